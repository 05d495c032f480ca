// include/ledger_ngin/portfolio/position_reconciler.hpp
#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "ledger_ngin/core/clock.hpp"
#include "ledger_ngin/core/config_base.hpp"
#include "ledger_ngin/core/error.hpp"
#include "ledger_ngin/core/types.hpp"
#include "ledger_ngin/data/repository_interface.hpp"
#include "ledger_ngin/ledger/cost_basis_ledger.hpp"
#include "ledger_ngin/ledger/expiration_synthesizer.hpp"
#include "ledger_ngin/ledger/strategy_classifier.hpp"
#include "ledger_ngin/transaction_cost/fee_calculator.hpp"

namespace ledger_ngin {

/**
 * @brief Configuration for position reconciliation
 */
struct ReconcilerConfig : public ConfigBase {
    bool auto_expire_options{true};     // Insert option_expired events for lapsed contracts
    bool delete_stale_positions{true};  // Drop stored rows whose asset has no transactions
    LedgerConfig ledger_config;

    std::string version{"1.0.0"};

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["auto_expire_options"] = auto_expire_options;
        j["delete_stale_positions"] = delete_stale_positions;
        j["ledger_config"] = ledger_config.to_json();
        j["version"] = version;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("auto_expire_options"))
            auto_expire_options = j.at("auto_expire_options").get<bool>();
        if (j.contains("delete_stale_positions"))
            delete_stale_positions = j.at("delete_stale_positions").get<bool>();
        if (j.contains("ledger_config"))
            ledger_config.from_json(j.at("ledger_config"));
        if (j.contains("version"))
            version = j.at("version").get<std::string>();
    }
};

/**
 * @brief Positions derived in memory from a portfolio's history
 */
struct PositionComputation {
    std::vector<Position> positions;  // One per asset, flat ones included
    std::vector<OrphanTransaction> orphans;
    std::vector<Transaction> synthesized_expirations;
    std::vector<std::string> warnings;
    size_t transactions_processed{0};
    size_t classified_count{0};
};

/**
 * @brief What one reconcile() call changed
 */
struct ReconciliationReport {
    std::string portfolio_id;
    std::vector<Position> upserted;
    std::vector<std::string> deleted_asset_ids;
    std::vector<OrphanTransaction> orphans;
    std::vector<Transaction> synthesized_expirations;
    std::vector<std::string> warnings;
    size_t transactions_processed{0};
    size_t classified_count{0};
    OutcomeStatus status{OutcomeStatus::SUCCEEDED};

    nlohmann::json to_json() const;
};

/**
 * @brief Rebuilds every position of a portfolio from its full history
 *
 * Positions are always recomputed from scratch, never updated
 * incrementally, so running twice without new transactions writes the
 * same rows. Nothing is written until every asset has been computed.
 */
class PositionReconciler {
public:
    PositionReconciler(std::shared_ptr<TransactionRepository> transactions,
                       std::shared_ptr<PositionRepository> positions,
                       std::shared_ptr<const Clock> clock,
                       transaction_cost::FeeCalculator fees = transaction_cost::FeeCalculator(),
                       std::shared_ptr<const StrategyClassifier> classifier = nullptr,
                       ReconcilerConfig config = ReconcilerConfig());

    /**
     * @brief Recompute and persist the positions of one portfolio
     * @return Report of the writes, REPOSITORY_ERROR when a collaborator
     * fails, INVALID_ARGUMENT for malformed history
     */
    Result<ReconciliationReport> reconcile(const std::string& portfolio_id);

    /**
     * @brief Derive positions without touching any repository
     */
    Result<PositionComputation> compute_positions(
        const std::string& portfolio_id, const std::vector<Transaction>& transactions) const;

    const ReconcilerConfig& config() const {
        return config_;
    }

private:
    Position to_position(const std::string& portfolio_id, const LedgerSnapshot& snapshot) const;

    std::shared_ptr<TransactionRepository> transactions_;
    std::shared_ptr<PositionRepository> positions_;
    std::shared_ptr<const Clock> clock_;
    transaction_cost::FeeCalculator fees_;
    std::shared_ptr<const StrategyClassifier> classifier_;
    ReconcilerConfig config_;
};

}  // namespace ledger_ngin
