// include/ledger_ngin/ledger/cost_basis_ledger.hpp
#pragma once

#include <deque>
#include <nlohmann/json.hpp>
#include <string>
#include <variant>
#include <vector>
#include "ledger_ngin/core/config_base.hpp"
#include "ledger_ngin/core/error.hpp"
#include "ledger_ngin/core/types.hpp"
#include "ledger_ngin/transaction_cost/fee_calculator.hpp"

namespace ledger_ngin {

/**
 * @brief Open long lot: shares or contracts bought and not yet sold
 */
struct LongLot {
    Quantity remaining_quantity{0.0};
    Price unit_cost{0.0};
    std::string originating_transaction_id;
};

/**
 * @brief Open short lot: option written (sold to open) and not yet covered
 * unit_cost holds the premium received per share.
 */
struct ShortLot {
    Quantity remaining_quantity{0.0};
    Price unit_cost{0.0};
    std::string originating_transaction_id;
};

/**
 * @brief One entry of the FIFO queue, tagged by side
 */
using Lot = std::variant<LongLot, ShortLot>;

/**
 * @brief Signed quantity of a lot (short lots are negative)
 */
Quantity signed_quantity(const Lot& lot);

/**
 * @brief JSON form of an orphan for reports and summaries
 */
nlohmann::json orphan_to_json(const OrphanTransaction& orphan);

/**
 * @brief Monetary consequences of applying one transaction
 */
struct TransactionEffect {
    double realized_pnl{0.0};     // Net of fees
    double dividend_income{0.0};  // Gross dividend amount
    double fees{0.0};
    double trade_volume{0.0};  // Notional of buys and sells
    double cash_flow{0.0};     // Cash in (+) or out (-)
    bool orphaned{false};
};

/**
 * @brief Configuration for lot matching
 */
struct LedgerConfig : public ConfigBase {
    // Remaining quantities below this are treated as exhausted
    double quantity_epsilon{kQuantityEpsilon};

    // When true any option buy against a net-short position closes short
    // lots; when false only buys tagged as covered-call buybacks do
    bool close_short_on_untagged_buy{false};

    std::string version{"1.0.0"};

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["quantity_epsilon"] = quantity_epsilon;
        j["close_short_on_untagged_buy"] = close_short_on_untagged_buy;
        j["version"] = version;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("quantity_epsilon"))
            quantity_epsilon = j.at("quantity_epsilon").get<double>();
        if (j.contains("close_short_on_untagged_buy"))
            close_short_on_untagged_buy = j.at("close_short_on_untagged_buy").get<bool>();
        if (j.contains("version"))
            version = j.at("version").get<std::string>();
    }
};

/**
 * @brief State of a ledger after a pass
 */
struct LedgerSnapshot {
    std::string asset_id;
    std::string symbol;
    AssetClass asset_class{AssetClass::UNKNOWN};
    std::deque<Lot> open_lots;
    Quantity net_quantity{0.0};
    double realized_pnl{0.0};
    double total_cost_basis{0.0};
    Price average_cost{0.0};
    std::vector<OrphanTransaction> orphans;
    size_t processed_count{0};
    Timestamp last_activity;
};

/**
 * @brief FIFO cost-basis engine for one (portfolio, asset) transaction stream
 *
 * Transactions are applied strictly in the order given. Long lots are
 * matched oldest first; option sales without enough long quantity open
 * short lots whose premium is realized immediately. Data-quality problems
 * (equity oversells, expirations with nothing open) never fail: they are
 * recorded as orphans and the stream continues. Only malformed input
 * returns an error.
 *
 * Realized P&L is net of fees: every applied transaction's fees are
 * deducted when it is applied.
 *
 * Not thread-safe; one ledger belongs to one computation pass.
 */
class CostBasisLedger {
public:
    /**
     * @param fees Fee calculator used when a transaction did not report fees
     * @param config Matching configuration
     * @param seed Open lots carried over from before the stream begins
     */
    explicit CostBasisLedger(transaction_cost::FeeCalculator fees = transaction_cost::FeeCalculator(),
                             LedgerConfig config = LedgerConfig(), std::deque<Lot> seed = {});

    /**
     * @brief Apply one transaction
     * @return The transaction's monetary effect, or INVALID_ARGUMENT for
     * malformed input (the ledger is left untouched in that case)
     */
    Result<TransactionEffect> apply(const Transaction& transaction);

    /**
     * @brief Apply a sequence in order, stopping at the first malformed entry
     */
    Result<void> apply_all(const std::vector<Transaction>& transactions);

    /**
     * @brief One-shot pass over a stream
     */
    static Result<LedgerSnapshot> run(
        const std::vector<Transaction>& transactions,
        transaction_cost::FeeCalculator fees = transaction_cost::FeeCalculator(),
        std::deque<Lot> seed = {}, LedgerConfig config = LedgerConfig());

    /**
     * @brief Reject transactions that cannot be processed at all
     */
    static Result<void> validate(const Transaction& transaction);

    const std::deque<Lot>& open_lots() const {
        return lots_;
    }

    Quantity long_quantity() const;
    Quantity short_quantity() const;

    /**
     * @brief Long minus short quantity
     */
    Quantity net_quantity() const;

    bool is_net_short() const {
        return net_quantity() < -config_.quantity_epsilon;
    }

    bool has_open_lots() const {
        return !lots_.empty();
    }

    double realized_pnl() const {
        return realized_pnl_;
    }

    /**
     * @brief Cost of open long lots minus premium held in open short lots
     */
    double total_cost_basis() const;

    /**
     * @brief total_cost_basis / net_quantity, 0 when flat
     */
    Price average_cost() const;

    const std::vector<OrphanTransaction>& orphans() const {
        return orphans_;
    }

    LedgerSnapshot snapshot() const;

private:
    TransactionEffect apply_buy(const Transaction& transaction, double fees);
    TransactionEffect apply_sell(const Transaction& transaction, double fees);
    TransactionEffect apply_dividend(const Transaction& transaction, double fees);
    TransactionEffect apply_expiration(const Transaction& transaction, double fees);

    bool is_short_cover(const Transaction& transaction) const;

    TransactionEffect quarantine(const Transaction& transaction, Quantity available,
                                 const std::string& reason);

    transaction_cost::FeeCalculator fees_;
    LedgerConfig config_;
    std::deque<Lot> lots_;
    double realized_pnl_{0.0};
    std::vector<OrphanTransaction> orphans_;

    std::string asset_id_;
    std::string symbol_;
    AssetClass asset_class_{AssetClass::UNKNOWN};
    size_t processed_count_{0};
    Timestamp last_activity_;
};

}  // namespace ledger_ngin
