// src/portfolio/position_reconciler.cpp
#include "ledger_ngin/portfolio/position_reconciler.hpp"

#include <unordered_map>
#include <unordered_set>
#include "ledger_ngin/core/date.hpp"
#include "ledger_ngin/core/logger.hpp"
#include "ledger_ngin/core/time_utils.hpp"
#include "ledger_ngin/ledger/asset_streams.hpp"

namespace ledger_ngin {

namespace {

nlohmann::json position_to_json(const Position& position) {
    nlohmann::json j;
    j["portfolio_id"] = position.portfolio_id;
    j["asset_id"] = position.asset_id;
    j["symbol"] = position.symbol;
    j["asset_class"] = asset_class_to_string(position.asset_class);
    j["quantity"] = position.quantity;
    j["average_cost_basis"] = position.average_cost_basis;
    j["total_cost_basis"] = position.total_cost_basis;
    j["realized_pnl"] = position.realized_pnl;
    j["open_lot_count"] = position.open_lot_count;
    j["is_active"] = position.is_active;
    j["last_update"] = core::format_timestamp(position.last_update, "%Y-%m-%dT%H:%M:%SZ");
    return j;
}

}  // namespace

nlohmann::json ReconciliationReport::to_json() const {
    nlohmann::json j;
    j["portfolio_id"] = portfolio_id;
    j["status"] = outcome_status_to_string(status);
    j["transactions_processed"] = transactions_processed;
    j["classified_count"] = classified_count;

    j["upserted"] = nlohmann::json::array();
    for (const auto& position : upserted) {
        j["upserted"].push_back(position_to_json(position));
    }
    j["deleted_asset_ids"] = deleted_asset_ids;

    j["orphans"] = nlohmann::json::array();
    for (const auto& orphan : orphans) {
        j["orphans"].push_back(orphan_to_json(orphan));
    }

    j["synthesized_expirations"] = nlohmann::json::array();
    for (const auto& expiration : synthesized_expirations) {
        j["synthesized_expirations"].push_back(
            {{"id", expiration.id},
             {"symbol", expiration.symbol},
             {"quantity", expiration.quantity},
             {"occurred_at",
              core::format_timestamp(expiration.occurred_at, "%Y-%m-%dT%H:%M:%SZ")}});
    }
    j["warnings"] = warnings;
    return j;
}

PositionReconciler::PositionReconciler(std::shared_ptr<TransactionRepository> transactions,
                                       std::shared_ptr<PositionRepository> positions,
                                       std::shared_ptr<const Clock> clock,
                                       transaction_cost::FeeCalculator fees,
                                       std::shared_ptr<const StrategyClassifier> classifier,
                                       ReconcilerConfig config)
    : transactions_(std::move(transactions)),
      positions_(std::move(positions)),
      clock_(clock ? std::move(clock) : std::make_shared<SystemClock>()),
      fees_(std::move(fees)),
      classifier_(classifier ? std::move(classifier)
                             : std::make_shared<NullStrategyClassifier>()),
      config_(std::move(config)) {
    Logger::register_component("PositionReconciler");

    if (!transactions_ || !positions_) {
        throw std::invalid_argument("PositionReconciler requires both repositories");
    }
}

Position PositionReconciler::to_position(const std::string& portfolio_id,
                                         const LedgerSnapshot& snapshot) const {
    Position position;
    position.portfolio_id = portfolio_id;
    position.asset_id = snapshot.asset_id;
    position.symbol = snapshot.symbol;
    position.asset_class = snapshot.asset_class;
    position.quantity = snapshot.net_quantity;
    position.average_cost_basis = snapshot.average_cost;
    position.total_cost_basis = snapshot.total_cost_basis;
    position.realized_pnl = snapshot.realized_pnl;
    position.open_lot_count = snapshot.open_lots.size();
    position.is_active = position.has_position();
    position.last_update = snapshot.last_activity;

    if (!position.is_active) {
        position.quantity = 0.0;
        position.average_cost_basis = 0.0;
        position.total_cost_basis = 0.0;
    }
    return position;
}

Result<PositionComputation> PositionReconciler::compute_positions(
    const std::string& portfolio_id, const std::vector<Transaction>& transactions) const {
    for (const auto& transaction : transactions) {
        if (transaction.portfolio_id != portfolio_id) {
            return make_error<PositionComputation>(
                ErrorCode::INVALID_ARGUMENT,
                "Transaction " + transaction.id + " belongs to portfolio " +
                    transaction.portfolio_id + ", not " + portfolio_id,
                "PositionReconciler");
        }
    }

    ExpirationSynthesizer synthesizer(fees_, config_.ledger_config);
    const Date today = date_from_timestamp(clock_->now());

    auto prepared_result =
        prepare_asset_streams(transactions, *classifier_,
                              config_.auto_expire_options ? &synthesizer : nullptr, today);
    if (prepared_result.is_error()) {
        return forward_error<PositionComputation>(*prepared_result.error());
    }
    PreparedStreams prepared = prepared_result.take_value();

    PositionComputation computation;
    computation.synthesized_expirations = std::move(prepared.synthesized_expirations);
    computation.warnings = std::move(prepared.warnings);
    computation.classified_count = prepared.classified_count;

    for (const auto& stream : prepared.streams) {
        auto snapshot =
            CostBasisLedger::run(stream.transactions, fees_, {}, config_.ledger_config);
        if (snapshot.is_error()) {
            return forward_error<PositionComputation>(*snapshot.error());
        }

        const LedgerSnapshot& state = snapshot.value();
        computation.positions.push_back(to_position(portfolio_id, state));
        computation.orphans.insert(computation.orphans.end(), state.orphans.begin(),
                                   state.orphans.end());
        computation.transactions_processed += state.processed_count;
    }
    return Result<PositionComputation>(std::move(computation));
}

Result<ReconciliationReport> PositionReconciler::reconcile(const std::string& portfolio_id) {
    Logger::register_component("PositionReconciler");

    if (portfolio_id.empty()) {
        return make_error<ReconciliationReport>(ErrorCode::INVALID_ARGUMENT,
                                                "Portfolio id must not be empty",
                                                "PositionReconciler");
    }

    auto history = transactions_->list_transactions(portfolio_id);
    if (history.is_error()) {
        ERROR("Failed to read transactions for portfolio " << portfolio_id << ": "
                                                           << history.error()->what());
        return make_error<ReconciliationReport>(
            ErrorCode::REPOSITORY_ERROR,
            "Failed to read transactions: " + std::string(history.error()->what()),
            "PositionReconciler");
    }

    auto stored = positions_->list_positions(portfolio_id);
    if (stored.is_error()) {
        ERROR("Failed to read positions for portfolio " << portfolio_id << ": "
                                                        << stored.error()->what());
        return make_error<ReconciliationReport>(
            ErrorCode::REPOSITORY_ERROR,
            "Failed to read positions: " + std::string(stored.error()->what()),
            "PositionReconciler");
    }

    auto computed = compute_positions(portfolio_id, history.value());
    if (computed.is_error()) {
        ERROR("Reconciliation of portfolio " << portfolio_id
                                             << " aborted before any write: "
                                             << computed.error()->what());
        return forward_error<ReconciliationReport>(*computed.error());
    }
    PositionComputation computation = computed.take_value();

    std::unordered_set<std::string> existing;
    for (const auto& position : stored.value()) {
        existing.insert(position.asset_id);
    }

    ReconciliationReport report;
    report.portfolio_id = portfolio_id;
    report.orphans = std::move(computation.orphans);
    report.synthesized_expirations = std::move(computation.synthesized_expirations);
    report.warnings = std::move(computation.warnings);
    report.transactions_processed = computation.transactions_processed;
    report.classified_count = computation.classified_count;

    auto write_failed = [&](const std::string& action, const std::string& asset_id,
                            const LedgerError& error) {
        ERROR("Failed to " << action << " position " << asset_id << " of portfolio "
                           << portfolio_id << ": " << error.what());
        return make_error<ReconciliationReport>(
            ErrorCode::REPOSITORY_ERROR,
            "Failed to " + action + " position " + asset_id + ": " + error.what(),
            "PositionReconciler");
    };

    std::unordered_set<std::string> computed_assets;
    for (const auto& position : computation.positions) {
        computed_assets.insert(position.asset_id);

        if (position.is_active) {
            auto written = positions_->upsert_position(position);
            if (written.is_error()) {
                return write_failed("upsert", position.asset_id, *written.error());
            }
            report.upserted.push_back(position);
        } else if (existing.count(position.asset_id) > 0) {
            auto removed = positions_->delete_position(portfolio_id, position.asset_id);
            if (removed.is_error()) {
                return write_failed("delete", position.asset_id, *removed.error());
            }
            report.deleted_asset_ids.push_back(position.asset_id);
        }
    }

    if (config_.delete_stale_positions) {
        for (const auto& position : stored.value()) {
            if (computed_assets.count(position.asset_id) > 0) {
                continue;
            }
            WARN("Deleting stale position " << position.symbol << " (" << position.asset_id
                                            << ") of portfolio " << portfolio_id
                                            << ": no transactions recorded");
            auto removed = positions_->delete_position(portfolio_id, position.asset_id);
            if (removed.is_error()) {
                return write_failed("delete", position.asset_id, *removed.error());
            }
            report.deleted_asset_ids.push_back(position.asset_id);
        }
    }

    report.status = (report.orphans.empty() && report.warnings.empty())
                        ? OutcomeStatus::SUCCEEDED
                        : OutcomeStatus::SUCCEEDED_DEGRADED;

    INFO("Reconciled portfolio " << portfolio_id << ": " << report.upserted.size()
                                 << " upserted, " << report.deleted_asset_ids.size()
                                 << " deleted, " << report.orphans.size() << " orphans, "
                                 << report.synthesized_expirations.size()
                                 << " synthesized expirations, status "
                                 << outcome_status_to_string(report.status));
    return Result<ReconciliationReport>(std::move(report));
}

}  // namespace ledger_ngin
