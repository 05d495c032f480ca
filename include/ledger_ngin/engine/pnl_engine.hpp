// include/ledger_ngin/engine/pnl_engine.hpp
#pragma once

#include <memory>
#include <string>
#include <vector>
#include "ledger_ngin/analytics/aggregation_cache.hpp"
#include "ledger_ngin/analytics/daily_pnl_aggregator.hpp"
#include "ledger_ngin/core/clock.hpp"
#include "ledger_ngin/core/error.hpp"
#include "ledger_ngin/data/repository_interface.hpp"
#include "ledger_ngin/engine/engine_config.hpp"
#include "ledger_ngin/ledger/strategy_classifier.hpp"
#include "ledger_ngin/portfolio/position_reconciler.hpp"

namespace ledger_ngin {

/**
 * @brief In-process entry point wiring reconciler, aggregator and cache
 *
 * Month-level reads go through the cache. Callers that append
 * transactions must call record_transactions_written() so cached months
 * of that portfolio are recomputed on the next read.
 */
class PnLEngine {
public:
    /**
     * @throws LedgerError when the configured strategy classifier is unknown
     */
    PnLEngine(std::shared_ptr<TransactionRepository> transactions,
              std::shared_ptr<PositionRepository> positions,
              std::shared_ptr<const Clock> clock = nullptr, EngineConfig config = EngineConfig());

    Result<ReconciliationReport> reconcile(const std::string& portfolio_id);

    Result<MonthlyPnLSummary> monthly_pnl(const std::string& portfolio_id, int year, int month);

    /**
     * @brief Combined calendar of several portfolios, each month read through the cache
     */
    Result<MonthlyPnLSummary> combined_monthly_pnl(const std::vector<std::string>& portfolio_ids,
                                                   int year, int month);

    Result<std::vector<MonthlyPnLSummary>> monthly_range(const std::string& portfolio_id,
                                                         int start_year, int start_month,
                                                         int end_year, int end_month);

    Result<DailyPnLRecord> daily_pnl(const std::string& portfolio_id, const Date& date);

    Result<MonthlyPnLSummary> current_month_pnl(const std::string& portfolio_id);

    /**
     * @brief Drop cached months of a portfolio after its ledger changed
     */
    void record_transactions_written(const std::string& portfolio_id);

    CacheStats cache_stats() const {
        return cache_->stats();
    }

    PositionReconciler& reconciler() {
        return *reconciler_;
    }

    DailyPnLAggregator& aggregator() {
        return *aggregator_;
    }

    const EngineConfig& config() const {
        return config_;
    }

private:
    EngineConfig config_;
    std::shared_ptr<const Clock> clock_;
    std::unique_ptr<PositionReconciler> reconciler_;
    std::shared_ptr<DailyPnLAggregator> aggregator_;
    std::unique_ptr<AggregationCache> cache_;
};

}  // namespace ledger_ngin
