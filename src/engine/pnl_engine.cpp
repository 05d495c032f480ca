// src/engine/pnl_engine.cpp
#include "ledger_ngin/engine/pnl_engine.hpp"

#include "ledger_ngin/core/logger.hpp"

namespace ledger_ngin {

PnLEngine::PnLEngine(std::shared_ptr<TransactionRepository> transactions,
                     std::shared_ptr<PositionRepository> positions,
                     std::shared_ptr<const Clock> clock, EngineConfig config)
    : config_(std::move(config)),
      clock_(clock ? std::move(clock) : std::make_shared<SystemClock>()) {
    Logger::register_component("PnLEngine");

    auto classifier = make_strategy_classifier(config_.strategy_classifier);
    if (classifier.is_error()) {
        throw *classifier.error();
    }

    transaction_cost::FeeCalculator fees(config_.fees);

    reconciler_ = std::make_unique<PositionReconciler>(transactions, std::move(positions), clock_,
                                                       fees, classifier.value(),
                                                       config_.reconciler);
    aggregator_ = std::make_shared<DailyPnLAggregator>(std::move(transactions), clock_, fees,
                                                       classifier.value(), config_.aggregator);
    cache_ = std::make_unique<AggregationCache>(aggregator_, clock_, config_.cache);

    INFO("PnLEngine ready: classifier=" << config_.strategy_classifier
                                        << " cache_ttl=" << config_.cache.ttl_seconds << "s"
                                        << " auto_expire="
                                        << (config_.reconciler.auto_expire_options ? "on" : "off"));
}

Result<ReconciliationReport> PnLEngine::reconcile(const std::string& portfolio_id) {
    auto report = reconciler_->reconcile(portfolio_id);
    if (report.is_ok()) {
        // Synthesized expirations change the month they land in
        cache_->invalidate_portfolio(portfolio_id);
    }
    return report;
}

Result<MonthlyPnLSummary> PnLEngine::monthly_pnl(const std::string& portfolio_id, int year,
                                                 int month) {
    return cache_->compute_month(portfolio_id, year, month);
}

Result<MonthlyPnLSummary> PnLEngine::combined_monthly_pnl(
    const std::vector<std::string>& portfolio_ids, int year, int month) {
    if (portfolio_ids.empty()) {
        return make_error<MonthlyPnLSummary>(ErrorCode::INVALID_ARGUMENT,
                                             "At least one portfolio id is required",
                                             "PnLEngine");
    }

    std::vector<MonthlyPnLSummary> summaries;
    for (const auto& portfolio_id : portfolio_ids) {
        auto summary = cache_->compute_month(portfolio_id, year, month);
        if (summary.is_error()) {
            return forward_error<MonthlyPnLSummary>(*summary.error());
        }
        summaries.push_back(summary.take_value());
    }
    return DailyPnLAggregator::merge_summaries(summaries, config_.aggregator.neutral_threshold);
}

Result<std::vector<MonthlyPnLSummary>> PnLEngine::monthly_range(const std::string& portfolio_id,
                                                                int start_year, int start_month,
                                                                int end_year, int end_month) {
    if (start_month < 1 || start_month > 12 || end_month < 1 || end_month > 12 ||
        Date(end_year, end_month, 1) < Date(start_year, start_month, 1)) {
        return make_error<std::vector<MonthlyPnLSummary>>(
            ErrorCode::INVALID_ARGUMENT, "Invalid month range", "PnLEngine");
    }

    std::vector<MonthlyPnLSummary> months;
    int year = start_year;
    int month = start_month;
    while (year < end_year || (year == end_year && month <= end_month)) {
        auto summary = cache_->compute_month(portfolio_id, year, month);
        if (summary.is_error()) {
            return forward_error<std::vector<MonthlyPnLSummary>>(*summary.error());
        }
        months.push_back(summary.take_value());
        if (++month > 12) {
            month = 1;
            ++year;
        }
    }
    return Result<std::vector<MonthlyPnLSummary>>(std::move(months));
}

Result<DailyPnLRecord> PnLEngine::daily_pnl(const std::string& portfolio_id, const Date& date) {
    if (!is_valid_date(date)) {
        return make_error<DailyPnLRecord>(ErrorCode::INVALID_ARGUMENT,
                                          "Invalid date " + to_string(date), "PnLEngine");
    }
    auto summary = cache_->compute_month(portfolio_id, date.year, date.month);
    if (summary.is_error()) {
        return forward_error<DailyPnLRecord>(*summary.error());
    }
    return Result<DailyPnLRecord>(summary.value().days[date.day - 1]);
}

Result<MonthlyPnLSummary> PnLEngine::current_month_pnl(const std::string& portfolio_id) {
    const Date today = date_from_timestamp(clock_->now());
    return cache_->compute_month(portfolio_id, today.year, today.month);
}

void PnLEngine::record_transactions_written(const std::string& portfolio_id) {
    Logger::register_component("PnLEngine");
    DEBUG("Transactions written for portfolio " << portfolio_id << ", invalidating cache");
    cache_->invalidate_portfolio(portfolio_id);
}

}  // namespace ledger_ngin
