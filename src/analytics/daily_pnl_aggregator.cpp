// src/analytics/daily_pnl_aggregator.cpp
#include "ledger_ngin/analytics/daily_pnl_aggregator.hpp"

#include <cmath>
#include "ledger_ngin/core/logger.hpp"
#include "ledger_ngin/ledger/asset_streams.hpp"
#include "ledger_ngin/ledger/expiration_synthesizer.hpp"

namespace ledger_ngin {

namespace {

Result<void> validate_month(int year, int month) {
    if (year < 1 || month < 1 || month > 12) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Invalid month " + std::to_string(year) + "-" +
                                    std::to_string(month),
                                "DailyPnLAggregator");
    }
    return Result<void>();
}

MonthlyPnLSummary empty_month(int year, int month) {
    MonthlyPnLSummary summary;
    summary.year = year;
    summary.month = month;
    summary.month_name = month_name(month);

    const int day_count = days_in_month(year, month);
    summary.days.reserve(day_count);
    for (int day = 1; day <= day_count; ++day) {
        DailyPnLRecord record;
        record.date = Date(year, month, day);
        record.day_of_month = day;
        summary.days.push_back(std::move(record));
    }
    return summary;
}

}  // namespace

nlohmann::json DailyPnLRecord::to_json() const {
    nlohmann::json j;
    j["date"] = to_string(date);
    j["day_of_month"] = day_of_month;
    j["realized_pnl"] = realized_pnl;
    j["dividend_income"] = dividend_income;
    j["fees"] = fees;
    j["trade_volume"] = trade_volume;
    j["net_cash_flow"] = net_cash_flow;
    j["transaction_count"] = transaction_count;
    j["net_pnl"] = net_pnl;
    j["has_transactions"] = has_transactions;
    j["category"] = day_category_to_string(category);
    j["transaction_ids"] = transaction_ids;
    j["orphans"] = nlohmann::json::array();
    for (const auto& orphan : orphans) {
        j["orphans"].push_back(orphan_to_json(orphan));
    }
    return j;
}

nlohmann::json MonthlyPnLSummary::to_json() const {
    nlohmann::json j;
    j["portfolio_ids"] = portfolio_ids;
    j["year"] = year;
    j["month"] = month;
    j["month_name"] = month_name;
    j["days"] = nlohmann::json::array();
    for (const auto& day : days) {
        j["days"].push_back(day.to_json());
    }
    j["total_pnl"] = total_pnl;
    j["total_realized_pnl"] = total_realized_pnl;
    j["total_dividends"] = total_dividends;
    j["total_fees"] = total_fees;
    j["total_volume"] = total_volume;
    j["total_cash_flow"] = total_cash_flow;
    j["total_transactions"] = total_transactions;
    j["days_with_transactions"] = days_with_transactions;
    j["profitable_days"] = profitable_days;
    j["loss_days"] = loss_days;
    j["orphans"] = nlohmann::json::array();
    for (const auto& orphan : orphans) {
        j["orphans"].push_back(orphan_to_json(orphan));
    }
    j["warnings"] = warnings;
    j["status"] = outcome_status_to_string(status);
    return j;
}

DailyPnLAggregator::DailyPnLAggregator(std::shared_ptr<TransactionRepository> transactions,
                                       std::shared_ptr<const Clock> clock,
                                       transaction_cost::FeeCalculator fees,
                                       std::shared_ptr<const StrategyClassifier> classifier,
                                       AggregatorConfig config)
    : transactions_(std::move(transactions)),
      clock_(clock ? std::move(clock) : std::make_shared<SystemClock>()),
      fees_(std::move(fees)),
      classifier_(classifier ? std::move(classifier)
                             : std::make_shared<NullStrategyClassifier>()),
      config_(std::move(config)) {
    Logger::register_component("DailyPnLAggregator");

    if (!transactions_) {
        throw std::invalid_argument("DailyPnLAggregator requires a transaction repository");
    }
}

DayCategory DailyPnLAggregator::categorize(bool has_transactions, double net_pnl,
                                           double neutral_threshold) {
    if (!has_transactions) {
        return DayCategory::NO_TRANSACTIONS;
    }
    if (std::abs(net_pnl) <= neutral_threshold) {
        return DayCategory::NEUTRAL;
    }
    return net_pnl > 0.0 ? DayCategory::POSITIVE : DayCategory::NEGATIVE;
}

void DailyPnLAggregator::finalize(MonthlyPnLSummary& summary, double neutral_threshold) {
    summary.total_pnl = 0.0;
    summary.total_realized_pnl = 0.0;
    summary.total_dividends = 0.0;
    summary.total_fees = 0.0;
    summary.total_volume = 0.0;
    summary.total_cash_flow = 0.0;
    summary.total_transactions = 0;
    summary.days_with_transactions = 0;
    summary.profitable_days = 0;
    summary.loss_days = 0;
    summary.orphans.clear();

    for (auto& day : summary.days) {
        day.net_pnl = day.realized_pnl;
        day.has_transactions = day.transaction_count > 0;
        day.category = categorize(day.has_transactions, day.net_pnl, neutral_threshold);

        summary.total_pnl += day.net_pnl;
        summary.total_realized_pnl += day.realized_pnl;
        summary.total_dividends += day.dividend_income;
        summary.total_fees += day.fees;
        summary.total_volume += day.trade_volume;
        summary.total_cash_flow += day.net_cash_flow;
        summary.total_transactions += day.transaction_count;
        summary.orphans.insert(summary.orphans.end(), day.orphans.begin(), day.orphans.end());

        if (day.has_transactions) {
            summary.days_with_transactions++;
        }
        if (day.category == DayCategory::POSITIVE) {
            summary.profitable_days++;
        } else if (day.category == DayCategory::NEGATIVE) {
            summary.loss_days++;
        }
    }

    summary.status = (summary.orphans.empty() && summary.warnings.empty())
                         ? OutcomeStatus::SUCCEEDED
                         : OutcomeStatus::SUCCEEDED_DEGRADED;
}

Result<MonthlyPnLSummary> DailyPnLAggregator::compute_month(const std::string& portfolio_id,
                                                            int year, int month) {
    Logger::register_component("DailyPnLAggregator");

    auto valid = validate_month(year, month);
    if (valid.is_error()) {
        return forward_error<MonthlyPnLSummary>(*valid.error());
    }

    auto history = transactions_->list_transactions(portfolio_id);
    if (history.is_error()) {
        ERROR("Failed to read transactions for portfolio " << portfolio_id << ": "
                                                           << history.error()->what());
        return make_error<MonthlyPnLSummary>(
            ErrorCode::REPOSITORY_ERROR,
            "Failed to read transactions: " + std::string(history.error()->what()),
            "DailyPnLAggregator");
    }
    return compute_month(portfolio_id, history.value(), year, month);
}

Result<MonthlyPnLSummary> DailyPnLAggregator::compute_month(
    const std::string& portfolio_id, const std::vector<Transaction>& transactions, int year,
    int month) const {
    auto valid = validate_month(year, month);
    if (valid.is_error()) {
        return forward_error<MonthlyPnLSummary>(*valid.error());
    }
    for (const auto& transaction : transactions) {
        if (transaction.portfolio_id != portfolio_id) {
            return make_error<MonthlyPnLSummary>(
                ErrorCode::INVALID_ARGUMENT,
                "Transaction " + transaction.id + " belongs to portfolio " +
                    transaction.portfolio_id + ", not " + portfolio_id,
                "DailyPnLAggregator");
        }
    }

    // Expirations are synthesized over the full history so lots seeded from
    // earlier months still expire inside this one
    ExpirationSynthesizer synthesizer(fees_, config_.ledger_config);
    auto prepared_result = prepare_asset_streams(
        transactions, *classifier_, config_.auto_expire_options ? &synthesizer : nullptr,
        date_from_timestamp(clock_->now()));
    if (prepared_result.is_error()) {
        return forward_error<MonthlyPnLSummary>(*prepared_result.error());
    }
    const PreparedStreams prepared = prepared_result.take_value();

    MonthlyPnLSummary summary = empty_month(year, month);
    summary.portfolio_ids.push_back(portfolio_id);
    summary.warnings = prepared.warnings;

    const Timestamp month_start = start_of_day(Date(year, month, 1));
    const Timestamp next_month_start =
        start_of_day(add_days(Date(year, month, days_in_month(year, month)), 1));

    for (const auto& stream : prepared.streams) {
        CostBasisLedger ledger(fees_, config_.ledger_config);

        for (const auto& transaction : stream.transactions) {
            if (transaction.occurred_at >= next_month_start) {
                break;
            }

            const size_t orphans_before = ledger.orphans().size();
            auto applied = ledger.apply(transaction);
            if (applied.is_error()) {
                return forward_error<MonthlyPnLSummary>(*applied.error());
            }
            if (transaction.occurred_at < month_start) {
                continue;  // Seeding only
            }

            const TransactionEffect& effect = applied.value();
            DailyPnLRecord& day =
                summary.days[date_from_timestamp(transaction.occurred_at).day - 1];

            if (effect.orphaned) {
                day.orphans.insert(day.orphans.end(),
                                   ledger.orphans().begin() + orphans_before,
                                   ledger.orphans().end());
                continue;
            }

            day.realized_pnl += effect.realized_pnl;
            day.dividend_income += effect.dividend_income;
            day.fees += effect.fees;
            day.trade_volume += effect.trade_volume;
            day.net_cash_flow += effect.cash_flow;
            day.transaction_count++;
            day.transaction_ids.push_back(transaction.id);
        }
    }

    finalize(summary, config_.neutral_threshold);

    DEBUG("Computed " << summary.month_name << " " << year << " for portfolio " << portfolio_id
                      << ": total_pnl=" << summary.total_pnl
                      << " transactions=" << summary.total_transactions
                      << " orphans=" << summary.orphans.size());
    return Result<MonthlyPnLSummary>(std::move(summary));
}

Result<MonthlyPnLSummary> DailyPnLAggregator::merge_summaries(
    const std::vector<MonthlyPnLSummary>& summaries, double neutral_threshold) {
    if (summaries.empty()) {
        return make_error<MonthlyPnLSummary>(ErrorCode::INVALID_ARGUMENT,
                                             "No summaries to merge", "DailyPnLAggregator");
    }

    const int year = summaries.front().year;
    const int month = summaries.front().month;
    MonthlyPnLSummary merged = empty_month(year, month);

    for (const auto& summary : summaries) {
        if (summary.year != year || summary.month != month ||
            summary.days.size() != merged.days.size()) {
            return make_error<MonthlyPnLSummary>(
                ErrorCode::INVALID_ARGUMENT,
                "Cannot merge summaries of different months", "DailyPnLAggregator");
        }

        merged.portfolio_ids.insert(merged.portfolio_ids.end(), summary.portfolio_ids.begin(),
                                    summary.portfolio_ids.end());
        merged.warnings.insert(merged.warnings.end(), summary.warnings.begin(),
                               summary.warnings.end());

        for (size_t i = 0; i < summary.days.size(); ++i) {
            const DailyPnLRecord& source = summary.days[i];
            DailyPnLRecord& target = merged.days[i];
            target.realized_pnl += source.realized_pnl;
            target.dividend_income += source.dividend_income;
            target.fees += source.fees;
            target.trade_volume += source.trade_volume;
            target.net_cash_flow += source.net_cash_flow;
            target.transaction_count += source.transaction_count;
            target.transaction_ids.insert(target.transaction_ids.end(),
                                          source.transaction_ids.begin(),
                                          source.transaction_ids.end());
            target.orphans.insert(target.orphans.end(), source.orphans.begin(),
                                  source.orphans.end());
        }
    }

    finalize(merged, neutral_threshold);
    return Result<MonthlyPnLSummary>(std::move(merged));
}

Result<MonthlyPnLSummary> DailyPnLAggregator::compute_portfolios(
    const std::vector<std::string>& portfolio_ids, int year, int month) {
    if (portfolio_ids.empty()) {
        return make_error<MonthlyPnLSummary>(ErrorCode::INVALID_ARGUMENT,
                                             "At least one portfolio id is required",
                                             "DailyPnLAggregator");
    }

    std::vector<MonthlyPnLSummary> summaries;
    summaries.reserve(portfolio_ids.size());
    for (const auto& portfolio_id : portfolio_ids) {
        auto summary = compute_month(portfolio_id, year, month);
        if (summary.is_error()) {
            return forward_error<MonthlyPnLSummary>(*summary.error());
        }
        summaries.push_back(summary.take_value());
    }
    return merge_summaries(summaries, config_.neutral_threshold);
}

Result<std::vector<MonthlyPnLSummary>> DailyPnLAggregator::compute_range(
    const std::string& portfolio_id, int start_year, int start_month, int end_year,
    int end_month) {
    auto valid_start = validate_month(start_year, start_month);
    if (valid_start.is_error()) {
        return forward_error<std::vector<MonthlyPnLSummary>>(*valid_start.error());
    }
    auto valid_end = validate_month(end_year, end_month);
    if (valid_end.is_error()) {
        return forward_error<std::vector<MonthlyPnLSummary>>(*valid_end.error());
    }
    if (Date(end_year, end_month, 1) < Date(start_year, start_month, 1)) {
        return make_error<std::vector<MonthlyPnLSummary>>(
            ErrorCode::INVALID_ARGUMENT, "Range end precedes range start", "DailyPnLAggregator");
    }

    auto history = transactions_->list_transactions(portfolio_id);
    if (history.is_error()) {
        ERROR("Failed to read transactions for portfolio " << portfolio_id << ": "
                                                           << history.error()->what());
        return make_error<std::vector<MonthlyPnLSummary>>(
            ErrorCode::REPOSITORY_ERROR,
            "Failed to read transactions: " + std::string(history.error()->what()),
            "DailyPnLAggregator");
    }

    std::vector<MonthlyPnLSummary> months;
    int year = start_year;
    int month = start_month;
    while (year < end_year || (year == end_year && month <= end_month)) {
        auto summary = compute_month(portfolio_id, history.value(), year, month);
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

Result<DailyPnLRecord> DailyPnLAggregator::compute_day(const std::string& portfolio_id,
                                                       const Date& date) {
    if (!is_valid_date(date)) {
        return make_error<DailyPnLRecord>(ErrorCode::INVALID_ARGUMENT,
                                          "Invalid date " + to_string(date),
                                          "DailyPnLAggregator");
    }
    auto summary = compute_month(portfolio_id, date.year, date.month);
    if (summary.is_error()) {
        return forward_error<DailyPnLRecord>(*summary.error());
    }
    return Result<DailyPnLRecord>(summary.value().days[date.day - 1]);
}

Result<MonthlyPnLSummary> DailyPnLAggregator::compute_current_month(
    const std::string& portfolio_id) {
    const Date today = date_from_timestamp(clock_->now());
    return compute_month(portfolio_id, today.year, today.month);
}

}  // namespace ledger_ngin
