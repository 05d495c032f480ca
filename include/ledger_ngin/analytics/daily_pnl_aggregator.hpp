// include/ledger_ngin/analytics/daily_pnl_aggregator.hpp
#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "ledger_ngin/core/clock.hpp"
#include "ledger_ngin/core/config_base.hpp"
#include "ledger_ngin/core/date.hpp"
#include "ledger_ngin/core/error.hpp"
#include "ledger_ngin/core/types.hpp"
#include "ledger_ngin/data/repository_interface.hpp"
#include "ledger_ngin/ledger/cost_basis_ledger.hpp"
#include "ledger_ngin/ledger/strategy_classifier.hpp"
#include "ledger_ngin/transaction_cost/fee_calculator.hpp"

namespace ledger_ngin {

/**
 * @brief Calendar colouring of a day
 */
enum class DayCategory { NO_TRANSACTIONS, NEUTRAL, POSITIVE, NEGATIVE };

inline std::string day_category_to_string(DayCategory category) {
    switch (category) {
        case DayCategory::NO_TRANSACTIONS:
            return "no-transactions";
        case DayCategory::NEUTRAL:
            return "neutral";
        case DayCategory::POSITIVE:
            return "positive";
        case DayCategory::NEGATIVE:
            return "negative";
        default:
            return "unknown";
    }
}

/**
 * @brief Realized activity of one calendar day (UTC)
 */
struct DailyPnLRecord {
    Date date;
    int day_of_month{0};
    double realized_pnl{0.0};  // Net of fees, dividends included
    double dividend_income{0.0};
    double fees{0.0};
    double trade_volume{0.0};
    double net_cash_flow{0.0};
    size_t transaction_count{0};  // Applied transactions; orphans are listed separately
    double net_pnl{0.0};
    bool has_transactions{false};
    DayCategory category{DayCategory::NO_TRANSACTIONS};
    std::vector<std::string> transaction_ids;
    std::vector<OrphanTransaction> orphans;

    nlohmann::json to_json() const;
};

/**
 * @brief One month of daily records plus totals
 */
struct MonthlyPnLSummary {
    std::vector<std::string> portfolio_ids;
    int year{0};
    int month{0};
    std::string month_name;
    std::vector<DailyPnLRecord> days;  // Every calendar day, empty ones included

    double total_pnl{0.0};
    double total_realized_pnl{0.0};
    double total_dividends{0.0};
    double total_fees{0.0};
    double total_volume{0.0};
    double total_cash_flow{0.0};
    size_t total_transactions{0};
    int days_with_transactions{0};
    int profitable_days{0};
    int loss_days{0};

    std::vector<OrphanTransaction> orphans;
    std::vector<std::string> warnings;
    OutcomeStatus status{OutcomeStatus::SUCCEEDED};

    nlohmann::json to_json() const;
};

/**
 * @brief Configuration for daily aggregation
 */
struct AggregatorConfig : public ConfigBase {
    double neutral_threshold{0.01};  // |net| at or below this is a neutral day
    bool auto_expire_options{true};
    LedgerConfig ledger_config;

    std::string version{"1.0.0"};

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["neutral_threshold"] = neutral_threshold;
        j["auto_expire_options"] = auto_expire_options;
        j["ledger_config"] = ledger_config.to_json();
        j["version"] = version;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("neutral_threshold"))
            neutral_threshold = j.at("neutral_threshold").get<double>();
        if (j.contains("auto_expire_options"))
            auto_expire_options = j.at("auto_expire_options").get<bool>();
        if (j.contains("ledger_config"))
            ledger_config.from_json(j.at("ledger_config"));
        if (j.contains("version"))
            version = j.at("version").get<std::string>();
    }
};

/**
 * @brief Anything that can produce a monthly summary for a portfolio
 */
class MonthlyPnLSource {
public:
    virtual ~MonthlyPnLSource() = default;

    virtual Result<MonthlyPnLSummary> compute_month(const std::string& portfolio_id, int year,
                                                    int month) = 0;
};

/**
 * @brief Replays each asset's ledger day by day across a month
 *
 * History before the month seeds the lot queues and is never reported;
 * history after the month is ignored. Queues carry over from one day to the
 * next, so the sum of daily realized P&L equals a single pass over the
 * month from the same seed.
 */
class DailyPnLAggregator : public MonthlyPnLSource {
public:
    DailyPnLAggregator(std::shared_ptr<TransactionRepository> transactions,
                       std::shared_ptr<const Clock> clock,
                       transaction_cost::FeeCalculator fees = transaction_cost::FeeCalculator(),
                       std::shared_ptr<const StrategyClassifier> classifier = nullptr,
                       AggregatorConfig config = AggregatorConfig());

    /**
     * @brief Summary of one portfolio's month, reading history from the repository
     */
    Result<MonthlyPnLSummary> compute_month(const std::string& portfolio_id, int year,
                                            int month) override;

    /**
     * @brief Summary of one portfolio's month from a given history, no I/O
     */
    Result<MonthlyPnLSummary> compute_month(const std::string& portfolio_id,
                                            const std::vector<Transaction>& transactions,
                                            int year, int month) const;

    /**
     * @brief Date-wise sum of independently computed portfolio summaries
     */
    Result<MonthlyPnLSummary> compute_portfolios(const std::vector<std::string>& portfolio_ids,
                                                 int year, int month);

    /**
     * @brief Consecutive monthly summaries, inclusive on both ends
     */
    Result<std::vector<MonthlyPnLSummary>> compute_range(const std::string& portfolio_id,
                                                         int start_year, int start_month,
                                                         int end_year, int end_month);

    Result<DailyPnLRecord> compute_day(const std::string& portfolio_id, const Date& date);

    /**
     * @brief Month containing the clock's current date
     */
    Result<MonthlyPnLSummary> compute_current_month(const std::string& portfolio_id);

    /**
     * @brief Combine summaries of the same month computed for different portfolios
     */
    static Result<MonthlyPnLSummary> merge_summaries(
        const std::vector<MonthlyPnLSummary>& summaries, double neutral_threshold);

    static DayCategory categorize(bool has_transactions, double net_pnl,
                                  double neutral_threshold);

    const AggregatorConfig& config() const {
        return config_;
    }

private:
    /**
     * @brief Recompute per-day categories and the monthly totals from the days
     */
    static void finalize(MonthlyPnLSummary& summary, double neutral_threshold);

    std::shared_ptr<TransactionRepository> transactions_;
    std::shared_ptr<const Clock> clock_;
    transaction_cost::FeeCalculator fees_;
    std::shared_ptr<const StrategyClassifier> classifier_;
    AggregatorConfig config_;
};

}  // namespace ledger_ngin
