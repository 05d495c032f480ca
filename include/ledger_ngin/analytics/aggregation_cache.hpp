// include/ledger_ngin/analytics/aggregation_cache.hpp
#pragma once

#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <tuple>
#include "ledger_ngin/analytics/daily_pnl_aggregator.hpp"
#include "ledger_ngin/core/clock.hpp"
#include "ledger_ngin/core/config_base.hpp"
#include "ledger_ngin/core/error.hpp"

namespace ledger_ngin {

/**
 * @brief Configuration for the monthly summary cache
 */
struct CacheConfig : public ConfigBase {
    int64_t ttl_seconds{300};
    size_t max_entries{0};  // 0 means unbounded

    std::string version{"1.0.0"};

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["ttl_seconds"] = ttl_seconds;
        j["max_entries"] = max_entries;
        j["version"] = version;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("ttl_seconds"))
            ttl_seconds = j.at("ttl_seconds").get<int64_t>();
        if (j.contains("max_entries"))
            max_entries = j.at("max_entries").get<size_t>();
        if (j.contains("version"))
            version = j.at("version").get<std::string>();
    }
};

/**
 * @brief Cache key: one portfolio's month
 */
struct CacheKey {
    std::string portfolio_id;
    int year{0};
    int month{0};

    bool operator<(const CacheKey& other) const {
        return std::tie(portfolio_id, year, month) <
               std::tie(other.portfolio_id, other.year, other.month);
    }
    bool operator==(const CacheKey& other) const {
        return portfolio_id == other.portfolio_id && year == other.year && month == other.month;
    }
};

/**
 * @brief Counters since construction
 */
struct CacheStats {
    uint64_t hits{0};
    uint64_t misses{0};
    uint64_t coalesced_waits{0};  // Callers that joined an in-flight computation
    uint64_t computations{0};
    uint64_t evictions{0};  // Expired or over capacity
    uint64_t invalidations{0};
    size_t entries{0};
};

/**
 * @brief TTL memoization and request coalescing around a MonthlyPnLSource
 *
 * Concurrent requests for a key that is neither cached nor being computed
 * result in exactly one call to the wrapped source; the others wait on
 * the same shared future. Failures reach every waiting caller but are
 * never stored. Invalidation detaches in-flight computations: callers
 * already waiting still get their result, later callers start a fresh
 * one. The mutex guards map bookkeeping only and is never held while the
 * source runs.
 */
class AggregationCache : public MonthlyPnLSource {
public:
    AggregationCache(std::shared_ptr<MonthlyPnLSource> source, std::shared_ptr<const Clock> clock,
                     CacheConfig config = CacheConfig());

    Result<MonthlyPnLSummary> compute_month(const std::string& portfolio_id, int year,
                                            int month) override;

    /**
     * @brief Drop one month; a computation in flight for it is detached and not stored
     */
    void invalidate(const std::string& portfolio_id, int year, int month);

    /**
     * @brief Drop every month of a portfolio
     */
    void invalidate_portfolio(const std::string& portfolio_id);

    void clear();

    CacheStats stats() const;

    size_t size() const;

    const CacheConfig& config() const {
        return config_;
    }

private:
    struct Outcome {
        std::shared_ptr<const MonthlyPnLSummary> summary;
        std::shared_ptr<const LedgerError> error;
    };

    struct Entry {
        std::shared_ptr<const MonthlyPnLSummary> summary;
        Timestamp expires_at;
    };

    struct InFlight {
        std::shared_future<Outcome> future;
        uint64_t token{0};
    };

    static Result<MonthlyPnLSummary> to_result(const Outcome& outcome);

    Outcome load(const CacheKey& key);

    void release_in_flight(const CacheKey& key, uint64_t token);

    // Erases the in-flight entry if it still belongs to token
    bool release_in_flight_locked(const CacheKey& key, uint64_t token);

    // Callers hold mutex_
    void sweep_expired(Timestamp now);
    void enforce_capacity();

    std::shared_ptr<MonthlyPnLSource> source_;
    std::shared_ptr<const Clock> clock_;
    CacheConfig config_;

    mutable std::mutex mutex_;
    std::map<CacheKey, Entry> entries_;
    std::map<CacheKey, InFlight> in_flight_;
    uint64_t next_token_{0};
    CacheStats stats_;
};

}  // namespace ledger_ngin
