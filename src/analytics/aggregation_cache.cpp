// src/analytics/aggregation_cache.cpp
#include "ledger_ngin/analytics/aggregation_cache.hpp"

#include <algorithm>
#include <exception>
#include "ledger_ngin/core/logger.hpp"

namespace ledger_ngin {

AggregationCache::AggregationCache(std::shared_ptr<MonthlyPnLSource> source,
                                   std::shared_ptr<const Clock> clock, CacheConfig config)
    : source_(std::move(source)),
      clock_(clock ? std::move(clock) : std::make_shared<SystemClock>()),
      config_(std::move(config)) {
    Logger::register_component("AggregationCache");

    if (!source_) {
        throw std::invalid_argument("AggregationCache requires a source");
    }
    if (config_.ttl_seconds < 0) {
        throw std::invalid_argument("AggregationCache TTL must not be negative");
    }
}

Result<MonthlyPnLSummary> AggregationCache::to_result(const Outcome& outcome) {
    if (outcome.error) {
        return forward_error<MonthlyPnLSummary>(*outcome.error);
    }
    return Result<MonthlyPnLSummary>(MonthlyPnLSummary(*outcome.summary));
}

Result<MonthlyPnLSummary> AggregationCache::compute_month(const std::string& portfolio_id,
                                                          int year, int month) {
    const CacheKey key{portfolio_id, year, month};
    std::shared_future<Outcome> pending;
    std::promise<Outcome> promise;
    uint64_t token = 0;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        const Timestamp now = clock_->now();

        auto cached = entries_.find(key);
        if (cached != entries_.end()) {
            if (now < cached->second.expires_at) {
                stats_.hits++;
                return Result<MonthlyPnLSummary>(MonthlyPnLSummary(*cached->second.summary));
            }
            entries_.erase(cached);
            stats_.evictions++;
        }

        auto flying = in_flight_.find(key);
        if (flying != in_flight_.end()) {
            stats_.coalesced_waits++;
            pending = flying->second.future;
        } else {
            stats_.misses++;
            stats_.computations++;
            token = ++next_token_;
            in_flight_[key] = InFlight{promise.get_future().share(), token};
        }
    }

    if (pending.valid()) {
        TRACE("Waiting on in-flight computation for " << portfolio_id << " " << year << "-"
                                                      << month);
        return to_result(pending.get());
    }

    Outcome outcome;
    try {
        outcome = load(key);
    } catch (...) {
        release_in_flight(key, token);
        promise.set_exception(std::current_exception());
        throw;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        const bool current = release_in_flight_locked(key, token);

        if (outcome.summary && current) {
            const Timestamp now = clock_->now();
            sweep_expired(now);
            entries_[key] =
                Entry{outcome.summary, now + std::chrono::seconds(config_.ttl_seconds)};
            enforce_capacity();
        } else if (outcome.summary) {
            DEBUG("Discarding result for " << portfolio_id << " " << year << "-" << month
                                           << ": invalidated while computing");
        }
    }

    promise.set_value(outcome);
    return to_result(outcome);
}

void AggregationCache::release_in_flight(const CacheKey& key, uint64_t token) {
    std::lock_guard<std::mutex> lock(mutex_);
    release_in_flight_locked(key, token);
}

bool AggregationCache::release_in_flight_locked(const CacheKey& key, uint64_t token) {
    auto flying = in_flight_.find(key);
    if (flying == in_flight_.end() || flying->second.token != token) {
        return false;  // Detached by an invalidation; a newer computation may own the key
    }
    in_flight_.erase(flying);
    return true;
}

AggregationCache::Outcome AggregationCache::load(const CacheKey& key) {
    Outcome outcome;
    try {
        auto result = source_->compute_month(key.portfolio_id, key.year, key.month);
        if (result.is_error()) {
            WARN("Monthly P&L computation failed for portfolio "
                 << key.portfolio_id << " " << key.year << "-" << key.month << ": "
                 << result.error()->what() << " (not cached)");
            outcome.error = std::make_shared<const LedgerError>(*result.error());
        } else {
            outcome.summary = std::make_shared<const MonthlyPnLSummary>(result.take_value());
        }
    } catch (const LedgerError& e) {
        ERROR("Monthly P&L computation threw for portfolio " << key.portfolio_id << ": "
                                                             << e.what());
        outcome.error = std::make_shared<const LedgerError>(e);
    } catch (const std::exception& e) {
        ERROR("Monthly P&L computation threw for portfolio " << key.portfolio_id << ": "
                                                             << e.what());
        outcome.error = std::make_shared<const LedgerError>(
            ErrorCode::COMPUTATION_ERROR, e.what(), "AggregationCache");
    } catch (...) {
        ERROR("Monthly P&L computation threw a non-standard exception for portfolio "
              << key.portfolio_id);
        throw;
    }
    return outcome;
}

void AggregationCache::sweep_expired(Timestamp now) {
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (now >= it->second.expires_at) {
            it = entries_.erase(it);
            stats_.evictions++;
        } else {
            ++it;
        }
    }
}

void AggregationCache::enforce_capacity() {
    if (config_.max_entries == 0) {
        return;
    }
    while (entries_.size() > config_.max_entries) {
        auto oldest = std::min_element(entries_.begin(), entries_.end(),
                                       [](const auto& a, const auto& b) {
                                           return a.second.expires_at < b.second.expires_at;
                                       });
        entries_.erase(oldest);
        stats_.evictions++;
    }
}

void AggregationCache::invalidate(const std::string& portfolio_id, int year, int month) {
    std::lock_guard<std::mutex> lock(mutex_);
    const CacheKey key{portfolio_id, year, month};
    entries_.erase(key);
    in_flight_.erase(key);
    stats_.invalidations++;
}

void AggregationCache::invalidate_portfolio(const std::string& portfolio_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->first.portfolio_id == portfolio_id) {
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
    for (auto it = in_flight_.begin(); it != in_flight_.end();) {
        if (it->first.portfolio_id == portfolio_id) {
            it = in_flight_.erase(it);
        } else {
            ++it;
        }
    }
    stats_.invalidations++;
    DEBUG("Invalidated cached months of portfolio " << portfolio_id);
}

void AggregationCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    in_flight_.clear();
    stats_.invalidations++;
}

CacheStats AggregationCache::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CacheStats snapshot = stats_;
    snapshot.entries = entries_.size();
    return snapshot;
}

size_t AggregationCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

}  // namespace ledger_ngin
