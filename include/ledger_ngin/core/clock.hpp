// include/ledger_ngin/core/clock.hpp
#pragma once

#include <atomic>
#include <chrono>
#include "ledger_ngin/core/types.hpp"

namespace ledger_ngin {

/**
 * @brief Source of "now" for TTL expiry and option auto-expiration
 *
 * Components hold a shared_ptr<const Clock> and never call
 * system_clock::now() directly, so tests can drive time explicitly.
 * Implementations must be safe for concurrent reads.
 */
class Clock {
public:
    virtual ~Clock() = default;

    virtual Timestamp now() const = 0;
};

/**
 * @brief Wall clock
 */
class SystemClock : public Clock {
public:
    Timestamp now() const override {
        return std::chrono::system_clock::now();
    }
};

/**
 * @brief Clock whose time only moves when told to
 */
class ManualClock : public Clock {
public:
    explicit ManualClock(Timestamp start = Timestamp());

    Timestamp now() const override;

    void set(Timestamp ts);

    void advance(std::chrono::system_clock::duration delta);

private:
    std::atomic<Timestamp::rep> ticks_;
};

}  // namespace ledger_ngin
