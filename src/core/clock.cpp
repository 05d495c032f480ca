#include "ledger_ngin/core/clock.hpp"

namespace ledger_ngin {

ManualClock::ManualClock(Timestamp start) : ticks_(start.time_since_epoch().count()) {}

Timestamp ManualClock::now() const {
    return Timestamp(Timestamp::duration(ticks_.load()));
}

void ManualClock::set(Timestamp ts) {
    ticks_.store(ts.time_since_epoch().count());
}

void ManualClock::advance(std::chrono::system_clock::duration delta) {
    ticks_.fetch_add(delta.count());
}

}  // namespace ledger_ngin
