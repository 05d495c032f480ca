#include <gtest/gtest.h>
#include <thread>
#include <vector>
#include "ledger_ngin/core/clock.hpp"
#include "ledger_ngin/core/date.hpp"

using namespace ledger_ngin;

class ClockTest : public ::testing::Test {};

TEST_F(ClockTest, ManualClockOnlyMovesWhenTold) {
    const Timestamp start = start_of_day(Date(2025, 1, 10));
    ManualClock clock(start);

    EXPECT_EQ(clock.now(), start);
    EXPECT_EQ(clock.now(), start);

    clock.advance(std::chrono::seconds(299));
    EXPECT_EQ(clock.now(), start + std::chrono::seconds(299));

    clock.set(start_of_day(Date(2025, 2, 1)));
    EXPECT_EQ(date_from_timestamp(clock.now()), Date(2025, 2, 1));
}

TEST_F(ClockTest, ManualClockConcurrentAdvances) {
    ManualClock clock(Timestamp{});
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&clock]() {
            for (int j = 0; j < 100; ++j) {
                clock.advance(std::chrono::seconds(1));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(clock.now(), Timestamp{} + std::chrono::seconds(800));
}

TEST_F(ClockTest, SystemClockIsMonotonicEnoughForTtl) {
    SystemClock clock;
    const Timestamp first = clock.now();
    EXPECT_GE(clock.now(), first);
}
