#include <gtest/gtest.h>
#include <chrono>
#include <ctime>
#include <regex>
#include "ledger_ngin/core/time_utils.hpp"

using namespace ledger_ngin;
using namespace ledger_ngin::core;

class TimeUtilsTest : public ::testing::Test {};

TEST_F(TimeUtilsTest, SafeGmtimeEpochTime) {
    std::time_t epoch = 0;
    std::tm result;

    std::tm* ret = safe_gmtime(&epoch, &result);

    ASSERT_NE(ret, nullptr);
    EXPECT_EQ(ret, &result);
    EXPECT_EQ(result.tm_year, 70);
    EXPECT_EQ(result.tm_mon, 0);
    EXPECT_EQ(result.tm_mday, 1);
    EXPECT_EQ(result.tm_hour, 0);
}

TEST_F(TimeUtilsTest, FormatTimestampUsesUtcByDefault) {
    // 2024-03-15 13:45:30 UTC
    Timestamp ts = std::chrono::system_clock::from_time_t(1710510330);
    EXPECT_EQ(format_timestamp(ts, "%Y-%m-%dT%H:%M:%SZ"), "2024-03-15T13:45:30Z");
}

TEST_F(TimeUtilsTest, GetFormattedTimeBasic) {
    std::string time_str = get_formatted_time("%Y-%m-%d %H:%M:%S");
    std::regex pattern(R"(\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2})");
    EXPECT_TRUE(std::regex_match(time_str, pattern));
}
