#include <gtest/gtest.h>
#include "ledger_ngin/instruments/option_symbol.hpp"

using namespace ledger_ngin;

class OptionSymbolTest : public ::testing::Test {};

TEST_F(OptionSymbolTest, ParsesCallSymbol) {
    auto parsed = parse_option_symbol("AAPL250117C00150000");
    ASSERT_TRUE(parsed.is_ok()) << parsed.error()->what();

    const OptionContract& contract = parsed.value();
    EXPECT_EQ(contract.underlying, "AAPL");
    EXPECT_EQ(contract.expiration, Date(2025, 1, 17));
    EXPECT_DOUBLE_EQ(contract.strike, 150.0);
    EXPECT_EQ(contract.type, OptionType::CALL);
    EXPECT_EQ(contract.describe(), "AAPL Jan 17 2025 $150 CALL");
}

TEST_F(OptionSymbolTest, ParsesPutWithFractionalStrike) {
    auto parsed = parse_option_symbol("F240621P00012500");
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value().underlying, "F");
    EXPECT_EQ(parsed.value().type, OptionType::PUT);
    EXPECT_DOUBLE_EQ(parsed.value().strike, 12.5);
    EXPECT_EQ(parsed.value().describe(), "F Jun 21 2024 $12.50 PUT");
}

TEST_F(OptionSymbolTest, FormatIsInverseOfParse) {
    OptionContract contract;
    contract.underlying = "SPY";
    contract.expiration = Date(2024, 12, 20);
    contract.strike = 475.5;
    contract.type = OptionType::PUT;
    EXPECT_EQ(format_option_symbol(contract), "SPY241220P00475500");
}

TEST_F(OptionSymbolTest, RejectsMalformedSymbols) {
    const char* bad[] = {"AAPL",                  // no suffix
                         "aapl250117C00150000",   // lower case
                         "AAPL250117X00150000",   // bad type
                         "AAPL2501A7C00150000",   // non-digit date
                         "AAPL251317C00150000",   // month 13
                         "AAPL250230C00150000",   // Feb 30
                         "TOOLONGX250117C00150000"};
    for (const char* symbol : bad) {
        auto parsed = parse_option_symbol(symbol);
        ASSERT_TRUE(parsed.is_error()) << symbol;
        EXPECT_EQ(parsed.error()->code(), ErrorCode::CONFIGURATION_ERROR) << symbol;
    }
}

TEST_F(OptionSymbolTest, ExpiredOnlyAfterExpirationDay) {
    auto contract = parse_option_symbol("AAPL250117C00150000").value();
    EXPECT_FALSE(contract.is_expired_on(Date(2025, 1, 16)));
    EXPECT_FALSE(contract.is_expired_on(Date(2025, 1, 17)));
    EXPECT_TRUE(contract.is_expired_on(Date(2025, 1, 18)));
}
