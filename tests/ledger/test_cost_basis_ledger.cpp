#include <gtest/gtest.h>
#include "../core/test_base.hpp"
#include "../data/test_repository_utils.hpp"
#include "ledger_ngin/ledger/cost_basis_ledger.hpp"

using namespace ledger_ngin;
using namespace ledger_ngin::testing;

namespace {
const std::string kCall = "AAPL250117C00150000";
}

class CostBasisLedgerTest : public TestBase {
protected:
    TransactionEffect apply_ok(CostBasisLedger& ledger, const Transaction& txn) {
        auto result = ledger.apply(txn);
        EXPECT_TRUE(result.is_ok()) << (result.error() ? result.error()->what() : "");
        return result.is_ok() ? result.value() : TransactionEffect{};
    }
};

TEST_F(CostBasisLedgerTest, FifoMatchesOldestLotsFirst) {
    CostBasisLedger ledger;
    apply_ok(ledger, stock_buy("b1", "AAPL", 10, 10.0, at(2024, 1, 2)));
    apply_ok(ledger, stock_buy("b2", "AAPL", 5, 20.0, at(2024, 1, 3)));
    auto effect = apply_ok(ledger, stock_sell("s1", "AAPL", 12, 15.0, at(2024, 1, 4)));

    EXPECT_DOUBLE_EQ(effect.realized_pnl, 40.0);
    EXPECT_DOUBLE_EQ(ledger.realized_pnl(), 40.0);
    EXPECT_DOUBLE_EQ(ledger.net_quantity(), 3.0);
    EXPECT_DOUBLE_EQ(ledger.total_cost_basis(), 60.0);
    EXPECT_DOUBLE_EQ(ledger.average_cost(), 20.0);

    ASSERT_EQ(ledger.open_lots().size(), 1u);
    const auto& remaining = std::get<LongLot>(ledger.open_lots().front());
    EXPECT_EQ(remaining.originating_transaction_id, "b2");
    EXPECT_DOUBLE_EQ(remaining.remaining_quantity, 3.0);
}

TEST_F(CostBasisLedgerTest, WeightedAverageCostAcrossBuys) {
    CostBasisLedger ledger;
    apply_ok(ledger, stock_buy("b1", "MSFT", 10, 10.0, at(2024, 1, 2)));
    apply_ok(ledger, stock_buy("b2", "MSFT", 30, 20.0, at(2024, 1, 3)));

    EXPECT_DOUBLE_EQ(ledger.net_quantity(), 40.0);
    EXPECT_DOUBLE_EQ(ledger.total_cost_basis(), 700.0);
    EXPECT_DOUBLE_EQ(ledger.average_cost(), 17.5);
}

TEST_F(CostBasisLedgerTest, BuyEffectCarriesVolumeAndCashFlow) {
    CostBasisLedger ledger;
    auto txn = stock_buy("b1", "AAPL", 10, 10.0, at(2024, 1, 2));
    txn.fees = 1.0;
    auto effect = apply_ok(ledger, txn);

    EXPECT_DOUBLE_EQ(effect.trade_volume, 100.0);
    EXPECT_DOUBLE_EQ(effect.cash_flow, -101.0);
    EXPECT_DOUBLE_EQ(effect.fees, 1.0);
    EXPECT_DOUBLE_EQ(effect.realized_pnl, -1.0);
    EXPECT_FALSE(effect.orphaned);
}

TEST_F(CostBasisLedgerTest, SellFeesReduceRealizedPnl) {
    CostBasisLedger ledger;
    apply_ok(ledger, stock_buy("b1", "AAPL", 10, 10.0, at(2024, 1, 2)));
    auto sell = stock_sell("s1", "AAPL", 10, 12.0, at(2024, 1, 3));
    sell.fees = 0.5;
    auto effect = apply_ok(ledger, sell);

    EXPECT_DOUBLE_EQ(effect.realized_pnl, 19.5);
    EXPECT_DOUBLE_EQ(effect.cash_flow, 119.5);
    EXPECT_FALSE(ledger.has_open_lots());
}

TEST_F(CostBasisLedgerTest, EquityOversellIsQuarantined) {
    CostBasisLedger ledger;
    auto effect = apply_ok(ledger, stock_sell("s1", "TSLA", 100, 250.0, at(2024, 2, 1)));

    EXPECT_TRUE(effect.orphaned);
    EXPECT_DOUBLE_EQ(effect.realized_pnl, 0.0);
    EXPECT_DOUBLE_EQ(effect.fees, 0.0);
    EXPECT_DOUBLE_EQ(ledger.net_quantity(), 0.0);
    EXPECT_DOUBLE_EQ(ledger.realized_pnl(), 0.0);

    ASSERT_EQ(ledger.orphans().size(), 1u);
    const OrphanTransaction& orphan = ledger.orphans().front();
    EXPECT_EQ(orphan.transaction_id, "s1");
    EXPECT_EQ(orphan.symbol, "TSLA");
    EXPECT_DOUBLE_EQ(orphan.requested_quantity, 100.0);
    EXPECT_DOUBLE_EQ(orphan.available_quantity, 0.0);
}

TEST_F(CostBasisLedgerTest, PartialOversellLeavesQueueUntouched) {
    CostBasisLedger ledger;
    apply_ok(ledger, stock_buy("b1", "TSLA", 50, 200.0, at(2024, 2, 1)));
    auto effect = apply_ok(ledger, stock_sell("s1", "TSLA", 80, 250.0, at(2024, 2, 2)));

    EXPECT_TRUE(effect.orphaned);
    EXPECT_DOUBLE_EQ(ledger.net_quantity(), 50.0);
    EXPECT_DOUBLE_EQ(ledger.orphans().front().available_quantity, 50.0);

    // Stream continues normally after the orphan
    auto later = apply_ok(ledger, stock_sell("s2", "TSLA", 50, 210.0, at(2024, 2, 3)));
    EXPECT_DOUBLE_EQ(later.realized_pnl, 500.0);
}

TEST_F(CostBasisLedgerTest, ShortOptionPremiumRealizedAtSale) {
    CostBasisLedger ledger;
    auto effect = apply_ok(
        ledger, option_trade("o1", TransactionKind::SELL, kCall, 100, 2.00, at(2024, 12, 2)));

    EXPECT_DOUBLE_EQ(effect.fees, 0.75);
    EXPECT_DOUBLE_EQ(effect.realized_pnl, 199.25);
    EXPECT_DOUBLE_EQ(ledger.net_quantity(), -100.0);
    EXPECT_TRUE(ledger.is_net_short());
    EXPECT_DOUBLE_EQ(ledger.total_cost_basis(), -200.0);
    EXPECT_DOUBLE_EQ(ledger.average_cost(), 2.0);
    ASSERT_EQ(ledger.open_lots().size(), 1u);
    EXPECT_TRUE(std::holds_alternative<ShortLot>(ledger.open_lots().front()));
    EXPECT_TRUE(ledger.orphans().empty());
}

TEST_F(CostBasisLedgerTest, OptionSellMatchesLongsBeforeWriting) {
    CostBasisLedger ledger;
    apply_ok(ledger, option_trade("o1", TransactionKind::BUY, kCall, 100, 1.00, at(2024, 12, 2),
                                  std::nullopt, 0.0));
    auto effect = apply_ok(ledger, option_trade("o2", TransactionKind::SELL, kCall, 300, 2.00,
                                                at(2024, 12, 3), std::nullopt, 0.0));

    // 100 closed for +100, 200 written for +400
    EXPECT_DOUBLE_EQ(effect.realized_pnl, 500.0);
    EXPECT_DOUBLE_EQ(ledger.net_quantity(), -200.0);
    EXPECT_DOUBLE_EQ(ledger.long_quantity(), 0.0);
    EXPECT_DOUBLE_EQ(ledger.short_quantity(), 200.0);
}

TEST_F(CostBasisLedgerTest, CoveredCallBuybackIsRealizedLoss) {
    CostBasisLedger ledger;
    apply_ok(ledger, option_trade("o1", TransactionKind::SELL, kCall, 100, 2.00, at(2024, 12, 2),
                                  kCoveredCallTag, 0.0));
    auto effect = apply_ok(ledger, option_trade("o2", TransactionKind::BUY, kCall, 100, 0.50,
                                                at(2024, 12, 10), kCoveredCallTag, 0.0));

    EXPECT_DOUBLE_EQ(effect.realized_pnl, -50.0);
    EXPECT_DOUBLE_EQ(ledger.realized_pnl(), 150.0);
    EXPECT_FALSE(ledger.has_open_lots());
    EXPECT_DOUBLE_EQ(ledger.net_quantity(), 0.0);
}

TEST_F(CostBasisLedgerTest, BuybackBeyondShortOpensLongLot) {
    CostBasisLedger ledger;
    apply_ok(ledger, option_trade("o1", TransactionKind::SELL, kCall, 100, 2.00, at(2024, 12, 2),
                                  kCoveredCallTag, 0.0));
    auto effect = apply_ok(ledger, option_trade("o2", TransactionKind::BUY, kCall, 300, 1.00,
                                                at(2024, 12, 10), kCoveredCallTag, 0.0));

    EXPECT_DOUBLE_EQ(effect.realized_pnl, -100.0);
    EXPECT_DOUBLE_EQ(ledger.net_quantity(), 200.0);
    EXPECT_DOUBLE_EQ(ledger.total_cost_basis(), 200.0);
}

TEST_F(CostBasisLedgerTest, UntaggedBuyWhileShortOpensLongByDefault) {
    CostBasisLedger ledger;
    apply_ok(ledger, option_trade("o1", TransactionKind::SELL, kCall, 100, 2.00, at(2024, 12, 2),
                                  std::nullopt, 0.0));
    auto effect = apply_ok(ledger, option_trade("o2", TransactionKind::BUY, kCall, 100, 0.50,
                                                at(2024, 12, 10), std::nullopt, 0.0));

    EXPECT_DOUBLE_EQ(effect.realized_pnl, 0.0);
    EXPECT_DOUBLE_EQ(ledger.long_quantity(), 100.0);
    EXPECT_DOUBLE_EQ(ledger.short_quantity(), 100.0);
    EXPECT_EQ(ledger.open_lots().size(), 2u);
}

TEST_F(CostBasisLedgerTest, UntaggedBuyClosesShortWhenConfigured) {
    LedgerConfig config;
    config.close_short_on_untagged_buy = true;
    CostBasisLedger ledger(transaction_cost::FeeCalculator(), config);

    apply_ok(ledger, option_trade("o1", TransactionKind::SELL, kCall, 100, 2.00, at(2024, 12, 2),
                                  std::nullopt, 0.0));
    auto effect = apply_ok(ledger, option_trade("o2", TransactionKind::BUY, kCall, 100, 0.50,
                                                at(2024, 12, 10), std::nullopt, 0.0));

    EXPECT_DOUBLE_EQ(effect.realized_pnl, -50.0);
    EXPECT_FALSE(ledger.has_open_lots());
}

TEST_F(CostBasisLedgerTest, LongOptionExpirationRealizesFullCost) {
    CostBasisLedger ledger;
    apply_ok(ledger, option_trade("o1", TransactionKind::BUY, kCall, 200, 1.50, at(2025, 1, 2),
                                  std::nullopt, 0.0));

    auto expired = option_trade("x1", TransactionKind::OPTION_EXPIRED, kCall, 200, 0.0,
                                at(2025, 1, 17, 23));
    auto effect = apply_ok(ledger, expired);

    EXPECT_DOUBLE_EQ(effect.realized_pnl, -300.0);
    EXPECT_DOUBLE_EQ(effect.fees, 0.0);
    EXPECT_FALSE(ledger.has_open_lots());
    EXPECT_DOUBLE_EQ(ledger.net_quantity(), 0.0);
    EXPECT_DOUBLE_EQ(ledger.realized_pnl(), -300.0);
}

TEST_F(CostBasisLedgerTest, ShortOptionExpirationHasNoPnlEffect) {
    CostBasisLedger ledger;
    apply_ok(ledger, option_trade("o1", TransactionKind::SELL, kCall, 100, 2.00, at(2025, 1, 2),
                                  std::nullopt, 0.0));
    auto effect = apply_ok(ledger, option_trade("x1", TransactionKind::OPTION_EXPIRED, kCall, 100,
                                                0.0, at(2025, 1, 17, 23)));

    EXPECT_DOUBLE_EQ(effect.realized_pnl, 0.0);
    EXPECT_FALSE(ledger.has_open_lots());
    EXPECT_DOUBLE_EQ(ledger.realized_pnl(), 200.0);
}

TEST_F(CostBasisLedgerTest, ExpirationWithoutOpenContractsIsOrphan) {
    CostBasisLedger ledger;
    auto effect = apply_ok(ledger, option_trade("x1", TransactionKind::OPTION_EXPIRED, kCall, 100,
                                                0.0, at(2025, 1, 17, 23)));
    EXPECT_TRUE(effect.orphaned);
    ASSERT_EQ(ledger.orphans().size(), 1u);
    EXPECT_EQ(ledger.orphans().front().kind, TransactionKind::OPTION_EXPIRED);
}

TEST_F(CostBasisLedgerTest, ExpirationOfEquityIsOrphan) {
    CostBasisLedger ledger;
    apply_ok(ledger, stock_buy("b1", "AAPL", 10, 10.0, at(2024, 1, 2)));
    auto expired = make_transaction("x1", TransactionKind::OPTION_EXPIRED, "AAPL", 10, 0.0,
                                    at(2024, 1, 3));
    auto effect = apply_ok(ledger, expired);

    EXPECT_TRUE(effect.orphaned);
    EXPECT_DOUBLE_EQ(ledger.net_quantity(), 10.0);
}

TEST_F(CostBasisLedgerTest, DividendLeavesLotsUntouched) {
    CostBasisLedger ledger;
    apply_ok(ledger, stock_buy("b1", "KO", 100, 60.0, at(2024, 3, 1)));
    auto effect = apply_ok(ledger, dividend("d1", "KO", 100, 0.485, at(2024, 4, 1)));

    EXPECT_DOUBLE_EQ(effect.dividend_income, 48.5);
    EXPECT_DOUBLE_EQ(effect.realized_pnl, 48.5);
    EXPECT_DOUBLE_EQ(effect.trade_volume, 0.0);
    EXPECT_DOUBLE_EQ(ledger.net_quantity(), 100.0);
    EXPECT_DOUBLE_EQ(ledger.total_cost_basis(), 6000.0);
}

TEST_F(CostBasisLedgerTest, MalformedTransactionsAreRejected) {
    CostBasisLedger ledger;
    apply_ok(ledger, stock_buy("b1", "AAPL", 10, 10.0, at(2024, 1, 2)));

    auto zero_quantity = stock_sell("s1", "AAPL", 0, 10.0, at(2024, 1, 3));
    auto negative_price = stock_sell("s2", "AAPL", 1, -1.0, at(2024, 1, 3));
    auto no_symbol = stock_sell("s3", "AAPL", 1, 10.0, at(2024, 1, 3));
    no_symbol.symbol.clear();
    auto unknown_class = stock_sell("s4", "AAPL", 1, 10.0, at(2024, 1, 3));
    unknown_class.asset_class = AssetClass::UNKNOWN;
    auto other_asset = stock_sell("s5", "MSFT", 1, 10.0, at(2024, 1, 3));

    for (const auto& txn : {zero_quantity, negative_price, no_symbol, unknown_class, other_asset}) {
        auto result = ledger.apply(txn);
        ASSERT_TRUE(result.is_error()) << txn.id;
        EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_ARGUMENT) << txn.id;
    }

    // Nothing was mutated
    EXPECT_DOUBLE_EQ(ledger.net_quantity(), 10.0);
    EXPECT_TRUE(ledger.orphans().empty());
}

TEST_F(CostBasisLedgerTest, SeededLotsAreMatchedFirst) {
    std::deque<Lot> seed{LongLot{10, 10.0, "carried"}};
    CostBasisLedger ledger(transaction_cost::FeeCalculator(), LedgerConfig(), seed);

    auto effect = apply_ok(ledger, stock_sell("s1", "AAPL", 5, 12.0, at(2024, 2, 1)));
    EXPECT_DOUBLE_EQ(effect.realized_pnl, 10.0);
    EXPECT_DOUBLE_EQ(ledger.net_quantity(), 5.0);
}

TEST_F(CostBasisLedgerTest, RunProducesSnapshot) {
    std::vector<Transaction> stream = {
        stock_buy("b1", "AAPL", 10, 10.0, at(2024, 1, 2)),
        stock_sell("s1", "AAPL", 20, 12.0, at(2024, 1, 3)),
        stock_sell("s2", "AAPL", 4, 12.0, at(2024, 1, 4)),
    };

    auto result = CostBasisLedger::run(stream);
    ASSERT_TRUE(result.is_ok());
    const LedgerSnapshot& snapshot = result.value();

    EXPECT_EQ(snapshot.asset_id, "asset-AAPL");
    EXPECT_EQ(snapshot.symbol, "AAPL");
    EXPECT_EQ(snapshot.asset_class, AssetClass::STOCK);
    EXPECT_DOUBLE_EQ(snapshot.net_quantity, 6.0);
    EXPECT_DOUBLE_EQ(snapshot.realized_pnl, 8.0);
    EXPECT_DOUBLE_EQ(snapshot.average_cost, 10.0);
    EXPECT_EQ(snapshot.orphans.size(), 1u);
    EXPECT_EQ(snapshot.processed_count, 3u);
    EXPECT_EQ(snapshot.last_activity, at(2024, 1, 4));
}

TEST_F(CostBasisLedgerTest, RunStopsAtMalformedInput) {
    std::vector<Transaction> stream = {
        stock_buy("b1", "AAPL", 10, 10.0, at(2024, 1, 2)),
        stock_sell("s1", "AAPL", -1, 12.0, at(2024, 1, 3)),
    };
    auto result = CostBasisLedger::run(stream);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(CostBasisLedgerTest, FractionalCryptoQuantities) {
    CostBasisLedger ledger;
    auto buy = stock_buy("b1", "BTC", 0.3, 40000.0, at(2024, 1, 2));
    buy.asset_class = AssetClass::CRYPTO;
    auto sell = stock_sell("s1", "BTC", 0.1, 50000.0, at(2024, 1, 3));
    sell.asset_class = AssetClass::CRYPTO;

    apply_ok(ledger, buy);
    auto effect = apply_ok(ledger, sell);
    EXPECT_NEAR(effect.realized_pnl, 1000.0, 1e-6);
    EXPECT_NEAR(ledger.net_quantity(), 0.2, 1e-12);
}
