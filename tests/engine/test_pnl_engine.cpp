#include <gtest/gtest.h>
#include "../core/test_base.hpp"
#include "../data/test_repository_utils.hpp"
#include "ledger_ngin/engine/pnl_engine.hpp"

using namespace ledger_ngin;
using namespace ledger_ngin::testing;

namespace {
const std::string kCall = "AAPL250117C00150000";
}

class PnLEngineTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        transactions = std::make_shared<InMemoryTransactionRepository>();
        positions = std::make_shared<InMemoryPositionRepository>();
        clock = std::make_shared<ManualClock>(at(2024, 2, 20));
        engine = std::make_unique<PnLEngine>(transactions, positions, clock);
    }

    void TearDown() override {
        engine.reset();
        TestBase::TearDown();
    }

    std::shared_ptr<InMemoryTransactionRepository> transactions;
    std::shared_ptr<InMemoryPositionRepository> positions;
    std::shared_ptr<ManualClock> clock;
    std::unique_ptr<PnLEngine> engine;
};

TEST_F(PnLEngineTest, MonthlyReadsAreCached) {
    transactions->add_all({
        stock_buy("b1", "AAPL", 10, 10.0, at(2024, 2, 1)),
        stock_sell("s1", "AAPL", 5, 14.0, at(2024, 2, 5)),
    });

    auto first = engine->monthly_pnl("pf-1", 2024, 2);
    auto second = engine->monthly_pnl("pf-1", 2024, 2);
    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());
    EXPECT_DOUBLE_EQ(second.value().total_pnl, 20.0);
    EXPECT_EQ(transactions->calls(), 1);
    EXPECT_EQ(engine->cache_stats().hits, 1u);
}

TEST_F(PnLEngineTest, WrittenTransactionsInvalidateCachedMonths) {
    transactions->add(stock_buy("b1", "AAPL", 10, 10.0, at(2024, 2, 1)));
    ASSERT_TRUE(engine->monthly_pnl("pf-1", 2024, 2).is_ok());

    transactions->add(stock_sell("s1", "AAPL", 10, 11.0, at(2024, 2, 8)));
    auto stale = engine->monthly_pnl("pf-1", 2024, 2);
    ASSERT_TRUE(stale.is_ok());
    EXPECT_EQ(stale.value().total_transactions, 1u);

    engine->record_transactions_written("pf-1");
    auto fresh = engine->monthly_pnl("pf-1", 2024, 2);
    ASSERT_TRUE(fresh.is_ok());
    EXPECT_EQ(fresh.value().total_transactions, 2u);
    EXPECT_DOUBLE_EQ(fresh.value().total_pnl, 10.0);
}

TEST_F(PnLEngineTest, ReconcileWritesPositionsAndInvalidates) {
    transactions->add(stock_buy("b1", "AAPL", 10, 10.0, at(2024, 2, 1)));
    ASSERT_TRUE(engine->monthly_pnl("pf-1", 2024, 2).is_ok());

    auto report = engine->reconcile("pf-1");
    ASSERT_TRUE(report.is_ok());
    EXPECT_TRUE(positions->find("pf-1", "asset-AAPL").has_value());
    EXPECT_EQ(engine->cache_stats().entries, 0u);
}

TEST_F(PnLEngineTest, FailedReconcileLeavesCache) {
    transactions->add(stock_buy("b1", "AAPL", 10, 10.0, at(2024, 2, 1)));
    ASSERT_TRUE(engine->monthly_pnl("pf-1", 2024, 2).is_ok());

    positions->fail_list_ = true;
    auto report = engine->reconcile("pf-1");
    ASSERT_TRUE(report.is_error());
    EXPECT_EQ(report.error()->code(), ErrorCode::REPOSITORY_ERROR);
    EXPECT_EQ(engine->cache_stats().entries, 1u);
}

TEST_F(PnLEngineTest, CombinedDailyRangeAndCurrentMonth) {
    transactions->add_all({
        stock_buy("b1", "AAPL", 10, 10.0, at(2024, 2, 1), "pf-1"),
        stock_sell("s1", "AAPL", 10, 12.0, at(2024, 2, 5), "pf-1"),
        stock_buy("b2", "MSFT", 1, 300.0, at(2024, 2, 1), "pf-2"),
        stock_sell("s2", "MSFT", 1, 290.0, at(2024, 2, 5), "pf-2"),
    });

    auto combined = engine->combined_monthly_pnl({"pf-1", "pf-2"}, 2024, 2);
    ASSERT_TRUE(combined.is_ok());
    EXPECT_DOUBLE_EQ(combined.value().days[4].realized_pnl, 10.0);
    EXPECT_EQ(combined.value().days[4].category, DayCategory::POSITIVE);
    EXPECT_EQ(combined.value().total_transactions, 4u);

    auto day = engine->daily_pnl("pf-2", Date(2024, 2, 5));
    ASSERT_TRUE(day.is_ok());
    EXPECT_DOUBLE_EQ(day.value().realized_pnl, -10.0);

    auto range = engine->monthly_range("pf-1", 2024, 1, 2024, 3);
    ASSERT_TRUE(range.is_ok());
    ASSERT_EQ(range.value().size(), 3u);
    EXPECT_DOUBLE_EQ(range.value()[1].total_pnl, 20.0);

    auto current = engine->current_month_pnl("pf-1");
    ASSERT_TRUE(current.is_ok());
    EXPECT_EQ(current.value().month, 2);

    EXPECT_TRUE(engine->combined_monthly_pnl({}, 2024, 2).is_error());
    EXPECT_TRUE(engine->monthly_range("pf-1", 2024, 3, 2024, 1).is_error());
    EXPECT_TRUE(engine->daily_pnl("pf-1", Date(2024, 2, 31)).is_error());
}

TEST_F(PnLEngineTest, ConfiguredClassifierIsUsed) {
    EngineConfig config;
    config.strategy_classifier = "underlying_ownership";
    engine = std::make_unique<PnLEngine>(transactions, positions, clock, config);
    clock->set(at(2024, 12, 31));

    transactions->add_all({
        stock_buy("b1", "AAPL", 100, 190.0, at(2024, 12, 1)),
        option_trade("o1", TransactionKind::SELL, kCall, 100, 2.0, at(2024, 12, 2)),
        option_trade("o2", TransactionKind::BUY, kCall, 100, 0.5, at(2024, 12, 20)),
    });

    auto report = engine->reconcile("pf-1");
    ASSERT_TRUE(report.is_ok());
    EXPECT_EQ(report.value().classified_count, 2u);
    EXPECT_FALSE(positions->find("pf-1", "asset-" + kCall).has_value());
}

TEST_F(PnLEngineTest, UnknownClassifierThrows) {
    EngineConfig config;
    config.strategy_classifier = "tea_leaves";
    EXPECT_THROW(PnLEngine(transactions, positions, clock, config), LedgerError);
}
