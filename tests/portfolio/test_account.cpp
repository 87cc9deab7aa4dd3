#include <gtest/gtest.h>
#include "backfolio/portfolio/account.hpp"
#include "core/test_base.hpp"
#include "data/test_data_utils.hpp"

using namespace backfolio;
using namespace backfolio::portfolio;
using namespace backfolio::testing;

class AccountTest : public TestBase {};

TEST_F(AccountTest, BuyDebitsNotionalAndCommission) {
    Account account(10000.0);
    ASSERT_TRUE(account.apply_fill(make_fill("A", Side::BUY, 10, 100.0, make_day(0), 5.0)).is_ok());

    EXPECT_DOUBLE_EQ(account.cash(), 10000.0 - 1000.0 - 5.0);
    EXPECT_DOUBLE_EQ(account.quantity("A"), 10.0);
    EXPECT_TRUE(account.holds("A"));
    EXPECT_DOUBLE_EQ(account.equity(), 9995.0);
}

TEST_F(AccountTest, SellCreditsNotionalLessCommission) {
    Account account(10000.0);
    ASSERT_TRUE(account.apply_fill(make_fill("A", Side::BUY, 10, 100.0, make_day(0))).is_ok());
    ASSERT_TRUE(account.apply_fill(make_fill("A", Side::SELL, 10, 110.0, make_day(1), 2.0)).is_ok());

    EXPECT_DOUBLE_EQ(account.cash(), 10000.0 + 100.0 - 2.0);
    EXPECT_FALSE(account.holds("A"));
    EXPECT_EQ(account.open_position_count(), 0u);
    EXPECT_DOUBLE_EQ(account.last_price("A"), 110.0);
}

TEST_F(AccountTest, AveragePriceOnAdds) {
    Account account(100000.0);
    ASSERT_TRUE(account.apply_fill(make_fill("A", Side::BUY, 10, 100.0, make_day(0))).is_ok());
    ASSERT_TRUE(account.apply_fill(make_fill("A", Side::BUY, 30, 120.0, make_day(1))).is_ok());

    const Position& pos = account.positions().at("A");
    EXPECT_DOUBLE_EQ(pos.quantity, 40.0);
    EXPECT_DOUBLE_EQ(pos.average_price, 115.0);
}

TEST_F(AccountTest, MarkToMarketRevaluesEquity) {
    Account account(10000.0);
    ASSERT_TRUE(account.apply_fill(make_fill("A", Side::BUY, 10, 100.0, make_day(0))).is_ok());

    account.mark_to_market({{"A", 120.0}}, make_day(1));
    EXPECT_DOUBLE_EQ(account.equity(), 9000.0 + 1200.0);
    EXPECT_DOUBLE_EQ(account.positions().at("A").unrealized_pnl, 200.0);

    // Missing and invalid prices keep the last known one
    account.mark_to_market({{"A", -5.0}}, make_day(2));
    EXPECT_DOUBLE_EQ(account.equity(), 10200.0);
    account.mark_to_market({}, make_day(3));
    EXPECT_DOUBLE_EQ(account.equity(), 10200.0);
}

TEST_F(AccountTest, ShortPositionReducesEquityWhenPriceRises) {
    Account account(10000.0);
    ASSERT_TRUE(account.apply_fill(make_fill("B", Side::SELL, 10, 50.0, make_day(0))).is_ok());
    EXPECT_DOUBLE_EQ(account.cash(), 10500.0);
    EXPECT_DOUBLE_EQ(account.quantity("B"), -10.0);

    account.mark_to_market({{"B", 60.0}}, make_day(1));
    EXPECT_DOUBLE_EQ(account.equity(), 10500.0 - 600.0);
}

TEST_F(AccountTest, RejectsMalformedFill) {
    Account account(1000.0);
    auto result = account.apply_fill(make_fill("A", Side::BUY, -1, 10.0, make_day(0)));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_FILL);
    EXPECT_TRUE(account.apply_fill(make_fill("A", Side::NONE, 1, 10.0, make_day(0))).is_error());
    EXPECT_DOUBLE_EQ(account.cash(), 1000.0);
}

TEST_F(AccountTest, RealizedPnlSurvivesFlatPosition) {
    Account account(100000.0);
    ASSERT_TRUE(account.apply_fill(make_fill("A", Side::BUY, 100, 100.0, make_day(0))).is_ok());
    ASSERT_TRUE(account.apply_fill(make_fill("A", Side::SELL, 100, 110.0, make_day(1), 3.0)).is_ok());

    EXPECT_FALSE(account.holds("A"));
    EXPECT_DOUBLE_EQ(account.realized_pnl("A"), 1000.0);

    ASSERT_TRUE(account.apply_fill(make_fill("A", Side::BUY, 50, 120.0, make_day(2))).is_ok());
    ASSERT_TRUE(account.holds("A"));
    EXPECT_DOUBLE_EQ(account.positions().at("A").realized_pnl, 1000.0);

    ASSERT_TRUE(account.apply_fill(make_fill("A", Side::SELL, 20, 115.0, make_day(3))).is_ok());
    EXPECT_DOUBLE_EQ(account.realized_pnl("A"), 900.0);
    EXPECT_DOUBLE_EQ(account.positions().at("A").realized_pnl, 900.0);
}

TEST_F(AccountTest, TotalRealizedPnlSumsInstruments) {
    Account account(100000.0);
    ASSERT_TRUE(account.apply_fill(make_fill("A", Side::BUY, 10, 100.0, make_day(0))).is_ok());
    ASSERT_TRUE(account.apply_fill(make_fill("A", Side::SELL, 10, 105.0, make_day(1))).is_ok());
    ASSERT_TRUE(account.apply_fill(make_fill("B", Side::SELL, 10, 50.0, make_day(0))).is_ok());
    ASSERT_TRUE(account.apply_fill(make_fill("B", Side::BUY, 10, 55.0, make_day(1))).is_ok());

    EXPECT_DOUBLE_EQ(account.realized_pnl("A"), 50.0);
    EXPECT_DOUBLE_EQ(account.realized_pnl("B"), -50.0);
    EXPECT_DOUBLE_EQ(account.realized_pnl("C"), 0.0);
    EXPECT_DOUBLE_EQ(account.total_realized_pnl(), 0.0);
    EXPECT_EQ(account.open_position_count(), 0u);
}
