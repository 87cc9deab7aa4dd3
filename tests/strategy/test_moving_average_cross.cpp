#include <gtest/gtest.h>
#include "backfolio/portfolio/account.hpp"
#include "backfolio/strategy/moving_average_cross.hpp"
#include "core/test_base.hpp"
#include "data/test_data_utils.hpp"

using namespace backfolio;
using namespace backfolio::strategy;
using namespace backfolio::testing;

class MovingAverageCrossTest : public TestBase {
protected:
    std::vector<OrderSignal> feed(MovingAverageCrossStrategy& strategy, double close, int day) {
        auto result = strategy.on_bar(make_bar("AAA", make_day(day), close), account);
        EXPECT_TRUE(result.is_ok());
        return result.is_ok() ? result.value() : std::vector<OrderSignal>{};
    }

    portfolio::Account account{10000.0};
};

TEST_F(MovingAverageCrossTest, ParametersOverrideDefaults) {
    MovingAverageCrossStrategy strategy(nlohmann::json{{"fast_period", 2}, {"slow_period", 3}});
    EXPECT_EQ(strategy.name(), "MA_CROSS");
    EXPECT_EQ(strategy.config().fast_period, 2);
    EXPECT_EQ(strategy.config().slow_period, 3);
    EXPECT_DOUBLE_EQ(strategy.config().position_fraction, 0.95);
    EXPECT_EQ(strategy.parameters()["slow_period"], 3);
    EXPECT_FALSE(strategy.has_universe_selection());
}

TEST_F(MovingAverageCrossTest, WrongParameterTypeFallsBackToDefault) {
    MovingAverageCrossStrategy strategy(nlohmann::json{{"fast_period", "fast"}});
    EXPECT_EQ(strategy.config().fast_period, 10);
    EXPECT_TRUE(strategy.validate_config().is_ok());
}

TEST_F(MovingAverageCrossTest, ValidationRejectsBadPeriods) {
    MovingAverageCrossStrategy zero_fast(nlohmann::json{{"fast_period", 0}});
    EXPECT_TRUE(zero_fast.validate_config().is_error());

    MovingAverageCrossStrategy equal_periods(nlohmann::json{{"fast_period", 5}, {"slow_period", 5}});
    EXPECT_TRUE(equal_periods.validate_config().is_error());

    MovingAverageCrossStrategy oversized(nlohmann::json{{"position_fraction", 1.5}});
    EXPECT_TRUE(oversized.validate_config().is_error());
}

TEST_F(MovingAverageCrossTest, NoSignalDuringWarmup) {
    MovingAverageCrossStrategy strategy(nlohmann::json{{"fast_period", 2}, {"slow_period", 3}});
    EXPECT_TRUE(feed(strategy, 10.0, 0).empty());
    EXPECT_TRUE(feed(strategy, 20.0, 1).empty());
}

TEST_F(MovingAverageCrossTest, BuysOnUpwardCrossAndSellsOnDownwardCross) {
    MovingAverageCrossStrategy strategy(nlohmann::json{{"fast_period", 2}, {"slow_period", 3}});
    feed(strategy, 10.0, 0);
    feed(strategy, 10.0, 1);
    EXPECT_TRUE(feed(strategy, 10.0, 2).empty());  // first full window sets the state

    auto buy = feed(strategy, 13.0, 3);
    ASSERT_EQ(buy.size(), 1u);
    EXPECT_EQ(buy[0].side, Side::BUY);
    EXPECT_EQ(buy[0].symbol, "AAA");
    EXPECT_DOUBLE_EQ(buy[0].quantity, 730.0);  // floor(10000 * 0.95 / 13)

    ASSERT_TRUE(account.apply_fill(make_fill("AAA", Side::BUY, 730, 13.0, make_day(3))).is_ok());
    EXPECT_TRUE(feed(strategy, 14.0, 4).empty());  // still above, no new cross

    auto sell = feed(strategy, 5.0, 5);
    ASSERT_EQ(sell.size(), 1u);
    EXPECT_EQ(sell[0].side, Side::SELL);
    EXPECT_DOUBLE_EQ(sell[0].quantity, 730.0);
}

TEST_F(MovingAverageCrossTest, DownwardCrossWithoutHoldingIsSilent) {
    MovingAverageCrossStrategy strategy(nlohmann::json{{"fast_period", 2}, {"slow_period", 3}});
    feed(strategy, 10.0, 0);
    feed(strategy, 12.0, 1);
    feed(strategy, 14.0, 2);
    EXPECT_TRUE(feed(strategy, 6.0, 3).empty());
}

TEST_F(MovingAverageCrossTest, NonPositiveCloseIsInvalidData) {
    MovingAverageCrossStrategy strategy;
    auto result = strategy.on_bar(make_bar("AAA", make_day(0), 0.0), account);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_DATA);
}

TEST_F(MovingAverageCrossTest, ResetForgetsHistory) {
    MovingAverageCrossStrategy strategy(nlohmann::json{{"fast_period", 2}, {"slow_period", 3}});
    feed(strategy, 10.0, 0);
    feed(strategy, 10.0, 1);
    feed(strategy, 10.0, 2);
    strategy.reset();

    // A rise right after reset is warmup again, not a cross
    EXPECT_TRUE(feed(strategy, 10.0, 3).empty());
    EXPECT_TRUE(feed(strategy, 10.0, 4).empty());
    EXPECT_TRUE(feed(strategy, 13.0, 5).empty());
}
