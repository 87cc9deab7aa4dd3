#include <gtest/gtest.h>
#include "backfolio/strategy/strategy_factory.hpp"
#include "core/test_base.hpp"

using namespace backfolio;
using namespace backfolio::strategy;
using namespace backfolio::testing;

class StrategyFactoryTest : public TestBase {};

TEST_F(StrategyFactoryTest, CreatesKnownStrategiesCaseInsensitively) {
    auto value = StrategyFactory::create("value_portfolio", {{"max_stocks", 3}});
    ASSERT_TRUE(value.is_ok()) << value.error()->to_string();
    EXPECT_EQ(value.value()->name(), "VALUE_PORTFOLIO");
    EXPECT_TRUE(value.value()->has_universe_selection());
    EXPECT_EQ(value.value()->parameters()["max_stocks"], 3);

    auto cross = StrategyFactory::create("MovingAverageCrossStrategy", nlohmann::json::object());
    ASSERT_TRUE(cross.is_ok());
    EXPECT_EQ(cross.value()->name(), "MA_CROSS");
}

TEST_F(StrategyFactoryTest, UnknownNameIsInvalidArgument) {
    auto result = StrategyFactory::create("MOMENTUM", nlohmann::json::object());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(StrategyFactoryTest, InvalidParametersAreRejected) {
    auto result = StrategyFactory::create("MA_CROSS", {{"fast_period", 30}, {"slow_period", 10}});
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(StrategyFactoryTest, ListsAvailableStrategies) {
    auto names = StrategyFactory::available_strategies();
    ASSERT_EQ(names.size(), 2u);
    for (const auto& name : names) {
        EXPECT_TRUE(StrategyFactory::create(name, nlohmann::json::object()).is_ok()) << name;
    }
}
