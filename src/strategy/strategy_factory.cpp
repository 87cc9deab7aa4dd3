// src/strategy/strategy_factory.cpp
#include "backfolio/strategy/strategy_factory.hpp"
#include <algorithm>
#include <cctype>
#include "backfolio/strategy/moving_average_cross.hpp"
#include "backfolio/strategy/value_portfolio.hpp"

namespace backfolio {
namespace strategy {

namespace {

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

template <typename StrategyT>
Result<std::unique_ptr<StrategyInterface>> build(const nlohmann::json& parameters) {
    try {
        auto strategy = std::make_unique<StrategyT>(parameters);
        auto validation = strategy->validate_config();
        if (validation.is_error()) {
            return make_error<std::unique_ptr<StrategyInterface>>(
                validation.error()->code(), validation.error()->what(), "StrategyFactory");
        }
        return std::unique_ptr<StrategyInterface>(std::move(strategy));
    } catch (const std::exception& e) {
        return make_error<std::unique_ptr<StrategyInterface>>(
            ErrorCode::INVALID_ARGUMENT, "Invalid strategy parameters: " + std::string(e.what()),
            "StrategyFactory");
    }
}

}  // namespace

Result<std::unique_ptr<StrategyInterface>> StrategyFactory::create(
    const std::string& name, const nlohmann::json& parameters) {
    std::string key = to_upper(name);
    if (key == "MA_CROSS" || key == "MOVINGAVERAGECROSSSTRATEGY") {
        return build<MovingAverageCrossStrategy>(parameters);
    }
    if (key == "VALUE_PORTFOLIO" || key == "VALUEPORTFOLIOSTRATEGY") {
        return build<ValuePortfolioStrategy>(parameters);
    }
    return make_error<std::unique_ptr<StrategyInterface>>(
        ErrorCode::INVALID_ARGUMENT, "Unknown strategy: " + name, "StrategyFactory");
}

std::vector<std::string> StrategyFactory::available_strategies() {
    return {"MA_CROSS", "VALUE_PORTFOLIO"};
}

}  // namespace strategy
}  // namespace backfolio
