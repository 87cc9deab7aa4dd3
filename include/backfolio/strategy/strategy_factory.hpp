// include/backfolio/strategy/strategy_factory.hpp
#pragma once

#include <memory>
#include <string>
#include <vector>
#include "backfolio/strategy/strategy_interface.hpp"

namespace backfolio {
namespace strategy {

/**
 * @brief Creates bundled strategies by name
 *
 * Known names are MA_CROSS and VALUE_PORTFOLIO (case-insensitive).
 * Parameters are validated before the strategy is returned.
 */
class StrategyFactory {
public:
    static Result<std::unique_ptr<StrategyInterface>> create(const std::string& name,
                                                             const nlohmann::json& parameters);

    static std::vector<std::string> available_strategies();
};

}  // namespace strategy
}  // namespace backfolio
