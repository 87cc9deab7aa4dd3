// include/backfolio/strategy/strategy_interface.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "backfolio/core/error.hpp"
#include "backfolio/core/types.hpp"
#include "backfolio/data/market_data_source.hpp"
#include "backfolio/portfolio/account.hpp"

namespace backfolio {
namespace strategy {

/**
 * @brief Interface for all backtestable strategies
 *
 * A strategy without universe selection is driven bar by bar over one
 * instrument through on_bar. A strategy reporting has_universe_selection()
 * is driven per session through select_universe and get_target_weights.
 */
class StrategyInterface {
public:
    virtual ~StrategyInterface() = default;

    virtual const std::string& name() const = 0;
    virtual const nlohmann::json& parameters() const = 0;

    virtual bool has_universe_selection() const = 0;

    // Single-instrument mode
    virtual Result<std::vector<OrderSignal>> on_bar(const Bar& bar,
                                                    const portfolio::Account& account) = 0;

    // Portfolio mode
    virtual Result<std::vector<std::string>> select_universe(
        const Timestamp& date, const data::MarketSnapshot& snapshot) = 0;

    virtual Result<std::vector<TargetWeight>> get_target_weights(
        const std::vector<std::string>& universe, const data::MarketSnapshot& snapshot,
        const portfolio::Account& account) = 0;

    virtual void on_fill(const Fill& fill) = 0;

    /**
     * @brief Drop all per-run state so the strategy can be replayed
     */
    virtual void reset() = 0;
};

}  // namespace strategy
}  // namespace backfolio
