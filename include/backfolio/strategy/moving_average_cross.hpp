// include/backfolio/strategy/moving_average_cross.hpp
#pragma once

#include <deque>
#include <optional>
#include "backfolio/strategy/base_strategy.hpp"

namespace backfolio {
namespace strategy {

/**
 * @brief Parameters of the moving average crossover strategy
 */
struct MovingAverageCrossConfig {
    int fast_period{10};
    int slow_period{30};
    double position_fraction{0.95};  // Share of cash committed on entry

    nlohmann::json to_json() const;
};

/**
 * @brief Long-only single-instrument crossover of two simple moving averages
 *
 * Buys when the fast average crosses above the slow one while flat and sells
 * the whole holding on the opposite cross.
 */
class MovingAverageCrossStrategy : public BaseStrategy {
public:
    explicit MovingAverageCrossStrategy(nlohmann::json parameters = nlohmann::json::object());

    Result<void> validate_config() const;

    Result<std::vector<OrderSignal>> on_bar(const Bar& bar,
                                            const portfolio::Account& account) override;

    void reset() override;

    const MovingAverageCrossConfig& config() const {
        return config_;
    }

private:
    double average(int period) const;

    MovingAverageCrossConfig config_;
    std::deque<double> closes_;
    std::optional<bool> fast_above_;  // unset until both averages exist
};

}  // namespace strategy
}  // namespace backfolio
