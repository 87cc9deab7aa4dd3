// include/backfolio/strategy/value_portfolio.hpp
#pragma once

#include "backfolio/strategy/base_strategy.hpp"

namespace backfolio {
namespace strategy {

/**
 * @brief Screening thresholds of the value portfolio strategy
 */
struct ValuePortfolioConfig {
    double per_max{10.0};
    double pbr_max{1.0};
    double roe_min{10.0};
    int max_stocks{20};
    int rebalance_days{30};  // Sessions between rebalances

    nlohmann::json to_json() const;
};

/**
 * @brief Equal-weight portfolio of cheap, profitable instruments
 *
 * Keeps instruments with 0 < PER < per_max, 0 < PBR < pbr_max and
 * ROE > roe_min, then holds the max_stocks with the largest traded value at
 * weight 1/N. Instruments missing a fundamental never pass the screen.
 */
class ValuePortfolioStrategy : public BaseStrategy {
public:
    explicit ValuePortfolioStrategy(nlohmann::json parameters = nlohmann::json::object());

    Result<void> validate_config() const;

    bool has_universe_selection() const override {
        return true;
    }

    Result<std::vector<std::string>> select_universe(
        const Timestamp& date, const data::MarketSnapshot& snapshot) override;

    Result<std::vector<TargetWeight>> get_target_weights(
        const std::vector<std::string>& universe, const data::MarketSnapshot& snapshot,
        const portfolio::Account& account) override;

    const ValuePortfolioConfig& config() const {
        return config_;
    }

private:
    bool passes_screen(const data::SnapshotRow& row) const;

    ValuePortfolioConfig config_;
};

}  // namespace strategy
}  // namespace backfolio
