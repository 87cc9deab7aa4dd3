// include/backfolio/strategy/base_strategy.hpp
#pragma once

#include <string>
#include <vector>
#include "backfolio/core/logger.hpp"
#include "backfolio/strategy/strategy_interface.hpp"

namespace backfolio {
namespace strategy {

/**
 * @brief Base class for all strategies
 *
 * Holds the strategy name and its JSON parameters. Portfolio-mode entry
 * points fail with NOT_INITIALIZED until a derived class overrides them.
 */
class BaseStrategy : public StrategyInterface {
public:
    /**
     * @brief Constructor
     * @param name Strategy name reported in results
     * @param parameters Strategy parameters, must be a JSON object or null
     */
    BaseStrategy(std::string name, nlohmann::json parameters);

    virtual ~BaseStrategy() = default;

    const std::string& name() const override {
        return name_;
    }

    const nlohmann::json& parameters() const override {
        return parameters_;
    }

    bool has_universe_selection() const override {
        return false;
    }

    Result<std::vector<OrderSignal>> on_bar(const Bar& bar,
                                            const portfolio::Account& account) override;

    Result<std::vector<std::string>> select_universe(
        const Timestamp& date, const data::MarketSnapshot& snapshot) override;

    Result<std::vector<TargetWeight>> get_target_weights(
        const std::vector<std::string>& universe, const data::MarketSnapshot& snapshot,
        const portfolio::Account& account) override;

    void on_fill(const Fill& fill) override;

    void reset() override {}

protected:
    /**
     * @brief Typed parameter lookup with a default for missing or mistyped keys
     */
    template <typename T>
    T get_param(const std::string& key, const T& default_value) const {
        if (!parameters_.is_object() || !parameters_.contains(key)) {
            return default_value;
        }
        try {
            return parameters_.at(key).get<T>();
        } catch (const nlohmann::json::exception& e) {
            WARN("Parameter '" << key << "' of strategy " << name_
                               << " has the wrong type, using default: " << e.what());
            return default_value;
        }
    }

    std::string name_;
    nlohmann::json parameters_;
};

}  // namespace strategy
}  // namespace backfolio
