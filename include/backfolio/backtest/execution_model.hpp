// include/backfolio/backtest/execution_model.hpp
#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include "backfolio/backtest/slippage_models.hpp"
#include "backfolio/core/error.hpp"
#include "backfolio/core/types.hpp"

namespace backfolio {
namespace backtest {

/**
 * @brief Which price of the session bar orders trade at
 */
enum class TradePricePolicy {
    OPEN,
    CLOSE,
    VWAP_PROXY  // (high + low + close) / 3
};

std::string trade_price_policy_to_string(TradePricePolicy policy);
TradePricePolicy trade_price_policy_from_string(const std::string& s);

/**
 * @brief Proportional commission with a per-fill minimum
 */
struct CommissionModel {
    double rate{0.0};     // fraction of notional
    double minimum{0.0};  // per fill

    double compute(double notional) const;

    nlohmann::json to_json() const;
    void from_json(const nlohmann::json& j);
};

/**
 * @brief Pluggable source of simulated fills
 */
class ExecutionModel {
public:
    virtual ~ExecutionModel() = default;

    /**
     * @brief Reference price of a bar under this model's price policy
     * @return std::nullopt when the bar cannot be traded
     */
    virtual std::optional<Price> session_price(const Bar& bar) const = 0;

    /**
     * @brief Fill an order in full against the session bar
     * @param symbol Instrument to trade
     * @param side BUY or SELL
     * @param quantity Unsigned quantity, > 0
     * @param bar Session bar of the instrument
     * @param timestamp Execution time
     */
    virtual Result<Fill> execute(const std::string& symbol, Side side, Quantity quantity,
                                 const Bar& bar, const Timestamp& timestamp) = 0;

    /**
     * @brief Observe a session bar (for stateful slippage)
     */
    virtual void on_bar(const Bar& bar) = 0;

    virtual void reset() = 0;
};

/**
 * @brief Fills at the session price adjusted by a slippage model
 */
class SimulatedExecutionModel : public ExecutionModel {
public:
    SimulatedExecutionModel(TradePricePolicy policy, CommissionModel commission,
                            std::unique_ptr<SlippageModel> slippage = nullptr);

    std::optional<Price> session_price(const Bar& bar) const override;

    Result<Fill> execute(const std::string& symbol, Side side, Quantity quantity, const Bar& bar,
                         const Timestamp& timestamp) override;

    void on_bar(const Bar& bar) override;

    void reset() override;

    int execution_count() const {
        return execution_counter_;
    }

private:
    std::string generate_order_id();

    TradePricePolicy policy_;
    CommissionModel commission_;
    std::unique_ptr<SlippageModel> slippage_;
    int execution_counter_{0};
};

}  // namespace backtest
}  // namespace backfolio
