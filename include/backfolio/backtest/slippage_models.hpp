// include/backfolio/backtest/slippage_models.hpp
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include "backfolio/core/types.hpp"

namespace backfolio {
namespace backtest {

/**
 * @brief Configuration for volume-based slippage model
 */
struct VolumeSlippageConfig {
    double price_impact_coefficient{1e-3};  // Impact at a volume ratio of 1
    double min_volume_ratio{0.0};           // Lower clamp on order / average volume
    double max_volume_ratio{0.1};           // Ratio above which impact grows linearly
};

/**
 * @brief Interface for slippage models
 */
class SlippageModel {
public:
    virtual ~SlippageModel() = default;

    /**
     * @brief Price an order will actually fill at
     * @param price Reference price for the session
     * @param quantity Unsigned order quantity
     * @param side Order side; buys fill above the reference, sells below
     * @param market_data Session bar of the instrument, when available
     */
    virtual double calculate_slippage(double price, double quantity, Side side,
                                      const std::optional<Bar>& market_data) const = 0;

    /**
     * @brief Feed the model one more bar of market history
     */
    virtual void update(const Bar& market_data) = 0;
};

/**
 * @brief Fixed basis-point slippage against the trader
 */
class BasisPointSlippageModel : public SlippageModel {
public:
    explicit BasisPointSlippageModel(double slippage_bps);

    double calculate_slippage(double price, double quantity, Side side,
                              const std::optional<Bar>& market_data) const override;

    void update(const Bar&) override {}

private:
    double slippage_bps_;
};

/**
 * @brief Square-root impact on the order's share of average traded volume
 */
class VolumeSlippageModel : public SlippageModel {
public:
    explicit VolumeSlippageModel(VolumeSlippageConfig config);

    double calculate_slippage(double price, double quantity, Side side,
                              const std::optional<Bar>& market_data) const override;

    void update(const Bar& market_data) override;

    double average_volume(const std::string& symbol) const;

private:
    VolumeSlippageConfig config_;
    std::unordered_map<std::string, double> average_volumes_;
};

}  // namespace backtest
}  // namespace backfolio
