// src/backtest/slippage_model.cpp
#include <algorithm>
#include <cmath>
#include "backfolio/backtest/slippage_models.hpp"

namespace backfolio {
namespace backtest {

BasisPointSlippageModel::BasisPointSlippageModel(double slippage_bps)
    : slippage_bps_(std::max(0.0, slippage_bps)) {}

double BasisPointSlippageModel::calculate_slippage(double price, double /*quantity*/, Side side,
                                                   const std::optional<Bar>& /*market_data*/) const {
    double impact = slippage_bps_ / 10000.0;
    return side == Side::BUY ? price * (1.0 + impact) : price * (1.0 - impact);
}

VolumeSlippageModel::VolumeSlippageModel(VolumeSlippageConfig config)
    : config_(std::move(config)) {}

double VolumeSlippageModel::calculate_slippage(double price, double quantity, Side side,
                                               const std::optional<Bar>& market_data) const {
    double avg_volume = 0.0;
    if (market_data) {
        avg_volume = average_volume(market_data->symbol);
        if (avg_volume <= 0.0) {
            avg_volume = market_data->volume;
        }
    }

    double impact = 0.0;
    if (avg_volume > 0.0) {
        double raw_ratio = std::abs(quantity) / avg_volume;
        double volume_ratio =
            std::clamp(raw_ratio, config_.min_volume_ratio, config_.max_volume_ratio);
        impact = config_.price_impact_coefficient * std::sqrt(volume_ratio);

        // Orders larger than the capped ratio pay linearly for the excess
        if (raw_ratio > config_.max_volume_ratio) {
            impact *= 1.0 + (raw_ratio - config_.max_volume_ratio);
        }
    }

    // Never let a sell fill at or below zero
    impact = std::min(impact, 0.5);
    return side == Side::BUY ? price * (1.0 + impact) : price * (1.0 - impact);
}

void VolumeSlippageModel::update(const Bar& market_data) {
    constexpr double kVolumeWindow = 20.0;

    auto& avg_volume = average_volumes_[market_data.symbol];
    if (avg_volume == 0.0) {
        avg_volume = market_data.volume;
    } else {
        avg_volume = (avg_volume * (kVolumeWindow - 1.0) + market_data.volume) / kVolumeWindow;
    }
}

double VolumeSlippageModel::average_volume(const std::string& symbol) const {
    auto it = average_volumes_.find(symbol);
    return it == average_volumes_.end() ? 0.0 : it->second;
}

}  // namespace backtest
}  // namespace backfolio
