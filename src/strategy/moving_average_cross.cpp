// src/strategy/moving_average_cross.cpp
#include "backfolio/strategy/moving_average_cross.hpp"
#include <cmath>

namespace backfolio {
namespace strategy {

nlohmann::json MovingAverageCrossConfig::to_json() const {
    return nlohmann::json{{"fast_period", fast_period},
                          {"slow_period", slow_period},
                          {"position_fraction", position_fraction}};
}

MovingAverageCrossStrategy::MovingAverageCrossStrategy(nlohmann::json parameters)
    : BaseStrategy("MA_CROSS", std::move(parameters)) {
    Logger::register_component("MovingAverageCross");

    config_.fast_period = get_param<int>("fast_period", config_.fast_period);
    config_.slow_period = get_param<int>("slow_period", config_.slow_period);
    config_.position_fraction = get_param<double>("position_fraction", config_.position_fraction);
    parameters_ = config_.to_json();
}

Result<void> MovingAverageCrossStrategy::validate_config() const {
    if (config_.fast_period < 1) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Fast period must be at least 1",
                                "MovingAverageCrossStrategy");
    }
    if (config_.slow_period <= config_.fast_period) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Slow period must be longer than the fast period",
                                "MovingAverageCrossStrategy");
    }
    if (config_.position_fraction <= 0.0 || config_.position_fraction > 1.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Position fraction must be in (0, 1]",
                                "MovingAverageCrossStrategy");
    }
    return Result<void>();
}

double MovingAverageCrossStrategy::average(int period) const {
    double sum = 0.0;
    auto it = closes_.rbegin();
    for (int i = 0; i < period; ++i, ++it) {
        sum += *it;
    }
    return sum / period;
}

Result<std::vector<OrderSignal>> MovingAverageCrossStrategy::on_bar(
    const Bar& bar, const portfolio::Account& account) {
    std::vector<OrderSignal> signals;

    if (!std::isfinite(bar.close) || bar.close <= 0.0) {
        return make_error<std::vector<OrderSignal>>(
            ErrorCode::INVALID_DATA, "Non-positive close for " + bar.symbol,
            "MovingAverageCrossStrategy");
    }

    closes_.push_back(bar.close);
    while (closes_.size() > static_cast<size_t>(config_.slow_period)) {
        closes_.pop_front();
    }
    if (closes_.size() < static_cast<size_t>(config_.slow_period)) {
        return signals;
    }

    bool above = average(config_.fast_period) > average(config_.slow_period);
    bool crossed = fast_above_.has_value() && *fast_above_ != above;
    fast_above_ = above;
    if (!crossed) {
        return signals;
    }

    Quantity held = account.quantity(bar.symbol);
    if (above && held <= 0.0) {
        Quantity qty = std::floor(account.cash() * config_.position_fraction / bar.close);
        if (qty > 0.0) {
            signals.push_back(OrderSignal{bar.symbol, Side::BUY, qty});
        }
    } else if (!above && held > 0.0) {
        signals.push_back(OrderSignal{bar.symbol, Side::SELL, held});
    }
    return signals;
}

void MovingAverageCrossStrategy::reset() {
    closes_.clear();
    fast_above_.reset();
}

}  // namespace strategy
}  // namespace backfolio
