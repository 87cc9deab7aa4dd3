// src/strategy/base_strategy.cpp

#include "backfolio/strategy/base_strategy.hpp"

namespace backfolio {
namespace strategy {

BaseStrategy::BaseStrategy(std::string name, nlohmann::json parameters)
    : name_(std::move(name)), parameters_(std::move(parameters)) {
    if (parameters_.is_null()) {
        parameters_ = nlohmann::json::object();
    }
}

Result<std::vector<OrderSignal>> BaseStrategy::on_bar(const Bar& /*bar*/,
                                                      const portfolio::Account& /*account*/) {
    return std::vector<OrderSignal>{};
}

Result<std::vector<std::string>> BaseStrategy::select_universe(
    const Timestamp& /*date*/, const data::MarketSnapshot& /*snapshot*/) {
    return make_error<std::vector<std::string>>(
        ErrorCode::NOT_INITIALIZED, "Strategy " + name_ + " does not select a universe",
        "BaseStrategy");
}

Result<std::vector<TargetWeight>> BaseStrategy::get_target_weights(
    const std::vector<std::string>& /*universe*/, const data::MarketSnapshot& /*snapshot*/,
    const portfolio::Account& /*account*/) {
    return make_error<std::vector<TargetWeight>>(
        ErrorCode::NOT_INITIALIZED, "Strategy " + name_ + " does not allocate target weights",
        "BaseStrategy");
}

void BaseStrategy::on_fill(const Fill& fill) {
    TRACE("Strategy " << name_ << " filled " << side_to_string(fill.side) << " "
                      << fill.quantity << " " << fill.symbol << " @ " << fill.price);
}

}  // namespace strategy
}  // namespace backfolio
