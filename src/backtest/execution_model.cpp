// src/backtest/execution_model.cpp

#include "backfolio/backtest/execution_model.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace backfolio {
namespace backtest {

std::string trade_price_policy_to_string(TradePricePolicy policy) {
    switch (policy) {
        case TradePricePolicy::OPEN:
            return "OPEN";
        case TradePricePolicy::CLOSE:
            return "CLOSE";
        case TradePricePolicy::VWAP_PROXY:
            return "VWAP_PROXY";
    }
    return "CLOSE";
}

TradePricePolicy trade_price_policy_from_string(const std::string& s) {
    if (s == "OPEN")
        return TradePricePolicy::OPEN;
    if (s == "VWAP_PROXY" || s == "VWAP")
        return TradePricePolicy::VWAP_PROXY;
    return TradePricePolicy::CLOSE;
}

double CommissionModel::compute(double notional) const {
    if (notional <= 0.0) {
        return 0.0;
    }
    return std::max(minimum, std::abs(notional) * rate);
}

nlohmann::json CommissionModel::to_json() const {
    nlohmann::json j;
    j["rate"] = rate;
    j["minimum"] = minimum;
    return j;
}

void CommissionModel::from_json(const nlohmann::json& j) {
    if (j.contains("rate"))
        rate = j.at("rate").get<double>();
    if (j.contains("minimum"))
        minimum = j.at("minimum").get<double>();
}

SimulatedExecutionModel::SimulatedExecutionModel(TradePricePolicy policy,
                                                 CommissionModel commission,
                                                 std::unique_ptr<SlippageModel> slippage)
    : policy_(policy), commission_(commission), slippage_(std::move(slippage)) {}

std::optional<Price> SimulatedExecutionModel::session_price(const Bar& bar) const {
    double price = 0.0;
    switch (policy_) {
        case TradePricePolicy::OPEN:
            price = bar.open;
            break;
        case TradePricePolicy::CLOSE:
            price = bar.close;
            break;
        case TradePricePolicy::VWAP_PROXY:
            price = (bar.high + bar.low + bar.close) / 3.0;
            break;
    }
    if (!std::isfinite(price) || price <= 0.0) {
        return std::nullopt;
    }
    return price;
}

Result<Fill> SimulatedExecutionModel::execute(const std::string& symbol, Side side,
                                              Quantity quantity, const Bar& bar,
                                              const Timestamp& timestamp) {
    if (side != Side::BUY && side != Side::SELL) {
        return make_error<Fill>(ErrorCode::INVALID_ARGUMENT, "Order for " + symbol + " has no side",
                                "SimulatedExecutionModel");
    }
    if (!(quantity > 0.0)) {
        return make_error<Fill>(ErrorCode::INVALID_ARGUMENT,
                                "Order quantity must be positive for " + symbol,
                                "SimulatedExecutionModel");
    }

    auto reference = session_price(bar);
    if (!reference) {
        return make_error<Fill>(ErrorCode::INVALID_DATA,
                                "No tradable " + trade_price_policy_to_string(policy_) +
                                    " price for " + symbol,
                                "SimulatedExecutionModel");
    }

    double fill_price = *reference;
    if (slippage_) {
        fill_price = slippage_->calculate_slippage(fill_price, quantity, side, bar);
    }

    Fill fill;
    fill.symbol = symbol;
    fill.side = side;
    fill.quantity = quantity;
    fill.price = fill_price;
    fill.commission = commission_.compute(quantity * fill_price);
    fill.timestamp = timestamp;
    fill.order_id = generate_order_id();
    return fill;
}

void SimulatedExecutionModel::on_bar(const Bar& bar) {
    if (slippage_) {
        slippage_->update(bar);
    }
}

void SimulatedExecutionModel::reset() {
    execution_counter_ = 0;
}

std::string SimulatedExecutionModel::generate_order_id() {
    std::ostringstream ss;
    ss << "BT-" << std::setw(8) << std::setfill('0') << ++execution_counter_;
    return ss.str();
}

}  // namespace backtest
}  // namespace backfolio
