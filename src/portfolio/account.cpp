// src/portfolio/account.cpp

#include "backfolio/portfolio/account.hpp"
#include <algorithm>
#include <cmath>

namespace backfolio {
namespace portfolio {

namespace {
constexpr double kFlatEpsilon = 1e-9;
}  // namespace

Account::Account(double initial_cash) : initial_cash_(initial_cash), cash_(initial_cash) {}

Result<void> Account::apply_fill(const Fill& fill) {
    if (fill.quantity <= 0.0 || fill.price <= 0.0 || fill.commission < 0.0) {
        return make_error<void>(ErrorCode::INVALID_FILL,
                                "Cannot settle malformed fill for " + fill.symbol, "Account");
    }

    double signed_qty = fill.side == Side::BUY ? fill.quantity : -fill.quantity;
    double notional = fill.quantity * fill.price;

    if (fill.side == Side::BUY) {
        cash_ -= notional + fill.commission;
    } else if (fill.side == Side::SELL) {
        cash_ += notional - fill.commission;
    } else {
        return make_error<void>(ErrorCode::INVALID_FILL, "Fill has no side for " + fill.symbol,
                                "Account");
    }

    last_prices_[fill.symbol] = fill.price;

    auto it = positions_.find(fill.symbol);
    if (it == positions_.end()) {
        Position pos(fill.symbol, signed_qty, fill.price, fill.timestamp);
        pos.last_price = fill.price;
        pos.realized_pnl = realized_pnl(fill.symbol);
        positions_.emplace(fill.symbol, pos);
        return Result<void>();
    }

    Position& pos = it->second;
    double old_qty = pos.quantity;
    double new_qty = old_qty + signed_qty;

    bool same_direction = (old_qty > 0 && signed_qty > 0) || (old_qty < 0 && signed_qty < 0);
    if (same_direction) {
        pos.average_price =
            (std::abs(old_qty) * pos.average_price + fill.quantity * fill.price) /
            std::abs(new_qty);
    } else {
        double closed = std::min(std::abs(old_qty), fill.quantity);
        double direction = old_qty > 0 ? 1.0 : -1.0;
        double realized = (fill.price - pos.average_price) * closed * direction;
        pos.realized_pnl += realized;
        realized_pnl_[fill.symbol] += realized;
        // Crossing through zero re-bases the remainder at the fill price
        if (std::abs(new_qty) > kFlatEpsilon && (new_qty > 0) != (old_qty > 0)) {
            pos.average_price = fill.price;
        }
    }

    pos.quantity = new_qty;
    pos.last_price = fill.price;
    pos.last_update = fill.timestamp;
    pos.unrealized_pnl = (pos.last_price - pos.average_price) * pos.quantity;

    if (std::abs(pos.quantity) <= kFlatEpsilon) {
        positions_.erase(it);
    }
    return Result<void>();
}

void Account::mark_to_market(const std::map<std::string, Price>& prices, const Timestamp& ts) {
    for (const auto& [symbol, price] : prices) {
        if (price > 0.0 && std::isfinite(price)) {
            last_prices_[symbol] = price;
        }
    }

    for (auto& [symbol, pos] : positions_) {
        auto it = last_prices_.find(symbol);
        if (it != last_prices_.end()) {
            pos.last_price = it->second;
        }
        pos.unrealized_pnl = (pos.last_price - pos.average_price) * pos.quantity;
        pos.last_update = ts;
    }
}

double Account::equity() const {
    double holdings = 0.0;
    for (const auto& [symbol, pos] : positions_) {
        holdings += pos.quantity * pos.last_price;
    }
    return cash_ + holdings;
}

Quantity Account::quantity(const std::string& symbol) const {
    auto it = positions_.find(symbol);
    return it == positions_.end() ? 0.0 : it->second.quantity;
}

double Account::realized_pnl(const std::string& symbol) const {
    auto it = realized_pnl_.find(symbol);
    return it == realized_pnl_.end() ? 0.0 : it->second;
}

double Account::total_realized_pnl() const {
    double total = 0.0;
    for (const auto& [symbol, pnl] : realized_pnl_) {
        total += pnl;
    }
    return total;
}

Price Account::last_price(const std::string& symbol) const {
    auto it = last_prices_.find(symbol);
    return it == last_prices_.end() ? 0.0 : it->second;
}

}  // namespace portfolio
}  // namespace backfolio
