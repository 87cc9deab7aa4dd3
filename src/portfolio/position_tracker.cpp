// src/portfolio/position_tracker.cpp

#include "backfolio/portfolio/position_tracker.hpp"
#include <algorithm>
#include <cmath>
#include <set>
#include <sstream>

namespace backfolio {
namespace portfolio {

namespace {
// Absorbs floating point noise in weight * equity / price before flooring
constexpr double kShareEpsilon = 1e-9;
constexpr double kCashEpsilon = 1e-9;
}  // namespace

std::map<std::string, Quantity> holdings_of(const Account& account) {
    std::map<std::string, Quantity> holdings;
    for (const auto& [symbol, pos] : account.positions()) {
        holdings[symbol] = pos.quantity;
    }
    return holdings;
}

PositionTracker::PositionTracker(RebalancePolicy policy) : policy_(policy) {}

std::map<std::string, double> PositionTracker::compute_weights(
    const Account& account, const std::map<std::string, Price>& prices) const {
    std::map<std::string, double> weights;

    double holdings_value = 0.0;
    std::map<std::string, double> values;
    for (const auto& [symbol, pos] : account.positions()) {
        auto it = prices.find(symbol);
        Price price = it != prices.end() ? it->second : pos.last_price;
        values[symbol] = pos.quantity * price;
        holdings_value += values[symbol];
    }

    double equity = account.cash() + holdings_value;
    for (const auto& [symbol, value] : values) {
        weights[symbol] = equity > 0.0 ? value / equity : 0.0;
    }
    return weights;
}

SanitizedWeights PositionTracker::sanitize_weights(const std::vector<TargetWeight>& targets) const {
    SanitizedWeights out;
    std::set<std::string> seen;

    for (const auto& target : targets) {
        if (!seen.insert(target.symbol).second) {
            out.warnings.push_back("Duplicate target weight for " + target.symbol + " ignored");
            continue;
        }

        double w = target.weight;
        if (!std::isfinite(w)) {
            out.warnings.push_back("Non-finite weight for " + target.symbol + " treated as 0");
            w = 0.0;
        } else if (w < 0.0 || w > 1.0) {
            std::ostringstream msg;
            msg << "Weight " << w << " for " << target.symbol << " clamped into [0, 1]";
            out.warnings.push_back(msg.str());
            w = std::min(1.0, std::max(0.0, w));
        }

        out.total += w;
        out.weights.push_back(TargetWeight{target.symbol, w});
    }

    if (out.total > 1.0 + 1e-12) {
        std::ostringstream msg;
        msg << "Target weights sum to " << out.total << " (> 1.0), not renormalized";
        out.warnings.push_back(msg.str());
    }
    return out;
}

RebalancePlan PositionTracker::compute_rebalance_orders(
    const std::vector<TargetWeight>& targets, const std::map<std::string, Price>& current_prices,
    double total_equity, const std::map<std::string, Quantity>& holdings) const {
    RebalancePlan plan;
    std::vector<RebalanceOrder> sells;
    std::vector<RebalanceOrder> buys;

    auto plan_one = [&](const std::string& symbol, double weight) {
        auto held_it = holdings.find(symbol);
        Quantity held = held_it != holdings.end() ? held_it->second : 0.0;

        auto price_it = current_prices.find(symbol);
        if (price_it == current_prices.end() || !std::isfinite(price_it->second) ||
            price_it->second <= 0.0) {
            if (weight > 0.0 || held != 0.0) {
                plan.unpriced.push_back(symbol);
            }
            return;
        }
        Price price = price_it->second;

        double target_shares = 0.0;
        if (total_equity > 0.0 && weight > 0.0) {
            target_shares = std::floor(weight * total_equity / price + kShareEpsilon);
        }

        Quantity delta = target_shares - held;
        if (std::abs(delta) < kShareEpsilon) {
            return;
        }

        if (std::abs(delta) * price < policy_.min_rebalance_cost) {
            plan.dropped.push_back(symbol);
            return;
        }

        RebalanceOrder order{symbol, delta, price};
        if (delta < 0) {
            sells.push_back(order);
        } else {
            buys.push_back(order);
        }
    };

    std::set<std::string> targeted;
    for (const auto& target : targets) {
        targeted.insert(target.symbol);
        plan_one(target.symbol, target.weight);
    }

    // Holdings the strategy no longer wants go to zero
    for (const auto& [symbol, qty] : holdings) {
        if (qty != 0.0 && targeted.count(symbol) == 0) {
            plan_one(symbol, 0.0);
        }
    }

    plan.orders.reserve(sells.size() + buys.size());
    plan.orders.insert(plan.orders.end(), sells.begin(), sells.end());
    plan.orders.insert(plan.orders.end(), buys.begin(), buys.end());
    return plan;
}

Result<void> PositionTracker::admit_buy(const Account& account, const std::string& symbol,
                                        double notional, double commission) const {
    if (policy_.max_positions > 0 && !account.holds(symbol) &&
        account.open_position_count() >= policy_.max_positions) {
        return make_error<void>(ErrorCode::POSITION_LIMIT_EXCEEDED,
                                "Buy of " + symbol + " rejected: " +
                                    std::to_string(policy_.max_positions) +
                                    " positions already held",
                                "PositionTracker");
    }

    double cash_after = account.cash() - notional - commission;
    if (cash_after < policy_.min_cash_balance - kCashEpsilon) {
        std::ostringstream msg;
        msg << "Buy of " << symbol << " rejected: cash " << account.cash() << " cannot cover "
            << notional << " + commission " << commission << " above floor "
            << policy_.min_cash_balance;
        return make_error<void>(ErrorCode::INSUFFICIENT_FUNDS, msg.str(), "PositionTracker");
    }
    return Result<void>();
}

}  // namespace portfolio
}  // namespace backfolio
