// src/ledger/fifo_matcher.cpp

#include "backfolio/ledger/fifo_matcher.hpp"
#include <algorithm>
#include <cmath>
#include <iterator>
#include "backfolio/core/logger.hpp"
#include "backfolio/core/time_utils.hpp"

namespace backfolio {
namespace ledger {

namespace {
// Remaining quantities below this are treated as fully consumed
constexpr double kQuantityEpsilon = 1e-9;
}  // namespace

FifoMatcher::FifoMatcher(bool long_only) : long_only_(long_only) {}

void FifoMatcher::reset() {
    books_.clear();
    fills_.clear();
    completed_trades_.clear();
    invariant_violations_ = 0;
}

Result<void> FifoMatcher::validate(const Fill& fill) const {
    if (fill.symbol.empty()) {
        return make_error<void>(ErrorCode::INVALID_FILL, "Fill has no instrument id",
                                "FifoMatcher");
    }
    if (fill.side != Side::BUY && fill.side != Side::SELL) {
        return make_error<void>(ErrorCode::INVALID_FILL,
                                "Fill for " + fill.symbol + " has no side", "FifoMatcher");
    }
    if (!std::isfinite(fill.quantity) || fill.quantity <= 0.0) {
        return make_error<void>(ErrorCode::INVALID_FILL,
                                "Fill quantity must be positive for " + fill.symbol,
                                "FifoMatcher");
    }
    if (!std::isfinite(fill.price) || fill.price <= 0.0) {
        return make_error<void>(ErrorCode::INVALID_FILL,
                                "Fill price must be positive for " + fill.symbol, "FifoMatcher");
    }
    if (!std::isfinite(fill.commission) || fill.commission < 0.0) {
        return make_error<void>(ErrorCode::INVALID_FILL,
                                "Fill commission must be non-negative for " + fill.symbol,
                                "FifoMatcher");
    }

    auto it = books_.find(fill.symbol);
    if (it != books_.end() && it->second.has_fills &&
        fill.timestamp < it->second.last_fill_time) {
        return make_error<void>(ErrorCode::INVALID_FILL,
                                "Fill for " + fill.symbol + " at " +
                                    core::format_timestamp(fill.timestamp) +
                                    " precedes the previous fill at " +
                                    core::format_timestamp(it->second.last_fill_time),
                                "FifoMatcher");
    }
    return Result<void>();
}

CompletedTrade FifoMatcher::close_against(Lot& lot, const Fill& fill, Quantity matched,
                                          double exit_commission_per_unit) const {
    CompletedTrade trade;
    trade.symbol = fill.symbol;
    trade.direction = lot.side == Side::BUY ? TradeDirection::LONG : TradeDirection::SHORT;
    trade.entry_time = lot.entry_time;
    trade.exit_time = fill.timestamp;
    trade.entry_price = lot.entry_price;
    trade.exit_price = fill.price;
    trade.quantity = matched;
    trade.commission = (lot.commission_per_unit + exit_commission_per_unit) * matched;

    double direction = trade.direction == TradeDirection::LONG ? 1.0 : -1.0;
    trade.pnl = (fill.price - lot.entry_price) * matched * direction - trade.commission;

    double entry_cost = lot.entry_price * matched;
    trade.return_pct = entry_cost > 0.0 ? trade.pnl / entry_cost * 100.0 : 0.0;
    trade.holding_period_days = core::days_between(lot.entry_time, fill.timestamp);
    trade.entry_order_id = lot.order_id;
    trade.exit_order_id = fill.order_id;

    lot.remaining -= matched;
    return trade;
}

Result<std::vector<CompletedTrade>> FifoMatcher::apply_fill(const Fill& fill) {
    auto valid = validate(fill);
    if (valid.is_error()) {
        return make_error<std::vector<CompletedTrade>>(valid.error()->code(),
                                                       valid.error()->what(), "FifoMatcher");
    }

    LotBook& book = books_[fill.symbol];
    book.last_fill_time = fill.timestamp;
    book.has_fills = true;
    fills_.push_back(fill);

    // A buy closes short lots, a sell closes long lots
    std::deque<Lot>& opposite = fill.side == Side::BUY ? book.short_lots : book.long_lots;
    std::deque<Lot>& same = fill.side == Side::BUY ? book.long_lots : book.short_lots;

    double exit_commission_per_unit = fill.commission / fill.quantity;
    Quantity remaining = fill.quantity;
    std::vector<CompletedTrade> closed;

    while (remaining > kQuantityEpsilon && !opposite.empty()) {
        Lot& oldest = opposite.front();
        Quantity matched = std::min(remaining, oldest.remaining);

        closed.push_back(close_against(oldest, fill, matched, exit_commission_per_unit));
        remaining -= matched;

        if (oldest.remaining <= kQuantityEpsilon) {
            opposite.pop_front();
        }
    }

    if (remaining > kQuantityEpsilon) {
        if (long_only_ && fill.side == Side::SELL) {
            ++invariant_violations_;
            WARN("Matching invariant violation: sell of " << fill.quantity << " "
                                                          << fill.symbol << " exceeds open long "
                                                          << "quantity by " << remaining
                                                          << ", opening short lot");
        }

        Lot lot;
        lot.symbol = fill.symbol;
        lot.side = fill.side;
        lot.remaining = remaining;
        lot.entry_price = fill.price;
        lot.entry_time = fill.timestamp;
        lot.commission_per_unit = exit_commission_per_unit;
        lot.order_id = fill.order_id;
        same.push_back(lot);
    }

    completed_trades_.insert(completed_trades_.end(), closed.begin(), closed.end());
    return closed;
}

Quantity FifoMatcher::net_quantity(const std::string& symbol) const {
    auto it = books_.find(symbol);
    if (it == books_.end()) {
        return 0.0;
    }
    Quantity net = 0.0;
    for (const auto& lot : it->second.long_lots) {
        net += lot.remaining;
    }
    for (const auto& lot : it->second.short_lots) {
        net -= lot.remaining;
    }
    return net;
}

Price FifoMatcher::average_entry_price(const std::string& symbol) const {
    auto it = books_.find(symbol);
    if (it == books_.end()) {
        return 0.0;
    }

    Quantity net = net_quantity(symbol);
    if (std::abs(net) <= kQuantityEpsilon) {
        return 0.0;
    }

    const std::deque<Lot>& lots = net > 0 ? it->second.long_lots : it->second.short_lots;
    double notional = 0.0;
    Quantity total = 0.0;
    for (const auto& lot : lots) {
        notional += lot.entry_price * lot.remaining;
        total += lot.remaining;
    }
    return total > 0.0 ? notional / total : 0.0;
}

std::vector<Lot> FifoMatcher::open_lots(const std::string& symbol) const {
    std::vector<Lot> lots;
    auto it = books_.find(symbol);
    if (it == books_.end()) {
        return lots;
    }
    lots.insert(lots.end(), it->second.long_lots.begin(), it->second.long_lots.end());
    lots.insert(lots.end(), it->second.short_lots.begin(), it->second.short_lots.end());
    return lots;
}

std::vector<std::string> FifoMatcher::open_symbols() const {
    std::vector<std::string> symbols;
    for (const auto& [symbol, book] : books_) {
        if (!book.long_lots.empty() || !book.short_lots.empty()) {
            symbols.push_back(symbol);
        }
    }
    return symbols;
}

std::vector<Fill> FifoMatcher::fills_for(const std::string& symbol) const {
    std::vector<Fill> out;
    std::copy_if(fills_.begin(), fills_.end(), std::back_inserter(out),
                 [&symbol](const Fill& f) { return f.symbol == symbol; });
    return out;
}

std::vector<CompletedTrade> FifoMatcher::trades_for(const std::string& symbol) const {
    std::vector<CompletedTrade> out;
    std::copy_if(completed_trades_.begin(), completed_trades_.end(), std::back_inserter(out),
                 [&symbol](const CompletedTrade& t) { return t.symbol == symbol; });
    return out;
}

}  // namespace ledger
}  // namespace backfolio
