// include/backfolio/core/types.hpp

#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace backfolio {

/**
 * @brief Timestamp type for consistent time representation
 * Uses std::chrono for type-safe time handling
 */
using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Price type with double precision
 */
using Price = double;

/**
 * @brief Quantity type for order and position sizes
 * Double to support fractional quantities
 */
using Quantity = double;

/**
 * @brief Trading side enumeration
 */
enum class Side {
    BUY,
    SELL,
    NONE  // Used for invalid/undefined states
};

/**
 * @brief Direction of a round trip
 */
enum class TradeDirection {
    LONG,   // Opened by a buy, closed by a sell
    SHORT   // Opened by a sell, closed by a buy
};

/**
 * @brief Data frequency enumeration
 */
enum class DataFrequency {
    TICK,
    SECOND,
    MINUTE,
    HOURLY,
    DAILY,
    WEEKLY,
    MONTHLY
};

inline std::string side_to_string(Side side) {
    switch (side) {
        case Side::BUY:
            return "BUY";
        case Side::SELL:
            return "SELL";
        default:
            return "NONE";
    }
}

inline Side side_from_string(const std::string& s) {
    if (s == "BUY")
        return Side::BUY;
    if (s == "SELL")
        return Side::SELL;
    return Side::NONE;
}

inline std::string direction_to_string(TradeDirection direction) {
    return direction == TradeDirection::LONG ? "LONG" : "SHORT";
}

inline TradeDirection direction_from_string(const std::string& s) {
    return s == "SHORT" ? TradeDirection::SHORT : TradeDirection::LONG;
}

inline std::string frequency_to_string(DataFrequency freq) {
    switch (freq) {
        case DataFrequency::TICK:
            return "TICK";
        case DataFrequency::SECOND:
            return "SECOND";
        case DataFrequency::MINUTE:
            return "MINUTE";
        case DataFrequency::HOURLY:
            return "HOURLY";
        case DataFrequency::DAILY:
            return "DAILY";
        case DataFrequency::WEEKLY:
            return "WEEKLY";
        case DataFrequency::MONTHLY:
            return "MONTHLY";
    }
    return "DAILY";
}

inline DataFrequency frequency_from_string(const std::string& s) {
    if (s == "TICK")
        return DataFrequency::TICK;
    if (s == "SECOND")
        return DataFrequency::SECOND;
    if (s == "MINUTE")
        return DataFrequency::MINUTE;
    if (s == "HOURLY")
        return DataFrequency::HOURLY;
    if (s == "WEEKLY")
        return DataFrequency::WEEKLY;
    if (s == "MONTHLY")
        return DataFrequency::MONTHLY;
    return DataFrequency::DAILY;
}

/**
 * @brief Market data bar structure
 * Represents OHLCV data for any timeframe
 */
struct Bar {
    Timestamp timestamp;
    Price open{0.0};
    Price high{0.0};
    Price low{0.0};
    Price close{0.0};
    double volume{0.0};
    std::string symbol;

    Bar() = default;
    Bar(Timestamp ts, Price o, Price h, Price l, Price c, double v, std::string s)
        : timestamp(ts), open(o), high(h), low(l), close(c), volume(v), symbol(std::move(s)) {}
};

/**
 * @brief One executed order leg
 */
struct Fill {
    std::string symbol;
    Side side{Side::NONE};
    Quantity quantity{0.0};
    Price price{0.0};
    double commission{0.0};
    Timestamp timestamp;
    std::string order_id;
};

/**
 * @brief Open, unmatched quantity left over from a fill
 */
struct Lot {
    std::string symbol;
    Side side{Side::NONE};
    Quantity remaining{0.0};
    Price entry_price{0.0};
    Timestamp entry_time;
    double commission_per_unit{0.0};
    std::string order_id;
};

/**
 * @brief A closed (or partially closed) round trip produced by lot matching
 */
struct CompletedTrade {
    std::string symbol;
    TradeDirection direction{TradeDirection::LONG};
    Timestamp entry_time;
    Timestamp exit_time;
    Price entry_price{0.0};
    Price exit_price{0.0};
    Quantity quantity{0.0};
    double pnl{0.0};
    double return_pct{0.0};
    int holding_period_days{0};
    double commission{0.0};
    std::string entry_order_id;
    std::string exit_order_id;
};

/**
 * @brief Current holding in one instrument
 */
struct Position {
    std::string symbol;
    Quantity quantity{0.0};
    Price average_price{0.0};
    double realized_pnl{0.0};
    double unrealized_pnl{0.0};
    Price last_price{0.0};
    Timestamp last_update;

    Position() = default;
    Position(std::string sym, Quantity qty, Price avg_price, Timestamp ts)
        : symbol(std::move(sym)), quantity(qty), average_price(avg_price), last_update(ts) {}

    bool has_position() const {
        return quantity != 0.0;
    }

    Side get_side() const {
        if (quantity > 0)
            return Side::BUY;
        if (quantity < 0)
            return Side::SELL;
        return Side::NONE;
    }
};

/**
 * @brief One point of the equity time series
 */
struct EquitySample {
    Timestamp timestamp;
    double equity{0.0};
};

/**
 * @brief Order request emitted by a single-instrument strategy
 */
struct OrderSignal {
    std::string symbol;
    Side side{Side::NONE};
    Quantity quantity{0.0};
};

/**
 * @brief Target allocation for one instrument, as a fraction of equity
 */
struct TargetWeight {
    std::string symbol;
    double weight{0.0};
};

}  // namespace backfolio
