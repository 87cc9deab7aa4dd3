// include/backfolio/portfolio/account.hpp
#pragma once

#include <map>
#include <string>
#include <vector>
#include "backfolio/core/error.hpp"
#include "backfolio/core/types.hpp"

namespace backfolio {
namespace portfolio {

/**
 * @brief Cash and holdings of one simulated portfolio
 *
 * Positions use average-cost accounting. Average-cost realized pnl is kept
 * per instrument and survives a position going flat; a reopened position
 * starts from the instrument's accumulated value. Trade-by-trade results
 * come from the FIFO ledger.
 */
class Account {
public:
    explicit Account(double initial_cash);

    /**
     * @brief Settle a fill against cash and the instrument's position
     *
     * Buys debit notional plus commission, sells credit notional minus
     * commission. Positions that return to zero are removed.
     */
    Result<void> apply_fill(const Fill& fill);

    /**
     * @brief Update last prices and unrealized pnl for held instruments
     *
     * Instruments missing from @p prices keep their last known price.
     */
    void mark_to_market(const std::map<std::string, Price>& prices, const Timestamp& ts);

    /**
     * @brief Cash plus quantity times last known price over all holdings
     */
    double equity() const;

    double cash() const {
        return cash_;
    }

    double initial_cash() const {
        return initial_cash_;
    }

    const std::map<std::string, Position>& positions() const {
        return positions_;
    }

    Quantity quantity(const std::string& symbol) const;

    /**
     * @brief Average-cost realized pnl of an instrument, before commission
     *
     * Accumulates over every closing fill, including positions that have
     * since gone flat. 0 for instruments never closed.
     */
    double realized_pnl(const std::string& symbol) const;

    double total_realized_pnl() const;

    /**
     * @brief Last price known for an instrument, 0 if never seen
     */
    Price last_price(const std::string& symbol) const;

    size_t open_position_count() const {
        return positions_.size();
    }

    bool holds(const std::string& symbol) const {
        return positions_.count(symbol) > 0;
    }

private:
    double initial_cash_;
    double cash_;
    std::map<std::string, Position> positions_;
    std::map<std::string, Price> last_prices_;
    std::map<std::string, double> realized_pnl_;
};

}  // namespace portfolio
}  // namespace backfolio
