// include/backfolio/ledger/fifo_matcher.hpp
#pragma once

#include <deque>
#include <map>
#include <string>
#include <vector>
#include "backfolio/core/error.hpp"
#include "backfolio/core/types.hpp"

namespace backfolio {
namespace ledger {

/**
 * @brief Append-only trade ledger with FIFO lot matching
 *
 * Each instrument keeps two independent queues of open lots: long lots opened
 * by buys and short lots opened by sells. A fill on the opposite side of the
 * open lots closes them oldest first, producing one CompletedTrade per lot
 * closure. Any remainder opens a new lot on the fill's side.
 *
 * Commissions are spread per unit: a closure of q units carries q times the
 * per-unit commission of the entry lot plus q times the per-unit commission
 * of the exit fill.
 */
class FifoMatcher {
public:
    /**
     * @param long_only When true, a sell that exceeds the open long quantity is
     *        recorded as a matching invariant violation before opening a short lot
     */
    explicit FifoMatcher(bool long_only = false);

    /**
     * @brief Validate and apply one fill
     * @return Trades closed by this fill (possibly empty), or INVALID_FILL
     */
    Result<std::vector<CompletedTrade>> apply_fill(const Fill& fill);

    /**
     * @brief Signed net open quantity (long lots minus short lots)
     */
    Quantity net_quantity(const std::string& symbol) const;

    /**
     * @brief Quantity-weighted entry price of the open lots on the net side
     * @return 0 when the instrument is flat
     */
    Price average_entry_price(const std::string& symbol) const;

    /**
     * @brief Open lots for an instrument, long lots first, each queue oldest first
     */
    std::vector<Lot> open_lots(const std::string& symbol) const;

    const std::vector<Fill>& fills() const {
        return fills_;
    }

    const std::vector<CompletedTrade>& completed_trades() const {
        return completed_trades_;
    }

    std::vector<Fill> fills_for(const std::string& symbol) const;
    std::vector<CompletedTrade> trades_for(const std::string& symbol) const;

    /**
     * @brief Instruments with at least one open lot, in lexicographic order
     */
    std::vector<std::string> open_symbols() const;

    int invariant_violations() const {
        return invariant_violations_;
    }

    void reset();

private:
    struct LotBook {
        std::deque<Lot> long_lots;
        std::deque<Lot> short_lots;
        Timestamp last_fill_time;
        bool has_fills{false};
    };

    Result<void> validate(const Fill& fill) const;

    CompletedTrade close_against(Lot& lot, const Fill& fill, Quantity matched,
                                 double exit_commission_per_unit) const;

    bool long_only_;
    std::map<std::string, LotBook> books_;
    std::vector<Fill> fills_;
    std::vector<CompletedTrade> completed_trades_;
    int invariant_violations_{0};
};

}  // namespace ledger
}  // namespace backfolio
