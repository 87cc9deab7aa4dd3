// include/backfolio/data/market_data_source.hpp

#pragma once

#include <limits>
#include <map>
#include <string>
#include <vector>
#include "backfolio/core/error.hpp"
#include "backfolio/core/types.hpp"

namespace backfolio {
namespace data {

/**
 * @brief One instrument's row of a point-in-time market snapshot
 *
 * Fundamental fields are NaN when the store has no value for them.
 */
struct SnapshotRow {
    std::string symbol;
    double price{0.0};
    double volume_amount{0.0};  // traded value for the session
    double per{std::numeric_limits<double>::quiet_NaN()};
    double pbr{std::numeric_limits<double>::quiet_NaN()};
    double roe{std::numeric_limits<double>::quiet_NaN()};
    std::map<std::string, double> fields;  // any further numeric columns
};

/**
 * @brief Per-instrument market and fundamental data for one date
 */
struct MarketSnapshot {
    Timestamp date;
    std::vector<SnapshotRow> rows;

    bool empty() const {
        return rows.empty();
    }

    const SnapshotRow* find(const std::string& symbol) const {
        for (const auto& row : rows) {
            if (row.symbol == symbol)
                return &row;
        }
        return nullptr;
    }
};

using OhlcSeriesMap = std::map<std::string, std::vector<Bar>>;

/**
 * @brief Read-only access to the historical data store
 *
 * Implementations must be safe to call from several backtest runs at once.
 */
class MarketDataSource {
public:
    virtual ~MarketDataSource() = default;

    /**
     * @brief Market snapshot for a date
     * @param date Session date
     * @param instrument_filter Restrict to these instruments; empty means all
     * @return An empty snapshot when the store has no data for the date
     */
    virtual Result<MarketSnapshot> get_market_snapshot(
        const Timestamp& date, const std::vector<std::string>& instrument_filter = {}) = 0;

    /**
     * @brief OHLC series per instrument over [start, end]
     *
     * Instruments without data are absent from the returned map. Each series
     * is sorted by timestamp.
     */
    virtual Result<OhlcSeriesMap> get_multi_ohlc(const std::vector<std::string>& symbols,
                                                 DataFrequency freq, const Timestamp& start,
                                                 const Timestamp& end) = 0;

    /**
     * @brief Ordered session dates in [start, end]
     */
    virtual Result<std::vector<Timestamp>> get_trading_days(const Timestamp& start,
                                                            const Timestamp& end) = 0;
};

}  // namespace data
}  // namespace backfolio
