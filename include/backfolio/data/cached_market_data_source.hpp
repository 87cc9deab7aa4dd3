// include/backfolio/data/cached_market_data_source.hpp

#pragma once

#include <memory>
#include <string>
#include <vector>
#include "backfolio/data/data_cache.hpp"
#include "backfolio/data/market_data_source.hpp"

namespace backfolio {
namespace data {

/**
 * @brief Market data source that memoizes OHLC series in a shared DataCache
 *
 * Snapshots and trading calendars are forwarded to the upstream source
 * unchanged. Instruments the upstream source has no bars for are cached as
 * empty series so repeated requests do not reach the store again.
 */
class CachedMarketDataSource : public MarketDataSource {
public:
    CachedMarketDataSource(std::shared_ptr<MarketDataSource> upstream,
                           std::shared_ptr<DataCache> cache);

    Result<MarketSnapshot> get_market_snapshot(
        const Timestamp& date, const std::vector<std::string>& instrument_filter = {}) override;

    Result<OhlcSeriesMap> get_multi_ohlc(const std::vector<std::string>& symbols,
                                         DataFrequency freq, const Timestamp& start,
                                         const Timestamp& end) override;

    Result<std::vector<Timestamp>> get_trading_days(const Timestamp& start,
                                                    const Timestamp& end) override;

    std::shared_ptr<DataCache> cache() const {
        return cache_;
    }

private:
    std::shared_ptr<MarketDataSource> upstream_;
    std::shared_ptr<DataCache> cache_;
};

}  // namespace data
}  // namespace backfolio
