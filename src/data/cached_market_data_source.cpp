// src/data/cached_market_data_source.cpp

#include "backfolio/data/cached_market_data_source.hpp"
#include <set>
#include "backfolio/core/logger.hpp"

namespace backfolio {
namespace data {

CachedMarketDataSource::CachedMarketDataSource(std::shared_ptr<MarketDataSource> upstream,
                                               std::shared_ptr<DataCache> cache)
    : upstream_(std::move(upstream)), cache_(std::move(cache)) {
    if (!cache_) {
        cache_ = std::make_shared<DataCache>(0);
    }
}

Result<MarketSnapshot> CachedMarketDataSource::get_market_snapshot(
    const Timestamp& date, const std::vector<std::string>& instrument_filter) {
    if (!upstream_) {
        return make_error<MarketSnapshot>(ErrorCode::NOT_INITIALIZED, "No upstream data source",
                                          "CachedMarketDataSource");
    }
    return upstream_->get_market_snapshot(date, instrument_filter);
}

Result<OhlcSeriesMap> CachedMarketDataSource::get_multi_ohlc(
    const std::vector<std::string>& symbols, DataFrequency freq, const Timestamp& start,
    const Timestamp& end) {
    if (!upstream_) {
        return make_error<OhlcSeriesMap>(ErrorCode::NOT_INITIALIZED, "No upstream data source",
                                         "CachedMarketDataSource");
    }

    OhlcSeriesMap result;
    std::vector<std::string> missing;
    std::set<std::string> seen;

    for (const auto& symbol : symbols) {
        if (!seen.insert(symbol).second) {
            continue;
        }
        auto cached = cache_->get(DataCache::make_key(symbol, freq, start, end));
        if (cached) {
            if (!cached->empty()) {
                result[symbol] = *cached;
            }
        } else {
            missing.push_back(symbol);
        }
    }

    if (missing.empty()) {
        return result;
    }

    auto fetched = upstream_->get_multi_ohlc(missing, freq, start, end);
    if (fetched.is_error()) {
        return make_error<OhlcSeriesMap>(fetched.error()->code(), fetched.error()->what(),
                                         "CachedMarketDataSource");
    }
    OhlcSeriesMap series = fetched.take_value();

    for (const auto& symbol : missing) {
        auto it = series.find(symbol);
        auto shared = std::make_shared<const std::vector<Bar>>(
            it == series.end() ? std::vector<Bar>{} : std::move(it->second));
        cache_->put(DataCache::make_key(symbol, freq, start, end), shared);
        if (!shared->empty()) {
            result[symbol] = *shared;
        }
    }

    DEBUG("Fetched " << missing.size() << " of " << seen.size()
                     << " series from upstream source");
    return result;
}

Result<std::vector<Timestamp>> CachedMarketDataSource::get_trading_days(const Timestamp& start,
                                                                        const Timestamp& end) {
    if (!upstream_) {
        return make_error<std::vector<Timestamp>>(ErrorCode::NOT_INITIALIZED,
                                                  "No upstream data source",
                                                  "CachedMarketDataSource");
    }
    return upstream_->get_trading_days(start, end);
}

}  // namespace data
}  // namespace backfolio
