// include/backfolio/data/data_cache.hpp

#pragma once

#include <cstddef>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include "backfolio/core/types.hpp"

namespace backfolio {
namespace data {

/**
 * @brief Counters describing cache effectiveness
 */
struct CacheStats {
    size_t hits{0};
    size_t misses{0};
    size_t evictions{0};
    size_t entries{0};
};

/**
 * @brief Bounded least-recently-used cache of OHLC series
 *
 * Entries are immutable and shared, so a series handed out stays valid after
 * it is evicted. All operations are thread-safe.
 */
class DataCache {
public:
    using SeriesPtr = std::shared_ptr<const std::vector<Bar>>;

    /**
     * @param capacity Maximum number of series held; 0 disables caching
     */
    explicit DataCache(size_t capacity = 256);

    /**
     * @brief Key for one instrument's series over a range at a frequency
     */
    static std::string make_key(const std::string& symbol, DataFrequency freq,
                                const Timestamp& start, const Timestamp& end);

    /**
     * @brief Look up a series and mark it most recently used
     * @return nullptr on a miss
     */
    SeriesPtr get(const std::string& key);

    /**
     * @brief Insert or replace a series, evicting the least recently used
     * entry when full
     */
    void put(const std::string& key, SeriesPtr series);

    void clear();

    size_t size() const;
    size_t capacity() const {
        return capacity_;
    }

    CacheStats stats() const;

private:
    using Entry = std::pair<std::string, SeriesPtr>;

    size_t capacity_;
    std::list<Entry> entries_;  // front is most recent
    std::unordered_map<std::string, std::list<Entry>::iterator> index_;
    size_t hits_{0};
    size_t misses_{0};
    size_t evictions_{0};
    mutable std::mutex mutex_;
};

}  // namespace data
}  // namespace backfolio
