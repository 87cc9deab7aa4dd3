// src/data/data_cache.cpp

#include "backfolio/data/data_cache.hpp"
#include <chrono>

namespace backfolio {
namespace data {

DataCache::DataCache(size_t capacity) : capacity_(capacity) {}

std::string DataCache::make_key(const std::string& symbol, DataFrequency freq,
                                const Timestamp& start, const Timestamp& end) {
    auto start_s =
        std::chrono::duration_cast<std::chrono::seconds>(start.time_since_epoch()).count();
    auto end_s = std::chrono::duration_cast<std::chrono::seconds>(end.time_since_epoch()).count();
    return symbol + "|" + frequency_to_string(freq) + "|" + std::to_string(start_s) + "|" +
           std::to_string(end_s);
}

DataCache::SeriesPtr DataCache::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(key);
    if (it == index_.end()) {
        ++misses_;
        return nullptr;
    }
    entries_.splice(entries_.begin(), entries_, it->second);
    ++hits_;
    return it->second->second;
}

void DataCache::put(const std::string& key, SeriesPtr series) {
    if (capacity_ == 0) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(key);
    if (it != index_.end()) {
        it->second->second = std::move(series);
        entries_.splice(entries_.begin(), entries_, it->second);
        return;
    }

    while (entries_.size() >= capacity_) {
        index_.erase(entries_.back().first);
        entries_.pop_back();
        ++evictions_;
    }

    entries_.emplace_front(key, std::move(series));
    index_[key] = entries_.begin();
}

void DataCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    index_.clear();
}

size_t DataCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

CacheStats DataCache::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CacheStats stats;
    stats.hits = hits_;
    stats.misses = misses_;
    stats.evictions = evictions_;
    stats.entries = entries_.size();
    return stats;
}

}  // namespace data
}  // namespace backfolio
