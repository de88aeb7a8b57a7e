#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace hashid {

class IHasher;

/// Point-in-time view of cache counters; rates are computed when taken
struct CacheStatistics {
    uint64_t hits{0};
    uint64_t misses{0};
    uint64_t evictions{0};
    size_t currentSize{0};
    size_t maxSize{0};
    double hitRate{0.0};   // hits / (hits + misses), 0 if no lookups
    double usage{0.0};     // currentSize / maxSize
};

/**
 * @brief Bounded LRU cache of hasher instances with hit/miss accounting
 *
 * Entries live in a list ordered most- to least-recently used, indexed by key.
 * Both a hit and an insert move the entry to the front; inserting into a full
 * cache first evicts the back entry.
 *
 * One mutex guards entries and counters. getOrCreate() runs the factory
 * function under that lock, so concurrent first requests for one key build
 * exactly one instance and every caller receives it.
 *
 * clear() and resetStatistics() are independent: clearing keeps counters,
 * resetting keeps entries.
 *
 * Each cache draws a random secret at construction; fingerprint() keys
 * HMAC-SHA-256 with it. Factories sharing one cache therefore agree on keys,
 * while keys from different caches (or processes) are unrelated.
 */
class InstanceCache {
public:
    using Creator = std::function<std::shared_ptr<IHasher>()>;

    /// @throws ConfigurationValidationError if maxSize <= 0
    explicit InstanceCache(int maxSize);

    InstanceCache(const InstanceCache&) = delete;
    InstanceCache& operator=(const InstanceCache&) = delete;

    /**
     * @brief Return the instance for `key`, building it with `create` on a miss
     *
     * Records exactly one hit or one miss per call. If `create` throws,
     * nothing is inserted and the miss is still counted.
     */
    std::shared_ptr<IHasher> getOrCreate(const std::string& key, const Creator& create);

    /// Hex HMAC-SHA-256 of `data` under this cache's secret
    std::string fingerprint(const std::string& data) const;

    /// Lookup without touching recency or counters
    bool contains(const std::string& key) const;

    /// Keys from most to least recently used
    std::vector<std::string> keys() const;

    size_t size() const;
    size_t maxSize() const { return maxSize_; }

    void clear();
    void resetStatistics();
    CacheStatistics statistics() const;

private:
    using Entry = std::pair<std::string, std::shared_ptr<IHasher>>;

    const size_t maxSize_;
    const std::vector<uint8_t> secret_;
    mutable std::mutex mtx;
    std::list<Entry> entries;
    std::unordered_map<std::string, std::list<Entry>::iterator> index;
    uint64_t hits{0};
    uint64_t misses{0};
    uint64_t evictions{0};
};

}
