#include "core/InstanceCache.hpp"

#include "core/Constants.hpp"
#include "core/HasherConfig.hpp"
#include "util/Crypto.hpp"
#include "util/Logger.hpp"

namespace hashid {

namespace {
size_t checkedMaxSize(int maxSize) {
    validateMaxCacheSize(maxSize);
    return static_cast<size_t>(maxSize);
}
}

InstanceCache::InstanceCache(int maxSize)
    : maxSize_(checkedMaxSize(maxSize)), secret_(Crypto::randomBytes(Constants::CACHE_SECRET_BYTES)) {}

std::string InstanceCache::fingerprint(const std::string& data) const {
    return Crypto::hmacSha256Hex(secret_, data);
}

std::shared_ptr<IHasher> InstanceCache::getOrCreate(const std::string& key, const Creator& create) {
    std::lock_guard<std::mutex> lock(mtx);

    auto it = index.find(key);
    if (it != index.end()) {
        ++hits;
        entries.splice(entries.begin(), entries, it->second);
        return it->second->second;
    }

    ++misses;
    Logger::instance().debug("Instance cache miss: " + key);
    auto instance = create();

    if (entries.size() >= maxSize_) {
        const auto& victim = entries.back();
        Logger::instance().debug("Instance cache evicting: " + victim.first);
        index.erase(victim.first);
        entries.pop_back();
        ++evictions;
    }
    entries.emplace_front(key, instance);
    index[key] = entries.begin();
    return instance;
}

bool InstanceCache::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mtx);
    return index.count(key) != 0;
}

std::vector<std::string> InstanceCache::keys() const {
    std::lock_guard<std::mutex> lock(mtx);
    std::vector<std::string> out;
    out.reserve(entries.size());
    for (const auto& entry : entries) {
        out.push_back(entry.first);
    }
    return out;
}

size_t InstanceCache::size() const {
    std::lock_guard<std::mutex> lock(mtx);
    return entries.size();
}

void InstanceCache::clear() {
    std::lock_guard<std::mutex> lock(mtx);
    entries.clear();
    index.clear();
}

void InstanceCache::resetStatistics() {
    std::lock_guard<std::mutex> lock(mtx);
    hits = 0;
    misses = 0;
    evictions = 0;
}

CacheStatistics InstanceCache::statistics() const {
    std::lock_guard<std::mutex> lock(mtx);
    CacheStatistics stats;
    stats.hits = hits;
    stats.misses = misses;
    stats.evictions = evictions;
    stats.currentSize = entries.size();
    stats.maxSize = maxSize_;
    uint64_t lookups = hits + misses;
    stats.hitRate = lookups ? static_cast<double>(hits) / static_cast<double>(lookups) : 0.0;
    stats.usage = static_cast<double>(stats.currentSize) / static_cast<double>(maxSize_);
    return stats;
}

}
