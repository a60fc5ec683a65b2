#pragma once

#include "resilink/cache/DistributedStore.hpp"

#include <boost/json.hpp>

#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace resilink::cache {

struct CacheOptions {
    // Unset uses CacheManagerOptions::defaultTtl. An explicit value <= 0 (including 0)
    // stores without expiry rather than falling back to the default.
    std::optional<std::chrono::seconds> ttl;
    std::vector<std::string> tags;
};

struct CacheManagerOptions {
    std::size_t maxLocalEntries{1000};
    std::size_t maxLocalValueSize{1024 * 1024};
    std::chrono::seconds defaultTtl{300};
    std::chrono::seconds localPromotionTtl{300};
};

struct CacheStats {
    std::size_t hits{};
    std::size_t misses{};
    std::size_t sets{};
    std::size_t deletes{};
    // Percent of lookups served from either tier.
    double hitRate{};
    std::size_t memoryUsage{};
    std::size_t keyCount{};
};

struct StoreMemoryInfo {
    long long used{};
    long long peak{};
    double fragmentation{1.0};
};

struct MemoryInfo {
    StoreMemoryInfo store;
    std::size_t localUsed{};
    std::size_t localKeyCount{};
};

struct CacheHealth {
    bool storeStatus{false};
    std::optional<std::chrono::milliseconds> storeResponseTime;
    std::string storeError;
    bool localStatus{true};
    std::size_t keyCount{};
    std::size_t memoryUsage{};
};

// Missing fields keep their defaults.
StoreMemoryInfo parseMemoryInfo(const std::string& info);

boost::json::object toJson(const CacheStats& stats);
boost::json::object toJson(const MemoryInfo& info);
boost::json::object toJson(const CacheHealth& health);

// Local LRU-ish tier in front of a DistributedStore. Store failures never
// escape: reads degrade to misses and writes report false.
class TieredCacheManager {
public:
    explicit TieredCacheManager(DistributedStore& store, CacheManagerOptions options = {});

    std::optional<boost::json::value> get(const std::string& key, const std::string& ns = {});
    bool set(const std::string& key,
             const boost::json::value& value,
             const CacheOptions& options = {},
             const std::string& ns = {});
    bool remove(const std::string& key, const std::string& ns = {});
    std::size_t invalidateByTag(const std::string& tag);
    bool exists(const std::string& key, const std::string& ns = {});
    // Seconds remaining in the store, or -1 on error.
    long long getTTL(const std::string& key, const std::string& ns = {});
    bool extend(const std::string& key, std::chrono::seconds additional, const std::string& ns = {});
    // With a namespace removes "<ns>:*"; without one empties both tiers.
    std::size_t clear(const std::string& ns = {});

    CacheStats getStats() const;
    MemoryInfo getMemoryInfo();
    CacheHealth healthCheck();

    void destroy();

private:
    using Clock = std::chrono::steady_clock;

    struct LocalEntry {
        boost::json::value value;
        Clock::time_point lastAccess;
        Clock::time_point expiresAt;
        std::chrono::seconds ttl{};
        std::vector<std::string> tags;
        std::size_t size{};
    };

    static std::string makeKey(const std::string& key, const std::string& ns);
    void indexTag(const std::string& setKey, const std::string& cacheKey, std::chrono::seconds ttl);
    void storeLocalLocked(const std::string& key, LocalEntry entry);
    void evictLocked();
    std::size_t localBytesLocked() const;

    DistributedStore& store_;
    CacheManagerOptions options_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, LocalEntry> local_;
    CacheStats stats_;
};

} // namespace resilink::cache
