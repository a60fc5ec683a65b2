#include "resilink/cache/TieredCacheManager.hpp"
#include "resilink/util/JsonUtil.hpp"
#include "resilink/util/Logging.hpp"

#include <algorithm>
#include <set>
#include <sstream>

namespace resilink::cache {
namespace {
constexpr double kEvictionFraction = 0.2;

std::string tagKey(const std::string& tag) {
    return "tag:" + tag;
}

bool hasPrefix(const std::string& value, const std::string& prefix) {
    return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

StoreMemoryInfo parseMemoryInfo(const std::string& info) {
    StoreMemoryInfo parsed;
    std::istringstream stream(info);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        auto name = line.substr(0, colon);
        auto value = line.substr(colon + 1);
        try {
            if (name == "used_memory") {
                parsed.used = std::stoll(value);
            } else if (name == "used_memory_peak") {
                parsed.peak = std::stoll(value);
            } else if (name == "mem_fragmentation_ratio") {
                parsed.fragmentation = std::stod(value);
            }
        } catch (const std::exception&) {
            util::log(util::LogLevel::debug, "Ignoring unparsable memory field " + name + "=" + value);
        }
    }
    return parsed;
}

boost::json::object toJson(const CacheStats& stats) {
    boost::json::object obj;
    obj["hits"] = stats.hits;
    obj["misses"] = stats.misses;
    obj["sets"] = stats.sets;
    obj["deletes"] = stats.deletes;
    obj["hitRate"] = stats.hitRate;
    obj["memoryUsage"] = stats.memoryUsage;
    obj["keyCount"] = stats.keyCount;
    return obj;
}

boost::json::object toJson(const MemoryInfo& info) {
    boost::json::object redis;
    redis["used"] = info.store.used;
    redis["peak"] = info.store.peak;
    redis["fragmentation"] = info.store.fragmentation;
    boost::json::object local;
    local["used"] = info.localUsed;
    local["keyCount"] = info.localKeyCount;

    boost::json::object obj;
    obj["redis"] = std::move(redis);
    obj["local"] = std::move(local);
    return obj;
}

boost::json::object toJson(const CacheHealth& health) {
    boost::json::object redis;
    redis["status"] = health.storeStatus;
    if (health.storeResponseTime) {
        redis["responseTime"] = health.storeResponseTime->count();
    }
    if (!health.storeError.empty()) {
        redis["error"] = health.storeError;
    }
    boost::json::object local;
    local["status"] = health.localStatus;
    local["keyCount"] = health.keyCount;
    local["memoryUsage"] = health.memoryUsage;

    boost::json::object obj;
    obj["redis"] = std::move(redis);
    obj["local"] = std::move(local);
    return obj;
}

TieredCacheManager::TieredCacheManager(DistributedStore& store, CacheManagerOptions options)
    : store_(store)
    , options_(options) {}

std::optional<boost::json::value> TieredCacheManager::get(const std::string& key, const std::string& ns) {
    const auto cacheKey = makeKey(key, ns);
    {
        std::scoped_lock lock(mutex_);
        auto it = local_.find(cacheKey);
        if (it != local_.end()) {
            const auto now = Clock::now();
            if (now < it->second.expiresAt) {
                it->second.lastAccess = now;
                stats_.hits += 1;
                return it->second.value;
            }
            local_.erase(it);
        }
    }

    try {
        auto raw = store_.get(cacheKey);
        if (!raw) {
            std::scoped_lock lock(mutex_);
            stats_.misses += 1;
            return std::nullopt;
        }
        auto value = util::parseJson(*raw);

        if (raw->size() <= options_.maxLocalValueSize) {
            const auto remaining = store_.ttl(cacheKey);
            // -2: the key expired between the two calls.
            if (remaining != -2) {
                auto localTtl = options_.localPromotionTtl;
                if (remaining > 0) {
                    localTtl = std::min(localTtl, std::chrono::seconds(remaining));
                }
                const auto now = Clock::now();
                LocalEntry entry;
                entry.value = value;
                entry.lastAccess = now;
                entry.expiresAt = now + localTtl;
                entry.ttl = localTtl;
                entry.size = raw->size();
                std::scoped_lock lock(mutex_);
                storeLocalLocked(cacheKey, std::move(entry));
            }
        }

        std::scoped_lock lock(mutex_);
        stats_.hits += 1;
        return value;
    } catch (const StoreError& ex) {
        util::log(util::LogLevel::warn, "Cache get error for " + cacheKey + ": " + ex.what());
    } catch (const boost::system::system_error& ex) {
        util::log(util::LogLevel::warn, "Cache value for " + cacheKey + " is not valid JSON: " + ex.what());
    }
    std::scoped_lock lock(mutex_);
    stats_.misses += 1;
    return std::nullopt;
}

bool TieredCacheManager::set(const std::string& key,
                             const boost::json::value& value,
                             const CacheOptions& options,
                             const std::string& ns) {
    const auto cacheKey = makeKey(key, ns);
    const auto ttl = options.ttl.value_or(options_.defaultTtl);
    const auto serialized = util::stringifyJson(value);

    try {
        store_.set(cacheKey, serialized, ttl);
        for (const auto& tag : options.tags) {
            indexTag(tagKey(tag), cacheKey, ttl);
        }
    } catch (const StoreError& ex) {
        util::log(util::LogLevel::warn, "Cache set error for " + cacheKey + ": " + ex.what());
        return false;
    }

    std::scoped_lock lock(mutex_);
    stats_.sets += 1;
    if (serialized.size() <= options_.maxLocalValueSize) {
        const auto localTtl = ttl.count() > 0 ? ttl : options_.localPromotionTtl;
        const auto now = Clock::now();
        LocalEntry entry;
        entry.value = value;
        entry.lastAccess = now;
        entry.expiresAt = now + localTtl;
        entry.ttl = localTtl;
        entry.tags = options.tags;
        entry.size = serialized.size();
        storeLocalLocked(cacheKey, std::move(entry));
    } else {
        local_.erase(cacheKey);
    }
    return true;
}

bool TieredCacheManager::remove(const std::string& key, const std::string& ns) {
    const auto cacheKey = makeKey(key, ns);
    {
        std::scoped_lock lock(mutex_);
        local_.erase(cacheKey);
    }
    try {
        auto removed = store_.del({cacheKey});
        std::scoped_lock lock(mutex_);
        stats_.deletes += 1;
        return removed > 0;
    } catch (const StoreError& ex) {
        util::log(util::LogLevel::warn, "Cache delete error for " + cacheKey + ": " + ex.what());
        return false;
    }
}

// The tag set lives as long as its longest-lived member: its expiry is only
// ever extended, and a member without expiry makes the set persistent.
void TieredCacheManager::indexTag(const std::string& setKey, const std::string& cacheKey, std::chrono::seconds ttl) {
    const auto remaining = store_.ttl(setKey);
    store_.sadd(setKey, cacheKey);
    if (ttl.count() <= 0) {
        if (remaining >= 0) {
            store_.persist(setKey);
        }
    } else if (remaining == -2 || (remaining >= 0 && remaining < ttl.count())) {
        store_.expire(setKey, ttl);
    }
}

std::size_t TieredCacheManager::invalidateByTag(const std::string& tag) {
    try {
        auto keys = store_.smembers(tagKey(tag));
        if (keys.empty()) {
            return 0;
        }
        {
            std::scoped_lock lock(mutex_);
            for (const auto& key : keys) {
                local_.erase(key);
            }
        }
        auto removed = store_.del(keys);
        store_.del({tagKey(tag)});

        std::scoped_lock lock(mutex_);
        stats_.deletes += static_cast<std::size_t>(removed);
        util::log(util::LogLevel::info, "Invalidated " + std::to_string(removed) + " cache entries with tag " + tag);
        return static_cast<std::size_t>(removed);
    } catch (const StoreError& ex) {
        util::log(util::LogLevel::warn, "Cache tag invalidation error for " + tag + ": " + ex.what());
    }

    std::scoped_lock lock(mutex_);
    std::size_t removed = 0;
    for (auto it = local_.begin(); it != local_.end();) {
        const auto& tags = it->second.tags;
        if (std::find(tags.begin(), tags.end(), tag) != tags.end()) {
            it = local_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    stats_.deletes += removed;
    return removed;
}

bool TieredCacheManager::exists(const std::string& key, const std::string& ns) {
    const auto cacheKey = makeKey(key, ns);
    {
        std::scoped_lock lock(mutex_);
        auto it = local_.find(cacheKey);
        if (it != local_.end()) {
            if (Clock::now() < it->second.expiresAt) {
                return true;
            }
            local_.erase(it);
        }
    }
    try {
        return store_.exists(cacheKey);
    } catch (const StoreError& ex) {
        util::log(util::LogLevel::warn, "Cache exists error for " + cacheKey + ": " + ex.what());
        return false;
    }
}

long long TieredCacheManager::getTTL(const std::string& key, const std::string& ns) {
    const auto cacheKey = makeKey(key, ns);
    try {
        return store_.ttl(cacheKey);
    } catch (const StoreError& ex) {
        util::log(util::LogLevel::warn, "Cache TTL error for " + cacheKey + ": " + ex.what());
        return -1;
    }
}

bool TieredCacheManager::extend(const std::string& key, std::chrono::seconds additional, const std::string& ns) {
    const auto cacheKey = makeKey(key, ns);
    try {
        const auto current = store_.ttl(cacheKey);
        if (current <= 0) {
            return false;
        }
        const auto extended = std::chrono::seconds(current) + additional;
        if (!store_.expire(cacheKey, extended)) {
            return false;
        }

        std::scoped_lock lock(mutex_);
        if (auto it = local_.find(cacheKey); it != local_.end()) {
            it->second.expiresAt = Clock::now() + extended;
            it->second.ttl = extended;
        }
        return true;
    } catch (const StoreError& ex) {
        util::log(util::LogLevel::warn, "Cache extend error for " + cacheKey + ": " + ex.what());
        return false;
    }
}

std::size_t TieredCacheManager::clear(const std::string& ns) {
    if (ns.empty()) {
        {
            std::scoped_lock lock(mutex_);
            local_.clear();
        }
        try {
            const auto present = store_.dbsize();
            store_.flushdb();
            std::scoped_lock lock(mutex_);
            stats_.deletes += static_cast<std::size_t>(present);
            util::log(util::LogLevel::info, "Cache cleared");
            return static_cast<std::size_t>(present);
        } catch (const StoreError& ex) {
            util::log(util::LogLevel::warn, std::string{"Cache clear error: "} + ex.what());
            return 0;
        }
    }

    const auto prefix = ns + ":";
    std::size_t localRemoved = 0;
    {
        std::scoped_lock lock(mutex_);
        for (auto it = local_.begin(); it != local_.end();) {
            if (hasPrefix(it->first, prefix)) {
                it = local_.erase(it);
                ++localRemoved;
            } else {
                ++it;
            }
        }
    }

    try {
        auto scanned = store_.scan(prefix + "*");
        std::set<std::string> unique(scanned.begin(), scanned.end());
        std::vector<std::string> keys(unique.begin(), unique.end());
        const auto removed = static_cast<std::size_t>(store_.del(keys));
        std::scoped_lock lock(mutex_);
        stats_.deletes += removed;
        return removed;
    } catch (const StoreError& ex) {
        util::log(util::LogLevel::warn, "Cache clear error for namespace " + ns + ": " + ex.what());
        std::scoped_lock lock(mutex_);
        stats_.deletes += localRemoved;
        return localRemoved;
    }
}

CacheStats TieredCacheManager::getStats() const {
    std::scoped_lock lock(mutex_);
    CacheStats stats = stats_;
    const auto lookups = stats.hits + stats.misses;
    stats.hitRate = lookups > 0 ? static_cast<double>(stats.hits) / static_cast<double>(lookups) * 100.0 : 0.0;
    stats.keyCount = local_.size();
    stats.memoryUsage = localBytesLocked();
    return stats;
}

MemoryInfo TieredCacheManager::getMemoryInfo() {
    MemoryInfo info;
    try {
        info.store = parseMemoryInfo(store_.memoryInfo());
    } catch (const StoreError& ex) {
        util::log(util::LogLevel::warn, std::string{"Error getting memory info: "} + ex.what());
    }
    std::scoped_lock lock(mutex_);
    info.localUsed = localBytesLocked();
    info.localKeyCount = local_.size();
    return info;
}

CacheHealth TieredCacheManager::healthCheck() {
    CacheHealth health;
    const auto started = std::chrono::steady_clock::now();
    try {
        store_.ping();
        health.storeStatus = true;
        health.storeResponseTime = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
    } catch (const StoreError& ex) {
        health.storeStatus = false;
        health.storeError = ex.what();
    }
    std::scoped_lock lock(mutex_);
    health.localStatus = true;
    health.keyCount = local_.size();
    health.memoryUsage = localBytesLocked();
    return health;
}

void TieredCacheManager::destroy() {
    std::scoped_lock lock(mutex_);
    local_.clear();
}

std::string TieredCacheManager::makeKey(const std::string& key, const std::string& ns) {
    return ns.empty() ? key : ns + ":" + key;
}

void TieredCacheManager::storeLocalLocked(const std::string& key, LocalEntry entry) {
    local_[key] = std::move(entry);
    evictLocked();
}

void TieredCacheManager::evictLocked() {
    if (local_.size() <= options_.maxLocalEntries) {
        return;
    }
    std::vector<std::pair<Clock::time_point, std::string>> byAge;
    byAge.reserve(local_.size());
    for (const auto& [key, entry] : local_) {
        byAge.emplace_back(entry.lastAccess, key);
    }
    std::sort(byAge.begin(), byAge.end());

    auto toRemove = static_cast<std::size_t>(static_cast<double>(byAge.size()) * kEvictionFraction);
    toRemove = std::max<std::size_t>(toRemove, 1);
    for (std::size_t i = 0; i < toRemove && i < byAge.size(); ++i) {
        local_.erase(byAge[i].second);
    }
    util::log(util::LogLevel::debug, "Evicted " + std::to_string(toRemove) + " local cache entries");
}

std::size_t TieredCacheManager::localBytesLocked() const {
    std::size_t total = 0;
    for (const auto& [key, entry] : local_) {
        total += entry.size;
    }
    return total;
}

} // namespace resilink::cache
