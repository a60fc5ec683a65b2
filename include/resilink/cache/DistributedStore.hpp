#pragma once

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace resilink::cache {

class StoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Shared key-value tier. Every operation throws StoreError when the store
// cannot be reached.
class DistributedStore {
public:
    virtual ~DistributedStore() = default;

    virtual std::optional<std::string> get(const std::string& key) = 0;
    // ttl <= 0 stores without expiry.
    virtual void set(const std::string& key, const std::string& value, std::chrono::seconds ttl) = 0;
    virtual long long del(const std::vector<std::string>& keys) = 0;
    virtual bool exists(const std::string& key) = 0;
    // Remaining seconds; -1 without expiry, -2 when the key is missing.
    virtual long long ttl(const std::string& key) = 0;
    virtual bool expire(const std::string& key, std::chrono::seconds ttl) = 0;
    // Drops the expiry of an existing key.
    virtual bool persist(const std::string& key) = 0;
    virtual void sadd(const std::string& key, const std::string& member) = 0;
    virtual std::vector<std::string> smembers(const std::string& key) = 0;
    // Glob pattern, e.g. "namespace:*".
    virtual std::vector<std::string> scan(const std::string& pattern) = 0;
    virtual long long dbsize() = 0;
    virtual void flushdb() = 0;
    virtual void ping() = 0;
    // Raw "INFO memory" text.
    virtual std::string memoryInfo() = 0;
};

} // namespace resilink::cache
