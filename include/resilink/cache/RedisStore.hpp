#pragma once

#include "resilink/cache/DistributedStore.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

namespace resilink::cache {

struct RedisOptions {
    std::string host{"127.0.0.1"};
    int port{6379};
    std::string password;
    int db{0};
    std::size_t poolSize{5};
    std::chrono::milliseconds connectTimeout{10000};
    std::chrono::milliseconds commandTimeout{5000};
};

class RedisStore : public DistributedStore {
public:
    explicit RedisStore(const RedisOptions& options);
    ~RedisStore() override;

    std::optional<std::string> get(const std::string& key) override;
    void set(const std::string& key, const std::string& value, std::chrono::seconds ttl) override;
    long long del(const std::vector<std::string>& keys) override;
    bool exists(const std::string& key) override;
    long long ttl(const std::string& key) override;
    bool expire(const std::string& key, std::chrono::seconds ttl) override;
    bool persist(const std::string& key) override;
    void sadd(const std::string& key, const std::string& member) override;
    std::vector<std::string> smembers(const std::string& key) override;
    std::vector<std::string> scan(const std::string& pattern) override;
    long long dbsize() override;
    void flushdb() override;
    void ping() override;
    std::string memoryInfo() override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace resilink::cache
