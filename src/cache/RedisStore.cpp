#include "resilink/cache/RedisStore.hpp"
#include "resilink/util/Logging.hpp"

#include <sw/redis++/redis++.h>

#include <iterator>

namespace resilink::cache {
namespace {

template <typename Fn>
auto guarded(const char* operation, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const sw::redis::Error& ex) {
        throw StoreError(std::string("Redis ") + operation + " failed: " + ex.what());
    }
}

} // namespace

struct RedisStore::Impl {
    explicit Impl(const RedisOptions& options)
        : redis(connectionOptions(options), poolOptions(options)) {}

    static sw::redis::ConnectionOptions connectionOptions(const RedisOptions& options) {
        sw::redis::ConnectionOptions opts;
        opts.host = options.host;
        opts.port = options.port;
        if (!options.password.empty()) {
            opts.password = options.password;
        }
        opts.db = options.db;
        opts.connect_timeout = options.connectTimeout;
        opts.socket_timeout = options.commandTimeout;
        return opts;
    }

    static sw::redis::ConnectionPoolOptions poolOptions(const RedisOptions& options) {
        sw::redis::ConnectionPoolOptions opts;
        opts.size = options.poolSize;
        return opts;
    }

    sw::redis::Redis redis;
};

RedisStore::RedisStore(const RedisOptions& options)
    : impl_(std::make_unique<Impl>(options)) {
    util::log(util::LogLevel::info, "Redis store configured for " + options.host + ":" + std::to_string(options.port) +
                                        "/" + std::to_string(options.db));
}

RedisStore::~RedisStore() = default;

std::optional<std::string> RedisStore::get(const std::string& key) {
    return guarded("GET", [&]() -> std::optional<std::string> {
        auto value = impl_->redis.get(key);
        if (!value) {
            return std::nullopt;
        }
        return std::string(*value);
    });
}

void RedisStore::set(const std::string& key, const std::string& value, std::chrono::seconds ttl) {
    guarded("SET", [&]() {
        if (ttl.count() > 0) {
            impl_->redis.setex(key, ttl.count(), value);
        } else {
            impl_->redis.set(key, value);
        }
    });
}

long long RedisStore::del(const std::vector<std::string>& keys) {
    if (keys.empty()) {
        return 0;
    }
    return guarded("DEL", [&]() { return impl_->redis.del(keys.begin(), keys.end()); });
}

bool RedisStore::exists(const std::string& key) {
    return guarded("EXISTS", [&]() { return impl_->redis.exists(key) > 0; });
}

long long RedisStore::ttl(const std::string& key) {
    return guarded("TTL", [&]() { return impl_->redis.ttl(key); });
}

bool RedisStore::expire(const std::string& key, std::chrono::seconds ttl) {
    return guarded("EXPIRE", [&]() { return impl_->redis.expire(key, ttl.count()); });
}

bool RedisStore::persist(const std::string& key) {
    return guarded("PERSIST", [&]() { return impl_->redis.persist(key); });
}

void RedisStore::sadd(const std::string& key, const std::string& member) {
    guarded("SADD", [&]() { impl_->redis.sadd(key, member); });
}

std::vector<std::string> RedisStore::smembers(const std::string& key) {
    return guarded("SMEMBERS", [&]() {
        std::vector<std::string> members;
        impl_->redis.smembers(key, std::back_inserter(members));
        return members;
    });
}

std::vector<std::string> RedisStore::scan(const std::string& pattern) {
    return guarded("SCAN", [&]() {
        std::vector<std::string> keys;
        sw::redis::Cursor cursor = 0;
        do {
            cursor = impl_->redis.scan(cursor, pattern, 100, std::back_inserter(keys));
        } while (cursor != 0);
        return keys;
    });
}

long long RedisStore::dbsize() {
    return guarded("DBSIZE", [&]() { return impl_->redis.dbsize(); });
}

void RedisStore::flushdb() {
    guarded("FLUSHDB", [&]() { impl_->redis.flushdb(); });
}

void RedisStore::ping() {
    guarded("PING", [&]() { impl_->redis.ping(); });
}

std::string RedisStore::memoryInfo() {
    return guarded("INFO", [&]() { return impl_->redis.info("memory"); });
}

} // namespace resilink::cache
