#pragma once

#include "resilink/cache/RedisStore.hpp"
#include "resilink/cache/TieredCacheManager.hpp"
#include "resilink/core/RequestError.hpp"
#include "resilink/core/RetryPolicy.hpp"
#include "resilink/proxy/ProxyManager.hpp"
#include "resilink/ratelimit/RateLimitConfig.hpp"
#include "resilink/util/Logging.hpp"

#include <boost/json.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace resilink::config {

struct ProxySettings {
    bool enabled{true};
    std::string host{"isp.oxylabs.io"};
    std::vector<std::uint16_t> ports{8001, 8002, 8003, 8004, 8005};
    std::string username;
    std::string password;
    std::string country{"US"};
    std::string region;
    std::chrono::milliseconds rotationInterval{300000};
    std::chrono::milliseconds healthCheckInterval{60000};
    std::string probeUrl{"https://httpbin.org/ip"};
    std::chrono::milliseconds probeTimeout{10000};
};

struct ProviderConfig {
    std::string baseUrl;
    bool useProxy{false};
    core::HeaderMap headers;
};

struct ServerConfig {
    std::string host{"0.0.0.0"};
    std::uint16_t port{8080};
};

struct AppConfig {
    ProxySettings proxy;
    cache::RedisOptions redis;
    core::RetryPolicy retry;
    std::chrono::milliseconds defaultTimeout{30000};
    std::map<std::string, std::chrono::milliseconds> providerTimeouts{
        {"sportsDataIO", std::chrono::milliseconds(30000)},
        {"oddsAPI", std::chrono::milliseconds(15000)},
        {"espnAPI", std::chrono::milliseconds(20000)},
    };
    std::map<std::string, ratelimit::RateLimitConfig> rateLimits{ratelimit::defaultRateLimits()};
    std::map<std::string, ProviderConfig> providers;
    cache::CacheManagerOptions cache;
    std::chrono::milliseconds queueTick{100};
    ServerConfig server;
    util::LogLevel logLevel{util::LogLevel::info};
};

// Defaults, then the JSON file, then RESILINK_* environment variables.
// A malformed file is logged and ignored.
AppConfig loadAppConfig(const std::filesystem::path& path);

// Throws std::invalid_argument on a value of the wrong type.
void applyConfigJson(AppConfig& config, const boost::json::object& json);
void applyEnvironment(AppConfig& config);

// Enabled only when both credentials are present. One endpoint per port.
proxy::ProxyManagerOptions makeProxyOptions(const ProxySettings& settings);

} // namespace resilink::config
