#include "resilink/config/AppConfig.hpp"
#include "resilink/util/JsonUtil.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string_view>

namespace resilink::config {
namespace {

std::string readString(const boost::json::value& value, std::string_view key) {
    if (!value.is_string()) {
        throw std::invalid_argument(std::string(key) + " must be a string");
    }
    return std::string(value.as_string());
}

bool readBool(const boost::json::value& value, std::string_view key) {
    if (!value.is_bool()) {
        throw std::invalid_argument(std::string(key) + " must be a boolean");
    }
    return value.as_bool();
}

long long readInt(const boost::json::value& value, std::string_view key) {
    if (value.is_int64()) {
        return value.as_int64();
    }
    if (value.is_uint64() && value.as_uint64() <= static_cast<std::uint64_t>(std::numeric_limits<long long>::max())) {
        return static_cast<long long>(value.as_uint64());
    }
    throw std::invalid_argument(std::string(key) + " must be an integer");
}

double readNumber(const boost::json::value& value, std::string_view key) {
    if (value.is_double()) {
        return value.as_double();
    }
    return static_cast<double>(readInt(value, key));
}

std::uint16_t readPort(long long value, std::string_view key) {
    if (value <= 0 || value > 65535) {
        throw std::invalid_argument(std::string(key) + " is not a valid port");
    }
    return static_cast<std::uint16_t>(value);
}

std::chrono::milliseconds readMillis(const boost::json::value& value, std::string_view key) {
    return std::chrono::milliseconds(readInt(value, key));
}

const boost::json::object& readObject(const boost::json::value& value, std::string_view key) {
    if (!value.is_object()) {
        throw std::invalid_argument(std::string(key) + " must be an object");
    }
    return value.as_object();
}

void applyProxy(ProxySettings& proxy, const boost::json::object& obj) {
    if (auto it = obj.if_contains("enabled")) proxy.enabled = readBool(*it, "proxy.enabled");
    if (auto it = obj.if_contains("host")) proxy.host = readString(*it, "proxy.host");
    if (auto it = obj.if_contains("ports")) {
        if (!it->is_array()) {
            throw std::invalid_argument("proxy.ports must be an array");
        }
        std::vector<std::uint16_t> ports;
        for (const auto& port : it->as_array()) {
            ports.push_back(readPort(readInt(port, "proxy.ports"), "proxy.ports"));
        }
        proxy.ports = std::move(ports);
    }
    if (auto it = obj.if_contains("username")) proxy.username = readString(*it, "proxy.username");
    if (auto it = obj.if_contains("password")) proxy.password = readString(*it, "proxy.password");
    if (auto it = obj.if_contains("country")) proxy.country = readString(*it, "proxy.country");
    if (auto it = obj.if_contains("region")) proxy.region = readString(*it, "proxy.region");
    if (auto it = obj.if_contains("rotationIntervalMs")) {
        proxy.rotationInterval = readMillis(*it, "proxy.rotationIntervalMs");
    }
    if (auto it = obj.if_contains("healthCheckIntervalMs")) {
        proxy.healthCheckInterval = readMillis(*it, "proxy.healthCheckIntervalMs");
    }
    if (auto it = obj.if_contains("probeUrl")) proxy.probeUrl = readString(*it, "proxy.probeUrl");
    if (auto it = obj.if_contains("probeTimeoutMs")) proxy.probeTimeout = readMillis(*it, "proxy.probeTimeoutMs");
}

void applyRedis(cache::RedisOptions& redis, const boost::json::object& obj) {
    if (auto it = obj.if_contains("host")) redis.host = readString(*it, "redis.host");
    if (auto it = obj.if_contains("port")) redis.port = readPort(readInt(*it, "redis.port"), "redis.port");
    if (auto it = obj.if_contains("password")) redis.password = readString(*it, "redis.password");
    if (auto it = obj.if_contains("db")) redis.db = static_cast<int>(readInt(*it, "redis.db"));
    if (auto it = obj.if_contains("poolSize")) {
        redis.poolSize = static_cast<std::size_t>(std::max(1LL, readInt(*it, "redis.poolSize")));
    }
}

void applyRetry(core::RetryPolicy& retry, const boost::json::object& obj) {
    if (auto it = obj.if_contains("maxRetries")) retry.maxRetries = static_cast<int>(readInt(*it, "retry.maxRetries"));
    if (auto it = obj.if_contains("baseDelayMs")) retry.baseDelay = readMillis(*it, "retry.baseDelayMs");
    if (auto it = obj.if_contains("maxDelayMs")) retry.maxDelay = readMillis(*it, "retry.maxDelayMs");
    if (auto it = obj.if_contains("backoffMultiplier")) {
        retry.backoffMultiplier = readNumber(*it, "retry.backoffMultiplier");
    }
}

void applyRateLimit(ratelimit::RateLimitConfig& limits, const boost::json::object& obj) {
    if (auto it = obj.if_contains("requestsPerSecond")) {
        limits.requestsPerSecond = readNumber(*it, "requestsPerSecond");
    }
    if (auto it = obj.if_contains("requestsPerMinute")) {
        limits.requestsPerMinute = static_cast<int>(readInt(*it, "requestsPerMinute"));
    }
    if (auto it = obj.if_contains("requestsPerHour")) {
        limits.requestsPerHour = static_cast<int>(readInt(*it, "requestsPerHour"));
    }
    if (auto it = obj.if_contains("requestsPerDay")) {
        limits.requestsPerDay = static_cast<int>(readInt(*it, "requestsPerDay"));
    }
    if (auto it = obj.if_contains("burstLimit")) limits.burstLimit = static_cast<int>(readInt(*it, "burstLimit"));
}

void applyProvider(ProviderConfig& provider, const boost::json::object& obj) {
    if (auto it = obj.if_contains("baseUrl")) provider.baseUrl = readString(*it, "providers.baseUrl");
    if (auto it = obj.if_contains("useProxy")) provider.useProxy = readBool(*it, "providers.useProxy");
    if (auto it = obj.if_contains("headers")) {
        for (const auto& [name, value] : readObject(*it, "providers.headers")) {
            provider.headers[std::string(name)] = readString(value, "providers.headers");
        }
    }
}

void applyCache(cache::CacheManagerOptions& cache, const boost::json::object& obj) {
    if (auto it = obj.if_contains("maxLocalEntries")) {
        cache.maxLocalEntries = static_cast<std::size_t>(std::max(1LL, readInt(*it, "cache.maxLocalEntries")));
    }
    if (auto it = obj.if_contains("maxLocalValueSize")) {
        cache.maxLocalValueSize = static_cast<std::size_t>(std::max(0LL, readInt(*it, "cache.maxLocalValueSize")));
    }
    if (auto it = obj.if_contains("defaultTtlSeconds")) {
        cache.defaultTtl = std::chrono::seconds(readInt(*it, "cache.defaultTtlSeconds"));
    }
    if (auto it = obj.if_contains("localPromotionTtlSeconds")) {
        cache.localPromotionTtl = std::chrono::seconds(readInt(*it, "cache.localPromotionTtlSeconds"));
    }
}

std::optional<std::string> env(const char* name) {
    if (const char* value = std::getenv(name)) {
        return std::string(value);
    }
    return std::nullopt;
}

std::optional<long long> envInt(const char* name) {
    auto value = env(name);
    if (!value) {
        return std::nullopt;
    }
    errno = 0;
    char* end = nullptr;
    const long long parsed = std::strtoll(value->c_str(), &end, 10);
    if (value->empty() || errno != 0 || *end != '\0') {
        util::log(util::LogLevel::warn, std::string("Ignoring invalid integer in ") + name + ": " + *value);
        return std::nullopt;
    }
    return parsed;
}

std::optional<double> envDouble(const char* name) {
    auto value = env(name);
    if (!value) {
        return std::nullopt;
    }
    errno = 0;
    char* end = nullptr;
    const double parsed = std::strtod(value->c_str(), &end);
    if (value->empty() || errno != 0 || *end != '\0') {
        util::log(util::LogLevel::warn, std::string("Ignoring invalid number in ") + name + ": " + *value);
        return std::nullopt;
    }
    return parsed;
}

std::optional<std::uint16_t> envPort(const char* name) {
    auto value = envInt(name);
    if (!value) {
        return std::nullopt;
    }
    if (*value <= 0 || *value > 65535) {
        util::log(util::LogLevel::warn, std::string("Ignoring invalid port in ") + name);
        return std::nullopt;
    }
    return static_cast<std::uint16_t>(*value);
}

std::vector<std::uint16_t> parsePortList(const std::string& value) {
    std::vector<std::uint16_t> ports;
    std::size_t start = 0;
    while (start <= value.size()) {
        auto comma = value.find(',', start);
        auto token = value.substr(start, comma == std::string::npos ? std::string::npos : comma - start);
        const auto begin = token.find_first_not_of(" \t");
        if (begin != std::string::npos) {
            token = token.substr(begin, token.find_last_not_of(" \t") - begin + 1);
            try {
                std::size_t consumed = 0;
                const auto port = std::stoul(token, &consumed);
                if (consumed == token.size() && port > 0 && port <= 65535) {
                    ports.push_back(static_cast<std::uint16_t>(port));
                } else {
                    util::log(util::LogLevel::warn, "Skipping invalid proxy port: " + token);
                }
            } catch (const std::exception&) {
                util::log(util::LogLevel::warn, "Skipping invalid proxy port: " + token);
            }
        }
        if (comma == std::string::npos) {
            break;
        }
        start = comma + 1;
    }
    return ports;
}

} // namespace

void applyConfigJson(AppConfig& config, const boost::json::object& json) {
    if (auto it = json.if_contains("logLevel")) config.logLevel = util::parseLogLevel(readString(*it, "logLevel"));
    if (auto it = json.if_contains("server")) {
        const auto& obj = readObject(*it, "server");
        if (auto host = obj.if_contains("host")) config.server.host = readString(*host, "server.host");
        if (auto port = obj.if_contains("port")) config.server.port = readPort(readInt(*port, "server.port"), "server.port");
    }
    if (auto it = json.if_contains("proxy")) applyProxy(config.proxy, readObject(*it, "proxy"));
    if (auto it = json.if_contains("redis")) applyRedis(config.redis, readObject(*it, "redis"));
    if (auto it = json.if_contains("retry")) applyRetry(config.retry, readObject(*it, "retry"));
    if (auto it = json.if_contains("timeouts")) {
        for (const auto& [name, value] : readObject(*it, "timeouts")) {
            if (name == "default") {
                config.defaultTimeout = readMillis(value, "timeouts.default");
            } else {
                config.providerTimeouts[std::string(name)] = readMillis(value, "timeouts");
            }
        }
    }
    if (auto it = json.if_contains("rateLimits")) {
        for (const auto& [name, value] : readObject(*it, "rateLimits")) {
            auto limits = ratelimit::resolveRateLimit(config.rateLimits, std::string(name));
            applyRateLimit(limits, readObject(value, "rateLimits"));
            config.rateLimits[std::string(name)] = limits;
        }
    }
    if (auto it = json.if_contains("providers")) {
        for (const auto& [name, value] : readObject(*it, "providers")) {
            applyProvider(config.providers[std::string(name)], readObject(value, "providers"));
        }
    }
    if (auto it = json.if_contains("cache")) applyCache(config.cache, readObject(*it, "cache"));
    if (auto it = json.if_contains("queue")) {
        const auto& obj = readObject(*it, "queue");
        if (auto tick = obj.if_contains("tickMs")) {
            config.queueTick = std::chrono::milliseconds(std::max(1LL, readInt(*tick, "queue.tickMs")));
        }
    }
}

void applyEnvironment(AppConfig& config) {
    if (auto value = env("RESILINK_LOG_LEVEL")) config.logLevel = util::parseLogLevel(*value);
    if (auto value = env("RESILINK_SERVER_HOST")) config.server.host = *value;
    if (auto value = envPort("RESILINK_SERVER_PORT")) config.server.port = *value;

    if (auto value = env("RESILINK_PROXY_ENABLED")) config.proxy.enabled = *value == "true" || *value == "1";
    if (auto value = env("RESILINK_PROXY_HOST")) config.proxy.host = *value;
    if (auto value = env("RESILINK_PROXY_PORTS")) {
        auto ports = parsePortList(*value);
        if (!ports.empty()) {
            config.proxy.ports = std::move(ports);
        }
    }
    if (auto value = env("RESILINK_PROXY_USERNAME")) config.proxy.username = *value;
    if (auto value = env("RESILINK_PROXY_PASSWORD")) config.proxy.password = *value;
    if (auto value = env("RESILINK_PROXY_COUNTRY")) config.proxy.country = *value;
    if (auto value = env("RESILINK_PROXY_REGION")) config.proxy.region = *value;
    if (auto value = envInt("RESILINK_PROXY_ROTATION_INTERVAL_MS")) {
        config.proxy.rotationInterval = std::chrono::milliseconds(*value);
    }
    if (auto value = env("RESILINK_PROXY_PROBE_URL")) config.proxy.probeUrl = *value;

    if (auto value = env("RESILINK_REDIS_HOST")) config.redis.host = *value;
    if (auto value = envPort("RESILINK_REDIS_PORT")) config.redis.port = *value;
    if (auto value = env("RESILINK_REDIS_PASSWORD")) config.redis.password = *value;
    if (auto value = envInt("RESILINK_REDIS_DB")) config.redis.db = static_cast<int>(*value);

    if (auto value = envInt("RESILINK_RETRY_MAX_RETRIES")) config.retry.maxRetries = static_cast<int>(*value);
    if (auto value = envInt("RESILINK_RETRY_BASE_DELAY_MS")) config.retry.baseDelay = std::chrono::milliseconds(*value);
    if (auto value = envInt("RESILINK_RETRY_MAX_DELAY_MS")) config.retry.maxDelay = std::chrono::milliseconds(*value);
    if (auto value = envDouble("RESILINK_RETRY_BACKOFF_MULTIPLIER")) config.retry.backoffMultiplier = *value;

    if (auto value = envInt("RESILINK_DEFAULT_TIMEOUT_MS")) config.defaultTimeout = std::chrono::milliseconds(*value);
    if (auto value = envInt("RESILINK_QUEUE_TICK_MS"); value && *value > 0) {
        config.queueTick = std::chrono::milliseconds(*value);
    }
}

AppConfig loadAppConfig(const std::filesystem::path& path) {
    AppConfig config;
    try {
        if (auto json = util::readJsonFile(path)) {
            if (!json->is_object()) {
                throw std::invalid_argument("top-level value must be an object");
            }
            AppConfig candidate = config;
            applyConfigJson(candidate, json->as_object());
            config = std::move(candidate);
        }
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::warn, "Failed to load configuration " + path.string() + ": " + ex.what());
    }
    applyEnvironment(config);
    return config;
}

proxy::ProxyManagerOptions makeProxyOptions(const ProxySettings& settings) {
    proxy::ProxyManagerOptions options;
    options.enabled = settings.enabled && !settings.username.empty() && !settings.password.empty();
    options.rotationInterval = settings.rotationInterval;
    options.healthCheckInterval = settings.healthCheckInterval;
    options.probeUrl = settings.probeUrl;
    options.probeTimeout = settings.probeTimeout;
    if (!options.enabled) {
        return options;
    }
    for (auto port : settings.ports) {
        proxy::ProxyEndpoint endpoint;
        endpoint.host = settings.host;
        endpoint.port = port;
        endpoint.username = settings.username;
        endpoint.password = settings.password;
        endpoint.country = settings.country;
        endpoint.region = settings.region;
        options.endpoints.push_back(std::move(endpoint));
    }
    return options;
}

} // namespace resilink::config
