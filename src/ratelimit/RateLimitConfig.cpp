#include "resilink/ratelimit/RateLimitConfig.hpp"

namespace resilink::ratelimit {

std::map<std::string, RateLimitConfig> defaultRateLimits() {
    return {
        {"sportsDataIO", RateLimitConfig{1.0, 60, 1000, 10000, 5}},
        {"oddsAPI", RateLimitConfig{0.5, 10, 500, 1000, 2}},
        {"espnAPI", RateLimitConfig{2.0, 100, 2000, 20000, 10}},
    };
}

RateLimitConfig resolveRateLimit(const std::map<std::string, RateLimitConfig>& limits,
                                 const std::string& provider) {
    if (auto it = limits.find(provider); it != limits.end()) {
        return it->second;
    }
    if (auto it = limits.find(kDefaultProvider); it != limits.end()) {
        return it->second;
    }
    return RateLimitConfig{};
}

boost::json::object toJson(const RateLimitConfig& config) {
    boost::json::object obj;
    obj["requestsPerSecond"] = config.requestsPerSecond;
    obj["requestsPerMinute"] = config.requestsPerMinute;
    obj["requestsPerHour"] = config.requestsPerHour;
    obj["requestsPerDay"] = config.requestsPerDay;
    obj["burstLimit"] = config.burstLimit;
    return obj;
}

} // namespace resilink::ratelimit
