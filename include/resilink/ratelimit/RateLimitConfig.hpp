#pragma once

#include <boost/json.hpp>

#include <map>
#include <string>

namespace resilink::ratelimit {

// A limit <= 0 is treated as unlimited.
struct RateLimitConfig {
    double requestsPerSecond{1.0};
    int requestsPerMinute{60};
    int requestsPerHour{1000};
    int requestsPerDay{10000};
    int burstLimit{5};
};

inline constexpr const char* kDefaultProvider = "sportsDataIO";

std::map<std::string, RateLimitConfig> defaultRateLimits();

// Looks up the provider, then the default provider, then the built-in defaults.
RateLimitConfig resolveRateLimit(const std::map<std::string, RateLimitConfig>& limits,
                                 const std::string& provider);

boost::json::object toJson(const RateLimitConfig& config);

} // namespace resilink::ratelimit
