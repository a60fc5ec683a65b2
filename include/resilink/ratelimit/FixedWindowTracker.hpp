#pragma once

#include "resilink/ratelimit/RateLimitConfig.hpp"

#include <boost/json.hpp>

#include <chrono>
#include <mutex>

namespace resilink::ratelimit {

// Minute, hour and day counters used by direct client calls. Each window
// restarts from the first check after it expires.
class FixedWindowTracker {
public:
    using Clock = std::chrono::steady_clock;

    struct Snapshot {
        int requests{};
        int hourlyRequests{};
        int dailyRequests{};
        std::chrono::milliseconds resetIn{};
        std::chrono::milliseconds hourlyResetIn{};
        std::chrono::milliseconds dailyResetIn{};
    };

    explicit FixedWindowTracker(Clock::time_point now = Clock::now());

    // Zero when a request may go out now, otherwise the time until the
    // exhausted window resets.
    std::chrono::milliseconds waitTime(const RateLimitConfig& config, Clock::time_point now);
    void record(Clock::time_point now);

    Snapshot snapshot(Clock::time_point now) const;

private:
    void roll(Clock::time_point now);

    mutable std::mutex mutex_;
    int requests_{0};
    int hourlyRequests_{0};
    int dailyRequests_{0};
    Clock::time_point resetTime_;
    Clock::time_point hourlyResetTime_;
    Clock::time_point dailyResetTime_;
};

boost::json::object toJson(const FixedWindowTracker::Snapshot& snapshot);

} // namespace resilink::ratelimit
