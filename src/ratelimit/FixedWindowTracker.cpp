#include "resilink/ratelimit/FixedWindowTracker.hpp"

#include <algorithm>

namespace resilink::ratelimit {
namespace {
constexpr auto kMinute = std::chrono::minutes(1);
constexpr auto kHour = std::chrono::hours(1);
constexpr auto kDay = std::chrono::hours(24);

std::chrono::milliseconds remaining(FixedWindowTracker::Clock::time_point until,
                                    FixedWindowTracker::Clock::time_point now) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(until - now);
    return std::max(left, std::chrono::milliseconds::zero());
}
}

FixedWindowTracker::FixedWindowTracker(Clock::time_point now)
    : resetTime_(now + kMinute)
    , hourlyResetTime_(now + kHour)
    , dailyResetTime_(now + kDay) {}

std::chrono::milliseconds FixedWindowTracker::waitTime(const RateLimitConfig& config, Clock::time_point now) {
    std::scoped_lock lock(mutex_);
    roll(now);

    if (config.requestsPerDay > 0 && dailyRequests_ >= config.requestsPerDay) {
        return std::max(remaining(dailyResetTime_, now), std::chrono::milliseconds(1));
    }
    if (config.requestsPerHour > 0 && hourlyRequests_ >= config.requestsPerHour) {
        return std::max(remaining(hourlyResetTime_, now), std::chrono::milliseconds(1));
    }
    if (config.requestsPerMinute > 0 && requests_ >= config.requestsPerMinute) {
        return std::max(remaining(resetTime_, now), std::chrono::milliseconds(1));
    }
    return std::chrono::milliseconds::zero();
}

void FixedWindowTracker::record(Clock::time_point now) {
    std::scoped_lock lock(mutex_);
    roll(now);
    ++requests_;
    ++hourlyRequests_;
    ++dailyRequests_;
}

FixedWindowTracker::Snapshot FixedWindowTracker::snapshot(Clock::time_point now) const {
    std::scoped_lock lock(mutex_);
    Snapshot snap;
    snap.requests = now >= resetTime_ ? 0 : requests_;
    snap.hourlyRequests = now >= hourlyResetTime_ ? 0 : hourlyRequests_;
    snap.dailyRequests = now >= dailyResetTime_ ? 0 : dailyRequests_;
    snap.resetIn = remaining(resetTime_, now);
    snap.hourlyResetIn = remaining(hourlyResetTime_, now);
    snap.dailyResetIn = remaining(dailyResetTime_, now);
    return snap;
}

void FixedWindowTracker::roll(Clock::time_point now) {
    if (now >= dailyResetTime_) {
        dailyRequests_ = 0;
        dailyResetTime_ = now + kDay;
    }
    if (now >= hourlyResetTime_) {
        hourlyRequests_ = 0;
        hourlyResetTime_ = now + kHour;
    }
    if (now >= resetTime_) {
        requests_ = 0;
        resetTime_ = now + kMinute;
    }
}

boost::json::object toJson(const FixedWindowTracker::Snapshot& snapshot) {
    boost::json::object obj;
    obj["requests"] = snapshot.requests;
    obj["hourlyRequests"] = snapshot.hourlyRequests;
    obj["dailyRequests"] = snapshot.dailyRequests;
    obj["resetInMs"] = snapshot.resetIn.count();
    obj["hourlyResetInMs"] = snapshot.hourlyResetIn.count();
    obj["dailyResetInMs"] = snapshot.dailyResetIn.count();
    return obj;
}

} // namespace resilink::ratelimit
