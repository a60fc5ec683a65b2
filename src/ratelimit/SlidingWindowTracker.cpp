#include "resilink/ratelimit/SlidingWindowTracker.hpp"

#include <algorithm>

namespace resilink::ratelimit {
namespace {
constexpr auto kBurstWindow = std::chrono::seconds(1);
constexpr auto kMinute = std::chrono::minutes(1);
constexpr auto kHour = std::chrono::hours(1);
}

SlidingWindowTracker::SlidingWindowTracker(Clock::time_point now)
    : burstResetTime_(now) {}

bool SlidingWindowTracker::canAdmit(const RateLimitConfig& config, Clock::time_point now) {
    prune(now);

    if (config.burstLimit > 0 && burstCount_ >= config.burstLimit) {
        if (now - burstResetTime_ < kBurstWindow) {
            return false;
        }
        burstCount_ = 0;
        burstResetTime_ = now;
    }

    if (config.requestsPerMinute > 0 &&
        countSince(now - kMinute) >= static_cast<std::size_t>(config.requestsPerMinute)) {
        return false;
    }
    if (config.requestsPerHour > 0 &&
        requests_.size() >= static_cast<std::size_t>(config.requestsPerHour)) {
        return false;
    }
    return true;
}

void SlidingWindowTracker::record(Clock::time_point now) {
    requests_.push_back(now);
    ++burstCount_;
}

std::size_t SlidingWindowTracker::countSince(Clock::time_point since) const {
    // Timestamps are appended in order, so the first one after `since` splits the window.
    auto first = std::upper_bound(requests_.begin(), requests_.end(), since);
    return static_cast<std::size_t>(std::distance(first, requests_.end()));
}

void SlidingWindowTracker::prune(Clock::time_point now) {
    while (!requests_.empty() && now - requests_.front() >= kHour) {
        requests_.pop_front();
    }
}

} // namespace resilink::ratelimit
