#pragma once

#include "resilink/ratelimit/RateLimitConfig.hpp"

#include <chrono>
#include <cstddef>
#include <deque>

namespace resilink::ratelimit {

// Admission state for one provider of the request queue: request timestamps
// from the last hour plus a burst counter with a one-second window.
// Not synchronised; the owner holds the lock.
class SlidingWindowTracker {
public:
    using Clock = std::chrono::steady_clock;

    explicit SlidingWindowTracker(Clock::time_point now = Clock::now());

    // Prunes timestamps older than an hour and may reset the burst window.
    bool canAdmit(const RateLimitConfig& config, Clock::time_point now);
    void record(Clock::time_point now);

    [[nodiscard]] std::size_t countSince(Clock::time_point since) const;
    [[nodiscard]] int burstCount() const noexcept { return burstCount_; }

private:
    void prune(Clock::time_point now);

    std::deque<Clock::time_point> requests_;
    int burstCount_{0};
    Clock::time_point burstResetTime_;
};

} // namespace resilink::ratelimit
