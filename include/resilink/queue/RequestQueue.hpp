#pragma once

#include "resilink/core/RetryPolicy.hpp"
#include "resilink/queue/QueuedRequest.hpp"
#include "resilink/ratelimit/RateLimitConfig.hpp"
#include "resilink/ratelimit/SlidingWindowTracker.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/json.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace resilink::queue {

struct QueueOptions {
    std::chrono::milliseconds tickInterval{100};
    std::map<std::string, ratelimit::RateLimitConfig> rateLimits{ratelimit::defaultRateLimits()};
    core::RetryPolicy retry{};
};

struct QueueStats {
    std::size_t pending{};
    std::size_t processing{};
    std::size_t completed{};
    std::size_t failed{};
    std::size_t totalProcessed{};
    double averageWaitTime{};
    double averageProcessingTime{};
};

struct RateLimitStatus {
    std::size_t requestsInLastMinute{};
    std::size_t requestsInLastHour{};
    int burstCount{};
    ratelimit::RateLimitConfig limits;
    bool canMakeRequest{true};
};

boost::json::object toJson(const QueueStats& stats);
boost::json::object toJson(const RateLimitStatus& status);

// Per-provider priority queues drained by a fixed tick. Each tick admits at
// most one request per provider, subject to its sliding-window limits, and
// hands it to the registered executor.
// Tick and timeout handlers capture `this`. destroy() cancels them, but an
// already-completed wait still runs, so the io_context must have stopped
// running before the queue is destroyed.
class RateLimitedRequestQueue {
public:
    RateLimitedRequestQueue(boost::asio::io_context& io, QueueOptions options = {});
    ~RateLimitedRequestQueue();

    RateLimitedRequestQueue(const RateLimitedRequestQueue&) = delete;
    RateLimitedRequestQueue& operator=(const RateLimitedRequestQueue&) = delete;

    void setExecutor(std::shared_ptr<RequestExecutor> executor);
    void start();

    std::future<boost::json::value> enqueue(const std::string& provider,
                                            const std::string& endpoint,
                                            RequestOptions options = {});

    // Unknown or no longer in-flight ids are ignored.
    void completeRequest(const std::string& id, boost::json::value result);
    void failRequest(const std::string& id, std::exception_ptr error);

    QueueStats getQueueStats(const std::string& provider) const;
    std::map<std::string, QueueStats> getQueueStats() const;

    std::optional<RateLimitStatus> getRateLimitStatus(const std::string& provider);
    std::map<std::string, RateLimitStatus> getRateLimitStatus();

    // Rejects the provider's pending requests; in-flight ones are untouched.
    std::size_t clearQueue(const std::string& provider);
    void pauseQueue(const std::string& provider);
    void resumeQueue(const std::string& provider);

    // One scheduling pass over every provider.
    void processQueues();

    void destroy();

private:
    using Clock = QueuedRequest::Clock;

    struct Entry {
        QueuedRequest request;
        std::promise<boost::json::value> promise;
        std::unique_ptr<boost::asio::steady_timer> timeoutTimer;
    };

    struct ProviderState {
        explicit ProviderState(Clock::time_point now) : tracker(now) {}

        std::vector<std::shared_ptr<Entry>> pending;
        std::unordered_set<std::string> processing;
        ratelimit::SlidingWindowTracker tracker;
        QueueStats stats;
        std::size_t dispatched{};
        bool paused{false};
    };

    ProviderState& stateFor(const std::string& provider, Clock::time_point now);
    ratelimit::RateLimitConfig limitsFor(const std::string& provider) const;
    void scheduleTick();
    void handleTimeout(const std::string& id);
    std::string makeRequestId(const std::string& provider);

    boost::asio::io_context& io_;
    QueueOptions options_;
    std::shared_ptr<RequestExecutor> executor_;

    mutable std::mutex mutex_;
    std::map<std::string, ProviderState> providers_;
    std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;
    std::uint64_t nextSequence_{0};
    bool destroyed_{false};
    std::unique_ptr<boost::asio::steady_timer> tickTimer_;
};

} // namespace resilink::queue
