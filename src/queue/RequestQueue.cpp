#include "resilink/queue/RequestQueue.hpp"
#include "resilink/core/RequestError.hpp"
#include "resilink/util/Logging.hpp"

#include <algorithm>
#include <random>

namespace resilink::queue {
namespace {

std::string toBase36(std::uint64_t value) {
    static constexpr char digits[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    std::string out;
    do {
        out.insert(out.begin(), digits[value % 36]);
        value /= 36;
    } while (value > 0);
    return out;
}

double toMillis(std::chrono::steady_clock::duration duration) {
    return std::chrono::duration<double, std::milli>(duration).count();
}

// Higher priority first, then enqueue order.
bool schedulesBefore(const QueuedRequest& lhs, const QueuedRequest& rhs) {
    if (lhs.priority != rhs.priority) {
        return static_cast<int>(lhs.priority) > static_cast<int>(rhs.priority);
    }
    return lhs.sequence < rhs.sequence;
}

} // namespace

boost::json::object toJson(const QueueStats& stats) {
    boost::json::object obj;
    obj["pending"] = stats.pending;
    obj["processing"] = stats.processing;
    obj["completed"] = stats.completed;
    obj["failed"] = stats.failed;
    obj["totalProcessed"] = stats.totalProcessed;
    obj["averageWaitTime"] = stats.averageWaitTime;
    obj["averageProcessingTime"] = stats.averageProcessingTime;
    return obj;
}

boost::json::object toJson(const RateLimitStatus& status) {
    boost::json::object obj;
    obj["requestsInLastMinute"] = status.requestsInLastMinute;
    obj["requestsInLastHour"] = status.requestsInLastHour;
    obj["burstCount"] = status.burstCount;
    obj["limits"] = ratelimit::toJson(status.limits);
    obj["canMakeRequest"] = status.canMakeRequest;
    return obj;
}

RateLimitedRequestQueue::RateLimitedRequestQueue(boost::asio::io_context& io, QueueOptions options)
    : io_(io)
    , options_(std::move(options)) {}

RateLimitedRequestQueue::~RateLimitedRequestQueue() {
    destroy();
}

void RateLimitedRequestQueue::setExecutor(std::shared_ptr<RequestExecutor> executor) {
    std::scoped_lock lock(mutex_);
    executor_ = std::move(executor);
}

void RateLimitedRequestQueue::start() {
    {
        std::scoped_lock lock(mutex_);
        if (destroyed_ || tickTimer_) {
            return;
        }
        tickTimer_ = std::make_unique<boost::asio::steady_timer>(io_);
    }
    scheduleTick();
}

std::future<boost::json::value> RateLimitedRequestQueue::enqueue(const std::string& provider,
                                                                 const std::string& endpoint,
                                                                 RequestOptions options) {
    auto entry = std::make_shared<Entry>();
    auto future = entry->promise.get_future();

    std::scoped_lock lock(mutex_);
    if (destroyed_) {
        entry->promise.set_exception(std::make_exception_ptr(
            core::RequestError(core::RequestError::Type::service_shutdown, "Service destroyed")));
        return future;
    }

    const auto now = Clock::now();
    auto& request = entry->request;
    request.id = makeRequestId(provider);
    request.priority = options.priority;
    request.provider = provider;
    request.endpoint = endpoint;
    request.params = std::move(options.params);
    request.headers = std::move(options.headers);
    request.maxRetries = options.maxRetries.value_or(options_.retry.maxRetries);
    request.timeout = options.timeout;
    request.createdAt = now;
    request.scheduledAt = now;
    request.sequence = nextSequence_++;

    if (request.timeout) {
        entry->timeoutTimer = std::make_unique<boost::asio::steady_timer>(io_);
        entry->timeoutTimer->expires_after(*request.timeout);
        entry->timeoutTimer->async_wait([this, id = request.id](const boost::system::error_code& ec) {
            if (!ec) {
                handleTimeout(id);
            }
        });
    }

    auto& state = stateFor(provider, now);
    state.pending.push_back(entry);
    state.stats.pending = state.pending.size();
    entries_.emplace(request.id, entry);

    util::log(util::LogLevel::debug, "Enqueued request " + request.id + " (" + toString(request.priority) +
                                         ") for " + provider + endpoint);
    return future;
}

void RateLimitedRequestQueue::completeRequest(const std::string& id, boost::json::value result) {
    std::shared_ptr<Entry> entry;
    {
        std::scoped_lock lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end()) {
            return;
        }
        auto& state = providers_.at(it->second->request.provider);
        if (state.processing.erase(id) == 0) {
            return;
        }
        entry = it->second;
        entries_.erase(it);

        const auto now = Clock::now();
        entry->request.completedAt = now;
        if (entry->timeoutTimer) {
            entry->timeoutTimer->cancel();
        }

        auto& stats = state.stats;
        stats.processing = state.processing.size();
        stats.completed += 1;
        stats.totalProcessed += 1;
        if (entry->request.executedAt) {
            const double elapsed = toMillis(now - *entry->request.executedAt);
            const auto n = static_cast<double>(stats.completed);
            stats.averageProcessingTime = (stats.averageProcessingTime * (n - 1) + elapsed) / n;
        }
    }
    entry->promise.set_value(std::move(result));
}

void RateLimitedRequestQueue::failRequest(const std::string& id, std::exception_ptr error) {
    if (!error) {
        error = std::make_exception_ptr(
            core::RequestError(core::RequestError::Type::transient_network, "Request " + id + " failed"));
    }

    std::shared_ptr<Entry> rejected;
    {
        std::scoped_lock lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end()) {
            return;
        }
        auto entry = it->second;
        auto& request = entry->request;
        auto& state = providers_.at(request.provider);
        if (state.processing.erase(id) == 0) {
            return;
        }

        request.retryCount += 1;
        if (request.retryCount < request.maxRetries) {
            const auto delay = core::computeRetryDelay(options_.retry, request.retryCount);
            request.scheduledAt = Clock::now() + delay;
            request.executedAt.reset();
            state.pending.push_back(entry);
            util::log(util::LogLevel::warn, "Retrying request " + id + " in " + std::to_string(delay.count()) +
                                                "ms (attempt " + std::to_string(request.retryCount) + "/" +
                                                std::to_string(request.maxRetries) + ")");
        } else {
            entries_.erase(it);
            if (entry->timeoutTimer) {
                entry->timeoutTimer->cancel();
            }
            state.stats.failed += 1;
            state.stats.totalProcessed += 1;
            rejected = std::move(entry);
        }
        state.stats.pending = state.pending.size();
        state.stats.processing = state.processing.size();
    }

    if (rejected) {
        util::log(util::LogLevel::warn, "Request " + id + " failed after " +
                                            std::to_string(rejected->request.retryCount) + " attempts");
        rejected->promise.set_exception(error);
    }
}

QueueStats RateLimitedRequestQueue::getQueueStats(const std::string& provider) const {
    std::scoped_lock lock(mutex_);
    if (auto it = providers_.find(provider); it != providers_.end()) {
        return it->second.stats;
    }
    return QueueStats{};
}

std::map<std::string, QueueStats> RateLimitedRequestQueue::getQueueStats() const {
    std::scoped_lock lock(mutex_);
    std::map<std::string, QueueStats> all;
    for (const auto& [provider, state] : providers_) {
        all.emplace(provider, state.stats);
    }
    return all;
}

std::optional<RateLimitStatus> RateLimitedRequestQueue::getRateLimitStatus(const std::string& provider) {
    std::scoped_lock lock(mutex_);
    auto it = providers_.find(provider);
    if (it == providers_.end()) {
        return std::nullopt;
    }
    const auto now = Clock::now();
    auto& tracker = it->second.tracker;
    RateLimitStatus status;
    status.limits = limitsFor(provider);
    status.canMakeRequest = tracker.canAdmit(status.limits, now);
    status.requestsInLastMinute = tracker.countSince(now - std::chrono::minutes(1));
    status.requestsInLastHour = tracker.countSince(now - std::chrono::hours(1));
    status.burstCount = tracker.burstCount();
    return status;
}

std::map<std::string, RateLimitStatus> RateLimitedRequestQueue::getRateLimitStatus() {
    std::vector<std::string> names;
    {
        std::scoped_lock lock(mutex_);
        for (const auto& [provider, state] : providers_) {
            names.push_back(provider);
        }
    }
    std::map<std::string, RateLimitStatus> all;
    for (const auto& name : names) {
        if (auto status = getRateLimitStatus(name)) {
            all.emplace(name, *status);
        }
    }
    return all;
}

std::size_t RateLimitedRequestQueue::clearQueue(const std::string& provider) {
    std::vector<std::shared_ptr<Entry>> cleared;
    {
        std::scoped_lock lock(mutex_);
        auto it = providers_.find(provider);
        if (it == providers_.end()) {
            return 0;
        }
        auto& state = it->second;
        cleared.swap(state.pending);
        state.stats.pending = 0;
        for (const auto& entry : cleared) {
            entries_.erase(entry->request.id);
            if (entry->timeoutTimer) {
                entry->timeoutTimer->cancel();
            }
        }
    }

    for (auto& entry : cleared) {
        entry->promise.set_exception(std::make_exception_ptr(
            core::RequestError(core::RequestError::Type::cancelled, "Queue cleared")));
    }
    if (!cleared.empty()) {
        util::log(util::LogLevel::info, "Cleared " + std::to_string(cleared.size()) + " pending requests for " + provider);
    }
    return cleared.size();
}

void RateLimitedRequestQueue::pauseQueue(const std::string& provider) {
    std::scoped_lock lock(mutex_);
    if (destroyed_) {
        return;
    }
    stateFor(provider, Clock::now()).paused = true;
    util::log(util::LogLevel::info, "Paused queue for " + provider);
}

void RateLimitedRequestQueue::resumeQueue(const std::string& provider) {
    std::scoped_lock lock(mutex_);
    if (auto it = providers_.find(provider); it != providers_.end()) {
        it->second.paused = false;
        util::log(util::LogLevel::info, "Resumed queue for " + provider);
    }
}

void RateLimitedRequestQueue::processQueues() {
    std::vector<QueuedRequest> dispatch;
    std::shared_ptr<RequestExecutor> executor;
    {
        std::scoped_lock lock(mutex_);
        if (destroyed_ || !executor_) {
            return;
        }
        executor = executor_;
        const auto now = Clock::now();

        for (auto& [provider, state] : providers_) {
            if (state.paused || state.pending.empty()) {
                continue;
            }
            if (!state.tracker.canAdmit(limitsFor(provider), now)) {
                continue;
            }

            std::stable_sort(state.pending.begin(), state.pending.end(),
                             [](const std::shared_ptr<Entry>& lhs, const std::shared_ptr<Entry>& rhs) {
                                 return schedulesBefore(lhs->request, rhs->request);
                             });
            auto ready = std::find_if(state.pending.begin(), state.pending.end(),
                                      [now](const std::shared_ptr<Entry>& entry) {
                                          return entry->request.scheduledAt <= now;
                                      });
            if (ready == state.pending.end()) {
                continue;
            }

            auto entry = *ready;
            state.pending.erase(ready);
            state.tracker.record(now);
            state.processing.insert(entry->request.id);

            auto& request = entry->request;
            const auto waitedSince = request.retryCount == 0 ? request.createdAt : request.scheduledAt;
            request.executedAt = now;
            state.dispatched += 1;
            const auto n = static_cast<double>(state.dispatched);
            state.stats.averageWaitTime = (state.stats.averageWaitTime * (n - 1) + toMillis(now - waitedSince)) / n;
            state.stats.pending = state.pending.size();
            state.stats.processing = state.processing.size();

            dispatch.push_back(request);
        }
    }

    for (const auto& request : dispatch) {
        util::log(util::LogLevel::debug, "Dispatching request " + request.id + " to " + request.provider);
        try {
            executor->execute(request);
        } catch (const std::exception& ex) {
            util::log(util::LogLevel::warn, "Executor rejected request " + request.id + ": " + ex.what());
            failRequest(request.id, std::current_exception());
        }
    }
}

void RateLimitedRequestQueue::destroy() {
    std::vector<std::shared_ptr<Entry>> outstanding;
    {
        std::scoped_lock lock(mutex_);
        if (destroyed_) {
            return;
        }
        destroyed_ = true;
        if (tickTimer_) {
            tickTimer_->cancel();
        }
        outstanding.reserve(entries_.size());
        for (auto& [id, entry] : entries_) {
            if (entry->timeoutTimer) {
                entry->timeoutTimer->cancel();
            }
            outstanding.push_back(entry);
        }
        entries_.clear();
        providers_.clear();
        executor_.reset();
    }

    for (auto& entry : outstanding) {
        entry->promise.set_exception(std::make_exception_ptr(
            core::RequestError(core::RequestError::Type::service_shutdown, "Service destroyed")));
    }
    if (!outstanding.empty()) {
        util::log(util::LogLevel::info, "Request queue destroyed with " + std::to_string(outstanding.size()) +
                                            " outstanding requests");
    }
}

RateLimitedRequestQueue::ProviderState& RateLimitedRequestQueue::stateFor(const std::string& provider,
                                                                          Clock::time_point now) {
    auto it = providers_.find(provider);
    if (it == providers_.end()) {
        it = providers_.emplace(provider, ProviderState(now)).first;
    }
    return it->second;
}

ratelimit::RateLimitConfig RateLimitedRequestQueue::limitsFor(const std::string& provider) const {
    return ratelimit::resolveRateLimit(options_.rateLimits, provider);
}

void RateLimitedRequestQueue::scheduleTick() {
    std::scoped_lock lock(mutex_);
    if (destroyed_ || !tickTimer_) {
        return;
    }
    tickTimer_->expires_after(options_.tickInterval);
    tickTimer_->async_wait([this](const boost::system::error_code& ec) {
        if (ec) {
            return;
        }
        processQueues();
        scheduleTick();
    });
}

void RateLimitedRequestQueue::handleTimeout(const std::string& id) {
    std::shared_ptr<Entry> entry;
    {
        std::scoped_lock lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end()) {
            return;
        }
        entry = it->second;
        entries_.erase(it);

        auto& state = providers_.at(entry->request.provider);
        auto pendingIt = std::find(state.pending.begin(), state.pending.end(), entry);
        if (pendingIt != state.pending.end()) {
            state.pending.erase(pendingIt);
        }
        state.processing.erase(id);
        state.stats.failed += 1;
        state.stats.totalProcessed += 1;
        state.stats.pending = state.pending.size();
        state.stats.processing = state.processing.size();
    }

    const auto timeoutMs = entry->request.timeout.value_or(std::chrono::milliseconds{0}).count();
    util::log(util::LogLevel::warn, "Request " + id + " timed out after " + std::to_string(timeoutMs) + "ms");
    entry->promise.set_exception(std::make_exception_ptr(core::RequestError(
        core::RequestError::Type::timeout, "Request timeout after " + std::to_string(timeoutMs) + "ms")));
}

std::string RateLimitedRequestQueue::makeRequestId(const std::string& provider) {
    thread_local std::mt19937_64 generator{std::random_device{}()};
    const auto epochMs = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return provider + "-" + std::to_string(epochMs) + "-" + toBase36(generator() % 101559956668416ULL);
}

} // namespace resilink::queue
