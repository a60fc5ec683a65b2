#include "resilink/proxy/ProxyManager.hpp"
#include "resilink/core/RequestError.hpp"
#include "resilink/util/JsonResponse.hpp"
#include "resilink/util/Logging.hpp"

#include <boost/asio/post.hpp>

#include <algorithm>
#include <cmath>
#include <iterator>

namespace resilink::proxy {
namespace {

double successRate(const ProxyEndpoint& endpoint) {
    const int total = endpoint.successCount + endpoint.failureCount;
    if (total == 0) {
        return 0.0;
    }
    return static_cast<double>(endpoint.successCount) / static_cast<double>(total);
}

// Success rate dominates when the gap exceeds 0.1; otherwise lower latency wins.
bool performsBetter(const ProxyEndpoint& candidate, const ProxyEndpoint& incumbent) {
    const double candidateRate = successRate(candidate);
    const double incumbentRate = successRate(incumbent);
    if (std::abs(candidateRate - incumbentRate) > 0.1) {
        return candidateRate > incumbentRate;
    }
    return candidate.responseTime < incumbent.responseTime;
}

const char* toString(ProxyHealthStatus::Status status) {
    switch (status) {
    case ProxyHealthStatus::Status::healthy: return "healthy";
    case ProxyHealthStatus::Status::unhealthy: return "unhealthy";
    case ProxyHealthStatus::Status::unknown: return "unknown";
    }
    return "unknown";
}

} // namespace

boost::json::object toJson(const ProxyHealthStatus& status) {
    boost::json::object obj;
    obj["endpoint"] = toJson(status.endpoint);
    obj["status"] = toString(status.status);
    if (status.responseTime) {
        obj["responseTime"] = status.responseTime->count();
    }
    if (!status.error.empty()) {
        obj["error"] = status.error;
    }
    obj["lastChecked"] = util::formatIsoTimestamp(status.lastChecked);
    return obj;
}

boost::json::object toJson(const ProxyStats& stats) {
    boost::json::object obj;
    obj["total"] = stats.total;
    obj["healthy"] = stats.healthy;
    obj["unhealthy"] = stats.unhealthy;
    obj["averageResponseTime"] = stats.averageResponseTime;
    if (stats.currentProxy) {
        obj["currentProxy"] = toJson(*stats.currentProxy);
    } else {
        obj["currentProxy"] = nullptr;
    }
    boost::json::array endpoints;
    endpoints.reserve(stats.endpoints.size());
    for (const auto& endpoint : stats.endpoints) {
        endpoints.emplace_back(toJson(endpoint));
    }
    obj["endpoints"] = std::move(endpoints);
    return obj;
}

ProxyManager::ProxyManager(boost::asio::io_context& io,
                           boost::asio::thread_pool& worker,
                           http::Transport& transport,
                           ProxyManagerOptions options)
    : io_(io)
    , worker_(worker)
    , transport_(transport)
    , options_(std::move(options)) {
    if (!options_.enabled) {
        util::log(util::LogLevel::info, "Proxy system disabled");
        return;
    }
    endpoints_ = options_.endpoints;
    util::log(util::LogLevel::info, "Initialized " + std::to_string(endpoints_.size()) + " proxy endpoints");
}

ProxyManager::~ProxyManager() {
    stop();
}

void ProxyManager::start() {
    if (!options_.enabled || running_.exchange(true)) {
        return;
    }
    std::scoped_lock lock(mutex_);
    if (!healthTimer_) {
        healthTimer_ = std::make_unique<boost::asio::steady_timer>(io_);
        rotationTimer_ = std::make_unique<boost::asio::steady_timer>(io_);
    }
    scheduleHealthCheckLocked(options_.initialHealthCheckDelay);
    if (options_.rotationInterval.count() > 0) {
        scheduleRotationLocked();
    }
}

void ProxyManager::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    std::scoped_lock lock(mutex_);
    if (healthTimer_) {
        healthTimer_->cancel();
    }
    if (rotationTimer_) {
        rotationTimer_->cancel();
    }
}

void ProxyManager::destroy() {
    stop();
    std::scoped_lock lock(mutex_);
    endpoints_.clear();
    currentIndex_ = 0;
}

bool ProxyManager::enabled() const {
    return options_.enabled;
}

std::optional<ProxyEndpoint> ProxyManager::getCurrentProxy() const {
    std::scoped_lock lock(mutex_);
    return currentLocked();
}

std::optional<ProxyAgent> ProxyManager::getProxyAgent() const {
    auto current = getCurrentProxy();
    if (!current) {
        return std::nullopt;
    }
    return makeProxyAgent(*current);
}

std::optional<ProxyAgent> ProxyManager::getGeoSpecificProxy(const std::string& country,
                                                            const std::string& region) const {
    if (!options_.enabled) {
        return std::nullopt;
    }
    std::scoped_lock lock(mutex_);
    auto match = std::find_if(endpoints_.begin(), endpoints_.end(), [&](const ProxyEndpoint& endpoint) {
        return endpoint.isHealthy && (country.empty() || endpoint.country == country) &&
               (region.empty() || endpoint.region == region);
    });
    if (match == endpoints_.end()) {
        match = std::find_if(endpoints_.begin(), endpoints_.end(),
                             [](const ProxyEndpoint& endpoint) { return endpoint.isHealthy; });
    }
    if (match != endpoints_.end()) {
        return makeProxyAgent(*match);
    }
    if (auto current = currentLocked()) {
        return makeProxyAgent(*current);
    }
    return std::nullopt;
}

std::optional<ProxyEndpoint> ProxyManager::getBestPerformingProxy() const {
    std::scoped_lock lock(mutex_);
    const ProxyEndpoint* best = nullptr;
    for (const auto& endpoint : endpoints_) {
        if (!endpoint.isHealthy) {
            continue;
        }
        if (!best || performsBetter(endpoint, *best)) {
            best = &endpoint;
        }
    }
    if (!best) {
        return std::nullopt;
    }
    return *best;
}

void ProxyManager::markProxyFailure(const ProxyEndpoint& endpoint) {
    std::scoped_lock lock(mutex_);
    auto it = std::find_if(endpoints_.begin(), endpoints_.end(),
                           [&](const ProxyEndpoint& entry) { return sameProxy(entry, endpoint); });
    if (it == endpoints_.end()) {
        return;
    }
    it->failureCount += 1;
    if (it->failureCount >= options_.maxFailures && it->isHealthy) {
        it->isHealthy = false;
        util::log(util::LogLevel::warn, "Proxy " + describe(*it) + " marked as unhealthy after " +
                                            std::to_string(it->failureCount) + " failures");
        if (static_cast<std::size_t>(std::distance(endpoints_.begin(), it)) == currentIndex_) {
            rotateLocked();
        }
    }
}

void ProxyManager::markProxySuccess(const ProxyEndpoint& endpoint) {
    std::scoped_lock lock(mutex_);
    auto it = std::find_if(endpoints_.begin(), endpoints_.end(),
                           [&](const ProxyEndpoint& entry) { return sameProxy(entry, endpoint); });
    if (it == endpoints_.end()) {
        return;
    }
    it->successCount += 1;
    it->failureCount = 0;
    if (!it->isHealthy) {
        it->isHealthy = true;
        util::log(util::LogLevel::info, "Proxy " + describe(*it) + " restored to healthy status");
        adoptRestoredLocked(static_cast<std::size_t>(std::distance(endpoints_.begin(), it)));
    }
}

ProxyStats ProxyManager::getProxyStats() const {
    std::scoped_lock lock(mutex_);
    ProxyStats stats;
    stats.total = endpoints_.size();
    long long responseTotal = 0;
    for (const auto& endpoint : endpoints_) {
        if (endpoint.isHealthy) {
            ++stats.healthy;
            responseTotal += endpoint.responseTime.count();
        }
    }
    stats.unhealthy = stats.total - stats.healthy;
    if (stats.healthy > 0) {
        stats.averageResponseTime = std::llround(static_cast<double>(responseTotal) / static_cast<double>(stats.healthy));
    }
    stats.currentProxy = currentLocked();
    stats.endpoints = endpoints_;
    return stats;
}

ProxyHealthStatus ProxyManager::testProxyConnectivity(const std::optional<ProxyEndpoint>& endpoint) {
    auto target = endpoint ? endpoint : getCurrentProxy();
    if (!target) {
        throw core::RequestError(core::RequestError::Type::proxy_unavailable,
                                 "No proxy endpoint available for testing");
    }
    return checkProxyHealth(*target);
}

void ProxyManager::performHealthChecks() {
    std::vector<ProxyEndpoint> snapshot;
    {
        std::scoped_lock lock(mutex_);
        snapshot = endpoints_;
    }
    for (const auto& endpoint : snapshot) {
        applyHealth(checkProxyHealth(endpoint));
    }

    std::scoped_lock lock(mutex_);
    auto healthy = std::count_if(endpoints_.begin(), endpoints_.end(),
                                 [](const ProxyEndpoint& endpoint) { return endpoint.isHealthy; });
    util::log(util::LogLevel::info, "Proxy health check completed: " + std::to_string(healthy) + "/" +
                                        std::to_string(endpoints_.size()) + " healthy");
}

void ProxyManager::rotateToNextHealthyProxy() {
    std::scoped_lock lock(mutex_);
    rotateLocked();
}

ProxyHealthStatus ProxyManager::checkProxyHealth(const ProxyEndpoint& endpoint) {
    ProxyHealthStatus status;
    status.endpoint = endpoint;

    http::OutboundRequest probe;
    probe.method = "GET";
    probe.url = options_.probeUrl;
    probe.headers["user-agent"] = options_.userAgent;

    const auto started = std::chrono::steady_clock::now();
    try {
        auto response = transport_.send(probe, makeProxyAgent(endpoint), options_.probeTimeout);
        if (response.status == 200) {
            status.status = ProxyHealthStatus::Status::healthy;
            status.responseTime = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started);
        } else {
            status.status = ProxyHealthStatus::Status::unhealthy;
            status.error = "HTTP " + std::to_string(response.status);
        }
    } catch (const std::exception& ex) {
        status.status = ProxyHealthStatus::Status::unhealthy;
        status.error = ex.what();
    }
    status.lastChecked = std::chrono::system_clock::now();
    return status;
}

void ProxyManager::applyHealth(const ProxyHealthStatus& status) {
    std::scoped_lock lock(mutex_);
    auto it = std::find_if(endpoints_.begin(), endpoints_.end(),
                           [&](const ProxyEndpoint& entry) { return sameProxy(entry, status.endpoint); });
    if (it == endpoints_.end()) {
        return;
    }
    it->lastHealthCheck = status.lastChecked;
    if (status.status == ProxyHealthStatus::Status::healthy) {
        const bool restored = !it->isHealthy;
        it->isHealthy = true;
        if (restored) {
            adoptRestoredLocked(static_cast<std::size_t>(std::distance(endpoints_.begin(), it)));
        }
        it->responseTime = status.responseTime.value_or(std::chrono::milliseconds{0});
        it->successCount += 1;
        it->failureCount = 0;
        return;
    }
    it->failureCount += 1;
    if (it->failureCount >= options_.maxFailures && it->isHealthy) {
        it->isHealthy = false;
        util::log(util::LogLevel::warn, "Proxy " + describe(*it) + " failed health check: " + status.error);
        if (static_cast<std::size_t>(std::distance(endpoints_.begin(), it)) == currentIndex_) {
            rotateLocked();
        }
    }
}

// Timers are only touched under mutex_; stop() may run on another io thread.
void ProxyManager::scheduleHealthCheckLocked(std::chrono::milliseconds delay) {
    healthTimer_->expires_after(delay);
    healthTimer_->async_wait([this](const boost::system::error_code& ec) {
        if (ec) {
            return;
        }
        std::scoped_lock lock(mutex_);
        if (!running_) {
            return;
        }
        if (!healthCheckInFlight_.exchange(true)) {
            boost::asio::post(worker_, [this]() {
                performHealthChecks();
                healthCheckInFlight_ = false;
            });
        }
        scheduleHealthCheckLocked(options_.healthCheckInterval);
    });
}

void ProxyManager::scheduleRotationLocked() {
    rotationTimer_->expires_after(options_.rotationInterval);
    rotationTimer_->async_wait([this](const boost::system::error_code& ec) {
        if (ec) {
            return;
        }
        std::scoped_lock lock(mutex_);
        if (!running_) {
            return;
        }
        rotateLocked();
        scheduleRotationLocked();
    });
}

void ProxyManager::rotateLocked() {
    if (endpoints_.empty()) {
        return;
    }
    const bool anyHealthy = std::any_of(endpoints_.begin(), endpoints_.end(),
                                        [](const ProxyEndpoint& endpoint) { return endpoint.isHealthy; });
    if (!anyHealthy) {
        util::log(util::LogLevel::warn, "No healthy proxies available, using first proxy anyway");
        currentIndex_ = 0;
        return;
    }
    do {
        currentIndex_ = (currentIndex_ + 1) % endpoints_.size();
    } while (!endpoints_[currentIndex_].isHealthy);
    util::log(util::LogLevel::info, "Rotated to proxy: " + describe(endpoints_[currentIndex_]));
}

// The current endpoint is only left unhealthy while no endpoint is healthy.
void ProxyManager::adoptRestoredLocked(std::size_t index) {
    if (endpoints_[currentIndex_ % endpoints_.size()].isHealthy) {
        return;
    }
    currentIndex_ = index;
    util::log(util::LogLevel::info, "Switched to restored proxy: " + describe(endpoints_[currentIndex_]));
}

std::optional<ProxyEndpoint> ProxyManager::currentLocked() const {
    if (!options_.enabled || endpoints_.empty()) {
        return std::nullopt;
    }
    const bool anyHealthy = std::any_of(endpoints_.begin(), endpoints_.end(),
                                        [](const ProxyEndpoint& endpoint) { return endpoint.isHealthy; });
    if (!anyHealthy) {
        return std::nullopt;
    }
    return endpoints_[currentIndex_ % endpoints_.size()];
}

} // namespace resilink::proxy
