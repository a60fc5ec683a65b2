#pragma once

#include "resilink/http/Transport.hpp"
#include "resilink/proxy/ProxyEndpoint.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/json.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace resilink::proxy {

struct ProxyManagerOptions {
    bool enabled{false};
    std::vector<ProxyEndpoint> endpoints;
    // <= 0 disables timed rotation.
    std::chrono::milliseconds rotationInterval{300000};
    std::chrono::milliseconds healthCheckInterval{60000};
    std::chrono::milliseconds initialHealthCheckDelay{1000};
    std::string probeUrl{"https://httpbin.org/ip"};
    std::chrono::milliseconds probeTimeout{10000};
    std::string userAgent{"resilink/1.0"};
    int maxFailures{3};
};

struct ProxyHealthStatus {
    enum class Status { healthy, unhealthy, unknown };

    ProxyEndpoint endpoint;
    Status status{Status::unknown};
    std::optional<std::chrono::milliseconds> responseTime;
    std::string error;
    std::chrono::system_clock::time_point lastChecked{};
};

struct ProxyStats {
    std::size_t total{};
    std::size_t healthy{};
    std::size_t unhealthy{};
    long long averageResponseTime{};
    std::optional<ProxyEndpoint> currentProxy;
    std::vector<ProxyEndpoint> endpoints;
};

boost::json::object toJson(const ProxyHealthStatus& status);
boost::json::object toJson(const ProxyStats& stats);

// Pool of egress proxies with periodic health probes and rotation of the
// current endpoint. Every proxy-returning call yields nullopt when the pool
// is disabled, empty or has no healthy endpoint; callers fall back to a
// direct connection. Timer handlers capture `this`; destroy the manager only
// after the io_context has stopped running.
class ProxyManager {
public:
    ProxyManager(boost::asio::io_context& io,
                 boost::asio::thread_pool& worker,
                 http::Transport& transport,
                 ProxyManagerOptions options);
    ~ProxyManager();

    ProxyManager(const ProxyManager&) = delete;
    ProxyManager& operator=(const ProxyManager&) = delete;

    // Arms the rotation and health-check timers.
    void start();
    void stop();
    // Stops the timers and drops every endpoint.
    void destroy();

    [[nodiscard]] bool enabled() const;

    std::optional<ProxyEndpoint> getCurrentProxy() const;
    std::optional<ProxyAgent> getProxyAgent() const;
    std::optional<ProxyAgent> getGeoSpecificProxy(const std::string& country,
                                                  const std::string& region = {}) const;
    std::optional<ProxyEndpoint> getBestPerformingProxy() const;

    void markProxyFailure(const ProxyEndpoint& endpoint);
    void markProxySuccess(const ProxyEndpoint& endpoint);

    ProxyStats getProxyStats() const;

    // Probes without updating pool state. Blocks for up to the probe timeout.
    // Throws RequestError(proxy_unavailable) when no endpoint is given and none is current.
    ProxyHealthStatus testProxyConnectivity(const std::optional<ProxyEndpoint>& endpoint = std::nullopt);

    // Probes every endpoint on the calling thread and applies the results.
    void performHealthChecks();

    void rotateToNextHealthyProxy();

private:
    ProxyHealthStatus checkProxyHealth(const ProxyEndpoint& endpoint);
    void applyHealth(const ProxyHealthStatus& status);
    void scheduleHealthCheckLocked(std::chrono::milliseconds delay);
    void scheduleRotationLocked();
    void rotateLocked();
    void adoptRestoredLocked(std::size_t index);
    std::optional<ProxyEndpoint> currentLocked() const;

    boost::asio::io_context& io_;
    boost::asio::thread_pool& worker_;
    http::Transport& transport_;
    ProxyManagerOptions options_;

    mutable std::mutex mutex_;
    std::vector<ProxyEndpoint> endpoints_;
    std::size_t currentIndex_{0};

    std::unique_ptr<boost::asio::steady_timer> healthTimer_;
    std::unique_ptr<boost::asio::steady_timer> rotationTimer_;
    std::atomic<bool> running_{false};
    std::atomic<bool> healthCheckInFlight_{false};
};

} // namespace resilink::proxy
