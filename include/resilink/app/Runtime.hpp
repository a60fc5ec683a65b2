#pragma once

#include "resilink/cache/TieredCacheManager.hpp"
#include "resilink/client/QueueDispatcher.hpp"
#include "resilink/client/ResilientClientFactory.hpp"
#include "resilink/config/AppConfig.hpp"
#include "resilink/proxy/ProxyManager.hpp"
#include "resilink/queue/RequestQueue.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/thread_pool.hpp>

#include <memory>

namespace resilink::app {

// Owns and wires the resilience services. The worker pool must be joined
// before the runtime is destroyed.
class Runtime {
public:
    Runtime(boost::asio::io_context& io,
            boost::asio::thread_pool& worker,
            config::AppConfig config,
            http::Transport& transport,
            cache::DistributedStore& store,
            client::Sleeper sleeper = {});
    ~Runtime();

    Runtime(const Runtime&) = delete;
    Runtime& operator=(const Runtime&) = delete;

    // Registers one client per configured provider and arms every timer.
    void start();
    // Destroys the services in reverse construction order.
    void stop();

    proxy::ProxyManager& proxies() { return proxies_; }
    cache::TieredCacheManager& cache() { return cache_; }
    queue::RateLimitedRequestQueue& queue() { return queue_; }
    client::ResilientClientFactory& clients() { return clients_; }
    const config::AppConfig& config() const { return config_; }

private:
    config::AppConfig config_;
    proxy::ProxyManager proxies_;
    cache::TieredCacheManager cache_;
    queue::RateLimitedRequestQueue queue_;
    client::ResilientClientFactory clients_;
    std::shared_ptr<client::QueueDispatcher> dispatcher_;
    bool started_{false};
    bool stopped_{false};
};

} // namespace resilink::app
