#pragma once

#include "resilink/server/Router.hpp"

namespace resilink::proxy {
class ProxyManager;
}
namespace resilink::queue {
class RateLimitedRequestQueue;
}
namespace resilink::cache {
class TieredCacheManager;
}
namespace resilink::client {
class ResilientClientFactory;
}

namespace resilink::controller {

// Read-only operational routes: health, proxy, queue, cache and client stats.
class OpsController {
public:
    OpsController(proxy::ProxyManager& proxies,
                  queue::RateLimitedRequestQueue& queue,
                  cache::TieredCacheManager& cache,
                  client::ResilientClientFactory& clients);

    void registerRoutes(server::Router& router);

private:
    void handleHealth(server::RequestContext& ctx);
    void handleProxyStats(server::RequestContext& ctx);
    void handleQueueStats(server::RequestContext& ctx);
    void handleQueueRateLimits(server::RequestContext& ctx);
    void handleCacheStats(server::RequestContext& ctx);
    void handleClientRateLimits(server::RequestContext& ctx);

    proxy::ProxyManager& proxies_;
    queue::RateLimitedRequestQueue& queue_;
    cache::TieredCacheManager& cache_;
    client::ResilientClientFactory& clients_;
};

} // namespace resilink::controller
