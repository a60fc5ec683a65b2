#include "resilink/controller/OpsController.hpp"
#include "resilink/cache/TieredCacheManager.hpp"
#include "resilink/client/ResilientClientFactory.hpp"
#include "resilink/proxy/ProxyManager.hpp"
#include "resilink/queue/RequestQueue.hpp"
#include "resilink/util/JsonUtil.hpp"

#include <boost/beast/http.hpp>
#include <boost/json.hpp>

#include <string>

namespace resilink::controller {
namespace {

void sendJson(server::RequestContext& ctx,
              const boost::json::value& value,
              boost::beast::http::status status = boost::beast::http::status::ok) {
    ctx.response.result(status);
    ctx.response.set(boost::beast::http::field::content_type, "application/json; charset=utf-8");
    ctx.response.body() = util::stringifyJson(value);
    ctx.response.prepare_payload();
}

const std::string* pathParameter(const server::RequestContext& ctx, const std::string& name) {
    auto it = ctx.pathParameters.find(name);
    return it == ctx.pathParameters.end() ? nullptr : &it->second;
}

} // namespace

OpsController::OpsController(proxy::ProxyManager& proxies,
                             queue::RateLimitedRequestQueue& queue,
                             cache::TieredCacheManager& cache,
                             client::ResilientClientFactory& clients)
    : proxies_(proxies)
    , queue_(queue)
    , cache_(cache)
    , clients_(clients) {}

void OpsController::registerRoutes(server::Router& router) {
    router.addRoute("GET", "/health", [this](auto& ctx) { handleHealth(ctx); });
    router.addRoute("GET", "/api/proxy/stats", [this](auto& ctx) { handleProxyStats(ctx); });
    router.addRoute("GET", "/api/queue/stats", [this](auto& ctx) { handleQueueStats(ctx); });
    router.addRoute("GET", "/api/queue/stats/:provider", [this](auto& ctx) { handleQueueStats(ctx); });
    router.addRoute("GET", "/api/queue/ratelimits", [this](auto& ctx) { handleQueueRateLimits(ctx); });
    router.addRoute("GET", "/api/queue/ratelimits/:provider", [this](auto& ctx) { handleQueueRateLimits(ctx); });
    router.addRoute("GET", "/api/cache/stats", [this](auto& ctx) { handleCacheStats(ctx); });
    router.addRoute("GET", "/api/clients/ratelimits", [this](auto& ctx) { handleClientRateLimits(ctx); });
}

void OpsController::handleHealth(server::RequestContext& ctx) {
    auto cacheHealth = cache_.healthCheck();
    auto proxyStats = proxies_.getProxyStats();

    boost::json::object clients;
    for (const auto& [name, health] : clients_.healthCheck()) {
        clients[name] = client::toJson(health);
    }

    boost::json::object proxy;
    proxy["enabled"] = proxies_.enabled();
    proxy["healthy"] = proxyStats.healthy;
    proxy["total"] = proxyStats.total;

    boost::json::object data;
    data["status"] = cacheHealth.storeStatus && cacheHealth.localStatus ? "healthy" : "degraded";
    data["cache"] = cache::toJson(cacheHealth);
    data["proxy"] = std::move(proxy);
    data["clients"] = std::move(clients);
    sendJson(ctx, data);
}

void OpsController::handleProxyStats(server::RequestContext& ctx) {
    sendJson(ctx, proxy::toJson(proxies_.getProxyStats()));
}

void OpsController::handleQueueStats(server::RequestContext& ctx) {
    if (auto provider = pathParameter(ctx, "provider")) {
        sendJson(ctx, queue::toJson(queue_.getQueueStats(*provider)));
        return;
    }
    boost::json::object data;
    for (const auto& [name, stats] : queue_.getQueueStats()) {
        data[name] = queue::toJson(stats);
    }
    sendJson(ctx, data);
}

void OpsController::handleQueueRateLimits(server::RequestContext& ctx) {
    if (auto provider = pathParameter(ctx, "provider")) {
        auto status = queue_.getRateLimitStatus(*provider);
        if (!status) {
            boost::json::object error;
            error["message"] = "No rate limit state for provider: " + *provider;
            sendJson(ctx, error, boost::beast::http::status::not_found);
            return;
        }
        sendJson(ctx, queue::toJson(*status));
        return;
    }
    boost::json::object data;
    for (const auto& [name, status] : queue_.getRateLimitStatus()) {
        data[name] = queue::toJson(status);
    }
    sendJson(ctx, data);
}

void OpsController::handleCacheStats(server::RequestContext& ctx) {
    boost::json::object data;
    data["stats"] = cache::toJson(cache_.getStats());
    data["memory"] = cache::toJson(cache_.getMemoryInfo());
    sendJson(ctx, data);
}

void OpsController::handleClientRateLimits(server::RequestContext& ctx) {
    boost::json::object data;
    for (const auto& [name, snapshot] : clients_.getRateLimitStatus()) {
        data[name] = ratelimit::toJson(snapshot);
    }
    sendJson(ctx, data);
}

} // namespace resilink::controller
