#include "resilink/client/ResilientClientFactory.hpp"
#include "resilink/util/Logging.hpp"

#include <thread>
#include <utility>
#include <vector>

namespace resilink::client {

boost::json::object toJson(const ClientHealth& health) {
    boost::json::object obj;
    obj["status"] = health.status;
    obj["responseTime"] = health.responseTime.count();
    if (!health.error.empty()) {
        obj["error"] = health.error;
    }
    return obj;
}

ResilientClientFactory::ResilientClientFactory(http::Transport& transport,
                                               proxy::ProxyManager& proxies,
                                               FactoryOptions options,
                                               Sleeper sleeper)
    : transport_(transport)
    , proxies_(proxies)
    , options_(std::move(options))
    , sleeper_(std::move(sleeper)) {
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
    }
}

std::shared_ptr<ResilientClient> ResilientClientFactory::createClient(const std::string& name,
                                                                      const ClientOptions& options) {
    ResilientClient::Settings settings;
    settings.name = name;
    settings.baseUrl = options.baseUrl;
    if (options.timeout) {
        settings.timeout = *options.timeout;
    } else if (auto it = options_.providerTimeouts.find(name); it != options_.providerTimeouts.end()) {
        settings.timeout = it->second;
    } else {
        settings.timeout = options_.defaultTimeout;
    }
    settings.retry = options_.retry;
    settings.retry.maxRetries = options.retry.maxRetries.value_or(settings.retry.maxRetries);
    settings.retry.baseDelay = options.retry.baseDelay.value_or(settings.retry.baseDelay);
    settings.retry.maxDelay = options.retry.maxDelay.value_or(settings.retry.maxDelay);
    settings.retry.backoffMultiplier = options.retry.backoffMultiplier.value_or(settings.retry.backoffMultiplier);
    settings.rateLimits = options.rateLimits;
    settings.headers = options.headers;
    settings.useProxy = options.useProxy;
    settings.userAgent = options_.userAgent;

    std::shared_ptr<ratelimit::FixedWindowTracker> tracker;
    if (settings.rateLimits) {
        tracker = std::make_shared<ratelimit::FixedWindowTracker>();
    }

    auto client = std::make_shared<ResilientClient>(std::move(settings), transport_, proxies_, tracker, sleeper_);
    {
        std::scoped_lock lock(mutex_);
        clients_[name] = client;
        if (tracker) {
            trackers_[name] = tracker;
        } else {
            trackers_.erase(name);
        }
    }
    util::log(util::LogLevel::info, "Created API client for " + name + " (" + options.baseUrl + ")");
    return client;
}

std::shared_ptr<ResilientClient> ResilientClientFactory::getClient(const std::string& name) const {
    std::scoped_lock lock(mutex_);
    auto it = clients_.find(name);
    if (it == clients_.end()) {
        throw core::RequestError(core::RequestError::Type::configuration, "No client found for provider: " + name);
    }
    return it->second;
}

std::map<std::string, ClientHealth> ResilientClientFactory::healthCheck() {
    std::vector<std::shared_ptr<ResilientClient>> clients;
    {
        std::scoped_lock lock(mutex_);
        for (const auto& [name, client] : clients_) {
            clients.push_back(client);
        }
    }

    std::map<std::string, ClientHealth> results;
    for (const auto& client : clients) {
        ClientHealth health;
        const auto started = std::chrono::steady_clock::now();
        try {
            CallOptions options;
            options.timeout = options_.healthTimeout;
            client->execute("/health", options);
            health.status = true;
        } catch (const std::exception& ex) {
            health.error = ex.what();
        }
        health.responseTime =
            std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
        results[client->name()] = std::move(health);
    }
    return results;
}

std::map<std::string, ratelimit::FixedWindowTracker::Snapshot> ResilientClientFactory::getRateLimitStatus() const {
    std::scoped_lock lock(mutex_);
    std::map<std::string, ratelimit::FixedWindowTracker::Snapshot> status;
    const auto now = ratelimit::FixedWindowTracker::Clock::now();
    for (const auto& [name, tracker] : trackers_) {
        status[name] = tracker->snapshot(now);
    }
    return status;
}

void ResilientClientFactory::destroy() {
    std::scoped_lock lock(mutex_);
    clients_.clear();
    trackers_.clear();
    util::log(util::LogLevel::info, "API client factory destroyed");
}

} // namespace resilink::client
