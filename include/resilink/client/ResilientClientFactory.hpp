#pragma once

#include "resilink/client/ResilientClient.hpp"

#include <boost/json.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace resilink::client {

struct FactoryOptions {
    core::RetryPolicy retry{};
    std::chrono::milliseconds defaultTimeout{30000};
    std::map<std::string, std::chrono::milliseconds> providerTimeouts{
        {"sportsDataIO", std::chrono::milliseconds(30000)},
        {"oddsAPI", std::chrono::milliseconds(15000)},
        {"espnAPI", std::chrono::milliseconds(20000)},
    };
    std::string userAgent{"resilink/1.0"};
    std::chrono::milliseconds healthTimeout{5000};
};

struct ClientHealth {
    bool status{false};
    std::chrono::milliseconds responseTime{};
    std::string error;
};

boost::json::object toJson(const ClientHealth& health);

class ResilientClientFactory {
public:
    ResilientClientFactory(http::Transport& transport,
                           proxy::ProxyManager& proxies,
                           FactoryOptions options = {},
                           Sleeper sleeper = {});

    ResilientClientFactory(const ResilientClientFactory&) = delete;
    ResilientClientFactory& operator=(const ResilientClientFactory&) = delete;

    // Replaces any client already registered under the name.
    std::shared_ptr<ResilientClient> createClient(const std::string& name, const ClientOptions& options);
    // Throws RequestError(configuration) for an unknown name.
    std::shared_ptr<ResilientClient> getClient(const std::string& name) const;

    std::map<std::string, ClientHealth> healthCheck();
    std::map<std::string, ratelimit::FixedWindowTracker::Snapshot> getRateLimitStatus() const;

    void destroy();

private:
    http::Transport& transport_;
    proxy::ProxyManager& proxies_;
    FactoryOptions options_;
    Sleeper sleeper_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<ResilientClient>> clients_;
    std::map<std::string, std::shared_ptr<ratelimit::FixedWindowTracker>> trackers_;
};

} // namespace resilink::client
