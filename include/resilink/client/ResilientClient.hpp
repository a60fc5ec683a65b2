#pragma once

#include "resilink/core/RequestError.hpp"
#include "resilink/core/RetryPolicy.hpp"
#include "resilink/http/Transport.hpp"
#include "resilink/proxy/ProxyManager.hpp"
#include "resilink/ratelimit/FixedWindowTracker.hpp"
#include "resilink/ratelimit/RateLimitConfig.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace resilink::client {

struct RetryOverrides {
    std::optional<int> maxRetries;
    std::optional<std::chrono::milliseconds> baseDelay;
    std::optional<std::chrono::milliseconds> maxDelay;
    std::optional<double> backoffMultiplier;
};

struct ClientOptions {
    std::string baseUrl;
    std::optional<std::chrono::milliseconds> timeout;
    RetryOverrides retry;
    std::optional<ratelimit::RateLimitConfig> rateLimits;
    core::HeaderMap headers;
    bool useProxy{false};
};

struct CallOptions {
    std::string method{"GET"};
    std::map<std::string, std::string> params;
    core::HeaderMap headers;
    std::string body;
    std::optional<std::chrono::milliseconds> timeout;
};

using Sleeper = std::function<void(std::chrono::milliseconds)>;

// Named upstream client. call() runs admission, retry and backoff around
// execute(), which is a single exchange.
class ResilientClient {
public:
    struct Settings {
        std::string name;
        std::string baseUrl;
        std::chrono::milliseconds timeout{30000};
        core::RetryPolicy retry;
        std::optional<ratelimit::RateLimitConfig> rateLimits;
        core::HeaderMap headers;
        bool useProxy{false};
        std::string userAgent{"resilink/1.0"};
    };

    ResilientClient(Settings settings,
                    http::Transport& transport,
                    proxy::ProxyManager& proxies,
                    std::shared_ptr<ratelimit::FixedWindowTracker> tracker,
                    Sleeper sleeper);

    // Throws the last RequestError once the retry budget is spent.
    http::Response call(const std::string& endpoint, const CallOptions& options = {});
    http::Response get(const std::string& endpoint,
                       const std::map<std::string, std::string>& params = {},
                       const core::HeaderMap& headers = {});

    // One attempt with proxy injection. Non-2xx responses throw RequestError.
    http::Response execute(const std::string& endpoint, const CallOptions& options = {});

    [[nodiscard]] const std::string& name() const noexcept { return settings_.name; }
    [[nodiscard]] const Settings& settings() const noexcept { return settings_; }

private:
    void awaitAdmission();

    Settings settings_;
    http::Transport& transport_;
    proxy::ProxyManager& proxies_;
    std::shared_ptr<ratelimit::FixedWindowTracker> tracker_;
    Sleeper sleeper_;
};

} // namespace resilink::client
