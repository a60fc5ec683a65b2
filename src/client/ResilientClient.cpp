#include "resilink/client/ResilientClient.hpp"
#include "resilink/client/RetryDecision.hpp"
#include "resilink/util/Logging.hpp"
#include "resilink/util/UrlUtil.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace resilink::client {
namespace {

std::string headerName(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return name;
}

} // namespace

ResilientClient::ResilientClient(Settings settings,
                                 http::Transport& transport,
                                 proxy::ProxyManager& proxies,
                                 std::shared_ptr<ratelimit::FixedWindowTracker> tracker,
                                 Sleeper sleeper)
    : settings_(std::move(settings))
    , transport_(transport)
    , proxies_(proxies)
    , tracker_(std::move(tracker))
    , sleeper_(std::move(sleeper)) {}

http::Response ResilientClient::get(const std::string& endpoint,
                                    const std::map<std::string, std::string>& params,
                                    const core::HeaderMap& headers) {
    CallOptions options;
    options.params = params;
    options.headers = headers;
    return call(endpoint, options);
}

http::Response ResilientClient::call(const std::string& endpoint, const CallOptions& options) {
    for (int attempt = 0;; ++attempt) {
        awaitAdmission();
        try {
            auto response = execute(endpoint, options);
            if (tracker_) {
                tracker_->record(ratelimit::FixedWindowTracker::Clock::now());
            }
            return response;
        } catch (const core::RequestError& error) {
            if (!shouldRetry(error, attempt, settings_.retry)) {
                throw;
            }
            const auto delay = retryDelayFor(error, attempt + 1, settings_.retry);
            util::log(util::LogLevel::warn,
                      "Retrying " + settings_.name + " " + endpoint + " (attempt " + std::to_string(attempt + 1) +
                          "/" + std::to_string(settings_.retry.maxRetries) + ") after " +
                          std::to_string(delay.count()) + "ms: " + error.what());
            sleeper_(delay);
        }
    }
}

http::Response ResilientClient::execute(const std::string& endpoint, const CallOptions& options) {
    http::OutboundRequest request;
    request.method = options.method;
    request.url = util::buildUrl(settings_.baseUrl, endpoint, options.params);
    request.body = options.body;
    request.headers["user-agent"] = settings_.userAgent;
    request.headers["accept"] = "application/json";
    for (const auto& [name, value] : settings_.headers) {
        request.headers[headerName(name)] = value;
    }
    for (const auto& [name, value] : options.headers) {
        request.headers[headerName(name)] = value;
    }

    std::optional<proxy::ProxyAgent> agent;
    if (settings_.useProxy) {
        agent = proxies_.getProxyAgent();
    }

    const auto timeout = options.timeout.value_or(settings_.timeout);
    util::log(util::LogLevel::debug,
              settings_.name + " " + request.method + " " + request.url +
                  (agent ? " via " + proxy::describe(agent->endpoint) : std::string{}));

    http::Response response;
    try {
        response = transport_.send(request, agent, timeout);
    } catch (const core::RequestError& error) {
        if (agent && error.type() == core::RequestError::Type::transient_network) {
            proxies_.markProxyFailure(agent->endpoint);
        }
        throw;
    }

    if (response.status >= 200 && response.status < 300) {
        if (agent) {
            proxies_.markProxySuccess(agent->endpoint);
        }
        return response;
    }

    std::optional<std::chrono::milliseconds> retryAfter;
    if (response.status == 429) {
        if (auto it = response.headers.find("retry-after"); it != response.headers.end()) {
            retryAfter = parseRetryAfter(it->second);
        }
    }
    throw core::RequestError(core::classifyStatus(response.status),
                             settings_.name + " responded with HTTP " + std::to_string(response.status),
                             response.status,
                             std::move(response.body),
                             std::move(response.headers),
                             retryAfter);
}

void ResilientClient::awaitAdmission() {
    if (!tracker_ || !settings_.rateLimits) {
        return;
    }
    for (;;) {
        const auto wait = tracker_->waitTime(*settings_.rateLimits, ratelimit::FixedWindowTracker::Clock::now());
        if (wait.count() <= 0) {
            return;
        }
        util::log(util::LogLevel::warn,
                  "Rate limit reached for " + settings_.name + ", waiting " + std::to_string(wait.count()) + "ms");
        sleeper_(wait);
    }
}

} // namespace resilink::client
