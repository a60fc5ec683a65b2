#pragma once

#include "resilink/http/Transport.hpp"

#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace resilink::test {

// Scripted Transport. Queued replies are consumed in order; once they run out
// the fallback handler answers. Every call is recorded.
class FakeTransport : public http::Transport {
public:
    using Handler = std::function<http::Response(const http::OutboundRequest&, const std::optional<proxy::ProxyAgent>&)>;

    struct Call {
        http::OutboundRequest request;
        std::optional<proxy::ProxyAgent> proxy;
        std::chrono::milliseconds timeout{};
    };

    static http::Response reply(int status, std::string body = {}, core::HeaderMap headers = {}) {
        http::Response response;
        response.status = status;
        response.body = std::move(body);
        response.headers = std::move(headers);
        return response;
    }

    void enqueue(http::Response response) {
        std::scoped_lock lock(mutex_);
        script_.push_back([response](const auto&, const auto&) { return response; });
    }

    void enqueueNetworkError(const std::string& message = "connection refused") {
        std::scoped_lock lock(mutex_);
        script_.push_back([message](const auto&, const auto&) -> http::Response {
            throw core::RequestError(core::RequestError::Type::transient_network, message);
        });
    }

    void setFallback(Handler handler) {
        std::scoped_lock lock(mutex_);
        fallback_ = std::move(handler);
    }

    http::Response send(const http::OutboundRequest& request,
                        const std::optional<proxy::ProxyAgent>& proxy,
                        std::chrono::milliseconds timeout) override {
        Handler handler;
        {
            std::scoped_lock lock(mutex_);
            calls_.push_back(Call{request, proxy, timeout});
            if (!script_.empty()) {
                handler = std::move(script_.front());
                script_.pop_front();
            } else {
                handler = fallback_;
            }
        }
        if (!handler) {
            return reply(200, "{}");
        }
        return handler(request, proxy);
    }

    std::vector<Call> calls() const {
        std::scoped_lock lock(mutex_);
        return calls_;
    }

    std::size_t callCount() const {
        std::scoped_lock lock(mutex_);
        return calls_.size();
    }

private:
    mutable std::mutex mutex_;
    std::deque<Handler> script_;
    Handler fallback_;
    std::vector<Call> calls_;
};

} // namespace resilink::test
