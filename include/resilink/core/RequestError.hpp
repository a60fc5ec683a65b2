#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>

namespace resilink::core {

// Header names are stored lower-cased.
using HeaderMap = std::map<std::string, std::string>;

class RequestError : public std::runtime_error {
public:
    enum class Type {
        transient_network,
        rate_limited,
        upstream_server,
        upstream_client,
        timeout,
        service_shutdown,
        cancelled,
        proxy_unavailable,
        configuration
    };

    RequestError(Type type, const std::string& message, int status = 0)
        : std::runtime_error(message)
        , type_(type)
        , status_(status) {}

    RequestError(Type type,
                 const std::string& message,
                 int status,
                 std::string body,
                 HeaderMap headers,
                 std::optional<std::chrono::milliseconds> retryAfter = std::nullopt)
        : std::runtime_error(message)
        , type_(type)
        , status_(status)
        , body_(std::move(body))
        , headers_(std::move(headers))
        , retryAfter_(retryAfter) {}

    [[nodiscard]] Type type() const noexcept { return type_; }

    // 0 when no response was received.
    [[nodiscard]] int status() const noexcept { return status_; }

    [[nodiscard]] const std::string& body() const noexcept { return body_; }

    [[nodiscard]] const HeaderMap& headers() const noexcept { return headers_; }

    [[nodiscard]] std::optional<std::chrono::milliseconds> retryAfter() const noexcept { return retryAfter_; }

private:
    Type type_;
    int status_;
    std::string body_;
    HeaderMap headers_;
    std::optional<std::chrono::milliseconds> retryAfter_;
};

const char* toString(RequestError::Type type);

// Maps an HTTP status to an error type. 2xx and 3xx are not errors and map to upstream_client.
RequestError::Type classifyStatus(int status);

} // namespace resilink::core
