#pragma once

#include "resilink/core/RequestError.hpp"
#include "resilink/proxy/ProxyEndpoint.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace resilink::http {

struct OutboundRequest {
    std::string method{"GET"};
    std::string url;
    core::HeaderMap headers;
    std::string body;
};

struct Response {
    int status{};
    core::HeaderMap headers;
    std::string body;
};

// Single HTTP exchange. Any response is returned regardless of status;
// RequestError(transient_network) is thrown when no response was obtained.
class Transport {
public:
    virtual ~Transport() = default;

    virtual Response send(const OutboundRequest& request,
                          const std::optional<proxy::ProxyAgent>& proxy,
                          std::chrono::milliseconds timeout) = 0;
};

} // namespace resilink::http
