#pragma once

#include <boost/json.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace resilink::proxy {

struct ProxyEndpoint {
    std::string host;
    std::uint16_t port{};
    std::string username;
    std::string password;
    std::string country;
    std::string region;
    bool isHealthy{true};
    std::optional<std::chrono::system_clock::time_point> lastHealthCheck;
    std::chrono::milliseconds responseTime{0};
    int successCount{};
    int failureCount{};
};

// Identity is host, port and credentials; health fields are ignored.
bool sameProxy(const ProxyEndpoint& lhs, const ProxyEndpoint& rhs);

std::string describe(const ProxyEndpoint& endpoint);

// Egress route handed to a transport.
struct ProxyAgent {
    ProxyEndpoint endpoint;
    std::string url;
    std::string authorization;
};

ProxyAgent makeProxyAgent(const ProxyEndpoint& endpoint);

// Credentials are never serialised.
boost::json::object toJson(const ProxyEndpoint& endpoint);

} // namespace resilink::proxy
