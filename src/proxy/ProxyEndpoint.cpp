#include "resilink/proxy/ProxyEndpoint.hpp"
#include "resilink/util/JsonResponse.hpp"
#include "resilink/util/UrlUtil.hpp"

namespace resilink::proxy {

bool sameProxy(const ProxyEndpoint& lhs, const ProxyEndpoint& rhs) {
    return lhs.host == rhs.host && lhs.port == rhs.port && lhs.username == rhs.username && lhs.password == rhs.password;
}

std::string describe(const ProxyEndpoint& endpoint) {
    return endpoint.host + ":" + std::to_string(endpoint.port);
}

ProxyAgent makeProxyAgent(const ProxyEndpoint& endpoint) {
    ProxyAgent agent;
    agent.endpoint = endpoint;
    agent.url = "http://";
    if (!endpoint.username.empty() || !endpoint.password.empty()) {
        agent.url += util::urlEncode(endpoint.username) + ":" + util::urlEncode(endpoint.password) + "@";
        agent.authorization = "Basic " + util::base64Encode(endpoint.username + ":" + endpoint.password);
    }
    agent.url += describe(endpoint);
    return agent;
}

boost::json::object toJson(const ProxyEndpoint& endpoint) {
    boost::json::object obj;
    obj["host"] = endpoint.host;
    obj["port"] = endpoint.port;
    if (!endpoint.country.empty()) {
        obj["country"] = endpoint.country;
    }
    if (!endpoint.region.empty()) {
        obj["region"] = endpoint.region;
    }
    obj["isHealthy"] = endpoint.isHealthy;
    if (endpoint.lastHealthCheck) {
        obj["lastHealthCheck"] = util::formatIsoTimestamp(*endpoint.lastHealthCheck);
    } else {
        obj["lastHealthCheck"] = nullptr;
    }
    obj["responseTime"] = endpoint.responseTime.count();
    obj["successCount"] = endpoint.successCount;
    obj["failureCount"] = endpoint.failureCount;
    return obj;
}

} // namespace resilink::proxy
