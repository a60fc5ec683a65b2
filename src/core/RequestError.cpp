#include "resilink/core/RequestError.hpp"

namespace resilink::core {

const char* toString(RequestError::Type type) {
    switch (type) {
    case RequestError::Type::transient_network: return "transient_network";
    case RequestError::Type::rate_limited: return "rate_limited";
    case RequestError::Type::upstream_server: return "upstream_server";
    case RequestError::Type::upstream_client: return "upstream_client";
    case RequestError::Type::timeout: return "timeout";
    case RequestError::Type::service_shutdown: return "service_shutdown";
    case RequestError::Type::cancelled: return "cancelled";
    case RequestError::Type::proxy_unavailable: return "proxy_unavailable";
    case RequestError::Type::configuration: return "configuration";
    }
    return "unknown";
}

RequestError::Type classifyStatus(int status) {
    if (status == 429) {
        return RequestError::Type::rate_limited;
    }
    if (status >= 500) {
        return RequestError::Type::upstream_server;
    }
    return RequestError::Type::upstream_client;
}

} // namespace resilink::core
