#pragma once

#include "resilink/server/RequestContext.hpp"

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace resilink::server {

// Method plus segment-wise path matching. A `:name` segment matches any
// single segment and captures it; empty segments are ignored on both sides,
// so trailing slashes do not matter.
class Router {
public:
    using Handler = std::function<void(RequestContext&)>;

    void addRoute(std::string method, const std::string& path, Handler handler);

    // Ignores the query string. Returns an empty handler when nothing matches.
    Handler resolve(const std::string& method,
                    const std::string& target,
                    std::unordered_map<std::string, std::string>& params) const;

private:
    struct Segment {
        std::string text;
        bool capture{false};
    };

    struct RouteEntry {
        std::string method;
        std::vector<Segment> segments;
        Handler handler;
    };

    std::vector<RouteEntry> routes_;
};

} // namespace resilink::server
