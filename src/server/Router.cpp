#include "resilink/server/Router.hpp"

#include <algorithm>
#include <cctype>
#include <string_view>

namespace resilink::server {
namespace {

std::string upper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return value;
}

std::vector<std::string_view> splitPath(std::string_view path) {
    std::vector<std::string_view> parts;
    while (!path.empty()) {
        auto slash = path.find('/');
        auto part = path.substr(0, slash);
        if (!part.empty()) {
            parts.push_back(part);
        }
        if (slash == std::string_view::npos) {
            break;
        }
        path.remove_prefix(slash + 1);
    }
    return parts;
}

} // namespace

void Router::addRoute(std::string method, const std::string& path, Handler handler) {
    RouteEntry entry;
    entry.method = upper(std::move(method));
    entry.handler = std::move(handler);
    for (auto part : splitPath(path)) {
        if (part.front() == ':') {
            entry.segments.push_back({std::string(part.substr(1)), true});
        } else {
            entry.segments.push_back({std::string(part), false});
        }
    }
    routes_.push_back(std::move(entry));
}

Router::Handler Router::resolve(const std::string& method,
                                const std::string& target,
                                std::unordered_map<std::string, std::string>& params) const {
    const auto normalized = upper(method);
    std::string_view path(target);
    path = path.substr(0, path.find('?'));
    const auto parts = splitPath(path);

    for (const auto& entry : routes_) {
        if (entry.method != normalized || entry.segments.size() != parts.size()) {
            continue;
        }
        std::unordered_map<std::string, std::string> captured;
        bool matched = true;
        for (std::size_t i = 0; i < parts.size() && matched; ++i) {
            const auto& segment = entry.segments[i];
            if (segment.capture) {
                captured.emplace(segment.text, std::string(parts[i]));
            } else {
                matched = segment.text == parts[i];
            }
        }
        if (matched) {
            params = std::move(captured);
            return entry.handler;
        }
    }
    return nullptr;
}

} // namespace resilink::server
