#include "resilink/util/UrlUtil.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace resilink::util {

ParsedUrl parseUrl(const std::string& url) {
    ParsedUrl parsed;
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        throw std::invalid_argument("URL missing scheme: " + url);
    }
    parsed.scheme = url.substr(0, schemeEnd);
    std::transform(parsed.scheme.begin(), parsed.scheme.end(), parsed.scheme.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    auto hostStart = schemeEnd + 3;
    auto pathPos = url.find_first_of("/?", hostStart);
    std::string hostPort = pathPos == std::string::npos ? url.substr(hostStart) : url.substr(hostStart, pathPos - hostStart);
    if (auto at = hostPort.rfind('@'); at != std::string::npos) {
        hostPort = hostPort.substr(at + 1);
    }
    auto colonPos = hostPort.find(':');
    if (colonPos == std::string::npos) {
        parsed.host = hostPort;
        parsed.port = (parsed.scheme == "https") ? "443" : "80";
    } else {
        parsed.host = hostPort.substr(0, colonPos);
        parsed.port = hostPort.substr(colonPos + 1);
    }
    parsed.target = pathPos == std::string::npos ? "/" : url.substr(pathPos);
    if (parsed.target.empty()) {
        parsed.target = "/";
    } else if (parsed.target.front() == '?') {
        parsed.target.insert(parsed.target.begin(), '/');
    }
    return parsed;
}

std::string urlEncode(std::string_view value) {
    std::ostringstream oss;
    oss << std::uppercase << std::hex;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            oss << static_cast<char>(c);
        } else {
            oss << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return oss.str();
}

std::string urlDecode(std::string_view value) {
    std::string result;
    result.reserve(value.size());
    for (std::size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (c == '+') {
            result.push_back(' ');
        } else if (c == '%' && i + 2 < value.size()) {
            std::string hex(value.substr(i + 1, 2));
            result.push_back(static_cast<char>(std::strtol(hex.c_str(), nullptr, 16)));
            i += 2;
        } else {
            result.push_back(c);
        }
    }
    return result;
}

std::unordered_map<std::string, std::string> parseQueryParameters(std::string_view target) {
    std::unordered_map<std::string, std::string> params;
    auto pos = target.find('?');
    if (pos == std::string_view::npos) {
        return params;
    }
    auto query = target.substr(pos + 1);
    std::size_t start = 0;
    while (start < query.size()) {
        auto end = query.find('&', start);
        if (end == std::string_view::npos) {
            end = query.size();
        }
        auto token = query.substr(start, end - start);
        auto eq = token.find('=');
        if (eq != std::string_view::npos) {
            params.emplace(urlDecode(token.substr(0, eq)), urlDecode(token.substr(eq + 1)));
        } else if (!token.empty()) {
            params.emplace(urlDecode(token), "");
        }
        start = end + 1;
    }
    return params;
}

std::string buildUrl(const std::string& baseUrl,
                     const std::string& endpoint,
                     const std::map<std::string, std::string>& params) {
    std::string url;
    if (endpoint.rfind("http://", 0) == 0 || endpoint.rfind("https://", 0) == 0) {
        url = endpoint;
    } else {
        url = baseUrl;
        if (!endpoint.empty()) {
            bool baseSlash = !url.empty() && url.back() == '/';
            bool endpointSlash = endpoint.front() == '/';
            if (baseSlash && endpointSlash) {
                url.pop_back();
            } else if (!baseSlash && !endpointSlash) {
                url.push_back('/');
            }
            url += endpoint;
        }
    }

    bool hasQuery = url.find('?') != std::string::npos;
    for (const auto& [key, value] : params) {
        url += hasQuery ? '&' : '?';
        hasQuery = true;
        url += urlEncode(key);
        url.push_back('=');
        url += urlEncode(value);
    }
    return url;
}

std::string base64Encode(std::string_view input) {
    static constexpr char alphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string output;
    output.reserve(((input.size() + 2) / 3) * 4);

    std::uint32_t value = 0;
    int bitCount = -6;
    for (unsigned char c : input) {
        value = (value << 8) | c;
        bitCount += 8;
        while (bitCount >= 0) {
            output.push_back(alphabet[(value >> bitCount) & 0x3F]);
            bitCount -= 6;
        }
    }

    if (bitCount > -6) {
        output.push_back(alphabet[((value << 8) >> (bitCount + 8)) & 0x3F]);
    }
    while (output.size() % 4 != 0) {
        output.push_back('=');
    }
    return output;
}

} // namespace resilink::util
