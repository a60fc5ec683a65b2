#pragma once

#include <map>
#include <string>
#include <string_view>
#include <unordered_map>

namespace resilink::util {

struct ParsedUrl {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target;
};

// Throws std::invalid_argument when the scheme is missing.
ParsedUrl parseUrl(const std::string& url);

std::string urlEncode(std::string_view value);
std::string urlDecode(std::string_view value);
std::unordered_map<std::string, std::string> parseQueryParameters(std::string_view target);

// Joins base URL, path and query. An absolute endpoint replaces the base URL.
std::string buildUrl(const std::string& baseUrl,
                     const std::string& endpoint,
                     const std::map<std::string, std::string>& params);

std::string base64Encode(std::string_view input);

} // namespace resilink::util
