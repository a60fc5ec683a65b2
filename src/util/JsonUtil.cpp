#include "resilink/util/JsonUtil.hpp"

#include <fstream>
#include <iterator>

namespace resilink::util {

boost::json::value parseJson(const std::string& payload) {
    return boost::json::parse(payload);
}

std::string stringifyJson(const boost::json::value& value) {
    return boost::json::serialize(value);
}

std::optional<boost::json::value> readJsonFile(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return std::nullopt;
    }
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        return std::nullopt;
    }
    std::string content((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    if (content.empty()) {
        return std::nullopt;
    }
    return parseJson(content);
}

} // namespace resilink::util
