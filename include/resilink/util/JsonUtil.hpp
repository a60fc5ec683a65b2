#pragma once

#include <boost/json.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace resilink::util {

boost::json::value parseJson(const std::string& payload);
std::string stringifyJson(const boost::json::value& value);

// Returns nullopt when the file is missing or empty. Throws on malformed JSON.
std::optional<boost::json::value> readJsonFile(const std::filesystem::path& path);

} // namespace resilink::util
