#pragma once

#include <boost/json.hpp>

#include <chrono>
#include <string>
#include <string_view>

namespace resilink::util {

// UTC with millisecond precision, e.g. 2024-03-01T12:00:00.250Z.
std::string formatIsoTimestamp(std::chrono::system_clock::time_point timePoint);

// Wraps an ops response body. Statuses below 400 yield
// {success: true, timestamp, path, data}; the rest yield
// {success: false, timestamp, path, error: {message, details}} where the
// body's "message" field is lifted out and any remaining fields become details.
boost::json::object makeEnvelope(unsigned status, const boost::json::value& body, std::string_view path);

} // namespace resilink::util
