#include "resilink/util/JsonResponse.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace resilink::util {

std::string formatIsoTimestamp(std::chrono::system_clock::time_point timePoint) {
    const auto seconds = std::chrono::floor<std::chrono::seconds>(timePoint);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(timePoint - seconds).count();
    const std::time_t time = std::chrono::system_clock::to_time_t(seconds);
    std::tm tm{};
    gmtime_r(&time, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return oss.str();
}

boost::json::object makeEnvelope(unsigned status, const boost::json::value& body, std::string_view path) {
    boost::json::object envelope;
    envelope["success"] = status < 400;
    envelope["timestamp"] = formatIsoTimestamp(std::chrono::system_clock::now());
    if (!path.empty()) {
        envelope["path"] = path;
    }

    if (status < 400) {
        envelope["data"] = body;
        return envelope;
    }

    boost::json::object error;
    if (body.is_object()) {
        auto details = body.as_object();
        if (auto message = details.if_contains("message"); message && message->is_string()) {
            error["message"] = message->as_string();
            details.erase("message");
        }
        if (!details.empty()) {
            error["details"] = std::move(details);
        }
    } else if (!body.is_null()) {
        error["details"] = body;
    }
    envelope["error"] = std::move(error);
    return envelope;
}

} // namespace resilink::util
