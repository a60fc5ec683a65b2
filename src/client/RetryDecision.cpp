#include "resilink/client/RetryDecision.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace resilink::client {
namespace {

std::string trim(const std::string& value) {
    const auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

} // namespace

bool shouldRetry(const core::RequestError& error, int retryCount, const core::RetryPolicy& policy) {
    if (retryCount >= policy.maxRetries) {
        return false;
    }
    const int status = error.status();
    if (status == 0) {
        return error.type() == core::RequestError::Type::transient_network;
    }
    if (status >= 500 || status == 429) {
        return true;
    }
    return status == 408 || status == 409 || status == 423 || status == 424;
}

std::chrono::milliseconds retryDelayFor(const core::RequestError& error, int attempt, const core::RetryPolicy& policy) {
    if (error.status() == 429) {
        if (auto retryAfter = error.retryAfter()) {
            return *retryAfter;
        }
    }
    return core::computeRetryDelay(policy, attempt);
}

std::optional<std::chrono::milliseconds> parseRetryAfter(const std::string& value,
                                                         std::chrono::system_clock::time_point now) {
    const auto trimmed = trim(value);
    if (trimmed.empty()) {
        return std::nullopt;
    }
    if (std::all_of(trimmed.begin(), trimmed.end(), [](unsigned char c) { return std::isdigit(c); })) {
        try {
            return std::chrono::milliseconds(std::stoll(trimmed) * 1000);
        } catch (const std::out_of_range&) {
            return std::nullopt;
        }
    }

    std::tm tm{};
    std::istringstream stream(trimmed);
    stream.imbue(std::locale::classic());
    stream >> std::get_time(&tm, "%a, %d %b %Y %H:%M:%S");
    if (stream.fail()) {
        return std::nullopt;
    }
#if defined(_WIN32)
    const std::time_t epoch = _mkgmtime(&tm);
#else
    const std::time_t epoch = timegm(&tm);
#endif
    if (epoch == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    const auto at = std::chrono::system_clock::from_time_t(epoch);
    const auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(at - now);
    return std::max(wait, std::chrono::milliseconds::zero());
}

} // namespace resilink::client
