#pragma once

#include "resilink/core/RequestError.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace resilink::queue {

enum class Priority {
    low = 1,
    medium = 2,
    high = 3,
    critical = 4
};

const char* toString(Priority priority);
// Unknown names map to medium.
Priority parsePriority(std::string_view name);

struct RequestOptions {
    Priority priority{Priority::medium};
    std::map<std::string, std::string> params;
    core::HeaderMap headers;
    std::optional<int> maxRetries;
    std::optional<std::chrono::milliseconds> timeout;
};

struct QueuedRequest {
    using Clock = std::chrono::steady_clock;

    std::string id;
    Priority priority{Priority::medium};
    std::string provider;
    std::string endpoint;
    std::map<std::string, std::string> params;
    core::HeaderMap headers;
    int retryCount{};
    int maxRetries{3};
    std::optional<std::chrono::milliseconds> timeout;
    Clock::time_point createdAt{};
    Clock::time_point scheduledAt{};
    std::optional<Clock::time_point> executedAt;
    std::optional<Clock::time_point> completedAt;
    // Enqueue order within the process; breaks priority ties.
    std::uint64_t sequence{};
};

// Executors receive a copy and must eventually report back to the queue
// with completeRequest or failRequest for the same id.
class RequestExecutor {
public:
    virtual ~RequestExecutor() = default;

    virtual void execute(const QueuedRequest& request) = 0;
};

} // namespace resilink::queue
