#include "resilink/queue/QueuedRequest.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace resilink::queue {

const char* toString(Priority priority) {
    switch (priority) {
    case Priority::low: return "low";
    case Priority::medium: return "medium";
    case Priority::high: return "high";
    case Priority::critical: return "critical";
    }
    return "medium";
}

Priority parsePriority(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lower == "low") return Priority::low;
    if (lower == "high") return Priority::high;
    if (lower == "critical") return Priority::critical;
    return Priority::medium;
}

} // namespace resilink::queue
