#pragma once

#include <chrono>

namespace resilink::core {

struct RetryPolicy {
    int maxRetries{3};
    std::chrono::milliseconds baseDelay{1000};
    std::chrono::milliseconds maxDelay{30000};
    double backoffMultiplier{2.0};
};

// min(baseDelay * multiplier^(attempt - 1), maxDelay); attempt counts from 1.
std::chrono::milliseconds computeRetryDelay(const RetryPolicy& policy, int attempt);

} // namespace resilink::core
