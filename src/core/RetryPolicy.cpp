#include "resilink/core/RetryPolicy.hpp"

#include <algorithm>
#include <cmath>

namespace resilink::core {

std::chrono::milliseconds computeRetryDelay(const RetryPolicy& policy, int attempt) {
    const int exponent = std::max(attempt, 1) - 1;
    const double scaled = static_cast<double>(policy.baseDelay.count()) * std::pow(policy.backoffMultiplier, exponent);
    const double capped = std::min(scaled, static_cast<double>(policy.maxDelay.count()));
    return std::chrono::milliseconds(static_cast<long long>(std::max(capped, 0.0)));
}

} // namespace resilink::core
