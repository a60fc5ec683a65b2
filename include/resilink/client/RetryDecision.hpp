#pragma once

#include "resilink/core/RequestError.hpp"
#include "resilink/core/RetryPolicy.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace resilink::client {

// Network errors, 5xx, 429 and 408/409/423/424 are retried while
// retryCount < maxRetries.
bool shouldRetry(const core::RequestError& error, int retryCount, const core::RetryPolicy& policy);

// Delay before retry number `attempt`. A 429 carrying retry-after uses the
// server's value instead of the backoff.
std::chrono::milliseconds retryDelayFor(const core::RequestError& error, int attempt, const core::RetryPolicy& policy);

// Accepts delta-seconds or an IMF-fixdate such as "Wed, 21 Oct 2015 07:28:00 GMT".
std::optional<std::chrono::milliseconds> parseRetryAfter(const std::string& value,
                                                         std::chrono::system_clock::time_point now =
                                                             std::chrono::system_clock::now());

} // namespace resilink::client
