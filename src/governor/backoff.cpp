/// @file backoff.cpp
/// @brief computeBackoff implementation.

#include "sgov/governor/backoff.hpp"

#include <algorithm>

namespace sgov::governor {

bool isThrottled(const GovernorPolicy& policy,
                 std::optional<int> statusCode) noexcept {
    return statusCode.has_value() && *statusCode == policy.throttleStatusCode;
}

std::chrono::milliseconds computeBackoff(const GovernorPolicy& policy,
                                         uint32_t consecutiveFailures,
                                         std::optional<int> statusCode) {
    if (consecutiveFailures == 0) {
        return std::chrono::milliseconds::zero();
    }

    // Double until the ceiling is reached; never shifts past it.
    auto delay = policy.baseDelay;
    for (uint32_t i = 1; i < consecutiveFailures && delay < policy.maxDelay; ++i) {
        delay *= 2;
    }
    delay = std::min(delay, policy.maxDelay);

    if (isThrottled(policy, statusCode)) {
        delay *= policy.throttleMultiplier;
    }
    return delay;
}

} // namespace sgov::governor
