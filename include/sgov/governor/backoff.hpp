#pragma once

/// @file backoff.hpp
/// @brief Exponential backoff delay computation.

#include <chrono>
#include <cstdint>
#include <optional>

#include "sgov/governor/source_config.hpp"

namespace sgov::governor {

/// Delay imposed after the @p consecutiveFailures-th failure in a row.
///
/// `min(baseDelay * 2^(n-1), maxDelay)`, multiplied by
/// `throttleMultiplier` when @p statusCode equals the policy's throttling
/// status. Returns zero for n == 0. Large n saturates at maxDelay.
///
/// | n | delay (defaults) | throttled |
/// |---|------------------|-----------|
/// | 1 | 1s               | 3s        |
/// | 3 | 4s               | 12s       |
/// | 7 | 60s              | 180s      |
[[nodiscard]] std::chrono::milliseconds
computeBackoff(const GovernorPolicy& policy, uint32_t consecutiveFailures,
               std::optional<int> statusCode = std::nullopt);

/// True if @p statusCode marks an explicit throttling response.
[[nodiscard]] bool isThrottled(const GovernorPolicy& policy,
                               std::optional<int> statusCode) noexcept;

} // namespace sgov::governor
