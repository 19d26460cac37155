#pragma once

/// @file source_config.hpp
/// @brief Per-source budgets and governor-wide failure policy.

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <string>

#include "sgov/foundation/config_manager.hpp"
#include "sgov/foundation/governor_result.hpp"

namespace sgov::governor {

/// Throughput and concurrency budget of one named source.
struct SourceConfig {
    /// Admissions allowed within any trailing windowDuration.
    uint32_t maxRequestsPerWindow = 60;

    /// Length of the sliding admission window.
    std::chrono::milliseconds windowDuration{60'000};

    /// Admitted-but-unreported calls allowed at once.
    uint32_t maxConcurrent = 5;

    /// Minimum spacing between consecutive admissions (0 disables).
    std::chrono::milliseconds minInterRequestDelay{0};

    /// Reject budgets the governor cannot honor.
    [[nodiscard]] foundation::GovernorResult<void> validate() const;

    bool operator==(const SourceConfig&) const = default;
};

/// Failure handling shared by every source.
struct GovernorPolicy {
    /// Backoff after the first consecutive failure; doubles per failure.
    std::chrono::milliseconds baseDelay{1'000};

    /// Ceiling for the doubled backoff (before the throttle multiplier).
    std::chrono::milliseconds maxDelay{60'000};

    /// Factor applied when the upstream explicitly throttled the call.
    uint32_t throttleMultiplier = 3;

    /// Status code that marks an explicit throttling response.
    int throttleStatusCode = 429;

    /// Consecutive failures that open the breaker.
    uint32_t tripThreshold = 5;

    /// Slack added when waiting for the oldest admission to leave the window.
    std::chrono::milliseconds windowSafetyMargin{100};

    [[nodiscard]] foundation::GovernorResult<void> validate() const;
};

/// Static source table keyed by source name (heterogeneous lookup).
using SourceTable = std::map<std::string, SourceConfig, std::less<>>;

/// Built-in budgets for the upstream data sources the pipelines call.
[[nodiscard]] SourceTable defaultSourceTable();

/// Read `governor.sources.<name>.*` from @p config.
///
/// Recognized keys per source: max_requests_per_window, window_ms,
/// max_concurrent, min_inter_request_delay_ms. Missing keys take the
/// SourceConfig defaults. If no `governor.sources` section exists the
/// built-in table is returned.
///
/// @return The table, or the first type-mismatch / validation error.
[[nodiscard]] foundation::GovernorResult<SourceTable>
loadSourceTable(const foundation::ConfigManager& config);

/// Read `governor.backoff.*`, `governor.breaker.*` and `governor.window.*`.
[[nodiscard]] foundation::GovernorResult<GovernorPolicy>
loadGovernorPolicy(const foundation::ConfigManager& config);

} // namespace sgov::governor
