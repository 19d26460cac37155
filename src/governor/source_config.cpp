/// @file source_config.cpp
/// @brief SourceConfig validation, built-in table and YAML loading.

#include "sgov/governor/source_config.hpp"

#include <string_view>

#include "sgov/foundation/governor_logger.hpp"

namespace sgov::governor {

using foundation::ConfigManager;
using foundation::ErrorCode;
using foundation::GovernorError;
using foundation::GovernorResult;

namespace {

constexpr std::string_view kSourcesPrefix = "governor.sources";

GovernorResult<void> invalid(std::string message) {
    return GovernorResult<void>::err(
        GovernorError(ErrorCode::InvalidArgument, std::move(message)));
}

/// Overwrite @p target with the value under @p key when present.
/// Absent keys leave @p target untouched; a present key of the wrong type
/// is an error.
template <typename T>
GovernorResult<void> readOptional(const ConfigManager& config,
                                  const std::string& key, T& target) {
    if (!config.hasKey(key)) {
        return GovernorResult<void>::ok();
    }
    auto value = config.get<T>(key);
    if (!value) {
        return GovernorResult<void>::err(value.error());
    }
    target = value.value();
    return GovernorResult<void>::ok();
}

GovernorResult<void> readMillis(const ConfigManager& config,
                                const std::string& key,
                                std::chrono::milliseconds& target) {
    auto raw = static_cast<int64_t>(target.count());
    auto read = readOptional(config, key, raw);
    if (!read) {
        return read;
    }
    target = std::chrono::milliseconds(raw);
    return GovernorResult<void>::ok();
}

} // namespace

GovernorResult<void> SourceConfig::validate() const {
    if (maxRequestsPerWindow == 0) {
        return invalid("max_requests_per_window must be at least 1");
    }
    if (windowDuration <= std::chrono::milliseconds::zero()) {
        return invalid("window duration must be positive");
    }
    if (maxConcurrent == 0) {
        return invalid("max_concurrent must be at least 1");
    }
    if (minInterRequestDelay < std::chrono::milliseconds::zero()) {
        return invalid("min_inter_request_delay must not be negative");
    }
    return GovernorResult<void>::ok();
}

GovernorResult<void> GovernorPolicy::validate() const {
    if (baseDelay < std::chrono::milliseconds::zero() || maxDelay < baseDelay) {
        return invalid("backoff delays must satisfy 0 <= base <= max");
    }
    if (throttleMultiplier == 0) {
        return invalid("throttle_multiplier must be at least 1");
    }
    if (tripThreshold == 0) {
        return invalid("trip_threshold must be at least 1");
    }
    if (windowSafetyMargin < std::chrono::milliseconds::zero()) {
        return invalid("window safety margin must not be negative");
    }
    return GovernorResult<void>::ok();
}

SourceTable defaultSourceTable() {
    using std::chrono::milliseconds;
    constexpr milliseconds kMinute{60'000};
    constexpr milliseconds kNoDelay{0};

    return SourceTable{
        {"reddit",              {60,  kMinute, 10, kNoDelay}},
        {"dexscreener",         {30,  kMinute, 5,  kNoDelay}},
        {"pumpfun",             {20,  kMinute, 5,  kNoDelay}},
        {"jupiter",             {30,  kMinute, 3,  kNoDelay}},
        {"helius",              {50,  kMinute, 1,  milliseconds(350)}},
        {"googletrends",        {10,  kMinute, 5,  kNoDelay}},
        {"goplus",              {30,  kMinute, 5,  kNoDelay}},
        {"heliusws",            {100, kMinute, 10, kNoDelay}},
        {"pumpfunlaunch",       {10,  kMinute, 5,  kNoDelay}},
        {"dexscreenertrending", {30,  kMinute, 5,  kNoDelay}},
        {"jupitertrending",     {20,  kMinute, 5,  kNoDelay}},
        {"telegram",            {30,  kMinute, 5,  kNoDelay}},
    };
}

GovernorResult<SourceTable> loadSourceTable(const ConfigManager& config) {
    auto names = config.childKeys(kSourcesPrefix);
    if (names.empty()) {
        SGOV_LOG_INFO(foundation::LogCategory::Config,
                      "No governor.sources section; using built-in source table");
        return GovernorResult<SourceTable>::ok(defaultSourceTable());
    }

    SourceTable table;
    for (const auto& name : names) {
        auto base = std::string(kSourcesPrefix) + "." + name + ".";
        SourceConfig source;

        auto maxRequests = readOptional(config, base + "max_requests_per_window",
                                        source.maxRequestsPerWindow);
        auto window = readMillis(config, base + "window_ms", source.windowDuration);
        auto maxConcurrent = readOptional(config, base + "max_concurrent",
                                          source.maxConcurrent);
        auto delay = readMillis(config, base + "min_inter_request_delay_ms",
                                source.minInterRequestDelay);

        for (auto* step : {&maxRequests, &window, &maxConcurrent, &delay}) {
            if (!*step) {
                return GovernorResult<SourceTable>::err(step->error());
            }
        }

        auto valid = source.validate();
        if (!valid) {
            return GovernorResult<SourceTable>::err(GovernorError(
                ErrorCode::InvalidArgument,
                "source '" + name + "': " + std::string(valid.error().message())));
        }
        table.emplace(name, source);
    }
    return GovernorResult<SourceTable>::ok(std::move(table));
}

GovernorResult<GovernorPolicy> loadGovernorPolicy(const ConfigManager& config) {
    GovernorPolicy policy;

    auto steps = {
        readMillis(config, "governor.backoff.base_delay_ms", policy.baseDelay),
        readMillis(config, "governor.backoff.max_delay_ms", policy.maxDelay),
        readOptional(config, "governor.backoff.throttle_multiplier",
                     policy.throttleMultiplier),
        readOptional(config, "governor.backoff.throttle_status_code",
                     policy.throttleStatusCode),
        readOptional(config, "governor.breaker.trip_threshold", policy.tripThreshold),
        readMillis(config, "governor.window.safety_margin_ms",
                   policy.windowSafetyMargin),
    };
    for (const auto& step : steps) {
        if (!step) {
            return GovernorResult<GovernorPolicy>::err(step.error());
        }
    }

    auto valid = policy.validate();
    if (!valid) {
        return GovernorResult<GovernorPolicy>::err(valid.error());
    }
    return GovernorResult<GovernorPolicy>::ok(policy);
}

} // namespace sgov::governor
