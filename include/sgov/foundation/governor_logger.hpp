#pragma once

/// @file governor_logger.hpp
/// @brief GovernorLogger wrapping kcenon logger_system for structured logging.
///
/// Provides category-based filtering, structured logging with context,
/// and per-category runtime log level control.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "sgov/foundation/governor_result.hpp"

namespace sgov::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally:
///   Trace -> trace, Debug -> debug, Info -> info, Warning -> warning,
///   Error -> error, Critical -> critical, Off -> off
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Log categories for structured filtering.
enum class LogCategory : uint8_t {
    Core      = 0, ///< Lifecycle, registry and caller contract violations
    Admission = 1, ///< Concurrency and sliding-window waits
    Backoff   = 2, ///< Failure reports and backoff waits
    Breaker   = 3, ///< Breaker trips, recoveries and fast-fail rejections
    Config    = 4  ///< Configuration loading
};

/// Total number of log categories.
inline constexpr std::size_t kLogCategoryCount = 5;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Admission", "Backoff", "Breaker", "Config"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Structured context data attached to log entries.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.source = "helius";
///   ctx.statusCode = 429;
///   ctx.extra["backoff_ms"] = "3000";
///   logger.logWithContext(LogLevel::Warning, LogCategory::Backoff,
///                         "Upstream failure reported", ctx);
/// @endcode
struct LogContext {
    std::optional<std::string> source;
    std::optional<int> statusCode;
    std::optional<std::string> traceId;
    std::unordered_map<std::string, std::string> extra;
};

/// Logger wrapping kcenon's logging system.
///
/// Uses PIMPL to hide kcenon implementation details from the public API.
///
/// Default log levels per category:
/// | Category  | Default Level |
/// |-----------|---------------|
/// | Core      | Info          |
/// | Admission | Info          |
/// | Backoff   | Info          |
/// | Breaker   | Debug         |
/// | Config    | Info          |
class GovernorLogger {
public:
    GovernorLogger();
    ~GovernorLogger();

    // Non-copyable, movable.
    GovernorLogger(const GovernorLogger&) = delete;
    GovernorLogger& operator=(const GovernorLogger&) = delete;
    GovernorLogger(GovernorLogger&&) noexcept;
    GovernorLogger& operator=(GovernorLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context data appended as key-value pairs.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush all buffered log messages.
    GovernorResult<void> flush();

    /// Process-wide logger instance.
    static GovernorLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace sgov::foundation

// ---------------------------------------------------------------------------
// Convenience macros (outside the namespace; macros are global)
// ---------------------------------------------------------------------------

/// @name SGOV_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// SGOV_MIN_LOG_LEVEL can be defined before including this header to
/// eliminate logging calls below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
/// @{

#ifndef SGOV_MIN_LOG_LEVEL
    #define SGOV_MIN_LOG_LEVEL 0
#endif

#define SGOV_LOG(level, cat, msg)                                                      \
    do {                                                                               \
        _Pragma("GCC diagnostic push")                                                 \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                            \
        if (static_cast<int>(level) >= SGOV_MIN_LOG_LEVEL &&                           \
            ::sgov::foundation::GovernorLogger::instance().isEnabled((level), (cat)))  \
        {                                                                              \
            ::sgov::foundation::GovernorLogger::instance().log((level), (cat), (msg)); \
        }                                                                              \
        _Pragma("GCC diagnostic pop")                                                  \
    } while (0)

#define SGOV_LOG_DEBUG(cat, msg) \
    SGOV_LOG(::sgov::foundation::LogLevel::Debug, (cat), (msg))

#define SGOV_LOG_INFO(cat, msg) \
    SGOV_LOG(::sgov::foundation::LogLevel::Info, (cat), (msg))

#define SGOV_LOG_WARN(cat, msg) \
    SGOV_LOG(::sgov::foundation::LogLevel::Warning, (cat), (msg))

#define SGOV_LOG_ERROR(cat, msg) \
    SGOV_LOG(::sgov::foundation::LogLevel::Error, (cat), (msg))

/// @}
