#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the source governor.

#include <cstdint>
#include <string_view>

namespace sgov::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), making it possible
/// to determine the error source from the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,

    // Logger (0x0800 - 0x08FF)
    LoggerError = 0x0800,
    LoggerNotInitialized = 0x0801,
    LoggerFlushFailed = 0x0802,

    // Governor (0x0900 - 0x09FF)
    SourceUnavailable = 0x0900,
    SourceNotConfigured = 0x0901,
    UpstreamFailure = 0x0902,
    UpstreamThrottled = 0x0903,
    AdmissionAbandoned = 0x0904,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0600: return "Config";
        case 0x0800: return "Logger";
        case 0x0900: return "Governor";
        default: return "Unknown";
    }
}

} // namespace sgov::foundation
