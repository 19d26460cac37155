#pragma once

/// @file governor_error.hpp
/// @brief Error type used with Result<T, GovernorError>.

#include <any>
#include <string>
#include <string_view>
#include <utility>

#include "sgov/foundation/error_code.hpp"

namespace sgov::foundation {

/// Error carrying a categorized code, a human-readable message,
/// and optional type-erased context.
///
/// Collaborators that fail an upstream call attach the observed HTTP
/// status as `int` context so the governor can tell throttling apart
/// from other failures.
class GovernorError {
public:
    GovernorError() = default;

    explicit GovernorError(ErrorCode code)
        : code_(code) {}

    GovernorError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    GovernorError(ErrorCode code, std::string message, std::any context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// The subsystem that produced this error.
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// Access typed context data (returns nullptr if type mismatch or empty).
    template <typename T>
    [[nodiscard]] const T* context() const noexcept {
        return std::any_cast<T>(&context_);
    }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

    [[nodiscard]] bool isSuccess() const noexcept {
        return code_ == ErrorCode::Success;
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::any context_;
};

} // namespace sgov::foundation
