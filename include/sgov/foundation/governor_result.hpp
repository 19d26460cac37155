#pragma once

/// @file governor_result.hpp
/// @brief GovernorResult<T> type alias for governor error handling.

#include "sgov/core/result.hpp"
#include "sgov/foundation/governor_error.hpp"

namespace sgov::foundation {

/// Result type specialized with GovernorError.
///
/// Example:
/// @code
///   GovernorResult<std::chrono::milliseconds> parseWindow(int64_t ms) {
///       if (ms <= 0) {
///           return GovernorResult<std::chrono::milliseconds>::err(
///               GovernorError(ErrorCode::InvalidArgument, "window must be positive"));
///       }
///       return GovernorResult<std::chrono::milliseconds>::ok(
///           std::chrono::milliseconds(ms));
///   }
/// @endcode
template <typename T>
using GovernorResult = sgov::Result<T, GovernorError>;

}  // namespace sgov::foundation
