#pragma once

/// @file logger_adapter.hpp
/// @brief Aggregate header for logging.
///
/// Integrates kcenon's common_system logger interface for category-filtered
/// structured logging.

#include "sgov/foundation/governor_logger.hpp"
