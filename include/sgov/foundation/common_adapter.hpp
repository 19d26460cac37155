#pragma once

/// @file common_adapter.hpp
/// @brief Aggregate header for the foundation layer.
///
/// Provides the error taxonomy, Result aliases, the time source and
/// configuration management.

#include "sgov/foundation/clock.hpp"
#include "sgov/foundation/config_manager.hpp"
#include "sgov/foundation/error_code.hpp"
#include "sgov/foundation/governor_error.hpp"
#include "sgov/foundation/governor_result.hpp"
