#pragma once

/// @file common_adapter.hpp
/// @brief Aggregate header for error types, Result aliases, IDs and configuration.

#include "abp/foundation/config_manager.hpp"
#include "abp/foundation/error_code.hpp"
#include "abp/foundation/planner_error.hpp"
#include "abp/foundation/planner_result.hpp"
#include "abp/foundation/types.hpp"
