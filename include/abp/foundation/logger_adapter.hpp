#pragma once

/// @file logger_adapter.hpp
/// @brief Aggregate header for planner logging on kcenon common_system.

#include "abp/foundation/planner_logger.hpp"
