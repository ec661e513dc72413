#pragma once

/// @file abp.hpp
/// @brief Umbrella header for the ambient behavior planner.

#include "abp/version.hpp"

#include "abp/core/result.hpp"

#include "abp/foundation/common_adapter.hpp"
#include "abp/foundation/logger_adapter.hpp"

#include "abp/behavior/behavior_catalog.hpp"
#include "abp/behavior/behavior_controller.hpp"
#include "abp/behavior/behavior_types.hpp"
#include "abp/behavior/plan_executor.hpp"
#include "abp/behavior/plan_generator.hpp"
#include "abp/behavior/plan_types.hpp"
#include "abp/behavior/random.hpp"

#include "abp/world/seat_board.hpp"
