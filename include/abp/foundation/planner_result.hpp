#pragma once

/// @file planner_result.hpp
/// @brief PlannerResult<T> alias for boundary operations.

#include "abp/core/result.hpp"
#include "abp/foundation/planner_error.hpp"

namespace abp::foundation {

/// Result specialized with PlannerError.
///
/// Example:
/// @code
///   PlannerResult<float> parseProbability(float p) {
///       if (p < 0.0f || p > 1.0f) {
///           return PlannerResult<float>::err(
///               PlannerError(ErrorCode::InvalidProbability, "out of [0,1]"));
///       }
///       return PlannerResult<float>::ok(p);
///   }
/// @endcode
template <typename T>
using PlannerResult = abp::Result<T, PlannerError>;

}  // namespace abp::foundation
