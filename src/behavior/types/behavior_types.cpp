/// @file behavior_types.cpp
/// @brief Name parsing for step kinds and seat areas.

#include "abp/behavior/behavior_types.hpp"

#include <string>

namespace abp::behavior {

using foundation::ErrorCode;
using foundation::PlannerError;
using foundation::PlannerResult;

PlannerResult<StepKind> ParseStepKind(std::string_view name) {
    for (auto kind : kAllStepKinds) {
        if (StepKindName(kind) == name) {
            return PlannerResult<StepKind>::ok(kind);
        }
    }
    return PlannerResult<StepKind>::err(
        PlannerError(ErrorCode::UnknownStepKind,
                     "unknown step kind: " + std::string(name)));
}

PlannerResult<StepKind> ParseWeightKey(std::string_view key) {
    for (auto kind : kAllStepKinds) {
        if (WeightKey(kind) == key) {
            return PlannerResult<StepKind>::ok(kind);
        }
    }
    return PlannerResult<StepKind>::err(
        PlannerError(ErrorCode::UnknownWeightKey,
                     "unknown weight key: " + std::string(key)));
}

PlannerResult<SeatArea> ParseSeatArea(std::string_view name) {
    for (auto area : kAllSeatAreas) {
        if (SeatAreaName(area) == name) {
            return PlannerResult<SeatArea>::ok(area);
        }
    }
    return PlannerResult<SeatArea>::err(
        PlannerError(ErrorCode::UnknownSeatArea,
                     "unknown seat area: " + std::string(name)));
}

PlannerResult<StepKind> ParseOverrideKind(std::string_view name) {
    auto kind = ParseStepKind(name);
    if (kind) {
        return kind;
    }
    return PlannerResult<StepKind>::err(
        PlannerError(ErrorCode::UnknownStepKind,
                     "rejected override command: '" + std::string(name) +
                         "' is not a known activity"));
}

}  // namespace abp::behavior
