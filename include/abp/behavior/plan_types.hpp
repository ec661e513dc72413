#pragma once

/// @file plan_types.hpp
/// @brief Plan data model: steps, generated and overridden plans, and the
///        availability snapshot consulted during generation.

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "abp/behavior/behavior_catalog.hpp"
#include "abp/behavior/behavior_types.hpp"

namespace abp::behavior {

/// Ground-plane position resolved by the movement collaborator.
struct Position {
    float x = 0.0f;
    float z = 0.0f;

    constexpr bool operator==(const Position&) const = default;
};

/// Presentation hints applied once the entity reaches its target.
struct ArrivalCue {
    std::optional<std::string> animation;
    std::optional<float> rotation;  ///< Facing angle in radians.
    std::optional<float> height;    ///< Vertical offset, e.g. seat height.

    bool operator==(const ArrivalCue&) const = default;
};

/// One scheduled activity.
///
/// kind, duration and seatArea are fixed at generation; target, cue and
/// seatIndex are filled in lazily by the caller the first time the step
/// becomes current.
struct PlanStep {
    StepKind kind = StepKind::Wander;
    StepDuration duration = StepDuration::Finite(0.0f);
    std::optional<Position> target;
    ArrivalCue arrivalCue;
    std::optional<SeatArea> seatArea;
    std::optional<uint32_t> seatIndex;

    bool operator==(const PlanStep&) const = default;
};

/// Multi-step plan produced by the generator.
///
/// steps is never empty; currentIndex is valid while the plan is active.
struct GeneratedPlan {
    std::vector<PlanStep> steps;
    std::size_t currentIndex = 0;
    bool paused = false;
    std::optional<float> arrivalTime;

    bool operator==(const GeneratedPlan&) const = default;
};

/// Single step forced by an operator command.
///
/// Carries no pause state: conversations and stage performances do not
/// affect it until it completes.
struct OverriddenPlan {
    PlanStep step;
    std::optional<float> arrivalTime;

    bool operator==(const OverriddenPlan&) const = default;
};

/// Plan held by an executor.
using Plan = std::variant<GeneratedPlan, OverriddenPlan>;

/// Point-in-time view of shared-resource usage.
struct AvailabilitySnapshot {
    bool stageOccupied = false;
    std::array<uint32_t, kSeatAreaCount> seatOccupancy{};

    [[nodiscard]] uint32_t Occupancy(SeatArea area) const noexcept {
        return seatOccupancy[ToIndex(area)];
    }

    void SetOccupancy(SeatArea area, uint32_t count) noexcept {
        seatOccupancy[ToIndex(area)] = count;
    }
};

/// Supplier of availability snapshots, queried each time a plan is built.
class IAvailabilitySource {
public:
    virtual ~IAvailabilitySource() = default;

    [[nodiscard]] virtual AvailabilitySnapshot Snapshot() const = 0;
};

}  // namespace abp::behavior
