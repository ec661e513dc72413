#pragma once

/// @file behavior_types.hpp
/// @brief Step kinds, seat areas and the fixed mappings between them.
///
/// All mappings are exhaustive switches over the enums so that adding a
/// kind without updating a table is caught by -Wswitch.

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

#include "abp/foundation/planner_result.hpp"

namespace abp::behavior {

/// Default inclusive bounds for the number of steps in a generated plan.
constexpr uint32_t kDefaultMinPlanSteps = 2;
constexpr uint32_t kDefaultMaxPlanSteps = 5;

/// Chance that an entity drops its plan to watch a newly started performance.
constexpr float kDefaultStageReactionProbability = 0.6f;

/// Behavior category an entity can be assigned.
enum class StepKind : uint8_t {
    ReturnToStation,    ///< Walk back to the entity's own workstation.
    VisitKitchen,       ///< Take a kitchen seat.
    SitOnCouch,         ///< Take a lounge couch seat.
    VisitBreakRoom,     ///< Take a break-room seat.
    PlayPoker,          ///< Take a poker-table seat.
    PerformOnStage,     ///< Occupy the stage as performer.
    WatchStage,         ///< Stand in the audience area.
    Wander,             ///< Walk to a random clear spot.
    CheckOnWorker,      ///< Visit another entity's station.
    Present,            ///< Present beside the stage.
    WalkInCircle,       ///< Pace around the floor centre.
    PlayOutdoorSportA,  ///< Pickleball court.
    PlayOutdoorSportB,  ///< Golf green.
    SitOutdoors         ///< Outdoor bench.
};

inline constexpr std::size_t kStepKindCount = 14;

/// Every step kind in declaration order.
inline constexpr std::array<StepKind, kStepKindCount> kAllStepKinds = {
    StepKind::ReturnToStation, StepKind::VisitKitchen,   StepKind::SitOnCouch,
    StepKind::VisitBreakRoom,  StepKind::PlayPoker,      StepKind::PerformOnStage,
    StepKind::WatchStage,      StepKind::Wander,         StepKind::CheckOnWorker,
    StepKind::Present,         StepKind::WalkInCircle,   StepKind::PlayOutdoorSportA,
    StepKind::PlayOutdoorSportB, StepKind::SitOutdoors
};

/// Capacity-limited shared area.
enum class SeatArea : uint8_t {
    Kitchen,
    Couch,
    BreakRoom,
    PokerTable
};

inline constexpr std::size_t kSeatAreaCount = 4;

inline constexpr std::array<SeatArea, kSeatAreaCount> kAllSeatAreas = {
    SeatArea::Kitchen, SeatArea::Couch, SeatArea::BreakRoom, SeatArea::PokerTable
};

[[nodiscard]] constexpr std::size_t ToIndex(StepKind kind) noexcept {
    return static_cast<std::size_t>(kind);
}

[[nodiscard]] constexpr std::size_t ToIndex(SeatArea area) noexcept {
    return static_cast<std::size_t>(area);
}

/// Stable external name of a step kind (used for commands and config).
[[nodiscard]] constexpr std::string_view StepKindName(StepKind kind) noexcept {
    switch (kind) {
        case StepKind::ReturnToStation:   return "go_to_workstation";
        case StepKind::VisitKitchen:      return "go_to_kitchen";
        case StepKind::SitOnCouch:        return "go_to_couch";
        case StepKind::VisitBreakRoom:    return "go_to_break_room";
        case StepKind::PlayPoker:         return "go_to_poker_table";
        case StepKind::PerformOnStage:    return "go_to_stage";
        case StepKind::WatchStage:        return "watch_stage";
        case StepKind::Wander:            return "wander";
        case StepKind::CheckOnWorker:     return "check_agent";
        case StepKind::Present:           return "present";
        case StepKind::WalkInCircle:      return "walk_circle";
        case StepKind::PlayOutdoorSportA: return "go_to_pickleball";
        case StepKind::PlayOutdoorSportB: return "go_to_golf";
        case StepKind::SitOutdoors:       return "sit_outdoor";
    }
    return "unknown";
}

/// Key under which an archetype's weight for @p kind is configured.
[[nodiscard]] constexpr std::string_view WeightKey(StepKind kind) noexcept {
    switch (kind) {
        case StepKind::ReturnToStation:   return "workstation";
        case StepKind::VisitKitchen:      return "kitchen";
        case StepKind::SitOnCouch:        return "couch";
        case StepKind::VisitBreakRoom:    return "break_room";
        case StepKind::PlayPoker:         return "poker_table";
        case StepKind::PerformOnStage:    return "stage";
        case StepKind::WatchStage:        return "watch_stage";
        case StepKind::Wander:            return "wander";
        case StepKind::CheckOnWorker:     return "check_agent";
        case StepKind::Present:           return "present";
        case StepKind::WalkInCircle:      return "walk_circle";
        case StepKind::PlayOutdoorSportA: return "pickleball";
        case StepKind::PlayOutdoorSportB: return "golf";
        case StepKind::SitOutdoors:       return "sit_outdoor";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::string_view SeatAreaName(SeatArea area) noexcept {
    switch (area) {
        case SeatArea::Kitchen:    return "kitchen";
        case SeatArea::Couch:      return "couch";
        case SeatArea::BreakRoom:  return "break_room";
        case SeatArea::PokerTable: return "poker_table";
    }
    return "unknown";
}

/// Shared area a step kind occupies, if it is capacity-limited.
[[nodiscard]] constexpr std::optional<SeatArea> SeatAreaFor(StepKind kind) noexcept {
    switch (kind) {
        case StepKind::VisitKitchen:   return SeatArea::Kitchen;
        case StepKind::SitOnCouch:     return SeatArea::Couch;
        case StepKind::VisitBreakRoom: return SeatArea::BreakRoom;
        case StepKind::PlayPoker:      return SeatArea::PokerTable;
        case StepKind::ReturnToStation:
        case StepKind::PerformOnStage:
        case StepKind::WatchStage:
        case StepKind::Wander:
        case StepKind::CheckOnWorker:
        case StepKind::Present:
        case StepKind::WalkInCircle:
        case StepKind::PlayOutdoorSportA:
        case StepKind::PlayOutdoorSportB:
        case StepKind::SitOutdoors:
            return std::nullopt;
    }
    return std::nullopt;
}

/// Outdoor kinds are exempt from indoor obstacle checks in movement.
[[nodiscard]] constexpr bool IsOutdoor(StepKind kind) noexcept {
    return kind == StepKind::PlayOutdoorSportA || kind == StepKind::PlayOutdoorSportB ||
           kind == StepKind::SitOutdoors;
}

/// Display category describing what an entity is thinking about.
[[nodiscard]] constexpr std::string_view ThoughtKey(StepKind kind) noexcept {
    switch (kind) {
        case StepKind::CheckOnWorker:     return "talking_to_agent";
        case StepKind::Present:           return "presenting";
        case StepKind::VisitKitchen:      return "visiting_kitchen";
        case StepKind::WatchStage:        return "watching_stage";
        case StepKind::PerformOnStage:    return "performing";
        case StepKind::PlayOutdoorSportB: return "playing_golf";
        case StepKind::ReturnToStation:   return "working";
        case StepKind::SitOnCouch:
        case StepKind::VisitBreakRoom:
        case StepKind::PlayPoker:
        case StepKind::Wander:
        case StepKind::WalkInCircle:
        case StepKind::PlayOutdoorSportA:
        case StepKind::SitOutdoors:
            return "wandering";
    }
    return "wandering";
}

/// Parse a step kind by its external name (e.g. "go_to_couch").
/// @return The kind or an UnknownStepKind error.
[[nodiscard]] foundation::PlannerResult<StepKind> ParseStepKind(std::string_view name);

/// Parse a step kind by its weight key (e.g. "couch").
/// @return The kind or an UnknownWeightKey error.
[[nodiscard]] foundation::PlannerResult<StepKind> ParseWeightKey(std::string_view key);

/// Parse a seat area by name (e.g. "break_room").
[[nodiscard]] foundation::PlannerResult<SeatArea> ParseSeatArea(std::string_view name);

/// Validate an operator-issued override before it reaches an executor.
///
/// Same as ParseStepKind, but the error message names the command so
/// that it can be shown to the operator verbatim.
[[nodiscard]] foundation::PlannerResult<StepKind> ParseOverrideKind(std::string_view name);

}  // namespace abp::behavior
