#pragma once

/// @file behavior_controller.hpp
/// @brief Per-tick driver that turns an executor's plan into movement
///        directives for one entity.
///
/// The controller owns the entity's PlanExecutor and reacts to the
/// per-tick inputs (operator commands, conversations, stage performers)
/// before deciding whether the entity should walk, dwell or idle. Motion
/// itself is left to the caller, which reports back through
/// NotifyArrived() and NotifyBlocked().
///
/// @code
///   world::SeatBoard board(catalog);
///   BehaviorController npc(EntityId(1), catalog.Weights(Archetype::Worker),
///                          generator, board, resolver, settings);
///   auto directive = npc.Tick({.now = 0.0f});
///   if (directive.action == DriverAction::MoveToTarget) {
///       // walk towards directive.target, then:
///       npc.NotifyArrived(now);
///   }
/// @endcode

#include <cstdint>
#include <optional>
#include <string_view>

#include "abp/behavior/plan_executor.hpp"
#include "abp/behavior/plan_generator.hpp"
#include "abp/behavior/plan_types.hpp"
#include "abp/foundation/config_manager.hpp"
#include "abp/foundation/planner_result.hpp"
#include "abp/foundation/types.hpp"

namespace abp::behavior {

/// Shared world state: availability plus seat reservation.
class IWorldState : public IAvailabilitySource {
public:
    /// Reserve a seat in @p area for @p entity.
    /// @return The seat index, or nullopt if the area is full.
    virtual std::optional<uint32_t> ClaimSeat(SeatArea area, foundation::EntityId entity) = 0;

    /// Give back any seat @p entity holds in @p area.
    virtual void ReleaseSeat(SeatArea area, foundation::EntityId entity) = 0;
};

/// Target position and presentation hints for a step.
struct ResolvedTarget {
    Position position;
    ArrivalCue cue;
};

/// Maps a step to a concrete destination (spatial layout is the caller's).
class ITargetResolver {
public:
    virtual ~ITargetResolver() = default;

    /// @param step The step to resolve; seatIndex is already set for
    ///             seated kinds.
    /// @return The destination, or nullopt if none exists right now.
    virtual std::optional<ResolvedTarget> Resolve(foundation::EntityId entity,
                                                  const PlanStep& step) = 0;
};

/// Planner tuning shared by every controller.
struct PlannerSettings {
    StepCountRange stepCountRange;
    float stageReactionProbability = kDefaultStageReactionProbability;
    uint64_t seed = 0;  ///< Base seed; each entity derives its own stream.
};

/// Read "planner.*" keys, falling back to the defaults for absent ones.
/// @return The settings, or InvalidStepCountRange/InvalidProbability and
///         config lookup errors.
[[nodiscard]] foundation::PlannerResult<PlannerSettings> LoadPlannerSettings(
    const foundation::ConfigManager& config);

/// Inputs sampled by the caller once per tick.
struct TickInput {
    float now = 0.0f;                                   ///< Monotonic seconds.
    bool inConversation = false;
    std::optional<foundation::EntityId> stagePerformer;  ///< Entity on stage, if any.
    std::optional<StepKind> command;                     ///< Operator override issued this tick.
};

enum class DriverAction : uint8_t {
    Idle,          ///< Stand still (paused, or between steps).
    MoveToTarget,  ///< Walk towards target.
    Dwell          ///< At target; play the arrival cue until the step ends.
};

/// What the entity should do this tick.
struct TickDirective {
    DriverAction action = DriverAction::Idle;
    std::optional<StepKind> kind;
    std::optional<Position> target;
    ArrivalCue cue;
    std::string_view thought = "wandering";

    bool operator==(const TickDirective&) const = default;
};

class BehaviorController {
public:
    BehaviorController(foundation::EntityId entity,
                       PersonalityWeights weights,
                       const PlanGenerator& generator,
                       IWorldState& world,
                       ITargetResolver& resolver,
                       const PlannerSettings& settings = {});

    /// Advance the entity's behavior by one tick.
    TickDirective Tick(const TickInput& input);

    /// The entity reached the current step's target at @p now.
    void NotifyArrived(float now);

    /// Movement could not make progress; skip the current step.
    void NotifyBlocked();

    [[nodiscard]] foundation::EntityId Entity() const noexcept { return entity_; }
    [[nodiscard]] bool HasArrived() const noexcept { return arrived_; }
    [[nodiscard]] std::optional<SeatArea> ClaimedArea() const noexcept;

    [[nodiscard]] PlanExecutor& Executor() noexcept { return executor_; }
    [[nodiscard]] const PlanExecutor& Executor() const noexcept { return executor_; }

private:
    struct ClaimedSeat {
        SeatArea area;
        uint32_t index;
    };

    void handleConversation(bool inConversation);
    void handleStage(const std::optional<foundation::EntityId>& performer);
    void restoreFromStage();
    bool resolveTarget(PlanStep& step);
    void skipStep(std::string_view reason);
    void releaseSeat();
    [[nodiscard]] TickDirective makeDirective(DriverAction action, const PlanStep* step) const;

    foundation::EntityId entity_;
    IWorldState& world_;
    ITargetResolver& resolver_;
    float stageReactionProbability_;
    PlanExecutor executor_;
    RandomStream reactionRng_;

    bool arrived_ = false;
    bool wasPaused_ = false;
    std::optional<foundation::EntityId> lastPerformer_;
    std::optional<ClaimedSeat> claimedSeat_;
};

}  // namespace abp::behavior
