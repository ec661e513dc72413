#pragma once

/// @file plan_executor.hpp
/// @brief PlanExecutor: per-entity plan lifecycle state machine.
///
/// Holds the active plan and at most one plan saved by a stage
/// interrupt. All operations complete synchronously; time only enters
/// through the explicit `now` arguments.
///
/// Lifecycle of a generated plan:
///
///   step i --MarkArrival--> dwelling --IsDurationElapsed--> Advance --> step i+1
///     |                                                               (regenerate past end)
///     +--Pause--> paused --Resume--> step i (arrival cleared)
///     +--InterruptForStage--> [WatchStage, indefinite] --RestoreFromStage--> saved plan
///
/// An overridden plan replaces all of the above with a single step that
/// ignores Pause and InterruptForStage; advancing past it regenerates.

#include <optional>
#include <string_view>

#include "abp/behavior/behavior_catalog.hpp"
#include "abp/behavior/plan_generator.hpp"
#include "abp/behavior/plan_types.hpp"
#include "abp/behavior/random.hpp"
#include "abp/foundation/types.hpp"

namespace abp::behavior {

class PlanExecutor {
public:
    /// @param entity   Entity this executor drives (used for logging).
    /// @param weights  Archetype weight profile, fixed for the executor's life.
    /// @param generator Generator used whenever the plan must be refilled.
    /// @param availability Snapshot source consulted on every generation.
    /// @param seed     Seed for generation and duration draws.
    /// @param range    Step count range for generated plans.
    PlanExecutor(foundation::EntityId entity,
                 PersonalityWeights weights,
                 const PlanGenerator& generator,
                 const IAvailabilitySource& availability,
                 uint64_t seed,
                 StepCountRange range = {});

    // -- Step access --------------------------------------------------------

    /// The step in progress, or nullptr when there is no plan or the plan
    /// is paused. An exhausted index is regenerated before returning.
    [[nodiscard]] PlanStep* CurrentStep();

    /// Read-only view; never regenerates.
    [[nodiscard]] const PlanStep* CurrentStep() const;

    /// Kind of the step in progress, regardless of pause state.
    [[nodiscard]] std::optional<StepKind> CurrentKind() const;

    /// Display category of the current step ("wandering" when idle).
    [[nodiscard]] std::string_view ThoughtKey() const;

    /// Shared-resource key of the current step, if it is seated. Reported
    /// while paused as well, since a paused entity keeps its seat.
    [[nodiscard]] std::optional<SeatArea> CurrentSeatArea() const;

    // -- Progression --------------------------------------------------------

    /// Discard any active plan and generate a fresh one.
    void NewPlan();

    /// Move to the next step, clearing arrival. Regenerates when the plan
    /// is exhausted or an overridden step completes.
    void Advance();

    /// Record (or overwrite) the arrival time for the step in progress.
    void MarkArrival(float now);

    /// Whether the current step's duration has passed since arrival.
    /// Always false without an arrival time or for indefinite steps.
    [[nodiscard]] bool IsDurationElapsed(float now) const;

    // -- Interruptions ------------------------------------------------------

    /// Pause a generated plan. Overridden plans ignore it.
    /// @return true if the plan is now paused.
    bool Pause();

    /// Unpause and clear the arrival time, so the full duration must be
    /// waited again after the entity re-arrives.
    void Resume();

    /// Save the generated plan and watch the stage indefinitely.
    /// No-op if a plan is already saved or the active plan is overridden.
    /// @return true if the interrupt took effect.
    bool InterruptForStage();

    /// Reinstall the saved plan, or generate a fresh one if none is saved.
    void RestoreFromStage();

    /// Replace the active plan with a single operator-forced step. Pause,
    /// arrival and any saved plan are discarded.
    void ApplyOverride(StepKind kind);

    // -- State queries ------------------------------------------------------

    [[nodiscard]] bool HasPlan() const noexcept { return plan_.has_value(); }
    [[nodiscard]] bool HasSavedPlan() const noexcept { return saved_.has_value(); }
    [[nodiscard]] bool IsPaused() const noexcept;
    [[nodiscard]] bool IsOverridden() const noexcept;
    [[nodiscard]] std::optional<float> ArrivalTime() const;

    [[nodiscard]] const std::optional<Plan>& ActivePlan() const noexcept { return plan_; }
    [[nodiscard]] const std::optional<GeneratedPlan>& SavedPlan() const noexcept { return saved_; }

    [[nodiscard]] foundation::EntityId Entity() const noexcept { return entity_; }
    [[nodiscard]] const PersonalityWeights& Weights() const noexcept { return weights_; }

private:
    void regenerate(std::string_view reason);

    foundation::EntityId entity_;
    PersonalityWeights weights_;
    const PlanGenerator& generator_;
    const IAvailabilitySource& availability_;
    RandomStream rng_;
    StepCountRange range_;

    std::optional<Plan> plan_;
    std::optional<GeneratedPlan> saved_;
};

}  // namespace abp::behavior
