/// @file behavior_controller.cpp
/// @brief BehaviorController implementation and planner settings loader.

#include "abp/behavior/behavior_controller.hpp"

#include <string>
#include <utility>

#include "abp/behavior/random.hpp"
#include "abp/foundation/planner_logger.hpp"

namespace abp::behavior {

using foundation::ConfigManager;
using foundation::EntityId;
using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::PlannerError;
using foundation::PlannerResult;

namespace {

/// Salt separating the stage-reaction stream from the plan stream.
constexpr uint64_t kReactionSalt = 0x5354414745ULL;

}  // namespace

// -- Settings -------------------------------------------------------------------

PlannerResult<PlannerSettings> LoadPlannerSettings(const ConfigManager& config) {
    PlannerSettings settings;

    auto minSteps = config.getOr<uint32_t>("planner.min_steps", settings.stepCountRange.min);
    if (!minSteps) {
        return PlannerResult<PlannerSettings>::err(minSteps.error());
    }
    auto maxSteps = config.getOr<uint32_t>("planner.max_steps", settings.stepCountRange.max);
    if (!maxSteps) {
        return PlannerResult<PlannerSettings>::err(maxSteps.error());
    }
    if (minSteps.value() == 0 || minSteps.value() > maxSteps.value()) {
        return PlannerResult<PlannerSettings>::err(
            PlannerError(ErrorCode::InvalidStepCountRange,
                         "step count range must satisfy 1 <= min_steps <= max_steps",
                         "planner.min_steps"));
    }

    auto probability = config.getOr<float>("planner.stage_reaction_probability",
                                           settings.stageReactionProbability);
    if (!probability) {
        return PlannerResult<PlannerSettings>::err(probability.error());
    }
    if (probability.value() < 0.0f || probability.value() > 1.0f) {
        return PlannerResult<PlannerSettings>::err(
            PlannerError(ErrorCode::InvalidProbability,
                         "stage reaction probability must be within [0, 1]",
                         "planner.stage_reaction_probability"));
    }

    auto seed = config.getOr<uint64_t>("planner.seed", settings.seed);
    if (!seed) {
        return PlannerResult<PlannerSettings>::err(seed.error());
    }

    settings.stepCountRange = {minSteps.value(), maxSteps.value()};
    settings.stageReactionProbability = probability.value();
    settings.seed = seed.value();
    return PlannerResult<PlannerSettings>::ok(settings);
}

// -- BehaviorController ---------------------------------------------------------

BehaviorController::BehaviorController(EntityId entity,
                                       PersonalityWeights weights,
                                       const PlanGenerator& generator,
                                       IWorldState& world,
                                       ITargetResolver& resolver,
                                       const PlannerSettings& settings)
    : entity_(entity),
      world_(world),
      resolver_(resolver),
      stageReactionProbability_(settings.stageReactionProbability),
      executor_(entity, std::move(weights), generator, world,
                DeriveSeed(settings.seed, entity.value()), settings.stepCountRange),
      reactionRng_(DeriveSeed(settings.seed ^ kReactionSalt, entity.value())) {}

TickDirective BehaviorController::Tick(const TickInput& input) {
    if (input.command) {
        releaseSeat();
        executor_.ApplyOverride(*input.command);
        arrived_ = false;
        wasPaused_ = false;
    }

    handleConversation(input.inConversation);
    if (executor_.IsPaused()) {
        return makeDirective(DriverAction::Idle, nullptr);
    }

    handleStage(input.stagePerformer);

    if (!executor_.HasPlan()) {
        executor_.NewPlan();
        arrived_ = false;
    }

    PlanStep* step = executor_.CurrentStep();
    if (step == nullptr) {
        executor_.NewPlan();
        arrived_ = false;
        return makeDirective(DriverAction::Idle, nullptr);
    }

    if (!step->target && !resolveTarget(*step)) {
        skipStep("no target");
        return makeDirective(DriverAction::Idle, nullptr);
    }

    if (!arrived_) {
        return makeDirective(DriverAction::MoveToTarget, step);
    }

    if (executor_.IsDurationElapsed(input.now)) {
        releaseSeat();
        executor_.Advance();
        arrived_ = false;
        return makeDirective(DriverAction::Idle, nullptr);
    }

    return makeDirective(DriverAction::Dwell, step);
}

void BehaviorController::NotifyArrived(float now) {
    if (arrived_) {
        return;
    }
    const PlanStep* step = executor_.CurrentStep();
    if (step == nullptr || !step->target) {
        return;
    }
    arrived_ = true;
    executor_.MarkArrival(now);
}

void BehaviorController::NotifyBlocked() {
    if (executor_.CurrentStep() == nullptr) {
        return;
    }
    skipStep("blocked");
}

std::optional<SeatArea> BehaviorController::ClaimedArea() const noexcept {
    if (!claimedSeat_) {
        return std::nullopt;
    }
    return claimedSeat_->area;
}

void BehaviorController::handleConversation(bool inConversation) {
    if (inConversation && !executor_.IsPaused() && !executor_.IsOverridden()) {
        if (executor_.Pause()) {
            wasPaused_ = true;
        }
    } else if (!inConversation && wasPaused_) {
        executor_.Resume();
        wasPaused_ = false;
        arrived_ = false;
    }
}

void BehaviorController::handleStage(const std::optional<EntityId>& performer) {
    if (performer && performer != lastPerformer_ && *performer != entity_) {
        lastPerformer_ = performer;
        if (executor_.IsOverridden() || executor_.HasSavedPlan() ||
            !reactionRng_.Chance(stageReactionProbability_)) {
            return;
        }
        if (executor_.InterruptForStage()) {
            releaseSeat();
            arrived_ = false;
        }
    } else if (!performer && lastPerformer_) {
        lastPerformer_.reset();
        if (executor_.IsOverridden() || executor_.CurrentKind() != StepKind::WatchStage) {
            return;
        }
        restoreFromStage();
    }
}

void BehaviorController::restoreFromStage() {
    executor_.RestoreFromStage();
    arrived_ = false;

    // The seat held before the interrupt was given up; claim again.
    if (PlanStep* step = executor_.CurrentStep(); step != nullptr && step->seatArea) {
        step->target.reset();
        step->seatIndex.reset();
    }
}

bool BehaviorController::resolveTarget(PlanStep& step) {
    if (step.seatArea) {
        auto seat = world_.ClaimSeat(*step.seatArea, entity_);
        if (!seat) {
            LogContext ctx;
            ctx.entityId = entity_;
            ctx.extra["area"] = std::string(SeatAreaName(*step.seatArea));
            ABP_LOG_CTX(LogLevel::Debug, LogCategory::World, "Seat claim denied", ctx);
            return false;
        }
        claimedSeat_ = ClaimedSeat{*step.seatArea, *seat};
        step.seatIndex = *seat;
    }

    auto resolved = resolver_.Resolve(entity_, step);
    if (!resolved) {
        return false;
    }
    step.target = resolved->position;
    step.arrivalCue = resolved->cue;
    return true;
}

void BehaviorController::skipStep(std::string_view reason) {
    LogContext ctx;
    ctx.entityId = entity_;
    ctx.extra["reason"] = std::string(reason);
    if (auto kind = executor_.CurrentKind()) {
        ctx.extra["kind"] = std::string(StepKindName(*kind));
    }
    ABP_LOG_CTX(LogLevel::Debug, LogCategory::Executor, "Skipped step", ctx);

    releaseSeat();
    if (executor_.HasSavedPlan() && executor_.CurrentKind() == StepKind::WatchStage) {
        restoreFromStage();
        return;
    }
    executor_.Advance();
    arrived_ = false;
}

void BehaviorController::releaseSeat() {
    if (!claimedSeat_) {
        return;
    }
    world_.ReleaseSeat(claimedSeat_->area, entity_);
    claimedSeat_.reset();
}

TickDirective BehaviorController::makeDirective(DriverAction action, const PlanStep* step) const {
    TickDirective directive;
    directive.action = action;
    directive.thought = executor_.ThoughtKey();
    if (step != nullptr) {
        directive.kind = step->kind;
        directive.target = step->target;
        directive.cue = step->arrivalCue;
    }
    return directive;
}

}  // namespace abp::behavior
