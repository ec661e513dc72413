/// @file plan_executor.cpp
/// @brief PlanExecutor implementation.

#include "abp/behavior/plan_executor.hpp"

#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include "abp/foundation/planner_logger.hpp"

namespace abp::behavior {

using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

namespace {

LogContext entityContext(foundation::EntityId entity) {
    LogContext ctx;
    ctx.entityId = entity;
    return ctx;
}

/// Step in progress of @p plan, or nullptr when the index is exhausted.
template <typename PlanT>
auto* stepOf(PlanT& plan) {
    using Step = std::conditional_t<std::is_const_v<PlanT>, const PlanStep, PlanStep>;
    return std::visit(
        [](auto& active) -> Step* {
            using T = std::decay_t<decltype(active)>;
            if constexpr (std::is_same_v<T, GeneratedPlan>) {
                if (active.currentIndex >= active.steps.size()) {
                    return nullptr;
                }
                return &active.steps[active.currentIndex];
            } else {
                return &active.step;
            }
        },
        plan);
}

}  // namespace

PlanExecutor::PlanExecutor(foundation::EntityId entity,
                           PersonalityWeights weights,
                           const PlanGenerator& generator,
                           const IAvailabilitySource& availability,
                           uint64_t seed,
                           StepCountRange range)
    : entity_(entity),
      weights_(std::move(weights)),
      generator_(generator),
      availability_(availability),
      rng_(seed),
      range_(range) {}

void PlanExecutor::regenerate(std::string_view reason) {
    auto generated = generator_.Generate(weights_, availability_.Snapshot(), rng_, range_);

    if (foundation::PlannerLogger::instance().isEnabled(LogLevel::Debug, LogCategory::Executor)) {
        auto ctx = entityContext(entity_);
        ctx.extra["reason"] = std::string(reason);
        ctx.extra["steps"] = std::to_string(generated.steps.size());
        ctx.extra["first"] = std::string(StepKindName(generated.steps.front().kind));
        ABP_LOG_CTX(LogLevel::Debug, LogCategory::Executor, "Generated plan", ctx);
    }

    plan_ = std::move(generated);
}

// -- Step access ----------------------------------------------------------------

PlanStep* PlanExecutor::CurrentStep() {
    if (!plan_) {
        return nullptr;
    }
    if (IsPaused()) {
        return nullptr;
    }
    if (auto* step = stepOf(*plan_)) {
        return step;
    }
    regenerate("index exhausted");
    return stepOf(*plan_);
}

const PlanStep* PlanExecutor::CurrentStep() const {
    if (!plan_ || IsPaused()) {
        return nullptr;
    }
    return stepOf(*plan_);
}

std::optional<StepKind> PlanExecutor::CurrentKind() const {
    if (!plan_) {
        return std::nullopt;
    }
    if (const auto* step = stepOf(*plan_)) {
        return step->kind;
    }
    return std::nullopt;
}

std::string_view PlanExecutor::ThoughtKey() const {
    auto kind = CurrentKind();
    return behavior::ThoughtKey(kind.value_or(StepKind::Wander));
}

std::optional<SeatArea> PlanExecutor::CurrentSeatArea() const {
    auto kind = CurrentKind();
    if (!kind) {
        return std::nullopt;
    }
    return SeatAreaFor(*kind);
}

// -- Progression ----------------------------------------------------------------

void PlanExecutor::NewPlan() {
    regenerate("requested");
}

void PlanExecutor::Advance() {
    if (!plan_) {
        regenerate("no plan");
        return;
    }

    auto* generated = std::get_if<GeneratedPlan>(&*plan_);
    if (generated == nullptr) {
        regenerate("override complete");
        return;
    }

    generated->currentIndex += 1;
    generated->arrivalTime.reset();
    if (generated->currentIndex >= generated->steps.size()) {
        regenerate("plan complete");
    }
}

void PlanExecutor::MarkArrival(float now) {
    if (!plan_) {
        return;
    }
    std::visit([now](auto& active) { active.arrivalTime = now; }, *plan_);
}

bool PlanExecutor::IsDurationElapsed(float now) const {
    auto arrival = ArrivalTime();
    if (!arrival) {
        return false;
    }
    const auto* step = stepOf(*plan_);
    if (step == nullptr) {
        return false;
    }
    return step->duration.IsSatisfiedBy(now - *arrival);
}

// -- Interruptions --------------------------------------------------------------

bool PlanExecutor::Pause() {
    if (!plan_) {
        return false;
    }
    auto* generated = std::get_if<GeneratedPlan>(&*plan_);
    if (generated == nullptr) {
        return false;
    }
    generated->paused = true;
    return true;
}

void PlanExecutor::Resume() {
    if (!plan_) {
        return;
    }
    if (auto* generated = std::get_if<GeneratedPlan>(&*plan_)) {
        generated->paused = false;
        generated->arrivalTime.reset();
    }
}

bool PlanExecutor::InterruptForStage() {
    if (saved_ || IsOverridden()) {
        return false;
    }

    if (plan_) {
        saved_ = std::get<GeneratedPlan>(std::move(*plan_));
    }

    GeneratedPlan watch;
    PlanStep step;
    step.kind = StepKind::WatchStage;
    step.duration = StepDuration::Indefinite();
    watch.steps.push_back(std::move(step));
    plan_ = std::move(watch);

    auto ctx = entityContext(entity_);
    ctx.extra["saved"] = saved_ ? "true" : "false";
    ABP_LOG_CTX(LogLevel::Debug, LogCategory::Stage, "Interrupted plan to watch stage", ctx);
    return true;
}

void PlanExecutor::RestoreFromStage() {
    if (!saved_) {
        regenerate("nothing saved");
        return;
    }

    plan_ = std::move(*saved_);
    saved_.reset();
    ABP_LOG_CTX(LogLevel::Debug, LogCategory::Stage, "Restored plan after stage",
                entityContext(entity_));
}

void PlanExecutor::ApplyOverride(StepKind kind) {
    OverriddenPlan overridden;
    overridden.step = generator_.MakeStep(kind, rng_);
    plan_ = std::move(overridden);
    saved_.reset();

    auto ctx = entityContext(entity_);
    ctx.extra["kind"] = std::string(StepKindName(kind));
    ABP_LOG_CTX(LogLevel::Info, LogCategory::Executor, "Applied override", ctx);
}

// -- State queries --------------------------------------------------------------

bool PlanExecutor::IsPaused() const noexcept {
    if (!plan_) {
        return false;
    }
    const auto* generated = std::get_if<GeneratedPlan>(&*plan_);
    return generated != nullptr && generated->paused;
}

bool PlanExecutor::IsOverridden() const noexcept {
    return plan_ && std::holds_alternative<OverriddenPlan>(*plan_);
}

std::optional<float> PlanExecutor::ArrivalTime() const {
    if (!plan_) {
        return std::nullopt;
    }
    return std::visit([](const auto& active) { return active.arrivalTime; }, *plan_);
}

}  // namespace abp::behavior
