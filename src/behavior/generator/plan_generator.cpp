/// @file plan_generator.cpp
/// @brief PlanGenerator implementation.
///
/// Each position filters the weight profile down to the kinds that are
/// allowed right now (not the previous kind, stage free, seat area not
/// full) and draws one of them proportionally to its weight.

#include "abp/behavior/plan_generator.hpp"

#include <string>
#include <utility>

#include "abp/foundation/planner_logger.hpp"

namespace abp::behavior {

using foundation::LogCategory;

std::optional<StepKind> SelectWeighted(const std::vector<WeightedKind>& candidates,
                                       RandomStream& rng) {
    if (candidates.empty()) {
        return std::nullopt;
    }

    double total = 0.0;
    for (const auto& candidate : candidates) {
        total += candidate.weight;
    }
    if (total <= 0.0) {
        return std::nullopt;
    }

    double remaining = rng.Uniform(0.0, total);
    for (const auto& candidate : candidates) {
        remaining -= candidate.weight;
        if (remaining <= 0.0) {
            return candidate.kind;
        }
    }

    // Rounding can leave a tiny positive remainder after the last entry.
    return candidates.back().kind;
}

PlanGenerator::PlanGenerator(const BehaviorCatalog& catalog) : catalog_(catalog) {}

bool PlanGenerator::IsAreaFull(SeatArea area, const AvailabilitySnapshot& snapshot) const noexcept {
    return snapshot.Occupancy(area) >= catalog_.Capacity(area);
}

std::vector<WeightedKind> PlanGenerator::BuildEligible(const PersonalityWeights& weights,
                                                       const AvailabilitySnapshot& snapshot,
                                                       std::optional<StepKind> previous) const {
    std::vector<WeightedKind> eligible;
    eligible.reserve(kStepKindCount);

    for (auto kind : kAllStepKinds) {
        float weight = weights.Get(kind);
        if (weight <= 0.0f) {
            continue;
        }
        if (previous && *previous == kind) {
            continue;
        }
        if (kind == StepKind::PerformOnStage && snapshot.stageOccupied) {
            continue;
        }
        if (auto area = SeatAreaFor(kind); area && IsAreaFull(*area, snapshot)) {
            continue;
        }
        eligible.push_back({kind, weight});
    }
    return eligible;
}

PlanStep PlanGenerator::MakeStep(StepKind kind, RandomStream& rng) const {
    const auto& range = catalog_.Durations(kind);

    PlanStep step;
    step.kind = kind;
    step.duration = StepDuration::Finite(static_cast<float>(rng.Uniform(range.min, range.max)));
    step.seatArea = SeatAreaFor(kind);
    return step;
}

GeneratedPlan PlanGenerator::Generate(const PersonalityWeights& weights,
                                      const AvailabilitySnapshot& snapshot,
                                      RandomStream& rng,
                                      StepCountRange range) const {
    if (range.min > range.max) {
        std::swap(range.min, range.max);
    }
    const uint32_t stepCount = rng.UniformInt(range.min, range.max);

    GeneratedPlan plan;
    plan.steps.reserve(stepCount > 0 ? stepCount : 1);

    std::optional<StepKind> previous;
    uint32_t fallbacks = 0;
    for (uint32_t i = 0; i < stepCount; ++i) {
        auto eligible = BuildEligible(weights, snapshot, previous);
        auto kind = SelectWeighted(eligible, rng);
        if (!kind) {
            kind = StepKind::Wander;
            ++fallbacks;
        }
        plan.steps.push_back(MakeStep(*kind, rng));
        previous = kind;
    }

    if (plan.steps.empty()) {
        plan.steps.push_back(MakeStep(StepKind::Wander, rng));
        ++fallbacks;
    }

    if (fallbacks > 0) {
        foundation::LogContext ctx;
        ctx.extra["fallbacks"] = std::to_string(fallbacks);
        ctx.extra["steps"] = std::to_string(plan.steps.size());
        ABP_LOG_CTX(foundation::LogLevel::Debug, LogCategory::Generator,
                    "No eligible step kind; fell back to wander", ctx);
    }

    return plan;
}

}  // namespace abp::behavior
