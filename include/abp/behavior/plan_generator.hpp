#pragma once

/// @file plan_generator.hpp
/// @brief Weighted-random plan generation under availability constraints.

#include <cstdint>
#include <optional>
#include <vector>

#include "abp/behavior/behavior_catalog.hpp"
#include "abp/behavior/plan_types.hpp"
#include "abp/behavior/random.hpp"

namespace abp::behavior {

/// Inclusive bounds on the number of steps per generated plan.
struct StepCountRange {
    uint32_t min = kDefaultMinPlanSteps;
    uint32_t max = kDefaultMaxPlanSteps;
};

/// A selectable kind with its positive weight.
struct WeightedKind {
    StepKind kind;
    float weight;
};

/// Pick one entry with probability proportional to its weight.
///
/// Draws r in [0, total) and subtracts weights in order until r drops
/// to or below zero. Returns nullopt only when @p candidates is empty or
/// the total weight is not positive.
[[nodiscard]] std::optional<StepKind> SelectWeighted(const std::vector<WeightedKind>& candidates,
                                                     RandomStream& rng);

/// Builds plans from a catalog's duration and capacity tables.
///
/// Generation never fails: when no kind is eligible at a position the
/// step falls back to Wander, even if that repeats the previous step.
class PlanGenerator {
public:
    explicit PlanGenerator(const BehaviorCatalog& catalog = BehaviorCatalog::Default());

    /// Generate a plan with a step count drawn from @p range.
    [[nodiscard]] GeneratedPlan Generate(const PersonalityWeights& weights,
                                         const AvailabilitySnapshot& snapshot,
                                         RandomStream& rng,
                                         StepCountRange range = {}) const;

    /// Kinds selectable after @p previous under @p snapshot, in kind order.
    [[nodiscard]] std::vector<WeightedKind> BuildEligible(const PersonalityWeights& weights,
                                                          const AvailabilitySnapshot& snapshot,
                                                          std::optional<StepKind> previous) const;

    /// A step of @p kind with a duration drawn from the catalog range.
    [[nodiscard]] PlanStep MakeStep(StepKind kind, RandomStream& rng) const;

    /// Whether @p area has reached its catalog capacity in @p snapshot.
    [[nodiscard]] bool IsAreaFull(SeatArea area, const AvailabilitySnapshot& snapshot) const noexcept;

    [[nodiscard]] const BehaviorCatalog& Catalog() const noexcept { return catalog_; }

private:
    const BehaviorCatalog& catalog_;
};

}  // namespace abp::behavior
