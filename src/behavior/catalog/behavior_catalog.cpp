/// @file behavior_catalog.cpp
/// @brief Built-in behavior tables and YAML overrides.

#include "abp/behavior/behavior_catalog.hpp"

#include <string>
#include <vector>

#include "abp/foundation/planner_logger.hpp"

namespace abp::behavior {

using foundation::ConfigManager;
using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::PlannerError;
using foundation::PlannerResult;

namespace {

constexpr std::string_view kDurationsKey = "catalog.durations";
constexpr std::string_view kCapacityKey = "catalog.capacity";
constexpr std::string_view kArchetypesKey = "catalog.archetypes";

std::string joinKey(std::string_view prefix, std::string_view child) {
    std::string key(prefix);
    key += '.';
    key += child;
    return key;
}

/// Re-tag a config lookup failure with the key it concerns.
PlannerError withKey(const PlannerError& error, const std::string& key) {
    return PlannerError(error.code(), std::string(error.message()), key);
}

}  // namespace

// -- Built-in tables ----------------------------------------------------------

DurationRange DefaultDurationRange(StepKind kind) noexcept {
    switch (kind) {
        case StepKind::ReturnToStation:   return {10.0f, 30.0f};
        case StepKind::VisitKitchen:      return {8.0f, 15.0f};
        case StepKind::SitOnCouch:        return {10.0f, 20.0f};
        case StepKind::VisitBreakRoom:    return {10.0f, 20.0f};
        case StepKind::PlayPoker:         return {15.0f, 30.0f};
        case StepKind::PerformOnStage:    return {10.0f, 20.0f};
        case StepKind::WatchStage:        return {10.0f, 20.0f};
        case StepKind::Wander:            return {3.0f, 8.0f};
        case StepKind::CheckOnWorker:     return {5.0f, 12.0f};
        case StepKind::Present:           return {10.0f, 20.0f};
        case StepKind::WalkInCircle:      return {8.0f, 15.0f};
        case StepKind::PlayOutdoorSportA: return {15.0f, 30.0f};
        case StepKind::PlayOutdoorSportB: return {15.0f, 30.0f};
        case StepKind::SitOutdoors:       return {10.0f, 20.0f};
    }
    return {3.0f, 8.0f};
}

PersonalityWeights DefaultWeights(Archetype archetype) {
    using K = StepKind;
    switch (archetype) {
        case Archetype::Worker:
            return {{K::VisitKitchen, 15.0f}, {K::SitOnCouch, 12.0f}, {K::VisitBreakRoom, 12.0f},
                    {K::PlayPoker, 12.0f},    {K::PerformOnStage, 8.0f}, {K::WatchStage, 10.0f},
                    {K::Wander, 15.0f}};
        case Archetype::Inspector:
            return {{K::VisitKitchen, 10.0f}, {K::SitOnCouch, 5.0f},  {K::VisitBreakRoom, 8.0f},
                    {K::PlayPoker, 5.0f},     {K::WatchStage, 8.0f},  {K::Wander, 12.0f},
                    {K::CheckOnWorker, 30.0f}};
        case Archetype::Presenter:
            return {{K::VisitKitchen, 10.0f}, {K::SitOnCouch, 6.0f},     {K::VisitBreakRoom, 6.0f},
                    {K::PlayPoker, 4.0f},     {K::WatchStage, 8.0f},     {K::Wander, 12.0f},
                    {K::CheckOnWorker, 20.0f}, {K::Present, 15.0f},     {K::WalkInCircle, 10.0f}};
        case Archetype::OutdoorExecutive:
            return {{K::VisitKitchen, 6.0f},  {K::SitOnCouch, 4.0f},        {K::VisitBreakRoom, 4.0f},
                    {K::PlayPoker, 6.0f},     {K::WatchStage, 6.0f},        {K::Wander, 10.0f},
                    {K::CheckOnWorker, 18.0f}, {K::PlayOutdoorSportA, 14.0f}, {K::PlayOutdoorSportB, 10.0f},
                    {K::SitOutdoors, 8.0f}};
        case Archetype::Golfer:
            return {{K::VisitKitchen, 6.0f},  {K::SitOnCouch, 5.0f},        {K::VisitBreakRoom, 5.0f},
                    {K::PlayPoker, 4.0f},     {K::WatchStage, 6.0f},        {K::Wander, 10.0f},
                    {K::CheckOnWorker, 20.0f}, {K::PlayOutdoorSportA, 6.0f}, {K::PlayOutdoorSportB, 20.0f},
                    {K::SitOutdoors, 6.0f}};
        case Archetype::Keynoter:
            return {{K::VisitKitchen, 8.0f},  {K::SitOnCouch, 4.0f}, {K::VisitBreakRoom, 6.0f},
                    {K::PlayPoker, 4.0f},     {K::WatchStage, 6.0f}, {K::Wander, 10.0f},
                    {K::CheckOnWorker, 28.0f}, {K::Present, 16.0f}};
        case Archetype::Coach:
            return {{K::VisitKitchen, 6.0f},  {K::SitOnCouch, 4.0f},        {K::VisitBreakRoom, 4.0f},
                    {K::PlayPoker, 6.0f},     {K::WatchStage, 6.0f},        {K::Wander, 10.0f},
                    {K::CheckOnWorker, 14.0f}, {K::PlayOutdoorSportA, 8.0f}, {K::PlayOutdoorSportB, 22.0f},
                    {K::SitOutdoors, 8.0f}};
        case Archetype::Audience:
            return {{K::VisitKitchen, 10.0f}, {K::SitOnCouch, 10.0f}, {K::VisitBreakRoom, 8.0f},
                    {K::PlayPoker, 6.0f},     {K::WatchStage, 12.0f}, {K::Wander, 30.0f}};
    }
    return {{K::Wander, 1.0f}};
}

PlannerResult<Archetype> ParseArchetype(std::string_view name) {
    for (auto archetype : kAllArchetypes) {
        if (ArchetypeName(archetype) == name) {
            return PlannerResult<Archetype>::ok(archetype);
        }
    }
    return PlannerResult<Archetype>::err(
        PlannerError(ErrorCode::UnknownArchetype, "unknown archetype: " + std::string(name)));
}

// -- BehaviorCatalog ----------------------------------------------------------

BehaviorCatalog::BehaviorCatalog() {
    for (auto kind : kAllStepKinds) {
        durations_[ToIndex(kind)] = DefaultDurationRange(kind);
    }
    for (auto area : kAllSeatAreas) {
        capacities_[ToIndex(area)] = DefaultSeatCapacity(area);
    }
    for (auto archetype : kAllArchetypes) {
        archetypes_[static_cast<std::size_t>(archetype)] = DefaultWeights(archetype);
    }
}

PlannerResult<void> BehaviorCatalog::SetDurations(StepKind kind, DurationRange range) {
    if (!range.IsValid()) {
        return PlannerResult<void>::err(
            PlannerError(ErrorCode::InvalidDurationRange,
                         "duration range for " + std::string(StepKindName(kind)) +
                             " must satisfy 0 < min <= max"));
    }
    durations_[ToIndex(kind)] = range;
    return PlannerResult<void>::ok();
}

PlannerResult<void> BehaviorCatalog::SetCapacity(SeatArea area, uint32_t capacity) {
    if (capacity == 0) {
        return PlannerResult<void>::err(
            PlannerError(ErrorCode::InvalidCapacity,
                         "capacity for " + std::string(SeatAreaName(area)) + " must be positive"));
    }
    capacities_[ToIndex(area)] = capacity;
    return PlannerResult<void>::ok();
}

void BehaviorCatalog::SetWeights(Archetype archetype, const PersonalityWeights& weights) {
    archetypes_[static_cast<std::size_t>(archetype)] = weights;
}

PlannerResult<void> BehaviorCatalog::ApplyConfig(const ConfigManager& config) {
    // Work on a copy and swap it in only when every entry validated.
    BehaviorCatalog staged = *this;

    for (const auto& name : config.childKeys(kDurationsKey)) {
        auto key = joinKey(kDurationsKey, name);
        auto kind = ParseStepKind(name);
        if (!kind) {
            return PlannerResult<void>::err(withKey(kind.error(), key));
        }
        auto bounds = config.get<std::vector<float>>(key);
        if (!bounds) {
            return PlannerResult<void>::err(withKey(bounds.error(), key));
        }
        if (bounds.value().size() != 2) {
            return PlannerResult<void>::err(
                PlannerError(ErrorCode::InvalidDurationRange,
                             "duration range must be a [min, max] pair", key));
        }
        auto set = staged.SetDurations(kind.value(), {bounds.value()[0], bounds.value()[1]});
        if (!set) {
            return PlannerResult<void>::err(withKey(set.error(), key));
        }
    }

    for (const auto& name : config.childKeys(kCapacityKey)) {
        auto key = joinKey(kCapacityKey, name);
        auto area = ParseSeatArea(name);
        if (!area) {
            return PlannerResult<void>::err(withKey(area.error(), key));
        }
        auto capacity = config.get<uint32_t>(key);
        if (!capacity) {
            return PlannerResult<void>::err(withKey(capacity.error(), key));
        }
        auto set = staged.SetCapacity(area.value(), capacity.value());
        if (!set) {
            return PlannerResult<void>::err(withKey(set.error(), key));
        }
    }

    for (const auto& name : config.childKeys(kArchetypesKey)) {
        auto section = joinKey(kArchetypesKey, name);
        auto archetype = ParseArchetype(name);
        if (!archetype) {
            return PlannerResult<void>::err(withKey(archetype.error(), section));
        }
        auto weights = staged.Weights(archetype.value());
        for (const auto& weightKey : config.childKeys(section)) {
            auto key = joinKey(section, weightKey);
            auto kind = ParseWeightKey(weightKey);
            if (!kind) {
                return PlannerResult<void>::err(withKey(kind.error(), key));
            }
            auto weight = config.get<float>(key);
            if (!weight) {
                return PlannerResult<void>::err(withKey(weight.error(), key));
            }
            if (weight.value() < 0.0f) {
                return PlannerResult<void>::err(
                    PlannerError(ErrorCode::InvalidWeight, "weights must be non-negative", key));
            }
            weights.Set(kind.value(), weight.value());
        }
        staged.SetWeights(archetype.value(), weights);
    }

    *this = staged;
    ABP_LOG_INFO(LogCategory::Catalog, "Catalog overrides applied");
    return PlannerResult<void>::ok();
}

const BehaviorCatalog& BehaviorCatalog::Default() {
    static const BehaviorCatalog catalog;
    return catalog;
}

}  // namespace abp::behavior
