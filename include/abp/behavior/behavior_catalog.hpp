#pragma once

/// @file behavior_catalog.hpp
/// @brief Weight profiles, duration ranges and seat capacities.
///
/// The catalog is configuration data. The built-in tables can be
/// overridden from YAML through BehaviorCatalog::ApplyConfig, which
/// validates every entry and rejects unknown names.

#include <array>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string_view>
#include <utility>

#include "abp/behavior/behavior_types.hpp"
#include "abp/foundation/config_manager.hpp"
#include "abp/foundation/planner_result.hpp"

namespace abp::behavior {

/// Inclusive [min, max] duration in seconds.
struct DurationRange {
    float min = 0.0f;
    float max = 0.0f;

    [[nodiscard]] constexpr bool Contains(float seconds) const noexcept {
        return seconds >= min && seconds <= max;
    }

    [[nodiscard]] constexpr bool IsValid() const noexcept {
        return min > 0.0f && max >= min;
    }

    constexpr bool operator==(const DurationRange&) const = default;
};

/// How long a step lasts once the entity has arrived.
///
/// Finite durations are seconds; an indefinite duration never elapses
/// and is used for watching a stage performance until it ends.
class StepDuration {
public:
    [[nodiscard]] static constexpr StepDuration Finite(float seconds) noexcept {
        return StepDuration(seconds);
    }

    [[nodiscard]] static constexpr StepDuration Indefinite() noexcept {
        return StepDuration();
    }

    [[nodiscard]] constexpr bool IsIndefinite() const noexcept { return !seconds_.has_value(); }

    /// Seconds for finite durations; 0 for indefinite ones.
    [[nodiscard]] constexpr float Seconds() const noexcept { return seconds_.value_or(0.0f); }

    /// Whether @p elapsed seconds satisfy this duration.
    [[nodiscard]] constexpr bool IsSatisfiedBy(float elapsed) const noexcept {
        return seconds_.has_value() && elapsed >= *seconds_;
    }

    constexpr bool operator==(const StepDuration&) const = default;

private:
    constexpr StepDuration() = default;
    constexpr explicit StepDuration(float seconds) : seconds_(seconds) {}

    std::optional<float> seconds_;
};

/// Relative likelihood of each step kind for one archetype.
///
/// Dense per-kind table; a kind left at 0 (or set <= 0) is never chosen.
class PersonalityWeights {
public:
    constexpr PersonalityWeights() = default;

    PersonalityWeights(std::initializer_list<std::pair<StepKind, float>> entries) {
        for (const auto& [kind, weight] : entries) {
            Set(kind, weight);
        }
    }

    /// Set the weight for @p kind; negative weights are stored as 0.
    constexpr void Set(StepKind kind, float weight) noexcept {
        weights_[ToIndex(kind)] = weight > 0.0f ? weight : 0.0f;
    }

    [[nodiscard]] constexpr float Get(StepKind kind) const noexcept {
        return weights_[ToIndex(kind)];
    }

    [[nodiscard]] constexpr bool Allows(StepKind kind) const noexcept {
        return Get(kind) > 0.0f;
    }

    /// Sum of all positive weights.
    [[nodiscard]] constexpr float Total() const noexcept {
        float total = 0.0f;
        for (float w : weights_) {
            total += w;
        }
        return total;
    }

    constexpr bool operator==(const PersonalityWeights&) const = default;

private:
    std::array<float, kStepKindCount> weights_{};
};

/// Built-in character archetypes.
enum class Archetype : uint8_t {
    Worker,            ///< Regular staff; the only archetype that performs.
    Inspector,         ///< Mostly checks on workers.
    Presenter,         ///< Checks on workers, presents, paces in circles.
    OutdoorExecutive,  ///< Checks on workers, plays outdoor sports.
    Golfer,            ///< Checks on workers, favours golf.
    Keynoter,          ///< Checks on workers heavily, presents.
    Coach,             ///< Golf first, then checks on workers.
    Audience           ///< Background crowd that mostly wanders.
};

inline constexpr std::size_t kArchetypeCount = 8;

inline constexpr std::array<Archetype, kArchetypeCount> kAllArchetypes = {
    Archetype::Worker,  Archetype::Inspector, Archetype::Presenter, Archetype::OutdoorExecutive,
    Archetype::Golfer,  Archetype::Keynoter,  Archetype::Coach,     Archetype::Audience
};

[[nodiscard]] constexpr std::string_view ArchetypeName(Archetype archetype) noexcept {
    switch (archetype) {
        case Archetype::Worker:           return "worker";
        case Archetype::Inspector:        return "inspector";
        case Archetype::Presenter:        return "presenter";
        case Archetype::OutdoorExecutive: return "outdoor_executive";
        case Archetype::Golfer:           return "golfer";
        case Archetype::Keynoter:         return "keynoter";
        case Archetype::Coach:            return "coach";
        case Archetype::Audience:         return "audience";
    }
    return "unknown";
}

[[nodiscard]] foundation::PlannerResult<Archetype> ParseArchetype(std::string_view name);

/// Built-in weight profile for an archetype.
[[nodiscard]] PersonalityWeights DefaultWeights(Archetype archetype);

/// Built-in duration range for a step kind.
[[nodiscard]] DurationRange DefaultDurationRange(StepKind kind) noexcept;

/// Built-in seat capacity for an area.
[[nodiscard]] constexpr uint32_t DefaultSeatCapacity(SeatArea area) noexcept {
    switch (area) {
        case SeatArea::Kitchen:    return 5;
        case SeatArea::Couch:      return 2;
        case SeatArea::BreakRoom:  return 4;
        case SeatArea::PokerTable: return 4;
    }
    return 0;
}

/// Duration, capacity and archetype tables consulted by the generator.
///
/// Example:
/// @code
///   ConfigManager config;
///   config.load("planner.yaml");
///   BehaviorCatalog catalog;
///   auto applied = catalog.ApplyConfig(config);
///   if (!applied) {
///       // applied.error().key() names the offending entry
///   }
/// @endcode
class BehaviorCatalog {
public:
    /// Catalog populated with the built-in tables.
    BehaviorCatalog();

    [[nodiscard]] const DurationRange& Durations(StepKind kind) const noexcept {
        return durations_[ToIndex(kind)];
    }

    [[nodiscard]] uint32_t Capacity(SeatArea area) const noexcept {
        return capacities_[ToIndex(area)];
    }

    [[nodiscard]] const PersonalityWeights& Weights(Archetype archetype) const noexcept {
        return archetypes_[static_cast<std::size_t>(archetype)];
    }

    foundation::PlannerResult<void> SetDurations(StepKind kind, DurationRange range);
    foundation::PlannerResult<void> SetCapacity(SeatArea area, uint32_t capacity);
    void SetWeights(Archetype archetype, const PersonalityWeights& weights);

    /// Override tables from "catalog.durations.<step>", "catalog.capacity.<area>"
    /// and "catalog.archetypes.<archetype>.<weight key>".
    ///
    /// Archetype sections replace only the keys they list. Validation
    /// happens before anything is modified, so a failed call leaves the
    /// catalog untouched.
    foundation::PlannerResult<void> ApplyConfig(const foundation::ConfigManager& config);

    /// Process-wide catalog holding the built-in tables.
    static const BehaviorCatalog& Default();

private:
    std::array<DurationRange, kStepKindCount> durations_{};
    std::array<uint32_t, kSeatAreaCount> capacities_{};
    std::array<PersonalityWeights, kArchetypeCount> archetypes_{};
};

}  // namespace abp::behavior
