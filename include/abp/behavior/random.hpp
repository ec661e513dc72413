#pragma once

/// @file random.hpp
/// @brief Seedable pure pseudo-random generator for plan generation.
///
/// The primitive is a SplitMix64 step expressed as a pure function:
/// a state goes in, a value and the successor state come out. Nothing
/// reads a global generator or the clock, so a seed fully determines
/// every plan an executor produces.

#include <cstdint>

namespace abp::behavior {

/// Opaque generator state.
struct RngState {
    uint64_t value = 0;

    constexpr bool operator==(const RngState&) const = default;
};

/// A drawn value together with the state to use for the next draw.
template <typename T>
struct Draw {
    T value;
    RngState next;
};

/// Advance the generator by one step.
[[nodiscard]] constexpr Draw<uint64_t> NextRandom(RngState state) noexcept {
    uint64_t s = state.value + 0x9E3779B97F4A7C15ULL;
    uint64_t z = s;
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
    return {z ^ (z >> 31), RngState{s}};
}

/// Uniform double in [0, 1).
[[nodiscard]] constexpr Draw<double> NextUnit(RngState state) noexcept {
    auto [bits, next] = NextRandom(state);
    return {static_cast<double>(bits >> 11) * (1.0 / 9007199254740992.0), next};
}

/// Uniform real in [lo, hi). Returns lo when hi <= lo.
[[nodiscard]] constexpr Draw<double> UniformReal(RngState state, double lo, double hi) noexcept {
    auto [unit, next] = NextUnit(state);
    if (hi <= lo) {
        return {lo, next};
    }
    return {lo + unit * (hi - lo), next};
}

/// Uniform integer in [lo, hi] (inclusive). Returns lo when hi <= lo.
[[nodiscard]] constexpr Draw<uint32_t> UniformInt(RngState state, uint32_t lo, uint32_t hi) noexcept {
    auto [bits, next] = NextRandom(state);
    if (hi <= lo) {
        return {lo, next};
    }
    const uint64_t span = static_cast<uint64_t>(hi) - lo + 1;
    return {lo + static_cast<uint32_t>(bits % span), next};
}

/// Mix an entity-specific salt into a base seed so that entities sharing
/// one configured seed still follow distinct sequences.
[[nodiscard]] constexpr uint64_t DeriveSeed(uint64_t baseSeed, uint64_t salt) noexcept {
    return NextRandom(RngState{baseSeed ^ (salt * 0xD1B54A32D192ED03ULL)}).value;
}

/// Mutable convenience wrapper threading an RngState through calls.
class RandomStream {
public:
    constexpr RandomStream() = default;
    constexpr explicit RandomStream(uint64_t seed) : state_{seed} {}
    constexpr explicit RandomStream(RngState state) : state_(state) {}

    constexpr uint64_t Next() noexcept { return take(NextRandom(state_)); }

    constexpr double NextUnit() noexcept { return take(abp::behavior::NextUnit(state_)); }

    constexpr double Uniform(double lo, double hi) noexcept {
        return take(UniformReal(state_, lo, hi));
    }

    constexpr uint32_t UniformInt(uint32_t lo, uint32_t hi) noexcept {
        return take(abp::behavior::UniformInt(state_, lo, hi));
    }

    /// True with probability @p p (clamped to [0, 1]).
    constexpr bool Chance(double p) noexcept { return NextUnit() < p; }

    [[nodiscard]] constexpr RngState State() const noexcept { return state_; }

private:
    template <typename T>
    constexpr T take(Draw<T> draw) noexcept {
        state_ = draw.next;
        return draw.value;
    }

    RngState state_{};
};

}  // namespace abp::behavior
