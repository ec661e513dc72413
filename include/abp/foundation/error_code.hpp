#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the behavior planner.

#include <cstdint>
#include <string_view>

namespace abp::foundation {

/// Error codes grouped by subsystem in 0x100-wide ranges, so the
/// origin of an error can be read off the code value.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,

    // Catalog (0x0100 - 0x01FF)
    UnknownStepKind = 0x0100,
    UnknownWeightKey = 0x0101,
    UnknownSeatArea = 0x0102,
    UnknownArchetype = 0x0103,
    InvalidDurationRange = 0x0104,
    InvalidWeight = 0x0105,
    InvalidCapacity = 0x0106,

    // Planner (0x0200 - 0x02FF)
    InvalidStepCountRange = 0x0200,
    InvalidProbability = 0x0201,
    InvalidTickSettings = 0x0202,

    // Config (0x0300 - 0x03FF)
    ConfigLoadFailed = 0x0300,
    ConfigKeyNotFound = 0x0301,
    ConfigTypeMismatch = 0x0302,

    // Logger (0x0400 - 0x04FF)
    LoggerError = 0x0400,
    LoggerNotInitialized = 0x0401,
    LoggerFlushFailed = 0x0402,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "Catalog";
        case 0x0200: return "Planner";
        case 0x0300: return "Config";
        case 0x0400: return "Logger";
        default: return "Unknown";
    }
}

} // namespace abp::foundation
