#pragma once

/// @file version.hpp
/// @brief Project version information and core namespace definition.

#define ABP_VERSION_MAJOR 0
#define ABP_VERSION_MINOR 3
#define ABP_VERSION_PATCH 0
#define ABP_VERSION_STRING "0.3.0"

namespace abp {

/// Planner library version at compile time.
struct Version {
    static constexpr int major = ABP_VERSION_MAJOR;
    static constexpr int minor = ABP_VERSION_MINOR;
    static constexpr int patch = ABP_VERSION_PATCH;
    static constexpr const char* string = ABP_VERSION_STRING;
};

} // namespace abp
