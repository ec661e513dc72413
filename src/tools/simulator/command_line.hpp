#pragma once

/// @file command_line.hpp
/// @brief Simulator command-line parsing.

#include <cstdint>
#include <filesystem>
#include <vector>

#include "abp/behavior/behavior_types.hpp"
#include "abp/foundation/planner_result.hpp"
#include "abp/foundation/types.hpp"

namespace abp::tools {

/// Operator command issued to one entity on the first tick.
struct EntityOverride {
    foundation::EntityId entity;
    behavior::StepKind kind;
};

/// Value of "--config <path>", else ABP_CONFIG_PATH, else empty.
std::filesystem::path parseConfigArg(int argc, const char* const argv[]);

/// Collect "--override <id>=<step>" pairs.
///
/// Rejects unknown step names, malformed or out-of-range entity ids
/// (valid ids are 1..entityCount).
foundation::PlannerResult<std::vector<EntityOverride>> parseOverrides(
    int argc, const char* const argv[], uint32_t entityCount);

}  // namespace abp::tools
