/// @file command_line.cpp
/// @brief Simulator command-line parsing.

#include "command_line.hpp"

#include <charconv>
#include <cstdlib>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace abp::tools {

using foundation::EntityId;
using foundation::ErrorCode;
using foundation::PlannerError;
using foundation::PlannerResult;

std::filesystem::path parseConfigArg(int argc, const char* const argv[]) {
    for (int i = 1; i < argc - 1; ++i) {
        if (std::string_view(argv[i]) == "--config") {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            return argv[i + 1];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        }
    }
    const char* envPath = std::getenv("ABP_CONFIG_PATH");
    if (envPath != nullptr) {
        return envPath;
    }
    return {};
}

PlannerResult<std::vector<EntityOverride>> parseOverrides(int argc, const char* const argv[],
                                                          uint32_t entityCount) {
    using Result = PlannerResult<std::vector<EntityOverride>>;

    std::vector<EntityOverride> overrides;
    for (int i = 1; i < argc - 1; ++i) {
        if (std::string_view(argv[i]) != "--override") {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            continue;
        }
        std::string_view arg = argv[i + 1];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        auto eq = arg.find('=');
        if (eq == std::string_view::npos || eq == 0) {
            return Result::err(
                PlannerError(ErrorCode::InvalidArgument,
                             "override must look like <entity>=<step>: " + std::string(arg)));
        }
        auto kind = behavior::ParseOverrideKind(arg.substr(eq + 1));
        if (!kind) {
            return Result::err(kind.error());
        }

        auto idText = arg.substr(0, eq);
        uint64_t id = 0;
        auto [end, ec] = std::from_chars(idText.data(), idText.data() + idText.size(), id);
        if (ec == std::errc::result_out_of_range) {
            return Result::err(PlannerError(ErrorCode::InvalidArgument,
                                            "override entity is out of range: " + std::string(arg)));
        }
        if (ec != std::errc{} || end != idText.data() + idText.size()) {
            return Result::err(PlannerError(ErrorCode::InvalidArgument,
                                            "override entity must be numeric: " + std::string(arg)));
        }
        if (id == 0 || id > entityCount) {
            return Result::err(PlannerError(
                ErrorCode::InvalidArgument,
                "override entity " + std::to_string(id) + " is not in 1.." +
                    std::to_string(entityCount)));
        }

        overrides.push_back({EntityId(id), kind.value()});
    }
    return Result::ok(std::move(overrides));
}

}  // namespace abp::tools
