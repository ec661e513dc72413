#pragma once

/// @file planner_logger.hpp
/// @brief PlannerLogger wrapping kcenon common_system logging for the planner.
///
/// Provides category-based filtering, structured logging with context,
/// and per-category runtime log level control.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "abp/foundation/planner_result.hpp"
#include "abp/foundation/types.hpp"

namespace abp::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally.
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Planner log categories, each with its own minimum level.
enum class LogCategory : uint8_t {
    Core      = 0, ///< Library setup, configuration
    Catalog   = 1, ///< Weight/duration/capacity tables
    Generator = 2, ///< Plan generation
    Executor  = 3, ///< Plan lifecycle transitions
    Stage     = 4, ///< Stage interrupts and restores
    World     = 5  ///< Seat claims, target resolution
};

inline constexpr std::size_t kLogCategoryCount = 6;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Catalog", "Generator", "Executor", "Stage", "World"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Structured context appended to a log entry.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.entityId = EntityId(7);
///   ctx.extra["kind"] = "watch_stage";
///   logger.logWithContext(LogLevel::Debug, LogCategory::Stage,
///                         "Plan interrupted", ctx);
/// @endcode
struct LogContext {
    std::optional<EntityId> entityId;
    std::unordered_map<std::string, std::string> extra;
};

/// Planner logger routing to kcenon's GlobalLoggerRegistry.
///
/// Messages are sent to the named logger "abp.<Category>" when one is
/// registered, otherwise to the registry's default logger.
///
/// Default log levels per category:
/// | Category  | Default Level |
/// |-----------|---------------|
/// | Core      | Info          |
/// | Catalog   | Info          |
/// | Generator | Debug         |
/// | Executor  | Debug         |
/// | Stage     | Info          |
/// | World     | Info          |
class PlannerLogger {
public:
    PlannerLogger();
    ~PlannerLogger();

    PlannerLogger(const PlannerLogger&) = delete;
    PlannerLogger& operator=(const PlannerLogger&) = delete;
    PlannerLogger(PlannerLogger&&) noexcept;
    PlannerLogger& operator=(PlannerLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message followed by " {key=val, ...}" context.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush the default logger.
    PlannerResult<void> flush();

    /// Process-wide logger used by the ABP_LOG macros.
    static PlannerLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// Parse "trace", "debug", "info", "warning", "error", "critical" or "off".
[[nodiscard]] std::optional<LogLevel> parseLogLevel(std::string_view name);

} // namespace abp::foundation

/// @name ABP_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// Define ABP_MIN_LOG_LEVEL before including this header to compile out
/// calls below the threshold.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
/// @{

#ifndef ABP_MIN_LOG_LEVEL
    #define ABP_MIN_LOG_LEVEL 0
#endif

#define ABP_LOG(level, cat, msg)                                                     \
    do {                                                                             \
        _Pragma("GCC diagnostic push")                                               \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                          \
        if (static_cast<int>(level) >= ABP_MIN_LOG_LEVEL &&                          \
            ::abp::foundation::PlannerLogger::instance().isEnabled((level), (cat)))  \
        {                                                                            \
            ::abp::foundation::PlannerLogger::instance().log((level), (cat), (msg)); \
        }                                                                            \
        _Pragma("GCC diagnostic pop")                                                \
    } while (0)

#define ABP_LOG_CTX(level, cat, msg, ctx)                                             \
    do {                                                                              \
        _Pragma("GCC diagnostic push")                                                \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                           \
        if (static_cast<int>(level) >= ABP_MIN_LOG_LEVEL &&                           \
            ::abp::foundation::PlannerLogger::instance().isEnabled((level), (cat)))   \
        {                                                                             \
            ::abp::foundation::PlannerLogger::instance().logWithContext(              \
                (level), (cat), (msg), (ctx));                                        \
        }                                                                             \
        _Pragma("GCC diagnostic pop")                                                 \
    } while (0)

#define ABP_LOG_DEBUG(cat, msg) \
    ABP_LOG(::abp::foundation::LogLevel::Debug, (cat), (msg))

#define ABP_LOG_INFO(cat, msg) \
    ABP_LOG(::abp::foundation::LogLevel::Info, (cat), (msg))

#define ABP_LOG_WARN(cat, msg) \
    ABP_LOG(::abp::foundation::LogLevel::Warning, (cat), (msg))

#define ABP_LOG_ERROR(cat, msg) \
    ABP_LOG(::abp::foundation::LogLevel::Error, (cat), (msg))

/// @}
