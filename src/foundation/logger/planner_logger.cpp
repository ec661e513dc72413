/// @file planner_logger.cpp
/// @brief PlannerLogger implementation on top of kcenon common_system.

#include "abp/foundation/planner_logger.hpp"

// kcenon logger headers (hidden behind PIMPL)
#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

#include <array>
#include <atomic>
#include <sstream>
#include <string>

namespace abp::foundation {

namespace kci = kcenon::common::interfaces;

// ---------------------------------------------------------------------------
// Level mapping: ABP -> kcenon
// ---------------------------------------------------------------------------
static kci::log_level mapLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return kci::log_level::trace;
        case LogLevel::Debug:    return kci::log_level::debug;
        case LogLevel::Info:     return kci::log_level::info;
        case LogLevel::Warning:  return kci::log_level::warning;
        case LogLevel::Error:    return kci::log_level::error;
        case LogLevel::Critical: return kci::log_level::critical;
        case LogLevel::Off:      return kci::log_level::off;
    }
    return kci::log_level::info;
}

static constexpr std::array<LogLevel, kLogCategoryCount> kDefaultCategoryLevels = {
    LogLevel::Info,   // Core
    LogLevel::Info,   // Catalog
    LogLevel::Debug,  // Generator
    LogLevel::Debug,  // Executor
    LogLevel::Info,   // Stage
    LogLevel::Info    // World
};

static std::string formatContext(const LogContext& ctx) {
    std::ostringstream oss;
    bool first = true;

    auto append = [&](std::string_view key, std::string_view val) {
        if (!first) {
            oss << ", ";
        }
        oss << key << '=' << val;
        first = false;
    };

    if (ctx.entityId && ctx.entityId->isValid()) {
        append("entity_id", std::to_string(ctx.entityId->value()));
    }
    for (const auto& [key, val] : ctx.extra) {
        append(key, val);
    }

    return oss.str();
}

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct PlannerLogger::Impl {
    std::array<std::atomic<LogLevel>, kLogCategoryCount> categoryLevels;
    std::array<std::string, kLogCategoryCount> loggerNames;

    Impl() {
        for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
            categoryLevels[i].store(kDefaultCategoryLevels[i],
                                    std::memory_order_relaxed);
            loggerNames[i] = std::string("abp.") +
                std::string(logCategoryName(static_cast<LogCategory>(i)));
        }
    }

    std::shared_ptr<kci::ILogger> getLogger(LogCategory cat) const {
        auto idx = static_cast<std::size_t>(cat);
        if (idx >= kLogCategoryCount) {
            return kci::GlobalLoggerRegistry::null_logger();
        }
        // An unregistered name resolves to the null logger, which reports
        // every level as disabled; route those to the default logger.
        auto& registry = kci::GlobalLoggerRegistry::instance();
        auto named = registry.get_logger(loggerNames[idx]);
        if (named && named->is_enabled(kci::log_level::critical)) {
            return named;
        }
        return registry.get_default_logger();
    }

    void emit(LogLevel level, LogCategory cat, const std::string& formatted) const {
        auto logger = getLogger(cat);
        if (!logger) {
            return;
        }
        auto result = logger->log(mapLevel(level), formatted);
        (void)result;  // a failed write has nowhere else to be reported
    }
};

// ---------------------------------------------------------------------------
// Construction / Destruction / Move
// ---------------------------------------------------------------------------
PlannerLogger::PlannerLogger() : impl_(std::make_unique<Impl>()) {}

PlannerLogger::~PlannerLogger() = default;

PlannerLogger::PlannerLogger(PlannerLogger&&) noexcept = default;
PlannerLogger& PlannerLogger::operator=(PlannerLogger&&) noexcept = default;

// ---------------------------------------------------------------------------
// log() / logWithContext()
// ---------------------------------------------------------------------------
void PlannerLogger::log(LogLevel level, LogCategory cat, std::string_view msg) {
    if (!isEnabled(level, cat)) {
        return;
    }

    // Format: [Category] message
    std::string formatted;
    formatted.reserve(msg.size() + 16);
    formatted += '[';
    formatted += logCategoryName(cat);
    formatted += "] ";
    formatted += msg;

    impl_->emit(level, cat, formatted);
}

void PlannerLogger::logWithContext(LogLevel level, LogCategory cat,
                                   std::string_view msg, const LogContext& ctx) {
    if (!isEnabled(level, cat)) {
        return;
    }

    std::string ctxStr = formatContext(ctx);

    // Format: [Category] message {key=val, ...}
    std::string formatted;
    formatted.reserve(msg.size() + ctxStr.size() + 20);
    formatted += '[';
    formatted += logCategoryName(cat);
    formatted += "] ";
    formatted += msg;
    if (!ctxStr.empty()) {
        formatted += " {";
        formatted += ctxStr;
        formatted += '}';
    }

    impl_->emit(level, cat, formatted);
}

// ---------------------------------------------------------------------------
// Category level control
// ---------------------------------------------------------------------------
void PlannerLogger::setCategoryLevel(LogCategory cat, LogLevel minLevel) {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        impl_->categoryLevels[idx].store(minLevel, std::memory_order_release);
    }
}

LogLevel PlannerLogger::getCategoryLevel(LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        return impl_->categoryLevels[idx].load(std::memory_order_acquire);
    }
    return LogLevel::Off;
}

bool PlannerLogger::isEnabled(LogLevel level, LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx >= kLogCategoryCount || level == LogLevel::Off) {
        return false;
    }
    auto minLevel = impl_->categoryLevels[idx].load(std::memory_order_acquire);
    return static_cast<uint8_t>(level) >= static_cast<uint8_t>(minLevel);
}

PlannerResult<void> PlannerLogger::flush() {
    auto& registry = kci::GlobalLoggerRegistry::instance();
    auto logger = registry.get_default_logger();
    if (!logger) {
        return PlannerResult<void>::err(
            PlannerError(ErrorCode::LoggerNotInitialized, "no default logger registered"));
    }
    auto result = logger->flush();
    if (result.is_err()) {
        return PlannerResult<void>::err(
            PlannerError(ErrorCode::LoggerFlushFailed, "failed to flush logger"));
    }
    return PlannerResult<void>::ok();
}

PlannerLogger& PlannerLogger::instance() {
    static PlannerLogger inst;
    return inst;
}

std::optional<LogLevel> parseLogLevel(std::string_view name) {
    for (auto level : {LogLevel::Trace, LogLevel::Debug, LogLevel::Info, LogLevel::Warning,
                       LogLevel::Error, LogLevel::Critical, LogLevel::Off}) {
        auto upper = logLevelName(level);
        if (upper.size() != name.size()) {
            continue;
        }
        bool same = true;
        for (std::size_t i = 0; i < name.size(); ++i) {
            char c = name[i];
            if (c >= 'a' && c <= 'z') {
                c = static_cast<char>(c - 'a' + 'A');
            }
            if (c != upper[i]) {
                same = false;
                break;
            }
        }
        if (same) {
            return level;
        }
    }
    return std::nullopt;
}

} // namespace abp::foundation
