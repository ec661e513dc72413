/// @file console_logger.cpp
/// @brief ConsoleLogger implementation.

#include "console_logger.hpp"

#include <variant>

namespace abp::tools {

namespace kci = kcenon::common::interfaces;

namespace {

std::string_view levelTag(kci::log_level level) {
    switch (level) {
        case kci::log_level::trace:    return "TRACE";
        case kci::log_level::debug:    return "DEBUG";
        case kci::log_level::info:     return "INFO ";
        case kci::log_level::warning:  return "WARN ";
        case kci::log_level::error:    return "ERROR";
        case kci::log_level::critical: return "CRIT ";
        default:                       return "     ";
    }
}

}  // namespace

ConsoleLogger::ConsoleLogger(std::ostream& out, log_level minLevel)
    : out_(out), minLevel_(minLevel) {}

kcenon::common::VoidResult ConsoleLogger::log(log_level level, const std::string& message) {
    if (!is_enabled(level)) {
        return kcenon::common::VoidResult::ok(std::monostate{});
    }
    std::lock_guard lock(mutex_);
    out_ << levelTag(level) << ' ' << message << '\n';
    return kcenon::common::VoidResult::ok(std::monostate{});
}

kcenon::common::VoidResult ConsoleLogger::log(log_level level, std::string_view message,
                                              const kci::source_location& /*loc*/) {
    return log(level, std::string(message));
}

kcenon::common::VoidResult ConsoleLogger::log(const kci::log_entry& entry) {
    return log(entry.level, entry.message);
}

bool ConsoleLogger::is_enabled(log_level level) const {
    return level != log_level::off && level >= minLevel_.load(std::memory_order_acquire);
}

kcenon::common::VoidResult ConsoleLogger::set_level(log_level level) {
    minLevel_.store(level, std::memory_order_release);
    return kcenon::common::VoidResult::ok(std::monostate{});
}

ConsoleLogger::log_level ConsoleLogger::get_level() const {
    return minLevel_.load(std::memory_order_acquire);
}

kcenon::common::VoidResult ConsoleLogger::flush() {
    std::lock_guard lock(mutex_);
    out_.flush();
    return kcenon::common::VoidResult::ok(std::monostate{});
}

}  // namespace abp::tools
