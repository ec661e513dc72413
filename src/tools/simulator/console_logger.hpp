#pragma once

/// @file console_logger.hpp
/// @brief Minimal kcenon ILogger writing to a std::ostream.
///
/// The planner itself only talks to GlobalLoggerRegistry; the simulator
/// registers this logger as the default so that planner output reaches
/// the terminal.

#include <atomic>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>

#include <kcenon/common/interfaces/logger_interface.h>

namespace abp::tools {

class ConsoleLogger : public kcenon::common::interfaces::ILogger {
public:
    using log_level = kcenon::common::interfaces::log_level;

    explicit ConsoleLogger(std::ostream& out, log_level minLevel = log_level::info);

    kcenon::common::VoidResult log(log_level level, const std::string& message) override;

    kcenon::common::VoidResult log(
        log_level level, std::string_view message,
        const kcenon::common::interfaces::source_location& loc) override;

    kcenon::common::VoidResult log(const kcenon::common::interfaces::log_entry& entry) override;

    bool is_enabled(log_level level) const override;
    kcenon::common::VoidResult set_level(log_level level) override;
    log_level get_level() const override;
    kcenon::common::VoidResult flush() override;

private:
    std::mutex mutex_;
    std::ostream& out_;
    std::atomic<log_level> minLevel_;
};

}  // namespace abp::tools
