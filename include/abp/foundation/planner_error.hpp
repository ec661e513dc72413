#pragma once

/// @file planner_error.hpp
/// @brief Planner error type used with Result<T, PlannerError>.

#include <string>
#include <string_view>
#include <utility>

#include "abp/foundation/error_code.hpp"

namespace abp::foundation {

/// Error carrying a categorized code, a readable message and, when the
/// failure concerns a configuration entry, the offending dotted key.
class PlannerError {
public:
    PlannerError() = default;

    explicit PlannerError(ErrorCode code)
        : code_(code) {}

    PlannerError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    PlannerError(ErrorCode code, std::string message, std::string key)
        : code_(code), message_(std::move(message)), key_(std::move(key)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// Configuration key the error refers to (empty if none).
    [[nodiscard]] std::string_view key() const noexcept { return key_; }

    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    [[nodiscard]] bool isSuccess() const noexcept {
        return code_ == ErrorCode::Success;
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::string key_;
};

} // namespace abp::foundation
