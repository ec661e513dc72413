#pragma once

/// @file result.hpp
/// @brief Result<T,E> for boundary operations that can fail.
///
/// The planner core itself never fails; Result is used where external
/// input enters the library (configuration, operator commands, logger
/// back-ends).

#include <string>
#include <utility>
#include <variant>

namespace abp {

/// Minimal error payload for the untyped Result form.
struct Error {
    int code = 0;
    std::string message;

    Error() = default;
    explicit Error(std::string msg) : code(-1), message(std::move(msg)) {}
    Error(int c, std::string msg) : code(c), message(std::move(msg)) {}
};

/// Either a value of type T or an error of type E.
///
/// Example:
/// @code
///   auto kind = ParseStepKind("go_to_couch");
///   if (kind) {
///       executor.ApplyOverride(kind.value());
///   }
/// @endcode
template <typename T, typename E = Error>
class Result {
public:
    static Result ok(T value) { return Result(std::move(value)); }
    static Result err(E error) { return Result(std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return std::holds_alternative<T>(data_); }
    [[nodiscard]] bool hasError() const noexcept { return std::holds_alternative<E>(data_); }

    explicit operator bool() const noexcept { return hasValue(); }

    /// Access the value. Calling this on an error result throws
    /// std::bad_variant_access.
    [[nodiscard]] const T& value() const& { return std::get<T>(data_); }
    [[nodiscard]] T& value() & { return std::get<T>(data_); }
    [[nodiscard]] T&& value() && { return std::get<T>(std::move(data_)); }

    [[nodiscard]] const E& error() const& { return std::get<E>(data_); }
    [[nodiscard]] E& error() & { return std::get<E>(data_); }

    [[nodiscard]] T valueOr(T fallback) const& {
        return hasValue() ? value() : std::move(fallback);
    }

private:
    explicit Result(T value) : data_(std::in_place_index<0>, std::move(value)) {}
    explicit Result(E error) : data_(std::in_place_index<1>, std::move(error)) {}

    std::variant<T, E> data_;
};

/// Result with no success payload.
template <typename E>
class Result<void, E> {
public:
    static Result ok() { return Result(); }
    static Result err(E error) { return Result(std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return success_; }
    [[nodiscard]] bool hasError() const noexcept { return !success_; }
    explicit operator bool() const noexcept { return success_; }

    [[nodiscard]] const E& error() const& { return error_; }

private:
    Result() : success_(true) {}
    explicit Result(E error) : success_(false), error_(std::move(error)) {}

    bool success_ = false;
    E error_;
};

}  // namespace abp
