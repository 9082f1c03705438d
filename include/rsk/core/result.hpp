#pragma once

/// @file result.hpp
/// @brief Result<T,E> type carried by every fallible call and every settled future.

#include <string>
#include <utility>
#include <variant>

namespace rsk {

/// Minimal error payload for Result when no richer error type is needed.
struct Error {
    int code = 0;
    std::string message;

    Error() = default;
    explicit Error(std::string msg) : code(-1), message(std::move(msg)) {}
    Error(int c, std::string msg) : code(c), message(std::move(msg)) {}
};

/// Value-or-error return type.
///
/// The toolkit never throws across its API: synchronous calls return a
/// Result directly and asynchronous calls settle a Future with one.
///
/// @tparam T The success value type.
/// @tparam E The error type (defaults to rsk::Error).
///
/// Example:
/// @code
///   auto settings = loadToolkitSettings(config);
///   if (settings.hasValue()) {
///       pool.emplace(loop, settings.value().poolConcurrency);
///   } else {
///       log(settings.error().message());
///   }
/// @endcode
template <typename T, typename E = Error>
class Result {
public:
    using ValueType = T;
    using ErrorType = E;

    /// Construct a success result.
    static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }

    /// Construct an error result.
    static Result err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return data_.index() == 0; }
    [[nodiscard]] bool hasError() const noexcept { return data_.index() == 1; }

    /// True on success.
    explicit operator bool() const noexcept { return hasValue(); }

    /// Access the success value (undefined behavior if error).
    [[nodiscard]] const T& value() const& { return std::get<0>(data_); }
    [[nodiscard]] T& value() & { return std::get<0>(data_); }
    [[nodiscard]] T&& value() && { return std::get<0>(std::move(data_)); }

    /// Access the error (undefined behavior if success).
    [[nodiscard]] const E& error() const& { return std::get<1>(data_); }
    [[nodiscard]] E& error() & { return std::get<1>(data_); }
    [[nodiscard]] E&& error() && { return std::get<1>(std::move(data_)); }

    /// Access value or return a default.
    [[nodiscard]] T valueOr(T defaultValue) const& {
        return hasValue() ? value() : std::move(defaultValue);
    }

private:
    template <std::size_t I, typename U>
    Result(std::in_place_index_t<I> tag, U&& payload)
        : data_(tag, std::forward<U>(payload)) {}

    // Indexed rather than typed so that T and E may be the same type.
    std::variant<T, E> data_;
};

/// Specialization for operations that produce no value.
template <typename E>
class Result<void, E> {
public:
    using ValueType = void;
    using ErrorType = E;

    static Result ok() { return Result(true); }
    static Result err(E error) { return Result(std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return success_; }
    [[nodiscard]] bool hasError() const noexcept { return !success_; }
    explicit operator bool() const noexcept { return success_; }

    [[nodiscard]] const E& error() const& { return error_; }
    [[nodiscard]] E& error() & { return error_; }

private:
    explicit Result(bool) : success_(true) {}
    explicit Result(E error) : success_(false), error_(std::move(error)) {}

    bool success_ = false;
    E error_;
};

}  // namespace rsk
