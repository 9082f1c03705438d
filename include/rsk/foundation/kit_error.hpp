#pragma once

/// @file kit_error.hpp
/// @brief Toolkit error type used with Result<T, KitError>.

#include <any>
#include <cstdio>
#include <string>
#include <string_view>
#include <utility>

#include "rsk/foundation/error_code.hpp"

namespace rsk::foundation {

/// Error carrying a categorized code, a human-readable message,
/// and optional type-erased context (e.g. the original failure of a
/// timed-out call or the HTTP status a factory observed).
class KitError {
public:
    KitError() = default;

    explicit KitError(ErrorCode code)
        : code_(code) {}

    KitError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    KitError(ErrorCode code, std::string message, std::any context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// The subsystem that produced this error.
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// Access typed context data (returns nullptr if type mismatch or empty).
    template <typename T>
    [[nodiscard]] const T* context() const noexcept {
        return std::any_cast<T>(&context_);
    }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

    [[nodiscard]] bool isSuccess() const noexcept {
        return code_ == ErrorCode::Success;
    }

    /// Single-line rendering for logs: "Async/0x0101: message".
    [[nodiscard]] std::string describe() const {
        char code[8];
        std::snprintf(code, sizeof(code), "0x%04x", static_cast<unsigned>(code_));
        std::string out(subsystem());
        out += '/';
        out += code;
        if (!message_.empty()) {
            out += ": ";
            out += message_;
        }
        return out;
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::any context_;
};

} // namespace rsk::foundation
