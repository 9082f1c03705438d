#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the resilience toolkit.

#include <cstdint>
#include <string_view>

namespace rsk::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), making it possible
/// to determine the error source from the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    AlreadyExists = 0x0004,
    TypeMismatch = 0x0005,

    // Async (0x0100 - 0x01FF)
    AsyncError = 0x0100,
    Timeout = 0x0101,
    Cancelled = 0x0102,
    TaskFailed = 0x0103,
    InvalidFuture = 0x0104,

    // Resilience (0x0200 - 0x02FF)
    ResilienceError = 0x0200,
    CircuitOpen = 0x0201,
    RateLimited = 0x0202,

    // Stream (0x0300 - 0x03FF)
    StreamError = 0x0300,
    ChannelNotFound = 0x0301,
    ChannelTypeMismatch = 0x0302,
    ChannelCompleted = 0x0303,
    FetchFailed = 0x0304,
    SearchFailed = 0x0305,
    HealthCheckFailed = 0x0306,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,
    ConfigInvalidValue = 0x0603,

    // Logger (0x0800 - 0x08FF)
    LoggerError = 0x0800,
    LoggerNotInitialized = 0x0801,
    LoggerFlushFailed = 0x0802,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "Async";
        case 0x0200: return "Resilience";
        case 0x0300: return "Stream";
        case 0x0600: return "Config";
        case 0x0800: return "Logger";
        default: return "Unknown";
    }
}

} // namespace rsk::foundation
