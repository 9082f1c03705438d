#pragma once

/// @file kit_logger.hpp
/// @brief KitLogger wrapping kcenon common_system logging for the toolkit.
///
/// Provides per-component categories, structured context, and runtime
/// level control. The concrete sink is whatever ILogger the embedding
/// application registers in kcenon's GlobalLoggerRegistry.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "rsk/foundation/kit_result.hpp"

namespace rsk::foundation {

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

/// Toolkit components that log, each with its own minimum level.
enum class LogCategory : uint8_t {
    Core      = 0, ///< Event loop, context, configuration
    Pool      = 1, ///< ConcurrencyPool
    Breaker   = 2, ///< CircuitBreaker state machine
    Retry     = 3, ///< RetryExecutor backoff
    Cache     = 4, ///< TtlCache
    RateLimit = 5, ///< RateLimiter
    Stream    = 6  ///< Stream hub, data/search/change/health streams
};

/// Total number of log categories.
inline constexpr std::size_t kLogCategoryCount = 7;

/// Return the string name for a log category.
constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Pool", "Breaker", "Retry", "Cache", "RateLimit", "Stream"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

/// Return the string name for a log level.
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

/// Structured context attached to a log entry.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.component = "catalog-db";
///   ctx.attempt = 2;
///   logger.logWithContext(LogLevel::Warning, LogCategory::Retry,
///                         "attempt failed, backing off", ctx);
/// @endcode
struct LogContext {
    std::optional<std::string> component;
    std::optional<std::string> key;
    std::optional<uint32_t> attempt;
    std::optional<std::string> traceId;
    std::unordered_map<std::string, std::string> extra;
};

/// Toolkit logger over kcenon's logging interfaces.
///
/// Default log levels per category:
/// | Category  | Default Level |
/// |-----------|---------------|
/// | Core      | Info          |
/// | Pool      | Info          |
/// | Breaker   | Info          |
/// | Retry     | Debug         |
/// | Cache     | Info          |
/// | RateLimit | Info          |
/// | Stream    | Info          |
///
/// Example:
/// @code
///   KitLogger logger;
///   logger.log(LogLevel::Info, LogCategory::Core, "toolkit context ready");
///   logger.setCategoryLevel(LogCategory::Stream, LogLevel::Debug);
/// @endcode
class KitLogger {
public:
    KitLogger();
    ~KitLogger();

    // Non-copyable, movable.
    KitLogger(const KitLogger&) = delete;
    KitLogger& operator=(const KitLogger&) = delete;
    KitLogger(KitLogger&&) noexcept;
    KitLogger& operator=(KitLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context appended as {key=val, ...}.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush the default kcenon logger.
    KitResult<void> flush();

    /// Process-wide logger used by the RSK_LOG macros.
    static KitLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace rsk::foundation

// ---------------------------------------------------------------------------
// Convenience macros (must be outside namespace: macros are global)
// ---------------------------------------------------------------------------

/// @name RSK_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// RSK_MIN_LOG_LEVEL can be defined before including this header to
/// eliminate logging calls below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
/// @{

#ifndef RSK_MIN_LOG_LEVEL
    #define RSK_MIN_LOG_LEVEL 0
#endif

#define RSK_LOG(level, cat, msg)                                                 \
    do {                                                                         \
        _Pragma("GCC diagnostic push")                                           \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                      \
        if (static_cast<int>(level) >= RSK_MIN_LOG_LEVEL &&                      \
            ::rsk::foundation::KitLogger::instance().isEnabled((level), (cat)))  \
        {                                                                        \
            ::rsk::foundation::KitLogger::instance().log((level), (cat), (msg)); \
        }                                                                        \
        _Pragma("GCC diagnostic pop")                                            \
    } while (0)

#define RSK_LOG_DEBUG(cat, msg) \
    RSK_LOG(::rsk::foundation::LogLevel::Debug, (cat), (msg))

#define RSK_LOG_INFO(cat, msg) \
    RSK_LOG(::rsk::foundation::LogLevel::Info, (cat), (msg))

#define RSK_LOG_WARN(cat, msg) \
    RSK_LOG(::rsk::foundation::LogLevel::Warning, (cat), (msg))

#define RSK_LOG_ERROR(cat, msg) \
    RSK_LOG(::rsk::foundation::LogLevel::Error, (cat), (msg))

/// @}
