/// @file toolkit_settings.cpp
/// @brief loadToolkitSettings() key mapping and validation.

#include "rsk/toolkit_settings.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>

namespace rsk {

using foundation::ConfigManager;
using foundation::ErrorCode;
using foundation::KitError;
using foundation::KitResult;
using foundation::LogCategory;
using foundation::LogLevel;

namespace {

/// Reads keys into settings fields, stopping at the first error.
class SettingsReader {
public:
    explicit SettingsReader(const ConfigManager& config) : config_(config) {}

    template <typename T>
    void value(std::string_view key, T& out) {
        if (error_) {
            return;
        }
        auto read = config_.getOr<T>(key, out);
        if (!read) {
            error_ = read.error();
            return;
        }
        out = read.value();
    }

    void integer(std::string_view key, int64_t& out, int64_t min) {
        value(key, out);
        if (!error_ && out < min) {
            invalid(key, "must be at least " + std::to_string(min));
        }
    }

    void count(std::string_view key, uint32_t& out, int64_t min) {
        int64_t wide = out;
        integer(key, wide, min);
        if (error_) {
            return;
        }
        if (wide > std::numeric_limits<uint32_t>::max()) {
            invalid(key, "is too large");
            return;
        }
        out = static_cast<uint32_t>(wide);
    }

    void size(std::string_view key, std::size_t& out, int64_t min) {
        int64_t wide = static_cast<int64_t>(out);
        integer(key, wide, min);
        if (!error_) {
            out = static_cast<std::size_t>(wide);
        }
    }

    void millis(std::string_view key, std::chrono::milliseconds& out, int64_t min) {
        int64_t wide = out.count();
        integer(key, wide, min);
        if (!error_) {
            out = std::chrono::milliseconds(wide);
        }
    }

    void logLevel(LogCategory cat, std::map<LogCategory, LogLevel>& out) {
        if (error_) {
            return;
        }
        std::string key = "logging.";
        for (char c : foundation::logCategoryName(cat)) {
            key += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        if (!config_.hasKey(key)) {
            return;
        }
        auto text = config_.get<std::string>(key);
        if (!text) {
            error_ = text.error();
            return;
        }
        auto level = parseLogLevel(text.value());
        if (!level) {
            invalid(key, "is not a log level: " + text.value());
            return;
        }
        out[cat] = level.value();
    }

    [[nodiscard]] const std::optional<KitError>& error() const { return error_; }

private:
    void invalid(std::string_view key, const std::string& what) {
        error_ = KitError(ErrorCode::ConfigInvalidValue, std::string(key) + " " + what);
    }

    const ConfigManager& config_;
    std::optional<KitError> error_;
};

} // namespace

KitResult<LogLevel> parseLogLevel(std::string_view text) {
    std::string lower;
    lower.reserve(text.size());
    for (char c : text) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    if (lower == "trace") return KitResult<LogLevel>::ok(LogLevel::Trace);
    if (lower == "debug") return KitResult<LogLevel>::ok(LogLevel::Debug);
    if (lower == "info") return KitResult<LogLevel>::ok(LogLevel::Info);
    if (lower == "warning" || lower == "warn") return KitResult<LogLevel>::ok(LogLevel::Warning);
    if (lower == "error") return KitResult<LogLevel>::ok(LogLevel::Error);
    if (lower == "critical") return KitResult<LogLevel>::ok(LogLevel::Critical);
    if (lower == "off") return KitResult<LogLevel>::ok(LogLevel::Off);

    return KitResult<LogLevel>::err(
        KitError(ErrorCode::InvalidArgument, "unknown log level: " + std::string(text)));
}

KitResult<ToolkitSettings> loadToolkitSettings(const ConfigManager& config) {
    ToolkitSettings s;
    SettingsReader read(config);

    read.size("pool.concurrency", s.pool.concurrency, 1);
    read.value("pool.name", s.pool.name);

    read.count("circuit_breaker.failure_threshold", s.breaker.failureThreshold, 1);
    read.millis("circuit_breaker.call_timeout_ms", s.breaker.callTimeout, 1);
    read.millis("circuit_breaker.reset_timeout_ms", s.breaker.resetTimeout, 0);
    read.value("circuit_breaker.name", s.breaker.name);

    read.count("retry.max_attempts", s.retry.maxAttempts, 1);
    read.millis("retry.base_delay_ms", s.retry.baseDelay, 0);
    read.millis("retry.max_delay_ms", s.retry.maxDelay, 0);
    read.value("retry.backoff_factor", s.retry.backoffFactor);

    read.millis("cache.ttl_ms", s.cache.ttl, 0);
    read.value("cache.deduplicate_in_flight", s.cache.deduplicateInFlight);
    read.value("cache.name", s.cache.name);

    read.count("rate_limiter.max_requests", s.limiter.maxRequests, 0);
    read.millis("rate_limiter.window_ms", s.limiter.window, 1);
    read.millis("rate_limiter.poll_interval_ms", s.limiter.pollInterval, 1);
    read.value("rate_limiter.name", s.limiter.name);

    read.millis("search.debounce_ms", s.search.debounce, 0);
    read.size("search.min_query_length", s.search.minQueryLength, 0);

    read.millis("streamer.poll_interval_ms", s.streamerPollInterval, 1);
    read.millis("change_stream.poll_interval_ms", s.changePollInterval, 1);
    read.millis("health.interval_ms", s.healthCheckInterval, 1);
    read.size("metrics.max_per_type", s.metricsPerType, 1);

    for (std::size_t i = 0; i < foundation::kLogCategoryCount; ++i) {
        read.logLevel(static_cast<LogCategory>(i), s.logLevels);
    }

    if (read.error()) {
        return KitResult<ToolkitSettings>::err(*read.error());
    }
    if (s.retry.backoffFactor <= 0.0) {
        return KitResult<ToolkitSettings>::err(
            KitError(ErrorCode::ConfigInvalidValue, "retry.backoff_factor must be positive"));
    }
    return KitResult<ToolkitSettings>::ok(std::move(s));
}

} // namespace rsk
