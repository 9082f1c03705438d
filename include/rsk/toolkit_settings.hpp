#pragma once

/// @file toolkit_settings.hpp
/// @brief Component configuration loaded from a ConfigManager.

#include <chrono>
#include <cstddef>
#include <map>

#include "rsk/foundation/config_manager.hpp"
#include "rsk/foundation/kit_logger.hpp"
#include "rsk/foundation/kit_result.hpp"
#include "rsk/resilience/circuit_breaker.hpp"
#include "rsk/resilience/concurrency_pool.hpp"
#include "rsk/resilience/rate_limiter.hpp"
#include "rsk/resilience/retry_executor.hpp"
#include "rsk/resilience/ttl_cache.hpp"
#include "rsk/stream/search_stream.hpp"

namespace rsk {

/// Configuration of every toolkit component. Defaults apply to absent keys.
struct ToolkitSettings {
    resilience::PoolConfig pool;
    resilience::CircuitBreakerConfig breaker;
    resilience::RetryOptions retry;
    resilience::TtlCacheConfig cache;
    resilience::RateLimiterConfig limiter;
    stream::SearchStreamConfig search;

    std::chrono::milliseconds streamerPollInterval{5000};
    std::chrono::milliseconds changePollInterval{1000};
    std::chrono::milliseconds healthCheckInterval{30000};

    /// Samples kept per metric type.
    std::size_t metricsPerType = 100;

    /// Per-category minimum log levels overriding KitLogger's defaults.
    std::map<foundation::LogCategory, foundation::LogLevel> logLevels;
};

/// Map configuration keys onto ToolkitSettings.
///
/// Recognized keys (all optional):
/// | Key                                 | Type   |
/// |-------------------------------------|--------|
/// | pool.concurrency                    | int>=1 |
/// | pool.name                           | string |
/// | circuit_breaker.failure_threshold   | int>=1 |
/// | circuit_breaker.call_timeout_ms     | int>0  |
/// | circuit_breaker.reset_timeout_ms    | int>=0 |
/// | circuit_breaker.name                | string |
/// | retry.max_attempts                  | int>=1 |
/// | retry.base_delay_ms                 | int>=0 |
/// | retry.max_delay_ms                  | int>=0 |
/// | retry.backoff_factor                | double |
/// | cache.ttl_ms                        | int>=0 |
/// | cache.deduplicate_in_flight         | bool   |
/// | cache.name                          | string |
/// | rate_limiter.max_requests           | int>=0 |
/// | rate_limiter.window_ms              | int>0  |
/// | rate_limiter.poll_interval_ms       | int>0  |
/// | rate_limiter.name                   | string |
/// | search.debounce_ms                  | int>=0 |
/// | search.min_query_length             | int>=0 |
/// | streamer.poll_interval_ms           | int>0  |
/// | change_stream.poll_interval_ms      | int>0  |
/// | health.interval_ms                  | int>0  |
/// | metrics.max_per_type                | int>=1 |
/// | logging.<category>                  | level  |
///
/// @return The settings, ConfigTypeMismatch for a malformed value, or
///         ConfigInvalidValue for an out-of-range one.
[[nodiscard]] foundation::KitResult<ToolkitSettings> loadToolkitSettings(
    const foundation::ConfigManager& config);

/// Parse "trace", "debug", "info", "warning"/"warn", "error", "critical", "off".
[[nodiscard]] foundation::KitResult<foundation::LogLevel> parseLogLevel(std::string_view text);

} // namespace rsk
