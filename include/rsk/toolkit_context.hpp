#pragma once

/// @file toolkit_context.hpp
/// @brief Explicit owner of the event loop, stream hub, settings and shared services.

#include <memory>
#include <string>
#include <utility>

#include "rsk/foundation/clock.hpp"
#include "rsk/foundation/config_manager.hpp"
#include "rsk/foundation/event_loop.hpp"
#include "rsk/foundation/kit_result.hpp"
#include "rsk/foundation/service_locator.hpp"
#include "rsk/resilience/circuit_breaker.hpp"
#include "rsk/resilience/concurrency_pool.hpp"
#include "rsk/resilience/rate_limiter.hpp"
#include "rsk/resilience/resilient_executor.hpp"
#include "rsk/resilience/retry_executor.hpp"
#include "rsk/resilience/ttl_cache.hpp"
#include "rsk/stream/change_stream.hpp"
#include "rsk/stream/data_streamer.hpp"
#include "rsk/stream/health_check_stream.hpp"
#include "rsk/stream/metrics_stream.hpp"
#include "rsk/stream/search_stream.hpp"
#include "rsk/stream/stream_hub.hpp"
#include "rsk/toolkit_settings.hpp"

namespace rsk {

/// Constructed once at process start and passed to consumers; replaces
/// module-level default instances.
///
/// Components built through the make*() helpers use the loaded settings and
/// this context's loop. Instances that several call sites must share are
/// registered in services().
///
/// Example:
/// @code
///   foundation::ConfigManager config;
///   (void)config.load("toolkit.yaml");
///   auto ctx = ToolkitContext::fromConfig(config);
///   if (!ctx) { return fail(ctx.error()); }
///
///   auto& toolkit = *ctx.value();
///   toolkit.services().add(std::shared_ptr<resilience::CircuitBreaker>(
///       toolkit.makeCircuitBreaker("payments")));
///   toolkit.loop().run();
/// @endcode
class ToolkitContext {
public:
    explicit ToolkitContext(ToolkitSettings settings = {},
                            std::shared_ptr<foundation::Clock> clock =
                                std::make_shared<foundation::SteadyClock>());
    ~ToolkitContext();

    ToolkitContext(const ToolkitContext&) = delete;
    ToolkitContext& operator=(const ToolkitContext&) = delete;

    /// Load settings from @p config and build a context.
    [[nodiscard]] static foundation::KitResult<std::unique_ptr<ToolkitContext>> fromConfig(
        const foundation::ConfigManager& config,
        std::shared_ptr<foundation::Clock> clock = std::make_shared<foundation::SteadyClock>());

    [[nodiscard]] foundation::EventLoop& loop() { return loop_; }
    [[nodiscard]] stream::StreamHub& hub() { return hub_; }
    [[nodiscard]] foundation::ServiceLocator& services() { return services_; }
    [[nodiscard]] const ToolkitSettings& settings() const { return settings_; }

    // ── Factories ────────────────────────────────────────────────────────

    [[nodiscard]] std::unique_ptr<resilience::ConcurrencyPool> makePool();

    /// Breaker with the configured thresholds; @p name overrides the configured name.
    [[nodiscard]] std::unique_ptr<resilience::CircuitBreaker> makeCircuitBreaker(
        const std::string& name = {});

    [[nodiscard]] std::unique_ptr<resilience::RateLimiter> makeRateLimiter();

    [[nodiscard]] std::unique_ptr<resilience::RetryExecutor> makeRetryExecutor();

    [[nodiscard]] std::unique_ptr<resilience::ResilientExecutor> makeResilientExecutor();

    [[nodiscard]] std::unique_ptr<stream::HealthCheckStream> makeHealthCheckStream();

    /// Keeps `metrics.max_per_type` samples per type.
    [[nodiscard]] std::unique_ptr<stream::MetricsStream> makeMetricsStream();

    template <typename V>
    [[nodiscard]] std::unique_ptr<resilience::TtlCache<V>> makeCache() {
        return std::make_unique<resilience::TtlCache<V>>(loop_, settings_.cache);
    }

    /// Polls at `streamer.poll_interval_ms`.
    template <typename T>
    [[nodiscard]] std::unique_ptr<stream::DataStreamer<T>> makeDataStreamer(
        typename stream::DataStreamer<T>::FetchFunction fetch,
        typename stream::DataStreamer<T>::KeyExtractor keyOf, std::string name = "data") {
        return std::make_unique<stream::DataStreamer<T>>(loop_, std::move(fetch),
                                                         std::move(keyOf),
                                                         settings_.streamerPollInterval,
                                                         std::move(name));
    }

    /// Debounce and minimum query length from the `search` section.
    template <typename T>
    [[nodiscard]] std::unique_ptr<stream::SearchStream<T>> makeSearchStream(
        typename stream::SearchStream<T>::SearchFunction searchFn) {
        return std::make_unique<stream::SearchStream<T>>(loop_, std::move(searchFn),
                                                         settings_.search);
    }

    /// Polls at `change_stream.poll_interval_ms` once started.
    template <typename T>
    [[nodiscard]] std::unique_ptr<stream::ChangeStream<T>> makeChangeStream(
        typename stream::ChangeStream<T>::FetchChanges fetchChanges,
        std::string name = "changes") {
        return std::make_unique<stream::ChangeStream<T>>(loop_, std::move(fetchChanges),
                                                         settings_.changePollInterval,
                                                         std::move(name));
    }

private:
    ToolkitSettings settings_;
    foundation::EventLoop loop_;
    stream::StreamHub hub_;
    foundation::ServiceLocator services_;
};

} // namespace rsk
