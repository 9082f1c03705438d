/// @file toolkit_context.cpp
/// @brief ToolkitContext construction and component factories.

#include "rsk/toolkit_context.hpp"

#include "rsk/foundation/kit_logger.hpp"
#include "rsk/version.hpp"

namespace rsk {

using foundation::KitResult;
using foundation::KitLogger;
using foundation::LogCategory;

ToolkitContext::ToolkitContext(ToolkitSettings settings, std::shared_ptr<foundation::Clock> clock)
    : settings_(std::move(settings)), loop_(std::move(clock)), hub_(loop_) {
    for (const auto& [category, level] : settings_.logLevels) {
        KitLogger::instance().setCategoryLevel(category, level);
    }
    RSK_LOG_INFO(LogCategory::Core,
                 std::string("resilience_kit ") + Version::string + " context ready");
}

ToolkitContext::~ToolkitContext() {
    // Shared components may reference the loop; drop them first.
    services_.clear();
}

KitResult<std::unique_ptr<ToolkitContext>> ToolkitContext::fromConfig(
    const foundation::ConfigManager& config, std::shared_ptr<foundation::Clock> clock) {
    auto settings = loadToolkitSettings(config);
    if (!settings) {
        RSK_LOG_ERROR(LogCategory::Core,
                      "invalid toolkit configuration: " + settings.error().describe());
        return KitResult<std::unique_ptr<ToolkitContext>>::err(settings.error());
    }
    return KitResult<std::unique_ptr<ToolkitContext>>::ok(
        std::make_unique<ToolkitContext>(std::move(settings).value(), std::move(clock)));
}

std::unique_ptr<resilience::ConcurrencyPool> ToolkitContext::makePool() {
    return std::make_unique<resilience::ConcurrencyPool>(loop_, settings_.pool);
}

std::unique_ptr<resilience::CircuitBreaker> ToolkitContext::makeCircuitBreaker(
    const std::string& name) {
    auto config = settings_.breaker;
    if (!name.empty()) {
        config.name = name;
    }
    return std::make_unique<resilience::CircuitBreaker>(loop_, std::move(config));
}

std::unique_ptr<resilience::RateLimiter> ToolkitContext::makeRateLimiter() {
    return std::make_unique<resilience::RateLimiter>(loop_, settings_.limiter);
}

std::unique_ptr<resilience::RetryExecutor> ToolkitContext::makeRetryExecutor() {
    return std::make_unique<resilience::RetryExecutor>(loop_, settings_.retry);
}

std::unique_ptr<resilience::ResilientExecutor> ToolkitContext::makeResilientExecutor() {
    return std::make_unique<resilience::ResilientExecutor>(
        loop_, resilience::ResilientExecutorConfig{settings_.cache, settings_.breaker,
                                                   settings_.limiter});
}

std::unique_ptr<stream::HealthCheckStream> ToolkitContext::makeHealthCheckStream() {
    return std::make_unique<stream::HealthCheckStream>(loop_, settings_.healthCheckInterval);
}

std::unique_ptr<stream::MetricsStream> ToolkitContext::makeMetricsStream() {
    return std::make_unique<stream::MetricsStream>(loop_, settings_.metricsPerType);
}

} // namespace rsk
