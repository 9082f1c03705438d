#pragma once

/// @file health_check_stream.hpp
/// @brief Periodic aggregated health report over named asynchronous checks.

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>

#include "rsk/foundation/event_loop.hpp"
#include "rsk/foundation/future.hpp"
#include "rsk/stream/stream_channel.hpp"

namespace rsk::stream {

/// Aggregated health.
enum class HealthStatus : uint8_t {
    Unknown,    ///< No check round has completed yet.
    Healthy,    ///< Every check passed.
    Degraded,   ///< Only non-critical checks failed.
    Unhealthy   ///< A critical check failed or errored.
};

[[nodiscard]] constexpr std::string_view toString(HealthStatus s) {
    switch (s) {
        case HealthStatus::Unknown:
            return "unknown";
        case HealthStatus::Healthy:
            return "healthy";
        case HealthStatus::Degraded:
            return "degraded";
        case HealthStatus::Unhealthy:
            return "unhealthy";
    }
    return "unknown";
}

/// Outcome of one check round.
struct HealthReport {
    HealthStatus status = HealthStatus::Unknown;

    /// Check name -> passed.
    std::map<std::string, bool> checks;

    rsk::foundation::EventLoop::TimePoint timestamp{};
};

/// Asynchronous health check. An error counts as a failed check.
using HealthCheck = std::function<rsk::foundation::Future<bool>()>;

/// Runs registered checks one after another every interval and publishes
/// the aggregated HealthReport on a snapshot channel.
///
/// Example:
/// @code
///   HealthCheckStream health(loop, std::chrono::seconds(30));
///   health.addHealthCheck("database", [&] { return db.ping(); });
///   health.addHealthCheck("cache", [&] { return cache.ping(); }, false);
///   health.health().subscribe([](const HealthReport& r) { publishStatus(r.status); });
/// @endcode
class HealthCheckStream {
public:
    /// Starts the periodic rounds immediately; the first runs after one interval.
    explicit HealthCheckStream(rsk::foundation::EventLoop& loop,
                               std::chrono::milliseconds interval = std::chrono::milliseconds(30000));
    ~HealthCheckStream();

    HealthCheckStream(const HealthCheckStream&) = delete;
    HealthCheckStream& operator=(const HealthCheckStream&) = delete;

    /// Register or replace a check. A failing non-critical check degrades
    /// the report instead of making it unhealthy.
    void addHealthCheck(const std::string& name, HealthCheck check, bool critical = true);

    bool removeHealthCheck(const std::string& name);

    /// Run one round now and publish its report.
    [[nodiscard]] rsk::foundation::Future<HealthReport> runChecks();

    /// Latest report; new subscribers receive it immediately.
    [[nodiscard]] SnapshotChannel<HealthReport>& health();

    [[nodiscard]] const HealthReport& latest() const;

    [[nodiscard]] std::size_t checkCount() const;

    void stop();

private:
    struct State;

    static rsk::foundation::Future<HealthReport> runRound(const std::shared_ptr<State>& state);

    std::shared_ptr<State> state_;
};

} // namespace rsk::stream
