#pragma once

/// @file metrics_stream.hpp
/// @brief Live metric samples with a bounded per-type history.

#include <cstddef>
#include <deque>
#include <map>
#include <string>
#include <vector>

#include "rsk/foundation/event_loop.hpp"
#include "rsk/stream/stream_channel.hpp"

namespace rsk::stream {

/// One recorded sample.
struct Metric {
    std::string type;
    double value = 0.0;
    std::map<std::string, std::string> tags;
    rsk::foundation::EventLoop::TimePoint timestamp{};

    /// UUID-formatted identifier.
    std::string id;
};

/// Publishes every recorded Metric and keeps the newest samples of each
/// type. Once a type holds maxPerType samples, recording another drops the
/// oldest one.
///
/// Example:
/// @code
///   MetricsStream metrics(loop);
///   metrics.metrics().subscribe([](const Metric& m) { chart(m.type, m.value); });
///   metrics.recordMetric("checkout.latency_ms", 182.0, {{"region", "eu"}});
/// @endcode
class MetricsStream {
public:
    explicit MetricsStream(rsk::foundation::EventLoop& loop, std::size_t maxPerType = 100);
    ~MetricsStream();

    MetricsStream(const MetricsStream&) = delete;
    MetricsStream& operator=(const MetricsStream&) = delete;

    /// Stamp, store and publish a sample. Returns the stored sample.
    Metric recordMetric(const std::string& type, double value,
                        std::map<std::string, std::string> tags = {});

    [[nodiscard]] StreamChannel<Metric>& metrics() { return channel_; }

    /// Samples of @p type, oldest first. Empty for an unknown type.
    [[nodiscard]] std::vector<Metric> metricsByType(const std::string& type) const;

    /// Every retained sample, grouped by type.
    [[nodiscard]] std::map<std::string, std::vector<Metric>> allMetrics() const;

    [[nodiscard]] std::size_t typeCount() const { return history_.size(); }

    [[nodiscard]] std::size_t maxPerType() const noexcept { return maxPerType_; }

    /// Drop the retained history. The channel stays open.
    void clear();

private:
    rsk::foundation::EventLoop& loop_;
    std::size_t maxPerType_;
    StreamChannel<Metric> channel_{"metrics"};
    std::map<std::string, std::deque<Metric>> history_;
};

} // namespace rsk::stream
