/// @file metrics_stream.cpp
/// @brief MetricsStream recording and history queries.

#include "rsk/stream/metrics_stream.hpp"

#include <algorithm>
#include <utility>

#include "rsk/foundation/kit_logger.hpp"
#include "rsk/stream/stream_hub.hpp"

namespace rsk::stream {

using rsk::foundation::LogCategory;

MetricsStream::MetricsStream(rsk::foundation::EventLoop& loop, std::size_t maxPerType)
    : loop_(loop), maxPerType_(std::max<std::size_t>(maxPerType, 1)) {}

MetricsStream::~MetricsStream() {
    channel_.complete();
}

Metric MetricsStream::recordMetric(const std::string& type, double value,
                                   std::map<std::string, std::string> tags) {
    Metric metric{type, value, std::move(tags), loop_.now(), generateEventId()};

    auto& samples = history_[type];
    samples.push_back(metric);
    while (samples.size() > maxPerType_) {
        samples.pop_front();
    }

    RSK_LOG_DEBUG(LogCategory::Stream,
                  "metric '" + type + "' = " + std::to_string(value));
    channel_.publish(metric);
    return metric;
}

std::vector<Metric> MetricsStream::metricsByType(const std::string& type) const {
    auto it = history_.find(type);
    if (it == history_.end()) {
        return {};
    }
    return {it->second.begin(), it->second.end()};
}

std::map<std::string, std::vector<Metric>> MetricsStream::allMetrics() const {
    std::map<std::string, std::vector<Metric>> out;
    for (const auto& [type, samples] : history_) {
        out.emplace(type, std::vector<Metric>(samples.begin(), samples.end()));
    }
    return out;
}

void MetricsStream::clear() {
    history_.clear();
}

} // namespace rsk::stream
