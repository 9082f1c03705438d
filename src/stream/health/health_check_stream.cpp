/// @file health_check_stream.cpp
/// @brief HealthCheckStream round execution and aggregation.

#include "rsk/stream/health_check_stream.hpp"

#include <utility>
#include <vector>

#include "rsk/foundation/kit_logger.hpp"

namespace rsk::stream {

using rsk::foundation::EventLoop;
using rsk::foundation::Future;
using rsk::foundation::KitResult;
using rsk::foundation::LogCategory;
using rsk::foundation::Promise;

struct HealthCheckStream::State {
    struct Registered {
        HealthCheck check;
        bool critical = true;
    };

    EventLoop& loop;
    std::chrono::milliseconds interval;
    std::map<std::string, Registered> checks;
    SnapshotChannel<HealthReport> channel;
    EventLoop::TimerId timer = EventLoop::kInvalidTimer;
    bool roundInFlight = false;

    State(EventLoop& l, std::chrono::milliseconds i)
        : loop(l), interval(i), channel(HealthReport{HealthStatus::Unknown, {}, l.now()}, "health") {}
};

HealthCheckStream::HealthCheckStream(EventLoop& loop, std::chrono::milliseconds interval)
    : state_(std::make_shared<State>(loop, interval)) {
    std::weak_ptr<State> weak = state_;
    state_->timer = loop.scheduleEvery(interval, [weak]() {
        auto locked = weak.lock();
        if (!locked || locked->roundInFlight) {
            return;
        }
        // The report is published on the channel.
        (void)runRound(locked);
    });
}

HealthCheckStream::~HealthCheckStream() {
    stop();
    state_->channel.complete();
}

void HealthCheckStream::addHealthCheck(const std::string& name, HealthCheck check, bool critical) {
    state_->checks.insert_or_assign(name, State::Registered{std::move(check), critical});
}

bool HealthCheckStream::removeHealthCheck(const std::string& name) {
    return state_->checks.erase(name) > 0;
}

Future<HealthReport> HealthCheckStream::runChecks() {
    return runRound(state_);
}

SnapshotChannel<HealthReport>& HealthCheckStream::health() {
    return state_->channel;
}

const HealthReport& HealthCheckStream::latest() const {
    return state_->channel.value();
}

std::size_t HealthCheckStream::checkCount() const {
    return state_->checks.size();
}

void HealthCheckStream::stop() {
    if (state_->timer != EventLoop::kInvalidTimer) {
        state_->loop.cancel(state_->timer);
        state_->timer = EventLoop::kInvalidTimer;
    }
}

Future<HealthReport> HealthCheckStream::runRound(const std::shared_ptr<State>& state) {
    // Checks run one after another over a snapshot of the registrations.
    struct Progress {
        std::weak_ptr<State> state;
        std::vector<std::pair<std::string, State::Registered>> pending;
        std::size_t next = 0;
        HealthReport report;
        Promise<HealthReport> promise;
        // Captures only a weak reference to this Progress.
        std::function<void()> step;
    };

    auto progress = std::make_shared<Progress>();
    progress->state = state;
    progress->pending.assign(state->checks.begin(), state->checks.end());
    progress->report.status = HealthStatus::Healthy;
    auto done = progress->promise.future();
    state->roundInFlight = true;

    std::weak_ptr<Progress> weakProgress = progress;
    progress->step = [weakProgress]() {
        auto p = weakProgress.lock();
        if (!p) {
            return;
        }
        auto owner = p->state.lock();
        if (!owner) {
            p->promise.reject(rsk::foundation::KitError(rsk::foundation::ErrorCode::Cancelled,
                                                        "health stream destroyed"));
            return;
        }

        if (p->next == p->pending.size()) {
            owner->roundInFlight = false;
            p->report.timestamp = owner->loop.now();
            if (p->report.status != HealthStatus::Healthy) {
                RSK_LOG_WARN(LogCategory::Stream, "health report: "
                                                      + std::string(toString(p->report.status)));
            }
            owner->channel.publish(p->report);
            p->promise.resolve(p->report);
            return;
        }

        auto& [name, registered] = p->pending[p->next++];
        const bool critical = registered.critical;
        const std::string checkName = name;
        rsk::foundation::invokeFactory(registered.check).onComplete(
            [p, critical, checkName](const KitResult<bool>& outcome) {
                const bool passed = outcome && outcome.value();
                p->report.checks[checkName] = passed;
                if (!outcome) {
                    RSK_LOG_WARN(LogCategory::Stream, "health check '" + checkName
                                                          + "' errored: "
                                                          + outcome.error().describe());
                }
                if (!passed) {
                    if (critical) {
                        p->report.status = HealthStatus::Unhealthy;
                    } else if (p->report.status == HealthStatus::Healthy) {
                        p->report.status = HealthStatus::Degraded;
                    }
                }
                if (auto owner = p->state.lock()) {
                    owner->loop.post([p]() { p->step(); });
                } else {
                    p->step();
                }
            });
    };

    // The posted continuations keep `progress` alive between checks.
    auto first = progress->step;
    first();
    return done;
}

} // namespace rsk::stream
