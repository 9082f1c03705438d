/// @file rate_limiter.cpp
/// @brief Sliding-window RateLimiter implementation.

#include "rsk/resilience/rate_limiter.hpp"

#include "rsk/foundation/kit_logger.hpp"

namespace rsk::resilience {

using rsk::foundation::ErrorCode;
using rsk::foundation::EventLoop;
using rsk::foundation::KitError;
using rsk::foundation::LogCategory;
using rsk::foundation::Promise;

struct RateLimiter::State {
    struct Waiter {
        EventLoop::TimerId timer = EventLoop::kInvalidTimer;
        Promise<void> promise;
    };

    EventLoop& loop;
    RateLimiterConfig config;
    std::deque<EventLoop::TimePoint> timestamps;
    std::unordered_map<uint64_t, Waiter> waiters;
    uint64_t nextWaiter = 1;

    State(EventLoop& l, RateLimiterConfig c) : loop(l), config(std::move(c)) {}

    void purgeExpired() {
        auto cutoff = loop.now() - config.window;
        while (!timestamps.empty() && timestamps.front() <= cutoff) {
            timestamps.pop_front();
        }
    }

    /// Entries younger than the window, without purging.
    [[nodiscard]] uint32_t liveCount() const {
        auto cutoff = loop.now() - config.window;
        uint32_t live = 0;
        for (auto it = timestamps.rbegin(); it != timestamps.rend() && *it > cutoff; ++it) {
            ++live;
        }
        return live;
    }

    bool tryAccept() {
        purgeExpired();
        if (timestamps.size() >= static_cast<std::size_t>(config.maxRequests)) {
            return false;
        }
        timestamps.push_back(loop.now());
        return true;
    }
};

RateLimiter::RateLimiter(EventLoop& loop, RateLimiterConfig config)
    : state_(std::make_shared<State>(loop, std::move(config))) {
    if (state_->config.pollInterval <= std::chrono::milliseconds::zero()) {
        RSK_LOG_WARN(LogCategory::RateLimit,
                     "limiter '" + state_->config.name + "': poll interval must be positive, using 100ms");
        state_->config.pollInterval = std::chrono::milliseconds(100);
    }
}

RateLimiter::~RateLimiter() {
    auto waiters = std::move(state_->waiters);
    state_->waiters.clear();
    for (auto& [id, waiter] : waiters) {
        state_->loop.cancel(waiter.timer);
        waiter.promise.reject(KitError(ErrorCode::Cancelled,
                                       "limiter '" + state_->config.name + "' destroyed"));
    }
}

bool RateLimiter::checkLimit() {
    return state_->tryAccept();
}

rsk::foundation::Future<void> RateLimiter::waitForSlot() {
    if (state_->tryAccept()) {
        return rsk::foundation::makeVoidFuture();
    }

    const uint64_t id = state_->nextWaiter++;
    auto& waiter = state_->waiters[id];
    auto future = waiter.promise.future();
    RSK_LOG_DEBUG(LogCategory::RateLimit,
                  "limiter '" + state_->config.name + "' full, waiting for a slot");

    std::weak_ptr<State> weak = state_;
    waiter.timer = state_->loop.schedule(state_->config.pollInterval, [weak, id]() {
        if (auto state = weak.lock()) {
            poll(state, id);
        }
    });
    return future;
}

void RateLimiter::poll(const std::shared_ptr<State>& state, uint64_t waiterId) {
    auto it = state->waiters.find(waiterId);
    if (it == state->waiters.end()) {
        return;
    }

    if (state->tryAccept()) {
        auto promise = std::move(it->second.promise);
        state->waiters.erase(it);
        promise.resolve();
        return;
    }

    std::weak_ptr<State> weak = state;
    it->second.timer = state->loop.schedule(state->config.pollInterval, [weak, waiterId]() {
        if (auto locked = weak.lock()) {
            poll(locked, waiterId);
        }
    });
}

void RateLimiter::reset() {
    state_->timestamps.clear();
}

RateLimiterStats RateLimiter::stats() const {
    RateLimiterStats s;
    s.currentRequests = state_->liveCount();
    s.maxRequests = state_->config.maxRequests;
    s.window = state_->config.window;
    s.remainingRequests = s.currentRequests >= s.maxRequests ? 0u : s.maxRequests - s.currentRequests;
    return s;
}

uint32_t RateLimiter::remaining() const {
    return stats().remainingRequests;
}

std::size_t RateLimiter::waitingCount() const {
    return state_->waiters.size();
}

const RateLimiterConfig& RateLimiter::config() const {
    return state_->config;
}

std::string_view RateLimiter::name() const {
    return state_->config.name;
}

} // namespace rsk::resilience
