/// @file event_loop.cpp
/// @brief EventLoop implementation: FIFO ready queue and deadline-ordered timers.

#include "rsk/foundation/event_loop.hpp"

#include <deque>
#include <map>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace rsk::foundation {

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct EventLoop::Impl {
    struct TimerEntry {
        Task task;
        Duration interval{};
        bool repeating{false};
    };

    std::shared_ptr<Clock> clock;
    std::deque<Task> ready;

    // Live timers by id. Cancelled ids are removed here and skipped lazily
    // when their queue slot comes up.
    std::unordered_map<TimerId, TimerEntry> timers;

    // Deadline order; multimap insertion keeps equal deadlines in
    // scheduling order.
    std::multimap<TimePoint, TimerId> queue;

    TimerId nextTimerId{1};
    std::size_t oneShotCount{0};
    bool stopRequested{false};

    // Released with the Impl; handed out as a weak token by lifetime().
    std::shared_ptr<int> token = std::make_shared<int>(0);

    TimerId addTimer(TimePoint deadline, Task task, Duration interval, bool repeating) {
        auto id = nextTimerId++;
        timers.emplace(id, TimerEntry{std::move(task), interval, repeating});
        queue.emplace(deadline, id);
        if (!repeating) {
            ++oneShotCount;
        }
        return id;
    }

    // Run only the tasks queued when the call started; tasks they post
    // wait for the next turn.
    std::size_t drainReady() {
        std::size_t count = 0;
        auto batch = ready.size();
        while (batch-- > 0 && !ready.empty() && !stopRequested) {
            auto task = std::move(ready.front());
            ready.pop_front();
            if (task) {
                task();
            }
            ++count;
        }
        return count;
    }

    std::size_t fireDueTimers() {
        auto now = clock->now();

        // Collect first so timers scheduled by callbacks wait for the next pass.
        std::vector<TimerId> due;
        while (!queue.empty() && queue.begin()->first <= now) {
            due.push_back(queue.begin()->second);
            queue.erase(queue.begin());
        }

        std::size_t count = 0;
        for (auto id : due) {
            if (stopRequested) {
                // Put back what we did not get to.
                auto it = timers.find(id);
                if (it != timers.end()) {
                    queue.emplace(now, id);
                }
                continue;
            }
            auto it = timers.find(id);
            if (it == timers.end()) {
                continue;
            }

            Task task;
            if (it->second.repeating) {
                auto next = now + it->second.interval;
                queue.emplace(next, id);
                task = it->second.task;
            } else {
                task = std::move(it->second.task);
                timers.erase(it);
                --oneShotCount;
            }

            if (task) {
                task();
            }
            ++count;
        }
        return count;
    }

    std::optional<TimePoint> nextDeadline() {
        while (!queue.empty()) {
            auto it = queue.begin();
            if (timers.count(it->second) > 0) {
                return it->first;
            }
            queue.erase(it);
        }
        return std::nullopt;
    }

    std::size_t turn() {
        auto count = drainReady();
        count += fireDueTimers();
        count += drainReady();
        return count;
    }
};

// ---------------------------------------------------------------------------
// Construction / Destruction
// ---------------------------------------------------------------------------
EventLoop::EventLoop(std::shared_ptr<Clock> clock)
    : impl_(std::make_unique<Impl>()) {
    impl_->clock = clock ? std::move(clock) : std::make_shared<SteadyClock>();
}

EventLoop::~EventLoop() = default;

// ---------------------------------------------------------------------------
// Scheduling
// ---------------------------------------------------------------------------
void EventLoop::post(Task task) {
    impl_->ready.push_back(std::move(task));
}

EventLoop::TimerId EventLoop::schedule(Duration delay, Task task) {
    if (delay < Duration::zero()) {
        delay = Duration::zero();
    }
    return impl_->addTimer(impl_->clock->now() + delay, std::move(task),
                           Duration::zero(), false);
}

EventLoop::TimerId EventLoop::scheduleEvery(Duration interval, Task task) {
    if (interval <= Duration::zero()) {
        interval = std::chrono::milliseconds(1);
    }
    return impl_->addTimer(impl_->clock->now() + interval, std::move(task),
                           interval, true);
}

bool EventLoop::cancel(TimerId id) {
    auto it = impl_->timers.find(id);
    if (it == impl_->timers.end()) {
        return false;
    }
    if (!it->second.repeating) {
        --impl_->oneShotCount;
    }
    impl_->timers.erase(it);
    return true;
}

// ---------------------------------------------------------------------------
// Running
// ---------------------------------------------------------------------------
std::size_t EventLoop::runOnce() {
    impl_->stopRequested = false;
    return impl_->turn();
}

std::size_t EventLoop::runUntilIdle() {
    impl_->stopRequested = false;
    std::size_t count = 0;
    for (;;) {
        count += impl_->turn();
        if (impl_->stopRequested) {
            break;
        }
        if (!impl_->ready.empty()) {
            continue;
        }
        if (impl_->oneShotCount == 0) {
            break;
        }
        auto next = impl_->nextDeadline();
        if (!next) {
            break;
        }
        impl_->clock->sleepUntil(*next);
    }
    return count;
}

std::size_t EventLoop::runFor(Duration duration) {
    impl_->stopRequested = false;
    auto end = impl_->clock->now() + duration;
    std::size_t count = 0;
    for (;;) {
        count += impl_->turn();
        if (impl_->stopRequested) {
            break;
        }
        if (!impl_->ready.empty()) {
            continue;
        }
        auto next = impl_->nextDeadline();
        if (!next || *next > end) {
            if (impl_->clock->now() < end) {
                impl_->clock->sleepUntil(end);
            }
            count += impl_->turn();
            break;
        }
        impl_->clock->sleepUntil(*next);
    }
    return count;
}

std::size_t EventLoop::run() {
    impl_->stopRequested = false;
    std::size_t count = 0;
    for (;;) {
        count += impl_->turn();
        if (impl_->stopRequested) {
            break;
        }
        if (!impl_->ready.empty()) {
            continue;
        }
        auto next = impl_->nextDeadline();
        if (!next) {
            break;
        }
        impl_->clock->sleepUntil(*next);
    }
    return count;
}

void EventLoop::stop() {
    impl_->stopRequested = true;
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------
EventLoop::TimePoint EventLoop::now() const {
    return impl_->clock->now();
}

Clock& EventLoop::clock() const {
    return *impl_->clock;
}

std::size_t EventLoop::pendingTasks() const {
    return impl_->ready.size();
}

std::size_t EventLoop::pendingTimers() const {
    return impl_->timers.size();
}

std::weak_ptr<void> EventLoop::lifetime() const {
    return impl_->token;
}

} // namespace rsk::foundation
