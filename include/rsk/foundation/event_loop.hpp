#pragma once

/// @file event_loop.hpp
/// @brief Single-threaded cooperative scheduler: ready queue plus timer queue.
///
/// All toolkit suspension points (pool slot hand-off, retry backoff, breaker
/// call timeouts, rate-limit polling, debounce, polling streams) are tasks or
/// timers on an EventLoop. The loop never creates threads.

#include <cstdint>
#include <functional>
#include <memory>

#include "rsk/foundation/clock.hpp"

namespace rsk::foundation {

/// Cooperative event loop.
///
/// Not thread-safe: every call, and every component bound to the loop, must
/// be used from the thread that runs it.
///
/// Example:
/// @code
///   EventLoop loop;
///   auto id = loop.scheduleEvery(std::chrono::seconds(5), [] { poll(); });
///   loop.post([] { startWork(); });
///   loop.runFor(std::chrono::minutes(1));
///   loop.cancel(id);
/// @endcode
class EventLoop {
public:
    using Task = std::function<void()>;
    using TimerId = uint64_t;
    using TimePoint = Clock::TimePoint;
    using Duration = Clock::Duration;

    /// Timer id never returned by schedule().
    static constexpr TimerId kInvalidTimer = 0;

    explicit EventLoop(std::shared_ptr<Clock> clock = std::make_shared<SteadyClock>());
    ~EventLoop();

    // Components keep references to their loop.
    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;
    EventLoop(EventLoop&&) = delete;
    EventLoop& operator=(EventLoop&&) = delete;

    /// Queue @p task to run on the next turn, after tasks already queued.
    void post(Task task);

    /// Run @p task once, @p delay from now. Timers with equal deadlines
    /// fire in scheduling order.
    TimerId schedule(Duration delay, Task task);

    /// Run @p task every @p interval until cancelled.
    /// A non-positive interval is treated as one millisecond.
    TimerId scheduleEvery(Duration interval, Task task);

    /// Cancel a pending timer. Returns false if it already fired or is unknown.
    bool cancel(TimerId id);

    /// Run queued tasks and due timers without waiting.
    /// @return Number of callbacks executed.
    std::size_t runOnce();

    /// Run until no task and no one-shot timer remains, waiting on the clock
    /// for the next deadline. Repeating timers fire while waiting but do not
    /// by themselves keep the loop running.
    std::size_t runUntilIdle();

    /// Run for @p duration of clock time, then return.
    std::size_t runFor(Duration duration);

    /// Run until stop() is called or nothing at all is scheduled.
    std::size_t run();

    /// Ask run()/runFor()/runUntilIdle() to return after the current callback.
    void stop();

    [[nodiscard]] TimePoint now() const;
    [[nodiscard]] Clock& clock() const;

    [[nodiscard]] std::size_t pendingTasks() const;
    [[nodiscard]] std::size_t pendingTimers() const;

    /// Token that expires when the loop is destroyed. Continuations that may
    /// settle after the loop is gone check it before touching the loop.
    [[nodiscard]] std::weak_ptr<void> lifetime() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace rsk::foundation
