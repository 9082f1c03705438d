#pragma once

/// @file clock.hpp
/// @brief Time source abstraction for the event loop and time-window components.
///
/// Every timestamp the toolkit records (breaker failure time, cache expiry,
/// rate-window entries, stream envelopes) comes from the Clock owned by the
/// EventLoop, so swapping in ManualClock makes all of them deterministic.

#include <chrono>
#include <cstdint>

namespace rsk::foundation {

/// Monotonic time source that the event loop can also wait on.
class Clock {
public:
    using TimePoint = std::chrono::steady_clock::time_point;
    using Duration = std::chrono::steady_clock::duration;

    virtual ~Clock() = default;

    [[nodiscard]] virtual TimePoint now() const = 0;

    /// Wait until @p deadline. Called by the loop only when it has nothing
    /// runnable before that deadline.
    virtual void sleepUntil(TimePoint deadline) = 0;
};

/// Wall-time clock backed by std::chrono::steady_clock.
/// sleepUntil() blocks the calling (loop) thread.
class SteadyClock final : public Clock {
public:
    [[nodiscard]] TimePoint now() const override;
    void sleepUntil(TimePoint deadline) override;
};

/// Virtual clock whose time only moves when told to.
///
/// sleepUntil() jumps straight to the deadline, so a loop driven by a
/// ManualClock runs timer-heavy scenarios (backoff, debounce, TTL expiry)
/// instantly and reproducibly.
///
/// Example:
/// @code
///   auto clock = std::make_shared<ManualClock>();
///   EventLoop loop(clock);
///   loop.schedule(std::chrono::seconds(30), [] { /* ... */ });
///   loop.runUntilIdle();   // returns immediately; clock->now() advanced 30 s
/// @endcode
class ManualClock final : public Clock {
public:
    ManualClock() = default;
    explicit ManualClock(TimePoint start) : now_(start) {}

    [[nodiscard]] TimePoint now() const override { return now_; }
    void sleepUntil(TimePoint deadline) override;

    /// Move time forward by @p delta (negative deltas are ignored).
    void advance(Duration delta);

    /// Number of times the loop waited on this clock.
    [[nodiscard]] uint64_t sleepCount() const noexcept { return sleeps_; }

private:
    TimePoint now_{};
    uint64_t sleeps_{0};
};

/// Convert a duration to whole milliseconds for logs and stats.
template <typename Rep, typename Period>
[[nodiscard]] constexpr int64_t toMillis(std::chrono::duration<Rep, Period> d) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
}

} // namespace rsk::foundation
