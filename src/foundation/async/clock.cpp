/// @file clock.cpp
/// @brief SteadyClock and ManualClock implementations.

#include "rsk/foundation/clock.hpp"

#include <thread>

namespace rsk::foundation {

Clock::TimePoint SteadyClock::now() const {
    return std::chrono::steady_clock::now();
}

void SteadyClock::sleepUntil(TimePoint deadline) {
    std::this_thread::sleep_until(deadline);
}

void ManualClock::sleepUntil(TimePoint deadline) {
    ++sleeps_;
    if (deadline > now_) {
        now_ = deadline;
    }
}

void ManualClock::advance(Duration delta) {
    if (delta > Duration::zero()) {
        now_ += delta;
    }
}

} // namespace rsk::foundation
