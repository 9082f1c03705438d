#pragma once

/// @file rate_limiter.hpp
/// @brief Sliding-window rate limiter with an asynchronous slot wait.
///
/// Keeps the timestamps of accepted operations within a trailing window.
/// Bursts at a window boundary are smoothed but not perfectly bounded.

#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>

#include "rsk/foundation/event_loop.hpp"
#include "rsk/foundation/future.hpp"

namespace rsk::resilience {

/// Configuration for a RateLimiter instance.
struct RateLimiterConfig {
    /// Operations accepted per window.
    uint32_t maxRequests = 100;

    std::chrono::milliseconds window{60000};

    /// Delay between re-checks in waitForSlot().
    std::chrono::milliseconds pollInterval{100};

    /// Human-readable name for logging.
    std::string name = "default";
};

/// Snapshot returned by RateLimiter::stats().
struct RateLimiterStats {
    uint32_t currentRequests = 0;
    uint32_t maxRequests = 0;
    std::chrono::milliseconds window{0};
    uint32_t remainingRequests = 0;
};

/// Sliding-window rate limiter.
///
/// Example:
/// @code
///   RateLimiter limiter(loop, RateLimiterConfig{.maxRequests = 10,
///                                               .window = std::chrono::seconds(1)});
///   if (!limiter.checkLimit()) {
///       limiter.waitForSlot().onComplete([&](const KitResult<void>&) { send(); });
///   }
/// @endcode
class RateLimiter {
public:
    explicit RateLimiter(rsk::foundation::EventLoop& loop, RateLimiterConfig config = {});
    ~RateLimiter();

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    /// Purge entries at least one window old, then accept iff fewer than
    /// maxRequests remain. An accepted call is recorded at the current time.
    [[nodiscard]] bool checkLimit();

    /// Resolve once checkLimit() accepts, re-checking every pollInterval.
    /// Never fails while the limiter exists; destroying the limiter rejects
    /// outstanding waits with Cancelled.
    [[nodiscard]] rsk::foundation::Future<void> waitForSlot();

    /// Forget every recorded acceptance.
    void reset();

    // ── Queries ──────────────────────────────────────────────────────────

    [[nodiscard]] RateLimiterStats stats() const;

    /// Acceptances left in the current window.
    [[nodiscard]] uint32_t remaining() const;

    /// Callers suspended in waitForSlot().
    [[nodiscard]] std::size_t waitingCount() const;

    [[nodiscard]] const RateLimiterConfig& config() const;

    [[nodiscard]] std::string_view name() const;

private:
    struct State;

    static void poll(const std::shared_ptr<State>& state, uint64_t waiterId);

    std::shared_ptr<State> state_;
};

} // namespace rsk::resilience
