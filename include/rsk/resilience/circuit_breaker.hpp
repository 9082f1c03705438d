#pragma once

/// @file circuit_breaker.hpp
/// @brief Three-state circuit breaker with a per-call deadline.
///
/// Implements the circuit breaker pattern (Closed -> Open -> HalfOpen)
/// to stop invoking a failing dependency for a cooldown period.

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "rsk/foundation/event_loop.hpp"
#include "rsk/foundation/future.hpp"
#include "rsk/foundation/timeout.hpp"

namespace rsk::resilience {

/// Configuration for a CircuitBreaker instance.
struct CircuitBreakerConfig {
    /// Number of consecutive failures before the circuit opens.
    uint32_t failureThreshold = 5;

    /// Deadline for every admitted call. Exceeding it counts as a failure.
    std::chrono::milliseconds callTimeout{60000};

    /// Cooldown after the last failure before a trial call is allowed.
    std::chrono::milliseconds resetTimeout{30000};

    /// Human-readable name for logging.
    std::string name = "default";
};

/// Circuit breaker guarding one downstream dependency.
///
/// Usage:
/// @code
///   CircuitBreaker cb(loop, CircuitBreakerConfig{.failureThreshold = 3, .name = "catalog"});
///   cb.execute<Product>([&] { return catalog.fetch(id); })
///       .onComplete([](const KitResult<Product>& r) {
///           if (!r && r.error().code() == ErrorCode::CircuitOpen) {
///               // degraded response
///           }
///       });
/// @endcode
///
/// The manual allowRequest()/recordSuccess()/recordFailure() protocol is
/// available for callers that drive the dependency themselves.
///
/// Not thread-safe: drive it from its event loop.
class CircuitBreaker {
public:
    /// Circuit breaker states.
    enum class State : uint8_t {
        Closed,   ///< Normal operation; calls pass through.
        Open,     ///< Failure threshold reached; calls are rejected.
        HalfOpen  ///< Recovery trial; a single call is allowed.
    };

    explicit CircuitBreaker(rsk::foundation::EventLoop& loop, CircuitBreakerConfig config = {});

    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;

    /// Run @p factory through the breaker.
    ///
    /// Fails with CircuitOpen without invoking @p factory when short-circuited,
    /// with Timeout when the call exceeds callTimeout, and otherwise with the
    /// operation's own outcome. The breaker state is updated before any
    /// continuation registered on the returned future runs.
    template <typename T>
    [[nodiscard]] rsk::foundation::Future<T> execute(rsk::foundation::TaskFactory<T> factory);

    /// Check whether a request is allowed through the circuit.
    ///
    /// If the circuit is Open and the reset timeout has elapsed, transitions
    /// to HalfOpen and admits the caller as the trial call. While it is in
    /// flight every other request is rejected.
    ///
    /// @return true if the call should proceed, false if rejected.
    [[nodiscard]] bool allowRequest();

    /// Record a successful call. Resets failure count; closes a half-open circuit.
    void recordSuccess();

    /// Record a failed call. Increments failure count; may open the circuit.
    void recordFailure();

    /// Force the circuit into a specific state (for testing or manual override).
    void forceState(State newState);

    /// Reset all counters and return to Closed state.
    void reset();

    // ── Queries ──────────────────────────────────────────────────────────

    [[nodiscard]] State state() const;

    /// Number of consecutive failures in the current state.
    [[nodiscard]] uint32_t failureCount() const;

    /// Total number of requests rejected due to open circuit.
    [[nodiscard]] uint64_t rejectedCount() const;

    /// Loop time of the most recent failure.
    [[nodiscard]] rsk::foundation::EventLoop::TimePoint lastFailureTime() const;

    [[nodiscard]] const CircuitBreakerConfig& config() const { return config_; }

    [[nodiscard]] std::string_view name() const;

private:
    void transitionTo(State newState);

    /// Apply the outcome of a call admitted by execute(). Outcomes of calls
    /// admitted before the current trial call are ignored while half-open.
    void recordOutcome(bool wasTrial, bool success);

    rsk::foundation::EventLoop& loop_;
    CircuitBreakerConfig config_;
    State state_{State::Closed};
    uint32_t consecutiveFailures_{0};
    uint64_t totalRejected_{0};
    bool trialInFlight_{false};
    rsk::foundation::EventLoop::TimePoint lastFailureTime_{};

    // Outstanding calls hold a weak reference; a destroyed breaker ignores them.
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

/// Convert circuit breaker state to string.
[[nodiscard]] constexpr std::string_view toString(CircuitBreaker::State s) {
    switch (s) {
        case CircuitBreaker::State::Closed:
            return "closed";
        case CircuitBreaker::State::Open:
            return "open";
        case CircuitBreaker::State::HalfOpen:
            return "half_open";
    }
    return "unknown";
}

// --- Template implementations ---

template <typename T>
rsk::foundation::Future<T> CircuitBreaker::execute(rsk::foundation::TaskFactory<T> factory) {
    using rsk::foundation::ErrorCode;
    using rsk::foundation::KitError;
    using rsk::foundation::KitResult;

    if (!allowRequest()) {
        return rsk::foundation::makeErrorFuture<T>(
            KitError(ErrorCode::CircuitOpen, "circuit '" + config_.name + "' is open"));
    }

    const bool wasTrial = state_ == State::HalfOpen;
    auto guarded = rsk::foundation::withTimeout(
        loop_, rsk::foundation::invokeFactory(factory), config_.callTimeout,
        "circuit '" + config_.name + "' call timed out");

    std::weak_ptr<bool> alive = alive_;
    guarded.onComplete([this, alive, wasTrial](const KitResult<T>& outcome) {
        if (alive.expired()) {
            return;
        }
        recordOutcome(wasTrial, outcome.hasValue());
    });
    return guarded;
}

} // namespace rsk::resilience
