/// @file circuit_breaker.cpp
/// @brief CircuitBreaker state machine implementation.

#include "rsk/resilience/circuit_breaker.hpp"

#include <string>

#include "rsk/foundation/kit_logger.hpp"

namespace rsk::resilience {

using rsk::foundation::LogCategory;

CircuitBreaker::CircuitBreaker(rsk::foundation::EventLoop& loop, CircuitBreakerConfig config)
    : loop_(loop), config_(std::move(config)) {
    if (config_.failureThreshold == 0) {
        RSK_LOG_WARN(LogCategory::Breaker,
                     "circuit '" + config_.name + "': failure threshold must be at least 1, using 1");
        config_.failureThreshold = 1;
    }
}

bool CircuitBreaker::allowRequest() {
    switch (state_) {
        case State::Closed:
            return true;

        case State::Open: {
            auto elapsed = loop_.now() - lastFailureTime_;
            if (elapsed > config_.resetTimeout) {
                transitionTo(State::HalfOpen);
                trialInFlight_ = true;
                return true;
            }
            ++totalRejected_;
            return false;
        }

        case State::HalfOpen:
            if (trialInFlight_) {
                ++totalRejected_;
                return false;
            }
            trialInFlight_ = true;
            return true;
    }
    return false;
}

void CircuitBreaker::recordSuccess() {
    switch (state_) {
        case State::Closed:
            consecutiveFailures_ = 0;
            break;

        case State::HalfOpen:
            transitionTo(State::Closed);
            break;

        case State::Open:
            // A call admitted before the circuit opened finished late.
            break;
    }
}

void CircuitBreaker::recordFailure() {
    lastFailureTime_ = loop_.now();

    switch (state_) {
        case State::Closed:
            ++consecutiveFailures_;
            if (consecutiveFailures_ >= config_.failureThreshold) {
                transitionTo(State::Open);
            }
            break;

        case State::HalfOpen:
            // A failed trial call re-opens immediately.
            transitionTo(State::Open);
            break;

        case State::Open:
            break;
    }
}

void CircuitBreaker::recordOutcome(bool wasTrial, bool success) {
    if (state_ == State::HalfOpen && !wasTrial) {
        return;
    }
    if (success) {
        recordSuccess();
    } else {
        recordFailure();
    }
}

void CircuitBreaker::forceState(State newState) {
    transitionTo(newState);
}

void CircuitBreaker::reset() {
    state_ = State::Closed;
    consecutiveFailures_ = 0;
    totalRejected_ = 0;
    trialInFlight_ = false;
    lastFailureTime_ = {};
}

CircuitBreaker::State CircuitBreaker::state() const {
    return state_;
}

uint32_t CircuitBreaker::failureCount() const {
    return consecutiveFailures_;
}

uint64_t CircuitBreaker::rejectedCount() const {
    return totalRejected_;
}

rsk::foundation::EventLoop::TimePoint CircuitBreaker::lastFailureTime() const {
    return lastFailureTime_;
}

std::string_view CircuitBreaker::name() const {
    return config_.name;
}

void CircuitBreaker::transitionTo(State newState) {
    const State previous = state_;
    state_ = newState;
    trialInFlight_ = false;

    if (newState == State::Closed) {
        consecutiveFailures_ = 0;
    } else if (newState == State::Open) {
        // Cooldown starts from now when entering Open state.
        lastFailureTime_ = loop_.now();
    }

    if (previous == newState) {
        return;
    }
    std::string message = "circuit '" + config_.name + "' " + std::string(toString(previous))
                          + " -> " + std::string(toString(newState));
    if (newState == State::Open) {
        RSK_LOG_WARN(LogCategory::Breaker, message);
    } else {
        RSK_LOG_INFO(LogCategory::Breaker, message);
    }
}

} // namespace rsk::resilience
