#pragma once

/// @file resilient_executor.hpp
/// @brief Cached, circuit-broken, rate-limited execution of operations.

#include <any>
#include <cstdint>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "rsk/foundation/event_loop.hpp"
#include "rsk/foundation/future.hpp"
#include "rsk/resilience/batch.hpp"
#include "rsk/resilience/circuit_breaker.hpp"
#include "rsk/resilience/rate_limiter.hpp"
#include "rsk/resilience/ttl_cache.hpp"

namespace rsk::resilience {

/// Configuration of the three composed components.
struct ResilientExecutorConfig {
    TtlCacheConfig cache{};
    CircuitBreakerConfig breaker{};
    RateLimiterConfig limiter{};
};

/// Point-in-time view of the composed components.
struct ResilienceHealth {
    /// "healthy", or "degraded" while the circuit is not closed.
    std::string status;
    std::size_t cacheSize = 0;
    double cacheHitRate = 0.0;
    CircuitBreaker::State breakerState = CircuitBreaker::State::Closed;
    uint32_t breakerFailures = 0;
    uint64_t breakerRejected = 0;
    RateLimiterStats rateLimiter;
};

/// One cache, one circuit breaker and one rate limiter guarding a
/// downstream dependency.
///
/// The cache stores type-erased values, so a single executor can memoize
/// operations of different result types under distinct keys. Reading a key
/// with a type other than the one it was written with fails with
/// TypeMismatch.
///
/// Example:
/// @code
///   ResilientExecutor catalog(loop);
///   catalog.executeCached<Product>("product:" + id, [&] { return db.loadProduct(id); });
///   catalog.executeRateLimited<void>([&] { return mailer.send(order); });
/// @endcode
class ResilientExecutor {
public:
    explicit ResilientExecutor(rsk::foundation::EventLoop& loop, ResilientExecutorConfig config = {})
        : loop_(loop),
          cache_(loop, std::move(config.cache)),
          breaker_(loop, std::move(config.breaker)),
          limiter_(loop, std::move(config.limiter)) {}

    /// Serve @p key from the cache, or run @p operation through the breaker
    /// and cache its result. With @p useCache false the cache is bypassed.
    template <typename T>
    [[nodiscard]] rsk::foundation::Future<T> executeCached(const std::string& key,
                                                           rsk::foundation::TaskFactory<T> operation,
                                                           bool useCache = true);

    /// Wait for a rate-limiter slot, then run @p operation.
    template <typename T>
    [[nodiscard]] rsk::foundation::Future<T> executeRateLimited(
        rsk::foundation::TaskFactory<T> operation);

    /// Run @p operation now if the limiter accepts it, otherwise fail with
    /// RateLimited without invoking it.
    template <typename T>
    [[nodiscard]] rsk::foundation::Future<T> executeIfAllowed(
        rsk::foundation::TaskFactory<T> operation);

    /// executeRateLimited() around executeCached().
    template <typename T>
    [[nodiscard]] rsk::foundation::Future<T> executeGuarded(const std::string& key,
                                                            rsk::foundation::TaskFactory<T> operation);

    /// batchProcess() on this executor's loop.
    template <typename T, typename R>
    [[nodiscard]] rsk::foundation::Future<std::vector<R>> executeBatch(
        std::vector<T> items, ItemProcessor<T, R> processor, std::size_t batchSize = 10) {
        return batchProcess<T, R>(loop_, std::move(items), std::move(processor), batchSize);
    }

    [[nodiscard]] ResilienceHealth health() const {
        ResilienceHealth h;
        h.breakerState = breaker_.state();
        h.status = h.breakerState == CircuitBreaker::State::Closed ? "healthy" : "degraded";
        h.cacheSize = cache_.size();
        h.cacheHitRate = cache_.hitRate();
        h.breakerFailures = breaker_.failureCount();
        h.breakerRejected = breaker_.rejectedCount();
        h.rateLimiter = limiter_.stats();
        return h;
    }

    [[nodiscard]] TtlCache<std::any>& cache() { return cache_; }
    [[nodiscard]] CircuitBreaker& breaker() { return breaker_; }
    [[nodiscard]] RateLimiter& limiter() { return limiter_; }

private:
    rsk::foundation::EventLoop& loop_;
    TtlCache<std::any> cache_;
    CircuitBreaker breaker_;
    RateLimiter limiter_;
};

// --- Template implementations ---

template <typename T>
rsk::foundation::Future<T> ResilientExecutor::executeCached(
    const std::string& key, rsk::foundation::TaskFactory<T> operation, bool useCache) {
    using rsk::foundation::ErrorCode;
    using rsk::foundation::Future;
    using rsk::foundation::KitError;
    using rsk::foundation::KitResult;
    static_assert(!std::is_void_v<T>, "only value-producing operations can be cached");

    if (!useCache) {
        return breaker_.execute<T>(std::move(operation));
    }

    rsk::foundation::TaskFactory<std::any> erased = [this, operation]() {
        return breaker_.execute<T>(operation).then(
            [](const KitResult<T>& r) -> Future<std::any> {
                if (!r) {
                    return rsk::foundation::makeErrorFuture<std::any>(r.error());
                }
                return rsk::foundation::makeValueFuture(std::any(r.value()));
            });
    };

    return cache_.get(key, std::move(erased))
        .then([key](const KitResult<std::any>& r) -> Future<T> {
            if (!r) {
                return rsk::foundation::makeErrorFuture<T>(r.error());
            }
            if (const T* value = std::any_cast<T>(&r.value())) {
                return rsk::foundation::makeValueFuture<T>(*value);
            }
            return rsk::foundation::makeErrorFuture<T>(
                KitError(ErrorCode::TypeMismatch, "cached value for '" + key + "' has another type"));
        });
}

template <typename T>
rsk::foundation::Future<T> ResilientExecutor::executeRateLimited(
    rsk::foundation::TaskFactory<T> operation) {
    using rsk::foundation::KitResult;

    return limiter_.waitForSlot().then(
        [operation](const KitResult<void>& slot) -> rsk::foundation::Future<T> {
            if (!slot) {
                return rsk::foundation::makeErrorFuture<T>(slot.error());
            }
            return rsk::foundation::invokeFactory(operation);
        });
}

template <typename T>
rsk::foundation::Future<T> ResilientExecutor::executeIfAllowed(
    rsk::foundation::TaskFactory<T> operation) {
    using rsk::foundation::ErrorCode;
    using rsk::foundation::KitError;

    if (!limiter_.checkLimit()) {
        return rsk::foundation::makeErrorFuture<T>(
            KitError(ErrorCode::RateLimited, "limiter '" + limiter_.config().name + "' is full"));
    }
    return rsk::foundation::invokeFactory(operation);
}

template <typename T>
rsk::foundation::Future<T> ResilientExecutor::executeGuarded(
    const std::string& key, rsk::foundation::TaskFactory<T> operation) {
    using rsk::foundation::KitResult;

    return limiter_.waitForSlot().then(
        [this, key, operation](const KitResult<void>& slot) -> rsk::foundation::Future<T> {
            if (!slot) {
                return rsk::foundation::makeErrorFuture<T>(slot.error());
            }
            return executeCached<T>(key, operation);
        });
}

} // namespace rsk::resilience
