#pragma once

/// @file retry_executor.hpp
/// @brief Exponential-backoff retry of fallible asynchronous operations.

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>

#include "rsk/foundation/event_loop.hpp"
#include "rsk/foundation/future.hpp"
#include "rsk/foundation/kit_logger.hpp"
#include "rsk/foundation/timeout.hpp"

namespace rsk::resilience {

/// Predicate deciding whether an error is worth another attempt.
using RetryCondition = std::function<bool(const rsk::foundation::KitError&)>;

/// Retry policy.
struct RetryOptions {
    /// Total attempts including the first. Values below 1 mean one attempt.
    uint32_t maxAttempts = 3;

    std::chrono::milliseconds baseDelay{1000};

    /// Upper bound for any single backoff wait.
    std::chrono::milliseconds maxDelay{10000};

    double backoffFactor = 2.0;

    /// Empty means every error is retryable.
    RetryCondition retryCondition;
};

/// Wait before the attempt following @p attempt (1-based):
/// min(baseDelay * backoffFactor^(attempt-1), maxDelay).
[[nodiscard]] std::chrono::milliseconds computeBackoffDelay(const RetryOptions& options,
                                                            uint32_t attempt);

namespace detail {

template <typename T>
struct RetryRun {
    rsk::foundation::EventLoop& loop;
    rsk::foundation::TaskFactory<T> factory;
    RetryOptions options;
    rsk::foundation::Promise<T> promise;
    uint32_t attempt = 0;

    RetryRun(rsk::foundation::EventLoop& l, rsk::foundation::TaskFactory<T> f, RetryOptions o)
        : loop(l), factory(std::move(f)), options(std::move(o)) {}
};

template <typename T>
void runAttempt(const std::shared_ptr<RetryRun<T>>& run) {
    using rsk::foundation::KitResult;
    using rsk::foundation::LogCategory;

    ++run->attempt;
    rsk::foundation::invokeFactory(run->factory).onComplete(
        [run](const KitResult<T>& outcome) {
            if (outcome) {
                run->promise.settle(outcome);
                return;
            }

            const uint32_t maxAttempts = run->options.maxAttempts < 1 ? 1 : run->options.maxAttempts;
            const bool retryable = !run->options.retryCondition
                                   || run->options.retryCondition(outcome.error());
            if (run->attempt >= maxAttempts || !retryable) {
                // Exhaustion surfaces the last underlying error unchanged.
                run->promise.settle(outcome);
                return;
            }

            auto wait = computeBackoffDelay(run->options, run->attempt);
            if (::rsk::foundation::KitLogger::instance().isEnabled(
                    ::rsk::foundation::LogLevel::Debug, LogCategory::Retry)) {
                rsk::foundation::LogContext ctx;
                ctx.attempt = run->attempt;
                ctx.extra["delay_ms"] = std::to_string(wait.count());
                ctx.extra["error"] = outcome.error().describe();
                ::rsk::foundation::KitLogger::instance().logWithContext(
                    ::rsk::foundation::LogLevel::Debug, LogCategory::Retry,
                    "attempt failed, backing off", ctx);
            }

            rsk::foundation::delay(run->loop, wait).onComplete(
                [run](const KitResult<void>&) { runAttempt(run); });
        });
}

} // namespace detail

/// Invoke @p factory up to options.maxAttempts times.
///
/// On failure the original error propagates immediately if this was the last
/// attempt or retryCondition rejects it; otherwise the next attempt starts
/// after computeBackoffDelay() of loop time. Waiting holds no pool slot and
/// blocks nothing.
///
/// Example:
/// @code
///   RetryOptions opts;
///   opts.maxAttempts = 4;
///   opts.baseDelay = std::chrono::milliseconds(200);
///   opts.retryCondition = [](const KitError& e) { return e.code() != ErrorCode::InvalidArgument; };
///   retry<Order>(loop, [&] { return orders.load(id); }, opts);
/// @endcode
template <typename T>
[[nodiscard]] rsk::foundation::Future<T> retry(rsk::foundation::EventLoop& loop,
                                               rsk::foundation::TaskFactory<T> factory,
                                               RetryOptions options = {}) {
    auto run = std::make_shared<detail::RetryRun<T>>(loop, std::move(factory), std::move(options));
    auto result = run->promise.future();
    detail::runAttempt(run);
    return result;
}

/// Binds an event loop and default retry options.
class RetryExecutor {
public:
    explicit RetryExecutor(rsk::foundation::EventLoop& loop, RetryOptions defaults = {})
        : loop_(loop), defaults_(std::move(defaults)) {}

    template <typename T>
    [[nodiscard]] rsk::foundation::Future<T> execute(rsk::foundation::TaskFactory<T> factory) {
        return retry<T>(loop_, std::move(factory), defaults_);
    }

    template <typename T>
    [[nodiscard]] rsk::foundation::Future<T> execute(rsk::foundation::TaskFactory<T> factory,
                                                     RetryOptions options) {
        return retry<T>(loop_, std::move(factory), std::move(options));
    }

    [[nodiscard]] const RetryOptions& defaults() const noexcept { return defaults_; }

private:
    rsk::foundation::EventLoop& loop_;
    RetryOptions defaults_;
};

} // namespace rsk::resilience
