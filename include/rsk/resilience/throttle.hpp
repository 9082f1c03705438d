#pragma once

/// @file throttle.hpp
/// @brief Call-site wrappers: concurrency-throttled and debounced async functions.

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>

#include "rsk/foundation/event_loop.hpp"
#include "rsk/foundation/future.hpp"
#include "rsk/resilience/concurrency_pool.hpp"

namespace rsk::resilience {

/// Asynchronous function taking @p Args.
template <typename R, typename... Args>
using AsyncFunction = std::function<rsk::foundation::Future<R>(Args...)>;

/// Wrap @p fn so that at most @p limit calls run at once. Excess calls wait
/// in FIFO order. Arguments are copied at call time.
///
/// All copies of the returned function share one pool; dropping the last
/// copy rejects calls still waiting with Cancelled.
///
/// Example:
/// @code
///   auto upload = throttle<Receipt, Blob>(loop, AsyncFunction<Receipt, Blob>(putObject), 3);
///   for (auto& blob : blobs) {
///       upload(blob).onComplete(record);   // never more than 3 in flight
///   }
/// @endcode
template <typename R, typename... Args>
[[nodiscard]] AsyncFunction<R, Args...> throttle(rsk::foundation::EventLoop& loop,
                                                 AsyncFunction<R, Args...> fn,
                                                 std::size_t limit) {
    auto pool = std::make_shared<ConcurrencyPool>(loop, PoolConfig{limit, "throttle"});
    return [pool, fn = std::move(fn)](Args... args) {
        auto bound = std::make_tuple(std::decay_t<Args>(std::move(args))...);
        return pool->template run<R>([fn, bound]() { return std::apply(fn, bound); });
    };
}

namespace detail {

template <typename R, typename... Args>
struct DebounceState {
    using Arguments = std::tuple<std::decay_t<Args>...>;

    DebounceState(rsk::foundation::EventLoop& l, std::chrono::milliseconds d,
                  AsyncFunction<R, Args...> f)
        : loop(l), loopAlive(l.lifetime()), delay(d), fn(std::move(f)) {}

    ~DebounceState() {
        if (timer != rsk::foundation::EventLoop::kInvalidTimer && !loopAlive.expired()) {
            loop.cancel(timer);
        }
        if (pending) {
            pending->reject(rsk::foundation::KitError(rsk::foundation::ErrorCode::Cancelled,
                                                      "debounced function destroyed"));
        }
    }

    rsk::foundation::EventLoop& loop;
    std::weak_ptr<void> loopAlive;
    std::chrono::milliseconds delay;
    AsyncFunction<R, Args...> fn;

    rsk::foundation::EventLoop::TimerId timer = rsk::foundation::EventLoop::kInvalidTimer;
    std::optional<rsk::foundation::Promise<R>> pending;
    std::optional<Arguments> arguments;

    // The invocation still running, if any, and its sequence number.
    std::optional<rsk::foundation::Future<R>> inFlight;
    uint64_t invocation = 0;
};

template <typename R, typename... Args>
void fireDebounced(const std::shared_ptr<DebounceState<R, Args...>>& state) {
    using rsk::foundation::KitResult;

    state->timer = rsk::foundation::EventLoop::kInvalidTimer;
    auto promise = std::move(*state->pending);
    auto arguments = std::move(*state->arguments);
    state->pending.reset();
    state->arguments.reset();

    // A quiet period that ends while an earlier invocation is running
    // shares that invocation's outcome.
    if (state->inFlight) {
        state->inFlight->onComplete(
            [promise](const KitResult<R>& outcome) mutable { promise.settle(outcome); });
        return;
    }

    auto fn = state->fn;
    auto future = rsk::foundation::invokeFactory<R>(
        [fn, arguments]() { return std::apply(fn, arguments); });
    auto sequence = ++state->invocation;
    state->inFlight = future;

    std::weak_ptr<DebounceState<R, Args...>> weak = state;
    future.onComplete([weak, sequence](const KitResult<R>&) {
        auto locked = weak.lock();
        if (locked && locked->invocation == sequence) {
            locked->inFlight.reset();
        }
    });
    future.onComplete(
        [promise](const KitResult<R>& outcome) mutable { promise.settle(outcome); });
}

} // namespace detail

/// Wrap @p fn so that it only runs once @p delay has passed without another
/// call. The call that survives the quiet period invokes @p fn with its own
/// arguments; every call it superseded rejects with Cancelled.
///
/// Dropping the last copy of the returned function cancels the pending call.
template <typename R, typename... Args>
[[nodiscard]] AsyncFunction<R, Args...> debounce(rsk::foundation::EventLoop& loop,
                                                 AsyncFunction<R, Args...> fn,
                                                 std::chrono::milliseconds delay) {
    using State = detail::DebounceState<R, Args...>;

    auto state = std::make_shared<State>(loop, delay, std::move(fn));
    return [state](Args... args) {
        if (state->timer != rsk::foundation::EventLoop::kInvalidTimer) {
            state->loop.cancel(state->timer);
        }
        if (state->pending) {
            auto superseded = std::move(*state->pending);
            state->pending.reset();
            superseded.reject(rsk::foundation::KitError(rsk::foundation::ErrorCode::Cancelled,
                                                        "superseded by a later call"));
        }

        rsk::foundation::Promise<R> promise;
        auto result = promise.future();
        state->pending = promise;
        state->arguments = typename State::Arguments(std::move(args)...);

        std::weak_ptr<State> weak = state;
        state->timer = state->loop.schedule(state->delay, [weak]() {
            if (auto locked = weak.lock(); locked && locked->pending) {
                detail::fireDebounced<R, Args...>(locked);
            }
        });
        return result;
    };
}

} // namespace rsk::resilience
