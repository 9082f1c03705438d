#pragma once

/// @file future.hpp
/// @brief Single-threaded Future<T>/Promise<T> settling with KitResult<T>.
///
/// A Promise settles exactly once; later settle attempts are ignored and
/// report false. This is what lets a timeout, a superseding query, or a
/// destroyed stream "win" against an operation that is still in flight:
/// the late outcome simply finds the promise already settled.

#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

#include "rsk/foundation/kit_result.hpp"

namespace rsk::foundation {

template <typename T>
class Promise;

namespace detail {

template <typename T>
struct FutureState {
    std::optional<KitResult<T>> result;
    std::vector<std::function<void(const KitResult<T>&)>> callbacks;
};

} // namespace detail

/// Read side of an asynchronous result.
///
/// Copies share the same state. Continuations registered with onComplete()
/// run synchronously when the promise settles, or immediately if it
/// already has.
template <typename T>
class Future {
public:
    using ValueType = T;
    using Callback = std::function<void(const KitResult<T>&)>;

    /// Constructs an invalid future (valid() == false).
    Future() = default;

    [[nodiscard]] bool valid() const noexcept { return state_ != nullptr; }

    [[nodiscard]] bool isReady() const noexcept {
        return state_ && state_->result.has_value();
    }

    /// The settled result. Only meaningful when isReady().
    [[nodiscard]] const KitResult<T>& result() const { return *state_->result; }

    /// Register a continuation. Runs now if already settled.
    void onComplete(Callback callback) const {
        if (!state_ || !callback) {
            return;
        }
        if (state_->result) {
            callback(*state_->result);
            return;
        }
        state_->callbacks.push_back(std::move(callback));
    }

    /// Chain an asynchronous step. @p fn receives the settled result and
    /// returns the next Future; the returned future mirrors that one.
    template <typename F>
    auto then(F fn) const -> std::invoke_result_t<F, const KitResult<T>&> {
        using Next = std::invoke_result_t<F, const KitResult<T>&>;
        using U = typename Next::ValueType;

        Promise<U> promise;
        auto chained = promise.future();
        onComplete([promise, fn = std::move(fn)](const KitResult<T>& r) mutable {
            Next inner = fn(r);
            if (!inner.valid()) {
                promise.reject(KitError(ErrorCode::InvalidFuture,
                                        "continuation returned an invalid future"));
                return;
            }
            inner.onComplete([promise](const KitResult<U>& nr) mutable {
                promise.settle(nr);
            });
        });
        return chained;
    }

private:
    template <typename>
    friend class Promise;

    explicit Future(std::shared_ptr<detail::FutureState<T>> state)
        : state_(std::move(state)) {}

    std::shared_ptr<detail::FutureState<T>> state_;
};

/// Write side of an asynchronous result. Copies share the same state.
///
/// Example:
/// @code
///   Promise<int> promise;
///   auto future = promise.future();
///   future.onComplete([](const KitResult<int>& r) { use(r.value()); });
///   promise.resolve(42);      // runs the continuation
///   promise.resolve(7);       // ignored, returns false
/// @endcode
template <typename T>
class Promise {
public:
    Promise() : state_(std::make_shared<detail::FutureState<T>>()) {}

    [[nodiscard]] Future<T> future() const { return Future<T>(state_); }

    [[nodiscard]] bool isSettled() const noexcept { return state_->result.has_value(); }

    /// Settle with @p result. Returns false if already settled.
    bool settle(KitResult<T> result) {
        if (state_->result) {
            return false;
        }
        // Hold the state: a continuation may drop the last Future/Promise.
        auto state = state_;
        state->result.emplace(std::move(result));
        auto callbacks = std::move(state->callbacks);
        state->callbacks.clear();
        for (auto& callback : callbacks) {
            callback(*state->result);
        }
        return true;
    }

    template <typename U = T, std::enable_if_t<!std::is_void_v<U>, int> = 0>
    bool resolve(U value) {
        return settle(KitResult<T>::ok(std::move(value)));
    }

    template <typename U = T, std::enable_if_t<std::is_void_v<U>, int> = 0>
    bool resolve() {
        return settle(KitResult<T>::ok());
    }

    bool reject(KitError error) {
        return settle(KitResult<T>::err(std::move(error)));
    }

private:
    std::shared_ptr<detail::FutureState<T>> state_;
};

/// Zero-argument asynchronous operation.
template <typename T>
using TaskFactory = std::function<Future<T>()>;

template <typename T>
[[nodiscard]] Future<T> makeReadyFuture(KitResult<T> result) {
    Promise<T> promise;
    promise.settle(std::move(result));
    return promise.future();
}

template <typename T>
[[nodiscard]] Future<T> makeValueFuture(T value) {
    return makeReadyFuture<T>(KitResult<T>::ok(std::move(value)));
}

[[nodiscard]] inline Future<void> makeVoidFuture() {
    return makeReadyFuture<void>(KitResult<void>::ok());
}

template <typename T>
[[nodiscard]] Future<T> makeErrorFuture(KitError error) {
    return makeReadyFuture<T>(KitResult<T>::err(std::move(error)));
}

/// Call @p factory, turning an empty factory, an invalid returned future,
/// or a thrown std::exception into a rejected future.
template <typename T>
[[nodiscard]] Future<T> invokeFactory(const TaskFactory<T>& factory) {
    if (!factory) {
        return makeErrorFuture<T>(
            KitError(ErrorCode::InvalidArgument, "empty task factory"));
    }
    try {
        auto future = factory();
        if (!future.valid()) {
            return makeErrorFuture<T>(
                KitError(ErrorCode::InvalidFuture, "task factory returned an invalid future"));
        }
        return future;
    } catch (const std::exception& e) {
        return makeErrorFuture<T>(KitError(ErrorCode::TaskFailed, e.what()));
    }
}

} // namespace rsk::foundation
