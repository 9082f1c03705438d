#pragma once

/// @file timeout.hpp
/// @brief Timer-backed primitives: delay() and withTimeout().

#include <memory>
#include <string>
#include <utility>

#include "rsk/foundation/event_loop.hpp"
#include "rsk/foundation/future.hpp"

namespace rsk::foundation {

/// Future that resolves after @p duration of loop time.
[[nodiscard]] inline Future<void> delay(EventLoop& loop, EventLoop::Duration duration) {
    Promise<void> promise;
    auto future = promise.future();
    loop.schedule(duration, [promise]() mutable { promise.resolve(); });
    return future;
}

/// Race @p future against a timer.
///
/// If the timer wins the result is a Timeout error carrying @p message.
/// The wrapped operation is not interrupted; its eventual outcome is
/// dropped. If the operation wins, the timer is cancelled.
template <typename T>
[[nodiscard]] Future<T> withTimeout(EventLoop& loop, Future<T> future,
                                    EventLoop::Duration timeout,
                                    std::string message = "operation timed out") {
    if (!future.valid()) {
        return makeErrorFuture<T>(
            KitError(ErrorCode::InvalidFuture, "cannot time out an invalid future"));
    }
    if (future.isReady()) {
        return future;
    }

    Promise<T> promise;
    auto raced = promise.future();
    auto timerId = loop.schedule(timeout, [promise, msg = std::move(message)]() mutable {
        promise.reject(KitError(ErrorCode::Timeout, msg));
    });
    std::weak_ptr<void> loopAlive = loop.lifetime();
    future.onComplete([&loop, loopAlive, promise, timerId](const KitResult<T>& result) mutable {
        // The operation may settle after the loop is gone; its timer went with it.
        if (!loopAlive.expired()) {
            loop.cancel(timerId);
        }
        promise.settle(result);
    });
    return raced;
}

} // namespace rsk::foundation
