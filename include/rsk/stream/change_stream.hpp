#pragma once

/// @file change_stream.hpp
/// @brief Polled change feed published one change at a time.

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "rsk/foundation/event_loop.hpp"
#include "rsk/foundation/future.hpp"
#include "rsk/foundation/kit_logger.hpp"
#include "rsk/stream/stream_channel.hpp"

namespace rsk::stream {

/// Polls @c fetchChanges every interval once started and publishes each
/// returned change individually, in batch order. Fetch failures are logged
/// and polling continues. A tick is skipped while a fetch is in flight.
///
/// Example:
/// @code
///   ChangeStream<OrderChange> feed(loop, [&] { return orders.changesSince(cursor); });
///   feed.changes().subscribe([](const OrderChange& c) { notify(c); });
///   feed.start();
/// @endcode
template <typename T>
class ChangeStream {
public:
    using FetchChanges = rsk::foundation::TaskFactory<std::vector<T>>;

    ChangeStream(rsk::foundation::EventLoop& loop, FetchChanges fetchChanges,
                 std::chrono::milliseconds pollInterval = std::chrono::milliseconds(1000),
                 std::string name = "changes")
        : state_(std::make_shared<State>(loop, std::move(fetchChanges), pollInterval,
                                         std::move(name))) {}

    ~ChangeStream() { destroy(); }

    ChangeStream(const ChangeStream&) = delete;
    ChangeStream& operator=(const ChangeStream&) = delete;

    [[nodiscard]] StreamChannel<T>& changes() { return state_->channel; }

    /// Begin polling. No effect if running or destroyed.
    void start() {
        auto& state = *state_;
        if (state.destroyed || state.timer != rsk::foundation::EventLoop::kInvalidTimer) {
            return;
        }
        std::weak_ptr<State> weak = state_;
        state.timer = state.loop.scheduleEvery(state.interval, [weak]() {
            if (auto locked = weak.lock()) {
                poll(locked);
            }
        });
    }

    void stop() {
        auto& state = *state_;
        if (state.timer != rsk::foundation::EventLoop::kInvalidTimer) {
            state.loop.cancel(state.timer);
            state.timer = rsk::foundation::EventLoop::kInvalidTimer;
        }
    }

    /// Stop polling and complete the channel. Idempotent.
    void destroy() {
        stop();
        if (state_->destroyed) {
            return;
        }
        state_->destroyed = true;
        state_->channel.complete();
    }

    [[nodiscard]] bool isRunning() const {
        return state_->timer != rsk::foundation::EventLoop::kInvalidTimer;
    }

    [[nodiscard]] uint64_t failedPolls() const { return state_->failures; }

private:
    struct State {
        rsk::foundation::EventLoop& loop;
        FetchChanges fetch;
        std::chrono::milliseconds interval;
        std::string name;
        StreamChannel<T> channel;
        rsk::foundation::EventLoop::TimerId timer = rsk::foundation::EventLoop::kInvalidTimer;
        bool inFlight = false;
        bool destroyed = false;
        uint64_t failures = 0;

        State(rsk::foundation::EventLoop& l, FetchChanges f, std::chrono::milliseconds i,
              std::string n)
            : loop(l), fetch(std::move(f)), interval(i), name(std::move(n)), channel(name) {}
    };

    static void poll(const std::shared_ptr<State>& state) {
        using rsk::foundation::KitResult;

        if (state->inFlight) {
            return;
        }
        state->inFlight = true;
        std::weak_ptr<State> weak = state;
        rsk::foundation::invokeFactory(state->fetch).onComplete(
            [weak](const KitResult<std::vector<T>>& batch) {
                auto locked = weak.lock();
                if (!locked) {
                    return;
                }
                locked->inFlight = false;
                if (locked->destroyed) {
                    return;
                }
                if (!batch) {
                    ++locked->failures;
                    RSK_LOG_ERROR(rsk::foundation::LogCategory::Stream,
                                  "change stream '" + locked->name + "' poll failed: "
                                      + batch.error().describe());
                    return;
                }
                for (const auto& change : batch.value()) {
                    locked->channel.publish(change);
                }
            });
    }

    std::shared_ptr<State> state_;
};

} // namespace rsk::stream
