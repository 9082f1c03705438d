#pragma once

/// @file data_streamer.hpp
/// @brief Polling refresher that maintains and republishes a keyed snapshot.

#include <algorithm>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "rsk/foundation/event_loop.hpp"
#include "rsk/foundation/future.hpp"
#include "rsk/foundation/kit_logger.hpp"
#include "rsk/stream/stream_channel.hpp"

namespace rsk::stream {

/// Polls a fetch function on a loop timer and merges every batch into an
/// insertion-ordered map keyed by @c keyOf (last write wins per key). The
/// full snapshot is republished after every merge and every direct mutation.
///
/// A tick is skipped while a previous fetch is still in flight. A failed
/// fetch is logged and leaves the snapshot untouched. After destroy() no
/// further snapshot is published.
///
/// Example:
/// @code
///   DataStreamer<Product> products(loop, [&] { return catalog.fetchAll(); },
///                                  [](const Product& p) { return p.sku; },
///                                  std::chrono::seconds(30));
///   products.stream().subscribe([](const std::vector<Product>& all) { render(all); });
/// @endcode
template <typename T>
class DataStreamer {
public:
    using FetchFunction = rsk::foundation::TaskFactory<std::vector<T>>;
    using KeyExtractor = std::function<std::string(const T&)>;

    /// Starts polling immediately; the first fetch happens after one interval.
    DataStreamer(rsk::foundation::EventLoop& loop, FetchFunction fetch, KeyExtractor keyOf,
                 std::chrono::milliseconds pollInterval = std::chrono::milliseconds(5000),
                 std::string name = "data")
        : state_(std::make_shared<State>(loop, std::move(fetch), std::move(keyOf), pollInterval,
                                         std::move(name))) {
        start();
    }

    ~DataStreamer() { destroy(); }

    DataStreamer(const DataStreamer&) = delete;
    DataStreamer& operator=(const DataStreamer&) = delete;

    /// Snapshot channel; new subscribers receive the current snapshot.
    [[nodiscard]] SnapshotChannel<std::vector<T>>& stream() { return state_->channel; }

    /// Latest published snapshot.
    [[nodiscard]] std::vector<T> currentData() const { return state_->channel.value(); }

    /// Fetch now and merge. The returned future carries the fetch error, which
    /// is also logged.
    [[nodiscard]] rsk::foundation::Future<void> refresh() { return refreshState(state_); }

    /// Insert or replace the item under its key and republish.
    void addItem(T item) {
        auto& state = *state_;
        if (state.destroyed) {
            return;
        }
        state.put(std::move(item));
        state.publish();
    }

    /// Apply @p mutator to the item stored under @p key and republish.
    /// @return false (and nothing is published) if the key is absent.
    bool updateItem(const std::string& key, const std::function<void(T&)>& mutator) {
        auto& state = *state_;
        if (state.destroyed) {
            return false;
        }
        auto it = state.items.find(key);
        if (it == state.items.end()) {
            return false;
        }
        mutator(it->second);
        state.publish();
        return true;
    }

    /// Remove the item under @p key and republish.
    /// @return true if an item was removed.
    bool removeItem(const std::string& key) {
        auto& state = *state_;
        if (state.destroyed) {
            return false;
        }
        bool removed = state.erase(key);
        state.publish();
        return removed;
    }

    /// Resume polling after stop(). No effect once destroyed.
    void start() {
        auto& state = *state_;
        if (state.destroyed || state.timer != rsk::foundation::EventLoop::kInvalidTimer) {
            return;
        }
        std::weak_ptr<State> weak = state_;
        state.timer = state.loop.scheduleEvery(state.interval, [weak]() {
            auto locked = weak.lock();
            if (!locked) {
                return;
            }
            if (locked->inFlight > 0) {
                RSK_LOG_DEBUG(rsk::foundation::LogCategory::Stream,
                              "streamer '" + locked->name + "': fetch in flight, skipping tick");
                return;
            }
            // Failures are logged inside refreshState().
            (void)refreshState(locked);
        });
    }

    /// Stop polling. The snapshot stays available.
    void stop() {
        auto& state = *state_;
        if (state.timer != rsk::foundation::EventLoop::kInvalidTimer) {
            state.loop.cancel(state.timer);
            state.timer = rsk::foundation::EventLoop::kInvalidTimer;
        }
    }

    /// Stop polling and close the channel. Idempotent.
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

    [[nodiscard]] bool isDestroyed() const { return state_->destroyed; }

    /// Number of keyed items in the snapshot.
    [[nodiscard]] std::size_t cacheSize() const { return state_->items.size(); }

private:
    struct State {
        rsk::foundation::EventLoop& loop;
        FetchFunction fetch;
        KeyExtractor keyOf;
        std::chrono::milliseconds interval;
        std::string name;

        std::vector<std::string> order;
        std::unordered_map<std::string, T> items;
        SnapshotChannel<std::vector<T>> channel;

        rsk::foundation::EventLoop::TimerId timer = rsk::foundation::EventLoop::kInvalidTimer;
        std::size_t inFlight = 0;
        bool destroyed = false;

        State(rsk::foundation::EventLoop& l, FetchFunction f, KeyExtractor k,
              std::chrono::milliseconds i, std::string n)
            : loop(l), fetch(std::move(f)), keyOf(std::move(k)), interval(i),
              name(std::move(n)), channel({}, name) {}

        void put(T item) {
            auto key = keyOf(item);
            auto it = items.find(key);
            if (it == items.end()) {
                order.push_back(key);
                items.emplace(std::move(key), std::move(item));
            } else {
                it->second = std::move(item);
            }
        }

        bool erase(const std::string& key) {
            if (items.erase(key) == 0) {
                return false;
            }
            order.erase(std::remove(order.begin(), order.end(), key), order.end());
            return true;
        }

        void publish() {
            std::vector<T> snapshot;
            snapshot.reserve(order.size());
            for (const auto& key : order) {
                snapshot.push_back(items.at(key));
            }
            channel.publish(std::move(snapshot));
        }
    };

    static rsk::foundation::Future<void> refreshState(const std::shared_ptr<State>& state) {
        using rsk::foundation::ErrorCode;
        using rsk::foundation::KitError;
        using rsk::foundation::KitResult;

        if (state->destroyed) {
            return rsk::foundation::makeErrorFuture<void>(
                KitError(ErrorCode::ChannelCompleted, "streamer '" + state->name + "' destroyed"));
        }

        rsk::foundation::Promise<void> promise;
        auto done = promise.future();
        ++state->inFlight;
        std::weak_ptr<State> weak = state;
        rsk::foundation::invokeFactory(state->fetch).onComplete(
            [weak, promise](const KitResult<std::vector<T>>& batch) mutable {
                auto locked = weak.lock();
                if (!locked) {
                    promise.reject(KitError(ErrorCode::Cancelled, "streamer destroyed"));
                    return;
                }
                --locked->inFlight;
                if (locked->destroyed) {
                    promise.reject(KitError(ErrorCode::ChannelCompleted,
                                            "streamer '" + locked->name + "' destroyed"));
                    return;
                }
                if (!batch) {
                    RSK_LOG_ERROR(rsk::foundation::LogCategory::Stream,
                                  "streamer '" + locked->name + "': refresh failed: "
                                      + batch.error().describe());
                    promise.reject(batch.error());
                    return;
                }
                for (const auto& item : batch.value()) {
                    locked->put(item);
                }
                locked->publish();
                promise.resolve();
            });
        return done;
    }

    std::shared_ptr<State> state_;
};

} // namespace rsk::stream
