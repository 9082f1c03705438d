#pragma once

/// @file stream_channel.hpp
/// @brief Multi-subscriber broadcast channels with ordered re-entrant delivery.
///
/// StreamChannel<T> delivers every value published while a subscriber is
/// attached exactly once, in publish order. Values published from inside a
/// subscriber callback are queued behind the one being dispatched instead of
/// being delivered recursively. SnapshotChannel<T> additionally hands each
/// new subscriber the latest value.

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "rsk/foundation/kit_error.hpp"

namespace rsk::stream {

/// Identifier of one subscription on one channel.
using SubscriptionId = uint64_t;

/// Returned when subscribing to a channel that is already closed.
inline constexpr SubscriptionId kInvalidSubscription = 0;

/// Named broadcast channel.
///
/// Copies share the same underlying channel. A channel is closed by
/// complete() or fail(); both are terminal, notify current subscribers and
/// detach them. Subscribing to a closed channel reports the terminal event
/// immediately.
///
/// Example:
/// @code
///   StreamChannel<Order> orders("orders");
///   auto id = orders.subscribe([](const Order& o) { ship(o); });
///   orders.publish(Order{42});
///   orders.unsubscribe(id);
/// @endcode
template <typename T>
class StreamChannel {
public:
    using ValueHandler = std::function<void(const T&)>;
    using ErrorHandler = std::function<void(const rsk::foundation::KitError&)>;
    using CompleteHandler = std::function<void()>;

    explicit StreamChannel(std::string name = {})
        : core_(std::make_shared<Core>()) {
        core_->name = std::move(name);
    }

    /// Attach a subscriber. Returns kInvalidSubscription if closed.
    SubscriptionId subscribe(ValueHandler onValue, ErrorHandler onError = {},
                             CompleteHandler onComplete = {}) {
        auto core = core_;
        if (core->closed) {
            if (core->terminalError && onError) {
                onError(*core->terminalError);
            } else if (!core->terminalError && onComplete) {
                onComplete();
            }
            return kInvalidSubscription;
        }
        auto id = core->nextId++;
        core->subscribers.emplace(
            id, Subscriber{std::move(onValue), std::move(onError), std::move(onComplete)});
        return id;
    }

    /// Detach a subscriber. No further events reach it, including events
    /// already queued. Returns false for an unknown id.
    bool unsubscribe(SubscriptionId id) {
        return core_->subscribers.erase(id) > 0;
    }

    /// Broadcast @p value. Ignored once the channel is closed.
    ///
    /// An exception thrown by a handler propagates to the caller; subscribers
    /// after it miss that value, but the channel keeps delivering.
    void publish(T value) {
        auto core = core_;
        if (core->closed) {
            return;
        }
        enqueue(core, Event{Payload(std::in_place_index<0>, std::move(value)), core->nextId});
    }

    /// Close with an error: subscribers' error handlers run, then all detach.
    void fail(rsk::foundation::KitError error) {
        auto core = core_;
        if (core->closed) {
            return;
        }
        core->closed = true;
        core->terminalError = error;
        enqueue(core, Event{Payload(std::in_place_index<1>, std::move(error)), core->nextId});
    }

    /// Close normally: subscribers' completion handlers run, then all detach.
    void complete() {
        auto core = core_;
        if (core->closed) {
            return;
        }
        core->closed = true;
        enqueue(core, Event{Payload(std::in_place_index<2>), core->nextId});
    }

    [[nodiscard]] bool isClosed() const noexcept { return core_->closed; }

    [[nodiscard]] std::size_t subscriberCount() const noexcept { return core_->subscribers.size(); }

    /// Values published since construction.
    [[nodiscard]] uint64_t publishedCount() const noexcept { return core_->published; }

    [[nodiscard]] std::string_view name() const noexcept { return core_->name; }

private:
    struct Completed {};

    // Indexed so that T may itself be constructible from KitError.
    using Payload = std::variant<T, rsk::foundation::KitError, Completed>;

    struct Event {
        Payload payload;

        // Subscribers with an id at or above this attached after the event
        // was published and must not see it.
        SubscriptionId watermark = 0;
    };

    struct Subscriber {
        ValueHandler onValue;
        ErrorHandler onError;
        CompleteHandler onComplete;
    };

    struct Core {
        std::string name;
        std::map<SubscriptionId, Subscriber> subscribers;
        std::deque<Event> pending;
        SubscriptionId nextId = 1;
        uint64_t published = 0;
        bool dispatching = false;
        bool closed = false;
        std::optional<rsk::foundation::KitError> terminalError;
    };

    static void enqueue(const std::shared_ptr<Core>& core, Event event) {
        core->pending.push_back(std::move(event));
        if (core->dispatching) {
            return;
        }
        // A throwing handler propagates out of publish(); the flag must still
        // drop so later events are delivered. Events left queued go out with
        // the next publish.
        struct DispatchGuard {
            Core& core;
            explicit DispatchGuard(Core& c) : core(c) { core.dispatching = true; }
            ~DispatchGuard() { core.dispatching = false; }
        } guard(*core);
        while (!core->pending.empty()) {
            Event next = std::move(core->pending.front());
            core->pending.pop_front();
            deliver(*core, next);
        }
    }

    static void deliver(Core& core, const Event& event) {
        std::vector<SubscriptionId> targets;
        targets.reserve(core.subscribers.size());
        for (const auto& [id, subscriber] : core.subscribers) {
            if (id >= event.watermark) {
                break;
            }
            targets.push_back(id);
        }

        if (const T* value = std::get_if<0>(&event.payload)) {
            ++core.published;
            for (auto id : targets) {
                auto it = core.subscribers.find(id);
                if (it == core.subscribers.end() || !it->second.onValue) {
                    continue;
                }
                // Copy: the handler may unsubscribe itself.
                auto handler = it->second.onValue;
                handler(*value);
            }
            return;
        }

        // Terminal event: detach everyone first so handlers cannot observe
        // further values.
        auto subscribers = std::move(core.subscribers);
        core.subscribers.clear();
        const auto* error = std::get_if<1>(&event.payload);
        for (auto id : targets) {
            auto& subscriber = subscribers.at(id);
            if (error && subscriber.onError) {
                subscriber.onError(*error);
            } else if (!error && subscriber.onComplete) {
                subscriber.onComplete();
            }
        }
    }

    std::shared_ptr<Core> core_;
};

/// Channel that remembers its latest value and replays it to each new
/// subscriber before any later value.
///
/// Example:
/// @code
///   SnapshotChannel<std::vector<Product>> catalog({}, "catalog");
///   catalog.publish(loadAll());
///   catalog.subscribe([](const auto& products) { render(products); });  // renders now
/// @endcode
template <typename T>
class SnapshotChannel {
public:
    using ValueHandler = typename StreamChannel<T>::ValueHandler;
    using ErrorHandler = typename StreamChannel<T>::ErrorHandler;
    using CompleteHandler = typename StreamChannel<T>::CompleteHandler;

    explicit SnapshotChannel(T initial, std::string name = {})
        : channel_(std::move(name)), latest_(std::make_shared<T>(std::move(initial))) {}

    /// Attach a subscriber and hand it the latest value immediately.
    SubscriptionId subscribe(ValueHandler onValue, ErrorHandler onError = {},
                             CompleteHandler onComplete = {}) {
        if (channel_.isClosed()) {
            return channel_.subscribe(std::move(onValue), std::move(onError), std::move(onComplete));
        }
        auto id = channel_.subscribe(onValue, std::move(onError), std::move(onComplete));
        if (onValue) {
            auto latest = latest_;
            onValue(*latest);
        }
        return id;
    }

    bool unsubscribe(SubscriptionId id) { return channel_.unsubscribe(id); }

    /// Replace the latest value and broadcast it. Ignored once closed.
    void publish(T value) {
        if (channel_.isClosed()) {
            return;
        }
        *latest_ = value;
        channel_.publish(std::move(value));
    }

    void fail(rsk::foundation::KitError error) { channel_.fail(std::move(error)); }

    void complete() { channel_.complete(); }

    /// The latest value (the initial one until the first publish).
    [[nodiscard]] const T& value() const noexcept { return *latest_; }

    [[nodiscard]] bool isClosed() const noexcept { return channel_.isClosed(); }

    [[nodiscard]] std::size_t subscriberCount() const noexcept { return channel_.subscriberCount(); }

    [[nodiscard]] std::string_view name() const noexcept { return channel_.name(); }

private:
    StreamChannel<T> channel_;
    std::shared_ptr<T> latest_;
};

} // namespace rsk::stream
