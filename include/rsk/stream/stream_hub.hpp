#pragma once

/// @file stream_hub.hpp
/// @brief Registry of named channels with a global envelope channel.

#include <any>
#include <functional>
#include <memory>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

#include "rsk/foundation/event_loop.hpp"
#include "rsk/foundation/kit_logger.hpp"
#include "rsk/foundation/kit_result.hpp"
#include "rsk/stream/stream_channel.hpp"

namespace rsk::stream {

/// Envelope re-broadcast on the hub's global channel.
struct StreamEvent {
    /// Channel or event name; "error" for stream failures.
    std::string type;

    /// The published value (or a StreamFailure for type "error").
    std::any payload;

    rsk::foundation::EventLoop::TimePoint timestamp{};

    /// UUID-formatted identifier.
    std::string id;

    /// "stream" for channel traffic, "event" for emitEvent().
    std::string source;
};

/// Payload of an "error" envelope.
struct StreamFailure {
    std::string stream;
    rsk::foundation::KitError error;
};

/// Random UUID v4 string used as StreamEvent::id.
[[nodiscard]] std::string generateEventId();

/// Named pub/sub channels plus an ad-hoc event bus, all mirrored to one
/// global channel of StreamEvent envelopes.
///
/// Usage:
/// @code
///   StreamHub hub(loop);
///   hub.global().subscribe([](const StreamEvent& e) { audit(e.type, e.id); });
///
///   auto orders = hub.createChannel<Order>("orders");
///   orders.value()->subscribe([](const Order& o) { ship(o); });
///   (void)hub.emit("orders", Order{42});   // ship() and audit() both run
///   (void)hub.complete("orders");          // channel closed and unregistered
/// @endcode
class StreamHub {
public:
    explicit StreamHub(rsk::foundation::EventLoop& loop);
    ~StreamHub();

    StreamHub(const StreamHub&) = delete;
    StreamHub& operator=(const StreamHub&) = delete;

    // -- Named channels -------------------------------------------------------

    /// Create channel @p name, or return the existing channel of that name.
    /// @return The channel, or ChannelTypeMismatch if it exists with another
    ///         value type.
    template <typename T>
    rsk::foundation::KitResult<std::shared_ptr<StreamChannel<T>>> createChannel(
        const std::string& name);

    /// Look up a channel.
    /// @return The channel, ChannelNotFound, or ChannelTypeMismatch.
    template <typename T>
    [[nodiscard]] rsk::foundation::KitResult<std::shared_ptr<StreamChannel<T>>> channel(
        const std::string& name) const;

    /// Publish to a registered channel.
    template <typename T>
    rsk::foundation::KitResult<void> emit(const std::string& name, T value);

    /// Close a channel with an error and unregister it. The failure is also
    /// broadcast on the global channel as an "error" envelope.
    rsk::foundation::KitResult<void> fail(const std::string& name, rsk::foundation::KitError error);

    /// Close a channel and unregister it.
    rsk::foundation::KitResult<void> complete(const std::string& name);

    [[nodiscard]] bool hasChannel(const std::string& name) const;

    [[nodiscard]] std::size_t channelCount() const;

    /// Registered channel names in creation order.
    [[nodiscard]] std::vector<std::string> channelNames() const;

    // -- Global channel -------------------------------------------------------

    [[nodiscard]] StreamChannel<StreamEvent>& global() { return global_; }

    // -- Event bus ------------------------------------------------------------

    /// Deliver @p payload to onEvent() handlers for @p name and mirror it on
    /// the global channel with source "event".
    void emitEvent(const std::string& name, std::any payload);

    /// Subscribe to ad-hoc events named @p name.
    SubscriptionId onEvent(const std::string& name, std::function<void(const std::any&)> handler);

    /// Typed convenience: events whose payload is not a P are skipped.
    template <typename P>
    SubscriptionId onEvent(const std::string& name, std::function<void(const P&)> handler) {
        return onEvent(name, std::function<void(const std::any&)>(
            [name, fn = std::move(handler)](const std::any& payload) {
                if (const P* typed = std::any_cast<P>(&payload)) {
                    fn(*typed);
                    return;
                }
                RSK_LOG_DEBUG(rsk::foundation::LogCategory::Stream,
                              "event '" + name + "': payload type does not match handler");
            }));
    }

    /// Remove an onEvent() handler. Returns false for an unknown pair.
    bool offEvent(const std::string& name, SubscriptionId id);

private:
    struct ChannelEntry {
        std::type_index type;
        std::shared_ptr<void> channel;
        std::function<void()> complete;
        std::function<void(const rsk::foundation::KitError&)> fail;

        /// Detach the global forwarder.
        std::function<void()> detach;
    };

    void broadcast(const std::string& type, std::any payload, const char* source);

    /// Drop @p name from the registry if it still maps to @p identity.
    void unregister(const std::string& name, const void* identity);

    rsk::foundation::EventLoop& loop_;
    StreamChannel<StreamEvent> global_{"global"};
    std::unordered_map<std::string, ChannelEntry> channels_;
    std::vector<std::string> order_;
    std::unordered_map<std::string, StreamChannel<std::any>> events_;
};

// --- Template implementations ---

template <typename T>
rsk::foundation::KitResult<std::shared_ptr<StreamChannel<T>>> StreamHub::createChannel(
    const std::string& name) {
    using rsk::foundation::ErrorCode;
    using rsk::foundation::KitError;
    using Result = rsk::foundation::KitResult<std::shared_ptr<StreamChannel<T>>>;

    if (auto it = channels_.find(name); it != channels_.end()) {
        if (it->second.type != std::type_index(typeid(T))) {
            return Result::err(KitError(ErrorCode::ChannelTypeMismatch,
                                        "channel '" + name + "' exists with another value type"));
        }
        return Result::ok(std::static_pointer_cast<StreamChannel<T>>(it->second.channel));
    }

    auto created = std::make_shared<StreamChannel<T>>(name);
    std::weak_ptr<StreamChannel<T>> weak = created;
    const void* identity = created.get();

    // The forwarder is the first subscriber: it mirrors values on the global
    // channel and unregisters the channel once it closes, however it closes.
    auto forwarder = created->subscribe(
        [this, name](const T& value) { broadcast(name, std::any(value), "stream"); },
        [this, name, identity](const KitError& error) {
            broadcast("error", std::any(StreamFailure{name, error}), "stream");
            unregister(name, identity);
        },
        [this, name, identity]() { unregister(name, identity); });

    ChannelEntry entry{
        std::type_index(typeid(T)),
        created,
        [weak]() {
            if (auto ch = weak.lock()) {
                ch->complete();
            }
        },
        [weak](const KitError& error) {
            if (auto ch = weak.lock()) {
                ch->fail(error);
            }
        },
        [weak, forwarder]() {
            if (auto ch = weak.lock()) {
                ch->unsubscribe(forwarder);
            }
        }};

    channels_.emplace(name, std::move(entry));
    order_.push_back(name);
    RSK_LOG_DEBUG(rsk::foundation::LogCategory::Stream, "channel '" + name + "' created");
    return Result::ok(std::move(created));
}

template <typename T>
rsk::foundation::KitResult<std::shared_ptr<StreamChannel<T>>> StreamHub::channel(
    const std::string& name) const {
    using rsk::foundation::ErrorCode;
    using rsk::foundation::KitError;
    using Result = rsk::foundation::KitResult<std::shared_ptr<StreamChannel<T>>>;

    auto it = channels_.find(name);
    if (it == channels_.end()) {
        return Result::err(KitError(ErrorCode::ChannelNotFound, "no channel named '" + name + "'"));
    }
    if (it->second.type != std::type_index(typeid(T))) {
        return Result::err(KitError(ErrorCode::ChannelTypeMismatch,
                                    "channel '" + name + "' holds another value type"));
    }
    return Result::ok(std::static_pointer_cast<StreamChannel<T>>(it->second.channel));
}

template <typename T>
rsk::foundation::KitResult<void> StreamHub::emit(const std::string& name, T value) {
    auto found = channel<T>(name);
    if (!found) {
        return rsk::foundation::KitResult<void>::err(std::move(found).error());
    }
    found.value()->publish(std::move(value));
    return rsk::foundation::KitResult<void>::ok();
}

} // namespace rsk::stream
