#pragma once

/// @file connection_hub.hpp
/// @brief Per-connection push channels fed by a shared broadcast channel.

#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "rsk/foundation/kit_logger.hpp"
#include "rsk/stream/stream_channel.hpp"

namespace rsk::stream {

/// Fan-out for long-lived client connections (server-sent events and the
/// like). Each connection gets its own channel that receives every
/// broadcast() plus the values sent to it directly.
///
/// A connection is unregistered as soon as its channel closes, whoever
/// closes it. Destroying the hub completes every remaining connection.
///
/// Example:
/// @code
///   ConnectionHub<std::string> events;
///   auto conn = events.createConnection("client-7");
///   conn->subscribe([&](const std::string& e) { socket.write(e); });
///   events.broadcast("inventory-changed");          // every connection
///   events.sendToConnection("client-7", "welcome");  // client-7 only
///   conn->complete();                                // unregistered
/// @endcode
template <typename T>
class ConnectionHub {
public:
    ConnectionHub() : state_(std::make_shared<State>()) {}

    ~ConnectionHub() {
        // Completing a connection unregisters it; collect first.
        std::vector<std::shared_ptr<StreamChannel<T>>> open;
        for (const auto& [id, connection] : state_->connections) {
            open.push_back(connection.channel);
        }
        for (auto& channel : open) {
            channel->complete();
        }
        state_->global.complete();
    }

    ConnectionHub(const ConnectionHub&) = delete;
    ConnectionHub& operator=(const ConnectionHub&) = delete;

    /// Open connection @p id, or return it if already open.
    std::shared_ptr<StreamChannel<T>> createConnection(const std::string& id) {
        if (auto it = state_->connections.find(id); it != state_->connections.end()) {
            return it->second.channel;
        }

        auto channel = std::make_shared<StreamChannel<T>>(id);
        std::weak_ptr<StreamChannel<T>> weakChannel = channel;
        auto forwarder = state_->global.subscribe([weakChannel](const T& value) {
            if (auto locked = weakChannel.lock()) {
                locked->publish(value);
            }
        });

        std::weak_ptr<State> weak = state_;
        const void* identity = channel.get();
        auto drop = [weak, id, identity]() {
            if (auto locked = weak.lock()) {
                locked->drop(id, identity);
            }
        };
        channel->subscribe({}, [drop](const rsk::foundation::KitError&) { drop(); }, drop);

        state_->connections.emplace(id, Connection{channel, forwarder});
        RSK_LOG_DEBUG(rsk::foundation::LogCategory::Stream, "connection '" + id + "' opened");
        return channel;
    }

    /// Deliver @p value to every open connection.
    void broadcast(T value) { state_->global.publish(std::move(value)); }

    /// Deliver @p value to one connection. Returns false for an unknown id.
    bool sendToConnection(const std::string& id, T value) {
        auto it = state_->connections.find(id);
        if (it == state_->connections.end()) {
            return false;
        }
        auto channel = it->second.channel;
        channel->publish(std::move(value));
        return true;
    }

    /// Complete and unregister a connection. Returns false for an unknown id.
    bool closeConnection(const std::string& id) {
        auto it = state_->connections.find(id);
        if (it == state_->connections.end()) {
            return false;
        }
        auto channel = it->second.channel;
        channel->complete();
        return true;
    }

    [[nodiscard]] bool hasConnection(const std::string& id) const {
        return state_->connections.count(id) > 0;
    }

    [[nodiscard]] std::size_t connectionCount() const { return state_->connections.size(); }

    /// Open connection ids in lexicographic order.
    [[nodiscard]] std::vector<std::string> connectionIds() const {
        std::vector<std::string> ids;
        ids.reserve(state_->connections.size());
        for (const auto& [id, connection] : state_->connections) {
            ids.push_back(id);
        }
        return ids;
    }

private:
    struct Connection {
        std::shared_ptr<StreamChannel<T>> channel;
        SubscriptionId forwarder = kInvalidSubscription;
    };

    struct State {
        StreamChannel<T> global{"broadcast"};
        std::map<std::string, Connection> connections;

        void drop(const std::string& id, const void* identity) {
            auto it = connections.find(id);
            if (it == connections.end() || it->second.channel.get() != identity) {
                return;
            }
            global.unsubscribe(it->second.forwarder);
            connections.erase(it);
            RSK_LOG_DEBUG(rsk::foundation::LogCategory::Stream, "connection '" + id + "' closed");
        }
    };

    std::shared_ptr<State> state_;
};

} // namespace rsk::stream
