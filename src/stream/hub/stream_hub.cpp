/// @file stream_hub.cpp
/// @brief StreamHub registry, global envelopes and event bus.

#include "rsk/stream/stream_hub.hpp"

#include <algorithm>
#include <cstdio>
#include <random>

namespace rsk::stream {

using rsk::foundation::ErrorCode;
using rsk::foundation::KitError;
using rsk::foundation::KitResult;
using rsk::foundation::LogCategory;

std::string generateEventId() {
    thread_local std::mt19937_64 gen(std::random_device{}());
    std::uniform_int_distribution<uint64_t> dist;

    uint64_t hi = dist(gen);
    uint64_t lo = dist(gen);

    // Version 4, variant 1.
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buf[37];
    std::snprintf(buf,
                  sizeof(buf),
                  "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<uint32_t>(hi >> 32),
                  static_cast<uint16_t>((hi >> 16) & 0xFFFF),
                  static_cast<uint16_t>(hi & 0xFFFF),
                  static_cast<uint16_t>(lo >> 48),
                  static_cast<unsigned long long>(lo & 0x0000FFFFFFFFFFFFULL));
    return buf;
}

StreamHub::StreamHub(rsk::foundation::EventLoop& loop)
    : loop_(loop) {}

StreamHub::~StreamHub() {
    // Channels handed out may outlive the hub; their forwarders capture it.
    for (auto& [name, entry] : channels_) {
        entry.detach();
    }
}

KitResult<void> StreamHub::fail(const std::string& name, KitError error) {
    auto it = channels_.find(name);
    if (it == channels_.end()) {
        return KitResult<void>::err(
            KitError(ErrorCode::ChannelNotFound, "no channel named '" + name + "'"));
    }
    RSK_LOG_WARN(LogCategory::Stream, "channel '" + name + "' failed: " + error.describe());

    // The forwarder erases the entry while this runs.
    auto keepAlive = it->second.channel;
    auto close = it->second.fail;
    close(error);
    return KitResult<void>::ok();
}

KitResult<void> StreamHub::complete(const std::string& name) {
    auto it = channels_.find(name);
    if (it == channels_.end()) {
        return KitResult<void>::err(
            KitError(ErrorCode::ChannelNotFound, "no channel named '" + name + "'"));
    }

    auto keepAlive = it->second.channel;
    auto close = it->second.complete;
    close();
    RSK_LOG_DEBUG(LogCategory::Stream, "channel '" + name + "' completed");
    return KitResult<void>::ok();
}

bool StreamHub::hasChannel(const std::string& name) const {
    return channels_.count(name) > 0;
}

std::size_t StreamHub::channelCount() const {
    return channels_.size();
}

std::vector<std::string> StreamHub::channelNames() const {
    return order_;
}

void StreamHub::emitEvent(const std::string& name, std::any payload) {
    if (auto it = events_.find(name); it != events_.end()) {
        // Copy the handle: a handler may remove the last subscription.
        auto handlers = it->second;
        handlers.publish(payload);
    }
    broadcast(name, std::move(payload), "event");
}

SubscriptionId StreamHub::onEvent(const std::string& name,
                                  std::function<void(const std::any&)> handler) {
    auto it = events_.try_emplace(name, name).first;
    return it->second.subscribe(std::move(handler));
}

bool StreamHub::offEvent(const std::string& name, SubscriptionId id) {
    auto it = events_.find(name);
    if (it == events_.end()) {
        return false;
    }
    return it->second.unsubscribe(id);
}

void StreamHub::broadcast(const std::string& type, std::any payload, const char* source) {
    global_.publish(StreamEvent{type, std::move(payload), loop_.now(), generateEventId(), source});
}

void StreamHub::unregister(const std::string& name, const void* identity) {
    auto it = channels_.find(name);
    if (it == channels_.end() || it->second.channel.get() != identity) {
        return;
    }
    channels_.erase(it);
    order_.erase(std::remove(order_.begin(), order_.end(), name), order_.end());
}

} // namespace rsk::stream
