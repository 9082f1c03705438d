#pragma once

/// @file ttl_cache.hpp
/// @brief Per-key memoization of asynchronous results with write-time TTL.

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

#include "rsk/foundation/event_loop.hpp"
#include "rsk/foundation/future.hpp"
#include "rsk/foundation/kit_logger.hpp"

namespace rsk::resilience {

/// Configuration for a TtlCache instance.
struct TtlCacheConfig {
    /// Lifetime of an entry, measured from the moment it was written.
    std::chrono::milliseconds ttl{300000};

    /// Concurrent misses on one key share a single factory invocation.
    bool deduplicateInFlight = true;

    /// Human-readable name for logging.
    std::string name = "default";
};

/// In-memory cache of asynchronous results keyed by caller-chosen strings.
///
/// Expiry is lazy on read and eager on cleanup(); an expired entry is never
/// served. Factory failures are not cached and propagate to the caller.
///
/// Example:
/// @code
///   TtlCache<Product> cache(loop, TtlCacheConfig{.ttl = std::chrono::seconds(30)});
///   cache.get("product:42", [&] { return catalog.fetch(42); })
///       .onComplete([](const KitResult<Product>& r) { render(r); });
/// @endcode
template <typename V>
class TtlCache {
public:
    explicit TtlCache(rsk::foundation::EventLoop& loop, TtlCacheConfig config = {})
        : loop_(loop), state_(std::make_shared<State>()) {
        state_->config = std::move(config);
    }

    TtlCache(const TtlCache&) = delete;
    TtlCache& operator=(const TtlCache&) = delete;

    /// Serve a live entry, or compute it with @p factory and store it.
    [[nodiscard]] rsk::foundation::Future<V> get(const std::string& key,
                                                 rsk::foundation::TaskFactory<V> factory);

    /// Store @p value, replacing any existing entry and restarting its TTL.
    void set(const std::string& key, V value);

    /// Delete an entry. A computation in flight for @p key is not stored.
    /// @return true if a live or expired entry existed.
    bool remove(const std::string& key);

    /// Purge every expired entry.
    /// @return Number of entries removed.
    std::size_t cleanup();

    /// Live value without touching statistics or invoking anything.
    [[nodiscard]] std::optional<V> peek(const std::string& key) const;

    /// Drop all entries and forget computations in flight.
    void clear();

    // ── Queries ──────────────────────────────────────────────────────────

    /// Stored entries, including expired ones not yet purged.
    [[nodiscard]] std::size_t size() const { return state_->entries.size(); }

    [[nodiscard]] std::size_t inFlightCount() const { return state_->inFlight.size(); }

    /// Lookups answered without invoking a factory (joining an in-flight
    /// computation counts as a hit).
    [[nodiscard]] uint64_t hitCount() const { return state_->hits; }

    [[nodiscard]] uint64_t missCount() const { return state_->misses; }

    /// Hit ratio in [0, 1]; 0 when nothing was looked up yet.
    [[nodiscard]] double hitRate() const {
        const uint64_t total = state_->hits + state_->misses;
        return total == 0 ? 0.0 : static_cast<double>(state_->hits) / static_cast<double>(total);
    }

    [[nodiscard]] const TtlCacheConfig& config() const { return state_->config; }

private:
    using TimePoint = rsk::foundation::EventLoop::TimePoint;

    struct Entry {
        V value;
        TimePoint expiresAt;
    };

    struct Computation {
        uint64_t id = 0;
        rsk::foundation::Future<V> future;
    };

    // Shared with pending factory continuations so they can outlive the cache.
    struct State {
        TtlCacheConfig config;
        std::unordered_map<std::string, Entry> entries;
        std::unordered_map<std::string, Computation> inFlight;
        uint64_t nextComputation = 1;
        uint64_t hits = 0;
        uint64_t misses = 0;
    };

    [[nodiscard]] bool isLive(const Entry& entry) const { return loop_.now() < entry.expiresAt; }

    static void store(State& state, const std::string& key, V value, TimePoint now) {
        state.entries.insert_or_assign(key, Entry{std::move(value), now + state.config.ttl});
    }

    rsk::foundation::EventLoop& loop_;
    std::shared_ptr<State> state_;
};

// --- Template implementations ---

template <typename V>
rsk::foundation::Future<V> TtlCache<V>::get(const std::string& key,
                                            rsk::foundation::TaskFactory<V> factory) {
    using rsk::foundation::KitResult;
    using rsk::foundation::LogCategory;

    auto& state = *state_;
    if (auto it = state.entries.find(key); it != state.entries.end()) {
        if (isLive(it->second)) {
            ++state.hits;
            return rsk::foundation::makeValueFuture(it->second.value);
        }
        state.entries.erase(it);
    }

    if (state.config.deduplicateInFlight) {
        if (auto it = state.inFlight.find(key); it != state.inFlight.end()) {
            ++state.hits;
            return it->second.future;
        }
    }

    ++state.misses;
    auto computation = rsk::foundation::invokeFactory(factory);
    if (computation.isReady()) {
        if (computation.result()) {
            store(state, key, computation.result().value(), loop_.now());
        }
        return computation;
    }

    // Tracked even without deduplication so remove()/clear() can drop the
    // result; a newer computation for the same key supersedes an older one.
    const uint64_t id = state.nextComputation++;
    state.inFlight.insert_or_assign(key, Computation{id, computation});

    std::weak_ptr<State> weak = state_;
    auto& loop = loop_;
    std::weak_ptr<void> loopAlive = loop_.lifetime();
    computation.onComplete([weak, key, id, &loop, loopAlive](const KitResult<V>& outcome) {
        auto shared = weak.lock();
        if (!shared || loopAlive.expired()) {
            return;
        }
        auto it = shared->inFlight.find(key);
        if (it == shared->inFlight.end() || it->second.id != id) {
            // Removed, cleared or superseded while computing.
            return;
        }
        shared->inFlight.erase(it);
        if (outcome) {
            store(*shared, key, outcome.value(), loop.now());
        } else {
            RSK_LOG_DEBUG(LogCategory::Cache, "cache '" + shared->config.name
                                                  + "': not caching failed result for '" + key
                                                  + "': " + outcome.error().describe());
        }
    });
    return computation;
}

template <typename V>
void TtlCache<V>::set(const std::string& key, V value) {
    store(*state_, key, std::move(value), loop_.now());
}

template <typename V>
bool TtlCache<V>::remove(const std::string& key) {
    state_->inFlight.erase(key);
    return state_->entries.erase(key) > 0;
}

template <typename V>
std::size_t TtlCache<V>::cleanup() {
    std::size_t purged = 0;
    for (auto it = state_->entries.begin(); it != state_->entries.end();) {
        if (isLive(it->second)) {
            ++it;
        } else {
            it = state_->entries.erase(it);
            ++purged;
        }
    }
    if (purged > 0) {
        RSK_LOG_DEBUG(rsk::foundation::LogCategory::Cache,
                      "cache '" + state_->config.name + "': purged " + std::to_string(purged)
                          + " expired entries");
    }
    return purged;
}

template <typename V>
std::optional<V> TtlCache<V>::peek(const std::string& key) const {
    auto it = state_->entries.find(key);
    if (it == state_->entries.end() || !isLive(it->second)) {
        return std::nullopt;
    }
    return it->second.value;
}

template <typename V>
void TtlCache<V>::clear() {
    state_->entries.clear();
    state_->inFlight.clear();
}

} // namespace rsk::resilience
