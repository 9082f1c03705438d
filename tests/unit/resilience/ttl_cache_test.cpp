#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>

#include "rsk/foundation/clock.hpp"
#include "rsk/foundation/event_loop.hpp"
#include "rsk/foundation/timeout.hpp"
#include "rsk/resilience/ttl_cache.hpp"

using namespace rsk::foundation;
using namespace rsk::resilience;
using namespace std::chrono_literals;

// ===========================================================================
// Test fixture
// ===========================================================================

class TtlCacheTest : public ::testing::Test {
protected:
    TaskFactory<std::string> immediate(std::string value) {
        return [this, value] {
            ++invocations_;
            return makeValueFuture(value);
        };
    }

    TaskFactory<std::string> slow(std::string value, EventLoop::Duration after) {
        return [this, value, after] {
            ++invocations_;
            return delay(loop_, after).then([value](const KitResult<void>&) {
                return makeValueFuture(value);
            });
        };
    }

    TaskFactory<std::string> failing() {
        return [this] {
            ++invocations_;
            return makeErrorFuture<std::string>(KitError(ErrorCode::FetchFailed, "db down"));
        };
    }

    std::shared_ptr<ManualClock> clock_ = std::make_shared<ManualClock>();
    EventLoop loop_{clock_};
    int invocations_ = 0;
};

// ---------------------------------------------------------------------------
// Hits and misses
// ---------------------------------------------------------------------------

TEST_F(TtlCacheTest, FactoryInvokedOnceWithinTtl) {
    TtlCache<std::string> cache(loop_, TtlCacheConfig{.ttl = 1000ms});

    auto first = cache.get("user:1", immediate("alice"));
    clock_->advance(500ms);
    auto second = cache.get("user:1", immediate("other"));

    EXPECT_EQ(first.result().value(), "alice");
    EXPECT_EQ(second.result().value(), "alice");
    EXPECT_EQ(invocations_, 1);
    EXPECT_EQ(cache.hitCount(), 1u);
    EXPECT_EQ(cache.missCount(), 1u);
    EXPECT_DOUBLE_EQ(cache.hitRate(), 0.5);
}

TEST_F(TtlCacheTest, EntryExpiresAtTtl) {
    TtlCache<std::string> cache(loop_, TtlCacheConfig{.ttl = 1000ms});
    (void)cache.get("user:1", immediate("alice"));

    clock_->advance(999ms);
    EXPECT_EQ(cache.peek("user:1"), "alice");

    clock_->advance(1ms);
    EXPECT_FALSE(cache.peek("user:1").has_value());

    auto refreshed = cache.get("user:1", immediate("alice v2"));
    EXPECT_EQ(refreshed.result().value(), "alice v2");
    EXPECT_EQ(invocations_, 2);
}

TEST_F(TtlCacheTest, TtlMeasuredFromWriteNotRead) {
    TtlCache<std::string> cache(loop_, TtlCacheConfig{.ttl = 1000ms});
    (void)cache.get("k", immediate("v"));

    clock_->advance(600ms);
    (void)cache.get("k", immediate("x"));
    clock_->advance(600ms);
    (void)cache.get("k", immediate("x"));

    EXPECT_EQ(invocations_, 2);
}

TEST_F(TtlCacheTest, FailuresAreNotCached) {
    TtlCache<std::string> cache(loop_);
    auto failed = cache.get("k", failing());
    EXPECT_EQ(failed.result().error().code(), ErrorCode::FetchFailed);
    EXPECT_EQ(cache.size(), 0u);

    auto ok = cache.get("k", immediate("v"));
    EXPECT_EQ(ok.result().value(), "v");
    EXPECT_EQ(invocations_, 2);
}

TEST_F(TtlCacheTest, EmptyHitRate) {
    TtlCache<int> cache(loop_);
    EXPECT_DOUBLE_EQ(cache.hitRate(), 0.0);
}

// ---------------------------------------------------------------------------
// In-flight deduplication
// ---------------------------------------------------------------------------

TEST_F(TtlCacheTest, ConcurrentMissesShareOneComputation) {
    TtlCache<std::string> cache(loop_);
    auto a = cache.get("k", slow("v", 100ms));
    auto b = cache.get("k", slow("w", 100ms));
    EXPECT_EQ(cache.inFlightCount(), 1u);

    loop_.runUntilIdle();
    EXPECT_EQ(a.result().value(), "v");
    EXPECT_EQ(b.result().value(), "v");
    EXPECT_EQ(invocations_, 1);
    EXPECT_EQ(cache.inFlightCount(), 0u);
    EXPECT_EQ(cache.peek("k"), "v");
}

TEST_F(TtlCacheTest, DeduplicationCanBeDisabled) {
    TtlCache<std::string> cache(loop_, TtlCacheConfig{.deduplicateInFlight = false});
    auto a = cache.get("k", slow("v", 100ms));
    auto b = cache.get("k", slow("w", 50ms));

    loop_.runUntilIdle();
    EXPECT_EQ(a.result().value(), "v");
    EXPECT_EQ(b.result().value(), "w");
    EXPECT_EQ(invocations_, 2);
    // The most recently started computation owns the entry.
    EXPECT_EQ(cache.peek("k"), "w");
}

TEST_F(TtlCacheTest, SharedFailureIsNotCached) {
    TtlCache<std::string> cache(loop_);
    TaskFactory<std::string> slowFailure = [this] {
        ++invocations_;
        return delay(loop_, 10ms).then([](const KitResult<void>&) {
            return makeErrorFuture<std::string>(KitError(ErrorCode::Timeout));
        });
    };
    auto a = cache.get("k", slowFailure);
    auto b = cache.get("k", slowFailure);
    loop_.runUntilIdle();

    EXPECT_EQ(a.result().error().code(), ErrorCode::Timeout);
    EXPECT_EQ(b.result().error().code(), ErrorCode::Timeout);
    EXPECT_EQ(invocations_, 1);
    EXPECT_EQ(cache.size(), 0u);
}

TEST_F(TtlCacheTest, RemoveDropsInFlightResult) {
    TtlCache<std::string> cache(loop_);
    auto pending = cache.get("k", slow("stale", 100ms));
    EXPECT_FALSE(cache.remove("k"));

    loop_.runUntilIdle();
    EXPECT_EQ(pending.result().value(), "stale");
    EXPECT_EQ(cache.size(), 0u);
}

TEST_F(TtlCacheTest, ClearDropsInFlightResult) {
    TtlCache<std::string> cache(loop_);
    auto pending = cache.get("k", slow("stale", 100ms));
    cache.clear();
    EXPECT_EQ(cache.inFlightCount(), 0u);

    loop_.runUntilIdle();
    EXPECT_FALSE(cache.peek("k").has_value());
}

TEST_F(TtlCacheTest, CacheDestroyedBeforeComputationCompletes) {
    Future<std::string> pending;
    {
        TtlCache<std::string> cache(loop_);
        pending = cache.get("k", slow("v", 10ms));
    }
    loop_.runUntilIdle();
    EXPECT_EQ(pending.result().value(), "v");
}

// ---------------------------------------------------------------------------
// set / remove / cleanup
// ---------------------------------------------------------------------------

TEST_F(TtlCacheTest, SetReplacesAndRestartsTtl) {
    TtlCache<std::string> cache(loop_, TtlCacheConfig{.ttl = 1000ms});
    cache.set("k", "one");
    clock_->advance(800ms);
    cache.set("k", "two");
    clock_->advance(800ms);

    auto got = cache.get("k", immediate("fresh"));
    EXPECT_EQ(got.result().value(), "two");
    EXPECT_EQ(invocations_, 0);
}

TEST_F(TtlCacheTest, RemoveReportsExistingEntry) {
    TtlCache<std::string> cache(loop_);
    cache.set("k", "v");
    EXPECT_TRUE(cache.remove("k"));
    EXPECT_FALSE(cache.remove("k"));
}

TEST_F(TtlCacheTest, CleanupPurgesOnlyExpired) {
    TtlCache<int> cache(loop_, TtlCacheConfig{.ttl = 1000ms});
    cache.set("old-1", 1);
    cache.set("old-2", 2);
    clock_->advance(700ms);
    cache.set("new", 3);
    clock_->advance(300ms);

    EXPECT_EQ(cache.size(), 3u);
    EXPECT_EQ(cache.cleanup(), 2u);
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(cache.peek("new"), 3);
}

TEST_F(TtlCacheTest, ZeroTtlNeverServes) {
    TtlCache<std::string> cache(loop_, TtlCacheConfig{.ttl = 0ms});
    (void)cache.get("k", immediate("v"));
    (void)cache.get("k", immediate("v"));
    EXPECT_EQ(invocations_, 2);
}
