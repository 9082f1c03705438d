#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "rsk/foundation/clock.hpp"
#include "rsk/foundation/event_loop.hpp"
#include "rsk/foundation/timeout.hpp"
#include "rsk/resilience/resilient_executor.hpp"

using namespace rsk::foundation;
using namespace rsk::resilience;
using namespace std::chrono_literals;

// ===========================================================================
// Test fixture
// ===========================================================================

class ResilientExecutorTest : public ::testing::Test {
protected:
    ResilientExecutorConfig smallConfig() {
        ResilientExecutorConfig config;
        config.cache.ttl = 1000ms;
        config.breaker.failureThreshold = 2;
        config.breaker.callTimeout = 500ms;
        config.breaker.resetTimeout = 5000ms;
        config.limiter.maxRequests = 2;
        config.limiter.window = 1000ms;
        config.limiter.pollInterval = 100ms;
        return config;
    }

    TaskFactory<std::string> loadUser(std::string name) {
        return [this, name] {
            ++invocations_;
            return makeValueFuture(name);
        };
    }

    TaskFactory<std::string> failingLoad() {
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
// executeCached
// ---------------------------------------------------------------------------

TEST_F(ResilientExecutorTest, CachedResultServedWithinTtl) {
    ResilientExecutor executor(loop_, smallConfig());

    auto first = executor.executeCached<std::string>("user:1", loadUser("alice"));
    auto second = executor.executeCached<std::string>("user:1", loadUser("bob"));
    loop_.runUntilIdle();

    EXPECT_EQ(first.result().value(), "alice");
    EXPECT_EQ(second.result().value(), "alice");
    EXPECT_EQ(invocations_, 1);

    clock_->advance(1000ms);
    auto third = executor.executeCached<std::string>("user:1", loadUser("carol"));
    loop_.runUntilIdle();
    EXPECT_EQ(third.result().value(), "carol");
    EXPECT_EQ(invocations_, 2);
}

TEST_F(ResilientExecutorTest, BypassingCacheAlwaysInvokes) {
    ResilientExecutor executor(loop_, smallConfig());
    (void)executor.executeCached<std::string>("user:1", loadUser("alice"), false);
    (void)executor.executeCached<std::string>("user:1", loadUser("alice"), false);
    loop_.runUntilIdle();
    EXPECT_EQ(invocations_, 2);
    EXPECT_EQ(executor.cache().size(), 0u);
}

TEST_F(ResilientExecutorTest, DifferentTypesUnderDifferentKeys) {
    ResilientExecutor executor(loop_, smallConfig());
    auto name = executor.executeCached<std::string>("user:1:name", loadUser("alice"));
    auto age = executor.executeCached<int>("user:1:age", [] { return makeValueFuture(34); });
    loop_.runUntilIdle();

    EXPECT_EQ(name.result().value(), "alice");
    EXPECT_EQ(age.result().value(), 34);
    EXPECT_EQ(executor.cache().size(), 2u);
}

TEST_F(ResilientExecutorTest, ReadingKeyWithWrongTypeFails) {
    ResilientExecutor executor(loop_, smallConfig());
    (void)executor.executeCached<std::string>("k", loadUser("alice"));
    auto wrong = executor.executeCached<int>("k", [] { return makeValueFuture(1); });
    loop_.runUntilIdle();

    ASSERT_TRUE(wrong.result().hasError());
    EXPECT_EQ(wrong.result().error().code(), ErrorCode::TypeMismatch);
}

TEST_F(ResilientExecutorTest, FailuresFeedBreakerAndAreNotCached) {
    ResilientExecutor executor(loop_, smallConfig());
    auto a = executor.executeCached<std::string>("k", failingLoad());
    auto b = executor.executeCached<std::string>("k", failingLoad());
    loop_.runUntilIdle();

    EXPECT_EQ(a.result().error().code(), ErrorCode::FetchFailed);
    EXPECT_EQ(b.result().error().code(), ErrorCode::FetchFailed);
    EXPECT_EQ(executor.cache().size(), 0u);
    EXPECT_EQ(executor.breaker().state(), CircuitBreaker::State::Open);

    auto rejected = executor.executeCached<std::string>("k", loadUser("alice"));
    loop_.runUntilIdle();
    EXPECT_EQ(rejected.result().error().code(), ErrorCode::CircuitOpen);
    EXPECT_EQ(invocations_, 2);
}

TEST_F(ResilientExecutorTest, CacheHitSkipsOpenBreaker) {
    ResilientExecutor executor(loop_, smallConfig());
    (void)executor.executeCached<std::string>("k", loadUser("alice"));
    executor.breaker().forceState(CircuitBreaker::State::Open);

    auto cached = executor.executeCached<std::string>("k", loadUser("bob"));
    loop_.runUntilIdle();
    EXPECT_EQ(cached.result().value(), "alice");
}

// ---------------------------------------------------------------------------
// Rate limiting
// ---------------------------------------------------------------------------

TEST_F(ResilientExecutorTest, ExecuteIfAllowedRejectsWhenFull) {
    ResilientExecutor executor(loop_, smallConfig());
    auto a = executor.executeIfAllowed<std::string>(loadUser("a"));
    auto b = executor.executeIfAllowed<std::string>(loadUser("b"));
    auto c = executor.executeIfAllowed<std::string>(loadUser("c"));

    EXPECT_EQ(a.result().value(), "a");
    EXPECT_EQ(b.result().value(), "b");
    EXPECT_EQ(c.result().error().code(), ErrorCode::RateLimited);
    EXPECT_EQ(invocations_, 2);
}

TEST_F(ResilientExecutorTest, ExecuteRateLimitedWaitsForSlot) {
    ResilientExecutor executor(loop_, smallConfig());
    auto start = loop_.now();
    std::vector<EventLoop::Duration> ranAt;
    TaskFactory<void> send = [&] {
        ranAt.push_back(loop_.now() - start);
        return makeVoidFuture();
    };

    for (int i = 0; i < 3; ++i) {
        (void)executor.executeRateLimited<void>(send);
    }
    loop_.runUntilIdle();

    ASSERT_EQ(ranAt.size(), 3u);
    EXPECT_EQ(ranAt[1], 0ms);
    EXPECT_EQ(ranAt[2], 1000ms);
}

TEST_F(ResilientExecutorTest, ExecuteGuardedCombinesLimiterAndCache) {
    ResilientExecutor executor(loop_, smallConfig());
    auto a = executor.executeGuarded<std::string>("k", loadUser("alice"));
    auto b = executor.executeGuarded<std::string>("k", loadUser("bob"));
    auto c = executor.executeGuarded<std::string>("k", loadUser("carol"));
    loop_.runUntilIdle();

    EXPECT_EQ(a.result().value(), "alice");
    EXPECT_EQ(b.result().value(), "alice");
    // The third waits a full window, by which time the entry has expired.
    EXPECT_EQ(c.result().value(), "carol");
    EXPECT_EQ(invocations_, 2);
}

TEST_F(ResilientExecutorTest, PendingGuardedCallsCancelledOnDestruction) {
    Future<std::string> pending;
    {
        ResilientExecutor executor(loop_, smallConfig());
        (void)executor.executeGuarded<std::string>("a", loadUser("a"));
        (void)executor.executeGuarded<std::string>("b", loadUser("b"));
        pending = executor.executeGuarded<std::string>("c", loadUser("c"));
    }
    ASSERT_TRUE(pending.isReady());
    EXPECT_EQ(pending.result().error().code(), ErrorCode::Cancelled);
}

// ---------------------------------------------------------------------------
// executeBatch / health
// ---------------------------------------------------------------------------

TEST_F(ResilientExecutorTest, ExecuteBatchKeepsOrder) {
    ResilientExecutor executor(loop_, smallConfig());
    ItemProcessor<int, int> square = [this](const int& item) {
        return delay(loop_, std::chrono::milliseconds(10 * (4 - item)))
            .then([item](const KitResult<void>&) { return makeValueFuture(item * item); });
    };
    auto future = executor.executeBatch<int, int>({1, 2, 3}, square, 2);
    loop_.runUntilIdle();
    EXPECT_EQ(future.result().value(), (std::vector<int>{1, 4, 9}));
}

TEST_F(ResilientExecutorTest, HealthReflectsComponents) {
    ResilientExecutor executor(loop_, smallConfig());
    (void)executor.executeCached<std::string>("k", loadUser("alice"));
    (void)executor.executeCached<std::string>("k", loadUser("alice"));
    ASSERT_TRUE(executor.limiter().checkLimit());

    auto healthy = executor.health();
    EXPECT_EQ(healthy.status, "healthy");
    EXPECT_EQ(healthy.cacheSize, 1u);
    EXPECT_DOUBLE_EQ(healthy.cacheHitRate, 0.5);
    EXPECT_EQ(healthy.breakerState, CircuitBreaker::State::Closed);
    EXPECT_EQ(healthy.rateLimiter.currentRequests, 1u);
    EXPECT_EQ(healthy.rateLimiter.remainingRequests, 1u);

    (void)executor.executeCached<std::string>("x", failingLoad());
    (void)executor.executeCached<std::string>("y", failingLoad());
    (void)executor.executeCached<std::string>("z", failingLoad());

    auto degraded = executor.health();
    EXPECT_EQ(degraded.status, "degraded");
    EXPECT_EQ(degraded.breakerState, CircuitBreaker::State::Open);
    EXPECT_EQ(degraded.breakerRejected, 1u);
}
