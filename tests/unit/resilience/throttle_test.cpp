#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <memory>
#include <optional>
#include <vector>

#include "rsk/foundation/clock.hpp"
#include "rsk/foundation/event_loop.hpp"
#include "rsk/foundation/timeout.hpp"
#include "rsk/resilience/throttle.hpp"

using namespace rsk::foundation;
using namespace rsk::resilience;
using namespace std::chrono_literals;

// ===========================================================================
// Test fixture
// ===========================================================================

class ThrottleTest : public ::testing::Test {
protected:
    /// Doubles its argument after @p after of loop time.
    AsyncFunction<int, int> slowDouble(EventLoop::Duration after) {
        return [this, after](int x) {
            started_.push_back(x);
            ++active_;
            peak_ = std::max(peak_, active_);
            return delay(loop_, after).then([this, x](const KitResult<void>&) {
                --active_;
                return makeValueFuture(x * 2);
            });
        };
    }

    /// Doubles its argument immediately.
    AsyncFunction<int, int> instantDouble() {
        return [this](int x) {
            started_.push_back(x);
            return makeValueFuture(x * 2);
        };
    }

    std::shared_ptr<ManualClock> clock_ = std::make_shared<ManualClock>();
    EventLoop loop_{clock_};
    std::vector<int> started_;
    int active_ = 0;
    int peak_ = 0;
};

// ---------------------------------------------------------------------------
// throttle
// ---------------------------------------------------------------------------

TEST_F(ThrottleTest, LimitsConcurrentCalls) {
    auto throttled = throttle<int, int>(loop_, slowDouble(100ms), 2);

    std::vector<Future<int>> results;
    for (int i = 1; i <= 5; ++i) {
        results.push_back(throttled(i));
    }
    EXPECT_EQ(active_, 2);

    loop_.runUntilIdle();

    EXPECT_EQ(peak_, 2);
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(results[i].isReady());
        EXPECT_EQ(results[i].result().value(), (i + 1) * 2);
    }
}

TEST_F(ThrottleTest, QueuedCallsStartInCallOrder) {
    auto throttled = throttle<int, int>(loop_, slowDouble(50ms), 1);

    auto a = throttled(3);
    auto b = throttled(1);
    auto c = throttled(2);
    loop_.runUntilIdle();

    EXPECT_EQ(started_, (std::vector<int>{3, 1, 2}));
    EXPECT_EQ(peak_, 1);
    EXPECT_EQ(c.result().value(), 4);
}

TEST_F(ThrottleTest, FailurePassesThroughAndFreesTheSlot) {
    AsyncFunction<int, int> picky = [](int x) {
        if (x < 0) {
            return makeErrorFuture<int>(KitError(ErrorCode::FetchFailed, "negative"));
        }
        return makeValueFuture(x);
    };
    auto throttled = throttle<int, int>(loop_, picky, 1);

    auto bad = throttled(-1);
    auto good = throttled(7);
    loop_.runUntilIdle();

    ASSERT_TRUE(bad.isReady());
    EXPECT_EQ(bad.result().error().code(), ErrorCode::FetchFailed);
    ASSERT_TRUE(good.isReady());
    EXPECT_EQ(good.result().value(), 7);
}

TEST_F(ThrottleTest, DroppingTheFunctionCancelsWaitingCalls) {
    std::optional<Future<int>> waiting;
    {
        auto throttled = throttle<int, int>(loop_, slowDouble(100ms), 1);
        (void)throttled(1);
        waiting = throttled(2);
    }

    ASSERT_TRUE(waiting->isReady());
    EXPECT_EQ(waiting->result().error().code(), ErrorCode::Cancelled);
    loop_.runUntilIdle();
    EXPECT_EQ(started_, (std::vector<int>{1}));
}

// ---------------------------------------------------------------------------
// debounce
// ---------------------------------------------------------------------------

TEST_F(ThrottleTest, DebounceWaitsForQuietPeriod) {
    auto debounced = debounce<int, int>(loop_, instantDouble(), 300ms);

    auto result = debounced(4);
    loop_.runFor(299ms);
    EXPECT_TRUE(started_.empty());
    EXPECT_FALSE(result.isReady());

    loop_.runFor(1ms);
    EXPECT_EQ(started_, (std::vector<int>{4}));
    ASSERT_TRUE(result.isReady());
    EXPECT_EQ(result.result().value(), 8);
}

TEST_F(ThrottleTest, DebounceRunsOnlyTheLastCall) {
    auto debounced = debounce<int, int>(loop_, instantDouble(), 300ms);

    auto first = debounced(1);
    loop_.runFor(100ms);
    auto second = debounced(2);
    loop_.runFor(100ms);
    auto third = debounced(3);
    loop_.runUntilIdle();

    EXPECT_EQ(started_, (std::vector<int>{3}));
    ASSERT_TRUE(first.isReady());
    EXPECT_EQ(first.result().error().code(), ErrorCode::Cancelled);
    ASSERT_TRUE(second.isReady());
    EXPECT_EQ(second.result().error().code(), ErrorCode::Cancelled);
    ASSERT_TRUE(third.isReady());
    EXPECT_EQ(third.result().value(), 6);
}

TEST_F(ThrottleTest, DebounceSharesTheRunningInvocation) {
    auto debounced = debounce<int, int>(loop_, slowDouble(500ms), 300ms);

    auto first = debounced(1);
    loop_.runFor(300ms);
    EXPECT_EQ(started_, (std::vector<int>{1}));

    // Its quiet period ends while the first call is still running.
    auto second = debounced(2);
    loop_.runFor(300ms);
    loop_.runUntilIdle();

    EXPECT_EQ(started_, (std::vector<int>{1}));
    EXPECT_EQ(first.result().value(), 2);
    EXPECT_EQ(second.result().value(), 2);
}

TEST_F(ThrottleTest, DebounceInvokesAgainOnceIdle) {
    auto debounced = debounce<int, int>(loop_, slowDouble(100ms), 300ms);

    auto first = debounced(1);
    loop_.runUntilIdle();
    auto second = debounced(5);
    loop_.runUntilIdle();

    EXPECT_EQ(started_, (std::vector<int>{1, 5}));
    EXPECT_EQ(second.result().value(), 10);
}

TEST_F(ThrottleTest, DroppingDebouncedFunctionCancelsPendingCall) {
    std::optional<Future<int>> pending;
    {
        auto debounced = debounce<int, int>(loop_, instantDouble(), 300ms);
        pending = debounced(1);
    }

    ASSERT_TRUE(pending->isReady());
    EXPECT_EQ(pending->result().error().code(), ErrorCode::Cancelled);
    EXPECT_EQ(loop_.pendingTimers(), 0u);
    loop_.runUntilIdle();
    EXPECT_TRUE(started_.empty());
}
