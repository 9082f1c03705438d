#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

#include "rsk/foundation/clock.hpp"
#include "rsk/foundation/event_loop.hpp"
#include "rsk/foundation/timeout.hpp"
#include "rsk/resilience/concurrency_pool.hpp"

using namespace rsk::foundation;
using namespace rsk::resilience;
using namespace std::chrono_literals;

// ===========================================================================
// Test fixture
// ===========================================================================

class ConcurrencyPoolTest : public ::testing::Test {
protected:
    /// Task that resolves to @p value after @p after of loop time.
    TaskFactory<int> delayed(int value, EventLoop::Duration after) {
        return [this, value, after] {
            ++started_;
            return delay(loop_, after).then([value](const KitResult<void>&) {
                return makeValueFuture(value);
            });
        };
    }

    TaskFactory<int> failing(ErrorCode code, EventLoop::Duration after) {
        return [this, code, after] {
            ++started_;
            return delay(loop_, after).then([code](const KitResult<void>&) {
                return makeErrorFuture<int>(KitError(code, "task failed"));
            });
        };
    }

    std::shared_ptr<ManualClock> clock_ = std::make_shared<ManualClock>();
    EventLoop loop_{clock_};
    int started_ = 0;
};

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

TEST_F(ConcurrencyPoolTest, DefaultConfig) {
    ConcurrencyPool pool(loop_);
    EXPECT_EQ(pool.concurrency(), 5u);
    EXPECT_EQ(pool.name(), "default");
    EXPECT_EQ(pool.runningCount(), 0u);
    EXPECT_EQ(pool.waitingCount(), 0u);
}

TEST_F(ConcurrencyPoolTest, ZeroConcurrencyClampedToOne) {
    ConcurrencyPool pool(loop_, PoolConfig{.concurrency = 0, .name = "zero"});
    EXPECT_EQ(pool.concurrency(), 1u);
}

// ---------------------------------------------------------------------------
// acquire / release
// ---------------------------------------------------------------------------

TEST_F(ConcurrencyPoolTest, AcquireWithinCapacityIsImmediate) {
    ConcurrencyPool pool(loop_, PoolConfig{.concurrency = 2});
    auto a = pool.acquire();
    auto b = pool.acquire();
    auto c = pool.acquire();

    EXPECT_TRUE(a.isReady());
    EXPECT_TRUE(b.isReady());
    EXPECT_FALSE(c.isReady());
    EXPECT_EQ(pool.runningCount(), 2u);
    EXPECT_EQ(pool.waitingCount(), 1u);
}

TEST_F(ConcurrencyPoolTest, ReleaseHandsSlotToOldestWaiter) {
    ConcurrencyPool pool(loop_, PoolConfig{.concurrency = 1});
    auto first = pool.acquire();
    auto second = pool.acquire();
    auto third = pool.acquire();

    first.result().value()->release();
    // The slot stays reserved for the waiter until the hand-off turn.
    EXPECT_EQ(pool.runningCount(), 1u);
    EXPECT_FALSE(second.isReady());

    loop_.runUntilIdle();
    ASSERT_TRUE(second.isReady());
    EXPECT_FALSE(third.isReady());
    EXPECT_EQ(pool.waitingCount(), 1u);
    EXPECT_EQ(pool.completedCount(), 1u);
}

TEST_F(ConcurrencyPoolTest, SlotReleasedOnceEvenIfReleasedTwice) {
    ConcurrencyPool pool(loop_, PoolConfig{.concurrency = 1});
    auto slot = pool.acquire().result().value();
    slot->release();
    slot->release();
    EXPECT_TRUE(slot->isReleased());
    EXPECT_EQ(pool.runningCount(), 0u);
    EXPECT_EQ(pool.completedCount(), 1u);
}

TEST_F(ConcurrencyPoolTest, DroppingLastHandleReleasesSlot) {
    ConcurrencyPool pool(loop_, PoolConfig{.concurrency = 1});
    {
        auto slot = pool.acquire().result().value();
        EXPECT_EQ(pool.runningCount(), 1u);
    }
    EXPECT_EQ(pool.runningCount(), 0u);
}

TEST_F(ConcurrencyPoolTest, SlotsAreOnlyCreatedByThePool) {
    static_assert(!std::is_default_constructible_v<ConcurrencyPool::Slot>);
    static_assert(!std::is_copy_constructible_v<ConcurrencyPool::Slot>);

    ConcurrencyPool pool(loop_, PoolConfig{.concurrency = 1});
    auto slot = pool.acquire().result().value();
    EXPECT_EQ(slot.use_count(), 1);
    EXPECT_FALSE(slot->isReleased());
}

TEST_F(ConcurrencyPoolTest, DestroyingPoolCancelsWaiters) {
    Future<ConcurrencyPool::SlotHandle> waiting;
    ConcurrencyPool::SlotHandle held;
    {
        ConcurrencyPool pool(loop_, PoolConfig{.concurrency = 1});
        held = pool.acquire().result().value();
        waiting = pool.acquire();
    }
    ASSERT_TRUE(waiting.isReady());
    EXPECT_EQ(waiting.result().error().code(), ErrorCode::Cancelled);

    // Releasing after the pool is gone is harmless.
    held->release();
    EXPECT_TRUE(held->isReleased());
}

// ---------------------------------------------------------------------------
// run
// ---------------------------------------------------------------------------

TEST_F(ConcurrencyPoolTest, RunPropagatesValue) {
    ConcurrencyPool pool(loop_);
    auto future = pool.run(delayed(9, 10ms));
    loop_.runUntilIdle();
    ASSERT_TRUE(future.isReady());
    EXPECT_EQ(future.result().value(), 9);
    EXPECT_EQ(pool.runningCount(), 0u);
}

TEST_F(ConcurrencyPoolTest, RunPropagatesErrorAndReleasesSlot) {
    ConcurrencyPool pool(loop_, PoolConfig{.concurrency = 1});
    auto bad = pool.run(failing(ErrorCode::FetchFailed, 10ms));
    auto good = pool.run(delayed(1, 10ms));
    loop_.runUntilIdle();

    EXPECT_EQ(bad.result().error().code(), ErrorCode::FetchFailed);
    EXPECT_EQ(good.result().value(), 1);
    EXPECT_EQ(pool.runningCount(), 0u);
}

TEST_F(ConcurrencyPoolTest, SlotIsFreeWhenContinuationRuns) {
    ConcurrencyPool pool(loop_, PoolConfig{.concurrency = 1});
    std::size_t runningSeen = 99;
    pool.run(delayed(1, 5ms)).onComplete([&](const KitResult<int>&) {
        runningSeen = pool.runningCount();
    });
    loop_.runUntilIdle();
    EXPECT_EQ(runningSeen, 0u);
}

TEST_F(ConcurrencyPoolTest, ThrowingFactoryFailsTask) {
    ConcurrencyPool pool(loop_, PoolConfig{.concurrency = 1});
    auto future = pool.run<int>([]() -> Future<int> { throw std::runtime_error("bad input"); });
    loop_.runUntilIdle();
    EXPECT_EQ(future.result().error().code(), ErrorCode::TaskFailed);
    EXPECT_EQ(pool.runningCount(), 0u);
}

TEST_F(ConcurrencyPoolTest, NeverExceedsConcurrency) {
    ConcurrencyPool pool(loop_, PoolConfig{.concurrency = 3});
    std::size_t maxSeen = 0;
    std::vector<Future<int>> futures;
    for (int i = 0; i < 20; ++i) {
        futures.push_back(pool.run<int>([&, i] {
            maxSeen = std::max(maxSeen, pool.runningCount());
            return delay(loop_, std::chrono::milliseconds(5 + (i % 4) * 7))
                .then([i](const KitResult<void>&) { return makeValueFuture(i); });
        }));
    }
    loop_.runUntilIdle();

    EXPECT_LE(maxSeen, 3u);
    EXPECT_EQ(pool.peakRunningCount(), 3u);
    EXPECT_EQ(pool.completedCount(), 20u);
    for (int i = 0; i < 20; ++i) {
        EXPECT_EQ(futures[i].result().value(), i);
    }
}

// ---------------------------------------------------------------------------
// runAll / runAllSettled
// ---------------------------------------------------------------------------

TEST_F(ConcurrencyPoolTest, RunAllPreservesInputOrder) {
    ConcurrencyPool pool(loop_, PoolConfig{.concurrency = 2});
    std::vector<TaskFactory<int>> tasks = {
        delayed(1, 50ms), delayed(2, 10ms), delayed(3, 30ms), delayed(4, 5ms)};

    auto all = pool.runAll(std::move(tasks));
    loop_.runUntilIdle();

    ASSERT_TRUE(all.isReady());
    EXPECT_EQ(all.result().value(), (std::vector<int>{1, 2, 3, 4}));
}

TEST_F(ConcurrencyPoolTest, RunAllFailsWithFirstError) {
    ConcurrencyPool pool(loop_, PoolConfig{.concurrency = 4});
    std::vector<TaskFactory<int>> tasks = {
        delayed(1, 10ms), failing(ErrorCode::Timeout, 20ms),
        failing(ErrorCode::FetchFailed, 30ms), delayed(4, 40ms)};

    auto all = pool.runAll(std::move(tasks));
    loop_.runUntilIdle();

    ASSERT_TRUE(all.isReady());
    EXPECT_EQ(all.result().error().code(), ErrorCode::Timeout);
    // Remaining tasks still ran.
    EXPECT_EQ(started_, 4);
    EXPECT_EQ(pool.completedCount(), 4u);
}

TEST_F(ConcurrencyPoolTest, RunAllEmptyResolvesImmediately) {
    ConcurrencyPool pool(loop_);
    auto all = pool.runAll(std::vector<TaskFactory<int>>{});
    ASSERT_TRUE(all.isReady());
    EXPECT_TRUE(all.result().value().empty());
}

TEST_F(ConcurrencyPoolTest, RunAllSettledReportsEveryOutcome) {
    ConcurrencyPool pool(loop_, PoolConfig{.concurrency = 2});
    std::vector<TaskFactory<int>> tasks = {
        delayed(1, 30ms), failing(ErrorCode::FetchFailed, 10ms), delayed(3, 20ms)};

    auto settled = pool.runAllSettled(std::move(tasks));
    loop_.runUntilIdle();

    ASSERT_TRUE(settled.isReady());
    const auto& outcomes = settled.result().value();
    ASSERT_EQ(outcomes.size(), 3u);
    EXPECT_EQ(outcomes[0].value(), 1);
    EXPECT_EQ(outcomes[1].error().code(), ErrorCode::FetchFailed);
    EXPECT_EQ(outcomes[2].value(), 3);
}
