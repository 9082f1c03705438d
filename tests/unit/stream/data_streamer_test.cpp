#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "rsk/foundation/clock.hpp"
#include "rsk/foundation/event_loop.hpp"
#include "rsk/foundation/timeout.hpp"
#include "rsk/stream/data_streamer.hpp"

using namespace rsk::foundation;
using namespace rsk::stream;
using namespace std::chrono_literals;

namespace {

struct Item {
    int id;
    std::string label;
};

bool operator==(const Item& a, const Item& b) {
    return a.id == b.id && a.label == b.label;
}

} // namespace

// ===========================================================================
// Test fixture
// ===========================================================================

class DataStreamerTest : public ::testing::Test {
protected:
    /// Returns the next scripted batch on each call.
    DataStreamer<Item>::FetchFunction scripted() {
        return [this]() -> Future<std::vector<Item>> {
            ++fetches_;
            if (batches_.empty()) {
                return makeValueFuture(std::vector<Item>{});
            }
            auto next = batches_.front();
            batches_.erase(batches_.begin());
            return makeValueFuture(next);
        };
    }

    static std::string keyOf(const Item& item) { return std::to_string(item.id); }

    std::unique_ptr<DataStreamer<Item>> makeStreamer(DataStreamer<Item>::FetchFunction fetch,
                                                     std::chrono::milliseconds interval = 1000ms) {
        auto streamer = std::make_unique<DataStreamer<Item>>(loop_, std::move(fetch), keyOf,
                                                             interval, "items");
        streamer->stream().subscribe(
            [this](const std::vector<Item>& snapshot) { snapshots_.push_back(snapshot); });
        return streamer;
    }

    std::shared_ptr<ManualClock> clock_ = std::make_shared<ManualClock>();
    EventLoop loop_{clock_};
    std::vector<std::vector<Item>> batches_;
    std::vector<std::vector<Item>> snapshots_;
    int fetches_ = 0;
};

// ---------------------------------------------------------------------------
// Merging
// ---------------------------------------------------------------------------

TEST_F(DataStreamerTest, NewSubscriberGetsCurrentSnapshot) {
    auto streamer = makeStreamer(scripted());
    ASSERT_EQ(snapshots_.size(), 1u);
    EXPECT_TRUE(snapshots_[0].empty());
    EXPECT_TRUE(streamer->isRunning());
}

TEST_F(DataStreamerTest, BatchesMergeLastWriteWinsInInsertionOrder) {
    batches_ = {{{1, "X"}, {2, "Z"}}, {{1, "Y"}}};
    auto streamer = makeStreamer(scripted());

    auto first = streamer->refresh();
    auto second = streamer->refresh();
    EXPECT_TRUE(first.result().hasValue());
    EXPECT_TRUE(second.result().hasValue());

    std::vector<Item> expected = {{1, "Y"}, {2, "Z"}};
    EXPECT_EQ(streamer->currentData(), expected);
    EXPECT_EQ(snapshots_.back(), expected);
    EXPECT_EQ(streamer->cacheSize(), 2u);
}

TEST_F(DataStreamerTest, PollsOnInterval) {
    batches_ = {{{1, "a"}}, {{2, "b"}}, {{3, "c"}}};
    auto streamer = makeStreamer(scripted(), 1000ms);

    loop_.runFor(999ms);
    EXPECT_EQ(fetches_, 0);

    loop_.runFor(2001ms);
    EXPECT_EQ(fetches_, 3);
    EXPECT_EQ(streamer->cacheSize(), 3u);
    // Initial snapshot plus one per poll.
    EXPECT_EQ(snapshots_.size(), 4u);
}

TEST_F(DataStreamerTest, TickSkippedWhileFetchInFlight) {
    int started = 0;
    DataStreamer<Item>::FetchFunction slowFetch = [&]() {
        int n = ++started;
        return delay(loop_, 2500ms).then([n](const KitResult<void>&) {
            return makeValueFuture(std::vector<Item>{{n, "slow"}});
        });
    };
    auto streamer = makeStreamer(slowFetch, 1000ms);

    // Ticks at 1s, 2s, 3s: the fetch started at 1s is still running at 2s
    // and 3s, so only one fetch starts.
    loop_.runFor(3000ms);
    EXPECT_EQ(started, 1);

    // Fetch finishes at 3.5s; the 4s tick starts a new one.
    loop_.runFor(1000ms);
    EXPECT_EQ(started, 2);
}

TEST_F(DataStreamerTest, FailedFetchKeepsSnapshotAndRejects) {
    batches_ = {{{1, "a"}}};
    bool fail = false;
    auto base = scripted();
    DataStreamer<Item>::FetchFunction flaky = [&, base]() {
        if (fail) {
            return makeErrorFuture<std::vector<Item>>(KitError(ErrorCode::FetchFailed, "503"));
        }
        return base();
    };
    auto streamer = makeStreamer(flaky);
    ASSERT_TRUE(streamer->refresh().result().hasValue());
    auto published = snapshots_.size();

    fail = true;
    auto failed = streamer->refresh();
    ASSERT_TRUE(failed.result().hasError());
    EXPECT_EQ(failed.result().error().code(), ErrorCode::FetchFailed);
    EXPECT_EQ(snapshots_.size(), published);
    EXPECT_EQ(streamer->cacheSize(), 1u);

    // Polling continues after a failure.
    fail = false;
    batches_ = {{{2, "b"}}};
    loop_.runFor(1000ms);
    EXPECT_EQ(streamer->cacheSize(), 2u);
}

// ---------------------------------------------------------------------------
// Direct mutation
// ---------------------------------------------------------------------------

TEST_F(DataStreamerTest, AddUpdateRemove) {
    auto streamer = makeStreamer(scripted());

    streamer->addItem({1, "one"});
    streamer->addItem({2, "two"});
    EXPECT_EQ(streamer->currentData(), (std::vector<Item>{{1, "one"}, {2, "two"}}));

    EXPECT_TRUE(streamer->updateItem("1", [](Item& item) { item.label = "uno"; }));
    EXPECT_EQ(streamer->currentData()[0].label, "uno");

    auto before = snapshots_.size();
    EXPECT_FALSE(streamer->updateItem("9", [](Item& item) { item.label = "never"; }));
    EXPECT_EQ(snapshots_.size(), before);

    EXPECT_TRUE(streamer->removeItem("1"));
    EXPECT_EQ(streamer->currentData(), (std::vector<Item>{{2, "two"}}));

    // Removing an absent key still republishes.
    before = snapshots_.size();
    EXPECT_FALSE(streamer->removeItem("1"));
    EXPECT_EQ(snapshots_.size(), before + 1);
}

TEST_F(DataStreamerTest, AddItemReplacesInPlace) {
    auto streamer = makeStreamer(scripted());
    streamer->addItem({1, "a"});
    streamer->addItem({2, "b"});
    streamer->addItem({1, "c"});
    EXPECT_EQ(streamer->currentData(), (std::vector<Item>{{1, "c"}, {2, "b"}}));
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

TEST_F(DataStreamerTest, StopAndStart) {
    auto streamer = makeStreamer(scripted(), 1000ms);
    streamer->stop();
    EXPECT_FALSE(streamer->isRunning());
    loop_.runFor(5000ms);
    EXPECT_EQ(fetches_, 0);

    streamer->start();
    loop_.runFor(1000ms);
    EXPECT_EQ(fetches_, 1);
}

TEST_F(DataStreamerTest, DestroyClosesStreamAndStopsUpdates) {
    bool completed = false;
    auto streamer = makeStreamer(scripted());
    streamer->stream().subscribe([](const std::vector<Item>&) {}, {}, [&] { completed = true; });

    streamer->destroy();
    EXPECT_TRUE(completed);
    EXPECT_TRUE(streamer->isDestroyed());
    EXPECT_FALSE(streamer->isRunning());

    auto before = snapshots_.size();
    streamer->addItem({1, "late"});
    EXPECT_FALSE(streamer->removeItem("1"));
    EXPECT_EQ(snapshots_.size(), before);

    auto refreshed = streamer->refresh();
    EXPECT_EQ(refreshed.result().error().code(), ErrorCode::ChannelCompleted);

    streamer->start();
    EXPECT_FALSE(streamer->isRunning());
    streamer->destroy();
}

TEST_F(DataStreamerTest, FetchCompletingAfterDestroyIsDropped) {
    DataStreamer<Item>::FetchFunction slowFetch = [&]() {
        return delay(loop_, 500ms).then([](const KitResult<void>&) {
            return makeValueFuture(std::vector<Item>{{1, "late"}});
        });
    };
    auto streamer = makeStreamer(slowFetch);
    auto pending = streamer->refresh();
    streamer->destroy();

    loop_.runUntilIdle();
    ASSERT_TRUE(pending.isReady());
    EXPECT_TRUE(pending.result().hasError());
    EXPECT_EQ(streamer->cacheSize(), 0u);
}

TEST_F(DataStreamerTest, DestructionStopsTimer) {
    {
        auto streamer = makeStreamer(scripted(), 1000ms);
        EXPECT_EQ(loop_.pendingTimers(), 1u);
    }
    EXPECT_EQ(loop_.pendingTimers(), 0u);
}
