#pragma once

/// @file concurrency_pool.hpp
/// @brief Counting-semaphore pool bounding in-flight asynchronous operations.

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "rsk/foundation/event_loop.hpp"
#include "rsk/foundation/future.hpp"

namespace rsk::resilience {

/// Configuration for a ConcurrencyPool.
struct PoolConfig {
    /// Maximum simultaneously running tasks. Values below 1 are clamped to 1.
    std::size_t concurrency = 5;

    /// Name used in log lines.
    std::string name = "default";
};

/// Bounds the number of simultaneously in-flight operations.
///
/// Waiters are served in FIFO order. When a task finishes, its slot is
/// handed to the next waiter on the following loop turn, so long chains of
/// already-completed tasks never recurse on the stack.
///
/// A task that never settles keeps its slot forever; compose with
/// CircuitBreaker or withTimeout() when a deadline is needed.
///
/// Example:
/// @code
///   ConcurrencyPool pool(loop, PoolConfig{.concurrency = 4, .name = "images"});
///   std::vector<TaskFactory<Thumbnail>> jobs = makeJobs();
///   pool.runAll(jobs).onComplete([](const KitResult<std::vector<Thumbnail>>& r) {
///       // r.value()[i] belongs to jobs[i]
///   });
///   loop.runUntilIdle();
/// @endcode
class ConcurrencyPool {
    struct Impl;

public:
    /// One occupied concurrency unit. Released exactly once: explicitly via
    /// release(), or when the last handle is dropped.
    class Slot {
        struct Passkey {
            explicit Passkey() = default;
        };

    public:
        /// Only the pool can name the passkey, so only it creates slots.
        Slot(Passkey, std::weak_ptr<ConcurrencyPool::Impl> pool);
        ~Slot();

        Slot(const Slot&) = delete;
        Slot& operator=(const Slot&) = delete;

        void release();

        [[nodiscard]] bool isReleased() const noexcept { return released_; }

    private:
        friend class ConcurrencyPool;

        std::weak_ptr<ConcurrencyPool::Impl> pool_;
        bool released_{false};
    };

    using SlotHandle = std::shared_ptr<Slot>;

    ConcurrencyPool(rsk::foundation::EventLoop& loop, PoolConfig config = {});
    ~ConcurrencyPool();

    ConcurrencyPool(const ConcurrencyPool&) = delete;
    ConcurrencyPool& operator=(const ConcurrencyPool&) = delete;

    /// Wait for a free slot.
    /// Fails with Cancelled only if the pool is destroyed while waiting.
    [[nodiscard]] rsk::foundation::Future<SlotHandle> acquire();

    /// Acquire, invoke @p factory, release on completion or failure.
    /// The task's outcome is propagated unchanged.
    template <typename T>
    [[nodiscard]] rsk::foundation::Future<T> run(rsk::foundation::TaskFactory<T> factory);

    /// Run every factory through the pool. Output index i holds the result
    /// of factories[i] regardless of completion order. Fails with the first
    /// error to occur; the remaining tasks still run to completion.
    template <typename T>
    [[nodiscard]] rsk::foundation::Future<std::vector<T>> runAll(
        std::vector<rsk::foundation::TaskFactory<T>> factories);

    /// Like runAll(), but never fails: every outcome is reported in order.
    template <typename T>
    [[nodiscard]] rsk::foundation::Future<std::vector<rsk::foundation::KitResult<T>>>
    runAllSettled(std::vector<rsk::foundation::TaskFactory<T>> factories);

    // ── Queries ──────────────────────────────────────────────────────────

    /// Slots currently held (running tasks plus slots being handed over).
    [[nodiscard]] std::size_t runningCount() const;

    /// Acquirers waiting for a slot.
    [[nodiscard]] std::size_t waitingCount() const;

    [[nodiscard]] std::size_t concurrency() const;

    /// Highest runningCount() observed since construction.
    [[nodiscard]] std::size_t peakRunningCount() const;

    /// Number of slots released so far.
    [[nodiscard]] uint64_t completedCount() const;

    [[nodiscard]] std::string_view name() const;

private:
    static void releaseSlot(const std::shared_ptr<Impl>& impl);
    static SlotHandle makeSlot(const std::shared_ptr<Impl>& impl);

    std::shared_ptr<Impl> impl_;
};

// --- Template implementations ---

template <typename T>
rsk::foundation::Future<T> ConcurrencyPool::run(rsk::foundation::TaskFactory<T> factory) {
    using rsk::foundation::KitResult;

    rsk::foundation::Promise<T> promise;
    auto result = promise.future();
    acquire().onComplete(
        [promise, factory = std::move(factory)](const KitResult<SlotHandle>& slot) mutable {
            if (!slot) {
                promise.reject(slot.error());
                return;
            }
            auto handle = slot.value();
            rsk::foundation::invokeFactory(factory).onComplete(
                [promise, handle](const KitResult<T>& outcome) mutable {
                    // Free the slot before the caller's continuation runs.
                    handle->release();
                    promise.settle(outcome);
                });
        });
    return result;
}

template <typename T>
rsk::foundation::Future<std::vector<T>> ConcurrencyPool::runAll(
    std::vector<rsk::foundation::TaskFactory<T>> factories) {
    static_assert(!std::is_void_v<T>, "runAll collects values; use runAllSettled for void tasks");
    using rsk::foundation::KitResult;

    if (factories.empty()) {
        return rsk::foundation::makeValueFuture(std::vector<T>{});
    }

    struct Gather {
        std::vector<std::optional<T>> values;
        std::size_t remaining = 0;
        bool failed = false;
        rsk::foundation::Promise<std::vector<T>> promise;
    };

    auto gather = std::make_shared<Gather>();
    gather->values.resize(factories.size());
    gather->remaining = factories.size();
    auto result = gather->promise.future();

    for (std::size_t i = 0; i < factories.size(); ++i) {
        run<T>(std::move(factories[i])).onComplete(
            [gather, i](const KitResult<T>& outcome) {
                if (gather->failed) {
                    return;
                }
                if (!outcome) {
                    gather->failed = true;
                    gather->promise.reject(outcome.error());
                    return;
                }
                gather->values[i] = outcome.value();
                if (--gather->remaining == 0) {
                    std::vector<T> ordered;
                    ordered.reserve(gather->values.size());
                    for (auto& value : gather->values) {
                        ordered.push_back(std::move(*value));
                    }
                    gather->promise.resolve(std::move(ordered));
                }
            });
    }
    return result;
}

template <typename T>
rsk::foundation::Future<std::vector<rsk::foundation::KitResult<T>>>
ConcurrencyPool::runAllSettled(std::vector<rsk::foundation::TaskFactory<T>> factories) {
    using rsk::foundation::KitResult;
    using Outcomes = std::vector<KitResult<T>>;

    if (factories.empty()) {
        return rsk::foundation::makeValueFuture(Outcomes{});
    }

    struct Gather {
        std::vector<std::optional<KitResult<T>>> outcomes;
        std::size_t remaining = 0;
        rsk::foundation::Promise<Outcomes> promise;
    };

    auto gather = std::make_shared<Gather>();
    gather->outcomes.resize(factories.size());
    gather->remaining = factories.size();
    auto result = gather->promise.future();

    for (std::size_t i = 0; i < factories.size(); ++i) {
        run<T>(std::move(factories[i])).onComplete(
            [gather, i](const KitResult<T>& outcome) {
                gather->outcomes[i].emplace(outcome);
                if (--gather->remaining == 0) {
                    Outcomes ordered;
                    ordered.reserve(gather->outcomes.size());
                    for (auto& o : gather->outcomes) {
                        ordered.push_back(std::move(*o));
                    }
                    gather->promise.resolve(std::move(ordered));
                }
            });
    }
    return result;
}

} // namespace rsk::resilience
