#pragma once

/// @file batch.hpp
/// @brief Collection helpers: bounded parallel map, sequential map, batched map.

#include <algorithm>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "rsk/foundation/event_loop.hpp"
#include "rsk/foundation/future.hpp"
#include "rsk/resilience/concurrency_pool.hpp"

namespace rsk::resilience {

/// Asynchronous per-item operation.
template <typename T, typename R>
using ItemProcessor = std::function<rsk::foundation::Future<R>(const T&)>;

/// Asynchronous per-item operation that also receives the item's index.
template <typename T, typename R>
using IndexedItemProcessor = std::function<rsk::foundation::Future<R>(const T&, std::size_t)>;

namespace detail {

template <typename T, typename R>
struct ParallelRun {
    std::shared_ptr<ConcurrencyPool> pool;
    std::vector<std::optional<R>> values;
    std::size_t outstanding = 0;
    bool failed = false;
    rsk::foundation::Promise<std::vector<R>> promise;
};

template <typename R>
std::vector<R> collect(std::vector<std::optional<R>>& slots) {
    std::vector<R> out;
    out.reserve(slots.size());
    for (auto& slot : slots) {
        out.push_back(std::move(*slot));
    }
    return out;
}

} // namespace detail

/// Apply @p processor to every item with at most @p concurrency in flight.
/// Output order follows input order. Fails with the first error to occur;
/// tasks already queued still run to completion.
template <typename T, typename R>
[[nodiscard]] rsk::foundation::Future<std::vector<R>> parallel(rsk::foundation::EventLoop& loop,
                                                               std::vector<T> items,
                                                               ItemProcessor<T, R> processor,
                                                               std::size_t concurrency = 5) {
    using rsk::foundation::KitResult;

    if (items.empty()) {
        return rsk::foundation::makeValueFuture(std::vector<R>{});
    }

    auto shared = std::make_shared<std::vector<T>>(std::move(items));
    auto gather = std::make_shared<detail::ParallelRun<T, R>>();
    gather->pool = std::make_shared<ConcurrencyPool>(
        loop, PoolConfig{.concurrency = concurrency, .name = "parallel"});
    gather->values.resize(shared->size());
    gather->outstanding = shared->size();
    auto result = gather->promise.future();

    // Copy the pool pointer: the last completion releases gather->pool.
    auto pool = gather->pool;
    for (std::size_t i = 0; i < shared->size(); ++i) {
        pool->template run<R>([shared, i, processor]() { return processor((*shared)[i]); })
            .onComplete([gather, i](const KitResult<R>& outcome) {
                if (outcome && !gather->failed) {
                    gather->values[i] = outcome.value();
                } else if (!outcome && !gather->failed) {
                    gather->failed = true;
                    gather->promise.reject(outcome.error());
                }
                if (--gather->outstanding == 0) {
                    if (!gather->failed) {
                        gather->promise.resolve(detail::collect(gather->values));
                    }
                    gather->pool.reset();
                }
            });
    }
    return result;
}

namespace detail {

template <typename T, typename R>
struct SequentialRun {
    rsk::foundation::EventLoop& loop;
    std::vector<T> items;
    IndexedItemProcessor<T, R> processor;
    std::vector<R> results;
    rsk::foundation::Promise<std::vector<R>> promise;

    SequentialRun(rsk::foundation::EventLoop& l, std::vector<T> i, IndexedItemProcessor<T, R> p)
        : loop(l), items(std::move(i)), processor(std::move(p)) {}
};

template <typename T, typename R>
void sequentialStep(const std::shared_ptr<SequentialRun<T, R>>& run) {
    using rsk::foundation::KitResult;

    const std::size_t index = run->results.size();
    if (index == run->items.size()) {
        run->promise.resolve(std::move(run->results));
        return;
    }

    rsk::foundation::TaskFactory<R> step = [run, index]() {
        return run->processor(run->items[index], index);
    };
    rsk::foundation::invokeFactory(step).onComplete([run](const KitResult<R>& outcome) {
        if (!outcome) {
            run->promise.reject(outcome.error());
            return;
        }
        run->results.push_back(outcome.value());
        // Next item on the next turn: synchronous processors must not recurse.
        run->loop.post([run]() { sequentialStep(run); });
    });
}

template <typename T, typename R>
struct BatchRun {
    rsk::foundation::EventLoop& loop;
    std::vector<T> items;
    ItemProcessor<T, R> processor;
    std::size_t batchSize;
    std::vector<R> results;
    rsk::foundation::Promise<std::vector<R>> promise;

    BatchRun(rsk::foundation::EventLoop& l, std::vector<T> i, ItemProcessor<T, R> p, std::size_t b)
        : loop(l), items(std::move(i)), processor(std::move(p)), batchSize(b) {}
};

template <typename T, typename R>
void batchStep(const std::shared_ptr<BatchRun<T, R>>& run) {
    using rsk::foundation::KitResult;

    const std::size_t begin = run->results.size();
    if (begin == run->items.size()) {
        run->promise.resolve(std::move(run->results));
        return;
    }
    const std::size_t end = std::min(begin + run->batchSize, run->items.size());

    struct Batch {
        std::vector<std::optional<R>> values;
        std::size_t remaining = 0;
        bool failed = false;
    };
    auto batch = std::make_shared<Batch>();
    batch->values.resize(end - begin);
    batch->remaining = end - begin;

    for (std::size_t i = begin; i < end; ++i) {
        rsk::foundation::TaskFactory<R> task = [run, i]() { return run->processor(run->items[i]); };
        rsk::foundation::invokeFactory(task).onComplete(
            [run, batch, slot = i - begin](const KitResult<R>& outcome) {
                if (batch->failed) {
                    return;
                }
                if (!outcome) {
                    batch->failed = true;
                    run->promise.reject(outcome.error());
                    return;
                }
                batch->values[slot] = outcome.value();
                if (--batch->remaining == 0) {
                    for (auto& value : batch->values) {
                        run->results.push_back(std::move(*value));
                    }
                    run->loop.post([run]() { batchStep(run); });
                }
            });
    }
}

} // namespace detail

/// Apply @p processor to items one at a time, in order. Stops at the first
/// failure and reports it.
template <typename T, typename R>
[[nodiscard]] rsk::foundation::Future<std::vector<R>> sequential(
    rsk::foundation::EventLoop& loop, std::vector<T> items, IndexedItemProcessor<T, R> processor) {
    auto run = std::make_shared<detail::SequentialRun<T, R>>(loop, std::move(items),
                                                             std::move(processor));
    auto result = run->promise.future();
    detail::sequentialStep(run);
    return result;
}

/// Split items into chunks of @p batchSize. Every item of a chunk runs at
/// once; the next chunk starts when the whole chunk has succeeded. Stops at
/// the first failure and reports it.
template <typename T, typename R>
[[nodiscard]] rsk::foundation::Future<std::vector<R>> batchProcess(
    rsk::foundation::EventLoop& loop, std::vector<T> items, ItemProcessor<T, R> processor,
    std::size_t batchSize = 10) {
    auto run = std::make_shared<detail::BatchRun<T, R>>(
        loop, std::move(items), std::move(processor), batchSize < 1 ? 1 : batchSize);
    auto result = run->promise.future();
    detail::batchStep(run);
    return result;
}

} // namespace rsk::resilience
