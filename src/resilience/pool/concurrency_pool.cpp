/// @file concurrency_pool.cpp
/// @brief ConcurrencyPool slot accounting and FIFO hand-off.

#include "rsk/resilience/concurrency_pool.hpp"

#include <algorithm>
#include <deque>
#include <string>

#include "rsk/foundation/kit_logger.hpp"

namespace rsk::resilience {

using rsk::foundation::ErrorCode;
using rsk::foundation::Future;
using rsk::foundation::KitError;
using rsk::foundation::LogCategory;
using rsk::foundation::Promise;

struct ConcurrencyPool::Impl {
    rsk::foundation::EventLoop& loop;
    PoolConfig config;
    std::size_t inUse = 0;
    std::size_t peak = 0;
    uint64_t completed = 0;
    std::deque<Promise<SlotHandle>> waiters;

    Impl(rsk::foundation::EventLoop& l, PoolConfig c)
        : loop(l), config(std::move(c)) {}

    void occupy() {
        ++inUse;
        peak = std::max(peak, inUse);
    }
};

// --- Slot ---

ConcurrencyPool::Slot::Slot(Passkey, std::weak_ptr<ConcurrencyPool::Impl> pool)
    : pool_(std::move(pool)) {}

ConcurrencyPool::Slot::~Slot() {
    release();
}

void ConcurrencyPool::Slot::release() {
    if (released_) {
        return;
    }
    released_ = true;
    if (auto pool = pool_.lock()) {
        ConcurrencyPool::releaseSlot(pool);
    }
}

// --- ConcurrencyPool ---

ConcurrencyPool::ConcurrencyPool(rsk::foundation::EventLoop& loop, PoolConfig config)
    : impl_(std::make_shared<Impl>(loop, std::move(config))) {
    if (impl_->config.concurrency < 1) {
        RSK_LOG_WARN(LogCategory::Pool,
                     "pool '" + impl_->config.name + "': concurrency must be at least 1, using 1");
        impl_->config.concurrency = 1;
    }
}

ConcurrencyPool::~ConcurrencyPool() {
    // Take the waiters out first: rejecting runs continuations that may
    // touch this pool's queries.
    auto waiters = std::move(impl_->waiters);
    impl_->waiters.clear();
    for (auto& waiter : waiters) {
        waiter.reject(KitError(ErrorCode::Cancelled,
                               "pool '" + impl_->config.name + "' destroyed"));
    }
}

Future<ConcurrencyPool::SlotHandle> ConcurrencyPool::acquire() {
    if (impl_->inUse < impl_->config.concurrency) {
        impl_->occupy();
        return rsk::foundation::makeValueFuture(makeSlot(impl_));
    }

    Promise<SlotHandle> waiter;
    impl_->waiters.push_back(waiter);
    RSK_LOG_DEBUG(LogCategory::Pool,
                  "pool '" + impl_->config.name + "' saturated, waiters="
                      + std::to_string(impl_->waiters.size()));
    return waiter.future();
}

ConcurrencyPool::SlotHandle ConcurrencyPool::makeSlot(const std::shared_ptr<Impl>& impl) {
    return std::make_shared<Slot>(Slot::Passkey{}, impl);
}

void ConcurrencyPool::releaseSlot(const std::shared_ptr<Impl>& impl) {
    ++impl->completed;

    if (impl->waiters.empty()) {
        --impl->inUse;
        return;
    }

    // The slot stays occupied and moves to the oldest waiter on the next
    // turn, so no newcomer can take it in between.
    auto next = std::move(impl->waiters.front());
    impl->waiters.pop_front();
    std::weak_ptr<Impl> weak = impl;
    impl->loop.post([weak, next]() mutable {
        auto pool = weak.lock();
        if (!pool) {
            next.reject(KitError(ErrorCode::Cancelled, "pool destroyed"));
            return;
        }
        next.resolve(makeSlot(pool));
    });
}

std::size_t ConcurrencyPool::runningCount() const {
    return impl_->inUse;
}

std::size_t ConcurrencyPool::waitingCount() const {
    return impl_->waiters.size();
}

std::size_t ConcurrencyPool::concurrency() const {
    return impl_->config.concurrency;
}

std::size_t ConcurrencyPool::peakRunningCount() const {
    return impl_->peak;
}

uint64_t ConcurrencyPool::completedCount() const {
    return impl_->completed;
}

std::string_view ConcurrencyPool::name() const {
    return impl_->config.name;
}

} // namespace rsk::resilience
