/// @file retry_executor.cpp
/// @brief Backoff computation for RetryExecutor.

#include "rsk/resilience/retry_executor.hpp"

#include <algorithm>
#include <cmath>

namespace rsk::resilience {

std::chrono::milliseconds computeBackoffDelay(const RetryOptions& options, uint32_t attempt) {
    const uint32_t exponent = attempt > 0 ? attempt - 1 : 0;
    const double base = static_cast<double>(options.baseDelay.count());
    const double cap = static_cast<double>(options.maxDelay.count());
    const double factor = options.backoffFactor > 0.0 ? options.backoffFactor : 1.0;

    // pow() may overflow to inf for large attempt counts; min() still caps it.
    const double raw = base * std::pow(factor, static_cast<double>(exponent));
    const double bounded = std::max(0.0, std::min(raw, cap));
    return std::chrono::milliseconds(static_cast<int64_t>(bounded));
}

} // namespace rsk::resilience
