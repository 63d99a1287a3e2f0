#include "mpu/upload/retry_policy.hpp"

#include <algorithm>
#include <cmath>

namespace mpu::upload {

bool RetryPolicy::should_retry(const UploadError& error, std::uint32_t attempts_made) const noexcept {
    if (!error.retryable) {
        return false;
    }
    return attempts_made < max_attempts;
}

std::chrono::milliseconds RetryPolicy::backoff_for(std::uint32_t next_attempt) const noexcept {
    if (next_attempt <= 1 || initial_backoff.count() <= 0) {
        return std::chrono::milliseconds{0};
    }
    const double factor = std::pow(std::max(backoff_multiplier, 1.0), static_cast<double>(next_attempt - 2));
    const double scaled = static_cast<double>(initial_backoff.count()) * factor;
    const double capped = std::min(scaled, static_cast<double>(max_backoff.count()));
    return std::chrono::milliseconds{static_cast<std::int64_t>(capped)};
}

bool RetryBudget::try_consume() noexcept {
    if (!limit_) {
        consumed_.fetch_add(1, std::memory_order_relaxed);
        return true;
    }
    std::size_t current = consumed_.load(std::memory_order_relaxed);
    while (current < *limit_) {
        if (consumed_.compare_exchange_weak(current, current + 1, std::memory_order_relaxed)) {
            return true;
        }
    }
    return false;
}

} // namespace mpu::upload
