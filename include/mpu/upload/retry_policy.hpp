#pragma once

#include "mpu/core/errors.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace mpu::upload {

/**
 * @brief Bounded-attempt exponential backoff, consumed by the coordinator
 *
 * Pure policy: it never sleeps. Callers decide how to wait, which keeps it
 * independent of the scheduling primitive (threads, tasks, channels).
 */
struct RetryPolicy {
    std::uint32_t max_attempts = 3;                        ///< Per part, first attempt included
    std::chrono::milliseconds initial_backoff{200};
    double backoff_multiplier = 2.0;
    std::chrono::milliseconds max_backoff{5000};
    std::optional<std::size_t> max_total_retries;          ///< Session-wide; nullopt = unlimited

    /**
     * @brief Whether another attempt is allowed after @p attempts_made
     *
     * Only errors flagged retryable qualify; the session budget is checked
     * separately through RetryBudget.
     */
    [[nodiscard]] bool should_retry(const UploadError& error, std::uint32_t attempts_made) const noexcept;

    /// Delay before attempt number @p next_attempt (2 for the first retry).
    [[nodiscard]] std::chrono::milliseconds backoff_for(std::uint32_t next_attempt) const noexcept;
};

/**
 * @brief Session-wide retry allowance shared by every worker
 */
class RetryBudget {
public:
    explicit RetryBudget(std::optional<std::size_t> limit) : limit_(limit) {}

    /// Reserve one retry; false once the budget is spent.
    bool try_consume() noexcept;

    [[nodiscard]] std::size_t consumed() const noexcept { return consumed_.load(std::memory_order_relaxed); }

private:
    std::optional<std::size_t> limit_;
    std::atomic<std::size_t> consumed_{0};
};

} // namespace mpu::upload
