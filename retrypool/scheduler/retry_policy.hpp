/*
 * retry_policy.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-02-10

Description: Retry decisions for failed attempts

**************************************************/

#ifndef RETRYPOOL_SCHEDULER_RETRY_POLICY_HPP
#define RETRYPOOL_SCHEDULER_RETRY_POLICY_HPP

#include <chrono>
#include <cstdint>
#include <memory>
#include <vector>

#include "retrypool/scheduler/config.hpp"
#include "retrypool/scheduler/task.hpp"

namespace retrypool::scheduler {

struct RetryDecision {
    bool retry = false;
    std::chrono::milliseconds delay{0};

    bool operator==(const RetryDecision &) const = default;
};

/**
 * @brief Decides whether a failed attempt is retried and after what delay.
 *
 * Implementations must be pure: the same (attempt, error kind) always gives
 * the same decision. decide() may be called from any scheduler thread.
 */
class RetryPolicy {
public:
    virtual ~RetryPolicy() = default;

    /**
     * @param attempt Number of the attempt that just failed, starting at 1.
     * @param error The failure of that attempt.
     */
    [[nodiscard]] virtual auto decide(std::uint32_t attempt,
                                      const TaskError &error) const
        -> RetryDecision = 0;
};

/**
 * @brief Retries while `attempt < maxAttempts`, except for non-retryable
 * error kinds, waiting `backoff(attempt)` before each retry.
 */
class DefaultRetryPolicy : public RetryPolicy {
public:
    /**
     * @throws ConfigurationError if maxAttempts < 1 or backoff is empty
     */
    DefaultRetryPolicy(int maxAttempts, BackoffFn backoff,
                       std::vector<ErrorKind> nonRetryable = {
                           ErrorKind::Validation, ErrorKind::Cancelled});

    /**
     * @brief Policy matching the attempt bound, backoff and non-retryable
     * kinds of a config.
     */
    [[nodiscard]] static auto fromConfig(const SchedulerConfig &config)
        -> std::shared_ptr<DefaultRetryPolicy>;

    [[nodiscard]] auto decide(std::uint32_t attempt,
                              const TaskError &error) const
        -> RetryDecision override;

    [[nodiscard]] auto isRetryable(ErrorKind kind) const noexcept -> bool;

    [[nodiscard]] auto maxAttempts() const noexcept -> int {
        return maxAttempts_;
    }

private:
    int maxAttempts_;
    BackoffFn backoff_;
    std::vector<ErrorKind> nonRetryable_;
};

}  // namespace retrypool::scheduler

#endif  // RETRYPOOL_SCHEDULER_RETRY_POLICY_HPP
