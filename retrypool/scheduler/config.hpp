/*
 * config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-02-10

Description: Scheduler settings and backoff functions

**************************************************/

#ifndef RETRYPOOL_SCHEDULER_CONFIG_HPP
#define RETRYPOOL_SCHEDULER_CONFIG_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <vector>

#include "retrypool/scheduler/task.hpp"

namespace retrypool::scheduler {

/**
 * @brief Maps the number of the attempt that just failed (1-based) to the
 * delay before the task re-enters the queue.
 */
using BackoffFn = std::function<std::chrono::milliseconds(std::uint32_t)>;

/**
 * @brief Same delay after every failed attempt.
 * @throws ConfigurationError if delay is negative
 */
[[nodiscard]] auto constantBackoff(std::chrono::milliseconds delay)
    -> BackoffFn;

/**
 * @brief `base + step * (attempt - 1)`.
 * @throws ConfigurationError if base or step is negative
 */
[[nodiscard]] auto linearBackoff(std::chrono::milliseconds base,
                                 std::chrono::milliseconds step) -> BackoffFn;

/**
 * @brief `base * factor^(attempt - 1)`, clamped to `cap`.
 * @throws ConfigurationError if base is negative, factor < 1 or cap < base
 */
[[nodiscard]] auto exponentialBackoff(std::chrono::milliseconds base,
                                      double factor,
                                      std::chrono::milliseconds cap)
    -> BackoffFn;

/**
 * @brief Settings of a Scheduler, validated at construction.
 */
struct SchedulerConfig {
    int maxConcurrency = 3;  ///< tasks in flight at most
    int maxAttempts = 1;     ///< execution starts per task at most
    BackoffFn backoff = constantBackoff(std::chrono::milliseconds(0));
    /// Error kinds the default retry policy never retries.
    std::vector<ErrorKind> nonRetryable{ErrorKind::Validation,
                                        ErrorKind::Cancelled};

    /**
     * @throws ConfigurationError if a bound is below 1 or backoff is empty
     */
    void validate() const;
};

/**
 * @brief Builds and validates a SchedulerConfig.
 * @throws ConfigurationError if either bound is below 1 or backoff is empty
 */
[[nodiscard]] auto configure(int maxConcurrency, int maxAttempts,
                             BackoffFn backoff) -> SchedulerConfig;

}  // namespace retrypool::scheduler

#endif  // RETRYPOOL_SCHEDULER_CONFIG_HPP
