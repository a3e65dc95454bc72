/*
 * retry_policy.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "retry_policy.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "retrypool/scheduler/errors.hpp"

namespace retrypool::scheduler {

DefaultRetryPolicy::DefaultRetryPolicy(int maxAttempts, BackoffFn backoff,
                                       std::vector<ErrorKind> nonRetryable)
    : maxAttempts_(maxAttempts),
      backoff_(std::move(backoff)),
      nonRetryable_(std::move(nonRetryable)) {
    if (maxAttempts_ < 1) {
        THROW_CONFIGURATION_ERROR("maxAttempts must be at least 1, got ",
                                  maxAttempts_);
    }
    if (!backoff_) {
        THROW_CONFIGURATION_ERROR("backoff function must be set");
    }
}

auto DefaultRetryPolicy::fromConfig(const SchedulerConfig &config)
    -> std::shared_ptr<DefaultRetryPolicy> {
    return std::make_shared<DefaultRetryPolicy>(
        config.maxAttempts, config.backoff, config.nonRetryable);
}

auto DefaultRetryPolicy::isRetryable(ErrorKind kind) const noexcept -> bool {
    return std::find(nonRetryable_.begin(), nonRetryable_.end(), kind) ==
           nonRetryable_.end();
}

auto DefaultRetryPolicy::decide(std::uint32_t attempt,
                                const TaskError &error) const
    -> RetryDecision {
    if (attempt < 1) {
        THROW_INVALID_ARGUMENT("attempt numbers start at 1");
    }
    if (!isRetryable(error.kind)) {
        return {false, std::chrono::milliseconds(0)};
    }
    if (attempt >= static_cast<std::uint32_t>(maxAttempts_)) {
        return {false, std::chrono::milliseconds(0)};
    }

    auto delay = backoff_(attempt);
    if (delay.count() < 0) {
        spdlog::warn("Backoff returned {}ms for attempt {}, using 0ms",
                     delay.count(), attempt);
        delay = std::chrono::milliseconds(0);
    }
    return {true, delay};
}

}  // namespace retrypool::scheduler
