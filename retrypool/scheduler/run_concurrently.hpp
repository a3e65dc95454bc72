/*
 * run_concurrently.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-02-10

Description: One-shot bounded batch runner

**************************************************/

#ifndef RETRYPOOL_SCHEDULER_RUN_CONCURRENTLY_HPP
#define RETRYPOOL_SCHEDULER_RUN_CONCURRENTLY_HPP

#include <chrono>
#include <concepts>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

#include "retrypool/async/executor.hpp"
#include "retrypool/scheduler/scheduler.hpp"

namespace retrypool::scheduler {

/**
 * @brief Outcome of one task of a batch.
 */
template <typename T>
struct TaskOutcome {
    bool success = false;
    std::optional<T> value;
    std::optional<TaskError> error;
};

/**
 * @brief Runs a fixed batch with at most `maxConcurrency` tasks in flight
 * and blocks until every task is terminal.
 *
 * Results come back in input order. With a ManualExecutor the calling thread
 * pumps the executor itself; any other executor (or none, meaning a private
 * ThreadExecutor) is waited on.
 *
 * @throws ConfigurationError if maxConcurrency or maxAttempts is below 1
 */
template <std::copy_constructible T>
auto runConcurrently(std::vector<TaskFn<T>> tasks, int maxConcurrency,
                     int maxAttempts = 1,
                     BackoffFn backoff = constantBackoff(
                         std::chrono::milliseconds(0)),
                     std::shared_ptr<async::Executor> executor = nullptr)
    -> std::vector<TaskOutcome<T>> {
    auto config = configure(maxConcurrency, maxAttempts, std::move(backoff));
    auto manual = std::dynamic_pointer_cast<async::ManualExecutor>(executor);

    Scheduler<T> scheduler(std::move(config), std::move(executor));
    std::vector<TaskId> ids;
    ids.reserve(tasks.size());
    for (auto &task : tasks) {
        ids.push_back(scheduler.submit(std::move(task)));
    }
    scheduler.close();

    auto drained = scheduler.waitForDrain();
    if (manual) {
        while (drained.wait_for(std::chrono::seconds(0)) !=
               std::future_status::ready) {
            if (!manual->runOne()) {
                // Only a retry backoff on the timer thread is outstanding.
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
        }
    }
    const auto &result = drained.get();

    std::vector<TaskOutcome<T>> outcomes;
    outcomes.reserve(ids.size());
    for (auto id : ids) {
        TaskOutcome<T> outcome;
        if (auto it = result.succeeded.find(id); it != result.succeeded.end()) {
            outcome.success = true;
            outcome.value = it->second;
        } else if (auto failed = result.failed.find(id);
                   failed != result.failed.end()) {
            outcome.error = failed->second;
        }
        outcomes.push_back(std::move(outcome));
    }
    return outcomes;
}

}  // namespace retrypool::scheduler

#endif  // RETRYPOOL_SCHEDULER_RUN_CONCURRENTLY_HPP
