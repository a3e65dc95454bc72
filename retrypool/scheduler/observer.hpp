/*
 * observer.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-02-10

Description: Scheduler lifecycle observer

**************************************************/

#ifndef RETRYPOOL_SCHEDULER_OBSERVER_HPP
#define RETRYPOOL_SCHEDULER_OBSERVER_HPP

#include <chrono>
#include <cstdint>

#include "retrypool/scheduler/completion_signal.hpp"
#include "retrypool/scheduler/task.hpp"

namespace retrypool::scheduler {

/**
 * @brief Hooks into scheduler events.
 *
 * Observers are called in registration order, outside the scheduler lock, on
 * whichever thread produced the event. Exceptions are logged and dropped.
 * Calls for different tasks may interleave when tasks run on threads.
 */
template <typename T>
class SchedulerObserver {
public:
    virtual ~SchedulerObserver() = default;

    virtual void onAdmitted(TaskId /*id*/, std::uint32_t /*attempt*/) {}
    virtual void onSucceeded(TaskId /*id*/, const T & /*value*/) {}
    virtual void onRetryScheduled(TaskId /*id*/, const TaskError & /*error*/,
                                  std::chrono::milliseconds /*delay*/) {}
    virtual void onAbandoned(TaskId /*id*/, const TaskError & /*error*/) {}
    virtual void onDrained(const DrainResult<T> & /*result*/) {}
};

}  // namespace retrypool::scheduler

#endif  // RETRYPOOL_SCHEDULER_OBSERVER_HPP
