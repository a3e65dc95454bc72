/*
 * completion_signal.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-02-10

Description: Re-armable drain signal

**************************************************/

#ifndef RETRYPOOL_SCHEDULER_COMPLETION_SIGNAL_HPP
#define RETRYPOOL_SCHEDULER_COMPLETION_SIGNAL_HPP

#include <cstdint>
#include <future>
#include <map>
#include <mutex>

#include "retrypool/scheduler/task.hpp"

namespace retrypool::scheduler {

/**
 * @brief Outcome partition delivered when a pool drains.
 */
template <typename T>
struct DrainResult {
    std::map<TaskId, T> succeeded;
    std::map<TaskId, TaskError> failed;

    [[nodiscard]] auto size() const noexcept -> std::size_t {
        return succeeded.size() + failed.size();
    }
};

/**
 * @brief Re-armable one-shot signal for "the pool is drained".
 *
 * Each cycle owns one promise. fire() resolves it once; every future handed
 * out during the cycle shares that value. rearm() starts a new cycle only
 * after the current one fired, so waiters of a pending cycle are never
 * orphaned.
 */
template <typename T>
class CompletionSignal {
public:
    using Future = std::shared_future<DrainResult<T>>;

    CompletionSignal() : future_(promise_.get_future().share()) {}

    CompletionSignal(const CompletionSignal &) = delete;
    CompletionSignal &operator=(const CompletionSignal &) = delete;

    /**
     * @brief Future of the current cycle.
     */
    [[nodiscard]] auto future() const -> Future {
        std::scoped_lock lock(mutex_);
        return future_;
    }

    /**
     * @brief Resolves the current cycle.
     * @return false if this cycle already fired.
     */
    auto fire(DrainResult<T> snapshot) -> bool {
        std::scoped_lock lock(mutex_);
        if (fired_) {
            return false;
        }
        promise_.set_value(std::move(snapshot));
        fired_ = true;
        return true;
    }

    /**
     * @brief Starts the next cycle if the current one fired.
     * @return true if a new cycle was started.
     */
    auto rearm() -> bool {
        std::scoped_lock lock(mutex_);
        if (!fired_) {
            return false;
        }
        promise_ = std::promise<DrainResult<T>>();
        future_ = promise_.get_future().share();
        fired_ = false;
        ++cycle_;
        return true;
    }

    [[nodiscard]] auto isFired() const -> bool {
        std::scoped_lock lock(mutex_);
        return fired_;
    }

    /**
     * @brief Number of the current cycle, starting at 0.
     */
    [[nodiscard]] auto cycle() const -> std::uint64_t {
        std::scoped_lock lock(mutex_);
        return cycle_;
    }

private:
    mutable std::mutex mutex_;
    std::promise<DrainResult<T>> promise_;
    Future future_;
    bool fired_ = false;
    std::uint64_t cycle_ = 0;
};

}  // namespace retrypool::scheduler

#endif  // RETRYPOOL_SCHEDULER_COMPLETION_SIGNAL_HPP
