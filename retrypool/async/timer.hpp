/*
 * timer.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2023-12-14

Description: One-shot deadline timer used for retry backoff and task
timeouts

**************************************************/

#ifndef RETRYPOOL_ASYNC_TIMER_HPP
#define RETRYPOOL_ASYNC_TIMER_HPP

#include <atomic>
#include <chrono>
#include <concepts>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <unordered_map>

#include "retrypool/error/exception.hpp"

namespace retrypool::async {

template <typename F>
concept TimerCallback = std::invocable<F> && std::copy_constructible<F>;

/**
 * @brief Fires callbacks on a single background thread once their deadline
 * has passed.
 *
 * Callbacks due at the same instant run in scheduling order. A callback that
 * throws is logged and dropped; it never stops the timer thread.
 */
class Timer {
public:
    using Clock = std::chrono::steady_clock;
    using TaskHandle = std::uint64_t;

    static constexpr TaskHandle INVALID_HANDLE = 0;

    /**
     * @brief Starts the timer thread.
     * @throws retrypool::error::RuntimeError if the thread cannot be started
     */
    Timer() noexcept(false);

    /**
     * @brief Stops the timer thread; pending callbacks are discarded.
     */
    ~Timer() noexcept;

    Timer(const Timer &) = delete;
    Timer &operator=(const Timer &) = delete;
    Timer(Timer &&) = delete;
    Timer &operator=(Timer &&) = delete;

    /**
     * @brief Schedules `func` to run once after `delay`.
     *
     * @param func The callback.
     * @param delay Delay before the callback runs; zero means "as soon as
     * possible".
     * @return A handle usable with cancel().
     * @throws retrypool::error::InvalidArgument if delay is negative
     * @throws retrypool::error::RuntimeError if the timer has been stopped
     */
    template <typename Function>
        requires TimerCallback<Function>
    auto setTimeout(Function &&func, std::chrono::milliseconds delay)
        -> TaskHandle;

    /**
     * @brief Cancels a scheduled callback.
     * @return true if the callback was still pending.
     */
    auto cancel(TaskHandle handle) noexcept -> bool;

    /**
     * @brief Cancels all scheduled callbacks.
     */
    void cancelAllTasks() noexcept;

    /**
     * @brief Stops the timer thread and joins it unless called from a
     * callback. Idempotent.
     */
    void stop() noexcept;

    /**
     * @brief Blocks until no callback is pending or running.
     */
    void wait() noexcept;

    [[nodiscard]] auto getTaskCount() const noexcept -> size_t;

    [[nodiscard]] auto isRunning() const noexcept -> bool {
        return !m_stop.load(std::memory_order_acquire);
    }

private:
    struct Entry {
        Clock::time_point deadline;
        std::uint64_t sequence;
        TaskHandle handle;

        // priority_queue is a max-heap, so the earliest deadline must compare
        // greatest.
        auto operator<(const Entry &other) const noexcept -> bool {
            if (deadline != other.deadline) {
                return deadline > other.deadline;
            }
            return sequence > other.sequence;
        }
    };

    auto enqueue(std::function<void()> func, std::chrono::milliseconds delay)
        -> TaskHandle;

    void run() noexcept;

    std::jthread m_thread;
    std::priority_queue<Entry> m_taskQueue;
    std::unordered_map<TaskHandle, std::function<void()>> m_tasks;
    TaskHandle m_nextHandle = 1;
    std::uint64_t m_sequence = 0;
    bool m_firing = false;

    mutable std::mutex m_mutex;
    std::condition_variable m_cond;
    std::atomic<bool> m_stop{false};
};

template <typename Function>
    requires TimerCallback<Function>
auto Timer::setTimeout(Function &&func, std::chrono::milliseconds delay)
    -> TaskHandle {
    if (delay.count() < 0) {
        THROW_INVALID_ARGUMENT("Timer::setTimeout: delay must be >= 0, got ",
                               delay.count(), "ms");
    }
    return enqueue(std::function<void()>(std::forward<Function>(func)), delay);
}

}  // namespace retrypool::async

#endif  // RETRYPOOL_ASYNC_TIMER_HPP
