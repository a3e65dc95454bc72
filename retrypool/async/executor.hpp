/*
 * executor.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-02-10

Description: Execution substrates for scheduler jobs

**************************************************/

#ifndef RETRYPOOL_ASYNC_EXECUTOR_HPP
#define RETRYPOOL_ASYNC_EXECUTOR_HPP

#include <atomic>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "retrypool/error/exception.hpp"

namespace retrypool::async {

/**
 * @brief Thrown when a job is posted to an executor that has been shut down.
 */
class ExecutorShutdownError : public retrypool::error::RuntimeError {
public:
    using retrypool::error::RuntimeError::RuntimeError;
};

#define THROW_EXECUTOR_SHUTDOWN_ERROR(...)                             \
    throw retrypool::async::ExecutorShutdownError(                     \
        RETRYPOOL_FILE_NAME, RETRYPOOL_FILE_LINE, RETRYPOOL_FUNC_NAME, \
        __VA_ARGS__)

/**
 * @brief Where scheduler jobs run.
 *
 * A job is a self-contained callable that never throws; the executor only
 * decides on which thread and when it runs.
 */
class Executor {
public:
    using Job = std::function<void()>;

    virtual ~Executor() = default;

    /**
     * @brief Hands a job over for execution. Must not run it inline.
     * @throws ExecutorShutdownError after shutdown()
     */
    virtual void post(Job job) = 0;

    /**
     * @brief Stops accepting jobs and releases the ones it holds.
     */
    virtual void shutdown() noexcept = 0;
};

/**
 * @brief Runs every job on its own thread.
 *
 * The scheduler already bounds the number of admitted jobs, so no worker
 * limit is applied here. Finished threads are reaped on the next post().
 * shutdown() joins every outstanding thread except the calling one, which is
 * detached.
 */
class ThreadExecutor : public Executor {
public:
    ThreadExecutor() = default;
    ~ThreadExecutor() override;

    ThreadExecutor(const ThreadExecutor&) = delete;
    ThreadExecutor& operator=(const ThreadExecutor&) = delete;

    void post(Job job) override;
    void shutdown() noexcept override;

    /**
     * @brief Number of jobs started and not yet reaped.
     */
    [[nodiscard]] auto outstanding() const -> std::size_t;

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void reapLocked();

    mutable std::mutex mutex_;
    std::vector<Worker> workers_;
    bool shutdown_ = false;
};

/**
 * @brief Queues jobs until the owner pumps them.
 *
 * Every job runs on the pumping thread, so work interleaves only at the
 * points the caller chooses. This is the cooperative single-threaded model;
 * tests use it to step a scheduler deterministically.
 */
class ManualExecutor : public Executor {
public:
    ManualExecutor() = default;

    void post(Job job) override;

    /**
     * @brief Discards pending jobs and rejects new ones.
     */
    void shutdown() noexcept override;

    /**
     * @brief Runs the oldest pending job.
     * @return false if nothing was pending.
     */
    auto runOne() -> bool;

    /**
     * @brief Runs jobs, including ones posted meanwhile, until none is left.
     * @return Number of jobs run.
     */
    auto runAll() -> std::size_t;

    [[nodiscard]] auto pending() const -> std::size_t;

private:
    mutable std::mutex mutex_;
    std::deque<Job> jobs_;
    bool shutdown_ = false;
};

}  // namespace retrypool::async

#endif  // RETRYPOOL_ASYNC_EXECUTOR_HPP
