/*
 * scheduler.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-02-10

Description: Bounded-concurrency retry scheduler

**************************************************/

#ifndef RETRYPOOL_SCHEDULER_SCHEDULER_HPP
#define RETRYPOOL_SCHEDULER_SCHEDULER_HPP

#include <algorithm>
#include <chrono>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include "retrypool/async/executor.hpp"
#include "retrypool/async/timer.hpp"
#include "retrypool/scheduler/completion_signal.hpp"
#include "retrypool/scheduler/config.hpp"
#include "retrypool/scheduler/errors.hpp"
#include "retrypool/scheduler/observer.hpp"
#include "retrypool/scheduler/result_store.hpp"
#include "retrypool/scheduler/retry_policy.hpp"
#include "retrypool/scheduler/task.hpp"

namespace retrypool::scheduler {

namespace detail {

/**
 * @brief Shared state behind a Scheduler handle.
 *
 * Every mutation of the queue, the active count, the closed flag and the
 * records happens under `mutex_`. Task bodies, executor hand-off and
 * observer calls happen after the lock is released; the work they produce
 * is collected in an Actions batch and flushed by the caller.
 */
template <std::copy_constructible T>
class SchedulerCore : public std::enable_shared_from_this<SchedulerCore<T>> {
public:
    using Task = TaskFn<T>;
    using Record = TaskRecord<T>;
    using Observer = SchedulerObserver<T>;
    using RecordFuture = std::shared_future<Record>;

    SchedulerCore(SchedulerConfig config, std::shared_ptr<RetryPolicy> policy,
                  std::shared_ptr<async::Executor> executor, bool ownsExecutor)
        : config_(std::move(config)),
          policy_(std::move(policy)),
          executor_(std::move(executor)),
          ownsExecutor_(ownsExecutor) {}

    auto submit(Task task, SubmitOptions options) -> TaskId {
        return enqueue(std::move(task), std::move(options), nullptr);
    }

    auto submitWithFuture(Task task, SubmitOptions options)
        -> std::pair<TaskId, RecordFuture> {
        auto completion = std::make_shared<std::promise<Record>>();
        RecordFuture future = completion->get_future().share();
        TaskId id =
            enqueue(std::move(task), std::move(options), std::move(completion));
        return {id, std::move(future)};
    }

    void close() {
        std::scoped_lock lock(mutex_);
        if (!closed_) {
            closed_ = true;
            spdlog::info("Scheduler closed ({} queued, {} active)",
                         queue_.size(), active_);
        }
    }

    auto cancel(TaskId id) -> bool {
        Actions actions;
        bool cancelled = false;
        {
            std::scoped_lock lock(mutex_);
            auto it = live_.find(id);
            if (it == live_.end()) {
                return false;
            }
            if (it->second.record.state == TaskState::Queued) {
                queue_.erase(std::find(queue_.begin(), queue_.end(), id));
                spdlog::info("Task {} cancelled before running", id);
                finalizeLocked(it, TaskState::Abandoned,
                               TaskError::cancelled("cancelled while queued"),
                               actions);
                checkDrainLocked(actions);
                cancelled = true;
            } else {
                it->second.cancelRequested = true;
                spdlog::info(
                    "Task {} is {}; its outcome will be discarded", id,
                    toString(it->second.record.state));
            }
        }
        flush(actions);
        return cancelled;
    }

    [[nodiscard]] auto stats() const -> Stats {
        std::scoped_lock lock(mutex_);
        auto stored = store_.stats();
        return Stats{queue_.size(), active_, stored.succeeded,
                     stored.abandoned, live_.size() + stored.total};
    }

    [[nodiscard]] auto get(TaskId id) const -> std::optional<Record> {
        std::scoped_lock lock(mutex_);
        if (auto it = live_.find(id); it != live_.end()) {
            return it->second.record;
        }
        return store_.get(id);
    }

    auto waitForDrain() -> typename CompletionSignal<T>::Future {
        Actions actions;
        typename CompletionSignal<T>::Future future;
        {
            std::scoped_lock lock(mutex_);
            checkDrainLocked(actions);
            future = signal_.future();
        }
        flush(actions);
        return future;
    }

    auto retryAbandoned() -> std::size_t {
        Actions actions;
        std::size_t count = 0;
        {
            std::scoped_lock lock(mutex_);
            if (closed_) {
                THROW_POOL_CLOSED_ERROR(
                    "Scheduler is closed; abandoned tasks cannot be retried");
            }
            for (auto &[id, retained] : retained_) {
                auto previous = store_.get(id);
                if (!previous) {
                    continue;
                }
                store_.erase(id);

                Entry entry;
                entry.record.id = id;
                entry.record.lastError = previous->lastError;
                entry.task = retained.task;
                entry.timeout = retained.timeout;
                live_.emplace(id, std::move(entry));
                queue_.push_back(id);
                ++count;
            }
            retained_.clear();

            if (count > 0) {
                signal_.rearm();
                spdlog::info("Requeued {} abandoned task(s)", count);
            }
            dispatchLocked(actions);
        }
        flush(actions);
        return count;
    }

    void resetResults() {
        std::scoped_lock lock(mutex_);
        spdlog::debug("Clearing {} stored result(s)", store_.size());
        store_.clear();
        retained_.clear();
    }

    void addObserver(std::shared_ptr<Observer> observer) {
        if (!observer) {
            THROW_INVALID_ARGUMENT("Observer must not be null");
        }
        std::scoped_lock lock(mutex_);
        observers_.push_back(std::move(observer));
    }

    [[nodiscard]] auto isClosed() const -> bool {
        std::scoped_lock lock(mutex_);
        return closed_;
    }

    [[nodiscard]] auto isDrained() const -> bool {
        std::scoped_lock lock(mutex_);
        return active_ == 0 && queue_.empty();
    }

    [[nodiscard]] auto activeCount() const -> std::size_t {
        std::scoped_lock lock(mutex_);
        return active_;
    }

    [[nodiscard]] auto peakActiveCount() const -> std::size_t {
        std::scoped_lock lock(mutex_);
        return peakActive_;
    }

    [[nodiscard]] auto config() const -> const SchedulerConfig & {
        return config_;
    }

    /**
     * @brief Stops dispatching, stops the timer and joins an owned executor.
     * Waiters of an undrained cycle see std::future_error (broken promise)
     * once the core is released; so do task futures of queued tasks and of
     * tasks waiting out a backoff, immediately.
     */
    void shutdown() noexcept {
        {
            std::scoped_lock lock(mutex_);
            closed_ = true;
            shuttingDown_ = true;
            for (auto &[id, entry] : live_) {
                if (entry.record.state != TaskState::Running) {
                    entry.completion.reset();
                }
            }
        }
        timer_.stop();
        if (ownsExecutor_) {
            executor_->shutdown();
        }
    }

private:
    struct Entry {
        Record record;
        std::shared_ptr<const Task> task;
        std::optional<std::chrono::milliseconds> timeout;
        std::uint64_t generation = 0;  ///< bumped on every admission
        async::Timer::TaskHandle timeoutHandle = async::Timer::INVALID_HANDLE;
        async::Timer::TaskHandle backoffHandle = async::Timer::INVALID_HANDLE;
        bool cancelRequested = false;
        std::shared_ptr<std::promise<Record>> completion;
    };

    /// Body of an abandoned task, kept for retryAbandoned().
    struct Retained {
        std::shared_ptr<const Task> task;
        std::optional<std::chrono::milliseconds> timeout;
    };

    struct PendingJob {
        TaskId id;
        std::uint64_t generation;
        std::shared_ptr<const Task> task;
    };

    struct Actions {
        std::vector<PendingJob> jobs;
        std::vector<std::function<void(Observer &)>> events;
        std::vector<std::shared_ptr<Observer>> observers;
        std::vector<std::pair<std::shared_ptr<std::promise<Record>>, Record>>
            completions;
    };

    using LiveMap = std::unordered_map<TaskId, Entry>;

    auto enqueue(Task task, SubmitOptions options,
                 std::shared_ptr<std::promise<Record>> completion) -> TaskId {
        if (!task) {
            THROW_INVALID_ARGUMENT("Cannot submit an empty task");
        }
        if (options.timeout && options.timeout->count() <= 0) {
            THROW_INVALID_ARGUMENT("Task timeout must be positive, got ",
                                   options.timeout->count(), "ms");
        }

        Actions actions;
        TaskId id = INVALID_TASK_ID;
        {
            std::scoped_lock lock(mutex_);
            if (closed_) {
                THROW_POOL_CLOSED_ERROR("Scheduler is closed; task rejected");
            }
            if (options.id) {
                id = *options.id;
                if (id == INVALID_TASK_ID) {
                    THROW_INVALID_ARGUMENT("Task id ", INVALID_TASK_ID,
                                           " is reserved");
                }
                if (isKnownLocked(id)) {
                    THROW_INVALID_ARGUMENT("Task id ", id,
                                           " is already in use");
                }
            } else {
                id = allocateIdLocked();
            }

            Entry entry;
            entry.record.id = id;
            entry.task = std::make_shared<const Task>(std::move(task));
            entry.timeout = options.timeout;
            entry.completion = std::move(completion);
            live_.emplace(id, std::move(entry));
            queue_.push_back(id);
            if (signal_.rearm()) {
                spdlog::debug("Completion signal re-armed for cycle {}",
                              signal_.cycle());
            }
            spdlog::debug("Task {} queued ({} waiting)", id, queue_.size());

            dispatchLocked(actions);
        }
        flush(actions);
        return id;
    }

    [[nodiscard]] auto isShuttingDown() const -> bool {
        std::scoped_lock lock(mutex_);
        return shuttingDown_;
    }

    [[nodiscard]] auto isKnownLocked(TaskId id) const -> bool {
        return live_.contains(id) || store_.contains(id);
    }

    auto allocateIdLocked() -> TaskId {
        while (nextId_ == INVALID_TASK_ID || isKnownLocked(nextId_)) {
            ++nextId_;
        }
        return nextId_++;
    }

    void notifyLocked(Actions &actions,
                      std::function<void(Observer &)> event) {
        if (observers_.empty()) {
            return;
        }
        if (actions.observers.empty()) {
            actions.observers = observers_;
        }
        actions.events.push_back(std::move(event));
    }

    void dispatchLocked(Actions &actions) {
        auto limit = static_cast<std::size_t>(config_.maxConcurrency);
        while (!shuttingDown_ && active_ < limit && !queue_.empty()) {
            TaskId id = queue_.front();
            queue_.pop_front();

            Entry &entry = live_.at(id);
            entry.record.state = TaskState::Running;
            ++entry.record.attempts;
            ++entry.generation;
            ++active_;
            peakActive_ = std::max(peakActive_, active_);

            if (entry.timeout) {
                armTimeoutLocked(id, entry);
            }
            actions.jobs.push_back({id, entry.generation, entry.task});

            auto attempt = entry.record.attempts;
            spdlog::debug("Task {} admitted (attempt {}/{}, {} active)", id,
                          attempt, config_.maxAttempts, active_);
            notifyLocked(actions, [id, attempt](Observer &observer) {
                observer.onAdmitted(id, attempt);
            });
        }
    }

    void armTimeoutLocked(TaskId id, Entry &entry) {
        auto timeout = *entry.timeout;
        entry.timeoutHandle = timer_.setTimeout(
            [weak = this->weak_from_this(), id,
             generation = entry.generation, timeout]() {
                if (auto core = weak.lock()) {
                    core->settle(id, generation,
                                 fail(TaskError::timeout(fmt::format(
                                     "attempt timed out after {}ms",
                                     timeout.count()))));
                }
            },
            timeout);
    }

    void settle(TaskId id, std::uint64_t generation, TaskResult<T> outcome) {
        Actions actions;
        {
            std::scoped_lock lock(mutex_);
            settleLocked(id, generation, std::move(outcome), actions);
        }
        flush(actions);
    }

    void settleLocked(TaskId id, std::uint64_t generation,
                      TaskResult<T> outcome, Actions &actions) {
        auto it = live_.find(id);
        if (it == live_.end() ||
            it->second.record.state != TaskState::Running ||
            it->second.generation != generation) {
            spdlog::debug("Discarding stale outcome of task {} (attempt {})",
                          id, generation);
            return;
        }

        Entry &entry = it->second;
        if (entry.timeoutHandle != async::Timer::INVALID_HANDLE) {
            timer_.cancel(entry.timeoutHandle);
            entry.timeoutHandle = async::Timer::INVALID_HANDLE;
        }

        if (entry.cancelRequested) {
            --active_;
            finalizeLocked(it, TaskState::Abandoned,
                           TaskError::cancelled("cancelled while running"),
                           actions);
        } else if (outcome.has_value()) {
            --active_;
            entry.record.result = std::move(outcome).value();
            spdlog::debug("Task {} succeeded on attempt {}", id,
                          entry.record.attempts);
            finalizeLocked(it, TaskState::Succeeded, std::nullopt, actions);
        } else {
            handleFailureLocked(it, std::move(outcome).error(), actions);
        }

        dispatchLocked(actions);
        checkDrainLocked(actions);
    }

    void handleFailureLocked(typename LiveMap::iterator it, TaskError error,
                             Actions &actions) {
        TaskId id = it->first;
        Entry &entry = it->second;
        entry.record.state = TaskState::Failed;
        entry.record.lastError = error;
        auto attempt = entry.record.attempts;

        RetryDecision decision;
        if (!shuttingDown_) {
            try {
                decision = policy_->decide(attempt, error);
            } catch (const std::exception &e) {
                spdlog::error("Retry policy failed for task {}: {}", id,
                              e.what());
                decision = RetryDecision{};
            }
        }

        if (!decision.retry) {
            --active_;
            spdlog::warn("Task {} abandoned after {} attempt(s): {}", id,
                         attempt, error.message);
            finalizeLocked(it, TaskState::Abandoned, std::move(error),
                           actions);
            return;
        }

        auto delay = std::max(decision.delay, std::chrono::milliseconds(0));
        spdlog::warn("Task {} failed on attempt {} ({}), retrying in {}ms", id,
                     attempt, error.message, delay.count());
        notifyLocked(actions, [id, error, delay](Observer &observer) {
            observer.onRetryScheduled(id, error, delay);
        });

        if (delay.count() == 0) {
            requeueLocked(id, entry);
            return;
        }
        try {
            entry.backoffHandle = timer_.setTimeout(
                [weak = this->weak_from_this(), id,
                 generation = entry.generation]() {
                    if (auto core = weak.lock()) {
                        core->onBackoffElapsed(id, generation);
                    }
                },
                delay);
        } catch (const std::exception &e) {
            spdlog::error("Cannot schedule backoff for task {}: {}", id,
                          e.what());
            requeueLocked(id, entry);
        }
    }

    void onBackoffElapsed(TaskId id, std::uint64_t generation) {
        Actions actions;
        {
            std::scoped_lock lock(mutex_);
            auto it = live_.find(id);
            if (it == live_.end() ||
                it->second.record.state != TaskState::Failed ||
                it->second.generation != generation) {
                return;
            }
            it->second.backoffHandle = async::Timer::INVALID_HANDLE;
            if (it->second.cancelRequested) {
                --active_;
                finalizeLocked(
                    it, TaskState::Abandoned,
                    TaskError::cancelled("cancelled during retry backoff"),
                    actions);
            } else {
                requeueLocked(id, it->second);
            }
            dispatchLocked(actions);
            checkDrainLocked(actions);
        }
        flush(actions);
    }

    // The slot is released only here, after the backoff, so retried work
    // goes to the tail and a pending retry keeps the pool undrained.
    void requeueLocked(TaskId id, Entry &entry) {
        --active_;
        entry.record.state = TaskState::Queued;
        queue_.push_back(id);
    }

    void finalizeLocked(typename LiveMap::iterator it, TaskState state,
                        std::optional<TaskError> error, Actions &actions) {
        Entry entry = std::move(it->second);
        live_.erase(it);

        TaskId id = entry.record.id;
        entry.record.state = state;
        if (error) {
            entry.record.lastError = std::move(error);
        }

        if (state == TaskState::Succeeded) {
            notifyLocked(actions,
                         [id, value = *entry.record.result](Observer &o) {
                             o.onSucceeded(id, value);
                         });
        } else {
            auto reason = entry.record.lastError.value_or(
                TaskError::failure("abandoned"));
            if (reason.kind != ErrorKind::Cancelled) {
                retained_[id] = Retained{entry.task, entry.timeout};
            }
            notifyLocked(actions, [id, reason](Observer &o) {
                o.onAbandoned(id, reason);
            });
        }
        if (entry.completion) {
            actions.completions.emplace_back(std::move(entry.completion),
                                             entry.record);
        }
        store_.record(std::move(entry.record));
    }

    void checkDrainLocked(Actions &actions) {
        if (active_ != 0 || !queue_.empty() || signal_.isFired()) {
            return;
        }
        DrainResult<T> snapshot{store_.succeeded(), store_.failed()};
        spdlog::info("Pool drained: {} succeeded, {} failed",
                     snapshot.succeeded.size(), snapshot.failed.size());
        notifyLocked(actions, [snapshot](Observer &o) { o.onDrained(snapshot); });
        signal_.fire(std::move(snapshot));
    }

    static auto runTask(const Task &task) -> TaskResult<T> {
        try {
            return task();
        } catch (const std::exception &e) {
            return fail(TaskError::exception(e.what()));
        } catch (...) {
            return fail(TaskError::exception("unknown exception"));
        }
    }

    void flush(Actions &actions) {
        // Rejected hand-offs settle as failures and may admit more jobs, so
        // the vector can grow while it is walked.
        for (std::size_t i = 0; i < actions.jobs.size(); ++i) {
            PendingJob job = actions.jobs[i];
            try {
                executor_->post([weak = this->weak_from_this(), job]() {
                    auto core = weak.lock();
                    if (!core || core->isShuttingDown()) {
                        spdlog::debug("Skipping task {}: scheduler is gone",
                                      job.id);
                        return;
                    }
                    core->settle(job.id, job.generation, runTask(*job.task));
                });
            } catch (const std::exception &e) {
                spdlog::error("Executor rejected task {}: {}", job.id,
                              e.what());
                std::scoped_lock lock(mutex_);
                settleLocked(job.id, job.generation,
                             fail(TaskError::exception(fmt::format(
                                 "executor rejected the task: {}", e.what()))),
                             actions);
            }
        }

        for (auto &[completion, record] : actions.completions) {
            completion->set_value(std::move(record));
        }
        actions.completions.clear();

        for (const auto &event : actions.events) {
            for (const auto &observer : actions.observers) {
                try {
                    event(*observer);
                } catch (const std::exception &e) {
                    spdlog::error("Scheduler observer threw: {}", e.what());
                }
            }
        }
    }

    const SchedulerConfig config_;
    const std::shared_ptr<RetryPolicy> policy_;
    const std::shared_ptr<async::Executor> executor_;
    const bool ownsExecutor_;

    mutable std::mutex mutex_;
    LiveMap live_;
    std::deque<TaskId> queue_;
    std::map<TaskId, Retained> retained_;
    std::size_t active_ = 0;
    std::size_t peakActive_ = 0;
    bool closed_ = false;
    bool shuttingDown_ = false;
    TaskId nextId_ = 1;

    ResultStore<T> store_;
    CompletionSignal<T> signal_;
    std::vector<std::shared_ptr<Observer>> observers_;
    async::Timer timer_;
};

}  // namespace detail

/**
 * @brief Runs submitted tasks with at most `maxConcurrency` in flight,
 * retrying failures per a RetryPolicy and signalling every time the pool
 * drains.
 *
 * Admission is FIFO; a retried task re-enters at the tail of the queue after
 * its backoff and keeps its id. The same instance can go through any number
 * of submit/drain cycles until close().
 *
 * @tparam T Value produced by a successful task; use std::monostate when
 * there is none.
 */
template <std::copy_constructible T>
class Scheduler {
public:
    using Task = TaskFn<T>;
    using Record = TaskRecord<T>;
    using Observer = SchedulerObserver<T>;
    using DrainFuture = typename CompletionSignal<T>::Future;
    using RecordFuture = std::shared_future<Record>;

    /**
     * @brief Scheduler on its own ThreadExecutor with the default retry
     * policy.
     * @throws ConfigurationError if the config is invalid
     */
    explicit Scheduler(SchedulerConfig config = {})
        : Scheduler(std::move(config), nullptr, nullptr) {}

    /**
     * @brief Scheduler on a caller-provided executor, which it does not shut
     * down.
     */
    Scheduler(SchedulerConfig config, std::shared_ptr<async::Executor> executor)
        : Scheduler(std::move(config), nullptr, std::move(executor)) {}

    /**
     * @brief Fully injected scheduler. A null policy means the default policy
     * built from `config`; a null executor means an owned ThreadExecutor.
     * @throws ConfigurationError if the config is invalid
     */
    Scheduler(SchedulerConfig config, std::shared_ptr<RetryPolicy> policy,
              std::shared_ptr<async::Executor> executor) {
        config.validate();
        bool ownsExecutor = !executor;
        if (!executor) {
            executor = std::make_shared<async::ThreadExecutor>();
        }
        if (!policy) {
            policy = DefaultRetryPolicy::fromConfig(config);
        }
        spdlog::info("Scheduler created: maxConcurrency={}, maxAttempts={}",
                     config.maxConcurrency, config.maxAttempts);
        core_ = std::make_shared<detail::SchedulerCore<T>>(
            std::move(config), std::move(policy), std::move(executor),
            ownsExecutor);
    }

    /**
     * @brief Closes the scheduler, stops dispatching queued work and waits
     * for running tasks when the executor is owned.
     */
    ~Scheduler() {
        if (core_) {
            core_->shutdown();
        }
    }

    Scheduler(const Scheduler &) = delete;
    Scheduler &operator=(const Scheduler &) = delete;
    Scheduler(Scheduler &&) = delete;
    Scheduler &operator=(Scheduler &&) = delete;

    /**
     * @brief Queues a task and dispatches as far as the budget allows.
     * @return The task id, stable across retries.
     * @throws PoolClosedError after close()
     * @throws retrypool::error::InvalidArgument for an empty task, a reserved
     * or duplicate id, or a non-positive timeout
     */
    auto submit(Task task, SubmitOptions options = {}) -> TaskId {
        return core_->submit(std::move(task), std::move(options));
    }

    auto submit(Task task, TaskId id) -> TaskId {
        SubmitOptions options;
        options.id = id;
        return core_->submit(std::move(task), std::move(options));
    }

    /**
     * @brief Rejects further submissions. Queued and running work finishes.
     */
    void close() { core_->close(); }

    /**
     * @brief Like submit(), and also returns a future of the task's first
     * terminal record (Succeeded or Abandoned).
     *
     * The future is broken (std::future_error) if the scheduler shuts down
     * before the task reaches a terminal state.
     */
    auto submitWithFuture(Task task, SubmitOptions options = {})
        -> std::pair<TaskId, RecordFuture> {
        return core_->submitWithFuture(std::move(task), std::move(options));
    }

    /**
     * @brief Cancels a task.
     * @return true iff the task was Queued and is now Abandoned. A running
     * task is not interrupted: false is returned and its outcome is recorded
     * as Abandoned (Cancelled) once it settles.
     */
    auto cancel(TaskId id) -> bool { return core_->cancel(id); }

    [[nodiscard]] auto stats() const -> Stats { return core_->stats(); }

    /**
     * @brief Snapshot of a task, live or terminal.
     */
    [[nodiscard]] auto get(TaskId id) const -> std::optional<Record> {
        return core_->get(id);
    }

    /**
     * @brief Future of the next drain, or of the current one if the pool is
     * already drained and nothing was submitted since.
     */
    [[nodiscard]] auto waitForDrain() -> DrainFuture {
        return core_->waitForDrain();
    }

    /**
     * @brief Requeues abandoned tasks (not cancelled ones) with a fresh
     * attempt budget.
     * @return Number of tasks requeued.
     * @throws PoolClosedError after close()
     */
    auto retryAbandoned() -> std::size_t { return core_->retryAbandoned(); }

    /**
     * @brief Forgets terminal records so ids can be reused by the next batch.
     */
    void resetResults() { core_->resetResults(); }

    void addObserver(std::shared_ptr<Observer> observer) {
        core_->addObserver(std::move(observer));
    }

    [[nodiscard]] auto isClosed() const -> bool { return core_->isClosed(); }
    [[nodiscard]] auto isDrained() const -> bool { return core_->isDrained(); }
    [[nodiscard]] auto activeCount() const -> std::size_t {
        return core_->activeCount();
    }
    /// Highest active count observed so far.
    [[nodiscard]] auto peakActiveCount() const -> std::size_t {
        return core_->peakActiveCount();
    }
    [[nodiscard]] auto maxConcurrency() const -> int {
        return core_->config().maxConcurrency;
    }

private:
    std::shared_ptr<detail::SchedulerCore<T>> core_;
};

}  // namespace retrypool::scheduler

#endif  // RETRYPOOL_SCHEDULER_SCHEDULER_HPP
