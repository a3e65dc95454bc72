/*
 * executor.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "executor.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace retrypool::async {

ThreadExecutor::~ThreadExecutor() { shutdown(); }

void ThreadExecutor::post(Job job) {
    std::scoped_lock lock(mutex_);
    if (shutdown_) {
        THROW_EXECUTOR_SHUTDOWN_ERROR("ThreadExecutor is shut down");
    }
    reapLocked();

    auto done = std::make_shared<std::atomic<bool>>(false);
    std::thread thread([job = std::move(job), done]() {
        try {
            job();
        } catch (const std::exception& e) {
            spdlog::error("ThreadExecutor job threw: {}", e.what());
        }
        done->store(true, std::memory_order_release);
    });
    workers_.push_back(Worker{std::move(thread), std::move(done)});
}

void ThreadExecutor::shutdown() noexcept {
    std::vector<Worker> pending;
    {
        std::scoped_lock lock(mutex_);
        shutdown_ = true;
        pending.swap(workers_);
    }
    if (!pending.empty()) {
        spdlog::debug("ThreadExecutor joining {} outstanding jobs",
                      pending.size());
    }
    for (auto& worker : pending) {
        if (!worker.thread.joinable()) {
            continue;
        }
        if (worker.thread.get_id() == std::this_thread::get_id()) {
            worker.thread.detach();
        } else {
            worker.thread.join();
        }
    }
}

auto ThreadExecutor::outstanding() const -> std::size_t {
    std::scoped_lock lock(mutex_);
    return workers_.size();
}

void ThreadExecutor::reapLocked() {
    std::erase_if(workers_, [](Worker& worker) {
        if (!worker.done->load(std::memory_order_acquire)) {
            return false;
        }
        worker.thread.join();
        return true;
    });
}

void ManualExecutor::post(Job job) {
    std::scoped_lock lock(mutex_);
    if (shutdown_) {
        THROW_EXECUTOR_SHUTDOWN_ERROR("ManualExecutor is shut down");
    }
    jobs_.push_back(std::move(job));
}

void ManualExecutor::shutdown() noexcept {
    std::deque<Job> dropped;
    {
        std::scoped_lock lock(mutex_);
        shutdown_ = true;
        dropped.swap(jobs_);
    }
    if (!dropped.empty()) {
        spdlog::debug("ManualExecutor discarded {} pending jobs",
                      dropped.size());
    }
}

auto ManualExecutor::runOne() -> bool {
    Job job;
    {
        std::scoped_lock lock(mutex_);
        if (jobs_.empty()) {
            return false;
        }
        job = std::move(jobs_.front());
        jobs_.pop_front();
    }
    job();
    return true;
}

auto ManualExecutor::runAll() -> std::size_t {
    std::size_t count = 0;
    while (runOne()) {
        ++count;
    }
    return count;
}

auto ManualExecutor::pending() const -> std::size_t {
    std::scoped_lock lock(mutex_);
    return jobs_.size();
}

}  // namespace retrypool::async
