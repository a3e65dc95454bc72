/*
 * timer.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "timer.hpp"

#include <spdlog/spdlog.h>

namespace retrypool::async {

Timer::Timer() noexcept(false) {
    try {
        m_thread = std::jthread(&Timer::run, this);
    } catch (const std::exception &e) {
        THROW_RUNTIME_ERROR("Failed to create timer thread: ", e.what());
    }
}

Timer::~Timer() noexcept {
    stop();
    if (m_thread.joinable()) {
        // Only reachable when the last owner is released from inside a
        // callback.
        m_thread.detach();
    }
}

auto Timer::enqueue(std::function<void()> func,
                    std::chrono::milliseconds delay) -> TaskHandle {
    TaskHandle handle = INVALID_HANDLE;
    {
        std::scoped_lock lock(m_mutex);
        if (m_stop.load(std::memory_order_acquire)) {
            THROW_RUNTIME_ERROR("Timer::setTimeout: timer is stopped");
        }
        handle = m_nextHandle++;
        m_tasks.emplace(handle, std::move(func));
        m_taskQueue.push(Entry{Clock::now() + delay, m_sequence++, handle});
    }
    m_cond.notify_all();
    return handle;
}

auto Timer::cancel(TaskHandle handle) noexcept -> bool {
    bool removed = false;
    {
        std::scoped_lock lock(m_mutex);
        removed = m_tasks.erase(handle) > 0;
    }
    if (removed) {
        m_cond.notify_all();
    }
    return removed;
}

void Timer::cancelAllTasks() noexcept {
    {
        std::scoped_lock lock(m_mutex);
        m_tasks.clear();
        m_taskQueue = std::priority_queue<Entry>();
    }
    m_cond.notify_all();
}

void Timer::stop() noexcept {
    {
        std::scoped_lock lock(m_mutex);
        m_stop.store(true, std::memory_order_release);
        m_tasks.clear();
        m_taskQueue = std::priority_queue<Entry>();
    }
    m_cond.notify_all();
    if (m_thread.joinable() &&
        m_thread.get_id() != std::this_thread::get_id()) {
        m_thread.join();
    }
}

void Timer::wait() noexcept {
    std::unique_lock lock(m_mutex);
    m_cond.wait(lock, [this]() {
        return m_stop.load(std::memory_order_acquire) ||
               (m_tasks.empty() && !m_firing);
    });
}

auto Timer::getTaskCount() const noexcept -> size_t {
    std::scoped_lock lock(m_mutex);
    return m_tasks.size();
}

void Timer::run() noexcept {
    std::unique_lock lock(m_mutex);
    while (!m_stop.load(std::memory_order_acquire)) {
        // Drop heap entries whose callback was cancelled.
        while (!m_taskQueue.empty() &&
               !m_tasks.contains(m_taskQueue.top().handle)) {
            m_taskQueue.pop();
        }

        if (m_taskQueue.empty()) {
            m_cond.notify_all();
            m_cond.wait(lock, [this]() {
                return m_stop.load(std::memory_order_acquire) ||
                       !m_taskQueue.empty();
            });
            continue;
        }

        Entry next = m_taskQueue.top();
        if (Clock::now() < next.deadline) {
            m_cond.wait_until(lock, next.deadline);
            continue;
        }

        m_taskQueue.pop();
        auto node = m_tasks.extract(next.handle);
        m_firing = true;
        lock.unlock();

        try {
            node.mapped()();
        } catch (const std::exception &e) {
            spdlog::error("Timer callback {} threw: {}", next.handle,
                          e.what());
        } catch (...) {
            spdlog::error("Timer callback {} threw an unknown exception",
                          next.handle);
        }

        lock.lock();
        m_firing = false;
        m_cond.notify_all();
    }
}

}  // namespace retrypool::async
