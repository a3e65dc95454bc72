/*
 * result_store.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file result_store.hpp
 * @brief Keyed storage of terminal task outcomes
 * @date 2024-02-10
 */

#ifndef RETRYPOOL_SCHEDULER_RESULT_STORE_HPP
#define RETRYPOOL_SCHEDULER_RESULT_STORE_HPP

#include <concepts>
#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <vector>

#include "retrypool/error/exception.hpp"
#include "retrypool/scheduler/task.hpp"

namespace retrypool::scheduler {

/**
 * @brief Aggregate counters. `running` counts occupied concurrency slots,
 * which includes tasks waiting out a retry backoff.
 */
struct Stats {
    std::size_t queued = 0;
    std::size_t running = 0;
    std::size_t succeeded = 0;
    std::size_t abandoned = 0;
    std::size_t total = 0;

    bool operator==(const Stats &) const = default;
};

/**
 * @brief Terminal TaskRecords keyed by id.
 *
 * Only Succeeded and Abandoned records are accepted. Reads return copies
 * taken under a shared lock, so a reader never sees a half-written record.
 * Nothing is ever removed implicitly.
 */
template <std::copy_constructible T>
class ResultStore {
public:
    using Record = TaskRecord<T>;

    /**
     * @brief Stores (or replaces) the terminal record of a task.
     * @throws retrypool::error::LogicError if the record is not terminal
     */
    void record(Record rec) {
        if (!rec.isTerminal()) {
            THROW_LOGIC_ERROR("Task ", rec.id, " is ", toString(rec.state),
                              "; only terminal records can be stored");
        }
        std::unique_lock lock(mutex_);
        auto [it, inserted] = records_.insert_or_assign(rec.id, std::move(rec));
        if (it->second.state == TaskState::Succeeded) {
            ++succeeded_;
        } else {
            ++abandoned_;
        }
        if (!inserted) {
            recount();
        }
    }

    [[nodiscard]] auto get(TaskId id) const -> std::optional<Record> {
        std::shared_lock lock(mutex_);
        auto it = records_.find(id);
        if (it == records_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    [[nodiscard]] auto contains(TaskId id) const -> bool {
        std::shared_lock lock(mutex_);
        return records_.contains(id);
    }

    /**
     * @brief Removes one record.
     * @return true if a record was removed.
     */
    auto erase(TaskId id) -> bool {
        std::unique_lock lock(mutex_);
        auto it = records_.find(id);
        if (it == records_.end()) {
            return false;
        }
        if (it->second.state == TaskState::Succeeded) {
            --succeeded_;
        } else {
            --abandoned_;
        }
        records_.erase(it);
        return true;
    }

    void clear() {
        std::unique_lock lock(mutex_);
        records_.clear();
        succeeded_ = 0;
        abandoned_ = 0;
    }

    [[nodiscard]] auto size() const -> std::size_t {
        std::shared_lock lock(mutex_);
        return records_.size();
    }

    /**
     * @brief Terminal-only view: queued and running are always zero here.
     */
    [[nodiscard]] auto stats() const -> Stats {
        std::shared_lock lock(mutex_);
        return Stats{0, 0, succeeded_, abandoned_, records_.size()};
    }

    [[nodiscard]] auto succeeded() const -> std::map<TaskId, T> {
        std::shared_lock lock(mutex_);
        std::map<TaskId, T> out;
        for (const auto &[id, rec] : records_) {
            if (rec.state == TaskState::Succeeded && rec.result) {
                out.emplace(id, *rec.result);
            }
        }
        return out;
    }

    [[nodiscard]] auto failed() const -> std::map<TaskId, TaskError> {
        std::shared_lock lock(mutex_);
        std::map<TaskId, TaskError> out;
        for (const auto &[id, rec] : records_) {
            if (rec.state == TaskState::Abandoned) {
                out.emplace(id, rec.lastError.value_or(TaskError::failure(
                                    "abandoned without error")));
            }
        }
        return out;
    }

    [[nodiscard]] auto records() const -> std::vector<Record> {
        std::shared_lock lock(mutex_);
        std::vector<Record> out;
        out.reserve(records_.size());
        for (const auto &[id, rec] : records_) {
            out.push_back(rec);
        }
        return out;
    }

private:
    void recount() {
        succeeded_ = 0;
        abandoned_ = 0;
        for (const auto &[id, rec] : records_) {
            if (rec.state == TaskState::Succeeded) {
                ++succeeded_;
            } else {
                ++abandoned_;
            }
        }
    }

    mutable std::shared_mutex mutex_;
    std::map<TaskId, Record> records_;
    std::size_t succeeded_ = 0;
    std::size_t abandoned_ = 0;
};

}  // namespace retrypool::scheduler

#endif  // RETRYPOOL_SCHEDULER_RESULT_STORE_HPP
