/*
 * task.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-02-10

Description: Task identity, state and outcome types

**************************************************/

#ifndef RETRYPOOL_SCHEDULER_TASK_HPP
#define RETRYPOOL_SCHEDULER_TASK_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include "retrypool/type/expected.hpp"

namespace retrypool::scheduler {

using TaskId = std::uint64_t;

/// Reserved; never assigned and never accepted from a caller.
inline constexpr TaskId INVALID_TASK_ID = 0;

/**
 * @brief Lifecycle of a submitted task.
 *
 * Queued -> Running -> Succeeded | Failed; Failed -> Queued | Abandoned;
 * Queued -> Abandoned on cancellation. Succeeded and Abandoned are terminal.
 */
enum class TaskState : std::uint8_t {
    Queued,
    Running,
    Succeeded,
    Failed,
    Abandoned
};

[[nodiscard]] constexpr auto toString(TaskState state) noexcept
    -> std::string_view {
    switch (state) {
        case TaskState::Queued:
            return "Queued";
        case TaskState::Running:
            return "Running";
        case TaskState::Succeeded:
            return "Succeeded";
        case TaskState::Failed:
            return "Failed";
        case TaskState::Abandoned:
            return "Abandoned";
    }
    return "Unknown";
}

[[nodiscard]] constexpr auto isTerminal(TaskState state) noexcept -> bool {
    return state == TaskState::Succeeded || state == TaskState::Abandoned;
}

/**
 * @brief Classification of a task failure, used by retry policies.
 */
enum class ErrorKind : std::uint8_t {
    Failure,     ///< the task reported an error
    Timeout,     ///< the attempt lost the race against its deadline
    Cancelled,   ///< cancel() was called for the task
    Exception,   ///< the task body threw
    Validation   ///< the task rejected its input; retrying cannot help
};

[[nodiscard]] constexpr auto toString(ErrorKind kind) noexcept
    -> std::string_view {
    switch (kind) {
        case ErrorKind::Failure:
            return "Failure";
        case ErrorKind::Timeout:
            return "Timeout";
        case ErrorKind::Cancelled:
            return "Cancelled";
        case ErrorKind::Exception:
            return "Exception";
        case ErrorKind::Validation:
            return "Validation";
    }
    return "Unknown";
}

/**
 * @brief A task's own failure. Recorded, never thrown to the submitter.
 */
struct TaskError {
    ErrorKind kind = ErrorKind::Failure;
    std::string message;

    static auto failure(std::string message) -> TaskError {
        return {ErrorKind::Failure, std::move(message)};
    }
    static auto timeout(std::string message) -> TaskError {
        return {ErrorKind::Timeout, std::move(message)};
    }
    static auto cancelled(std::string message) -> TaskError {
        return {ErrorKind::Cancelled, std::move(message)};
    }
    static auto exception(std::string message) -> TaskError {
        return {ErrorKind::Exception, std::move(message)};
    }
    static auto validation(std::string message) -> TaskError {
        return {ErrorKind::Validation, std::move(message)};
    }

    [[nodiscard]] auto isTimeout() const noexcept -> bool {
        return kind == ErrorKind::Timeout;
    }

    bool operator==(const TaskError &) const = default;
};

inline auto operator<<(std::ostream &os, const TaskError &error)
    -> std::ostream & {
    return os << toString(error.kind) << ": " << error.message;
}

template <typename T>
using TaskResult = type::expected<T, TaskError>;

template <typename T>
using TaskFn = std::function<TaskResult<T>()>;

/**
 * @brief Shorthand for returning a failure from a task body.
 */
inline auto fail(TaskError error) -> type::unexpected<TaskError> {
    return type::unexpected<TaskError>(std::move(error));
}

/**
 * @brief Snapshot of one task. Copies are independent of the scheduler.
 */
template <typename T>
struct TaskRecord {
    TaskId id = INVALID_TASK_ID;
    TaskState state = TaskState::Queued;
    std::uint32_t attempts = 0;  ///< execution starts so far
    std::optional<T> result;     ///< present iff Succeeded
    std::optional<TaskError> lastError;

    [[nodiscard]] auto isTerminal() const noexcept -> bool {
        return scheduler::isTerminal(state);
    }
};

/**
 * @brief Per-submission options.
 */
struct SubmitOptions {
    std::optional<TaskId> id;  ///< caller key; assigned when empty
    std::optional<std::chrono::milliseconds> timeout;  ///< per attempt
};

}  // namespace retrypool::scheduler

#endif  // RETRYPOOL_SCHEDULER_TASK_HPP
