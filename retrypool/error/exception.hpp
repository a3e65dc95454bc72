/*
 * exception.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2023-11-10

Description: Better Exception Library

**************************************************/

#ifndef RETRYPOOL_ERROR_EXCEPTION_HPP
#define RETRYPOOL_ERROR_EXCEPTION_HPP

#include <exception>
#include <sstream>
#include <string>
#include <thread>
#include <utility>

#include "retrypool/error/stacktrace.hpp"

#define RETRYPOOL_FILE_NAME __FILE__
#define RETRYPOOL_FILE_LINE __LINE__
#define RETRYPOOL_FUNC_NAME __func__

namespace retrypool::error {

/**
 * @brief Base exception carrying the throw site, the throwing thread and a
 * stack trace captured at construction.
 *
 * The message is built by streaming every extra constructor argument, so
 * callers can write `THROW_RUNTIME_ERROR("bad value: ", value)`.
 */
class Exception : public std::exception {
public:
    template <typename... Args>
    Exception(const char *file, int line, const char *func, Args &&...args)
        : file_(file),
          line_(line),
          func_(func),
          thread_id_(std::this_thread::get_id()) {
        std::ostringstream oss;
        ((oss << std::forward<Args>(args)), ...);
        message_ = oss.str();
        report_ = render();
    }

    /**
     * @brief Message, throw site, thread and stack trace, rendered when the
     * exception is constructed.
     */
    [[nodiscard]] auto what() const noexcept -> const char * override;

    [[nodiscard]] auto getFile() const -> std::string;
    [[nodiscard]] auto getLine() const -> int;
    [[nodiscard]] auto getFunction() const -> std::string;
    [[nodiscard]] auto getMessage() const -> std::string;
    [[nodiscard]] auto getThreadId() const -> std::thread::id;

private:
    [[nodiscard]] auto render() const -> std::string;

    std::string file_;
    int line_;
    std::string func_;
    std::string message_;
    std::thread::id thread_id_;
    StackTrace stack_trace_;
    std::string report_;
};

class RuntimeError : public Exception {
public:
    using Exception::Exception;
};

class InvalidArgument : public Exception {
public:
    using Exception::Exception;
};

class LogicError : public Exception {
public:
    using Exception::Exception;
};

}  // namespace retrypool::error

#define THROW_RUNTIME_ERROR(...)                                      \
    throw retrypool::error::RuntimeError(                             \
        RETRYPOOL_FILE_NAME, RETRYPOOL_FILE_LINE, RETRYPOOL_FUNC_NAME, \
        __VA_ARGS__)

#define THROW_INVALID_ARGUMENT(...)                                   \
    throw retrypool::error::InvalidArgument(                          \
        RETRYPOOL_FILE_NAME, RETRYPOOL_FILE_LINE, RETRYPOOL_FUNC_NAME, \
        __VA_ARGS__)

#define THROW_LOGIC_ERROR(...)                                        \
    throw retrypool::error::LogicError(                               \
        RETRYPOOL_FILE_NAME, RETRYPOOL_FILE_LINE, RETRYPOOL_FUNC_NAME, \
        __VA_ARGS__)

#endif  // RETRYPOOL_ERROR_EXCEPTION_HPP
