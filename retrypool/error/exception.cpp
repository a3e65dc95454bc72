/*
 * exception.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2023-11-10

Description: Better Exception Library

**************************************************/

#include "exception.hpp"

namespace retrypool::error {

auto Exception::what() const noexcept -> const char * {
    return report_.c_str();
}

// "<message>\n  at <func>() (<file>:<line>) on thread <id>\n  stack trace:"
auto Exception::render() const -> std::string {
    std::ostringstream oss;
    oss << message_ << "\n";
    oss << "  at " << func_ << "() (" << file_ << ":" << line_
        << ") on thread " << thread_id_ << "\n";
    oss << "  stack trace:\n" << stack_trace_.toString();
    return oss.str();
}

auto Exception::getFile() const -> std::string { return file_; }
auto Exception::getLine() const -> int { return line_; }
auto Exception::getFunction() const -> std::string { return func_; }
auto Exception::getMessage() const -> std::string { return message_; }
auto Exception::getThreadId() const -> std::thread::id { return thread_id_; }

}  // namespace retrypool::error
