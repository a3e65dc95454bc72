/*
 * stacktrace.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2023-11-10

Description: Stack trace capture for exception reports

**************************************************/

#ifndef RETRYPOOL_ERROR_STACKTRACE_HPP
#define RETRYPOOL_ERROR_STACKTRACE_HPP

#include <string>
#include <vector>

namespace retrypool::error {

/**
 * @brief Captures the call stack at construction and renders it on demand.
 *
 * Symbol resolution is deferred to toString(), so capturing is cheap enough
 * to do for every thrown retrypool::error::Exception.
 */
class StackTrace {
public:
    /**
     * @brief Captures the current stack trace.
     */
    StackTrace();

    /**
     * @brief One line per frame, innermost first, with demangled names where
     * the symbol table allows it.
     */
    [[nodiscard]] auto toString() const -> std::string;

    [[nodiscard]] auto size() const noexcept -> std::size_t {
        return frames_.size();
    }

private:
    void capture();

    [[nodiscard]] auto processFrame(void *frame, int frameIndex) const
        -> std::string;

    std::vector<void *> frames_;
};

}  // namespace retrypool::error

#endif  // RETRYPOOL_ERROR_STACKTRACE_HPP
