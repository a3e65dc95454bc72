/*
 * errors.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-02-10

Description: Scheduler error types

**************************************************/

#ifndef RETRYPOOL_SCHEDULER_ERRORS_HPP
#define RETRYPOOL_SCHEDULER_ERRORS_HPP

#include "retrypool/error/exception.hpp"

namespace retrypool::scheduler {

/**
 * @class ConfigurationError
 * @brief Thrown when a scheduler is constructed with invalid settings.
 */
class ConfigurationError : public retrypool::error::InvalidArgument {
public:
    using retrypool::error::InvalidArgument::InvalidArgument;
};

/**
 * @class PoolClosedError
 * @brief Thrown when work is submitted after close().
 */
class PoolClosedError : public retrypool::error::RuntimeError {
public:
    using retrypool::error::RuntimeError::RuntimeError;
};

}  // namespace retrypool::scheduler

#define THROW_CONFIGURATION_ERROR(...)                                 \
    throw retrypool::scheduler::ConfigurationError(                    \
        RETRYPOOL_FILE_NAME, RETRYPOOL_FILE_LINE, RETRYPOOL_FUNC_NAME, \
        __VA_ARGS__)

#define THROW_POOL_CLOSED_ERROR(...)                                   \
    throw retrypool::scheduler::PoolClosedError(                       \
        RETRYPOOL_FILE_NAME, RETRYPOOL_FILE_LINE, RETRYPOOL_FUNC_NAME, \
        __VA_ARGS__)

#endif  // RETRYPOOL_SCHEDULER_ERRORS_HPP
