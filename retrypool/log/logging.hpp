/*
 * logging.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-08-19

Description: spdlog setup helpers for retrypool

**************************************************/

#ifndef RETRYPOOL_LOG_LOGGING_HPP
#define RETRYPOOL_LOG_LOGGING_HPP

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace spdlog {
class logger;
}

namespace retrypool::log {

/**
 * @brief Enum representing different log levels.
 */
enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    CRITICAL = 5,
    OFF = 6,
    UNKNOWN = 7
};

/**
 * @brief Convert log level to string.
 */
std::string logLevelToString(LogLevel level);

/**
 * @brief Convert string to log level. Accepts full names and the usual one
 * letter abbreviations, case-insensitively.
 */
LogLevel stringToLogLevel(std::string_view levelStr);

/**
 * @brief Options for the process-wide default logger.
 */
struct LoggingOptions {
    std::string name = "retrypool";
    LogLevel level = LogLevel::INFO;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] [%t] %v";
    std::optional<std::string> filePath;  ///< also log to this file if set
};

/**
 * @brief Installs a colour stdout logger (plus a file sink when requested)
 * as the spdlog default logger and returns it.
 * @throws retrypool::error::InvalidArgument if the level is UNKNOWN or the
 * pattern is empty.
 */
std::shared_ptr<spdlog::logger> initLogging(const LoggingOptions &options);

/**
 * @brief Changes the level of the default logger.
 */
void setLevel(LogLevel level);

}  // namespace retrypool::log

#endif  // RETRYPOOL_LOG_LOGGING_HPP
