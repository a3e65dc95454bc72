/*
 * logging.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-08-19

Description: spdlog setup helpers for retrypool

**************************************************/

#include "logging.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "retrypool/error/exception.hpp"

#undef ERROR

namespace retrypool::log {

namespace {

auto toSpdlogLevel(LogLevel level) -> spdlog::level::level_enum {
    switch (level) {
        case LogLevel::TRACE:
            return spdlog::level::trace;
        case LogLevel::DEBUG:
            return spdlog::level::debug;
        case LogLevel::INFO:
            return spdlog::level::info;
        case LogLevel::WARN:
            return spdlog::level::warn;
        case LogLevel::ERROR:
            return spdlog::level::err;
        case LogLevel::CRITICAL:
            return spdlog::level::critical;
        case LogLevel::OFF:
            return spdlog::level::off;
        default:
            THROW_INVALID_ARGUMENT("Unknown log level");
    }
}

}  // namespace

std::string logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE:
            return "TRACE";
        case LogLevel::DEBUG:
            return "DEBUG";
        case LogLevel::INFO:
            return "INFO";
        case LogLevel::WARN:
            return "WARN";
        case LogLevel::ERROR:
            return "ERROR";
        case LogLevel::CRITICAL:
            return "CRITICAL";
        case LogLevel::OFF:
            return "OFF";
        default:
            return "UNKNOWN";
    }
}

LogLevel stringToLogLevel(std::string_view levelStr) {
    std::string level(levelStr);
    std::transform(level.begin(), level.end(), level.begin(),
                   [](unsigned char c) { return std::toupper(c); });

    if (level == "TRACE" || level == "T")
        return LogLevel::TRACE;
    if (level == "DEBUG" || level == "D")
        return LogLevel::DEBUG;
    if (level == "INFO" || level == "I")
        return LogLevel::INFO;
    if (level == "WARN" || level == "WARNING" || level == "W")
        return LogLevel::WARN;
    if (level == "ERROR" || level == "ERR" || level == "E")
        return LogLevel::ERROR;
    if (level == "CRITICAL" || level == "CRIT" || level == "C" ||
        level == "FATAL")
        return LogLevel::CRITICAL;
    if (level == "OFF")
        return LogLevel::OFF;

    return LogLevel::UNKNOWN;
}

std::shared_ptr<spdlog::logger> initLogging(const LoggingOptions &options) {
    if (options.pattern.empty()) {
        THROW_INVALID_ARGUMENT("Log pattern must not be empty");
    }
    auto level = toSpdlogLevel(options.level);

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (options.filePath) {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
            *options.filePath, true));
    }

    auto logger = std::make_shared<spdlog::logger>(options.name, sinks.begin(),
                                                   sinks.end());
    logger->set_pattern(options.pattern);
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);

    spdlog::debug("Logging initialised at level {}",
                  logLevelToString(options.level));
    return logger;
}

void setLevel(LogLevel level) { spdlog::set_level(toSpdlogLevel(level)); }

}  // namespace retrypool::log
