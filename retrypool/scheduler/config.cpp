/*
 * config.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "config.hpp"

#include <algorithm>
#include <cmath>

#include "retrypool/scheduler/errors.hpp"

namespace retrypool::scheduler {

auto constantBackoff(std::chrono::milliseconds delay) -> BackoffFn {
    if (delay.count() < 0) {
        THROW_CONFIGURATION_ERROR("Backoff delay must be >= 0, got ",
                                  delay.count(), "ms");
    }
    return [delay](std::uint32_t) { return delay; };
}

auto linearBackoff(std::chrono::milliseconds base,
                   std::chrono::milliseconds step) -> BackoffFn {
    if (base.count() < 0 || step.count() < 0) {
        THROW_CONFIGURATION_ERROR("Backoff base and step must be >= 0");
    }
    return [base, step](std::uint32_t attempt) {
        auto steps = static_cast<std::int64_t>(std::max<std::uint32_t>(
                         attempt, 1)) -
                     1;
        return base + step * steps;
    };
}

auto exponentialBackoff(std::chrono::milliseconds base, double factor,
                        std::chrono::milliseconds cap) -> BackoffFn {
    if (base.count() < 0) {
        THROW_CONFIGURATION_ERROR("Backoff base must be >= 0");
    }
    if (!(factor >= 1.0)) {
        THROW_CONFIGURATION_ERROR("Backoff factor must be >= 1, got ", factor);
    }
    if (cap < base) {
        THROW_CONFIGURATION_ERROR("Backoff cap must be >= base");
    }
    return [base, factor, cap](std::uint32_t attempt) {
        auto exponent = static_cast<double>(std::max<std::uint32_t>(attempt, 1)) -
                        1.0;
        double delay =
            static_cast<double>(base.count()) * std::pow(factor, exponent);
        if (!std::isfinite(delay) ||
            delay >= static_cast<double>(cap.count())) {
            return cap;
        }
        return std::chrono::milliseconds(static_cast<std::int64_t>(delay));
    };
}

void SchedulerConfig::validate() const {
    if (maxConcurrency < 1) {
        THROW_CONFIGURATION_ERROR("maxConcurrency must be at least 1, got ",
                                  maxConcurrency);
    }
    if (maxAttempts < 1) {
        THROW_CONFIGURATION_ERROR("maxAttempts must be at least 1, got ",
                                  maxAttempts);
    }
    if (!backoff) {
        THROW_CONFIGURATION_ERROR("backoff function must be set");
    }
}

auto configure(int maxConcurrency, int maxAttempts, BackoffFn backoff)
    -> SchedulerConfig {
    SchedulerConfig config;
    config.maxConcurrency = maxConcurrency;
    config.maxAttempts = maxAttempts;
    config.backoff = std::move(backoff);
    config.validate();
    return config;
}

}  // namespace retrypool::scheduler
