#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>

#include "retrypool/log/logging.hpp"
#include "retrypool/scheduler/run_concurrently.hpp"
#include "retrypool/scheduler/scheduler.hpp"

using namespace retrypool::scheduler;
using namespace std::chrono_literals;

// Prints every lifecycle event of the pool
class ConsoleObserver : public SchedulerObserver<std::string> {
public:
    void onAdmitted(TaskId id, std::uint32_t attempt) override {
        std::cout << "  task " << id << " admitted (attempt " << attempt
                  << ")\n";
    }
    void onSucceeded(TaskId id, const std::string& value) override {
        std::cout << "  task " << id << " succeeded: " << value << "\n";
    }
    void onRetryScheduled(TaskId id, const TaskError& error,
                          std::chrono::milliseconds delay) override {
        std::cout << "  task " << id << " failed (" << error
                  << "), retry in " << delay.count() << "ms\n";
    }
    void onAbandoned(TaskId id, const TaskError& error) override {
        std::cout << "  task " << id << " abandoned: " << error << "\n";
    }
};

auto sleepThen(std::chrono::milliseconds delay, std::string value)
    -> TaskFn<std::string> {
    return [delay, value]() -> TaskResult<std::string> {
        std::this_thread::sleep_for(delay);
        return value;
    };
}

// Example 1: a mixed batch with one task that never succeeds
void mixedBatchExample() {
    std::cout << "\n===== Example 1: Mixed batch =====\n";
    Scheduler<std::string> scheduler(configure(2, 2, constantBackoff(50ms)));
    scheduler.addObserver(std::make_shared<ConsoleObserver>());

    auto a = scheduler.submit(sleepThen(10ms, "A"));
    auto b = scheduler.submit([]() -> TaskResult<std::string> {
        return fail(TaskError::failure("B always fails"));
    });
    auto c = scheduler.submit(sleepThen(5ms, "C"));

    const auto& result = scheduler.waitForDrain().get();
    std::cout << "drained: " << result.succeeded.size() << " succeeded, "
              << result.failed.size() << " failed\n";
    std::cout << "A=" << result.succeeded.at(a)
              << " C=" << result.succeeded.at(c)
              << " B attempts=" << scheduler.get(b)->attempts << "\n";
    std::cout << "peak concurrency: " << scheduler.peakActiveCount() << "\n";
}

// Example 2: a second submission cycle on the same scheduler
void reuseExample() {
    std::cout << "\n===== Example 2: Reusing a drained pool =====\n";
    Scheduler<std::string> scheduler(configure(3, 1, constantBackoff(0ms)));

    scheduler.submit(sleepThen(5ms, "first"));
    auto firstCycle = scheduler.waitForDrain();
    std::cout << "cycle 1 results: " << firstCycle.get().size() << "\n";

    scheduler.submit(sleepThen(5ms, "second"));
    scheduler.submit(sleepThen(5ms, "third"));
    auto secondCycle = scheduler.waitForDrain();
    std::cout << "cycle 2 results: " << secondCycle.get().size() << "\n";

    auto stats = scheduler.stats();
    std::cout << "stats: succeeded=" << stats.succeeded
              << " abandoned=" << stats.abandoned << " total=" << stats.total
              << "\n";
}

// Example 3: per-attempt timeouts
void timeoutExample() {
    std::cout << "\n===== Example 3: Timeouts =====\n";
    Scheduler<std::string> scheduler(
        configure(1, 2, exponentialBackoff(10ms, 2.0, 100ms)));

    SubmitOptions options;
    options.timeout = 20ms;
    auto id = scheduler.submit(sleepThen(100ms, "too slow"), options);

    const auto& result = scheduler.waitForDrain().get();
    std::cout << "task " << id << ": " << result.failed.at(id) << " after "
              << scheduler.get(id)->attempts << " attempts\n";
}

// Example 4: one-shot batch helper
void batchExample() {
    std::cout << "\n===== Example 4: runConcurrently =====\n";
    std::vector<TaskFn<int>> tasks;
    for (int i = 1; i <= 5; ++i) {
        tasks.emplace_back([i]() -> TaskResult<int> {
            if (i == 4) {
                return fail(TaskError::validation("4 is not allowed"));
            }
            return i * 10;
        });
    }

    auto outcomes = runConcurrently<int>(std::move(tasks), 2, 3,
                                         linearBackoff(5ms, 5ms));
    for (std::size_t i = 0; i < outcomes.size(); ++i) {
        if (outcomes[i].success) {
            std::cout << "  #" << i << " -> " << *outcomes[i].value << "\n";
        } else {
            std::cout << "  #" << i << " -> " << *outcomes[i].error << "\n";
        }
    }
}

// Example 5: waiting on a single task
void taskFutureExample() {
    std::cout << "\n===== Example 5: submitWithFuture =====\n";
    Scheduler<std::string> scheduler(configure(2, 1, constantBackoff(0ms)));

    scheduler.submit(sleepThen(50ms, "slow"));
    auto [id, future] = scheduler.submitWithFuture(sleepThen(5ms, "fast"));

    const auto& record = future.get();
    std::cout << "task " << id << " is " << toString(record.state) << ": "
              << record.result.value_or("") << " (pool still has "
              << scheduler.activeCount() << " active)\n";
}

int main() {
    retrypool::log::LoggingOptions options;
    options.level = retrypool::log::LogLevel::WARN;
    retrypool::log::initLogging(options);

    try {
        mixedBatchExample();
        reuseExample();
        timeoutExample();
        batchExample();
        taskFutureExample();
    } catch (const std::exception& e) {
        spdlog::critical("Example failed: {}", e.what());
        return 1;
    }
    return 0;
}
