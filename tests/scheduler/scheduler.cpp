#include "retrypool/scheduler/scheduler.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace retrypool::scheduler;
using retrypool::async::ManualExecutor;
using namespace std::chrono_literals;
using ::testing::_;
using ::testing::InSequence;

namespace {

template <typename T>
auto ready(const std::shared_future<T>& future) -> bool {
    return future.wait_for(0ms) == std::future_status::ready;
}

auto succeedWith(int value) -> TaskFn<int> {
    return [value]() -> TaskResult<int> { return value; };
}

auto alwaysFail(std::shared_ptr<std::atomic<int>> calls) -> TaskFn<int> {
    return [calls]() -> TaskResult<int> {
        ++*calls;
        return fail(TaskError::failure("always fails"));
    };
}

class MockObserver : public SchedulerObserver<int> {
public:
    MOCK_METHOD(void, onAdmitted, (TaskId, std::uint32_t), (override));
    MOCK_METHOD(void, onSucceeded, (TaskId, const int&), (override));
    MOCK_METHOD(void, onRetryScheduled,
                (TaskId, const TaskError&, std::chrono::milliseconds),
                (override));
    MOCK_METHOD(void, onAbandoned, (TaskId, const TaskError&), (override));
    MOCK_METHOD(void, onDrained, (const DrainResult<int>&), (override));
};

class RecordingObserver : public SchedulerObserver<int> {
public:
    RecordingObserver(std::string name, std::vector<std::string>& log)
        : name_(std::move(name)), log_(log) {}

    void onAdmitted(TaskId id, std::uint32_t attempt) override {
        log_.push_back(name_ + ":admit:" + std::to_string(id) + "#" +
                       std::to_string(attempt));
    }
    void onSucceeded(TaskId id, const int&) override {
        log_.push_back(name_ + ":ok:" + std::to_string(id));
    }

private:
    std::string name_;
    std::vector<std::string>& log_;
};

}  // namespace

/**
 * Scheduler driven by a ManualExecutor: every job runs on the test thread
 * when the test pumps the executor, so interleavings are deterministic.
 */
class SchedulerTest : public ::testing::Test {
protected:
    void SetUp() override { executor = std::make_shared<ManualExecutor>(); }

    auto makeScheduler(int maxConcurrency, int maxAttempts,
                       std::chrono::milliseconds backoff = 0ms)
        -> std::unique_ptr<Scheduler<int>> {
        return std::make_unique<Scheduler<int>>(
            configure(maxConcurrency, maxAttempts, constantBackoff(backoff)),
            executor);
    }

    std::shared_ptr<ManualExecutor> executor;
};

TEST_F(SchedulerTest, MaxConcurrencyOne_RunsSequentiallyInSubmissionOrder) {
    auto scheduler = makeScheduler(1, 1);
    std::vector<int> order;
    for (int i = 0; i < 5; ++i) {
        scheduler->submit([&, i]() -> TaskResult<int> {
            EXPECT_EQ(scheduler->activeCount(), 1u);
            order.push_back(i);
            return i;
        });
    }
    EXPECT_EQ(executor->pending(), 1u);

    executor->runAll();

    EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3, 4}));
    EXPECT_EQ(scheduler->peakActiveCount(), 1u);
    auto drained = scheduler->waitForDrain();
    ASSERT_TRUE(ready(drained));
    EXPECT_EQ(drained.get().succeeded.size(), 5u);
}

TEST_F(SchedulerTest, Submit_AdmitsUpToMaxConcurrency) {
    auto scheduler = makeScheduler(3, 1);
    for (int i = 0; i < 10; ++i) {
        scheduler->submit([&, i]() -> TaskResult<int> {
            EXPECT_LE(scheduler->activeCount(), 3u);
            return i;
        });
    }
    EXPECT_EQ(executor->pending(), 3u);
    EXPECT_EQ(scheduler->stats(), (Stats{7, 3, 0, 0, 10}));

    EXPECT_EQ(executor->runAll(), 10u);
    EXPECT_EQ(scheduler->peakActiveCount(), 3u);
    EXPECT_EQ(scheduler->stats(), (Stats{0, 0, 10, 0, 10}));
}

TEST_F(SchedulerTest, Stats_TrackProgress) {
    auto scheduler = makeScheduler(2, 1);
    for (int i = 0; i < 5; ++i) {
        scheduler->submit(succeedWith(i));
    }
    EXPECT_EQ(scheduler->stats(), (Stats{3, 2, 0, 0, 5}));

    ASSERT_TRUE(executor->runOne());
    EXPECT_EQ(scheduler->stats(), (Stats{2, 2, 1, 0, 5}));
}

TEST_F(SchedulerTest, FailingTask_RunsExactlyMaxAttempts) {
    auto scheduler = makeScheduler(1, 3);
    auto calls = std::make_shared<std::atomic<int>>(0);
    auto id = scheduler->submit(alwaysFail(calls));

    executor->runAll();

    EXPECT_EQ(calls->load(), 3);
    auto record = scheduler->get(id);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->state, TaskState::Abandoned);
    EXPECT_EQ(record->attempts, 3u);
    ASSERT_TRUE(record->lastError.has_value());
    EXPECT_EQ(record->lastError->kind, ErrorKind::Failure);
    EXPECT_FALSE(record->result.has_value());
}

TEST_F(SchedulerTest, RetriedTask_ReentersAtTailOfQueue) {
    auto scheduler = makeScheduler(1, 2);
    std::vector<std::string> order;
    bool failedOnce = false;
    scheduler->submit([&]() -> TaskResult<int> {
        order.push_back("A");
        if (!failedOnce) {
            failedOnce = true;
            return fail(TaskError::failure("transient"));
        }
        return 1;
    });
    scheduler->submit([&]() -> TaskResult<int> {
        order.push_back("B");
        return 2;
    });
    scheduler->submit([&]() -> TaskResult<int> {
        order.push_back("C");
        return 3;
    });

    executor->runAll();

    EXPECT_EQ(order, (std::vector<std::string>{"A", "B", "C", "A"}));
    auto drained = scheduler->waitForDrain();
    ASSERT_TRUE(ready(drained));
    EXPECT_EQ(drained.get().succeeded.size(), 3u);
    EXPECT_EQ(scheduler->get(1)->attempts, 2u);
}

TEST_F(SchedulerTest, SucceedingRetry_KeepsIdAndStoresValue) {
    auto scheduler = makeScheduler(2, 3);
    int calls = 0;
    auto id = scheduler->submit([&]() -> TaskResult<int> {
        if (++calls < 3) {
            return fail(TaskError::failure("not yet"));
        }
        return 99;
    });

    executor->runAll();

    auto record = scheduler->get(id);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->state, TaskState::Succeeded);
    EXPECT_EQ(record->attempts, 3u);
    ASSERT_TRUE(record->result.has_value());
    EXPECT_EQ(*record->result, 99);
    auto drained = scheduler->waitForDrain().get();
    EXPECT_EQ(drained.succeeded.at(id), 99);
    EXPECT_TRUE(drained.failed.empty());
}

TEST_F(SchedulerTest, ThrowingTask_IsRecordedAsException) {
    auto scheduler = makeScheduler(1, 1);
    auto id = scheduler->submit(
        []() -> TaskResult<int> { throw std::runtime_error("boom"); });

    executor->runAll();

    auto failed = scheduler->waitForDrain().get().failed;
    ASSERT_TRUE(failed.contains(id));
    EXPECT_EQ(failed.at(id), TaskError::exception("boom"));
}

TEST_F(SchedulerTest, ValidationFailure_IsNotRetried) {
    auto scheduler = makeScheduler(1, 5);
    int calls = 0;
    auto id = scheduler->submit([&]() -> TaskResult<int> {
        ++calls;
        return fail(TaskError::validation("bad input"));
    });

    executor->runAll();

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(scheduler->get(id)->attempts, 1u);
    EXPECT_EQ(scheduler->get(id)->lastError->kind, ErrorKind::Validation);
}

TEST_F(SchedulerTest, EmptyScheduler_IsDrainedImmediately) {
    auto scheduler = makeScheduler(2, 1);
    auto drained = scheduler->waitForDrain();
    ASSERT_TRUE(ready(drained));
    EXPECT_EQ(drained.get().size(), 0u);
    EXPECT_TRUE(scheduler->isDrained());
}

TEST_F(SchedulerTest, WaitForDrain_ResolvesOnlyWhenAllWorkIsTerminal) {
    auto scheduler = makeScheduler(1, 1);
    scheduler->submit(succeedWith(1));
    scheduler->submit(succeedWith(2));

    auto drained = scheduler->waitForDrain();
    EXPECT_FALSE(ready(drained));
    ASSERT_TRUE(executor->runOne());
    EXPECT_FALSE(ready(drained));
    EXPECT_FALSE(scheduler->isDrained());
    ASSERT_TRUE(executor->runOne());

    ASSERT_TRUE(ready(drained));
    EXPECT_EQ(drained.get().succeeded.size(), 2u);
}

TEST_F(SchedulerTest, WaitForDrain_IsIdempotent) {
    auto scheduler = makeScheduler(2, 1);
    int calls = 0;
    scheduler->submit([&]() -> TaskResult<int> { return ++calls; });
    executor->runAll();

    auto first = scheduler->waitForDrain();
    auto second = scheduler->waitForDrain();
    ASSERT_TRUE(ready(first));
    ASSERT_TRUE(ready(second));
    EXPECT_EQ(&first.get(), &second.get());
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(executor->pending(), 0u);
}

TEST_F(SchedulerTest, SubmitAfterDrain_StartsNewCycle) {
    auto scheduler = makeScheduler(2, 1);
    scheduler->submit(succeedWith(1));
    executor->runAll();
    auto firstCycle = scheduler->waitForDrain();
    ASSERT_TRUE(ready(firstCycle));

    auto id = scheduler->submit(succeedWith(2));
    auto secondCycle = scheduler->waitForDrain();
    EXPECT_FALSE(ready(secondCycle));
    EXPECT_EQ(firstCycle.get().size(), 1u);

    executor->runAll();
    ASSERT_TRUE(ready(secondCycle));
    EXPECT_EQ(secondCycle.get().size(), 2u);
    EXPECT_EQ(secondCycle.get().succeeded.at(id), 2);
}

TEST_F(SchedulerTest, Close_RejectsSubmissionsButFinishesQueuedWork) {
    auto scheduler = makeScheduler(1, 1);
    scheduler->submit(succeedWith(1));
    scheduler->submit(succeedWith(2));
    scheduler->close();
    scheduler->close();

    EXPECT_TRUE(scheduler->isClosed());
    EXPECT_THROW(scheduler->submit(succeedWith(3)), PoolClosedError);

    executor->runAll();
    auto drained = scheduler->waitForDrain();
    ASSERT_TRUE(ready(drained));
    EXPECT_EQ(drained.get().succeeded.size(), 2u);
    EXPECT_EQ(scheduler->stats().total, 2u);
}

TEST_F(SchedulerTest, Cancel_QueuedTaskNeverRuns) {
    auto scheduler = makeScheduler(1, 1);
    bool bRan = false;
    auto a = scheduler->submit(succeedWith(1));
    auto b = scheduler->submit([&]() -> TaskResult<int> {
        bRan = true;
        return 2;
    });

    EXPECT_TRUE(scheduler->cancel(b));
    auto record = scheduler->get(b);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->state, TaskState::Abandoned);
    EXPECT_EQ(record->attempts, 0u);
    EXPECT_EQ(record->lastError->kind, ErrorKind::Cancelled);

    executor->runAll();
    EXPECT_FALSE(bRan);
    EXPECT_FALSE(scheduler->cancel(a));
    EXPECT_FALSE(scheduler->cancel(b));
    EXPECT_FALSE(scheduler->cancel(4242));

    auto drained = scheduler->waitForDrain().get();
    EXPECT_TRUE(drained.succeeded.contains(a));
    EXPECT_TRUE(drained.failed.contains(b));
}

TEST_F(SchedulerTest, Cancel_RunningTaskDiscardsItsOutcome) {
    auto scheduler = makeScheduler(1, 1);
    int calls = 0;
    auto id = scheduler->submit([&]() -> TaskResult<int> {
        ++calls;
        return 5;
    });

    EXPECT_FALSE(scheduler->cancel(id));
    executor->runAll();

    EXPECT_EQ(calls, 1);
    auto record = scheduler->get(id);
    EXPECT_EQ(record->state, TaskState::Abandoned);
    EXPECT_EQ(record->lastError->kind, ErrorKind::Cancelled);
    EXPECT_FALSE(record->result.has_value());
    EXPECT_TRUE(scheduler->waitForDrain().get().succeeded.empty());
}

TEST_F(SchedulerTest, CallerSuppliedIds_AreHonouredAndUnique) {
    auto scheduler = makeScheduler(2, 1);
    EXPECT_EQ(scheduler->submit(succeedWith(1), 42), 42u);
    EXPECT_THROW(scheduler->submit(succeedWith(2), 42),
                 retrypool::error::InvalidArgument);
    EXPECT_THROW(scheduler->submit(succeedWith(2), INVALID_TASK_ID),
                 retrypool::error::InvalidArgument);

    EXPECT_EQ(scheduler->submit(succeedWith(3), 1), 1u);
    EXPECT_EQ(scheduler->submit(succeedWith(4)), 2u);

    executor->runAll();
    // Terminal ids stay reserved until the results are reset.
    EXPECT_THROW(scheduler->submit(succeedWith(5), 42),
                 retrypool::error::InvalidArgument);
}

TEST_F(SchedulerTest, Submit_RejectsEmptyTaskAndBadTimeout) {
    auto scheduler = makeScheduler(1, 1);
    EXPECT_THROW(scheduler->submit(TaskFn<int>{}),
                 retrypool::error::InvalidArgument);

    SubmitOptions options;
    options.timeout = 0ms;
    EXPECT_THROW(scheduler->submit(succeedWith(1), options),
                 retrypool::error::InvalidArgument);
    EXPECT_EQ(scheduler->stats().total, 0u);
}

TEST_F(SchedulerTest, InvalidConfig_ThrowsConfigurationError) {
    SchedulerConfig zeroConcurrency;
    zeroConcurrency.maxConcurrency = 0;
    EXPECT_THROW((Scheduler<int>(zeroConcurrency, executor)),
                 ConfigurationError);

    SchedulerConfig zeroAttempts;
    zeroAttempts.maxAttempts = 0;
    EXPECT_THROW((Scheduler<int>(zeroAttempts, executor)),
                 ConfigurationError);
}

TEST_F(SchedulerTest, RetryAbandoned_RequeuesWithFreshBudget) {
    auto scheduler = makeScheduler(1, 1);
    int calls = 0;
    auto id = scheduler->submit([&]() -> TaskResult<int> {
        if (++calls == 1) {
            return fail(TaskError::failure("first run fails"));
        }
        return 7;
    });
    executor->runAll();
    ASSERT_EQ(scheduler->get(id)->state, TaskState::Abandoned);

    EXPECT_EQ(scheduler->retryAbandoned(), 1u);
    auto drained = scheduler->waitForDrain();
    EXPECT_FALSE(ready(drained));
    executor->runAll();

    auto record = scheduler->get(id);
    EXPECT_EQ(record->state, TaskState::Succeeded);
    EXPECT_EQ(record->attempts, 1u);
    ASSERT_TRUE(ready(drained));
    EXPECT_EQ(drained.get().succeeded.at(id), 7);
    EXPECT_TRUE(drained.get().failed.empty());
    EXPECT_EQ(scheduler->retryAbandoned(), 0u);
}

TEST_F(SchedulerTest, RetryAbandoned_SkipsCancelledTasks) {
    auto scheduler = makeScheduler(1, 1);
    scheduler->submit(succeedWith(1));
    auto cancelled = scheduler->submit(succeedWith(2));
    ASSERT_TRUE(scheduler->cancel(cancelled));
    executor->runAll();

    EXPECT_EQ(scheduler->retryAbandoned(), 0u);
    EXPECT_EQ(scheduler->get(cancelled)->state, TaskState::Abandoned);
}

TEST_F(SchedulerTest, RetryAbandoned_AfterCloseThrows) {
    auto scheduler = makeScheduler(1, 1);
    scheduler->close();
    EXPECT_THROW(scheduler->retryAbandoned(), PoolClosedError);
}

TEST_F(SchedulerTest, ResetResults_ForgetsTerminalRecords) {
    auto scheduler = makeScheduler(1, 1);
    auto id = scheduler->submit(succeedWith(1));
    executor->runAll();
    ASSERT_EQ(scheduler->stats().succeeded, 1u);

    scheduler->resetResults();
    EXPECT_EQ(scheduler->stats(), Stats{});
    EXPECT_FALSE(scheduler->get(id).has_value());
    EXPECT_EQ(scheduler->submit(succeedWith(2), id), id);
}

TEST_F(SchedulerTest, Observer_ReceivesLifecycleEventsInOrder) {
    auto scheduler = makeScheduler(1, 2);
    auto observer = std::make_shared<MockObserver>();
    {
        InSequence sequence;
        EXPECT_CALL(*observer, onAdmitted(1, 1u));
        EXPECT_CALL(*observer, onRetryScheduled(1, _, 0ms));
        EXPECT_CALL(*observer, onAdmitted(1, 2u));
        EXPECT_CALL(*observer, onAbandoned(1, TaskError::failure("nope")));
        EXPECT_CALL(*observer, onDrained(_));
    }
    scheduler->addObserver(observer);

    scheduler->submit(
        []() -> TaskResult<int> { return fail(TaskError::failure("nope")); });
    executor->runAll();
}

TEST_F(SchedulerTest, Observers_AreCalledInRegistrationOrder) {
    auto scheduler = makeScheduler(1, 1);
    std::vector<std::string> log;
    scheduler->addObserver(std::make_shared<RecordingObserver>("first", log));
    scheduler->addObserver(std::make_shared<RecordingObserver>("second", log));

    scheduler->submit(succeedWith(3));
    executor->runAll();

    EXPECT_EQ(log, (std::vector<std::string>{"first:admit:1#1",
                                             "second:admit:1#1", "first:ok:1",
                                             "second:ok:1"}));
}

TEST_F(SchedulerTest, ThrowingObserver_DoesNotDisturbScheduling) {
    class Throwing : public SchedulerObserver<int> {
    public:
        void onSucceeded(TaskId, const int&) override {
            throw std::runtime_error("observer failure");
        }
    };
    auto scheduler = makeScheduler(1, 1);
    scheduler->addObserver(std::make_shared<Throwing>());
    EXPECT_THROW(scheduler->addObserver(nullptr),
                 retrypool::error::InvalidArgument);

    scheduler->submit(succeedWith(1));
    scheduler->submit(succeedWith(2));
    executor->runAll();

    EXPECT_EQ(scheduler->stats().succeeded, 2u);
}

TEST_F(SchedulerTest, RejectingExecutor_AbandonsTask) {
    auto scheduler = makeScheduler(1, 1);
    executor->shutdown();

    auto id = scheduler->submit(succeedWith(1));

    auto record = scheduler->get(id);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->state, TaskState::Abandoned);
    EXPECT_EQ(record->lastError->kind, ErrorKind::Exception);
    EXPECT_TRUE(ready(scheduler->waitForDrain()));
}

TEST_F(SchedulerTest, CustomRetryPolicy_IsConsulted) {
    class RetryTimeoutsOnly : public RetryPolicy {
    public:
        auto decide(std::uint32_t attempt, const TaskError& error) const
            -> RetryDecision override {
            return {error.isTimeout() && attempt < 4, 0ms};
        }
    };
    Scheduler<int> scheduler(configure(1, 1, constantBackoff(0ms)),
                             std::make_shared<RetryTimeoutsOnly>(), executor);
    auto timeouts = std::make_shared<int>(0);
    auto id = scheduler.submit([timeouts]() -> TaskResult<int> {
        ++*timeouts;
        return fail(TaskError::timeout("simulated"));
    });

    executor->runAll();

    EXPECT_EQ(*timeouts, 4);
    EXPECT_EQ(scheduler.get(id)->attempts, 4u);
}

TEST_F(SchedulerTest, DestroyedScheduler_SkipsPendingJobs) {
    auto calls = std::make_shared<std::atomic<int>>(0);
    {
        auto scheduler = makeScheduler(2, 1);
        scheduler->submit([calls]() -> TaskResult<int> {
            ++*calls;
            return 1;
        });
        ASSERT_EQ(executor->pending(), 1u);
    }

    executor->runAll();

    EXPECT_EQ(calls->load(), 0);
}

TEST_F(SchedulerTest, SubmitWithFuture_ResolvesWithOwnRecord) {
    auto scheduler = makeScheduler(1, 1);
    auto [first, firstFuture] = scheduler->submitWithFuture(succeedWith(10));
    auto [second, secondFuture] = scheduler->submitWithFuture(succeedWith(20));
    EXPECT_FALSE(ready(firstFuture));

    ASSERT_TRUE(executor->runOne());

    ASSERT_TRUE(ready(firstFuture));
    EXPECT_FALSE(ready(secondFuture));
    const auto& record = firstFuture.get();
    EXPECT_EQ(record.id, first);
    EXPECT_EQ(record.state, TaskState::Succeeded);
    ASSERT_TRUE(record.result.has_value());
    EXPECT_EQ(*record.result, 10);
    EXPECT_EQ(record.attempts, 1u);

    executor->runAll();
    ASSERT_TRUE(ready(secondFuture));
    EXPECT_EQ(secondFuture.get().id, second);
    EXPECT_EQ(secondFuture.get().result.value_or(0), 20);
}

TEST_F(SchedulerTest, SubmitWithFuture_ResolvesAbandonedRecord) {
    auto scheduler = makeScheduler(1, 2);
    auto calls = std::make_shared<std::atomic<int>>(0);
    auto [failing, failingFuture] =
        scheduler->submitWithFuture(alwaysFail(calls));
    auto [queued, queuedFuture] = scheduler->submitWithFuture(succeedWith(1));

    ASSERT_TRUE(scheduler->cancel(queued));
    ASSERT_TRUE(ready(queuedFuture));
    EXPECT_EQ(queuedFuture.get().state, TaskState::Abandoned);
    EXPECT_EQ(queuedFuture.get().lastError->kind, ErrorKind::Cancelled);

    executor->runAll();

    ASSERT_TRUE(ready(failingFuture));
    const auto& record = failingFuture.get();
    EXPECT_EQ(record.id, failing);
    EXPECT_EQ(record.state, TaskState::Abandoned);
    EXPECT_EQ(record.attempts, 2u);
    EXPECT_FALSE(record.result.has_value());
    EXPECT_EQ(record.lastError->kind, ErrorKind::Failure);
}

TEST_F(SchedulerTest, SubmitWithFuture_KeepsFirstRecordAfterRetryAbandoned) {
    auto scheduler = makeScheduler(1, 1);
    int calls = 0;
    auto [id, future] = scheduler->submitWithFuture([&]() -> TaskResult<int> {
        if (++calls == 1) {
            return fail(TaskError::failure("first run fails"));
        }
        return 3;
    });
    executor->runAll();
    ASSERT_TRUE(ready(future));

    ASSERT_EQ(scheduler->retryAbandoned(), 1u);
    executor->runAll();

    EXPECT_EQ(future.get().state, TaskState::Abandoned);
    EXPECT_EQ(scheduler->get(id)->state, TaskState::Succeeded);
}

TEST_F(SchedulerTest, SubmitWithFuture_BrokenWhenSchedulerDestroyed) {
    Scheduler<int>::RecordFuture runningFuture;
    Scheduler<int>::RecordFuture queuedFuture;
    {
        auto scheduler = makeScheduler(1, 1);
        runningFuture = scheduler->submitWithFuture(succeedWith(1)).second;
        queuedFuture = scheduler->submitWithFuture(succeedWith(2)).second;
    }
    executor->runAll();

    for (const auto& future : {runningFuture, queuedFuture}) {
        ASSERT_TRUE(ready(future));
        try {
            future.get();
            FAIL() << "expected a broken promise";
        } catch (const std::future_error& e) {
            EXPECT_EQ(e.code(), std::future_errc::broken_promise);
        }
    }
}

TEST_F(SchedulerTest, SubmitWithFuture_AfterCloseThrows) {
    auto scheduler = makeScheduler(1, 1);
    scheduler->close();
    EXPECT_THROW(scheduler->submitWithFuture(succeedWith(1)), PoolClosedError);
}

/**
 * Scheduler on its own ThreadExecutor with real timing.
 */
class ThreadedSchedulerTest : public ::testing::Test {
protected:
    static constexpr auto kDrainTimeout = 5s;
};

TEST_F(ThreadedSchedulerTest, MixedBatch_DrainsWithRetries) {
    std::atomic<int> bCalls{0};
    std::atomic<int> inFlight{0};
    std::atomic<int> maxInFlight{0};
    Scheduler<std::string> scheduler(configure(2, 2, constantBackoff(50ms)));

    auto track = [&](auto body) {
        return [&, body]() -> TaskResult<std::string> {
            int now = ++inFlight;
            int seen = maxInFlight.load();
            while (now > seen && !maxInFlight.compare_exchange_weak(seen, now)) {
            }
            auto result = body();
            --inFlight;
            return result;
        };
    };

    auto start = std::chrono::steady_clock::now();
    auto a = scheduler.submit(track([]() -> TaskResult<std::string> {
        std::this_thread::sleep_for(10ms);
        return std::string("A");
    }));
    auto b = scheduler.submit(track([&]() -> TaskResult<std::string> {
        ++bCalls;
        return fail(TaskError::failure("B always fails"));
    }));
    auto c = scheduler.submit(track([]() -> TaskResult<std::string> {
        std::this_thread::sleep_for(5ms);
        return std::string("C");
    }));

    auto drained = scheduler.waitForDrain();
    ASSERT_EQ(drained.wait_for(kDrainTimeout), std::future_status::ready);
    auto elapsed = std::chrono::steady_clock::now() - start;

    const auto& result = drained.get();
    EXPECT_EQ(result.succeeded.at(a), "A");
    EXPECT_EQ(result.succeeded.at(c), "C");
    ASSERT_TRUE(result.failed.contains(b));
    EXPECT_EQ(result.failed.at(b).kind, ErrorKind::Failure);
    EXPECT_EQ(bCalls.load(), 2);
    EXPECT_EQ(scheduler.get(b)->attempts, 2u);
    EXPECT_GE(elapsed, 50ms);
    EXPECT_LE(maxInFlight.load(), 2);
    EXPECT_LE(scheduler.peakActiveCount(), 2u);
}

TEST_F(ThreadedSchedulerTest, ManyTasks_NeverExceedConcurrencyLimit) {
    std::atomic<int> inFlight{0};
    std::atomic<int> maxInFlight{0};
    std::mutex mutex;
    std::vector<int> attemptsSeen(100, 0);
    Scheduler<int> scheduler(configure(4, 3, constantBackoff(1ms)));

    for (int i = 0; i < 100; ++i) {
        scheduler.submit([&, i]() -> TaskResult<int> {
            int now = ++inFlight;
            int seen = maxInFlight.load();
            while (now > seen && !maxInFlight.compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(1ms);
            bool failThisTime = false;
            {
                std::scoped_lock lock(mutex);
                failThisTime = i % 3 == 0 && attemptsSeen[i]++ == 0;
            }
            --inFlight;
            if (failThisTime) {
                return fail(TaskError::failure("first attempt fails"));
            }
            return i;
        });
    }
    scheduler.close();

    auto drained = scheduler.waitForDrain();
    ASSERT_EQ(drained.wait_for(kDrainTimeout), std::future_status::ready);
    EXPECT_EQ(drained.get().succeeded.size(), 100u);
    EXPECT_LE(maxInFlight.load(), 4);
    EXPECT_LE(scheduler.peakActiveCount(), 4u);
    EXPECT_EQ(scheduler.stats(), (Stats{0, 0, 100, 0, 100}));
}

TEST_F(ThreadedSchedulerTest, SlowAttempt_TimesOutAndIsRetried) {
    std::atomic<int> calls{0};
    Scheduler<int> scheduler(configure(1, 2, constantBackoff(0ms)));
    SubmitOptions options;
    options.timeout = 20ms;
    auto id = scheduler.submit(
        [&]() -> TaskResult<int> {
            ++calls;
            std::this_thread::sleep_for(150ms);
            return 1;
        },
        options);

    auto drained = scheduler.waitForDrain();
    ASSERT_EQ(drained.wait_for(kDrainTimeout), std::future_status::ready);
    ASSERT_TRUE(drained.get().failed.contains(id));
    EXPECT_TRUE(drained.get().failed.at(id).isTimeout());
    EXPECT_EQ(scheduler.get(id)->attempts, 2u);

    // Late completions of timed-out attempts are ignored.
    std::this_thread::sleep_for(300ms);
    EXPECT_EQ(calls.load(), 2);
    EXPECT_EQ(scheduler.get(id)->state, TaskState::Abandoned);
    EXPECT_EQ(scheduler.stats().succeeded, 0u);
}

TEST_F(ThreadedSchedulerTest, Cancel_DuringBackoffAbandonsTask) {
    std::atomic<int> calls{0};
    Scheduler<int> scheduler(configure(1, 3, constantBackoff(200ms)));
    auto id = scheduler.submit([&]() -> TaskResult<int> {
        ++calls;
        return fail(TaskError::failure("retry me"));
    });

    while (calls.load() == 0 || scheduler.get(id)->state != TaskState::Failed) {
        std::this_thread::sleep_for(1ms);
    }
    EXPECT_FALSE(scheduler.cancel(id));

    auto drained = scheduler.waitForDrain();
    ASSERT_EQ(drained.wait_for(kDrainTimeout), std::future_status::ready);
    EXPECT_EQ(calls.load(), 1);
    EXPECT_EQ(drained.get().failed.at(id).kind, ErrorKind::Cancelled);
}

TEST_F(ThreadedSchedulerTest, ConcurrentWaiters_ShareOneSnapshot) {
    Scheduler<int> scheduler(configure(2, 1, constantBackoff(0ms)));
    for (int i = 0; i < 6; ++i) {
        scheduler.submit([i]() -> TaskResult<int> {
            std::this_thread::sleep_for(5ms);
            return i;
        });
    }

    std::vector<const DrainResult<int>*> seen(4, nullptr);
    std::vector<std::thread> waiters;
    for (std::size_t i = 0; i < seen.size(); ++i) {
        waiters.emplace_back([&, i]() {
            auto future = scheduler.waitForDrain();
            if (future.wait_for(kDrainTimeout) == std::future_status::ready) {
                seen[i] = &future.get();
            }
        });
    }
    for (auto& waiter : waiters) {
        waiter.join();
    }

    ASSERT_NE(seen[0], nullptr);
    for (const auto* snapshot : seen) {
        EXPECT_EQ(snapshot, seen[0]);
    }
    EXPECT_EQ(seen[0]->succeeded.size(), 6u);
}

TEST_F(ThreadedSchedulerTest, Destructor_WaitsForRunningTasks) {
    std::atomic<bool> finished{false};
    {
        Scheduler<int> scheduler(configure(1, 1, constantBackoff(0ms)));
        scheduler.submit([&]() -> TaskResult<int> {
            std::this_thread::sleep_for(30ms);
            finished = true;
            return 0;
        });
        std::this_thread::sleep_for(20ms);
    }
    EXPECT_TRUE(finished);
}

TEST_F(ThreadedSchedulerTest, SubmitWithFuture_ResolvesAcrossThreads) {
    Scheduler<int> scheduler(configure(2, 3, constantBackoff(10ms)));
    std::atomic<int> calls{0};
    auto [id, future] = scheduler.submitWithFuture([&]() -> TaskResult<int> {
        if (++calls < 3) {
            return fail(TaskError::failure("not yet"));
        }
        return 42;
    });

    ASSERT_EQ(future.wait_for(kDrainTimeout), std::future_status::ready);
    EXPECT_EQ(future.get().id, id);
    EXPECT_EQ(future.get().state, TaskState::Succeeded);
    EXPECT_EQ(future.get().result.value_or(0), 42);
    EXPECT_EQ(future.get().attempts, 3u);
}
