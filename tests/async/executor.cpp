#include "retrypool/async/executor.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace retrypool::async;
using namespace std::chrono_literals;

class ManualExecutorTest : public ::testing::Test {
protected:
    ManualExecutor executor;
};

TEST_F(ManualExecutorTest, Post_DoesNotRunInline) {
    bool ran = false;
    executor.post([&]() { ran = true; });
    EXPECT_FALSE(ran);
    EXPECT_EQ(executor.pending(), 1u);

    EXPECT_TRUE(executor.runOne());
    EXPECT_TRUE(ran);
    EXPECT_FALSE(executor.runOne());
}

TEST_F(ManualExecutorTest, RunAll_RunsJobsPostedWhileRunning) {
    std::vector<int> order;
    executor.post([&]() {
        order.push_back(1);
        executor.post([&]() { order.push_back(3); });
    });
    executor.post([&]() { order.push_back(2); });

    EXPECT_EQ(executor.runAll(), 3u);
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(executor.pending(), 0u);
}

TEST_F(ManualExecutorTest, Shutdown_DiscardsPendingAndRejectsNewJobs) {
    bool ran = false;
    executor.post([&]() { ran = true; });
    executor.shutdown();

    EXPECT_EQ(executor.pending(), 0u);
    EXPECT_FALSE(executor.runOne());
    EXPECT_FALSE(ran);
    EXPECT_THROW(executor.post([]() {}), ExecutorShutdownError);
}

TEST(ThreadExecutorTest, Post_RunsOnAnotherThread) {
    ThreadExecutor executor;
    std::atomic<bool> done{false};
    std::thread::id worker;
    executor.post([&]() {
        worker = std::this_thread::get_id();
        done = true;
    });
    executor.shutdown();

    EXPECT_TRUE(done);
    EXPECT_NE(worker, std::this_thread::get_id());
}

TEST(ThreadExecutorTest, Shutdown_JoinsOutstandingJobs) {
    ThreadExecutor executor;
    std::atomic<int> finished{0};
    for (int i = 0; i < 4; ++i) {
        executor.post([&]() {
            std::this_thread::sleep_for(20ms);
            ++finished;
        });
    }
    executor.shutdown();

    EXPECT_EQ(finished.load(), 4);
    EXPECT_EQ(executor.outstanding(), 0u);
    EXPECT_THROW(executor.post([]() {}), ExecutorShutdownError);
}

TEST(ThreadExecutorTest, Post_ReapsFinishedWorkers) {
    ThreadExecutor executor;
    std::atomic<bool> done{false};
    executor.post([&]() { done = true; });
    while (!done) {
        std::this_thread::sleep_for(1ms);
    }
    // The done flag is set after the job returns; give the thread time to
    // publish it.
    std::this_thread::sleep_for(20ms);

    executor.post([]() {});
    EXPECT_LE(executor.outstanding(), 1u);
}
