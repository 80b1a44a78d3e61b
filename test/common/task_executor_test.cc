#include <gtest/gtest.h>
#include "../../src/common/task_executor.h"
#include <atomic>
#include <stdexcept>
#include <vector>

using namespace Lockstep;

TEST(TaskExecutorTest, FuturesCarryResultsInSubmissionOrder) {
    TaskExecutor executor(4);
    EXPECT_EQ(executor.num_threads(), 4u);

    std::vector<std::future<int>> futures;
    for (int i = 0; i < 32; ++i) {
        futures.push_back(executor.Submit([i]() { return i * i; }));
    }
    for (int i = 0; i < 32; ++i) {
        EXPECT_EQ(futures[i].get(), i * i);
    }
}

TEST(TaskExecutorTest, ExceptionsSurfaceThroughFuture) {
    TaskExecutor executor(2);
    auto failing = executor.Submit([]() -> int { throw std::runtime_error("bad"); });
    auto fine = executor.Submit([]() { return 1; });

    EXPECT_THROW(failing.get(), std::runtime_error);
    EXPECT_EQ(fine.get(), 1);
}

TEST(TaskExecutorTest, StopDrainsQueuedWork) {
    std::atomic<int> ran{0};
    {
        TaskExecutor executor(1);
        for (int i = 0; i < 10; ++i) {
            executor.Submit([&ran]() { ++ran; });
        }
        executor.Stop();
    }
    EXPECT_EQ(ran.load(), 10);
}

TEST(TaskExecutorTest, ZeroThreadsStillRunsWork) {
    TaskExecutor executor(0);
    EXPECT_EQ(executor.num_threads(), 1u);
    EXPECT_EQ(executor.Submit([]() { return 5; }).get(), 5);
}
