#include <gtest/gtest.h>

#include "thread_pool.hpp"

#include <atomic>
#include <stdexcept>

TEST(ThreadPoolTest, RunsEveryJobBeforeWaitReturns) {
    ThreadPool pool(4);
    EXPECT_EQ(pool.size(), 4);

    std::atomic<int> sum{0};
    for (int i = 1; i <= 100; ++i)
        pool.submit([&sum, i] { sum += i; });
    pool.wait();

    EXPECT_EQ(sum.load(), 5050);
}

TEST(ThreadPoolTest, ZeroThreadsMeansHardwareConcurrency) {
    ThreadPool pool(0);
    EXPECT_GE(pool.size(), 1);
}

TEST(ThreadPoolTest, ThrowingJobDoesNotHangWait) {
    ThreadPool pool(2);
    std::atomic<int> done{0};
    pool.submit([] { throw std::runtime_error("boom"); });
    pool.submit([&done] { ++done; });
    pool.submit([] { throw 7; });
    pool.wait();
    EXPECT_EQ(done.load(), 1);
    EXPECT_EQ(pool.failed(), 2);
}
