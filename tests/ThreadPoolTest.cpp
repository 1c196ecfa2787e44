#include <gtest/gtest.h>

#include <atomic>
#include <future>
#include <stdexcept>
#include <vector>

#include "threadpool/ThreadPool.hpp"

TEST(ThreadPoolTest, ReturnsTaskResults) {
    ThreadPool pool(3);
    EXPECT_EQ(pool.getWorkerCount(), 3u);

    std::vector<std::future<int>> results;
    for (int i = 0; i < 20; ++i) {
        results.push_back(pool.submit([i]() { return i * i; }));
    }
    for (int i = 0; i < 20; ++i) EXPECT_EQ(results[i].get(), i * i);
}

TEST(ThreadPoolTest, ExceptionsSurfaceFromFuture) {
    ThreadPool pool(1);
    auto f = pool.submit([]() -> int { throw std::runtime_error("task failed"); });
    EXPECT_THROW(f.get(), std::runtime_error);

    // the worker survives a failing task
    EXPECT_EQ(pool.submit([]() { return 7; }).get(), 7);
}

TEST(ThreadPoolTest, DestructorDrainsQueue) {
    std::atomic<int> done{0};
    {
        ThreadPool pool(2);
        for (int i = 0; i < 50; ++i) {
            pool.submit([&done]() { done.fetch_add(1); });
        }
    }
    EXPECT_EQ(done.load(), 50);
}

TEST(ThreadPoolTest, RejectsZeroWorkers) {
    EXPECT_THROW(ThreadPool(0), std::invalid_argument);
}
