// ThreadPool.hpp
#pragma once

#include <vector>
#include <queue>
#include <thread>
#include <atomic>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <condition_variable>

// Fixed-size FIFO worker pool. submit() returns a future; exceptions thrown by
// the task surface from future::get().
class ThreadPool {
public:
    explicit ThreadPool(int threads);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    template <typename F>
    auto submit(F&& fn) -> std::future<decltype(fn())> {
        using R = decltype(fn());
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
        std::future<R> result = task->get_future();

        {
            std::lock_guard<std::mutex> lock(queueMutex);
            if (stop.load(std::memory_order_relaxed)) {
                throw std::runtime_error("ThreadPool is stopping");
            }
            tasks.emplace([task]() { (*task)(); });
            pendingTasks.fetch_add(1, std::memory_order_relaxed);
        }
        cv.notify_one();
        return result;
    }

    std::size_t getWorkerCount() const { return workers.size(); }

    // queued + running
    std::size_t getPendingTaskCount() const {
        return pendingTasks.load(std::memory_order_relaxed);
    }

private:
    void workerLoop();

    std::vector<std::thread> workers;
    std::queue<std::function<void()>> tasks;
    std::atomic<bool> stop{false};

    std::atomic<std::size_t> pendingTasks{0};

    std::condition_variable cv;
    std::mutex queueMutex;
};
