#include "threadpool/ThreadPool.hpp"

ThreadPool::ThreadPool(int threads)
    : stop(false)
{
    if (threads < 1) {
        throw std::invalid_argument("ThreadPool requires at least one worker");
    }

    for (int i = 0; i < threads; ++i) {
        workers.emplace_back([this]() {
            workerLoop();
        });
    }
}

ThreadPool::~ThreadPool() {
    {
        std::lock_guard<std::mutex> lock(queueMutex);
        stop.store(true, std::memory_order_relaxed);
    }
    cv.notify_all();

    // queued tasks are drained before the workers exit
    for (auto& w : workers) {
        if (w.joinable()) {
            w.join();
        }
    }
}

void ThreadPool::workerLoop() {
    while (true) {
        std::function<void()> job;

        {
            std::unique_lock<std::mutex> lock(queueMutex);
            cv.wait(lock, [this]() {
                return stop.load(std::memory_order_relaxed) || !tasks.empty();
            });
            if (tasks.empty()) {
                return;
            }
            job = std::move(tasks.front());
            tasks.pop();
        }

        // packaged_task stores any exception in its future
        job();
        pendingTasks.fetch_sub(1, std::memory_order_relaxed);
    }
}
