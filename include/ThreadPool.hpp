#pragma once
#include <vector>
#include <thread>
#include <queue>
#include <functional>
#include <mutex>
#include <condition_variable>
#include <atomic>

class ThreadPool
{
public:
    // maxQueued bounds the backlog accepted by tryPost; 0 means unbounded.
    explicit ThreadPool(std::size_t threadCount, std::size_t maxQueued = 0);
    ~ThreadPool();

    // Enqueues a task for execution; returns immediately.
    void post(std::function<void()> task);
    // Enqueues unless the backlog is full or the pool is stopping.
    bool tryPost(std::function<void()> task);
    // Number of tasks waiting for a worker.
    std::size_t pending();
    // Blocks until all queued tasks are finished.
    void wait();
private:
    void workerLoop();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::atomic<bool> stopping_{false};
    std::condition_variable done_cv_;
    std::size_t active_ = 0;
    std::size_t max_queued_;
};
