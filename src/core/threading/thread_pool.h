#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace pn {

// Worker count for a batch of `jobCount` independent jobs: never more than
// the jobs or the hardware threads, clamped to [1, 64]. A non-zero
// `requested` overrides the hardware limit.
size_t workerCountFor(size_t jobCount, size_t requested = 0);

// Fixed-size worker pool for running independent nesting jobs concurrently.
// Jobs share no mutable state, so tasks never coordinate with each other.
class ThreadPool {
  public:
    // Workers start immediately and wait for tasks
    explicit ThreadPool(size_t numThreads);

    // Shutdown pool and join all threads (executes remaining tasks)
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Thread-safe. Tasks enqueued after shutdown are dropped.
    void enqueue(std::function<void()> task);

    // Block until the queue is empty and no task is executing
    void waitIdle();

    // Signal shutdown and wait for all workers to finish
    // Remaining queued tasks are executed before threads exit
    void shutdown();

    bool isIdle() const;
    size_t pendingCount() const;
    size_t activeCount() const;
    size_t workerCount() const { return m_workers.size(); }

  private:
    void workerLoop();

    std::vector<std::thread> m_workers;
    std::queue<std::function<void()>> m_taskQueue;
    mutable std::mutex m_mutex;
    std::condition_variable m_condition;
    std::condition_variable m_idleCondition;

    std::atomic<size_t> m_activeCount{0};
    std::atomic<bool> m_shutdown{false};
};

} // namespace pn
