#include "thread_pool.h"

#include <algorithm>

namespace pn {

size_t workerCountFor(size_t jobCount, size_t requested) {
    size_t limit = requested;
    if (limit == 0) {
        limit = std::thread::hardware_concurrency();
        if (limit == 0) {
            limit = 4; // Fallback if detection fails
        }
    }

    size_t threadCount = std::min(limit, jobCount);
    return std::max(size_t(1), std::min(size_t(64), threadCount));
}

ThreadPool::ThreadPool(size_t numThreads) {
    m_workers.reserve(numThreads);
    for (size_t i = 0; i < numThreads; ++i) {
        m_workers.emplace_back([this] { workerLoop(); });
    }
}

ThreadPool::~ThreadPool() {
    shutdown();
}

void ThreadPool::enqueue(std::function<void()> task) {
    if (m_shutdown.load()) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_taskQueue.push(std::move(task));
    }
    m_condition.notify_one();
}

void ThreadPool::waitIdle() {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_idleCondition.wait(lock, [this] { return m_taskQueue.empty() && m_activeCount.load() == 0; });
}

void ThreadPool::shutdown() {
    if (m_shutdown.exchange(true)) {
        return; // Already shut down
    }

    m_condition.notify_all();

    for (auto& worker : m_workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

bool ThreadPool::isIdle() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_taskQueue.empty() && m_activeCount.load() == 0;
}

size_t ThreadPool::pendingCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_taskQueue.size();
}

size_t ThreadPool::activeCount() const {
    return m_activeCount.load();
}

void ThreadPool::workerLoop() {
    while (true) {
        std::function<void()> task;

        {
            std::unique_lock<std::mutex> lock(m_mutex);

            m_condition.wait(lock, [this] { return m_shutdown.load() || !m_taskQueue.empty(); });

            // Drain the queue before exiting
            if (m_shutdown.load() && m_taskQueue.empty()) {
                return;
            }

            task = std::move(m_taskQueue.front());
            m_taskQueue.pop();
            // Counted under the lock so waitIdle never sees an empty queue
            // with the task not yet marked active
            m_activeCount.fetch_add(1);
        }

        task();

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_activeCount.fetch_sub(1);
        }
        m_idleCondition.notify_all();
    }
}

} // namespace pn
