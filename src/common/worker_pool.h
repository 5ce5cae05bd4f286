#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace Meshwork {

/**
 * Fixed pool of worker threads draining a FIFO task queue.
 * Tasks may block (units calling out to external services); a blocked task
 * only occupies its own worker.
 */
class WorkerPool {
public:
    explicit WorkerPool(size_t num_threads = 4);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Returns false once the pool is stopping.
    bool Submit(std::function<void()> task);

    // Drains queued tasks, then joins every worker.
    void Stop();

    size_t NumThreads() const { return num_threads_; }
    size_t QueueDepth() const;
    size_t BusyWorkers() const { return busy_.load(std::memory_order_relaxed); }

private:
    void WorkerThread();

    const size_t num_threads_;
    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    mutable std::mutex queue_mutex_;
    std::condition_variable condition_;
    bool stop_ = false;
    std::atomic<size_t> busy_{0};
};

/**
 * Scoped guard for automatic cleanup
 */
class ScopeGuard {
public:
    explicit ScopeGuard(std::function<void()> cleanup) : cleanup_(std::move(cleanup)) {}
    ~ScopeGuard() { if (cleanup_) cleanup_(); }

    ScopeGuard(const ScopeGuard&) = delete;
    ScopeGuard& operator=(const ScopeGuard&) = delete;

private:
    std::function<void()> cleanup_;
};

} // namespace Meshwork
