#include "worker_pool.h"
#include <glog/logging.h>

namespace Meshwork {

WorkerPool::WorkerPool(size_t num_threads) : num_threads_(num_threads) {
    if (num_threads_ == 0) {
        LOG(FATAL) << "WorkerPool: at least one worker thread is required";
    }
    for (size_t i = 0; i < num_threads_; ++i) {
        workers_.emplace_back(&WorkerPool::WorkerThread, this);
    }
    VLOG(1) << "WorkerPool started with " << num_threads_ << " threads";
}

WorkerPool::~WorkerPool() {
    Stop();
}

bool WorkerPool::Submit(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stop_) {
            return false;
        }
        tasks_.emplace(std::move(task));
    }
    condition_.notify_one();
    return true;
}

void WorkerPool::Stop() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stop_ = true;
    }
    condition_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
}

size_t WorkerPool::QueueDepth() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return tasks_.size();
}

void WorkerPool::WorkerThread() {
    while (true) {
        std::function<void()> task;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            condition_.wait(lock, [this] { return stop_ || !tasks_.empty(); });

            if (stop_ && tasks_.empty()) {
                return;
            }

            task = std::move(tasks_.front());
            tasks_.pop();
        }

        busy_.fetch_add(1, std::memory_order_relaxed);
        task();
        busy_.fetch_sub(1, std::memory_order_relaxed);
    }
}

} // namespace Meshwork
