#include "core/ThreadPool.hpp"
#include <algorithm>

namespace filesentry {

ThreadPool::ThreadPool(size_t num_threads) {
    num_threads = std::max<size_t>(1, num_threads);
    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back(&ThreadPool::WorkerThread, this);
    }
}

ThreadPool::~ThreadPool() {
    Shutdown();
}

size_t ThreadPool::DefaultThreadCount() {
    return std::max<size_t>(2, std::thread::hardware_concurrency());
}

void ThreadPool::Shutdown() {
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        stop_ = true;
    }
    condition_.notify_all();

    for (std::thread& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
}

size_t ThreadPool::GetQueueSize() const {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    return tasks_.size();
}

void ThreadPool::WorkerThread() {
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

        ++busy_workers_;
        task();
        --busy_workers_;
    }
}

} // namespace filesentry
