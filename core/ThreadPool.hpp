#pragma once

#include "core/CancellationToken.hpp"
#include <atomic>
#include <condition_variable>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace filesentry {

// Delivered through the future of a task that was dropped because its scan
// was cancelled before a worker picked it up.
class TaskCancelled : public std::runtime_error {
public:
    TaskCancelled() : std::runtime_error("task cancelled before start") {}
};

// Fixed-size worker pool shared by the detection phase. Tasks never block on
// other tasks of the same pool, so a single worker is enough to make progress.
class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads = DefaultThreadCount());
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    template<typename F, typename... Args>
    auto Enqueue(F&& f, Args&&... args) -> std::future<typename std::invoke_result<F, Args...>::type>;

    // Like Enqueue, but the task is skipped if `token` is raised by the time
    // a worker dequeues it. Used for analyzer tasks of a single scan so a
    // timed-out scan does not keep occupying workers.
    template<typename F>
    auto Submit(const CancellationToken& token, F&& f) -> std::future<typename std::invoke_result<F>::type>;

    void Shutdown();
    size_t GetThreadCount() const { return workers_.size(); }
    size_t GetQueueSize() const;
    size_t GetBusyWorkerCount() const { return busy_workers_.load(); }
    size_t GetSkippedTaskCount() const { return skipped_tasks_.load(); }
    bool IsStopped() const { return stop_.load(); }

    static size_t DefaultThreadCount();

private:
    void WorkerThread();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;

    mutable std::mutex queue_mutex_;
    std::condition_variable condition_;
    std::atomic<bool> stop_{false};
    std::atomic<size_t> busy_workers_{0};
    std::atomic<size_t> skipped_tasks_{0};
};

template<typename F, typename... Args>
auto ThreadPool::Enqueue(F&& f, Args&&... args) -> std::future<typename std::invoke_result<F, Args...>::type> {
    using return_type = typename std::invoke_result<F, Args...>::type;

    auto task = std::make_shared<std::packaged_task<return_type()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );

    std::future<return_type> res = task->get_future();
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        if (stop_) {
            throw std::runtime_error("Cannot enqueue on stopped ThreadPool");
        }
        tasks_.emplace([task]() { (*task)(); });
    }
    condition_.notify_one();
    return res;
}

template<typename F>
auto ThreadPool::Submit(const CancellationToken& token, F&& f) -> std::future<typename std::invoke_result<F>::type> {
    using return_type = typename std::invoke_result<F>::type;

    auto promise = std::make_shared<std::promise<return_type>>();
    std::future<return_type> res = promise->get_future();
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        if (stop_) {
            throw std::runtime_error("Cannot enqueue on stopped ThreadPool");
        }
        tasks_.emplace([this, promise, token, fn = std::forward<F>(f)]() mutable {
            if (token.IsCancelled()) {
                ++skipped_tasks_;
                promise->set_exception(std::make_exception_ptr(TaskCancelled()));
                return;
            }
            try {
                if constexpr (std::is_void_v<return_type>) {
                    fn();
                    promise->set_value();
                } else {
                    promise->set_value(fn());
                }
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
        });
    }
    condition_.notify_one();
    return res;
}

} // namespace filesentry
