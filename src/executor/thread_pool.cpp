/**
 * @file thread_pool.cpp
 * @brief ThreadPool implementation.
 * @author Dimitris Kafetzis
 */

#include "executor/thread_pool.hpp"

namespace hydramesh {

ThreadPool::ThreadPool(size_t num_threads) {
    if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
        if (num_threads == 0) num_threads = 4;  // fallback
    }

    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this](std::stop_token stop) {
            worker_loop(stop);
        });
    }
}

ThreadPool::~ThreadPool() {
    shutdown();
}

void ThreadPool::enqueue(std::function<void(std::stop_token)> task) {
    {
        std::lock_guard lock(queue_mutex_);
        if (!accepting_) {
            throw std::runtime_error("ThreadPool is shut down");
        }
        task_queue_.push(std::move(task));
    }
    queue_cv_.notify_one();
}

void ThreadPool::shutdown() {
    {
        std::lock_guard lock(queue_mutex_);
        if (!accepting_) return;
        accepting_ = false;
        // Abandoned tasks destroy their promises, which surfaces broken_promise to waiters.
        std::queue<std::function<void(std::stop_token)>> empty;
        task_queue_.swap(empty);
    }

    for (auto& worker : workers_) {
        worker.request_stop();
    }
    queue_cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) worker.join();
    }
}

void ThreadPool::worker_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        std::function<void(std::stop_token)> task;
        {
            std::unique_lock lock(queue_mutex_);
            queue_cv_.wait(lock, stop, [this] { return !task_queue_.empty(); });

            if (stop.stop_requested() && task_queue_.empty()) return;
            if (task_queue_.empty()) continue;

            task = std::move(task_queue_.front());
            task_queue_.pop();
        }

        ++active_tasks_;
        task(stop);
        --active_tasks_;
    }
}

size_t ThreadPool::active_count() const noexcept {
    return active_tasks_.load();
}

size_t ThreadPool::queued_count() const noexcept {
    std::lock_guard lock(queue_mutex_);
    return task_queue_.size();
}

size_t ThreadPool::thread_count() const noexcept {
    return workers_.size();
}

}  // namespace hydramesh
