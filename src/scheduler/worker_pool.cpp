#include "internal/scheduler/worker_pool.hpp"

#include <iostream>
#include <mutex>
#include <queue>
#include <thread>
#include <utility>

namespace sonata {

WorkerPool::WorkerPool(size_t num_threads)
    : num_threads_(num_threads > 0 ? num_threads : 1) {
    workers_.reserve(num_threads_);
}

WorkerPool::~WorkerPool() {
    stop();
}

void WorkerPool::start() {
    if (running_) {
        return;
    }

    running_ = true;
    stop_requested_ = false;

    for (size_t i = 0; i < num_threads_; ++i) {
        workers_.emplace_back(&WorkerPool::workerThread, this);
    }
}

void WorkerPool::stop() {
    if (!running_) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stop_requested_ = true;
    }
    queue_cv_.notify_all();

    for (auto& thread : workers_) {
        if (thread.joinable()) {
            thread.join();
        }
    }

    workers_.clear();
    running_ = false;
}

bool WorkerPool::submit(Task task) {
    if (!running_) {
        std::cerr << "[WorkerPool] Pool not running, task rejected" << std::endl;
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        task_queue_.push(std::move(task));
    }
    queue_cv_.notify_one();
    return true;
}

size_t WorkerPool::clear() {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    size_t dropped = task_queue_.size();
    std::queue<Task> empty;
    std::swap(task_queue_, empty);
    return dropped;
}

size_t WorkerPool::getQueueSize() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return task_queue_.size();
}

void WorkerPool::workerThread() {
    while (true) {
        Task task;

        // Wait for a task
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] {
                return !task_queue_.empty() || stop_requested_;
            });

            if (stop_requested_ && task_queue_.empty()) {
                break;
            }

            task = std::move(task_queue_.front());
            task_queue_.pop();
        }

        if (task) {
            task();
        }
    }
}

}  // namespace sonata
