#include "worker_pool.hpp"
#include <algorithm>
#include <crow.h>

namespace toolhost {

WorkerPool::WorkerPool(size_t thread_count) : running_(true) {
    size_t count = std::max<size_t>(1, thread_count);
    workers_.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        workers_.emplace_back(&WorkerPool::workerLoop, this);
    }
    CROW_LOG_DEBUG << "Worker pool started with " << count << " threads";
}

WorkerPool::~WorkerPool() {
    shutdown();
}

bool WorkerPool::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_tasks_);
        if (!running_) {
            return false;
        }
        queue_tasks_.push_back(std::move(task));
    }
    condition_tasks_.notify_one();
    return true;
}

void WorkerPool::waitIdle() {
    std::unique_lock<std::mutex> lock(mutex_tasks_);
    condition_idle_.wait(lock, [this] { return queue_tasks_.empty() && active_ == 0; });
}

void WorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_tasks_);
        if (!running_.exchange(false)) {
            return;
        }
    }
    condition_tasks_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

size_t WorkerPool::pendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_tasks_);
    return queue_tasks_.size();
}

size_t WorkerPool::defaultThreadCount() {
    return std::max<size_t>(2, std::thread::hardware_concurrency());
}

void WorkerPool::workerLoop() {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_tasks_);
            condition_tasks_.wait(lock, [this] { return !queue_tasks_.empty() || !running_; });

            // Drain what was queued before shutdown, then exit
            if (queue_tasks_.empty()) {
                return;
            }
            task = std::move(queue_tasks_.front());
            queue_tasks_.pop_front();
            ++active_;
        }

        try {
            task();
        } catch (const std::exception& ex) {
            CROW_LOG_ERROR << "Worker task failed: " << ex.what();
        }

        {
            std::lock_guard<std::mutex> lock(mutex_tasks_);
            --active_;
        }
        condition_idle_.notify_all();
    }
}

} // namespace toolhost
