#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace toolhost {

/**
 * Fixed-size pool running one task per inbound request.
 *
 * post() never blocks. shutdown() stops accepting work, lets the queued tasks
 * finish, and joins the workers.
 */
class WorkerPool {
public:
    using Task = std::function<void()>;

    explicit WorkerPool(size_t thread_count);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Returns false once shutdown has started
    bool post(Task task);

    // Blocks until the queue is empty and no task is running
    void waitIdle();

    void shutdown();

    size_t threadCount() const { return workers_.size(); }
    size_t pendingCount() const;

    static size_t defaultThreadCount();

private:
    void workerLoop();

    std::vector<std::thread> workers_;
    std::deque<Task> queue_tasks_;
    mutable std::mutex mutex_tasks_;
    std::condition_variable condition_tasks_;
    std::condition_variable condition_idle_;
    size_t active_ = 0;
    std::atomic<bool> running_;
};

} // namespace toolhost
