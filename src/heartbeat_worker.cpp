#include "heartbeat_worker.hpp"

namespace toolhost {

HeartbeatWorker::HeartbeatWorker(std::shared_ptr<MCPSessionManager> session_manager,
                                 std::shared_ptr<ToolMetricsRegistry> metrics,
                                 std::chrono::milliseconds interval)
    : session_manager(std::move(session_manager)), metrics(std::move(metrics)), interval(interval), running(false) {}

HeartbeatWorker::~HeartbeatWorker() {
    stop();
}

void HeartbeatWorker::start() {
    if (!running.exchange(true)) {
        worker_thread = std::thread(&HeartbeatWorker::workerLoop, this);
    }
}

void HeartbeatWorker::stop() {
    if (running.exchange(false)) {
        {
            std::lock_guard<std::mutex> lock(mutex);
        }
        cv.notify_one(); // Wake up the worker thread
        if (worker_thread.joinable()) {
            worker_thread.join();
        }
    }
}

void HeartbeatWorker::workerLoop() {
    while (running) {
        // Use condition variable to wait with timeout
        {
            std::unique_lock<std::mutex> lock(mutex);
            cv.wait_for(lock, interval, [this] { return !running; });
        }
        if (!running) {
            break;
        }

        try {
            performHeartbeat();
        } catch (const std::exception& ex) {
            CROW_LOG_ERROR << "Heartbeat failed: " << ex.what();
        }
    }
}

void HeartbeatWorker::performHeartbeat() {
    ++ticks_;
    auto expired = session_manager->cleanupExpiredSessions();
    CROW_LOG_DEBUG << "Heartbeat: " << session_manager->getActiveSessionCount() << " active session(s), "
                   << expired << " expired, metrics " << metrics->toJson().dump();
}

} // namespace toolhost
