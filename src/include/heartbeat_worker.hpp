#pragma once

#include <crow.h>
#include <thread>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

#include "mcp_session_manager.hpp"
#include "tool_metrics.hpp"

namespace toolhost {

// Background housekeeping for the HTTP transport: expires idle sessions and
// logs a metrics line on every tick
class HeartbeatWorker {
public:
    HeartbeatWorker(std::shared_ptr<MCPSessionManager> session_manager,
                    std::shared_ptr<ToolMetricsRegistry> metrics,
                    std::chrono::milliseconds interval);
    ~HeartbeatWorker();

    void start();
    void stop();

    size_t ticks() const { return ticks_.load(); }

private:
    std::shared_ptr<MCPSessionManager> session_manager;
    std::shared_ptr<ToolMetricsRegistry> metrics;
    std::chrono::milliseconds interval;
    std::thread worker_thread;
    std::atomic<bool> running;
    std::atomic<size_t> ticks_{0};
    std::condition_variable cv;
    std::mutex mutex;

    void workerLoop();
    void performHeartbeat();
};

} // namespace toolhost
