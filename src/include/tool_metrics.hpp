#pragma once

#include <atomic>
#include <chrono>
#include <crow.h>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace toolhost {

// Point-in-time statistics for one tool
struct ToolStats {
    uint64_t call_count = 0;
    uint64_t error_count = 0;
    uint64_t success_count = 0;
    std::chrono::microseconds total_duration{0};
    std::chrono::microseconds average_duration{0};

    double errorRate() const;
    crow::json::wvalue toJson() const;
};

// Counters for one tool; safe to update from any thread
class ToolMetrics {
public:
    void recordSuccess(std::chrono::microseconds duration);
    void recordError(std::chrono::microseconds duration);
    ToolStats stats() const;
    void reset();

private:
    std::atomic<uint64_t> call_count_{0};
    std::atomic<uint64_t> error_count_{0};
    std::atomic<int64_t> total_duration_us_{0};
};

class ToolMetricsRegistry {
public:
    // Created on first use
    ToolMetrics& forTool(const std::string& name);

    std::map<std::string, ToolStats> snapshot() const;
    crow::json::wvalue toJson() const;
    void reset();

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::unique_ptr<ToolMetrics>> metrics_;
};

// Measures one call and records it on the way out unless marked
class ScopedToolTimer {
public:
    explicit ScopedToolTimer(ToolMetrics& metrics);
    ~ScopedToolTimer();

    ScopedToolTimer(const ScopedToolTimer&) = delete;
    ScopedToolTimer& operator=(const ScopedToolTimer&) = delete;

    void markFailed() { failed_ = true; }

private:
    ToolMetrics& metrics_;
    std::chrono::steady_clock::time_point start_;
    bool failed_ = false;
};

} // namespace toolhost
