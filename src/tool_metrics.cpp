#include "tool_metrics.hpp"

namespace toolhost {

double ToolStats::errorRate() const {
    if (call_count == 0) {
        return 0.0;
    }
    return static_cast<double>(error_count) / static_cast<double>(call_count) * 100.0;
}

crow::json::wvalue ToolStats::toJson() const {
    crow::json::wvalue stats;
    stats["calls"] = call_count;
    stats["errors"] = error_count;
    stats["successes"] = success_count;
    stats["totalDurationUs"] = static_cast<int64_t>(total_duration.count());
    stats["averageDurationUs"] = static_cast<int64_t>(average_duration.count());
    stats["errorRate"] = errorRate();
    return stats;
}

void ToolMetrics::recordSuccess(std::chrono::microseconds duration) {
    call_count_.fetch_add(1, std::memory_order_relaxed);
    total_duration_us_.fetch_add(duration.count(), std::memory_order_relaxed);
}

void ToolMetrics::recordError(std::chrono::microseconds duration) {
    call_count_.fetch_add(1, std::memory_order_relaxed);
    error_count_.fetch_add(1, std::memory_order_relaxed);
    total_duration_us_.fetch_add(duration.count(), std::memory_order_relaxed);
}

ToolStats ToolMetrics::stats() const {
    ToolStats stats;
    stats.call_count = call_count_.load(std::memory_order_relaxed);
    stats.error_count = error_count_.load(std::memory_order_relaxed);
    stats.success_count = stats.call_count >= stats.error_count ? stats.call_count - stats.error_count : 0;
    stats.total_duration = std::chrono::microseconds(total_duration_us_.load(std::memory_order_relaxed));
    if (stats.call_count > 0) {
        stats.average_duration = stats.total_duration / static_cast<int64_t>(stats.call_count);
    }
    return stats;
}

void ToolMetrics::reset() {
    call_count_.store(0, std::memory_order_relaxed);
    error_count_.store(0, std::memory_order_relaxed);
    total_duration_us_.store(0, std::memory_order_relaxed);
}

ToolMetrics& ToolMetricsRegistry::forTool(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& metrics = metrics_[name];
    if (!metrics) {
        metrics = std::make_unique<ToolMetrics>();
    }
    return *metrics;
}

std::map<std::string, ToolStats> ToolMetricsRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, ToolStats> result;
    for (const auto& entry : metrics_) {
        result[entry.first] = entry.second->stats();
    }
    return result;
}

crow::json::wvalue ToolMetricsRegistry::toJson() const {
    crow::json::wvalue json = crow::json::wvalue::object();
    for (const auto& entry : snapshot()) {
        json[entry.first] = entry.second.toJson();
    }
    return json;
}

void ToolMetricsRegistry::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& entry : metrics_) {
        entry.second->reset();
    }
}

ScopedToolTimer::ScopedToolTimer(ToolMetrics& metrics)
    : metrics_(metrics), start_(std::chrono::steady_clock::now()) {}

ScopedToolTimer::~ScopedToolTimer() {
    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start_);
    if (failed_) {
        metrics_.recordError(elapsed);
    } else {
        metrics_.recordSuccess(elapsed);
    }
}

} // namespace toolhost
