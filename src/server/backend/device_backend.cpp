/*
 * device_backend.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "device_backend.hpp"

namespace skygate::server::backend {

namespace {

auto toMillis(std::chrono::system_clock::time_point tp) -> std::int64_t {
    if (tp.time_since_epoch().count() == 0) {
        return 0;
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               tp.time_since_epoch())
        .count();
}

}  // namespace

auto connectionStateToString(ConnectionState state) -> std::string_view {
    switch (state) {
        case ConnectionState::Connected: return "connected";
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Error: return "error";
    }
    return "disconnected";
}

void BackendMetrics::recordRequest(std::chrono::milliseconds latency,
                                   bool success) {
    auto now = std::chrono::system_clock::now();
    ++totalRequests;
    if (success) {
        ++successfulRequests;
        lastSuccessTime = now;
    } else {
        ++failedRequests;
        lastFailureTime = now;
    }
    lastRequestTime = now;

    auto sample = static_cast<double>(latency.count());
    if (averageLatencyMs == 0.0) {
        averageLatencyMs = sample;
    } else {
        averageLatencyMs = 0.8 * averageLatencyMs + 0.2 * sample;
    }
}

void BackendMetrics::setConnectionState(ConnectionState state,
                                        const std::string& error) {
    connectionState = state;
    if (!error.empty()) {
        lastError = error;
    }
}

json BackendMetrics::toJson() const {
    return {{"total_requests", totalRequests},
            {"successful_requests", successfulRequests},
            {"failed_requests", failedRequests},
            {"last_request_time", toMillis(lastRequestTime)},
            {"last_success_time", toMillis(lastSuccessTime)},
            {"last_failure_time", toMillis(lastFailureTime)},
            {"average_latency_ms", averageLatencyMs},
            {"connection_state", connectionStateToString(connectionState)},
            {"last_error", lastError}};
}

void MetricsRecorder::record(std::chrono::steady_clock::time_point start,
                             bool success) {
    auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    std::lock_guard lock(mutex_);
    metrics_.recordRequest(latency, success);
}

void MetricsRecorder::setConnectionState(ConnectionState state,
                                         const std::string& error) {
    std::lock_guard lock(mutex_);
    metrics_.setConnectionState(state, error);
}

BackendMetrics MetricsRecorder::snapshot() const {
    std::lock_guard lock(mutex_);
    return metrics_;
}

}  // namespace skygate::server::backend
