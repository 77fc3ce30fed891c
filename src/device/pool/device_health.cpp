/*
 * device_health.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "device_health.hpp"

namespace skygate::device {

auto healthStateToString(DeviceHealthState state) -> std::string {
    switch (state) {
        case DeviceHealthState::Unknown: return "unknown";
        case DeviceHealthState::Connecting: return "connecting";
        case DeviceHealthState::Connected: return "connected";
        case DeviceHealthState::Disconnected: return "disconnected";
    }
    return "unknown";
}

auto applyHealthCheck(DeviceHealthState state, int failCount, bool success)
    -> HealthTransition {
    if (state != DeviceHealthState::Connected) {
        return {state, failCount, false};
    }
    if (success) {
        return {DeviceHealthState::Connected, 0, false};
    }

    int failures = failCount + 1;
    if (failures >= kHealthFailureThreshold) {
        return {DeviceHealthState::Disconnected, 0, true};
    }
    return {DeviceHealthState::Connected, failures, false};
}

auto healthStatusToString(HealthStatus status) -> std::string {
    switch (status) {
        case HealthStatus::Healthy: return "healthy";
        case HealthStatus::Degraded: return "degraded";
        case HealthStatus::Unhealthy: return "unhealthy";
    }
    return "unhealthy";
}

auto HealthResult::toJson() const -> json {
    return {{"component", component},
            {"status", healthStatusToString(status)},
            {"message", message},
            {"details", details},
            {"timestamp",
             std::chrono::duration_cast<std::chrono::milliseconds>(
                 timestamp.time_since_epoch())
                 .count()}};
}

}  // namespace skygate::device
