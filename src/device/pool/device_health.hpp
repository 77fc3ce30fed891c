/*
 * device_health.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-11

Description: Managed device health states and check transitions

**************************************************/

#ifndef SKYGATE_DEVICE_POOL_DEVICE_HEALTH_HPP
#define SKYGATE_DEVICE_POOL_DEVICE_HEALTH_HPP

#include <chrono>
#include <string>

#include "atom/type/json.hpp"

namespace skygate::device {

using json = nlohmann::json;

/// Consecutive failed checks that demote a connected device
inline constexpr int kHealthFailureThreshold = 3;

enum class DeviceHealthState { Unknown, Connecting, Connected, Disconnected };

auto healthStateToString(DeviceHealthState state) -> std::string;

/**
 * @brief Result of feeding one health check into a device's state
 */
struct HealthTransition {
    DeviceHealthState state{DeviceHealthState::Unknown};
    int failCount{0};
    /// Set when this check moved the device from Connected to Disconnected
    bool demoted{false};
};

/**
 * @brief Apply one health check outcome
 *
 * Only Connected devices are affected. A success clears the failure count,
 * a failure increments it and the third consecutive one demotes the device
 * to Disconnected with the count reset.
 */
auto applyHealthCheck(DeviceHealthState state, int failCount, bool success)
    -> HealthTransition;

enum class HealthStatus { Healthy, Degraded, Unhealthy };

auto healthStatusToString(HealthStatus status) -> std::string;

/**
 * @brief Component health report consumed by the coordinator
 */
struct HealthResult {
    std::string component;
    HealthStatus status{HealthStatus::Healthy};
    std::string message;
    json details = json::object();
    std::chrono::system_clock::time_point timestamp{};

    [[nodiscard]] auto toJson() const -> json;
};

}  // namespace skygate::device

#endif  // SKYGATE_DEVICE_POOL_DEVICE_HEALTH_HPP
