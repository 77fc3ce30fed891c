/*
 * backend_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-3

Description: Per-device backend settings

**************************************************/

#ifndef SKYGATE_SERVER_BACKEND_BACKEND_CONFIG_HPP
#define SKYGATE_SERVER_BACKEND_BACKEND_CONFIG_HPP

#include <chrono>
#include <string>
#include <string_view>
#include <variant>

#include "config/server_config.hpp"

namespace skygate::server::backend {

using Duration = config::Duration;

/**
 * @brief Forward ASCOM calls to a remote Alpaca server
 *
 * The remote type and number may differ from the virtual device, so a
 * reflector `telescope/0` can front `telescope/3` on another host.
 */
struct NetworkBackendConfig {
    std::string serverUrl;
    std::string remoteDeviceType;
    int remoteDeviceNumber{0};
    Duration timeout{std::chrono::seconds(30)};
    int retryAttempts{3};
    Duration retryDelay{std::chrono::seconds(1)};
};

/**
 * @brief Bridge ASCOM calls over the message bus
 */
struct MqttBackendConfig {
    std::string broker;
    std::string telescopeId;
    std::string clientId;
    std::string username;
    std::string password;
    Duration timeout{std::chrono::seconds(30)};
    int qos{1};
    std::string topicPrefix{"ascom"};
};

/**
 * @brief Serial/USB connection, reserved
 */
struct DirectBackendConfig {
    std::string port;
    int baudRate{9600};
    std::string protocol;
    Duration timeout{std::chrono::seconds(30)};
};

/// Exactly one transport per virtual device
using BackendDeviceConfig =
    std::variant<NetworkBackendConfig, MqttBackendConfig, DirectBackendConfig>;

/// `network`, `mqtt` or `direct`
auto backendModeName(const BackendDeviceConfig& config) -> std::string_view;

/**
 * @brief Build the backend settings of one configured device
 *
 * The device mode overrides the server-wide mode. `hybrid` resolves to the
 * network backend when the device names a network URL and to the message
 * bus otherwise.
 *
 * @throws InvalidConfigException for an unknown mode
 */
auto resolveBackendConfig(const config::DeviceConfig& device,
                          const config::BackendConfig& global)
    -> BackendDeviceConfig;

}  // namespace skygate::server::backend

#endif  // SKYGATE_SERVER_BACKEND_BACKEND_CONFIG_HPP
