/*
 * backend_config.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "backend_config.hpp"

#include <type_traits>

#include "exception/exception.hpp"

namespace skygate::server::backend {

namespace {

auto makeNetworkConfig(const config::DeviceConfig& device,
                       const config::BackendConfig& global)
    -> NetworkBackendConfig {
    NetworkBackendConfig cfg;
    cfg.serverUrl = device.backend.networkUrl;
    while (!cfg.serverUrl.empty() && cfg.serverUrl.back() == '/') {
        cfg.serverUrl.pop_back();
    }
    cfg.remoteDeviceType = device.backend.networkDeviceType.empty()
                               ? device.type
                               : device.backend.networkDeviceType;
    cfg.remoteDeviceNumber = device.backend.networkDeviceNumber;
    cfg.timeout = global.network.defaultTimeout;
    cfg.retryAttempts = global.network.defaultRetryAttempts;
    cfg.retryDelay = global.network.retryDelay;
    return cfg;
}

auto makeMqttConfig(const config::DeviceConfig& device,
                    const config::BackendConfig& global) -> MqttBackendConfig {
    MqttBackendConfig cfg;
    cfg.broker = global.mqtt.broker;
    cfg.telescopeId = device.backend.mqttTelescopeId.empty()
                          ? global.mqtt.telescopeId
                          : device.backend.mqttTelescopeId;
    cfg.clientId = global.mqtt.clientId;
    cfg.username = global.mqtt.username;
    cfg.password = global.mqtt.password;
    cfg.timeout = global.mqtt.timeout;
    cfg.qos = global.mqtt.qos;
    if (!global.mqtt.topicPrefix.empty()) {
        cfg.topicPrefix = global.mqtt.topicPrefix;
    }
    return cfg;
}

}  // namespace

auto backendModeName(const BackendDeviceConfig& config) -> std::string_view {
    return std::visit(
        [](const auto& cfg) -> std::string_view {
            using T = std::decay_t<decltype(cfg)>;

            if constexpr (std::is_same_v<T, NetworkBackendConfig>) {
                return "network";
            } else if constexpr (std::is_same_v<T, MqttBackendConfig>) {
                return "mqtt";
            } else {
                static_assert(std::is_same_v<T, DirectBackendConfig>);
                return "direct";
            }
        },
        config);
}

auto resolveBackendConfig(const config::DeviceConfig& device,
                          const config::BackendConfig& global)
    -> BackendDeviceConfig {
    std::string mode =
        device.backend.mode.empty() ? global.mode : device.backend.mode;
    if (mode == "hybrid") {
        mode = device.backend.networkUrl.empty() ? "mqtt" : "network";
    }

    if (mode == "network") {
        return makeNetworkConfig(device, global);
    }
    if (mode == "mqtt") {
        return makeMqttConfig(device, global);
    }
    if (mode == "direct") {
        DirectBackendConfig cfg;
        cfg.timeout = global.network.defaultTimeout;
        return cfg;
    }

    THROW_INVALID_CONFIG_EXCEPTION("unknown backend mode '" + mode +
                                   "' for device " + device.type + "/" +
                                   std::to_string(device.number));
}

}  // namespace skygate::server::backend
