/*
 * device_registry.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-2

Description: Registry of the virtual devices exposed by the reflector

**************************************************/

#ifndef SKYGATE_SERVER_DEVICE_REGISTRY_HPP
#define SKYGATE_SERVER_DEVICE_REGISTRY_HPP

#include <chrono>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "atom/type/json.hpp"
#include "backend/backend_config.hpp"
#include "config/server_config.hpp"

namespace skygate::server {

using json = nlohmann::json;

/**
 * @brief One ASCOM device exposed by the reflector
 */
struct VirtualDevice {
    std::string deviceType;
    int deviceNumber{0};
    std::string name;
    std::string description;
    std::string driverInfo;
    std::string driverVersion;
    int interfaceVersion{1};
    std::string uniqueId;
    backend::BackendDeviceConfig backendConfig;
    bool connected{false};
    std::chrono::system_clock::time_point lastUpdate{};
    /// Last value returned per method, filled as calls succeed
    json stateCache = json::object();

    [[nodiscard]] std::string key() const;
};

/// Registry key of a (type, number) pair
auto deviceKey(std::string_view deviceType, int deviceNumber) -> std::string;

/**
 * @brief UUIDv5 (OID namespace) of "type-number", stable across restarts
 */
auto deterministicUniqueId(std::string_view deviceType, int deviceNumber)
    -> std::string;

/**
 * @brief Virtual devices keyed by (type, number)
 *
 * Filled once at startup, then read concurrently by request handlers.
 * Iteration follows registration order.
 */
class DeviceRegistry {
public:
    DeviceRegistry() = default;

    DeviceRegistry(const DeviceRegistry&) = delete;
    DeviceRegistry& operator=(const DeviceRegistry&) = delete;

    /**
     * @brief Register every configured device
     * @throws InvalidConfigException if the list is empty or a
     * (type, number) pair repeats
     */
    void loadFromConfig(const config::ReflectorConfig& config);

    /**
     * @brief Register one device
     * @throws InvalidConfigException on a duplicate (type, number)
     */
    auto registerDevice(const config::DeviceConfig& device,
                        const config::BackendConfig& backend) -> VirtualDevice;

    [[nodiscard]] auto find(std::string_view deviceType,
                            int deviceNumber) const
        -> std::optional<VirtualDevice>;

    [[nodiscard]] bool contains(std::string_view deviceType,
                                int deviceNumber) const;

    /// Snapshot in registration order
    [[nodiscard]] auto list() const -> std::vector<VirtualDevice>;

    [[nodiscard]] size_t size() const;

    void setConnected(std::string_view deviceType, int deviceNumber,
                      bool connected);

    void updateState(std::string_view deviceType, int deviceNumber,
                     const std::string& method, const json& value);

private:
    mutable std::shared_mutex mutex_;
    std::vector<VirtualDevice> devices_;
    std::unordered_map<std::string, size_t> index_;
};

}  // namespace skygate::server

#endif  // SKYGATE_SERVER_DEVICE_REGISTRY_HPP
