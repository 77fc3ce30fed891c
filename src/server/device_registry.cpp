/*
 * device_registry.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "device_registry.hpp"

#include <algorithm>
#include <cctype>
#include <mutex>

#include <boost/uuid/name_generator_sha1.hpp>
#include <boost/uuid/uuid_io.hpp>

#include "alpaca/ascom_types.hpp"
#include "atom/log/spdlog_logger.hpp"
#include "exception/exception.hpp"

namespace skygate::server {

namespace {

auto toLower(std::string_view str) -> std::string {
    std::string lower(str);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return lower;
}

}  // namespace

std::string VirtualDevice::key() const {
    return deviceKey(deviceType, deviceNumber);
}

auto deviceKey(std::string_view deviceType, int deviceNumber) -> std::string {
    return toLower(deviceType) + "-" + std::to_string(deviceNumber);
}

auto deterministicUniqueId(std::string_view deviceType, int deviceNumber)
    -> std::string {
    boost::uuids::name_generator_sha1 generator(boost::uuids::ns::oid());
    std::string name =
        std::string(deviceType) + "-" + std::to_string(deviceNumber);
    return boost::uuids::to_string(generator(name));
}

void DeviceRegistry::loadFromConfig(const config::ReflectorConfig& config) {
    if (config.devices.empty()) {
        THROW_INVALID_CONFIG_EXCEPTION(
            "at least one device must be configured");
    }
    for (const auto& device : config.devices) {
        registerDevice(device, config.backend);
    }
    LOG_INFO("Device registry loaded with {} device(s)", size());
}

auto DeviceRegistry::registerDevice(const config::DeviceConfig& device,
                                    const config::BackendConfig& backend)
    -> VirtualDevice {
    VirtualDevice entry;
    entry.deviceType = toLower(device.type);
    entry.deviceNumber = device.number;
    entry.name = device.name.empty()
                     ? entry.deviceType + " #" + std::to_string(device.number)
                     : device.name;
    entry.description = device.description;
    entry.driverInfo =
        "BigSkies ASCOM Reflector - " + entry.deviceType + " Driver";
    entry.driverVersion = "1.0.0";
    entry.interfaceVersion = alpaca::interfaceVersionFor(entry.deviceType);
    entry.uniqueId = device.uniqueId.empty()
                         ? deterministicUniqueId(device.type, device.number)
                         : device.uniqueId;
    entry.backendConfig = backend::resolveBackendConfig(device, backend);
    entry.lastUpdate = std::chrono::system_clock::now();

    std::unique_lock lock(mutex_);
    auto key = entry.key();
    if (index_.contains(key)) {
        THROW_INVALID_CONFIG_EXCEPTION("duplicate device " + entry.deviceType +
                                       "/" + std::to_string(device.number));
    }

    index_.emplace(key, devices_.size());
    devices_.push_back(std::move(entry));
    const auto& stored = devices_.back();

    LOG_INFO("Virtual device registered: {}/{} '{}' ({}) backend={}",
             stored.deviceType, stored.deviceNumber, stored.name,
             stored.uniqueId, backend::backendModeName(stored.backendConfig));
    return stored;
}

auto DeviceRegistry::find(std::string_view deviceType, int deviceNumber) const
    -> std::optional<VirtualDevice> {
    std::shared_lock lock(mutex_);
    auto it = index_.find(deviceKey(deviceType, deviceNumber));
    if (it == index_.end()) {
        return std::nullopt;
    }
    return devices_[it->second];
}

bool DeviceRegistry::contains(std::string_view deviceType,
                              int deviceNumber) const {
    std::shared_lock lock(mutex_);
    return index_.contains(deviceKey(deviceType, deviceNumber));
}

auto DeviceRegistry::list() const -> std::vector<VirtualDevice> {
    std::shared_lock lock(mutex_);
    return devices_;
}

size_t DeviceRegistry::size() const {
    std::shared_lock lock(mutex_);
    return devices_.size();
}

void DeviceRegistry::setConnected(std::string_view deviceType,
                                  int deviceNumber, bool connected) {
    std::unique_lock lock(mutex_);
    auto it = index_.find(deviceKey(deviceType, deviceNumber));
    if (it == index_.end()) {
        return;
    }
    auto& device = devices_[it->second];
    device.connected = connected;
    device.lastUpdate = std::chrono::system_clock::now();
}

void DeviceRegistry::updateState(std::string_view deviceType,
                                 int deviceNumber, const std::string& method,
                                 const json& value) {
    std::unique_lock lock(mutex_);
    auto it = index_.find(deviceKey(deviceType, deviceNumber));
    if (it == index_.end()) {
        return;
    }
    auto& device = devices_[it->second];
    device.stateCache[method] = value;
    device.lastUpdate = std::chrono::system_clock::now();
}

}  // namespace skygate::server
