/*
 * device_pool_engine.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "device_pool_engine.hpp"

#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <algorithm>

#include "exception/exception.hpp"

namespace skygate::device {

DevicePoolEngine::DevicePoolEngine(std::shared_ptr<AlpacaClient> client,
                                   std::chrono::milliseconds healthInterval)
    : client_(std::move(client)),
      healthInterval_(healthInterval.count() > 0 ? healthInterval
                                                 : kDefaultHealthInterval) {
    if (!client_) {
        THROW_DEVICE_ENGINE_EXCEPTION("DevicePoolEngine requires a client");
    }
}

DevicePoolEngine::~DevicePoolEngine() { stop(); }

void DevicePoolEngine::start() {
    if (running_.exchange(true)) {
        return;
    }
    spdlog::info("Starting ASCOM engine, health check interval {}ms",
                 healthInterval_.count());
    healthThread_ = std::thread(&DevicePoolEngine::healthCheckLoop, this);
}

void DevicePoolEngine::stop() {
    if (running_.exchange(false)) {
        spdlog::info("Stopping ASCOM engine");
        {
            std::lock_guard lock(loopMutex_);
        }
        loopCv_.notify_all();
    }
    if (healthThread_.joinable()) {
        healthThread_.join();
    }

    for (const auto& entry : snapshotEntries()) {
        if (auto device = markDisconnected(*entry)) {
            releaseRemote(*device, "during shutdown");
        }
    }
}

void DevicePoolEngine::healthCheckLoop() {
    std::unique_lock lock(loopMutex_);
    while (running_) {
        if (loopCv_.wait_for(lock, healthInterval_,
                             [this] { return !running_.load(); })) {
            break;
        }
        lock.unlock();
        try {
            runHealthChecks();
        } catch (const std::exception& e) {
            spdlog::error("Error in device health monitoring: {}", e.what());
        }
        lock.lock();
    }
}

// ==================== Discovery ====================

auto DevicePoolEngine::discoverDevices(int port,
                                       std::chrono::milliseconds timeout)
    -> std::vector<AlpacaDevice> {
    spdlog::info("Starting device discovery on port {}", port);
    auto devices = client_->discoverDevices(port, timeout);
    spdlog::info("Discovery complete, {} device(s)", devices.size());
    return devices;
}

// ==================== Device management ====================

auto DevicePoolEngine::findEntry(const std::string& deviceId) const
    -> std::shared_ptr<Entry> {
    std::shared_lock lock(mutex_);
    auto it = devices_.find(deviceId);
    if (it == devices_.end()) {
        THROW_DEVICE_NOT_FOUND(
            fmt::format("device {} not registered", deviceId));
    }
    return it->second;
}

auto DevicePoolEngine::snapshotEntries() const
    -> std::vector<std::shared_ptr<Entry>> {
    std::shared_lock lock(mutex_);
    std::vector<std::shared_ptr<Entry>> entries;
    entries.reserve(devices_.size());
    for (const auto& [id, entry] : devices_) {
        entries.push_back(entry);
    }
    return entries;
}

auto DevicePoolEngine::markDisconnected(Entry& entry)
    -> std::optional<AlpacaDevice> {
    std::lock_guard lock(entry.mutex);
    auto& managed = entry.managed;
    if (!managed.connected()) {
        return std::nullopt;
    }
    managed.state = DeviceHealthState::Disconnected;
    managed.device.connected = false;
    managed.failCount = 0;
    ++entry.generation;
    return managed.device;
}

void DevicePoolEngine::releaseRemote(const AlpacaDevice& device,
                                     std::string_view context) {
    try {
        client_->disconnect(device);
    } catch (const std::exception& e) {
        spdlog::warn("Device {} did not acknowledge disconnect {}: {}",
                     device.deviceId, context, e.what());
    }
}

void DevicePoolEngine::registerDevice(const AlpacaDevice& device) {
    if (device.deviceId.empty()) {
        THROW_DEVICE_ENGINE_EXCEPTION("device id cannot be empty");
    }

    std::unique_lock lock(mutex_);
    if (devices_.contains(device.deviceId)) {
        THROW_DEVICE_ENGINE_EXCEPTION(
            fmt::format("device {} already registered", device.deviceId));
    }

    auto entry = std::make_shared<Entry>();
    entry->managed.device = device;
    entry->managed.device.connected = false;
    entry->managed.lastHealthy = std::chrono::system_clock::now();
    devices_.emplace(device.deviceId, std::move(entry));

    spdlog::info("Device registered: {} ({})", device.deviceId,
                 device.deviceType);
}

void DevicePoolEngine::unregisterDevice(const std::string& deviceId) {
    std::shared_ptr<Entry> entry;
    {
        std::unique_lock lock(mutex_);
        auto it = devices_.find(deviceId);
        if (it == devices_.end()) {
            THROW_DEVICE_NOT_FOUND(
                fmt::format("device {} not registered", deviceId));
        }
        entry = std::move(it->second);
        devices_.erase(it);
    }

    if (auto device = markDisconnected(*entry)) {
        releaseRemote(*device, "during unregister");
    }
    spdlog::info("Device unregistered: {}", deviceId);
}

void DevicePoolEngine::connectDevice(const std::string& deviceId) {
    auto entry = findEntry(deviceId);

    AlpacaDevice device;
    auto previous = DeviceHealthState::Unknown;
    std::uint64_t generation = 0;
    {
        std::lock_guard lock(entry->mutex);
        auto& managed = entry->managed;
        // Connected, or another caller is already connecting
        if (managed.connected() ||
            managed.state == DeviceHealthState::Connecting) {
            return;
        }
        previous = managed.state;
        managed.state = DeviceHealthState::Connecting;
        generation = ++entry->generation;
        device = managed.device;
    }

    try {
        client_->connect(device);
    } catch (const std::exception& e) {
        std::lock_guard lock(entry->mutex);
        if (entry->generation == generation) {
            entry->managed.state = previous == DeviceHealthState::Unknown
                                       ? DeviceHealthState::Unknown
                                       : DeviceHealthState::Disconnected;
        }
        spdlog::error("Failed to connect device {}: {}", deviceId, e.what());
        throw;
    }

    std::lock_guard lock(entry->mutex);
    if (entry->generation != generation) {
        return;
    }
    auto& managed = entry->managed;
    managed.state = DeviceHealthState::Connected;
    managed.device.connected = true;
    managed.lastHealthy = std::chrono::system_clock::now();
    managed.failCount = 0;
    spdlog::info("Device connected: {}", deviceId);
}

void DevicePoolEngine::disconnectDevice(const std::string& deviceId) {
    auto entry = findEntry(deviceId);
    // Local state flips first so the disconnect is honored even when the
    // remote end is slow or gone
    auto device = markDisconnected(*entry);
    if (!device) {
        return;
    }
    spdlog::info("Device disconnected: {}", deviceId);
    releaseRemote(*device, "on request");
}

bool DevicePoolEngine::isDeviceConnected(const std::string& deviceId) const {
    auto entry = findEntry(deviceId);
    std::lock_guard lock(entry->mutex);
    return entry->managed.connected();
}

auto DevicePoolEngine::getDevice(const std::string& deviceId) const
    -> AlpacaDevice {
    return getManagedDevice(deviceId).device;
}

auto DevicePoolEngine::getManagedDevice(const std::string& deviceId) const
    -> ManagedDevice {
    auto entry = findEntry(deviceId);
    std::lock_guard lock(entry->mutex);
    return entry->managed;
}

auto DevicePoolEngine::listDevices() const -> std::vector<AlpacaDevice> {
    auto entries = snapshotEntries();
    std::vector<AlpacaDevice> devices;
    devices.reserve(entries.size());
    for (const auto& entry : entries) {
        std::lock_guard lock(entry->mutex);
        devices.push_back(entry->managed.device);
    }
    std::sort(devices.begin(), devices.end(),
              [](const AlpacaDevice& a, const AlpacaDevice& b) {
                  return a.deviceId < b.deviceId;
              });
    return devices;
}

// ==================== Telescope pools ====================

void DevicePoolEngine::registerTelescopeDevices(
    const std::string& telescopeId,
    const std::map<alpaca::DeviceRole, std::string>& devices) {
    std::unique_lock lock(mutex_);
    for (const auto& [role, deviceId] : devices) {
        if (!devices_.contains(deviceId)) {
            THROW_DEVICE_NOT_FOUND(
                fmt::format("device {} not registered", deviceId));
        }
    }
    telescopes_[telescopeId] = devices;
    spdlog::info("Telescope {} registered with {} device(s)", telescopeId,
                 devices.size());
}

void DevicePoolEngine::unregisterTelescope(const std::string& telescopeId) {
    std::unique_lock lock(mutex_);
    telescopes_.erase(telescopeId);
    spdlog::info("Telescope unregistered: {}", telescopeId);
}

auto DevicePoolEngine::getTelescopeDevice(const std::string& telescopeId,
                                          alpaca::DeviceRole role) const
    -> AlpacaDevice {
    std::string deviceId;
    {
        std::shared_lock lock(mutex_);
        auto pool = telescopes_.find(telescopeId);
        if (pool == telescopes_.end()) {
            THROW_DEVICE_NOT_FOUND(
                fmt::format("telescope {} not registered", telescopeId));
        }
        auto it = pool->second.find(role);
        if (it == pool->second.end()) {
            THROW_DEVICE_NOT_FOUND(fmt::format(
                "device role {} not found for telescope {}",
                alpaca::deviceRoleToString(role), telescopeId));
        }
        deviceId = it->second;
    }
    return getDevice(deviceId);
}

size_t DevicePoolEngine::telescopeCount() const {
    std::shared_lock lock(mutex_);
    return telescopes_.size();
}

// ==================== Health ====================

void DevicePoolEngine::runHealthChecks() {
    for (const auto& entry : snapshotEntries()) {
        checkDeviceHealth(*entry);
    }
}

void DevicePoolEngine::checkDeviceHealth(Entry& entry) {
    AlpacaDevice device;
    std::uint64_t generation = 0;
    {
        std::lock_guard lock(entry.mutex);
        if (!entry.managed.connected()) {
            return;
        }
        device = entry.managed.device;
        generation = entry.generation;
    }

    bool healthy = false;
    std::string reason;
    try {
        healthy = client_->isConnected(device);
        if (!healthy) {
            reason = "device reported not connected";
        }
    } catch (const std::exception& e) {
        reason = e.what();
    }

    std::lock_guard lock(entry.mutex);
    auto& managed = entry.managed;
    if (entry.generation != generation || !managed.connected()) {
        spdlog::debug("Discarding stale health check for {}",
                      device.deviceId);
        return;
    }

    auto transition = applyHealthCheck(managed.state, managed.failCount,
                                       healthy);
    managed.state = transition.state;
    managed.failCount = transition.failCount;

    if (healthy) {
        managed.lastHealthy = std::chrono::system_clock::now();
        return;
    }

    if (transition.demoted) {
        managed.device.connected = false;
        spdlog::error(
            "Device {} marked as disconnected after {} failed health checks",
            managed.device.deviceId, kHealthFailureThreshold);
    } else {
        spdlog::warn("Device health check failed for {} (fail count {}): {}",
                     managed.device.deviceId, managed.failCount, reason);
    }
}

auto DevicePoolEngine::check() const -> HealthResult {
    auto entries = snapshotEntries();
    const auto telescopes = telescopeCount();

    const int total = static_cast<int>(entries.size());
    int connected = 0;
    int healthy = 0;
    for (const auto& entry : entries) {
        std::lock_guard lock(entry->mutex);
        if (entry->managed.connected()) {
            ++connected;
            if (entry->managed.failCount == 0) {
                ++healthy;
            }
        }
    }

    HealthResult result;
    result.component = std::string(kComponentName);
    result.timestamp = std::chrono::system_clock::now();
    result.status = HealthStatus::Healthy;
    result.message =
        fmt::format("ASCOM engine healthy: {}/{} devices connected, {} healthy",
                    connected, total, healthy);

    if (total > 0 && connected == 0) {
        result.status = HealthStatus::Unhealthy;
        result.message = "No devices connected";
    } else if (connected > 0 && healthy < connected) {
        result.status = HealthStatus::Degraded;
        result.message =
            fmt::format("Some devices unhealthy: {}/{}", healthy, connected);
    }

    result.details = {{"total_devices", total},
                      {"connected_devices", connected},
                      {"healthy_devices", healthy},
                      {"telescope_count", telescopes}};
    return result;
}

}  // namespace skygate::device
