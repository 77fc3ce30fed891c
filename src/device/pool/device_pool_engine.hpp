/*
 * device_pool_engine.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-11

Description: Pool of remote Alpaca devices with health monitoring

**************************************************/

#ifndef SKYGATE_DEVICE_POOL_DEVICE_POOL_ENGINE_HPP
#define SKYGATE_DEVICE_POOL_DEVICE_POOL_ENGINE_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <vector>

#include "alpaca/ascom_types.hpp"
#include "client/alpaca/alpaca_client.hpp"
#include "device_health.hpp"

namespace skygate::device {

using client::alpaca::AlpacaClient;
using client::alpaca::AlpacaDevice;

/**
 * @brief Snapshot of a device tracked by the engine
 */
struct ManagedDevice {
    AlpacaDevice device;
    DeviceHealthState state{DeviceHealthState::Unknown};
    std::chrono::system_clock::time_point lastHealthy{};
    int failCount{0};

    [[nodiscard]] bool connected() const {
        return state == DeviceHealthState::Connected;
    }
};

/**
 * @brief Registry of remote Alpaca devices grouped into telescope pools
 *
 * A background loop checks every connected device at a fixed interval and
 * demotes a device after three consecutive failed checks. Demoted devices
 * are not reconnected automatically. Operations on the same device are
 * not serialized against each other beyond the state bookkeeping; callers
 * needing exclusive access must serialize themselves.
 */
class DevicePoolEngine {
public:
    static constexpr std::chrono::milliseconds kDefaultHealthInterval{30000};
    static constexpr std::string_view kComponentName = "ascom_engine";

    explicit DevicePoolEngine(
        std::shared_ptr<AlpacaClient> client,
        std::chrono::milliseconds healthInterval = kDefaultHealthInterval);
    ~DevicePoolEngine();

    DevicePoolEngine(const DevicePoolEngine&) = delete;
    DevicePoolEngine& operator=(const DevicePoolEngine&) = delete;

    /// Launch the health loop; a second call is a no-op
    void start();

    /**
     * @brief Stop the health loop within one interval and disconnect every
     * connected device
     */
    void stop();

    [[nodiscard]] bool isRunning() const { return running_.load(); }

    [[nodiscard]] std::string_view name() const { return kComponentName; }

    // ==================== Discovery ====================

    /// Scan the network; the registry is not modified
    auto discoverDevices(int port,
                         std::chrono::milliseconds timeout =
                             AlpacaClient::kDiscoveryTimeout)
        -> std::vector<AlpacaDevice>;

    // ==================== Device management ====================

    /**
     * @throws DeviceEngineException for an empty or repeated device id
     */
    void registerDevice(const AlpacaDevice& device);

    /// Disconnects a connected device before removing it
    void unregisterDevice(const std::string& deviceId);

    /**
     * @brief Connect a registered device; connecting a connected device
     * does nothing
     * @throws DeviceNotFoundException, TransportException,
     * AlpacaApiException
     */
    void connectDevice(const std::string& deviceId);

    /// Disconnect a device; disconnecting a disconnected device does nothing
    void disconnectDevice(const std::string& deviceId);

    [[nodiscard]] bool isDeviceConnected(const std::string& deviceId) const;

    [[nodiscard]] auto getDevice(const std::string& deviceId) const
        -> AlpacaDevice;

    [[nodiscard]] auto getManagedDevice(const std::string& deviceId) const
        -> ManagedDevice;

    /// Every registered device ordered by id
    [[nodiscard]] auto listDevices() const -> std::vector<AlpacaDevice>;

    // ==================== Telescope pools ====================

    /**
     * @brief Create or replace the pool of a telescope
     * @throws DeviceNotFoundException if any device id is unknown; the
     * existing pool is left untouched in that case
     */
    void registerTelescopeDevices(
        const std::string& telescopeId,
        const std::map<alpaca::DeviceRole, std::string>& devices);

    void unregisterTelescope(const std::string& telescopeId);

    /**
     * @throws DeviceNotFoundException if the telescope, the role or the
     * device behind it is unknown
     */
    [[nodiscard]] auto getTelescopeDevice(const std::string& telescopeId,
                                          alpaca::DeviceRole role) const
        -> AlpacaDevice;

    [[nodiscard]] size_t telescopeCount() const;

    // ==================== Health ====================

    /// Check every connected device once
    void runHealthChecks();

    [[nodiscard]] auto check() const -> HealthResult;

    [[nodiscard]] auto client() -> AlpacaClient& { return *client_; }

private:
    /// Entry mutexes guard bookkeeping only and are never held across a
    /// client call or while `mutex_` is held.
    struct Entry {
        mutable std::mutex mutex;
        ManagedDevice managed;
        /// Bumped by every connect and disconnect; a health result taken
        /// under an older generation is discarded
        std::uint64_t generation{0};
    };

    auto findEntry(const std::string& deviceId) const
        -> std::shared_ptr<Entry>;
    auto snapshotEntries() const -> std::vector<std::shared_ptr<Entry>>;
    /// Mark a connected entry disconnected; returns the device to release
    /// remotely, or nothing if it was not connected
    static auto markDisconnected(Entry& entry) -> std::optional<AlpacaDevice>;
    void releaseRemote(const AlpacaDevice& device, std::string_view context);
    void checkDeviceHealth(Entry& entry);
    void healthCheckLoop();

    std::shared_ptr<AlpacaClient> client_;
    std::chrono::milliseconds healthInterval_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Entry>> devices_;
    std::unordered_map<std::string,
                       std::map<alpaca::DeviceRole, std::string>>
        telescopes_;

    std::atomic<bool> running_{false};
    std::mutex loopMutex_;
    std::condition_variable loopCv_;
    std::thread healthThread_;
};

}  // namespace skygate::device

#endif  // SKYGATE_DEVICE_POOL_DEVICE_POOL_ENGINE_HPP
