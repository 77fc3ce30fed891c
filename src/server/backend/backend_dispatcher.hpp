/*
 * backend_dispatcher.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-4

Description: Resolves a virtual device to its backend and forwards calls

**************************************************/

#ifndef SKYGATE_SERVER_BACKEND_BACKEND_DISPATCHER_HPP
#define SKYGATE_SERVER_BACKEND_BACKEND_DISPATCHER_HPP

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "device_backend.hpp"
#include "message_bus.hpp"
#include "server/device_registry.hpp"

namespace skygate::server::backend {

/**
 * @brief Per-device backend strategy
 *
 * Backends are created on first use, one per virtual device, and connected
 * before the first forwarded call. A backend that fails to connect is
 * retried on the next call.
 */
class BackendDispatcher {
public:
    using BackendFactory =
        std::function<std::shared_ptr<DeviceBackend>(const VirtualDevice&)>;

    /**
     * @param transport HTTP client of network backends
     * @param bus message bus of mqtt backends, may be null
     */
    BackendDispatcher(std::shared_ptr<client::alpaca::HttpTransport> transport,
                      std::shared_ptr<MessageBus> bus);

    /// Replace backend construction, used by tests
    explicit BackendDispatcher(BackendFactory factory);

    ~BackendDispatcher();

    BackendDispatcher(const BackendDispatcher&) = delete;
    BackendDispatcher& operator=(const BackendDispatcher&) = delete;

    /**
     * @brief Backend of a device, created on first request
     * @throws BackendException when the backend cannot be built
     */
    auto backendFor(const VirtualDevice& device)
        -> std::shared_ptr<DeviceBackend>;

    /// Forward a GET, connecting the backend first when needed
    auto get(const VirtualDevice& device, const std::string& method,
             const Params& params) -> json;

    /// Forward a PUT, connecting the backend first when needed
    auto put(const VirtualDevice& device, const std::string& method,
             const Params& params) -> json;

    void disconnectAll();

    [[nodiscard]] size_t backendCount() const;

    /// Metrics of every created backend keyed by device
    [[nodiscard]] json metrics() const;

private:
    auto createBackend(const VirtualDevice& device)
        -> std::shared_ptr<DeviceBackend>;
    auto connected(const VirtualDevice& device)
        -> std::shared_ptr<DeviceBackend>;

    std::shared_ptr<client::alpaca::HttpTransport> transport_;
    std::shared_ptr<MessageBus> bus_;
    BackendFactory factory_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<DeviceBackend>> backends_;
};

}  // namespace skygate::server::backend

#endif  // SKYGATE_SERVER_BACKEND_BACKEND_DISPATCHER_HPP
