/*
 * backend_dispatcher.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "backend_dispatcher.hpp"

#include <type_traits>

#include "atom/log/spdlog_logger.hpp"
#include "direct_backend.hpp"
#include "exception/exception.hpp"
#include "mqtt_backend.hpp"
#include "network_backend.hpp"

namespace skygate::server::backend {

BackendDispatcher::BackendDispatcher(
    std::shared_ptr<client::alpaca::HttpTransport> transport,
    std::shared_ptr<MessageBus> bus)
    : transport_(std::move(transport)), bus_(std::move(bus)) {}

BackendDispatcher::BackendDispatcher(BackendFactory factory)
    : factory_(std::move(factory)) {}

BackendDispatcher::~BackendDispatcher() { disconnectAll(); }

auto BackendDispatcher::createBackend(const VirtualDevice& device)
    -> std::shared_ptr<DeviceBackend> {
    if (factory_) {
        return factory_(device);
    }

    return std::visit(
        [&](const auto& cfg) -> std::shared_ptr<DeviceBackend> {
            using T = std::decay_t<decltype(cfg)>;

            if constexpr (std::is_same_v<T, NetworkBackendConfig>) {
                return std::make_shared<NetworkBackend>(cfg, transport_);
            } else if constexpr (std::is_same_v<T, MqttBackendConfig>) {
                return std::make_shared<MqttBackend>(
                    device.deviceType, device.deviceNumber, cfg, bus_);
            } else {
                static_assert(std::is_same_v<T, DirectBackendConfig>);
                return std::make_shared<DirectBackend>(cfg);
            }
        },
        device.backendConfig);
}

auto BackendDispatcher::backendFor(const VirtualDevice& device)
    -> std::shared_ptr<DeviceBackend> {
    std::lock_guard lock(mutex_);
    auto key = device.key();
    if (auto it = backends_.find(key); it != backends_.end()) {
        return it->second;
    }

    auto backend = createBackend(device);
    if (!backend) {
        THROW_BACKEND_EXCEPTION(BackendErrorKind::Unavailable, key,
                                "no backend available");
    }
    LOG_INFO("Created {} backend for {}", backend->name(), key);
    backends_.emplace(key, backend);
    return backend;
}

auto BackendDispatcher::connected(const VirtualDevice& device)
    -> std::shared_ptr<DeviceBackend> {
    auto backend = backendFor(device);
    if (!backend->isConnected()) {
        backend->connect();
    }
    return backend;
}

auto BackendDispatcher::get(const VirtualDevice& device,
                            const std::string& method, const Params& params)
    -> json {
    return connected(device)->get(method, params);
}

auto BackendDispatcher::put(const VirtualDevice& device,
                            const std::string& method, const Params& params)
    -> json {
    return connected(device)->put(method, params);
}

void BackendDispatcher::disconnectAll() {
    std::lock_guard lock(mutex_);
    for (auto& [key, backend] : backends_) {
        if (!backend->isConnected()) {
            continue;
        }
        try {
            backend->disconnect();
        } catch (const std::exception& e) {
            LOG_WARN("Failed to disconnect backend {}: {}", key, e.what());
        }
    }
}

size_t BackendDispatcher::backendCount() const {
    std::lock_guard lock(mutex_);
    return backends_.size();
}

json BackendDispatcher::metrics() const {
    std::lock_guard lock(mutex_);
    json result = json::object();
    for (const auto& [key, backend] : backends_) {
        auto entry = backend->metrics().toJson();
        entry["backend"] = backend->name();
        result[key] = std::move(entry);
    }
    return result;
}

}  // namespace skygate::server::backend
