/*
 * device_backend.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-3

Description: Transport-independent interface of a virtual device backend

**************************************************/

#ifndef SKYGATE_SERVER_BACKEND_DEVICE_BACKEND_HPP
#define SKYGATE_SERVER_BACKEND_DEVICE_BACKEND_HPP

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>

#include "atom/type/json.hpp"
#include "client/alpaca/http_transport.hpp"

namespace skygate::server::backend {

using json = nlohmann::json;
using Params = client::alpaca::FormParams;

enum class ConnectionState { Disconnected, Connected, Error };

auto connectionStateToString(ConnectionState state) -> std::string_view;

/**
 * @brief Request statistics of one backend
 */
struct BackendMetrics {
    std::uint64_t totalRequests{0};
    std::uint64_t successfulRequests{0};
    std::uint64_t failedRequests{0};
    std::chrono::system_clock::time_point lastRequestTime{};
    std::chrono::system_clock::time_point lastSuccessTime{};
    std::chrono::system_clock::time_point lastFailureTime{};
    /// Exponential moving average, the first sample is taken as is
    double averageLatencyMs{0.0};
    ConnectionState connectionState{ConnectionState::Disconnected};
    std::string lastError;

    void recordRequest(std::chrono::milliseconds latency, bool success);
    void setConnectionState(ConnectionState state,
                            const std::string& error = {});

    [[nodiscard]] json toJson() const;
};

/**
 * @brief Thread-safe holder shared by the backend implementations
 */
class MetricsRecorder {
public:
    void record(std::chrono::steady_clock::time_point start, bool success);
    void setConnectionState(ConnectionState state,
                            const std::string& error = {});
    [[nodiscard]] BackendMetrics snapshot() const;

private:
    mutable std::mutex mutex_;
    BackendMetrics metrics_;
};

/**
 * @brief Strategy that realizes a virtual device against real hardware
 *
 * get() and put() return the `Value` of a successful call and throw
 * BackendException on failure.
 */
class DeviceBackend {
public:
    virtual ~DeviceBackend() = default;

    /// `network`, `mqtt` or `direct`
    [[nodiscard]] virtual std::string_view name() const = 0;

    virtual void connect() = 0;
    virtual void disconnect() = 0;
    [[nodiscard]] virtual bool isConnected() const = 0;

    virtual auto get(const std::string& method, const Params& params)
        -> json = 0;
    virtual auto put(const std::string& method, const Params& params)
        -> json = 0;

    /// Throws BackendException when the device is unreachable
    virtual void healthCheck() = 0;

    [[nodiscard]] virtual BackendMetrics metrics() const = 0;
};

}  // namespace skygate::server::backend

#endif  // SKYGATE_SERVER_BACKEND_DEVICE_BACKEND_HPP
