/*
 * network_backend.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-3

Description: Backend forwarding ASCOM calls to a remote Alpaca server

**************************************************/

#ifndef SKYGATE_SERVER_BACKEND_NETWORK_BACKEND_HPP
#define SKYGATE_SERVER_BACKEND_NETWORK_BACKEND_HPP

#include <atomic>
#include <memory>
#include <string>

#include "backend_config.hpp"
#include "device_backend.hpp"

namespace skygate::server::backend {

/**
 * @brief Remote Alpaca proxy
 *
 * Calls go to `{server_url}/api/v1/{remote_type}/{remote_number}/{method}`.
 * Transport and protocol failures are retried up to `retryAttempts` more
 * times with a delay of `retryDelay * 2^attempt`. A non-zero ErrorNumber
 * from the remote device is returned on the first occurrence.
 */
class NetworkBackend : public DeviceBackend {
public:
    /**
     * @throws BackendException (Unavailable) when no server URL is set
     */
    NetworkBackend(NetworkBackendConfig config,
                   std::shared_ptr<client::alpaca::HttpTransport> transport);

    [[nodiscard]] std::string_view name() const override { return "network"; }

    void connect() override;
    void disconnect() override;
    [[nodiscard]] bool isConnected() const override { return connected_; }

    auto get(const std::string& method, const Params& params) -> json override;
    auto put(const std::string& method, const Params& params) -> json override;

    void healthCheck() override;

    [[nodiscard]] BackendMetrics metrics() const override {
        return metrics_.snapshot();
    }

    [[nodiscard]] const NetworkBackendConfig& config() const {
        return config_;
    }

    [[nodiscard]] std::string buildUrl(const std::string& method) const;

private:
    auto execute(client::alpaca::HttpMethod method, const std::string& name,
                 const Params& params) -> json;
    auto doRequest(const client::alpaca::HttpRequest& request) -> json;

    NetworkBackendConfig config_;
    std::shared_ptr<client::alpaca::HttpTransport> transport_;
    std::atomic<bool> connected_{false};
    MetricsRecorder metrics_;
};

}  // namespace skygate::server::backend

#endif  // SKYGATE_SERVER_BACKEND_NETWORK_BACKEND_HPP
