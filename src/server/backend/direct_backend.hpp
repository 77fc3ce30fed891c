/*
 * direct_backend.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef SKYGATE_SERVER_BACKEND_DIRECT_BACKEND_HPP
#define SKYGATE_SERVER_BACKEND_DIRECT_BACKEND_HPP

#include "backend_config.hpp"
#include "device_backend.hpp"

namespace skygate::server::backend {

/**
 * @brief Serial/USB backend placeholder, every operation is NotImplemented
 */
class DirectBackend : public DeviceBackend {
public:
    explicit DirectBackend(DirectBackendConfig config)
        : config_(std::move(config)) {}

    [[nodiscard]] std::string_view name() const override { return "direct"; }

    void connect() override;
    void disconnect() override {}
    [[nodiscard]] bool isConnected() const override { return false; }

    auto get(const std::string& method, const Params& params) -> json override;
    auto put(const std::string& method, const Params& params) -> json override;

    void healthCheck() override;

    [[nodiscard]] BackendMetrics metrics() const override { return {}; }

private:
    [[noreturn]] void unsupported(const std::string& operation) const;

    DirectBackendConfig config_;
};

}  // namespace skygate::server::backend

#endif  // SKYGATE_SERVER_BACKEND_DIRECT_BACKEND_HPP
