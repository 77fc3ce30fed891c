/*
 * alpaca_server.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-9

Description: ASCOM Alpaca reflector server

**************************************************/

#ifndef SKYGATE_SERVER_ALPACA_SERVER_HPP
#define SKYGATE_SERVER_ALPACA_SERVER_HPP

#include <atomic>
#include <memory>
#include <vector>

#include "app.hpp"
#include "backend/backend_dispatcher.hpp"
#include "backend/message_bus.hpp"
#include "client/alpaca/http_transport.hpp"
#include "config/server_config.hpp"
#include "controller/controller.hpp"
#include "device_registry.hpp"
#include "discovery.hpp"
#include "middleware/chain.hpp"
#include "transaction.hpp"

namespace skygate::server {

/**
 * @brief Reflector exposing configured virtual devices over the Alpaca
 * discovery protocol and REST API
 *
 * Owns the device registry, the backend dispatcher, the discovery
 * responder and the Crow application.
 */
class AlpacaServer {
public:
    /**
     * @param config validated configuration
     * @param transport HTTP client used by network backends
     * @param bus message bus used by mqtt backends; without one, mqtt
     * devices answer NotConnected
     * @throws InvalidConfigException when the device list is rejected
     */
    explicit AlpacaServer(
        config::ReflectorConfig config,
        std::shared_ptr<client::alpaca::HttpTransport> transport =
            std::make_shared<client::alpaca::CurlTransport>(),
        std::shared_ptr<backend::MessageBus> bus = nullptr);

    ~AlpacaServer();

    AlpacaServer(const AlpacaServer&) = delete;
    AlpacaServer& operator=(const AlpacaServer&) = delete;

    /**
     * @brief Start discovery, then serve HTTP until stop() is called
     */
    void start();

    /**
     * @brief Stop HTTP and discovery and disconnect every backend
     */
    void stop();

    [[nodiscard]] ServerApp& getApp() { return app_; }
    [[nodiscard]] const DeviceRegistry& registry() const { return registry_; }
    [[nodiscard]] backend::BackendDispatcher& dispatcher() {
        return dispatcher_;
    }
    [[nodiscard]] const middleware::MiddlewareChain& chain() const {
        return chain_;
    }
    [[nodiscard]] const config::ReflectorConfig& config() const {
        return config_;
    }

private:
    void initializeControllers();
    void configureListener();

    config::ReflectorConfig config_;
    DeviceRegistry registry_;
    backend::BackendDispatcher dispatcher_;
    TransactionCounter counter_;
    middleware::MiddlewareChain chain_;
    DiscoveryResponder discovery_;
    ServerApp app_;
    std::vector<std::unique_ptr<controller::Controller>> controllers_;
    std::atomic<bool> stopped_{false};
};

}  // namespace skygate::server

#endif  // SKYGATE_SERVER_ALPACA_SERVER_HPP
