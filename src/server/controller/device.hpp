/*
 * device.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-8

Description: Alpaca device API forwarded to the device backends

**************************************************/

#ifndef SKYGATE_SERVER_CONTROLLER_DEVICE_HPP
#define SKYGATE_SERVER_CONTROLLER_DEVICE_HPP

#include <optional>
#include <string>

#include "controller.hpp"
#include "server/backend/backend_dispatcher.hpp"
#include "server/device_registry.hpp"

namespace skygate::server::controller {

/**
 * @brief `GET|PUT /api/v1/{type}/{number}/{method}`
 *
 * Identity methods (description, driverinfo, driverversion,
 * interfaceversion, name, supportedactions) are answered from the
 * registry. Everything else goes to the device backend.
 */
class DeviceController : public Controller {
public:
    DeviceController(const middleware::MiddlewareChain& chain,
                     DeviceRegistry& registry,
                     backend::BackendDispatcher& dispatcher)
        : Controller(chain), registry_(registry), dispatcher_(dispatcher) {}

    void registerRoutes(ServerApp& app) override;

    void handleDeviceRequest(const crow::request& req, crow::response& res,
                             middleware::RequestContext& ctx,
                             const std::string& deviceType,
                             const std::string& deviceNumber,
                             const std::string& method);

    /// Answer for identity methods, nullopt for forwarded ones
    static auto localValue(const VirtualDevice& device,
                           const std::string& method) -> std::optional<json>;

    /**
     * @brief Query (GET) or form (PUT) parameters of a request without the
     * ClientID and ClientTransactionID correlation fields
     */
    static auto forwardParams(const crow::request& req) -> backend::Params;

private:
    void trackState(const VirtualDevice& device, const std::string& method,
                    bool isPut, const backend::Params& params,
                    const json& value);

    DeviceRegistry& registry_;
    backend::BackendDispatcher& dispatcher_;
};

/**
 * @brief Envelope 0x400 "Unknown endpoint" with HTTP 404 for every route
 * nobody registered
 */
class FallbackController : public Controller {
public:
    using Controller::Controller;

    void registerRoutes(ServerApp& app) override;

    static void unknownEndpoint(const crow::request& req, crow::response& res,
                                middleware::RequestContext& ctx);
};

}  // namespace skygate::server::controller

#endif  // SKYGATE_SERVER_CONTROLLER_DEVICE_HPP
