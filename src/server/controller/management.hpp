/*
 * management.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-8

Description: Alpaca management API

**************************************************/

#ifndef SKYGATE_SERVER_CONTROLLER_MANAGEMENT_HPP
#define SKYGATE_SERVER_CONTROLLER_MANAGEMENT_HPP

#include "config/server_config.hpp"
#include "controller.hpp"
#include "server/device_registry.hpp"

namespace skygate::server::controller {

/**
 * @brief `/management/apiversions`, `/management/v1/description` and
 * `/management/v1/configureddevices`
 */
class ManagementController : public Controller {
public:
    ManagementController(const middleware::MiddlewareChain& chain,
                         const config::ServerConfig& server,
                         const DeviceRegistry& registry)
        : Controller(chain), server_(server), registry_(registry) {}

    void registerRoutes(ServerApp& app) override;

    void apiVersions(const crow::request& req, crow::response& res,
                     middleware::RequestContext& ctx) const;

    void description(const crow::request& req, crow::response& res,
                     middleware::RequestContext& ctx) const;

    void configuredDevices(const crow::request& req, crow::response& res,
                           middleware::RequestContext& ctx) const;

private:
    const config::ServerConfig& server_;
    const DeviceRegistry& registry_;
};

}  // namespace skygate::server::controller

#endif  // SKYGATE_SERVER_CONTROLLER_MANAGEMENT_HPP
