/*
 * management.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "management.hpp"

#include "alpaca/ascom_types.hpp"
#include "atom/log/spdlog_logger.hpp"
#include "server/utils/response.hpp"

namespace skygate::server::controller {

using ResponseBuilder = utils::ResponseBuilder;

void ManagementController::registerRoutes(ServerApp& app) {
    LOG_INFO("Registering management routes.");

    CROW_ROUTE(app, "/management/apiversions")
        .methods("GET"_method)(
            [this](const crow::request& req, crow::response& res) {
                serve(req, res,
                      [this](const crow::request& r, crow::response& s,
                             middleware::RequestContext& ctx) {
                          apiVersions(r, s, ctx);
                      });
            });
    CROW_ROUTE(app, "/management/v1/description")
        .methods("GET"_method)(
            [this](const crow::request& req, crow::response& res) {
                serve(req, res,
                      [this](const crow::request& r, crow::response& s,
                             middleware::RequestContext& ctx) {
                          description(r, s, ctx);
                      });
            });
    CROW_ROUTE(app, "/management/v1/configureddevices")
        .methods("GET"_method)(
            [this](const crow::request& req, crow::response& res) {
                serve(req, res,
                      [this](const crow::request& r, crow::response& s,
                             middleware::RequestContext& ctx) {
                          configuredDevices(r, s, ctx);
                      });
            });
}

void ManagementController::apiVersions(const crow::request& /*req*/,
                                       crow::response& res,
                                       middleware::RequestContext& ctx) const {
    ResponseBuilder::success(res, ctx,
                             json::array({alpaca::kAlpacaApiVersion}));
}

void ManagementController::description(const crow::request& /*req*/,
                                       crow::response& res,
                                       middleware::RequestContext& ctx) const {
    ResponseBuilder::success(
        res, ctx,
        {{"ServerName", server_.serverName},
         {"Manufacturer", server_.manufacturer},
         {"ManufacturerVersion", server_.manufacturerVersion},
         {"Location", server_.location}});
}

void ManagementController::configuredDevices(
    const crow::request& /*req*/, crow::response& res,
    middleware::RequestContext& ctx) const {
    json devices = json::array();
    for (const auto& device : registry_.list()) {
        devices.push_back({{"DeviceName", device.name},
                           {"DeviceType", device.deviceType},
                           {"DeviceNumber", device.deviceNumber},
                           {"UniqueID", device.uniqueId}});
    }
    ResponseBuilder::success(res, ctx, std::move(devices));
}

}  // namespace skygate::server::controller
