/*
 * device.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "device.hpp"

#include <algorithm>
#include <cctype>

#include "alpaca/ascom_types.hpp"
#include "atom/log/spdlog_logger.hpp"
#include "exception/exception.hpp"
#include "server/transaction.hpp"
#include "server/utils/response.hpp"

namespace skygate::server::controller {

using ResponseBuilder = utils::ResponseBuilder;
using alpaca::ASCOMErrorCode;

namespace {

auto toLower(std::string value) -> std::string {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return value;
}

bool isCorrelationParam(const std::string& name) {
    auto lowered = toLower(name);
    return lowered == "clientid" || lowered == "clienttransactionid";
}

void appendParams(const crow::query_string& source, backend::Params& out) {
    for (const auto* key : source.keys()) {
        std::string name(key);
        if (isCorrelationParam(name)) {
            continue;
        }
        const char* value = source.get(name);
        out.emplace_back(name, value != nullptr ? value : "");
    }
}

}  // namespace

void DeviceController::registerRoutes(ServerApp& app) {
    LOG_INFO("Registering Alpaca device routes.");

    CROW_ROUTE(app, "/api/v1/<string>/<string>/<string>")
        .methods("GET"_method, "PUT"_method)(
            [this](const crow::request& req, crow::response& res,
                   std::string deviceType, std::string deviceNumber,
                   std::string method) {
                serve(req, res,
                      [&](const crow::request& r, crow::response& s,
                          middleware::RequestContext& ctx) {
                          handleDeviceRequest(r, s, ctx, deviceType,
                                              deviceNumber, method);
                      });
            });
}

void DeviceController::handleDeviceRequest(const crow::request& req,
                                           crow::response& res,
                                           middleware::RequestContext& ctx,
                                           const std::string& deviceType,
                                           const std::string& deviceNumber,
                                           const std::string& method) {
    auto number = parseInt32(deviceNumber);
    if (!number || *number < 0) {
        ResponseBuilder::error(res, ctx, ASCOMErrorCode::InvalidValue,
                               "Invalid device number: " + deviceNumber, 400);
        return;
    }

    auto device = registry_.find(toLower(deviceType), *number);
    if (!device) {
        ResponseBuilder::error(res, ctx, ASCOMErrorCode::NotImplemented,
                               "Device not found", 404);
        return;
    }

    const auto action = toLower(method);
    if (auto local = localValue(*device, action)) {
        ResponseBuilder::success(res, ctx, std::move(*local));
        return;
    }

    const bool isPut = req.method == crow::HTTPMethod::Put;
    const auto params = forwardParams(req);
    try {
        json value = isPut ? dispatcher_.put(*device, action, params)
                           : dispatcher_.get(*device, action, params);
        trackState(*device, action, isPut, params, value);
        ResponseBuilder::success(res, ctx, std::move(value));
    } catch (const BackendException& e) {
        LOG_WARN("{} {} on {} failed ({}): {}", isPut ? "PUT" : "GET", action,
                 device->key(), backendErrorKindName(e.kind()), e.detail());
        ResponseBuilder::error(res, ctx, e.ascomCode(), e.detail());
    } catch (const std::exception& e) {
        LOG_ERROR("{} on {} failed: {}", action, device->key(), e.what());
        ResponseBuilder::error(res, ctx, ASCOMErrorCode::UnspecifiedError,
                               e.what());
    }
}

auto DeviceController::localValue(const VirtualDevice& device,
                                  const std::string& method)
    -> std::optional<json> {
    if (method == "description") {
        return json(device.description);
    }
    if (method == "driverinfo") {
        return json(device.driverInfo);
    }
    if (method == "driverversion") {
        return json(device.driverVersion);
    }
    if (method == "interfaceversion") {
        return json(device.interfaceVersion);
    }
    if (method == "name") {
        return json(device.name);
    }
    if (method == "supportedactions") {
        return json::array();
    }
    return std::nullopt;
}

auto DeviceController::forwardParams(const crow::request& req)
    -> backend::Params {
    backend::Params params;
    if (req.method == crow::HTTPMethod::Put) {
        const auto& contentType = req.get_header_value("Content-Type");
        if (contentType.empty() ||
            contentType.find("application/x-www-form-urlencoded") !=
                std::string::npos) {
            appendParams(crow::query_string("?" + req.body), params);
        }
        return params;
    }
    appendParams(req.url_params, params);
    return params;
}

void DeviceController::trackState(const VirtualDevice& device,
                                  const std::string& method, bool isPut,
                                  const backend::Params& params,
                                  const json& value) {
    if (method == "connected") {
        if (isPut) {
            auto it = std::find_if(params.begin(), params.end(),
                                   [](const auto& param) {
                                       return toLower(param.first) ==
                                              "connected";
                                   });
            if (it != params.end()) {
                registry_.setConnected(device.deviceType, device.deviceNumber,
                                       toLower(it->second) == "true");
            }
        } else if (value.is_boolean()) {
            registry_.setConnected(device.deviceType, device.deviceNumber,
                                   value.get<bool>());
        }
    }
    if (!isPut) {
        registry_.updateState(device.deviceType, device.deviceNumber, method,
                              value);
    }
}

void FallbackController::registerRoutes(ServerApp& app) {
    CROW_CATCHALL_ROUTE(app)
    ([this](const crow::request& req, crow::response& res) {
        serve(req, res, &FallbackController::unknownEndpoint);
    });
}

void FallbackController::unknownEndpoint(const crow::request& req,
                                         crow::response& res,
                                         middleware::RequestContext& ctx) {
    LOG_DEBUG("No route for {} {}", crow::method_name(req.method), req.url);
    ResponseBuilder::error(res, ctx, ASCOMErrorCode::NotImplemented,
                           "Unknown endpoint", 404);
}

}  // namespace skygate::server::controller
