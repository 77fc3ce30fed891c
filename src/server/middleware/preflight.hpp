/*
 * preflight.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-6

Description: Crow middleware routing OPTIONS requests through the
request pipeline

**************************************************/

#ifndef SKYGATE_SERVER_MIDDLEWARE_PREFLIGHT_HPP
#define SKYGATE_SERVER_MIDDLEWARE_PREFLIGHT_HPP

#include <crow.h>

#include "chain.hpp"
#include "server/utils/response.hpp"

namespace skygate::server::middleware {

/**
 * @brief Crow answers OPTIONS itself without calling a route handler, so
 * preflight requests are run through the pipeline after Crow is done
 * with them.
 */
struct PreflightCors {
    struct context {};

    const MiddlewareChain* chain{nullptr};

    void before_handle(crow::request& /*req*/, crow::response& /*res*/,
                       context& /*ctx*/) {}

    void after_handle(crow::request& req, crow::response& res,
                      context& /*ctx*/) {
        if (req.method != crow::HTTPMethod::Options || chain == nullptr) {
            return;
        }
        chain->run(req, res,
                   [](const crow::request&, crow::response& response,
                      RequestContext&) {
                       utils::ResponseBuilder::noContent(response);
                   });
    }
};

}  // namespace skygate::server::middleware

#endif  // SKYGATE_SERVER_MIDDLEWARE_PREFLIGHT_HPP
