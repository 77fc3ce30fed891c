#ifndef SKYGATE_SERVER_APP_HPP
#define SKYGATE_SERVER_APP_HPP

#include <crow.h>

#include "middleware/preflight.hpp"

namespace skygate::server {

/**
 * @brief Central HTTP application type
 *
 * The request pipeline itself runs inside each route through a
 * middleware::MiddlewareChain. The only Crow-level middleware hands
 * OPTIONS requests, which Crow answers without calling a route, to that
 * same chain.
 */
using ServerApp = crow::App<middleware::PreflightCors>;

}  // namespace skygate::server

#endif  // SKYGATE_SERVER_APP_HPP
