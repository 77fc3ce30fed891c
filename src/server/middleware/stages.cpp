/*
 * stages.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "stages.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <chrono>

#include "alpaca/ascom_types.hpp"
#include "atom/log/spdlog_logger.hpp"
#include "server/utils/response.hpp"

namespace skygate::server::middleware {

namespace {

auto joinStrings(const std::vector<std::string>& items,
                 const std::string& separator) -> std::string {
    std::string joined;
    for (const auto& item : items) {
        if (!joined.empty()) {
            joined += separator;
        }
        joined += item;
    }
    return joined;
}

auto rawQuery(const crow::request& req) -> std::string {
    auto pos = req.raw_url.find('?');
    return pos == std::string::npos ? std::string{}
                                    : req.raw_url.substr(pos + 1);
}

/// Client transaction id of a request that may not have reached the
/// transaction stage yet
auto clientIdFor(const crow::request& req, RequestContext& ctx)
    -> std::int32_t {
    if (!ctx.transactionAssigned) {
        ctx.clientTransactionId = parseClientTransactionId(req);
    }
    return ctx.clientTransactionId;
}

}  // namespace

// ==================== Recovery ====================

void Recovery::handle(const crow::request& req, crow::response& res,
                      RequestContext& ctx, const Next& next) {
    try {
        next();
    } catch (const std::exception& e) {
        fail(req, res, ctx, e.what());
    } catch (...) {
        fail(req, res, ctx, "non-standard exception");
    }
}

void Recovery::fail(const crow::request& req, crow::response& res,
                    RequestContext& ctx, const std::string& detail) {
    LOG_ERROR("Recovered from fault in {} {}: {}",
              crow::method_name(req.method), req.url, detail);
    clientIdFor(req, ctx);
    utils::ResponseBuilder::error(res, ctx,
                                  alpaca::ASCOMErrorCode::UnspecifiedError,
                                  "Internal server error", 500);
    ctx.error = detail;
}

// ==================== Request logging ====================

auto statusLogLevel(int status) -> spdlog::level::level_enum {
    if (status >= 500) {
        return spdlog::level::err;
    }
    if (status >= 400) {
        return spdlog::level::warn;
    }
    return spdlog::level::debug;
}

void RequestLogger::handle(const crow::request& req, crow::response& res,
                           RequestContext& ctx, const Next& next) {
    auto start = std::chrono::steady_clock::now();
    const auto method = crow::method_name(req.method);
    LOG_INFO("Incoming request: {} {} query='{}' client={}", method, req.url,
             rawQuery(req), req.remote_ip_address);

    auto complete = [&](int status) {
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        auto level = statusLogLevel(status);
        if (level == spdlog::level::debug) {
            spdlog::log(level, "Request completed: {} {} - Status: {} - "
                        "Duration: {}ms",
                        method, req.url, status, duration.count());
        } else {
            spdlog::log(level, "Request failed: {} {} - Status: {} - "
                        "Duration: {}ms - Error: {}",
                        method, req.url, status, duration.count(), ctx.error);
        }
    };

    try {
        next();
    } catch (...) {
        complete(500);
        throw;
    }
    complete(res.code);
}

// ==================== CORS ====================

auto Cors::allowedOrigin(const std::string& origin) const
    -> std::optional<std::string> {
    for (const auto& allowed : config_.allowedOrigins) {
        if (allowed == "*") {
            return allowed;
        }
        if (allowed == origin) {
            return origin;
        }
    }
    return std::nullopt;
}

void Cors::handle(const crow::request& req, crow::response& res,
                  RequestContext& /*ctx*/, const Next& next) {
    const auto& origin = req.get_header_value("Origin");
    if (auto allowed = allowedOrigin(origin)) {
        res.set_header("Access-Control-Allow-Origin", *allowed);
        res.set_header("Access-Control-Allow-Methods",
                       joinStrings(config_.allowedMethods, ", "));
        res.set_header("Access-Control-Allow-Headers",
                       joinStrings(config_.allowedHeaders, ", "));
        if (config_.allowCredentials) {
            res.set_header("Access-Control-Allow-Credentials", "true");
        }
        res.set_header("Access-Control-Max-Age",
                       std::to_string(config_.maxAge));
    }

    if (req.method == crow::HTTPMethod::Options) {
        utils::ResponseBuilder::noContent(res);
        return;
    }
    next();
}

// ==================== Basic authentication ====================

auto parseBasicAuth(const std::string& header)
    -> std::optional<std::pair<std::string, std::string>> {
    constexpr std::string_view prefix = "Basic ";
    if (header.size() < prefix.size()) {
        return std::nullopt;
    }
    for (size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(header[i])) !=
            std::tolower(static_cast<unsigned char>(prefix[i]))) {
            return std::nullopt;
        }
    }

    std::string encoded = header.substr(prefix.size());
    std::string decoded = crow::utility::base64decode(encoded, encoded.size());
    auto colon = decoded.find(':');
    if (colon == std::string::npos) {
        return std::nullopt;
    }
    return std::make_pair(decoded.substr(0, colon), decoded.substr(colon + 1));
}

void BasicAuth::handle(const crow::request& req, crow::response& res,
                       RequestContext& ctx, const Next& next) {
    if (!config_.enabled) {
        next();
        return;
    }

    auto credentials = parseBasicAuth(req.get_header_value("Authorization"));
    if (!credentials || credentials->first != config_.username ||
        credentials->second != config_.password) {
        LOG_WARN("Request to {} rejected: invalid or missing credentials",
                 req.url);
        clientIdFor(req, ctx);
        res.set_header("WWW-Authenticate",
                       "Basic realm=\"" + config_.realm + "\"");
        utils::ResponseBuilder::error(
            res, ctx, alpaca::ASCOMErrorCode::UnspecifiedError,
            "Authentication required", 401);
        return;
    }

    ctx.authenticated = true;
    next();
}

// ==================== Transaction ids ====================

void TransactionAssigner::handle(const crow::request& req,
                                 crow::response& /*res*/, RequestContext& ctx,
                                 const Next& next) {
    ctx.clientTransactionId = parseClientTransactionId(req);
    ctx.serverTransactionId = counter_.next();
    ctx.transactionAssigned = true;
    next();
}

auto buildDefaultChain(const config::ReflectorConfig& config,
                       TransactionCounter& counter) -> MiddlewareChain {
    MiddlewareChain chain;
    chain.use(std::make_shared<Recovery>())
        .use(std::make_shared<RequestLogger>());
    if (config.cors.enabled) {
        chain.use(std::make_shared<Cors>(config.cors));
    }
    chain.use(std::make_shared<BasicAuth>(config.authentication))
        .use(std::make_shared<TransactionAssigner>(counter));
    return chain;
}

}  // namespace skygate::server::middleware
