/*
 * stages.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-5

Description: Recovery, logging, CORS, Basic auth and transaction stages

**************************************************/

#ifndef SKYGATE_SERVER_MIDDLEWARE_STAGES_HPP
#define SKYGATE_SERVER_MIDDLEWARE_STAGES_HPP

#include <optional>
#include <string>
#include <utility>

#include <spdlog/common.h>

#include "chain.hpp"
#include "config/server_config.hpp"
#include "server/transaction.hpp"

namespace skygate::server::middleware {

/**
 * @brief Turns any exception thrown further down into HTTP 500 with an
 * UnspecifiedError envelope
 */
class Recovery : public Middleware {
public:
    [[nodiscard]] std::string_view name() const override { return "recovery"; }

    void handle(const crow::request& req, crow::response& res,
                RequestContext& ctx, const Next& next) override;

private:
    static void fail(const crow::request& req, crow::response& res,
                     RequestContext& ctx, const std::string& detail);
};

/**
 * @brief Log level of a completed request: debug below 400, warn for 4xx,
 * error from 500
 */
auto statusLogLevel(int status) -> spdlog::level::level_enum;

/**
 * @brief Logs each request on entry and its outcome on exit
 */
class RequestLogger : public Middleware {
public:
    [[nodiscard]] std::string_view name() const override { return "logging"; }

    void handle(const crow::request& req, crow::response& res,
                RequestContext& ctx, const Next& next) override;
};

/**
 * @brief Cross-origin headers and preflight short-circuit
 *
 * OPTIONS requests are answered with 204 here and never reach the later
 * stages.
 */
class Cors : public Middleware {
public:
    explicit Cors(config::CorsConfig config) : config_(std::move(config)) {}

    [[nodiscard]] std::string_view name() const override { return "cors"; }

    void handle(const crow::request& req, crow::response& res,
                RequestContext& ctx, const Next& next) override;

    /**
     * @brief Value of Access-Control-Allow-Origin for a request origin
     *
     * The first configured entry equal to the origin or to `*` wins.
     */
    [[nodiscard]] auto allowedOrigin(const std::string& origin) const
        -> std::optional<std::string>;

private:
    config::CorsConfig config_;
};

/**
 * @brief Username and password from a `Basic` Authorization header
 */
auto parseBasicAuth(const std::string& header)
    -> std::optional<std::pair<std::string, std::string>>;

/**
 * @brief HTTP Basic authentication against one configured account
 *
 * Failures answer 401 with a WWW-Authenticate challenge and an
 * UnspecifiedError envelope; the handler is not called.
 */
class BasicAuth : public Middleware {
public:
    explicit BasicAuth(config::AuthConfig config)
        : config_(std::move(config)) {}

    [[nodiscard]] std::string_view name() const override { return "auth"; }

    void handle(const crow::request& req, crow::response& res,
                RequestContext& ctx, const Next& next) override;

private:
    config::AuthConfig config_;
};

/**
 * @brief Assigns the client and server transaction ids
 */
class TransactionAssigner : public Middleware {
public:
    explicit TransactionAssigner(TransactionCounter& counter)
        : counter_(counter) {}

    [[nodiscard]] std::string_view name() const override {
        return "transaction";
    }

    void handle(const crow::request& req, crow::response& res,
                RequestContext& ctx, const Next& next) override;

private:
    TransactionCounter& counter_;
};

/**
 * @brief recovery, logging, CORS (when enabled), auth, transaction
 */
auto buildDefaultChain(const config::ReflectorConfig& config,
                       TransactionCounter& counter) -> MiddlewareChain;

}  // namespace skygate::server::middleware

#endif  // SKYGATE_SERVER_MIDDLEWARE_STAGES_HPP
