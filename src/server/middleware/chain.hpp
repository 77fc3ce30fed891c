/*
 * chain.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-5

Description: Ordered request pipeline wrapped around every Alpaca handler

**************************************************/

#ifndef SKYGATE_SERVER_MIDDLEWARE_CHAIN_HPP
#define SKYGATE_SERVER_MIDDLEWARE_CHAIN_HPP

#include <crow.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace skygate::server::middleware {

/**
 * @brief Request-scoped state shared by the stages and the handler
 */
struct RequestContext {
    std::int32_t clientTransactionId{0};
    /// 0 until the transaction stage has run
    std::int32_t serverTransactionId{0};
    bool transactionAssigned{false};
    bool authenticated{false};
    /// Failure detail reported by the request logger
    std::string error;
};

using Handler = std::function<void(const crow::request&, crow::response&,
                                   RequestContext&)>;
using Next = std::function<void()>;

/**
 * @brief One stage of the pipeline
 *
 * A stage either calls next() to hand the request on, or writes the
 * response itself and returns without calling it.
 */
class Middleware {
public:
    virtual ~Middleware() = default;

    [[nodiscard]] virtual std::string_view name() const = 0;

    virtual void handle(const crow::request& req, crow::response& res,
                        RequestContext& ctx, const Next& next) = 0;
};

/**
 * @brief Stages run in insertion order, each wrapping the rest
 */
class MiddlewareChain {
public:
    auto use(std::shared_ptr<Middleware> stage) -> MiddlewareChain&;

    void run(const crow::request& req, crow::response& res,
             RequestContext& ctx, const Handler& handler) const;

    void run(const crow::request& req, crow::response& res,
             const Handler& handler) const;

    [[nodiscard]] auto stageNames() const -> std::vector<std::string>;

    [[nodiscard]] size_t size() const { return stages_.size(); }

private:
    void dispatch(size_t index, const crow::request& req, crow::response& res,
                  RequestContext& ctx, const Handler& handler) const;

    std::vector<std::shared_ptr<Middleware>> stages_;
};

}  // namespace skygate::server::middleware

#endif  // SKYGATE_SERVER_MIDDLEWARE_CHAIN_HPP
