#ifndef SKYGATE_SERVER_UTILS_RESPONSE_HPP
#define SKYGATE_SERVER_UTILS_RESPONSE_HPP

#include <crow.h>
#include <string>

#include "alpaca/alpaca_response.hpp"
#include "server/middleware/chain.hpp"

namespace skygate::server::utils {

using json = nlohmann::json;

/**
 * @brief Helpers writing the Alpaca envelope into a Crow response
 *
 * Headers already set on the response (CORS) are preserved; only the
 * status, content type and body are replaced.
 */
class ResponseBuilder {
public:
    static void writeJson(crow::response& res, int httpCode,
                          const json& body) {
        res.code = httpCode;
        res.set_header("Content-Type", "application/json");
        res.body = body.dump();
    }

    static void writeEnvelope(crow::response& res,
                              const alpaca::AlpacaResponse& envelope,
                              int httpCode = 200) {
        writeJson(res, httpCode, envelope.toJson());
    }

    /**
     * @brief Successful envelope carrying the request's transaction ids
     */
    static void success(crow::response& res,
                        const middleware::RequestContext& ctx, json value) {
        writeEnvelope(res, alpaca::AlpacaResponse::success(
                               std::move(value), ctx.clientTransactionId,
                               ctx.serverTransactionId));
    }

    /**
     * @brief Error envelope; ASCOM errors keep HTTP 200 unless told
     * otherwise
     */
    static void error(crow::response& res, middleware::RequestContext& ctx,
                      int errorNumber, const std::string& message,
                      int httpCode = 200) {
        ctx.error = message;
        writeEnvelope(res,
                      alpaca::AlpacaResponse::error(errorNumber, message,
                                                    ctx.clientTransactionId,
                                                    ctx.serverTransactionId),
                      httpCode);
    }

    /**
     * @brief Empty 204 response
     */
    static void noContent(crow::response& res) {
        res.code = 204;
        res.body.clear();
    }
};

}  // namespace skygate::server::utils

#endif  // SKYGATE_SERVER_UTILS_RESPONSE_HPP
