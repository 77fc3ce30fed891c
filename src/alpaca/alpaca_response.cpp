/*
 * alpaca_response.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "alpaca_response.hpp"

#include <utility>

namespace skygate::alpaca {

auto AlpacaResponse::success(json value, std::int32_t clientTransactionId,
                             std::int32_t serverTransactionId)
    -> AlpacaResponse {
    AlpacaResponse resp;
    resp.value = std::move(value);
    resp.clientTransactionId = clientTransactionId;
    resp.serverTransactionId = serverTransactionId;
    return resp;
}

auto AlpacaResponse::error(int errorNumber, std::string message,
                           std::int32_t clientTransactionId,
                           std::int32_t serverTransactionId)
    -> AlpacaResponse {
    AlpacaResponse resp;
    resp.errorNumber =
        errorNumber == 0 ? ASCOMErrorCode::UnspecifiedError : errorNumber;
    resp.errorMessage = message.empty() ? "Unspecified error" : std::move(message);
    resp.clientTransactionId = clientTransactionId;
    resp.serverTransactionId = serverTransactionId;
    return resp;
}

auto AlpacaResponse::toJson() const -> json {
    json j;
    if (errorNumber == 0) {
        j["Value"] = value;
    }
    j["ClientTransactionID"] = clientTransactionId;
    j["ServerTransactionID"] = serverTransactionId;
    j["ErrorNumber"] = errorNumber;
    j["ErrorMessage"] = errorNumber == 0 ? std::string{} : errorMessage;
    return j;
}

auto AlpacaResponse::fromJson(const json& j) -> AlpacaResponse {
    AlpacaResponse resp;
    resp.clientTransactionId = j.value("ClientTransactionID", 0);
    resp.serverTransactionId = j.value("ServerTransactionID", 0);
    resp.errorNumber = j.value("ErrorNumber", 0);
    resp.errorMessage = j.value("ErrorMessage", "");
    if (j.contains("Value")) {
        resp.value = j["Value"];
    }
    return resp;
}

}  // namespace skygate::alpaca
