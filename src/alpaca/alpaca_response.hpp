/*
 * alpaca_response.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-28

Description: ASCOM Alpaca response envelope

*************************************************/

#ifndef SKYGATE_ALPACA_ALPACA_RESPONSE_HPP
#define SKYGATE_ALPACA_ALPACA_RESPONSE_HPP

#include <cstdint>
#include <string>

#include "ascom_types.hpp"

namespace skygate::alpaca {

/**
 * @brief ASCOM Alpaca API response
 *
 * ErrorNumber is zero exactly when ErrorMessage is empty. Value is only
 * serialized for successful responses.
 */
struct AlpacaResponse {
    json value;
    std::int32_t clientTransactionId{0};
    std::int32_t serverTransactionId{0};
    int errorNumber{0};
    std::string errorMessage;

    [[nodiscard]] bool isSuccess() const { return errorNumber == 0; }

    static auto success(json value, std::int32_t clientTransactionId,
                        std::int32_t serverTransactionId) -> AlpacaResponse;

    /**
     * @brief Build an error envelope
     *
     * An errorNumber of zero is promoted to UnspecifiedError and an empty
     * message is filled with a generic description so the envelope never
     * reports a failure without both fields set.
     */
    static auto error(int errorNumber, std::string message,
                      std::int32_t clientTransactionId,
                      std::int32_t serverTransactionId) -> AlpacaResponse;

    [[nodiscard]] auto toJson() const -> json;

    static auto fromJson(const json& j) -> AlpacaResponse;
};

}  // namespace skygate::alpaca

#endif  // SKYGATE_ALPACA_ALPACA_RESPONSE_HPP
