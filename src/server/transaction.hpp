/*
 * transaction.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-1

Description: Alpaca transaction id handling

**************************************************/

#ifndef SKYGATE_SERVER_TRANSACTION_HPP
#define SKYGATE_SERVER_TRANSACTION_HPP

#include <cstdint>
#include <optional>
#include <string_view>

#include <crow.h>

#include "alpaca/transaction_counter.hpp"

namespace skygate::server {

using TransactionCounter = alpaca::TransactionCounter;

/**
 * @brief Parse a decimal int32, rejecting trailing garbage and overflow
 */
auto parseInt32(std::string_view text) -> std::optional<std::int32_t>;

/**
 * @brief Look up a parameter in the query string, then in a form body
 *
 * Alpaca clients send GET parameters in the query and PUT parameters as
 * application/x-www-form-urlencoded. Parameter names are matched exactly.
 */
auto findRequestParam(const crow::request& req, const std::string& name)
    -> std::optional<std::string>;

/**
 * @brief ClientTransactionID of a request, 0 when absent or malformed
 */
auto parseClientTransactionId(const crow::request& req) -> std::int32_t;

}  // namespace skygate::server

#endif  // SKYGATE_SERVER_TRANSACTION_HPP
