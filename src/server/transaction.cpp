/*
 * transaction.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "transaction.hpp"

#include <charconv>
#include <string>

#include "alpaca/ascom_types.hpp"

namespace skygate::server {

auto parseInt32(std::string_view text) -> std::optional<std::int32_t> {
    if (text.empty()) {
        return std::nullopt;
    }
    // Clients may send an explicit '+' sign, which from_chars rejects
    if (text.front() == '+') {
        text.remove_prefix(1);
        if (text.empty() || text.front() == '-') {
            return std::nullopt;
        }
    }

    std::int32_t value = 0;
    const auto* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

auto findRequestParam(const crow::request& req, const std::string& name)
    -> std::optional<std::string> {
    if (const char* value = req.url_params.get(name)) {
        return std::string(value);
    }

    if (req.body.empty()) {
        return std::nullopt;
    }
    const auto& contentType = req.get_header_value("Content-Type");
    if (!contentType.empty() &&
        contentType.find("application/x-www-form-urlencoded") ==
            std::string::npos) {
        return std::nullopt;
    }

    crow::query_string form("?" + req.body);
    if (const char* value = form.get(name)) {
        return std::string(value);
    }
    return std::nullopt;
}

auto parseClientTransactionId(const crow::request& req) -> std::int32_t {
    auto raw = findRequestParam(req, "ClientTransactionID");
    if (!raw || raw->empty()) {
        return 0;
    }
    return parseInt32(*raw).value_or(0);
}

}  // namespace skygate::server
