/*
 * http_transport.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-3

Description: HTTP transport used by the Alpaca client and the network
backend

*************************************************/

#ifndef SKYGATE_CLIENT_ALPACA_HTTP_TRANSPORT_HPP
#define SKYGATE_CLIENT_ALPACA_HTTP_TRANSPORT_HPP

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace skygate::client::alpaca {

/**
 * @brief HTTP request method
 */
enum class HttpMethod { GET, PUT };

auto methodToString(HttpMethod method) -> const char*;

/// Ordered name/value pairs sent as a query string or a form body
using FormParams = std::vector<std::pair<std::string, std::string>>;

struct HttpRequest {
    HttpMethod method{HttpMethod::GET};
    std::string url;
    std::string body;
    std::string contentType;
    std::chrono::milliseconds timeout{std::chrono::seconds(30)};
};

struct HttpResponse {
    long statusCode{0};
    std::string body;
};

/**
 * @brief Percent-encode a string for a query string or form body
 */
auto urlEncode(const std::string& str) -> std::string;

/**
 * @brief Encode parameters as application/x-www-form-urlencoded
 */
auto encodeForm(const FormParams& params) -> std::string;

/**
 * @brief Blocking HTTP exchange
 *
 * Implementations throw TransportException with status 0 when no response
 * arrives. Any HTTP status is returned to the caller, which decides what
 * counts as a failure.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual auto perform(const HttpRequest& request) -> HttpResponse = 0;
};

/**
 * @brief libcurl implementation, one easy handle per request
 */
class CurlTransport : public HttpTransport {
public:
    explicit CurlTransport(std::string userAgent = "skygate/1.0");
    ~CurlTransport() override;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    auto perform(const HttpRequest& request) -> HttpResponse override;

private:
    std::string userAgent_;
};

}  // namespace skygate::client::alpaca

#endif  // SKYGATE_CLIENT_ALPACA_HTTP_TRANSPORT_HPP
