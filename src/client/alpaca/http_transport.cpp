/*
 * http_transport.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "http_transport.hpp"

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <cctype>
#include <iomanip>
#include <memory>
#include <mutex>
#include <sstream>

#include "exception/exception.hpp"

namespace skygate::client::alpaca {

namespace {

std::once_flag curlInitFlag;

size_t writeCallback(void* contents, size_t size, size_t nmemb,
                     std::string* userp) {
    size_t totalSize = size * nmemb;
    userp->append(static_cast<char*>(contents), totalSize);
    return totalSize;
}

struct CurlHandleDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct CurlListDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

}  // namespace

auto methodToString(HttpMethod method) -> const char* {
    switch (method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::PUT: return "PUT";
    }
    return "GET";
}

auto urlEncode(const std::string& str) -> std::string {
    std::ostringstream escaped;
    escaped.fill('0');
    escaped << std::hex << std::uppercase;

    for (unsigned char c : str) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            escaped << c;
        } else if (c == ' ') {
            escaped << '+';
        } else {
            escaped << '%' << std::setw(2) << static_cast<int>(c);
        }
    }
    return escaped.str();
}

auto encodeForm(const FormParams& params) -> std::string {
    std::string encoded;
    for (const auto& [name, value] : params) {
        if (!encoded.empty()) {
            encoded += '&';
        }
        encoded += urlEncode(name);
        encoded += '=';
        encoded += urlEncode(value);
    }
    return encoded;
}

CurlTransport::CurlTransport(std::string userAgent)
    : userAgent_(std::move(userAgent)) {
    std::call_once(curlInitFlag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

CurlTransport::~CurlTransport() = default;

auto CurlTransport::perform(const HttpRequest& request) -> HttpResponse {
    std::unique_ptr<CURL, CurlHandleDeleter> handle(curl_easy_init());
    if (!handle) {
        THROW_TRANSPORT_EXCEPTION(0, "Failed to initialize cURL handle");
    }

    HttpResponse response;
    CURL* curl = handle.get();

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS,
                     static_cast<long>(request.timeout.count()));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, userAgent_.c_str());

    std::unique_ptr<curl_slist, CurlListDeleter> headers;
    if (request.method == HttpMethod::PUT) {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "PUT");
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE,
                         static_cast<long>(request.body.size()));
    }
    if (!request.contentType.empty()) {
        std::string header = "Content-Type: " + request.contentType;
        headers.reset(curl_slist_append(nullptr, header.c_str()));
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get());
    }

    spdlog::debug("HTTP {} {}", methodToString(request.method), request.url);

    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        THROW_TRANSPORT_EXCEPTION(
            0, std::string("cURL error: ") + curl_easy_strerror(res));
    }

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.statusCode);
    return response;
}

}  // namespace skygate::client::alpaca
