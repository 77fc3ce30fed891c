/*
 * network_backend.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "network_backend.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <thread>

#include "alpaca/alpaca_response.hpp"
#include "exception/exception.hpp"

namespace skygate::server::backend {

using client::alpaca::HttpMethod;
using client::alpaca::HttpRequest;

NetworkBackend::NetworkBackend(
    NetworkBackendConfig config,
    std::shared_ptr<client::alpaca::HttpTransport> transport)
    : config_(std::move(config)), transport_(std::move(transport)) {
    if (config_.serverUrl.empty()) {
        THROW_BACKEND_EXCEPTION(BackendErrorKind::Unavailable, "network",
                                "server URL is required");
    }
    if (!transport_) {
        THROW_BACKEND_EXCEPTION(BackendErrorKind::Unavailable,
                                config_.serverUrl, "no HTTP transport");
    }
    config_.retryAttempts =
        std::clamp(config_.retryAttempts, 0, config::kMaxRetryAttempts);
}

std::string NetworkBackend::buildUrl(const std::string& method) const {
    return config_.serverUrl + "/api/v1/" + config_.remoteDeviceType + "/" +
           std::to_string(config_.remoteDeviceNumber) + "/" + method;
}

void NetworkBackend::connect() {
    spdlog::info("Connecting to remote Alpaca server {} ({}/{})",
                 config_.serverUrl, config_.remoteDeviceType,
                 config_.remoteDeviceNumber);
    try {
        healthCheck();
    } catch (const BackendException& e) {
        metrics_.setConnectionState(ConnectionState::Error, e.detail());
        THROW_BACKEND_EXCEPTION(BackendErrorKind::Unavailable,
                                config_.serverUrl,
                                "health check failed: " + e.detail());
    }
    connected_ = true;
    metrics_.setConnectionState(ConnectionState::Connected);
    spdlog::info("Connected to remote Alpaca server {}", config_.serverUrl);
}

void NetworkBackend::disconnect() {
    connected_ = false;
    metrics_.setConnectionState(ConnectionState::Disconnected);
    spdlog::info("Disconnected from remote Alpaca server {}",
                 config_.serverUrl);
}

auto NetworkBackend::get(const std::string& method, const Params& params)
    -> json {
    return execute(HttpMethod::GET, method, params);
}

auto NetworkBackend::put(const std::string& method, const Params& params)
    -> json {
    return execute(HttpMethod::PUT, method, params);
}

void NetworkBackend::healthCheck() {
    HttpRequest request;
    request.method = HttpMethod::GET;
    request.url = buildUrl("connected") + "?" +
                  client::alpaca::encodeForm(
                      {{"ClientID", "1"}, {"ClientTransactionID", "0"}});
    request.timeout = config_.timeout;
    doRequest(request);
}

auto NetworkBackend::execute(HttpMethod method, const std::string& name,
                             const Params& params) -> json {
    auto start = std::chrono::steady_clock::now();
    spdlog::debug("Network backend {} {} ({} params)",
                  client::alpaca::methodToString(method), name,
                  params.size());

    HttpRequest request;
    request.method = method;
    request.timeout = config_.timeout;
    request.url = buildUrl(name);
    std::string encoded = client::alpaca::encodeForm(params);
    if (method == HttpMethod::GET) {
        if (!encoded.empty()) {
            request.url += "?" + encoded;
        }
    } else {
        request.body = std::move(encoded);
        request.contentType = "application/x-www-form-urlencoded";
    }

    for (int attempt = 0;; ++attempt) {
        try {
            auto value = doRequest(request);
            metrics_.record(start, true);
            return value;
        } catch (const BackendException& e) {
            bool retryable = e.kind() != BackendErrorKind::Remote;
            bool exhausted = attempt >= config_.retryAttempts;
            spdlog::warn("Request attempt {}/{} to {} failed: {}",
                         attempt + 1, config_.retryAttempts + 1, request.url,
                         e.detail());
            if (!retryable || exhausted) {
                metrics_.record(start, false);
                metrics_.setConnectionState(
                    connected_ ? ConnectionState::Connected
                               : ConnectionState::Disconnected,
                    e.detail());
                throw;
            }
        }
        std::this_thread::sleep_for(config_.retryDelay * (1 << attempt));
    }
}

auto NetworkBackend::doRequest(const HttpRequest& request) -> json {
    client::alpaca::HttpResponse response;
    try {
        response = transport_->perform(request);
    } catch (const TransportException& e) {
        THROW_BACKEND_EXCEPTION(BackendErrorKind::Unavailable,
                                config_.serverUrl, e.what());
    }

    if (response.statusCode != 200) {
        THROW_BACKEND_EXCEPTION(BackendErrorKind::Protocol, config_.serverUrl,
                                "HTTP " + std::to_string(response.statusCode) +
                                    ": " + response.body);
    }

    alpaca::AlpacaResponse envelope;
    try {
        auto body = json::parse(response.body);
        if (!body.is_object()) {
            THROW_BACKEND_EXCEPTION(BackendErrorKind::Protocol,
                                    config_.serverUrl,
                                    "ASCOM response is not an object");
        }
        envelope = alpaca::AlpacaResponse::fromJson(body);
    } catch (const json::exception& e) {
        THROW_BACKEND_EXCEPTION(
            BackendErrorKind::Protocol, config_.serverUrl,
            std::string("failed to parse ASCOM response: ") + e.what());
    }

    if (envelope.errorNumber != 0) {
        THROW_BACKEND_EXCEPTION(BackendErrorKind::Remote, config_.serverUrl,
                                envelope.errorMessage, envelope.errorNumber);
    }
    return envelope.value;
}

}  // namespace skygate::server::backend
