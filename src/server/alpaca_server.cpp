/*
 * alpaca_server.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "alpaca_server.hpp"

#include <fmt/ranges.h>

#include <algorithm>
#include <chrono>
#include <cstdint>

#include "atom/log/spdlog_logger.hpp"
#include "controller/device.hpp"
#include "controller/management.hpp"
#include "exception/exception.hpp"
#include "middleware/stages.hpp"

namespace skygate::server {

namespace {

auto listenHost(const std::string& listenAddress) -> std::string {
    auto colon = listenAddress.rfind(':');
    std::string host = colon == std::string::npos
                           ? listenAddress
                           : listenAddress.substr(0, colon);
    // "[::]:11111"
    if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
        host = host.substr(1, host.size() - 2);
    }
    return host.empty() ? "0.0.0.0" : host;
}

}  // namespace

AlpacaServer::AlpacaServer(
    config::ReflectorConfig config,
    std::shared_ptr<client::alpaca::HttpTransport> transport,
    std::shared_ptr<backend::MessageBus> bus)
    : config_(std::move(config)),
      dispatcher_(std::move(transport), std::move(bus)),
      chain_(middleware::buildDefaultChain(config_, counter_)),
      discovery_(static_cast<std::uint16_t>(config_.server.discoveryPort),
                 config_.apiPort()) {
    LOG_INFO("Initializing {} {}", config_.server.serverName,
             config_.server.manufacturerVersion);
    registry_.loadFromConfig(config_);
    app_.get_middleware<middleware::PreflightCors>().chain = &chain_;
    initializeControllers();
    configureListener();
}

AlpacaServer::~AlpacaServer() { stop(); }

void AlpacaServer::initializeControllers() {
    LOG_INFO("Initializing controllers...");

    controllers_.push_back(std::make_unique<controller::ManagementController>(
        chain_, config_.server, registry_));
    controllers_.push_back(std::make_unique<controller::DeviceController>(
        chain_, registry_, dispatcher_));
    controllers_.push_back(
        std::make_unique<controller::FallbackController>(chain_));

    for (auto& controller : controllers_) {
        controller->registerRoutes(app_);
    }

    LOG_INFO("Registered {} controllers, pipeline: {}", controllers_.size(),
             fmt::join(chain_.stageNames(), " -> "));
}

void AlpacaServer::configureListener() {
    auto host = listenHost(config_.server.listenAddress);
    auto port = config_.apiPort();
    app_.bindaddr(host).port(static_cast<std::uint16_t>(port));

    auto idleSeconds = std::chrono::duration_cast<std::chrono::seconds>(
                           config_.server.idleTimeout)
                           .count();
    if (idleSeconds > 0) {
        app_.timeout(static_cast<std::uint8_t>(
            std::clamp<std::int64_t>(idleSeconds, 1, 255)));
    }

    if (config_.tls.enabled) {
#ifdef CROW_ENABLE_SSL
        app_.ssl_file(config_.tls.certFile, config_.tls.keyFile);
        LOG_INFO("TLS enabled with certificate {}", config_.tls.certFile);
#else
        THROW_INVALID_CONFIG_EXCEPTION(
            "tls.enabled requires Crow built with CROW_ENABLE_SSL");
#endif
    }
}

void AlpacaServer::start() {
    stopped_ = false;
    discovery_.start();
    LOG_INFO("Discovery responder listening on UDP port {}",
             discovery_.boundPort());
    LOG_INFO("Alpaca REST API on {}:{}", listenHost(config_.server.listenAddress),
             config_.apiPort());

    app_.multithreaded().run();
}

void AlpacaServer::stop() {
    if (stopped_.exchange(true)) {
        return;
    }
    LOG_INFO("Stopping server...");
    app_.stop();
    discovery_.stop();
    dispatcher_.disconnectAll();
    LOG_INFO("Server stopped");
}

}  // namespace skygate::server
