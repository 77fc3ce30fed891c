/**
 * @file main.cpp
 * @brief Main entry point for the skygate ASCOM Alpaca reflector
 *
 * The reflector answers Alpaca discovery broadcasts and serves the Alpaca
 * management and device REST API for the devices listed in its
 * configuration file, forwarding device calls to remote Alpaca servers or
 * a message bus.
 */

#include "atom/log/spdlog_logger.hpp"
#include "config/config_loader.hpp"
#include "logging/logging_manager.hpp"
#include "server/alpaca_server.hpp"

#include <csignal>
#include <iostream>
#include <memory>
#include <string>

// Global server instance for signal handling
std::unique_ptr<skygate::server::AlpacaServer> g_server;

/**
 * @brief Signal handler for graceful shutdown
 */
void signalHandler(int signal) {
    LOG_WARN("Received signal {}, initiating graceful shutdown...", signal);
    if (g_server) {
        g_server->stop();
    }
}

int main(int argc, char* argv[]) {
    std::string configPath;
    int portOverride = 0;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--port" && i + 1 < argc) {
            try {
                portOverride = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid port: " << argv[i] << "\n";
                return 2;
            }
        } else if (arg == "--help" || arg == "-h") {
            std::cout
                << "Usage: " << argv[0] << " [options]\n"
                << "Options:\n"
                << "  --config <file>     YAML configuration file\n"
                << "  --port <number>     REST API port (overrides "
                   "server.listen_address)\n"
                << "  --help, -h          Show this help message\n";
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return 2;
        }
    }

    if (configPath.empty()) {
        std::cerr << "Missing --config <file>\n";
        return 2;
    }

    try {
        auto config = skygate::config::loadReflectorConfig(configPath);
        if (portOverride > 0) {
            config.server.listenAddress = ":" + std::to_string(portOverride);
            config.validate();
        }

        skygate::logging::LoggingManager::getInstance().initialize(
            config.logging);

        LOG_INFO("==============================================");
        LOG_INFO("  {}", config.server.serverName);
        LOG_INFO("  Version: {}", config.server.manufacturerVersion);
        LOG_INFO("==============================================");
        LOG_INFO("Server configuration:");
        LOG_INFO("  Listen: {}", config.server.listenAddress);
        LOG_INFO("  Discovery port: {}", config.server.discoveryPort);
        LOG_INFO("  Backend mode: {}", config.backend.mode);
        LOG_INFO("  Devices: {}", config.devices.size());
        LOG_INFO("  CORS: {}", config.cors.enabled ? "enabled" : "disabled");
        LOG_INFO("  Auth: {}",
                 config.authentication.enabled ? "enabled" : "disabled");

        g_server = std::make_unique<skygate::server::AlpacaServer>(
            std::move(config));

        // Register signal handlers for graceful shutdown
        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        LOG_INFO("Press Ctrl+C to stop the server");

        // Start server (blocking call)
        g_server->start();
        g_server->stop();
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: {}", e.what());
        skygate::logging::LoggingManager::getInstance().shutdown();
        return 1;
    }

    LOG_INFO("Server shutdown complete");
    skygate::logging::LoggingManager::getInstance().shutdown();
    return 0;
}
