/*
 * server_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-30

Description: Reflector server configuration

**************************************************/

#ifndef SKYGATE_CONFIG_SERVER_CONFIG_HPP
#define SKYGATE_CONFIG_SERVER_CONFIG_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "atom/type/json.hpp"

namespace skygate::config {

using json = nlohmann::json;
using Duration = std::chrono::milliseconds;

/// Upper bound for `backend.network.default_retry_attempts`
inline constexpr int kMaxRetryAttempts = 10;

/**
 * @brief Parse a duration value
 *
 * Integers are seconds. Strings accept an `ms`, `s`, `m` or `h` suffix,
 * a bare number in a string is seconds. Throws InvalidConfigException on
 * anything else.
 */
auto parseDuration(const json& value) -> Duration;

/**
 * @brief HTTP listener and server identity
 *
 * @example
 * ```yaml
 * server:
 *   listen_address: ":11111"
 *   discovery_port: 32227
 *   server_name: "BigSkies ASCOM Reflector"
 *   location: "Backyard"
 *   read_timeout: 30s
 * ```
 */
struct ServerConfig {
    std::string listenAddress;
    int discoveryPort{0};
    std::string serverName;
    std::string manufacturer;
    std::string manufacturerVersion;
    std::string location;
    Duration readTimeout{0};
    Duration writeTimeout{0};
    Duration idleTimeout{0};

    [[nodiscard]] json serialize() const;
    static ServerConfig deserialize(const json& j);
};

/**
 * @brief HTTP Basic authentication
 */
struct AuthConfig {
    bool enabled{false};
    std::string username;
    std::string password;
    std::string realm;

    [[nodiscard]] json serialize() const;
    static AuthConfig deserialize(const json& j);
};

struct CorsConfig {
    bool enabled{false};
    std::vector<std::string> allowedOrigins;
    std::vector<std::string> allowedMethods;
    std::vector<std::string> allowedHeaders;
    bool allowCredentials{false};
    int maxAge{0};

    [[nodiscard]] json serialize() const;
    static CorsConfig deserialize(const json& j);
};

struct TlsConfig {
    bool enabled{false};
    std::string certFile;
    std::string keyFile;
    std::string minVersion;

    [[nodiscard]] json serialize() const;
    static TlsConfig deserialize(const json& j);
};

struct NetworkBackendDefaults {
    Duration defaultTimeout{0};
    int defaultRetryAttempts{0};
    Duration retryDelay{std::chrono::seconds(1)};

    [[nodiscard]] json serialize() const;
    static NetworkBackendDefaults deserialize(const json& j);
};

struct MqttBackendDefaults {
    std::string broker;
    std::string telescopeId;
    std::string clientId;
    std::string username;
    std::string password;
    int qos{0};
    Duration timeout{0};
    Duration keepAlive{0};
    std::string topicPrefix{"ascom"};

    [[nodiscard]] json serialize() const;
    static MqttBackendDefaults deserialize(const json& j);
};

/**
 * @brief Server-wide backend settings
 *
 * `mode` is one of `network`, `mqtt` or `hybrid`.
 */
struct BackendConfig {
    std::string mode;
    NetworkBackendDefaults network;
    MqttBackendDefaults mqtt;

    [[nodiscard]] json serialize() const;
    static BackendConfig deserialize(const json& j);
};

struct LoggingConfig {
    std::string level;
    std::string format;
    std::vector<std::string> outputPaths;
    std::vector<std::string> errorOutputPaths;

    [[nodiscard]] json serialize() const;
    static LoggingConfig deserialize(const json& j);
};

/**
 * @brief Per-device backend override
 */
struct DeviceBackendConfig {
    std::string mode;
    std::string networkUrl;
    std::string networkDeviceType;
    int networkDeviceNumber{0};
    std::string mqttTelescopeId;

    [[nodiscard]] json serialize() const;
    static DeviceBackendConfig deserialize(const json& j);
};

struct DeviceConfig {
    std::string type;
    int number{0};
    std::string name;
    std::string description;
    std::string uniqueId;
    DeviceBackendConfig backend;

    [[nodiscard]] json serialize() const;
    static DeviceConfig deserialize(const json& j);
};

/**
 * @brief Complete reflector configuration
 */
struct ReflectorConfig {
    ServerConfig server;
    AuthConfig authentication;
    CorsConfig cors;
    TlsConfig tls;
    BackendConfig backend;
    LoggingConfig logging;
    std::vector<DeviceConfig> devices;

    /**
     * @brief Fill defaults and reject invalid settings
     *
     * Throws InvalidConfigException for an unknown backend mode, a missing
     * device list, a device without type, a negative device number, a
     * repeated (type, number) pair, a listen port outside 1-65535 or a
     * retry count outside 0-kMaxRetryAttempts.
     */
    void validate();

    /**
     * @brief Port advertised by discovery, taken after the last ':' of
     * the listen address
     */
    [[nodiscard]] int apiPort() const;

    [[nodiscard]] json serialize() const;
    static ReflectorConfig deserialize(const json& j);

    /// Configuration with every default filled and no devices
    static ReflectorConfig defaults();
};

}  // namespace skygate::config

#endif  // SKYGATE_CONFIG_SERVER_CONFIG_HPP
