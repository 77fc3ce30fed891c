/*
 * server_config.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "server_config.hpp"

#include <charconv>
#include <set>
#include <utility>

#include <fmt/format.h>

#include "alpaca/ascom_types.hpp"
#include "exception/exception.hpp"

namespace skygate::config {

namespace {

constexpr auto kDefaultRequestTimeout = std::chrono::seconds(30);

auto durationValue(const json& j, const char* key, Duration fallback)
    -> Duration {
    if (!j.contains(key) || j[key].is_null()) {
        return fallback;
    }
    return parseDuration(j[key]);
}

auto durationToJson(Duration d) -> json {
    return fmt::format("{}ms", d.count());
}

template <typename T>
auto listValue(const json& j, const char* key) -> std::vector<T> {
    if (!j.contains(key) || !j[key].is_array()) {
        return {};
    }
    return j[key].get<std::vector<T>>();
}

auto sectionOf(const json& j, const char* key) -> json {
    if (j.contains(key) && j[key].is_object()) {
        return j[key];
    }
    return json::object();
}

auto isServerMode(const std::string& mode) -> bool {
    return mode == "network" || mode == "mqtt" || mode == "hybrid";
}

auto isDeviceMode(const std::string& mode) -> bool {
    return isServerMode(mode) || mode == "direct";
}

}  // namespace

auto parseDuration(const json& value) -> Duration {
    if (value.is_number_integer()) {
        return std::chrono::seconds(value.get<std::int64_t>());
    }
    if (value.is_number_float()) {
        return Duration(static_cast<std::int64_t>(value.get<double>() * 1000));
    }
    if (!value.is_string()) {
        THROW_INVALID_CONFIG_EXCEPTION(
            fmt::format("invalid duration value: {}", value.dump()));
    }

    const auto text = value.get<std::string>();
    std::int64_t amount = 0;
    const auto* begin = text.data();
    const auto* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, amount);
    if (ec != std::errc{} || ptr == begin || amount < 0) {
        THROW_INVALID_CONFIG_EXCEPTION(
            fmt::format("invalid duration value: {}", text));
    }

    const std::string_view unit(ptr, static_cast<size_t>(end - ptr));
    if (unit.empty() || unit == "s") {
        return std::chrono::seconds(amount);
    }
    if (unit == "ms") {
        return Duration(amount);
    }
    if (unit == "m") {
        return std::chrono::minutes(amount);
    }
    if (unit == "h") {
        return std::chrono::hours(amount);
    }
    THROW_INVALID_CONFIG_EXCEPTION(
        fmt::format("invalid duration unit in '{}'", text));
}

// ============================================================================
// Sections
// ============================================================================

json ServerConfig::serialize() const {
    return {{"listen_address", listenAddress},
            {"discovery_port", discoveryPort},
            {"server_name", serverName},
            {"manufacturer", manufacturer},
            {"manufacturer_version", manufacturerVersion},
            {"location", location},
            {"read_timeout", durationToJson(readTimeout)},
            {"write_timeout", durationToJson(writeTimeout)},
            {"idle_timeout", durationToJson(idleTimeout)}};
}

ServerConfig ServerConfig::deserialize(const json& j) {
    ServerConfig cfg;
    cfg.listenAddress = j.value("listen_address", cfg.listenAddress);
    cfg.discoveryPort = j.value("discovery_port", cfg.discoveryPort);
    cfg.serverName = j.value("server_name", cfg.serverName);
    cfg.manufacturer = j.value("manufacturer", cfg.manufacturer);
    cfg.manufacturerVersion =
        j.value("manufacturer_version", cfg.manufacturerVersion);
    cfg.location = j.value("location", cfg.location);
    cfg.readTimeout = durationValue(j, "read_timeout", cfg.readTimeout);
    cfg.writeTimeout = durationValue(j, "write_timeout", cfg.writeTimeout);
    cfg.idleTimeout = durationValue(j, "idle_timeout", cfg.idleTimeout);
    return cfg;
}

json AuthConfig::serialize() const {
    // The password is never written back out.
    return {{"enabled", enabled}, {"username", username}, {"realm", realm}};
}

AuthConfig AuthConfig::deserialize(const json& j) {
    AuthConfig cfg;
    cfg.enabled = j.value("enabled", cfg.enabled);
    cfg.username = j.value("username", cfg.username);
    cfg.password = j.value("password", cfg.password);
    cfg.realm = j.value("realm", cfg.realm);
    return cfg;
}

json CorsConfig::serialize() const {
    return {{"enabled", enabled},
            {"allowed_origins", allowedOrigins},
            {"allowed_methods", allowedMethods},
            {"allowed_headers", allowedHeaders},
            {"allow_credentials", allowCredentials},
            {"max_age", maxAge}};
}

CorsConfig CorsConfig::deserialize(const json& j) {
    CorsConfig cfg;
    cfg.enabled = j.value("enabled", cfg.enabled);
    cfg.allowedOrigins = listValue<std::string>(j, "allowed_origins");
    cfg.allowedMethods = listValue<std::string>(j, "allowed_methods");
    cfg.allowedHeaders = listValue<std::string>(j, "allowed_headers");
    cfg.allowCredentials = j.value("allow_credentials", cfg.allowCredentials);
    cfg.maxAge = j.value("max_age", cfg.maxAge);
    return cfg;
}

json TlsConfig::serialize() const {
    return {{"enabled", enabled},
            {"cert_file", certFile},
            {"key_file", keyFile},
            {"min_version", minVersion}};
}

TlsConfig TlsConfig::deserialize(const json& j) {
    TlsConfig cfg;
    cfg.enabled = j.value("enabled", cfg.enabled);
    cfg.certFile = j.value("cert_file", cfg.certFile);
    cfg.keyFile = j.value("key_file", cfg.keyFile);
    cfg.minVersion = j.value("min_version", cfg.minVersion);
    return cfg;
}

json NetworkBackendDefaults::serialize() const {
    return {{"default_timeout", durationToJson(defaultTimeout)},
            {"default_retry_attempts", defaultRetryAttempts},
            {"retry_delay", durationToJson(retryDelay)}};
}

NetworkBackendDefaults NetworkBackendDefaults::deserialize(const json& j) {
    NetworkBackendDefaults cfg;
    cfg.defaultTimeout =
        durationValue(j, "default_timeout", cfg.defaultTimeout);
    cfg.defaultRetryAttempts =
        j.value("default_retry_attempts", cfg.defaultRetryAttempts);
    cfg.retryDelay = durationValue(j, "retry_delay", cfg.retryDelay);
    return cfg;
}

json MqttBackendDefaults::serialize() const {
    return {{"broker", broker},
            {"telescope_id", telescopeId},
            {"client_id", clientId},
            {"username", username},
            {"qos", qos},
            {"timeout", durationToJson(timeout)},
            {"keep_alive", durationToJson(keepAlive)},
            {"topic_prefix", topicPrefix}};
}

MqttBackendDefaults MqttBackendDefaults::deserialize(const json& j) {
    MqttBackendDefaults cfg;
    cfg.broker = j.value("broker", cfg.broker);
    cfg.telescopeId = j.value("telescope_id", cfg.telescopeId);
    cfg.clientId = j.value("client_id", cfg.clientId);
    cfg.username = j.value("username", cfg.username);
    cfg.password = j.value("password", cfg.password);
    cfg.qos = j.value("qos", cfg.qos);
    cfg.timeout = durationValue(j, "timeout", cfg.timeout);
    cfg.keepAlive = durationValue(j, "keep_alive", cfg.keepAlive);
    cfg.topicPrefix = j.value("topic_prefix", cfg.topicPrefix);
    return cfg;
}

json BackendConfig::serialize() const {
    return {{"mode", mode},
            {"network", network.serialize()},
            {"mqtt", mqtt.serialize()}};
}

BackendConfig BackendConfig::deserialize(const json& j) {
    BackendConfig cfg;
    cfg.mode = j.value("mode", cfg.mode);
    cfg.network = NetworkBackendDefaults::deserialize(sectionOf(j, "network"));
    cfg.mqtt = MqttBackendDefaults::deserialize(sectionOf(j, "mqtt"));
    return cfg;
}

json LoggingConfig::serialize() const {
    return {{"level", level},
            {"format", format},
            {"output_paths", outputPaths},
            {"error_output_paths", errorOutputPaths}};
}

LoggingConfig LoggingConfig::deserialize(const json& j) {
    LoggingConfig cfg;
    cfg.level = j.value("level", cfg.level);
    cfg.format = j.value("format", cfg.format);
    cfg.outputPaths = listValue<std::string>(j, "output_paths");
    cfg.errorOutputPaths = listValue<std::string>(j, "error_output_paths");
    return cfg;
}

json DeviceBackendConfig::serialize() const {
    return {{"mode", mode},
            {"network_url", networkUrl},
            {"network_device_type", networkDeviceType},
            {"network_device_number", networkDeviceNumber},
            {"mqtt_telescope_id", mqttTelescopeId}};
}

DeviceBackendConfig DeviceBackendConfig::deserialize(const json& j) {
    DeviceBackendConfig cfg;
    cfg.mode = j.value("mode", cfg.mode);
    cfg.networkUrl = j.value("network_url", cfg.networkUrl);
    cfg.networkDeviceType =
        j.value("network_device_type", cfg.networkDeviceType);
    cfg.networkDeviceNumber =
        j.value("network_device_number", cfg.networkDeviceNumber);
    cfg.mqttTelescopeId = j.value("mqtt_telescope_id", cfg.mqttTelescopeId);
    return cfg;
}

json DeviceConfig::serialize() const {
    return {{"type", type},
            {"number", number},
            {"name", name},
            {"description", description},
            {"unique_id", uniqueId},
            {"backend", backend.serialize()}};
}

DeviceConfig DeviceConfig::deserialize(const json& j) {
    DeviceConfig cfg;
    cfg.type = j.value("type", cfg.type);
    cfg.number = j.value("number", cfg.number);
    cfg.name = j.value("name", cfg.name);
    cfg.description = j.value("description", cfg.description);
    cfg.uniqueId = j.value("unique_id", cfg.uniqueId);
    cfg.backend = DeviceBackendConfig::deserialize(sectionOf(j, "backend"));
    return cfg;
}

// ============================================================================
// ReflectorConfig
// ============================================================================

void ReflectorConfig::validate() {
    if (server.listenAddress.empty()) {
        server.listenAddress = fmt::format(":{}", alpaca::kDefaultApiPort);
    }
    if (auto colon = server.listenAddress.rfind(':');
        colon != std::string::npos) {
        // Non-numeric ports fall back to the default in apiPort()
        const auto* begin = server.listenAddress.data() + colon + 1;
        const auto* end =
            server.listenAddress.data() + server.listenAddress.size();
        long long port = 0;
        auto [ptr, ec] = std::from_chars(begin, end, port);
        if (ec == std::errc::result_out_of_range ||
            (ec == std::errc{} && ptr == end && (port <= 0 || port > 65535))) {
            THROW_INVALID_CONFIG_EXCEPTION(fmt::format(
                "invalid listen port in {}", server.listenAddress));
        }
    }
    if (server.discoveryPort == 0) {
        server.discoveryPort = alpaca::kDefaultDiscoveryPort;
    }
    if (server.discoveryPort < 0 || server.discoveryPort > 65535) {
        THROW_INVALID_CONFIG_EXCEPTION(fmt::format(
            "invalid discovery port: {}", server.discoveryPort));
    }
    if (server.serverName.empty()) {
        server.serverName = "BigSkies ASCOM Reflector";
    }
    if (server.manufacturer.empty()) {
        server.manufacturer = "BigSkies Framework";
    }
    if (server.manufacturerVersion.empty()) {
        server.manufacturerVersion = "1.0.0";
    }
    if (server.location.empty()) {
        server.location = "Observatory";
    }
    if (server.readTimeout.count() == 0) {
        server.readTimeout = std::chrono::seconds(30);
    }
    if (server.writeTimeout.count() == 0) {
        server.writeTimeout = std::chrono::seconds(30);
    }
    if (server.idleTimeout.count() == 0) {
        server.idleTimeout = std::chrono::seconds(60);
    }

    if (authentication.realm.empty()) {
        authentication.realm = "ASCOM Alpaca Server";
    }

    if (cors.enabled) {
        if (cors.allowedOrigins.empty()) {
            cors.allowedOrigins = {"*"};
        }
        if (cors.allowedMethods.empty()) {
            cors.allowedMethods = {"GET", "POST", "PUT", "DELETE", "OPTIONS"};
        }
        if (cors.allowedHeaders.empty()) {
            cors.allowedHeaders = {"*"};
        }
        if (cors.maxAge == 0) {
            cors.maxAge = 3600;
        }
    }

    if (backend.mode.empty()) {
        backend.mode = "network";
    }
    if (!isServerMode(backend.mode)) {
        THROW_INVALID_CONFIG_EXCEPTION(fmt::format(
            "invalid backend mode: {} (must be 'network', 'mqtt', or "
            "'hybrid')",
            backend.mode));
    }
    if (backend.network.defaultTimeout.count() == 0) {
        backend.network.defaultTimeout = kDefaultRequestTimeout;
    }
    if (backend.network.defaultRetryAttempts == 0) {
        backend.network.defaultRetryAttempts = 3;
    }
    if (backend.network.defaultRetryAttempts < 0 ||
        backend.network.defaultRetryAttempts > kMaxRetryAttempts) {
        THROW_INVALID_CONFIG_EXCEPTION(fmt::format(
            "default_retry_attempts must be between 0 and {}, got {}",
            kMaxRetryAttempts, backend.network.defaultRetryAttempts));
    }
    if (backend.mqtt.timeout.count() == 0) {
        backend.mqtt.timeout = kDefaultRequestTimeout;
    }
    if (backend.mqtt.keepAlive.count() == 0) {
        backend.mqtt.keepAlive = std::chrono::seconds(60);
    }
    if (backend.mqtt.qos == 0) {
        backend.mqtt.qos = 1;
    }

    if (logging.level.empty()) {
        logging.level = "info";
    }
    if (logging.format.empty()) {
        logging.format = "json";
    }
    if (logging.outputPaths.empty()) {
        logging.outputPaths = {"stdout"};
    }
    if (logging.errorOutputPaths.empty()) {
        logging.errorOutputPaths = {"stderr"};
    }

    if (devices.empty()) {
        THROW_INVALID_CONFIG_EXCEPTION(
            "at least one device must be configured");
    }

    std::set<std::pair<std::string, int>> seen;
    for (size_t i = 0; i < devices.size(); ++i) {
        auto& dev = devices[i];
        if (dev.type.empty()) {
            THROW_INVALID_CONFIG_EXCEPTION(
                fmt::format("device {}: type is required", i));
        }
        if (dev.number < 0) {
            THROW_INVALID_CONFIG_EXCEPTION(
                fmt::format("device {}: number must be non-negative", i));
        }
        if (!seen.emplace(dev.type, dev.number).second) {
            THROW_INVALID_CONFIG_EXCEPTION(fmt::format(
                "duplicate device: {}-{} (type={}, number={})", dev.type,
                dev.number, dev.type, dev.number));
        }
        if (dev.name.empty()) {
            dev.name = fmt::format("{} #{}", dev.type, dev.number);
        }
        if (dev.description.empty()) {
            dev.description = fmt::format("BigSkies ASCOM {}", dev.type);
        }
        if (dev.backend.mode.empty()) {
            dev.backend.mode = backend.mode;
        }
        if (!isDeviceMode(dev.backend.mode)) {
            THROW_INVALID_CONFIG_EXCEPTION(
                fmt::format("device {}: invalid backend mode: {}", i,
                            dev.backend.mode));
        }
    }
}

int ReflectorConfig::apiPort() const {
    const auto& address = server.listenAddress;
    const auto colon = address.rfind(':');
    if (colon == std::string::npos) {
        return alpaca::kDefaultApiPort;
    }

    int port = 0;
    const auto* begin = address.data() + colon + 1;
    const auto* end = address.data() + address.size();
    auto [ptr, ec] = std::from_chars(begin, end, port);
    if (ec != std::errc{} || ptr == begin || port <= 0) {
        return alpaca::kDefaultApiPort;
    }
    return port;
}

json ReflectorConfig::serialize() const {
    json deviceList = json::array();
    for (const auto& dev : devices) {
        deviceList.push_back(dev.serialize());
    }
    return {{"server", server.serialize()},
            {"authentication", authentication.serialize()},
            {"cors", cors.serialize()},
            {"tls", tls.serialize()},
            {"backend", backend.serialize()},
            {"logging", logging.serialize()},
            {"devices", deviceList}};
}

ReflectorConfig ReflectorConfig::deserialize(const json& j) {
    ReflectorConfig cfg;
    cfg.server = ServerConfig::deserialize(sectionOf(j, "server"));
    cfg.authentication =
        AuthConfig::deserialize(sectionOf(j, "authentication"));
    cfg.cors = CorsConfig::deserialize(sectionOf(j, "cors"));
    cfg.tls = TlsConfig::deserialize(sectionOf(j, "tls"));
    cfg.backend = BackendConfig::deserialize(sectionOf(j, "backend"));
    cfg.logging = LoggingConfig::deserialize(sectionOf(j, "logging"));
    if (j.contains("devices") && j["devices"].is_array()) {
        for (const auto& dev : j["devices"]) {
            cfg.devices.push_back(DeviceConfig::deserialize(dev));
        }
    }
    return cfg;
}

ReflectorConfig ReflectorConfig::defaults() {
    ReflectorConfig cfg;
    cfg.cors.enabled = true;
    // validate() rejects an empty device list, so fill defaults on a copy
    // that carries a placeholder device and drop it afterwards.
    cfg.devices.push_back(DeviceConfig{.type = "telescope"});
    cfg.validate();
    cfg.devices.clear();
    return cfg;
}

}  // namespace skygate::config
