/*
 * mqtt_backend.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-4

Description: Backend bridging ASCOM calls over the message bus

**************************************************/

#ifndef SKYGATE_SERVER_BACKEND_MQTT_BACKEND_HPP
#define SKYGATE_SERVER_BACKEND_MQTT_BACKEND_HPP

#include <atomic>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "backend_config.hpp"
#include "device_backend.hpp"
#include "message_bus.hpp"

namespace skygate::server::backend {

/**
 * @brief Reply published by the device side of the bridge
 */
struct MqttReply {
    std::string requestId;
    json value;
    int errorNumber{0};
    std::string errorMessage;
    bool cancelled{false};

    static auto fromJson(const json& j) -> MqttReply;
};

/**
 * @brief Message bus bridge
 *
 * Requests are published to `{prefix}/request/{type}/{number}/{method}`
 * and answered on `{prefix}/response/+`. Replies are matched to waiting
 * callers by request id; a caller that hears nothing within the configured
 * timeout fails with a Timeout error.
 */
class MqttBackend : public DeviceBackend {
public:
    MqttBackend(std::string deviceType, int deviceNumber,
                MqttBackendConfig config, std::shared_ptr<MessageBus> bus);
    ~MqttBackend() override;

    MqttBackend(const MqttBackend&) = delete;
    MqttBackend& operator=(const MqttBackend&) = delete;

    [[nodiscard]] std::string_view name() const override { return "mqtt"; }

    void connect() override;
    void disconnect() override;
    [[nodiscard]] bool isConnected() const override;

    auto get(const std::string& method, const Params& params) -> json override;
    auto put(const std::string& method, const Params& params) -> json override;

    void healthCheck() override;

    [[nodiscard]] BackendMetrics metrics() const override {
        return metrics_.snapshot();
    }

    [[nodiscard]] std::string requestTopic(const std::string& method) const;
    [[nodiscard]] std::string responseFilter() const;

    [[nodiscard]] size_t pendingCount() const;

private:
    auto execute(const char* httpMethod, const std::string& method,
                 const Params& params) -> json;
    void handleReply(const std::string& topic, const std::string& payload);

    std::string deviceType_;
    int deviceNumber_;
    MqttBackendConfig config_;
    std::shared_ptr<MessageBus> bus_;
    std::atomic<bool> connected_{false};
    std::optional<MessageBus::SubscriptionId> subscription_;

    mutable std::mutex pendingMutex_;
    std::unordered_map<std::string, std::promise<MqttReply>> pending_;

    MetricsRecorder metrics_;
};

}  // namespace skygate::server::backend

#endif  // SKYGATE_SERVER_BACKEND_MQTT_BACKEND_HPP
