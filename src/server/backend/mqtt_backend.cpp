/*
 * mqtt_backend.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "mqtt_backend.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <ctime>

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

#include "exception/exception.hpp"

namespace skygate::server::backend {

namespace {

auto newRequestId() -> std::string {
    thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

auto isoTimestamp() -> std::string {
    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  now.time_since_epoch()) %
              1000;
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &tm);
    return fmt::format("{}.{:03d}Z", buffer, ms.count());
}

}  // namespace

auto MqttReply::fromJson(const json& j) -> MqttReply {
    MqttReply reply;
    reply.requestId = j.at("request_id").get<std::string>();
    if (j.contains("value")) {
        reply.value = j["value"];
    }
    reply.errorNumber = j.value("error_number", 0);
    reply.errorMessage = j.value("error_message", "");
    return reply;
}

MqttBackend::MqttBackend(std::string deviceType, int deviceNumber,
                         MqttBackendConfig config,
                         std::shared_ptr<MessageBus> bus)
    : deviceType_(std::move(deviceType)),
      deviceNumber_(deviceNumber),
      config_(std::move(config)),
      bus_(std::move(bus)) {
    if (config_.topicPrefix.empty()) {
        config_.topicPrefix = "ascom";
    }
}

MqttBackend::~MqttBackend() {
    if (connected_) {
        disconnect();
    }
}

std::string MqttBackend::requestTopic(const std::string& method) const {
    return config_.topicPrefix + "/request/" + deviceType_ + "/" +
           std::to_string(deviceNumber_) + "/" + method;
}

std::string MqttBackend::responseFilter() const {
    return config_.topicPrefix + "/response/+";
}

void MqttBackend::connect() {
    if (!bus_) {
        metrics_.setConnectionState(ConnectionState::Error,
                                    "no message bus configured");
        THROW_BACKEND_EXCEPTION(BackendErrorKind::NotConnected,
                                config_.broker, "no message bus configured");
    }
    if (connected_) {
        return;
    }

    spdlog::info("Connecting {}/{} to message bus {}", deviceType_,
                 deviceNumber_, config_.broker);
    try {
        if (!bus_->isConnected()) {
            bus_->connect();
        }
        subscription_ = bus_->subscribe(
            responseFilter(), config_.qos,
            [this](const std::string& topic, const std::string& payload) {
                handleReply(topic, payload);
            });
    } catch (const std::exception& e) {
        metrics_.setConnectionState(ConnectionState::Error, e.what());
        THROW_BACKEND_EXCEPTION(BackendErrorKind::NotConnected, config_.broker,
                                std::string("message bus connection failed: ") +
                                    e.what());
    }

    connected_ = true;
    metrics_.setConnectionState(ConnectionState::Connected);
    spdlog::info("Subscribed to {}", responseFilter());
}

void MqttBackend::disconnect() {
    if (!connected_.exchange(false)) {
        return;
    }
    spdlog::info("Disconnecting {}/{} from message bus", deviceType_,
                 deviceNumber_);

    if (subscription_ && bus_) {
        bus_->unsubscribe(*subscription_);
    }
    subscription_.reset();

    std::lock_guard lock(pendingMutex_);
    for (auto& [id, promise] : pending_) {
        MqttReply cancelled;
        cancelled.requestId = id;
        cancelled.cancelled = true;
        promise.set_value(std::move(cancelled));
    }
    pending_.clear();
    metrics_.setConnectionState(ConnectionState::Disconnected);
}

bool MqttBackend::isConnected() const {
    return connected_ && bus_ && bus_->isConnected();
}

auto MqttBackend::get(const std::string& method, const Params& params)
    -> json {
    return execute("GET", method, params);
}

auto MqttBackend::put(const std::string& method, const Params& params)
    -> json {
    return execute("PUT", method, params);
}

void MqttBackend::healthCheck() {
    if (!bus_ || !bus_->isConnected()) {
        THROW_BACKEND_EXCEPTION(BackendErrorKind::NotConnected, config_.broker,
                                "message bus not connected");
    }
    execute("GET", "connected", {});
}

size_t MqttBackend::pendingCount() const {
    std::lock_guard lock(pendingMutex_);
    return pending_.size();
}

auto MqttBackend::execute(const char* httpMethod, const std::string& method,
                          const Params& params) -> json {
    auto start = std::chrono::steady_clock::now();

    if (!isConnected()) {
        metrics_.record(start, false);
        THROW_BACKEND_EXCEPTION(BackendErrorKind::NotConnected, config_.broker,
                                "not connected to message bus");
    }

    std::string requestId = newRequestId();
    json parameters = json::object();
    for (const auto& [key, value] : params) {
        parameters[key] = value;
    }
    json request = {{"request_id", requestId},
                    {"telescope_id", config_.telescopeId},
                    {"device_type", deviceType_},
                    {"device_number", deviceNumber_},
                    {"method", method},
                    {"http_method", httpMethod},
                    {"parameters", parameters},
                    {"timestamp", isoTimestamp()}};

    std::future<MqttReply> future;
    {
        std::lock_guard lock(pendingMutex_);
        future = pending_[requestId].get_future();
    }
    auto forget = [this, &requestId] {
        std::lock_guard lock(pendingMutex_);
        pending_.erase(requestId);
    };

    std::string topic = requestTopic(method);
    try {
        bus_->publish(topic, request.dump(), config_.qos, false);
    } catch (const std::exception& e) {
        forget();
        metrics_.record(start, false);
        THROW_BACKEND_EXCEPTION(
            BackendErrorKind::Unavailable, config_.broker,
            std::string("failed to publish request: ") + e.what());
    }
    spdlog::debug("Published {} request {} to {}", httpMethod, requestId,
                  topic);

    if (future.wait_for(config_.timeout) != std::future_status::ready) {
        forget();
        metrics_.record(start, false);
        THROW_BACKEND_EXCEPTION(BackendErrorKind::Timeout, config_.broker,
                                "no reply to " + method + " within " +
                                    std::to_string(config_.timeout.count()) +
                                    "ms");
    }

    MqttReply reply = future.get();
    forget();
    if (reply.cancelled) {
        metrics_.record(start, false);
        THROW_BACKEND_EXCEPTION(BackendErrorKind::NotConnected, config_.broker,
                                "disconnected while waiting for reply");
    }
    if (reply.errorNumber != 0) {
        metrics_.record(start, false);
        THROW_BACKEND_EXCEPTION(BackendErrorKind::Remote, config_.broker,
                                reply.errorMessage, reply.errorNumber);
    }

    metrics_.record(start, true);
    return reply.value;
}

void MqttBackend::handleReply(const std::string& topic,
                              const std::string& payload) {
    MqttReply reply;
    try {
        reply = MqttReply::fromJson(json::parse(payload));
    } catch (const json::exception& e) {
        spdlog::error("Dropping malformed reply on {}: {}", topic, e.what());
        return;
    }

    std::lock_guard lock(pendingMutex_);
    auto it = pending_.find(reply.requestId);
    if (it == pending_.end()) {
        spdlog::debug("Reply for unknown request {} on {}", reply.requestId,
                      topic);
        return;
    }
    it->second.set_value(std::move(reply));
    pending_.erase(it);
}

}  // namespace skygate::server::backend
