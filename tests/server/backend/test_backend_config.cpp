/*
 * test_backend_config.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-04

Description: Tests for per-device backend resolution

**************************************************/

#include <gtest/gtest.h>

#include "exception/exception.hpp"
#include "server/backend/backend_config.hpp"

using namespace skygate::server::backend;
using skygate::config::BackendConfig;
using skygate::config::DeviceConfig;

class BackendConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        global_.mode = "network";
        global_.network.defaultTimeout = std::chrono::seconds(7);
        global_.network.defaultRetryAttempts = 4;
        global_.network.retryDelay = std::chrono::milliseconds(250);
        global_.mqtt.broker = "tcp://broker:1883";
        global_.mqtt.telescopeId = "scope-a";
        global_.mqtt.timeout = std::chrono::seconds(3);
        global_.mqtt.qos = 2;

        device_.type = "telescope";
        device_.number = 0;
    }

    BackendConfig global_;
    DeviceConfig device_;
};

TEST_F(BackendConfigTest, NetworkInheritsServerDefaults) {
    device_.backend.networkUrl = "http://mount.local:11111/";
    device_.backend.networkDeviceNumber = 3;

    auto resolved = resolveBackendConfig(device_, global_);
    ASSERT_TRUE(std::holds_alternative<NetworkBackendConfig>(resolved));
    const auto& net = std::get<NetworkBackendConfig>(resolved);

    EXPECT_EQ(net.serverUrl, "http://mount.local:11111");
    EXPECT_EQ(net.remoteDeviceType, "telescope");
    EXPECT_EQ(net.remoteDeviceNumber, 3);
    EXPECT_EQ(net.timeout, std::chrono::seconds(7));
    EXPECT_EQ(net.retryAttempts, 4);
    EXPECT_EQ(net.retryDelay, std::chrono::milliseconds(250));
    EXPECT_EQ(backendModeName(resolved), "network");
}

TEST_F(BackendConfigTest, RemoteTypeCanDiffer) {
    device_.backend.networkUrl = "http://x";
    device_.backend.networkDeviceType = "camera";
    auto net = std::get<NetworkBackendConfig>(
        resolveBackendConfig(device_, global_));
    EXPECT_EQ(net.remoteDeviceType, "camera");
}

TEST_F(BackendConfigTest, DeviceModeOverridesServerMode) {
    device_.backend.mode = "mqtt";
    device_.backend.mqttTelescopeId = "scope-b";

    auto resolved = resolveBackendConfig(device_, global_);
    ASSERT_TRUE(std::holds_alternative<MqttBackendConfig>(resolved));
    const auto& mqtt = std::get<MqttBackendConfig>(resolved);
    EXPECT_EQ(mqtt.telescopeId, "scope-b");
    EXPECT_EQ(mqtt.broker, "tcp://broker:1883");
    EXPECT_EQ(mqtt.qos, 2);
    EXPECT_EQ(mqtt.timeout, std::chrono::seconds(3));
    EXPECT_EQ(mqtt.topicPrefix, "ascom");
}

TEST_F(BackendConfigTest, HybridPicksByNetworkUrl) {
    global_.mode = "hybrid";
    EXPECT_EQ(backendModeName(resolveBackendConfig(device_, global_)), "mqtt");

    device_.backend.networkUrl = "http://remote";
    EXPECT_EQ(backendModeName(resolveBackendConfig(device_, global_)),
              "network");
}

TEST_F(BackendConfigTest, DirectMode) {
    device_.backend.mode = "direct";
    EXPECT_EQ(backendModeName(resolveBackendConfig(device_, global_)),
              "direct");
}

TEST_F(BackendConfigTest, UnknownModeThrows) {
    device_.backend.mode = "telepathy";
    EXPECT_THROW(resolveBackendConfig(device_, global_),
                 skygate::InvalidConfigException);
}
