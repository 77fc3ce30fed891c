/*
 * test_device_registry.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-04

Description: Tests for the virtual device registry

**************************************************/

#include <gtest/gtest.h>

#include "exception/exception.hpp"
#include "server/device_registry.hpp"

using namespace skygate::server;
using namespace skygate::config;

class DeviceRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        global_.mode = "network";
        global_.network.defaultTimeout = std::chrono::seconds(5);
        global_.network.defaultRetryAttempts = 2;
    }

    static DeviceConfig device(const std::string& type, int number,
                               const std::string& name = "") {
        DeviceConfig cfg;
        cfg.type = type;
        cfg.number = number;
        cfg.name = name;
        cfg.backend.mode = "network";
        cfg.backend.networkUrl = "http://remote:11111";
        return cfg;
    }

    BackendConfig global_;
    DeviceRegistry registry_;
};

// ============================================================================
// Registration
// ============================================================================

TEST_F(DeviceRegistryTest, RegisterFillsMetadata) {
    auto dev = registry_.registerDevice(device("Telescope", 0, "Mount"),
                                        global_);

    EXPECT_EQ(dev.deviceType, "telescope");
    EXPECT_EQ(dev.deviceNumber, 0);
    EXPECT_EQ(dev.name, "Mount");
    EXPECT_EQ(dev.interfaceVersion, 3);
    EXPECT_EQ(dev.driverVersion, "1.0.0");
    EXPECT_EQ(dev.driverInfo, "BigSkies ASCOM Reflector - telescope Driver");
    EXPECT_FALSE(dev.connected);
    EXPECT_EQ(dev.uniqueId.size(), 36u);
    EXPECT_TRUE(
        std::holds_alternative<skygate::server::backend::NetworkBackendConfig>(
            dev.backendConfig));
}

TEST_F(DeviceRegistryTest, UniqueIdIsDeterministic) {
    EXPECT_EQ(deterministicUniqueId("camera", 1),
              deterministicUniqueId("camera", 1));
    EXPECT_NE(deterministicUniqueId("camera", 1),
              deterministicUniqueId("camera", 2));

    auto cfg = device("dome", 0);
    cfg.uniqueId = "my-own-id";
    EXPECT_EQ(registry_.registerDevice(cfg, global_).uniqueId, "my-own-id");
}

TEST_F(DeviceRegistryTest, DefaultNameUsesTypeAndNumber) {
    auto dev = registry_.registerDevice(device("focuser", 2), global_);
    EXPECT_EQ(dev.name, "focuser #2");
}

TEST_F(DeviceRegistryTest, DuplicateIsRejected) {
    registry_.registerDevice(device("camera", 0), global_);
    EXPECT_THROW(registry_.registerDevice(device("CAMERA", 0), global_),
                 skygate::InvalidConfigException);
    EXPECT_EQ(registry_.size(), 1u);
}

TEST_F(DeviceRegistryTest, LoadFromConfigRejectsEmptyList) {
    ReflectorConfig cfg;
    EXPECT_THROW(registry_.loadFromConfig(cfg),
                 skygate::InvalidConfigException);
}

TEST_F(DeviceRegistryTest, LoadFromConfigKeepsOrder) {
    ReflectorConfig cfg;
    cfg.backend = global_;
    cfg.devices = {device("telescope", 0), device("camera", 1),
                   device("camera", 0)};
    registry_.loadFromConfig(cfg);

    auto all = registry_.list();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].key(), "telescope-0");
    EXPECT_EQ(all[1].key(), "camera-1");
    EXPECT_EQ(all[2].key(), "camera-0");
}

// ============================================================================
// Lookup and state
// ============================================================================

TEST_F(DeviceRegistryTest, LookupIsCaseInsensitiveOnType) {
    registry_.registerDevice(device("camera", 0), global_);

    EXPECT_TRUE(registry_.contains("Camera", 0));
    EXPECT_TRUE(registry_.find("CAMERA", 0).has_value());
    EXPECT_FALSE(registry_.find("camera", 1).has_value());
    EXPECT_FALSE(registry_.find("dome", 0).has_value());
}

TEST_F(DeviceRegistryTest, ConnectedAndStateCache) {
    registry_.registerDevice(device("telescope", 0), global_);

    registry_.setConnected("telescope", 0, true);
    registry_.updateState("telescope", 0, "rightascension", 5.5);

    auto dev = registry_.find("telescope", 0);
    ASSERT_TRUE(dev.has_value());
    EXPECT_TRUE(dev->connected);
    EXPECT_DOUBLE_EQ(dev->stateCache["rightascension"].get<double>(), 5.5);

    // Unknown devices are ignored
    EXPECT_NO_THROW(registry_.setConnected("dome", 9, true));
    EXPECT_NO_THROW(registry_.updateState("dome", 9, "x", 1));
}
