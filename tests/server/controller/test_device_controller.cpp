/*
 * test_device_controller.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-07

Description: Tests for the Alpaca device endpoint and the fallback route

**************************************************/

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "exception/exception.hpp"
#include "mocks/mock_device_backend.hpp"
#include "server/controller/device.hpp"

#include <stdexcept>

using namespace skygate::server;
using namespace skygate::server::controller;
using skygate::BackendErrorKind;
using skygate::test::MockDeviceBackend;
using ::testing::_;
using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::NiceMock;
using ::testing::Pair;
using ::testing::Return;

namespace {

crow::request makeRequest(crow::HTTPMethod method, const std::string& query,
                          const std::string& body = "",
                          const std::string& contentType = "") {
    crow::request req;
    req.method = method;
    req.url = "/api/v1/telescope/0/x";
    req.url_params = crow::query_string(query.empty() ? "" : "?" + query);
    req.body = body;
    if (!contentType.empty()) {
        req.add_header("Content-Type", contentType);
    }
    return req;
}

}  // namespace

class DeviceControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        skygate::config::ReflectorConfig cfg;
        cfg.backend.mode = "network";
        skygate::config::DeviceConfig telescope;
        telescope.type = "telescope";
        telescope.number = 0;
        telescope.name = "Main Mount";
        telescope.description = "Equatorial mount";
        telescope.backend.networkUrl = "http://mount.local:11111";
        cfg.devices.push_back(telescope);
        registry_.loadFromConfig(cfg);

        backend_ = std::make_shared<NiceMock<MockDeviceBackend>>();
        ON_CALL(*backend_, name()).WillByDefault(Return("network"));
        ON_CALL(*backend_, isConnected()).WillByDefault(Return(true));

        dispatcher_ = std::make_unique<backend::BackendDispatcher>(
            [this](const VirtualDevice&)
                -> std::shared_ptr<backend::DeviceBackend> { return backend_; });
        controller_ =
            std::make_unique<DeviceController>(chain_, registry_, *dispatcher_);

        ctx_.clientTransactionId = 5;
        ctx_.serverTransactionId = 10;
    }

    nlohmann::json call(const crow::request& req, const std::string& type,
                        const std::string& number, const std::string& method) {
        controller_->handleDeviceRequest(req, res_, ctx_, type, number, method);
        return nlohmann::json::parse(res_.body);
    }

    middleware::MiddlewareChain chain_;
    DeviceRegistry registry_;
    std::shared_ptr<NiceMock<MockDeviceBackend>> backend_;
    std::unique_ptr<backend::BackendDispatcher> dispatcher_;
    std::unique_ptr<DeviceController> controller_;
    middleware::RequestContext ctx_;
    crow::response res_;
};

// ============================================================================
// Routing errors
// ============================================================================

TEST_F(DeviceControllerTest, BadDeviceNumberIs400) {
    auto body = call(makeRequest(crow::HTTPMethod::Get, ""), "telescope",
                     "zero", "connected");
    EXPECT_EQ(res_.code, 400);
    EXPECT_EQ(body["ErrorNumber"], 0x401);

    call(makeRequest(crow::HTTPMethod::Get, ""), "telescope", "-1",
         "connected");
    EXPECT_EQ(res_.code, 400);
}

TEST_F(DeviceControllerTest, UnknownDeviceIs404) {
    EXPECT_CALL(*backend_, get(_, _)).Times(0);
    auto body = call(makeRequest(crow::HTTPMethod::Get, ""), "camera", "0",
                     "connected");
    EXPECT_EQ(res_.code, 404);
    EXPECT_EQ(body["ErrorNumber"], 0x400);
    EXPECT_EQ(body["ErrorMessage"], "Device not found");
    EXPECT_EQ(body["ClientTransactionID"], 5);
    EXPECT_EQ(body["ServerTransactionID"], 10);
}

// ============================================================================
// Identity methods
// ============================================================================

TEST_F(DeviceControllerTest, IdentityAnsweredLocally) {
    EXPECT_CALL(*backend_, get(_, _)).Times(0);

    auto req = makeRequest(crow::HTTPMethod::Get, "");
    EXPECT_EQ(call(req, "Telescope", "0", "Name")["Value"], "Main Mount");
    EXPECT_EQ(call(req, "telescope", "0", "description")["Value"],
              "Equatorial mount");
    EXPECT_EQ(call(req, "telescope", "0", "interfaceversion")["Value"], 3);
    EXPECT_EQ(call(req, "telescope", "0", "driverversion")["Value"], "1.0.0");
    EXPECT_TRUE(
        call(req, "telescope", "0", "supportedactions")["Value"].empty());
    EXPECT_EQ(res_.code, 200);
}

TEST(DeviceControllerLocalValueTest, ForwardedMethodsHaveNoLocalValue) {
    VirtualDevice device;
    EXPECT_FALSE(DeviceController::localValue(device, "connected"));
    EXPECT_FALSE(DeviceController::localValue(device, "rightascension"));
}

// ============================================================================
// Forwarding
// ============================================================================

TEST_F(DeviceControllerTest, GetIsForwardedWithoutCorrelationParams) {
    EXPECT_CALL(*backend_, get("rightascension",
                               ElementsAre(Pair("Extra", "1"))))
        .WillOnce(Return(nlohmann::json(5.25)));

    auto body = call(makeRequest(crow::HTTPMethod::Get,
                                 "ClientID=2&ClientTransactionID=5&Extra=1"),
                     "telescope", "0", "RightAscension");

    EXPECT_EQ(res_.code, 200);
    EXPECT_DOUBLE_EQ(body["Value"].get<double>(), 5.25);
    EXPECT_EQ(body["ErrorNumber"], 0);

    auto device = registry_.find("telescope", 0);
    ASSERT_TRUE(device.has_value());
    EXPECT_DOUBLE_EQ(device->stateCache["rightascension"].get<double>(), 5.25);
}

TEST_F(DeviceControllerTest, PutConnectedUpdatesRegistry) {
    EXPECT_CALL(*backend_,
                put("connected", ElementsAre(Pair("Connected", "True"))))
        .WillOnce(Return(nlohmann::json(nullptr)));

    call(makeRequest(crow::HTTPMethod::Put, "",
                     "Connected=True&ClientID=1&ClientTransactionID=5",
                     "application/x-www-form-urlencoded"),
         "telescope", "0", "connected");

    EXPECT_EQ(res_.code, 200);
    EXPECT_TRUE(registry_.find("telescope", 0)->connected);
}

TEST_F(DeviceControllerTest, GetConnectedMirrorsRemoteState) {
    registry_.setConnected("telescope", 0, true);
    EXPECT_CALL(*backend_, get("connected", _))
        .WillOnce(Return(nlohmann::json(false)));

    call(makeRequest(crow::HTTPMethod::Get, ""), "telescope", "0",
         "connected");
    EXPECT_FALSE(registry_.find("telescope", 0)->connected);
}

TEST_F(DeviceControllerTest, RemoteErrorKeepsItsNumber) {
    EXPECT_CALL(*backend_, put("slewtocoordinates", _))
        .WillOnce([](const std::string&, const backend::Params&)
                      -> nlohmann::json {
            THROW_BACKEND_EXCEPTION(BackendErrorKind::Remote, "remote",
                                    "Telescope is parked", 0x408);
        });

    auto body = call(makeRequest(crow::HTTPMethod::Put, "", "RightAscension=1"),
                     "telescope", "0", "slewtocoordinates");
    EXPECT_EQ(res_.code, 200);
    EXPECT_EQ(body["ErrorNumber"], 0x408);
    EXPECT_EQ(body["ErrorMessage"], "Telescope is parked");
    EXPECT_FALSE(body.contains("Value"));
}

TEST_F(DeviceControllerTest, UnreachableBackendIsNotConnected) {
    EXPECT_CALL(*backend_, get("altitude", _))
        .WillOnce([](const std::string&, const backend::Params&)
                      -> nlohmann::json {
            THROW_BACKEND_EXCEPTION(BackendErrorKind::Unavailable, "remote",
                                    "connection refused");
        });

    auto body = call(makeRequest(crow::HTTPMethod::Get, ""), "telescope", "0",
                     "altitude");
    EXPECT_EQ(body["ErrorNumber"], 0x407);
    EXPECT_EQ(ctx_.error, "connection refused");
}

TEST_F(DeviceControllerTest, UnexpectedFailureIsUnspecified) {
    EXPECT_CALL(*backend_, get("altitude", _))
        .WillOnce([](const std::string&, const backend::Params&)
                      -> nlohmann::json {
            throw std::runtime_error("bad state");
        });

    auto body = call(makeRequest(crow::HTTPMethod::Get, ""), "telescope", "0",
                     "altitude");
    EXPECT_EQ(body["ErrorNumber"], 0x4FF);
    EXPECT_EQ(body["ErrorMessage"], "bad state");
}

// ============================================================================
// Parameter extraction
// ============================================================================

TEST(ForwardParamsTest, PutReadsFormBodyOnly) {
    auto req = makeRequest(crow::HTTPMethod::Put, "Ignored=1",
                           "Position=3&clientid=4");
    EXPECT_THAT(DeviceController::forwardParams(req),
                ElementsAre(Pair("Position", "3")));
}

TEST(ForwardParamsTest, PutWithJsonBodyHasNoParams) {
    auto req = makeRequest(crow::HTTPMethod::Put, "", R"({"Position":3})",
                           "application/json");
    EXPECT_THAT(DeviceController::forwardParams(req), IsEmpty());
}

TEST(ForwardParamsTest, GetReadsQuery) {
    auto req = makeRequest(crow::HTTPMethod::Get,
                           "Axis=0&CLIENTTRANSACTIONID=8");
    EXPECT_THAT(DeviceController::forwardParams(req),
                ElementsAre(Pair("Axis", "0")));
}

// ============================================================================
// Fallback
// ============================================================================

TEST(FallbackControllerTest, UnknownEndpoint) {
    crow::request req;
    req.url = "/api/v2/telescope/0/connected";
    crow::response res;
    middleware::RequestContext ctx;
    ctx.clientTransactionId = 3;

    FallbackController::unknownEndpoint(req, res, ctx);

    EXPECT_EQ(res.code, 404);
    auto body = nlohmann::json::parse(res.body);
    EXPECT_EQ(body["ErrorNumber"], 0x400);
    EXPECT_EQ(body["ErrorMessage"], "Unknown endpoint");
    EXPECT_EQ(body["ClientTransactionID"], 3);
}
