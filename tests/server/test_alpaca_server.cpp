/*
 * test_alpaca_server.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-09

Description: Wiring tests for the reflector server, routes are driven
through Crow without opening sockets

**************************************************/

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "exception/exception.hpp"
#include "mocks/mock_http_transport.hpp"
#include "server/alpaca_server.hpp"

using namespace skygate::server;
using skygate::InvalidConfigException;
using skygate::test::envelopeResponse;
using skygate::test::MockHttpTransport;
using ::testing::_;
using ::testing::ElementsAre;
using ::testing::NiceMock;
using ::testing::Return;
using nlohmann::json;

class AlpacaServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_ = skygate::config::ReflectorConfig::defaults();
        config_.cors.enabled = false;
        config_.server.listenAddress = "127.0.0.1:18111";
        config_.server.discoveryPort = 0;

        skygate::config::DeviceConfig mount;
        mount.type = "telescope";
        mount.number = 0;
        mount.backend.networkUrl = "http://mount.local:11111";
        config_.devices.push_back(mount);

        skygate::config::DeviceConfig camera;
        camera.type = "camera";
        camera.number = 0;
        camera.backend.networkUrl = "http://camera.local:11111";
        config_.devices.push_back(camera);

        transport_ = std::make_shared<NiceMock<MockHttpTransport>>();
        ON_CALL(*transport_, perform(_))
            .WillByDefault(Return(envelopeResponse(true)));
    }

    auto makeServer() -> std::unique_ptr<AlpacaServer> {
        config_.validate();
        return std::make_unique<AlpacaServer>(config_, transport_);
    }

    skygate::config::ReflectorConfig config_;
    std::shared_ptr<NiceMock<MockHttpTransport>> transport_;
};

TEST_F(AlpacaServerTest, LoadsConfiguredDevices) {
    auto server = makeServer();
    EXPECT_EQ(server->registry().size(), 2u);
    EXPECT_EQ(server->config().apiPort(), 18111);
}

TEST_F(AlpacaServerTest, PipelineWithoutCors) {
    auto server = makeServer();
    EXPECT_THAT(server->chain().stageNames(),
                ElementsAre("recovery", "logging", "auth", "transaction"));
}

TEST_F(AlpacaServerTest, PipelineWithCors) {
    config_.cors.enabled = true;
    auto server = makeServer();
    EXPECT_THAT(server->chain().stageNames(),
                ElementsAre("recovery", "logging", "cors", "auth",
                            "transaction"));
}

TEST_F(AlpacaServerTest, StopWithoutStartIsSafe) {
    auto server = makeServer();
    server->stop();
    server->stop();
}

#ifndef CROW_ENABLE_SSL
TEST_F(AlpacaServerTest, TlsNeedsSslSupport) {
    config_.tls.enabled = true;
    config_.tls.certFile = "cert.pem";
    config_.tls.keyFile = "key.pem";
    EXPECT_THROW(makeServer(), InvalidConfigException);
}
#endif

TEST_F(AlpacaServerTest, ManagementRouteIsServed) {
    auto server = makeServer();
    auto& app = server->getApp();
    app.validate();

    crow::request req;
    req.method = crow::HTTPMethod::Get;
    req.url = "/management/apiversions";
    req.url_params = crow::query_string("?ClientTransactionID=7");
    crow::response res;
    app.handle_full(req, res);

    ASSERT_EQ(res.code, 200);
    auto body = json::parse(res.body);
    EXPECT_EQ(body["Value"], json::array({1}));
    EXPECT_EQ(body["ClientTransactionID"], 7);
    EXPECT_EQ(body["ServerTransactionID"], 1);
}

TEST_F(AlpacaServerTest, UnknownDeviceIsNotFound) {
    auto server = makeServer();
    auto& app = server->getApp();
    app.validate();

    crow::request req;
    req.method = crow::HTTPMethod::Get;
    req.url = "/api/v1/dome/0/connected";
    crow::response res;
    app.handle_full(req, res);

    EXPECT_EQ(res.code, 404);
    EXPECT_EQ(json::parse(res.body)["ErrorNumber"], 0x400);
}

TEST_F(AlpacaServerTest, PreflightSkipsAuthAndCarriesCorsHeaders) {
    config_.cors.enabled = true;
    config_.cors.allowedOrigins = {"http://planetarium.local"};
    config_.authentication.enabled = true;
    config_.authentication.username = "observer";
    config_.authentication.password = "secret";
    auto server = makeServer();
    auto& app = server->getApp();
    app.validate();

    crow::request req;
    req.method = crow::HTTPMethod::Options;
    req.url = "/api/v1/telescope/0/connected";
    req.add_header("Origin", "http://planetarium.local");
    req.add_header("Access-Control-Request-Method", "PUT");
    crow::response res;

    // Same order a Crow connection uses: middleware before, router, then
    // middleware after
    auto& preflight = app.get_middleware<middleware::PreflightCors>();
    middleware::PreflightCors::context ctx;
    preflight.before_handle(req, res, ctx);
    app.handle_full(req, res);
    preflight.after_handle(req, res, ctx);

    EXPECT_EQ(res.code, 204);
    EXPECT_EQ(res.get_header_value("Access-Control-Allow-Origin"),
              "http://planetarium.local");
    EXPECT_EQ(res.get_header_value("Access-Control-Allow-Methods"),
              "GET, POST, PUT, DELETE, OPTIONS");
    EXPECT_FALSE(res.get_header_value("Access-Control-Allow-Headers").empty());
    EXPECT_TRUE(res.get_header_value("WWW-Authenticate").empty());
    EXPECT_TRUE(res.body.empty());
}

TEST_F(AlpacaServerTest, PreflightFromUnknownOriginGetsNoCorsHeaders) {
    config_.cors.enabled = true;
    config_.cors.allowedOrigins = {"http://planetarium.local"};
    auto server = makeServer();
    auto& app = server->getApp();
    app.validate();

    crow::request req;
    req.method = crow::HTTPMethod::Options;
    req.url = "/management/apiversions";
    req.add_header("Origin", "http://elsewhere.local");
    crow::response res;

    auto& preflight = app.get_middleware<middleware::PreflightCors>();
    middleware::PreflightCors::context ctx;
    preflight.before_handle(req, res, ctx);
    app.handle_full(req, res);
    preflight.after_handle(req, res, ctx);

    EXPECT_EQ(res.code, 204);
    EXPECT_TRUE(res.get_header_value("Access-Control-Allow-Origin").empty());
    EXPECT_TRUE(res.body.empty());
}
