/*
 * test_stages.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-06

Description: Tests for recovery, logging, CORS, auth and transaction stages

**************************************************/

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "server/middleware/stages.hpp"

#include <stdexcept>

#include "atom/type/json.hpp"

using namespace skygate::server;
using namespace skygate::server::middleware;
using nlohmann::json;

namespace {

constexpr const char* kGoodCredentials = "Basic b2JzZXJ2ZXI6c2VjcmV0";
constexpr const char* kBadCredentials = "Basic b2JzZXJ2ZXI6d3Jvbmc=";

crow::request makeRequest(crow::HTTPMethod method, const std::string& query,
                          const std::string& authorization = "",
                          const std::string& origin = "") {
    crow::request req;
    req.method = method;
    req.url = "/api/v1/telescope/0/connected";
    req.raw_url = query.empty() ? req.url : req.url + "?" + query;
    req.url_params = crow::query_string(query.empty() ? "" : "?" + query);
    if (!authorization.empty()) {
        req.add_header("Authorization", authorization);
    }
    if (!origin.empty()) {
        req.add_header("Origin", origin);
    }
    return req;
}

}  // namespace

class StagesTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.authentication.enabled = true;
        config_.authentication.username = "observer";
        config_.authentication.password = "secret";
        config_.authentication.realm = "Test Realm";
        config_.cors.enabled = true;
        config_.cors.allowedOrigins = {"*"};
        config_.cors.allowedMethods = {"GET", "PUT", "OPTIONS"};
        config_.cors.allowedHeaders = {"Authorization", "Content-Type"};
        config_.cors.maxAge = 600;
    }

    /// Run the default chain and count handler invocations
    crow::response run(const crow::request& req,
                       const Handler& handler = nullptr) {
        auto chain = buildDefaultChain(config_, counter_);
        crow::response res;
        chain.run(req, res, ctx_,
                  [&](const crow::request& r, crow::response& s,
                      RequestContext& c) {
                      ++handlerCalls_;
                      if (handler) {
                          handler(r, s, c);
                      } else {
                          s.code = 200;
                      }
                  });
        return res;
    }

    skygate::config::ReflectorConfig config_;
    TransactionCounter counter_;
    RequestContext ctx_;
    int handlerCalls_{0};
};

// ============================================================================
// Chain layout
// ============================================================================

TEST_F(StagesTest, DefaultChainOrder) {
    auto chain = buildDefaultChain(config_, counter_);
    EXPECT_EQ(chain.stageNames(),
              (std::vector<std::string>{"recovery", "logging", "cors", "auth",
                                        "transaction"}));

    config_.cors.enabled = false;
    auto noCors = buildDefaultChain(config_, counter_);
    EXPECT_EQ(noCors.stageNames(),
              (std::vector<std::string>{"recovery", "logging", "auth",
                                        "transaction"}));
}

// ============================================================================
// Authentication
// ============================================================================

TEST_F(StagesTest, ValidCredentialsReachHandler) {
    auto res = run(makeRequest(crow::HTTPMethod::Get, "ClientTransactionID=4",
                               kGoodCredentials));
    EXPECT_EQ(handlerCalls_, 1);
    EXPECT_EQ(res.code, 200);
    EXPECT_TRUE(ctx_.authenticated);
    EXPECT_EQ(ctx_.clientTransactionId, 4);
    EXPECT_EQ(ctx_.serverTransactionId, 1);
}

TEST_F(StagesTest, WrongPasswordIsRejected) {
    auto res = run(makeRequest(crow::HTTPMethod::Get, "ClientTransactionID=9",
                               kBadCredentials));
    EXPECT_EQ(handlerCalls_, 0);
    EXPECT_EQ(res.code, 401);
    EXPECT_EQ(res.get_header_value("WWW-Authenticate"),
              "Basic realm=\"Test Realm\"");

    auto body = json::parse(res.body);
    EXPECT_EQ(body["ErrorNumber"], 0x4FF);
    EXPECT_EQ(body["ErrorMessage"], "Authentication required");
    EXPECT_EQ(body["ClientTransactionID"], 9);
    EXPECT_EQ(body["ServerTransactionID"], 0);
    EXPECT_EQ(counter_.current(), 0);
}

TEST_F(StagesTest, MissingCredentialsAreRejected) {
    auto res = run(makeRequest(crow::HTTPMethod::Put, ""));
    EXPECT_EQ(handlerCalls_, 0);
    EXPECT_EQ(res.code, 401);
}

TEST_F(StagesTest, DisabledAuthPassesThrough) {
    config_.authentication.enabled = false;
    auto res = run(makeRequest(crow::HTTPMethod::Get, ""));
    EXPECT_EQ(handlerCalls_, 1);
    EXPECT_FALSE(ctx_.authenticated);
}

TEST(ParseBasicAuthTest, DecodesCredentials) {
    auto creds = parseBasicAuth(kGoodCredentials);
    ASSERT_TRUE(creds.has_value());
    EXPECT_EQ(creds->first, "observer");
    EXPECT_EQ(creds->second, "secret");
}

TEST(ParseBasicAuthTest, SchemeIsCaseInsensitive) {
    EXPECT_TRUE(parseBasicAuth("basic b2JzZXJ2ZXI6c2VjcmV0").has_value());
    EXPECT_TRUE(parseBasicAuth("BASIC b2JzZXJ2ZXI6c2VjcmV0").has_value());
}

TEST(ParseBasicAuthTest, PasswordMayContainColons) {
    auto creds = parseBasicAuth("Basic dXNlcjpwYTpzcw==");
    ASSERT_TRUE(creds.has_value());
    EXPECT_EQ(creds->first, "user");
    EXPECT_EQ(creds->second, "pa:ss");
}

TEST(ParseBasicAuthTest, RejectsMalformedHeaders) {
    EXPECT_FALSE(parseBasicAuth("").has_value());
    EXPECT_FALSE(parseBasicAuth("Bearer abc").has_value());
    EXPECT_FALSE(parseBasicAuth("Basic bm9jb2xvbg==").has_value());
}

// ============================================================================
// CORS
// ============================================================================

TEST_F(StagesTest, PreflightIsAnsweredBeforeAuth) {
    auto res = run(makeRequest(crow::HTTPMethod::Options, "", "",
                               "https://planner.example"));
    EXPECT_EQ(handlerCalls_, 0);
    EXPECT_EQ(res.code, 204);
    EXPECT_TRUE(res.body.empty());
    EXPECT_EQ(res.get_header_value("Access-Control-Allow-Origin"), "*");
    EXPECT_EQ(res.get_header_value("Access-Control-Allow-Methods"),
              "GET, PUT, OPTIONS");
    EXPECT_EQ(res.get_header_value("Access-Control-Allow-Headers"),
              "Authorization, Content-Type");
    EXPECT_EQ(res.get_header_value("Access-Control-Max-Age"), "600");
    EXPECT_EQ(counter_.current(), 0);
}

TEST_F(StagesTest, CorsHeadersOnRegularResponses) {
    config_.cors.allowedOrigins = {"https://planner.example"};
    config_.cors.allowCredentials = true;
    auto res = run(makeRequest(crow::HTTPMethod::Get, "", kGoodCredentials,
                               "https://planner.example"));
    EXPECT_EQ(handlerCalls_, 1);
    EXPECT_EQ(res.get_header_value("Access-Control-Allow-Origin"),
              "https://planner.example");
    EXPECT_EQ(res.get_header_value("Access-Control-Allow-Credentials"),
              "true");
}

TEST_F(StagesTest, UnlistedOriginGetsNoCorsHeaders) {
    config_.cors.allowedOrigins = {"https://planner.example"};
    auto res = run(makeRequest(crow::HTTPMethod::Get, "", kGoodCredentials,
                               "https://evil.example"));
    EXPECT_EQ(handlerCalls_, 1);
    EXPECT_TRUE(res.get_header_value("Access-Control-Allow-Origin").empty());
}

// ============================================================================
// Recovery and transaction ids
// ============================================================================

TEST_F(StagesTest, HandlerExceptionBecomes500) {
    auto res = run(
        makeRequest(crow::HTTPMethod::Get, "ClientTransactionID=21",
                    kGoodCredentials),
        [](const crow::request&, crow::response&, RequestContext&) {
            throw std::runtime_error("driver exploded");
        });

    EXPECT_EQ(handlerCalls_, 1);
    EXPECT_EQ(res.code, 500);
    auto body = json::parse(res.body);
    EXPECT_EQ(body["ErrorNumber"], 0x4FF);
    EXPECT_EQ(body["ErrorMessage"], "Internal server error");
    EXPECT_EQ(body["ClientTransactionID"], 21);
    EXPECT_EQ(body["ServerTransactionID"], 1);
    EXPECT_EQ(ctx_.error, "driver exploded");
}

TEST_F(StagesTest, ServerTransactionIdsIncrease) {
    config_.authentication.enabled = false;
    run(makeRequest(crow::HTTPMethod::Get, ""));
    EXPECT_EQ(ctx_.serverTransactionId, 1);

    ctx_ = {};
    run(makeRequest(crow::HTTPMethod::Get, ""));
    EXPECT_EQ(ctx_.serverTransactionId, 2);
    EXPECT_TRUE(ctx_.transactionAssigned);
}

TEST(StatusLogLevelTest, ClassifiesStatus) {
    EXPECT_EQ(statusLogLevel(200), spdlog::level::debug);
    EXPECT_EQ(statusLogLevel(204), spdlog::level::debug);
    EXPECT_EQ(statusLogLevel(401), spdlog::level::warn);
    EXPECT_EQ(statusLogLevel(404), spdlog::level::warn);
    EXPECT_EQ(statusLogLevel(500), spdlog::level::err);
}
