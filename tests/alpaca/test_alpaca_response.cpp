/*
 * test_alpaca_response.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-02

Description: Tests for the Alpaca response envelope and ASCOM constants

**************************************************/

#include <gtest/gtest.h>

#include "alpaca/alpaca_response.hpp"
#include "alpaca/ascom_types.hpp"

using namespace skygate::alpaca;

// ============================================================================
// Envelope
// ============================================================================

TEST(AlpacaResponseTest, SuccessCarriesValue) {
    auto resp = AlpacaResponse::success(json(42.5), 7, 9);
    auto j = resp.toJson();

    EXPECT_TRUE(resp.isSuccess());
    EXPECT_DOUBLE_EQ(j["Value"].get<double>(), 42.5);
    EXPECT_EQ(j["ClientTransactionID"], 7);
    EXPECT_EQ(j["ServerTransactionID"], 9);
    EXPECT_EQ(j["ErrorNumber"], 0);
    EXPECT_EQ(j["ErrorMessage"], "");
}

TEST(AlpacaResponseTest, ErrorOmitsValue) {
    auto resp = AlpacaResponse::error(ASCOMErrorCode::NotImplemented,
                                      "Method not implemented", 3, 4);
    auto j = resp.toJson();

    EXPECT_FALSE(resp.isSuccess());
    EXPECT_FALSE(j.contains("Value"));
    EXPECT_EQ(j["ErrorNumber"], 0x400);
    EXPECT_EQ(j["ErrorMessage"], "Method not implemented");
}

TEST(AlpacaResponseTest, ErrorWithoutNumberOrMessageIsFilledIn) {
    auto resp = AlpacaResponse::error(0, "", 0, 0);
    EXPECT_EQ(resp.errorNumber, ASCOMErrorCode::UnspecifiedError);
    EXPECT_FALSE(resp.errorMessage.empty());
}

TEST(AlpacaResponseTest, SuccessNeverReportsAMessage) {
    AlpacaResponse resp;
    resp.errorMessage = "stale";
    EXPECT_EQ(resp.toJson()["ErrorMessage"], "");
}

TEST(AlpacaResponseTest, FromJsonToleratesMissingFields) {
    auto resp = AlpacaResponse::fromJson(json::object());
    EXPECT_TRUE(resp.isSuccess());
    EXPECT_TRUE(resp.value.is_null());
    EXPECT_EQ(resp.serverTransactionId, 0);

    auto remote = AlpacaResponse::fromJson(json::parse(
        R"({"Value":[1,2],"ClientTransactionID":5,"ServerTransactionID":11,)"
        R"("ErrorNumber":1031,"ErrorMessage":"Not connected"})"));
    EXPECT_EQ(remote.errorNumber, ASCOMErrorCode::NotConnected);
    EXPECT_EQ(remote.errorMessage, "Not connected");
    EXPECT_EQ(remote.value.size(), 2u);
}

// ============================================================================
// ASCOM constants and helpers
// ============================================================================

TEST(AscomTypesTest, ErrorCodes) {
    EXPECT_EQ(ASCOMErrorCode::NotImplemented, 0x400);
    EXPECT_EQ(ASCOMErrorCode::InvalidValue, 0x401);
    EXPECT_EQ(ASCOMErrorCode::ValueNotSet, 0x402);
    EXPECT_EQ(ASCOMErrorCode::NotConnected, 0x407);
    EXPECT_EQ(ASCOMErrorCode::InvalidWhileParked, 0x408);
    EXPECT_EQ(ASCOMErrorCode::InvalidWhileSlaved, 0x409);
    EXPECT_EQ(ASCOMErrorCode::InvalidOperation, 0x40B);
    EXPECT_EQ(ASCOMErrorCode::ActionNotImplemented, 0x40C);
    EXPECT_EQ(ASCOMErrorCode::UnspecifiedError, 0x4FF);
}

TEST(AscomTypesTest, InterfaceVersions) {
    EXPECT_EQ(interfaceVersionFor("telescope"), 3);
    EXPECT_EQ(interfaceVersionFor("camera"), 3);
    EXPECT_EQ(interfaceVersionFor("dome"), 2);
    EXPECT_EQ(interfaceVersionFor("safetymonitor"), 1);
}

TEST(AscomTypesTest, DeviceRoleNames) {
    EXPECT_EQ(deviceRoleToString(DeviceRole::Telescope), "telescope");
    EXPECT_EQ(stringToDeviceRole("filterwheel"), DeviceRole::FilterWheel);
    EXPECT_FALSE(stringToDeviceRole("toaster").has_value());
}

TEST(AscomTypesTest, StateNames) {
    EXPECT_EQ(cameraStateToString(0), "Idle");
    EXPECT_EQ(cameraStateToString(2), "Exposing");
    EXPECT_EQ(cameraStateToString(99), "");
    EXPECT_EQ(shutterStateToString(0), "Open");
    EXPECT_EQ(shutterStateToString(1), "Closed");
}
