/*
 * test_discovery.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-03

Description: Tests for the UDP discovery responder

**************************************************/

#include <gtest/gtest.h>

#include "server/discovery.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <array>
#include <string>

#include "atom/type/json.hpp"

using namespace skygate::server;

namespace {

/// Send one datagram to the responder and wait up to two seconds for a reply
std::optional<std::string> exchange(std::uint16_t port,
                                    const std::string& payload) {
    int fd = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (fd < 0) {
        return std::nullopt;
    }
    timeval timeout{2, 0};
    ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    ::sendto(fd, payload.data(), payload.size(), 0,
             reinterpret_cast<sockaddr*>(&addr), sizeof(addr));

    std::array<char, 1024> buffer{};
    ssize_t n = ::recv(fd, buffer.data(), buffer.size(), 0);
    ::close(fd);
    if (n <= 0) {
        return std::nullopt;
    }
    return std::string(buffer.data(), static_cast<size_t>(n));
}

}  // namespace

// ============================================================================
// Datagram handling
// ============================================================================

TEST(DiscoveryResponderTest, ExactTokenGetsReply) {
    auto reply = DiscoveryResponder::handleDatagram("alpacadiscovery1", 11111);
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(*reply, R"({"AlpacaPort":11111})");
}

TEST(DiscoveryResponderTest, AnythingElseIsIgnored) {
    EXPECT_FALSE(DiscoveryResponder::handleDatagram("", 1).has_value());
    EXPECT_FALSE(
        DiscoveryResponder::handleDatagram("alpacadiscovery", 1).has_value());
    EXPECT_FALSE(
        DiscoveryResponder::handleDatagram("alpacadiscovery1\n", 1).has_value());
    EXPECT_FALSE(
        DiscoveryResponder::handleDatagram("ALPACADISCOVERY1", 1).has_value());
}

TEST(DiscoveryResponderTest, ReplyAdvertisesConfiguredPort) {
    auto payload = nlohmann::json::parse(DiscoveryResponder::makeResponse(8080));
    EXPECT_EQ(payload["AlpacaPort"], 8080);
    EXPECT_EQ(payload.size(), 1u);
}

// ============================================================================
// Socket lifecycle
// ============================================================================

TEST(DiscoveryResponderTest, RepliesOverLoopback) {
    DiscoveryResponder responder(0, 4567);
    responder.start();
    ASSERT_TRUE(responder.isRunning());
    ASSERT_NE(responder.boundPort(), 0);

    auto reply = exchange(responder.boundPort(), "alpacadiscovery1");
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(nlohmann::json::parse(*reply)["AlpacaPort"], 4567);
    EXPECT_EQ(responder.repliesSent(), 1u);

    EXPECT_FALSE(exchange(responder.boundPort(), "hello").has_value());
    EXPECT_EQ(responder.repliesSent(), 1u);

    responder.stop();
    EXPECT_FALSE(responder.isRunning());
}

TEST(DiscoveryResponderTest, StopIsIdempotent) {
    DiscoveryResponder responder(0, 1);
    responder.start();
    responder.stop();
    EXPECT_NO_THROW(responder.stop());
}
