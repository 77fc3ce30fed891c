/*
 * discovery.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-1

Description: Alpaca UDP discovery responder

**************************************************/

#ifndef SKYGATE_SERVER_DISCOVERY_HPP
#define SKYGATE_SERVER_DISCOVERY_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

namespace skygate::server {

/**
 * @brief Answers `alpacadiscovery1` datagrams with `{"AlpacaPort": N}`
 *
 * The receive loop uses a one second read timeout so that stop() is
 * observed within one deadline without a second thread. Replies are always
 * unicast to the sender.
 */
class DiscoveryResponder {
public:
    static constexpr std::chrono::milliseconds kReadDeadline{1000};
    static constexpr size_t kMaxDatagramSize = 1024;

    /**
     * @param port UDP port to bind on all interfaces, 0 picks a free port
     * @param apiPort REST port advertised in replies
     */
    DiscoveryResponder(std::uint16_t port, int apiPort);
    ~DiscoveryResponder();

    DiscoveryResponder(const DiscoveryResponder&) = delete;
    DiscoveryResponder& operator=(const DiscoveryResponder&) = delete;

    /**
     * @brief Bind the socket and launch the receive loop
     * @throws atom::error::RuntimeError if the socket cannot be bound
     */
    void start();

    /**
     * @brief Signal the loop and wait for it, at most one read deadline
     */
    void stop();

    [[nodiscard]] bool isRunning() const { return running_.load(); }

    /// Port actually bound, useful when constructed with port 0
    [[nodiscard]] std::uint16_t boundPort() const { return boundPort_.load(); }

    [[nodiscard]] int apiPort() const { return apiPort_; }

    [[nodiscard]] std::uint64_t repliesSent() const {
        return repliesSent_.load();
    }

    /**
     * @brief Reply for a received datagram
     *
     * The datagram must equal the discovery token byte for byte. Anything
     * else yields no reply.
     */
    static auto handleDatagram(std::string_view datagram, int apiPort)
        -> std::optional<std::string>;

    /// JSON payload of a discovery reply
    static auto makeResponse(int apiPort) -> std::string;

private:
    void receiveLoop();

    std::uint16_t port_;
    int apiPort_;
    int socket_{-1};
    std::atomic<bool> running_{false};
    std::atomic<std::uint16_t> boundPort_{0};
    std::atomic<std::uint64_t> repliesSent_{0};
    std::thread thread_;
};

}  // namespace skygate::server

#endif  // SKYGATE_SERVER_DISCOVERY_HPP
