/*
 * discovery.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "discovery.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>

#include "alpaca/ascom_types.hpp"
#include "atom/error/exception.hpp"
#include "atom/log/spdlog_logger.hpp"

namespace skygate::server {

namespace {

auto describePeer(const sockaddr_in& addr) -> std::string {
    std::array<char, INET_ADDRSTRLEN> host{};
    inet_ntop(AF_INET, &addr.sin_addr, host.data(), host.size());
    return std::string(host.data()) + ":" + std::to_string(ntohs(addr.sin_port));
}

}  // namespace

DiscoveryResponder::DiscoveryResponder(std::uint16_t port, int apiPort)
    : port_(port), apiPort_(apiPort) {}

DiscoveryResponder::~DiscoveryResponder() { stop(); }

auto DiscoveryResponder::makeResponse(int apiPort) -> std::string {
    alpaca::json reply = {{"AlpacaPort", apiPort}};
    return reply.dump();
}

auto DiscoveryResponder::handleDatagram(std::string_view datagram, int apiPort)
    -> std::optional<std::string> {
    if (datagram != alpaca::kDiscoveryMessage) {
        return std::nullopt;
    }
    return makeResponse(apiPort);
}

void DiscoveryResponder::start() {
    if (running_.load()) {
        LOG_WARN("Discovery responder already running on port {}",
                 boundPort_.load());
        return;
    }

    int fd = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (fd < 0) {
        THROW_RUNTIME_ERROR("Failed to create UDP socket: " +
                            std::string(std::strerror(errno)));
    }

    int reuse = 1;
    if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) <
        0) {
        LOG_WARN("Failed to set SO_REUSEADDR on discovery socket: {}",
                 std::strerror(errno));
    }

    timeval timeout{};
    timeout.tv_sec = kReadDeadline.count() / 1000;
    timeout.tv_usec = (kReadDeadline.count() % 1000) * 1000;
    if (::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &timeout,
                     sizeof(timeout)) < 0) {
        std::string reason = std::strerror(errno);
        ::close(fd);
        THROW_RUNTIME_ERROR("Failed to set discovery read deadline: " +
                            reason);
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = htons(port_);
    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::string reason = std::strerror(errno);
        ::close(fd);
        THROW_RUNTIME_ERROR("Failed to bind discovery port " +
                            std::to_string(port_) + ": " + reason);
    }

    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &len) == 0) {
        boundPort_ = ntohs(bound.sin_port);
    } else {
        boundPort_ = port_;
    }

    socket_ = fd;
    running_ = true;
    thread_ = std::thread([this] { receiveLoop(); });

    LOG_INFO("Discovery responder listening on UDP port {}, advertising API "
             "port {}",
             boundPort_.load(), apiPort_);
}

void DiscoveryResponder::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    LOG_INFO("Stopping discovery responder");
    if (thread_.joinable()) {
        thread_.join();
    }
    if (socket_ >= 0) {
        ::close(socket_);
        socket_ = -1;
    }
}

void DiscoveryResponder::receiveLoop() {
    std::array<char, kMaxDatagramSize> buffer{};

    while (running_.load()) {
        sockaddr_in peer{};
        socklen_t peerLen = sizeof(peer);
        ssize_t received =
            ::recvfrom(socket_, buffer.data(), buffer.size(), 0,
                       reinterpret_cast<sockaddr*>(&peer), &peerLen);
        if (received < 0) {
            // Deadline expired, loop around to check the stop flag
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
                continue;
            }
            LOG_WARN("Error reading discovery datagram: {}",
                     std::strerror(errno));
            continue;
        }

        std::string_view datagram(buffer.data(),
                                  static_cast<size_t>(received));
        auto reply = handleDatagram(datagram, apiPort_);
        if (!reply) {
            LOG_DEBUG("Ignoring non-discovery datagram ({} bytes) from {}",
                      received, describePeer(peer));
            continue;
        }

        LOG_INFO("Discovery request from {}, replying with API port {}",
                 describePeer(peer), apiPort_);
        ssize_t sent = ::sendto(socket_, reply->data(), reply->size(), 0,
                                reinterpret_cast<sockaddr*>(&peer), peerLen);
        if (sent < 0) {
            LOG_ERROR("Failed to send discovery reply to {}: {}",
                      describePeer(peer), std::strerror(errno));
            continue;
        }
        ++repliesSent_;
    }
    LOG_INFO("Discovery loop stopped");
}

}  // namespace skygate::server
