/*
 * alpaca_client.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-10

Description: ASCOM Alpaca REST API client implementation

*************************************************/

#include "alpaca_client.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <type_traits>

#include "alpaca/ascom_types.hpp"
#include "exception/exception.hpp"

namespace skygate::client::alpaca {

using ::skygate::alpaca::AlpacaResponse;

namespace {

/// Closes the descriptor when discovery returns or throws
class UdpSocket {
public:
    UdpSocket() : fd_(::socket(AF_INET, SOCK_DGRAM, 0)) {}
    ~UdpSocket() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;

    [[nodiscard]] int fd() const { return fd_; }
    [[nodiscard]] bool valid() const { return fd_ >= 0; }

private:
    int fd_;
};

auto formatValue(bool value) -> std::string { return value ? "true" : "false"; }

auto formatValue(double value) -> std::string {
    return fmt::format("{}", value);
}

auto formatValue(int value) -> std::string { return std::to_string(value); }

void setReceiveTimeout(int fd, std::chrono::milliseconds timeout) {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    if (::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0) {
        THROW_TRANSPORT_EXCEPTION(
            0, fmt::format("failed to set read deadline: {}",
                           std::strerror(errno)));
    }
}

}  // namespace

AlpacaClient::AlpacaClient(std::shared_ptr<HttpTransport> transport,
                           std::chrono::milliseconds timeout)
    : transport_(std::move(transport)), timeout_(timeout) {
    if (!transport_) {
        THROW_TRANSPORT_EXCEPTION(0, "AlpacaClient requires a transport");
    }
}

auto AlpacaClient::nextTransactionId() -> std::int32_t {
    return transaction_.next();
}

// ==================== Discovery ====================

auto AlpacaClient::discoverDevices(int port,
                                   std::chrono::milliseconds timeout,
                                   const std::string& broadcastAddress)
    -> std::vector<AlpacaDevice> {
    spdlog::info("Starting Alpaca device discovery on port {}", port);

    UdpSocket sock;
    if (!sock.valid()) {
        THROW_TRANSPORT_EXCEPTION(
            0, fmt::format("failed to create UDP socket: {}",
                           std::strerror(errno)));
    }

    int enable = 1;
    if (::setsockopt(sock.fd(), SOL_SOCKET, SO_BROADCAST, &enable,
                     sizeof(enable)) != 0) {
        THROW_TRANSPORT_EXCEPTION(
            0, fmt::format("failed to enable broadcast: {}",
                           std::strerror(errno)));
    }

    sockaddr_in local{};
    local.sin_family = AF_INET;
    local.sin_addr.s_addr = htonl(INADDR_ANY);
    local.sin_port = 0;
    if (::bind(sock.fd(), reinterpret_cast<sockaddr*>(&local),
               sizeof(local)) != 0) {
        THROW_TRANSPORT_EXCEPTION(
            0, fmt::format("failed to bind UDP listener: {}",
                           std::strerror(errno)));
    }

    sockaddr_in target{};
    target.sin_family = AF_INET;
    target.sin_port = htons(static_cast<std::uint16_t>(port));
    if (::inet_pton(AF_INET, broadcastAddress.c_str(), &target.sin_addr) !=
        1) {
        THROW_TRANSPORT_EXCEPTION(
            0, "invalid broadcast address: " + broadcastAddress);
    }

    const auto& message = ::skygate::alpaca::kDiscoveryMessage;
    if (::sendto(sock.fd(), message.data(), message.size(), 0,
                 reinterpret_cast<sockaddr*>(&target),
                 sizeof(target)) < 0) {
        THROW_TRANSPORT_EXCEPTION(
            0, fmt::format("failed to send discovery broadcast: {}",
                           std::strerror(errno)));
    }
    spdlog::debug("Sent discovery broadcast to {}:{}", broadcastAddress,
                  port);

    std::vector<AlpacaDevice> devices;
    std::array<char, 1024> buffer{};
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            break;
        }
        setReceiveTimeout(sock.fd(), remaining);

        sockaddr_in sender{};
        socklen_t senderLen = sizeof(sender);
        auto received = ::recvfrom(sock.fd(), buffer.data(), buffer.size(), 0,
                                   reinterpret_cast<sockaddr*>(&sender),
                                   &senderLen);
        if (received < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                break;
            }
            if (errno != EINTR) {
                spdlog::warn("Error reading discovery response: {}",
                             std::strerror(errno));
            }
            continue;
        }

        int alpacaPort = 0;
        try {
            auto reply = json::parse(
                std::string(buffer.data(), static_cast<size_t>(received)));
            alpacaPort = reply.at("AlpacaPort").get<int>();
        } catch (const json::exception& e) {
            spdlog::warn("Failed to parse discovery response: {}", e.what());
            continue;
        }

        std::array<char, INET_ADDRSTRLEN> ip{};
        ::inet_ntop(AF_INET, &sender.sin_addr, ip.data(), ip.size());
        auto serverUrl = fmt::format("http://{}:{}", ip.data(), alpacaPort);
        spdlog::info("Discovered Alpaca server {}", serverUrl);

        try {
            auto serverDevices = getConfiguredDevices(serverUrl);
            devices.insert(devices.end(), serverDevices.begin(),
                           serverDevices.end());
        } catch (const std::exception& e) {
            spdlog::error("Failed to get configured devices from {}: {}",
                          serverUrl, e.what());
        }
    }

    spdlog::info("Discovery complete, {} device(s) found", devices.size());
    return devices;
}

auto AlpacaClient::getConfiguredDevices(const std::string& serverUrl)
    -> std::vector<AlpacaDevice> {
    auto response = execute(HttpMethod::GET,
                            serverUrl + "/management/v1/configureddevices", {});
    if (!response.value.is_array()) {
        THROW_TRANSPORT_EXCEPTION(
            200, "configureddevices did not return a device list");
    }

    std::vector<AlpacaDevice> devices;
    const auto now = std::chrono::system_clock::now();
    for (const auto& entry : response.value) {
        AlpacaDevice device;
        device.deviceType = entry.value("DeviceType", "");
        device.deviceNumber = entry.value("DeviceNumber", 0);
        device.name = entry.value("DeviceName", "");
        device.uuid = entry.value("UniqueID", "");
        device.serverUrl = serverUrl;
        device.deviceId = AlpacaDevice::makeDeviceId(
            serverUrl, device.deviceType, device.deviceNumber);
        device.lastSeen = now;
        devices.push_back(std::move(device));
    }
    return devices;
}

// ==================== Generic API Access ====================

auto AlpacaClient::buildUrl(const AlpacaDevice& device,
                            const std::string& method) -> std::string {
    return fmt::format("{}/api/v1/{}/{}/{}", device.serverUrl,
                       device.deviceType, device.deviceNumber, method);
}

auto AlpacaClient::get(const AlpacaDevice& device, const std::string& method,
                       const FormParams& params) -> AlpacaResponse {
    return execute(HttpMethod::GET, buildUrl(device, method), params);
}

auto AlpacaClient::put(const AlpacaDevice& device, const std::string& method,
                       const FormParams& params) -> AlpacaResponse {
    return execute(HttpMethod::PUT, buildUrl(device, method), params);
}

auto AlpacaClient::execute(HttpMethod method, const std::string& url,
                           const FormParams& params) -> AlpacaResponse {
    FormParams fields{{"ClientID", std::to_string(kClientId)},
                      {"ClientTransactionID",
                       std::to_string(nextTransactionId())}};
    fields.insert(fields.end(), params.begin(), params.end());

    HttpRequest request;
    request.method = method;
    request.timeout = timeout_;
    if (method == HttpMethod::GET) {
        request.url = url + "?" + encodeForm(fields);
    } else {
        request.url = url;
        request.body = encodeForm(fields);
        request.contentType = "application/x-www-form-urlencoded";
    }

    spdlog::debug("{} {}", methodToString(method), request.url);
    auto reply = transport_->perform(request);
    if (reply.statusCode != 200) {
        THROW_TRANSPORT_EXCEPTION(
            static_cast<int>(reply.statusCode),
            fmt::format("HTTP {} from {}: {}", reply.statusCode, url,
                        reply.body));
    }

    AlpacaResponse response;
    try {
        auto body = json::parse(reply.body);
        if (!body.is_object()) {
            THROW_TRANSPORT_EXCEPTION(200, "response is not an Alpaca envelope");
        }
        response = AlpacaResponse::fromJson(body);
    } catch (const json::exception& e) {
        THROW_TRANSPORT_EXCEPTION(
            200, fmt::format("failed to unmarshal response: {}", e.what()));
    }

    if (response.errorNumber != 0) {
        THROW_ALPACA_API_EXCEPTION(response.errorNumber,
                                   response.errorMessage);
    }
    return response;
}

template <typename T>
void AlpacaClient::readProperty(const AlpacaDevice& device,
                                const std::string& method, T& out) {
    try {
        auto value = get(device, method).value;
        if constexpr (std::is_same_v<T, bool>) {
            if (value.is_boolean()) {
                out = value.template get<bool>();
            }
        } else if constexpr (std::is_arithmetic_v<T>) {
            if (value.is_number()) {
                out = static_cast<T>(value.template get<double>());
            }
        } else {
            out = value.template get<T>();
        }
    } catch (const std::exception& e) {
        spdlog::debug("Reading {} from {} failed: {}", method, device.deviceId,
                      e.what());
    }
}

// ==================== Common Device Operations ====================

void AlpacaClient::connect(const AlpacaDevice& device) {
    put(device, "connected", {{"Connected", formatValue(true)}});
}

void AlpacaClient::disconnect(const AlpacaDevice& device) {
    put(device, "connected", {{"Connected", formatValue(false)}});
}

auto AlpacaClient::isConnected(const AlpacaDevice& device) -> bool {
    auto response = get(device, "connected");
    if (!response.value.is_boolean()) {
        THROW_TRANSPORT_EXCEPTION(
            200, "unexpected value type for connected: " +
                     std::string(response.value.type_name()));
    }
    return response.value.get<bool>();
}

auto AlpacaClient::getName(const AlpacaDevice& device) -> std::string {
    auto response = get(device, "name");
    if (!response.value.is_string()) {
        THROW_TRANSPORT_EXCEPTION(200, "unexpected value type for name");
    }
    return response.value.get<std::string>();
}

auto AlpacaClient::getDescription(const AlpacaDevice& device) -> std::string {
    auto response = get(device, "description");
    if (!response.value.is_string()) {
        THROW_TRANSPORT_EXCEPTION(200,
                                  "unexpected value type for description");
    }
    return response.value.get<std::string>();
}

// ==================== Telescope ====================

auto AlpacaClient::getTelescopeStatus(const AlpacaDevice& device)
    -> TelescopeStatus {
    TelescopeStatus status;
    status.connected = isConnected(device);
    if (!status.connected) {
        return status;
    }

    readProperty(device, "tracking", status.tracking);
    readProperty(device, "slewing", status.slewing);
    readProperty(device, "atpark", status.atPark);
    readProperty(device, "rightascension", status.rightAscension);
    readProperty(device, "declination", status.declination);
    readProperty(device, "altitude", status.altitude);
    readProperty(device, "azimuth", status.azimuth);
    return status;
}

void AlpacaClient::slewToCoordinates(const AlpacaDevice& device, double ra,
                                     double dec) {
    put(device, "slewtocoordinates",
        {{"RightAscension", formatValue(ra)},
         {"Declination", formatValue(dec)}});
}

void AlpacaClient::park(const AlpacaDevice& device) { put(device, "park"); }

void AlpacaClient::unpark(const AlpacaDevice& device) {
    put(device, "unpark");
}

void AlpacaClient::setTracking(const AlpacaDevice& device, bool tracking) {
    put(device, "tracking", {{"Tracking", formatValue(tracking)}});
}

void AlpacaClient::abortSlew(const AlpacaDevice& device) {
    put(device, "abortslew");
}

// ==================== Camera ====================

auto AlpacaClient::getCameraStatus(const AlpacaDevice& device)
    -> CameraStatus {
    CameraStatus status;
    status.connected = isConnected(device);
    if (!status.connected) {
        return status;
    }

    int state = -1;
    readProperty(device, "camerastate", state);
    if (state >= 0) {
        status.cameraState = ::skygate::alpaca::cameraStateToString(state);
    }
    readProperty(device, "ccdtemperature", status.ccdTemperature);
    readProperty(device, "cooleron", status.coolerOn);
    readProperty(device, "coolerpower", status.coolerPower);
    readProperty(device, "imageready", status.imageReady);
    readProperty(device, "percentcompleted", status.percentCompleted);
    return status;
}

void AlpacaClient::startExposure(const AlpacaDevice& device, double duration,
                                 bool light) {
    put(device, "startexposure",
        {{"Duration", formatValue(duration)}, {"Light", formatValue(light)}});
}

void AlpacaClient::stopExposure(const AlpacaDevice& device) {
    put(device, "stopexposure");
}

void AlpacaClient::abortExposure(const AlpacaDevice& device) {
    put(device, "abortexposure");
}

void AlpacaClient::setCoolerOn(const AlpacaDevice& device, bool on) {
    put(device, "cooleron", {{"CoolerOn", formatValue(on)}});
}

// ==================== Dome ====================

auto AlpacaClient::getDomeStatus(const AlpacaDevice& device) -> DomeStatus {
    DomeStatus status;
    status.connected = isConnected(device);
    if (!status.connected) {
        return status;
    }

    readProperty(device, "athome", status.atHome);
    readProperty(device, "atpark", status.atPark);
    readProperty(device, "slewing", status.slewing);
    readProperty(device, "azimuth", status.azimuth);
    int shutter = -1;
    readProperty(device, "shutterstatus", shutter);
    if (shutter >= 0) {
        status.shutterStatus = ::skygate::alpaca::shutterStateToString(shutter);
    }
    return status;
}

void AlpacaClient::slewDomeToAzimuth(const AlpacaDevice& device,
                                     double azimuth) {
    put(device, "slewtoazimuth", {{"Azimuth", formatValue(azimuth)}});
}

void AlpacaClient::openDomeShutter(const AlpacaDevice& device) {
    put(device, "openshutter");
}

void AlpacaClient::closeDomeShutter(const AlpacaDevice& device) {
    put(device, "closeshutter");
}

// ==================== Focuser ====================

auto AlpacaClient::getFocuserStatus(const AlpacaDevice& device)
    -> FocuserStatus {
    FocuserStatus status;
    status.connected = isConnected(device);
    if (!status.connected) {
        return status;
    }

    readProperty(device, "ismoving", status.isMoving);
    readProperty(device, "position", status.position);
    readProperty(device, "maxstep", status.maxStep);
    readProperty(device, "tempcomp", status.tempComp);
    readProperty(device, "temperature", status.temperature);
    return status;
}

void AlpacaClient::moveFocuser(const AlpacaDevice& device, int position) {
    put(device, "move", {{"Position", formatValue(position)}});
}

void AlpacaClient::haltFocuser(const AlpacaDevice& device) {
    put(device, "halt");
}

// ==================== Filter wheel ====================

auto AlpacaClient::getFilterWheelStatus(const AlpacaDevice& device)
    -> FilterWheelStatus {
    FilterWheelStatus status;
    status.connected = isConnected(device);
    if (!status.connected) {
        return status;
    }

    readProperty(device, "position", status.position);
    readProperty(device, "names", status.names);
    return status;
}

void AlpacaClient::setFilterWheelPosition(const AlpacaDevice& device,
                                          int position) {
    put(device, "position", {{"Position", formatValue(position)}});
}

}  // namespace skygate::client::alpaca
