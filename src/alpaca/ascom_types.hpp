/*
 * ascom_types.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-28

Description: ASCOM Alpaca type definitions and constants shared by the
reflector server and the device pool engine

*************************************************/

#ifndef SKYGATE_ALPACA_ASCOM_TYPES_HPP
#define SKYGATE_ALPACA_ASCOM_TYPES_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "atom/type/json.hpp"

namespace skygate::alpaca {

using json = nlohmann::json;

/// Alpaca REST API version served under /api/v1
inline constexpr int kAlpacaApiVersion = 1;

/// Literal payload of an Alpaca discovery broadcast
inline constexpr std::string_view kDiscoveryMessage = "alpacadiscovery1";

inline constexpr int kDefaultDiscoveryPort = 32227;
inline constexpr int kDefaultApiPort = 11111;

/// Largest ServerTransactionID before the counter wraps back to 1
inline constexpr std::int32_t kMaxTransactionId = INT32_MAX;

/**
 * @brief ASCOM error codes
 */
struct ASCOMErrorCode {
    static constexpr int OK = 0;
    static constexpr int NotImplemented = 0x400;
    static constexpr int InvalidValue = 0x401;
    static constexpr int ValueNotSet = 0x402;
    static constexpr int NotConnected = 0x407;
    static constexpr int InvalidWhileParked = 0x408;
    static constexpr int InvalidWhileSlaved = 0x409;
    static constexpr int InvalidOperation = 0x40B;
    static constexpr int ActionNotImplemented = 0x40C;
    static constexpr int UnspecifiedError = 0x4FF;
};

/**
 * @brief ASCOM interface version for a device type string
 *
 * Unknown types report version 1.
 */
inline auto interfaceVersionFor(std::string_view deviceType) -> int {
    static const std::unordered_map<std::string_view, int> versions = {
        {"telescope", 3},     {"camera", 3},
        {"dome", 2},          {"focuser", 3},
        {"filterwheel", 2},   {"rotator", 2},
        {"switch", 2},        {"safetymonitor", 1},
        {"observingconditions", 1}, {"covercalibrator", 1}};

    auto it = versions.find(deviceType);
    return it != versions.end() ? it->second : 1;
}

/**
 * @brief Role a device plays inside a telescope pool
 */
enum class DeviceRole {
    Telescope,
    Camera,
    Dome,
    Focuser,
    FilterWheel,
    Rotator,
    Switch,
    Safety,
    ObservingConditions,
    CoverCalibrator
};

inline auto deviceRoleToString(DeviceRole role) -> std::string {
    switch (role) {
        case DeviceRole::Telescope: return "telescope";
        case DeviceRole::Camera: return "camera";
        case DeviceRole::Dome: return "dome";
        case DeviceRole::Focuser: return "focuser";
        case DeviceRole::FilterWheel: return "filterwheel";
        case DeviceRole::Rotator: return "rotator";
        case DeviceRole::Switch: return "switch";
        case DeviceRole::Safety: return "safety";
        case DeviceRole::ObservingConditions: return "observingconditions";
        case DeviceRole::CoverCalibrator: return "covercalibrator";
    }
    return "unknown";
}

inline auto stringToDeviceRole(std::string_view str)
    -> std::optional<DeviceRole> {
    static const std::unordered_map<std::string_view, DeviceRole> roleMap = {
        {"telescope", DeviceRole::Telescope},
        {"camera", DeviceRole::Camera},
        {"dome", DeviceRole::Dome},
        {"focuser", DeviceRole::Focuser},
        {"filterwheel", DeviceRole::FilterWheel},
        {"rotator", DeviceRole::Rotator},
        {"switch", DeviceRole::Switch},
        {"safety", DeviceRole::Safety},
        {"observingconditions", DeviceRole::ObservingConditions},
        {"covercalibrator", DeviceRole::CoverCalibrator}};

    auto it = roleMap.find(str);
    if (it == roleMap.end()) {
        return std::nullopt;
    }
    return it->second;
}

/**
 * @brief ASCOM camera states
 */
enum class CameraState {
    Idle = 0,
    Waiting = 1,
    Exposing = 2,
    Reading = 3,
    Download = 4,
    Error = 5
};

inline auto cameraStateToString(int state) -> std::string {
    switch (static_cast<CameraState>(state)) {
        case CameraState::Idle: return "Idle";
        case CameraState::Waiting: return "Waiting";
        case CameraState::Exposing: return "Exposing";
        case CameraState::Reading: return "Reading";
        case CameraState::Download: return "Download";
        case CameraState::Error: return "Error";
    }
    return "";
}

/**
 * @brief ASCOM shutter states
 */
enum class ShutterState {
    Open = 0,
    Closed = 1,
    Opening = 2,
    Closing = 3,
    Error = 4
};

inline auto shutterStateToString(int state) -> std::string {
    switch (static_cast<ShutterState>(state)) {
        case ShutterState::Open: return "Open";
        case ShutterState::Closed: return "Closed";
        case ShutterState::Opening: return "Opening";
        case ShutterState::Closing: return "Closing";
        case ShutterState::Error: return "Error";
    }
    return "";
}

}  // namespace skygate::alpaca

#endif  // SKYGATE_ALPACA_ASCOM_TYPES_HPP
