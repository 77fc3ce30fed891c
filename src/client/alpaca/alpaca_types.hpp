/*
 * alpaca_types.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-10

Description: Devices and status snapshots seen by the Alpaca client

*************************************************/

#ifndef SKYGATE_CLIENT_ALPACA_ALPACA_TYPES_HPP
#define SKYGATE_CLIENT_ALPACA_ALPACA_TYPES_HPP

#include <chrono>
#include <string>
#include <vector>

#include "atom/type/json.hpp"

namespace skygate::client::alpaca {

using json = nlohmann::json;

/**
 * @brief A device published by a remote Alpaca server
 */
struct AlpacaDevice {
    /// `{serverUrl}-{deviceType}-{deviceNumber}`
    std::string deviceId;
    std::string deviceType;
    int deviceNumber{0};
    std::string name;
    std::string description;
    std::string driverInfo;
    std::string driverVersion;
    std::string serverUrl;
    std::string uuid;
    bool connected{false};
    std::chrono::system_clock::time_point lastSeen{};

    static auto makeDeviceId(const std::string& serverUrl,
                             const std::string& deviceType, int deviceNumber)
        -> std::string {
        return serverUrl + "-" + deviceType + "-" +
               std::to_string(deviceNumber);
    }

    [[nodiscard]] auto toJson() const -> json {
        json j;
        j["device_id"] = deviceId;
        j["device_type"] = deviceType;
        j["device_number"] = deviceNumber;
        j["name"] = name;
        j["description"] = description;
        j["driver_info"] = driverInfo;
        j["driver_version"] = driverVersion;
        j["server_url"] = serverUrl;
        j["uuid"] = uuid;
        j["connected"] = connected;
        j["last_seen"] = std::chrono::duration_cast<std::chrono::milliseconds>(
                             lastSeen.time_since_epoch())
                             .count();
        return j;
    }
};

struct TelescopeStatus {
    bool connected{false};
    bool tracking{false};
    bool slewing{false};
    bool atPark{false};
    double rightAscension{0.0};  // hours
    double declination{0.0};     // degrees
    double altitude{0.0};
    double azimuth{0.0};

    [[nodiscard]] auto toJson() const -> json {
        return {{"connected", connected},
                {"tracking", tracking},
                {"slewing", slewing},
                {"at_park", atPark},
                {"right_ascension", rightAscension},
                {"declination", declination},
                {"altitude", altitude},
                {"azimuth", azimuth}};
    }
};

struct CameraStatus {
    bool connected{false};
    /// Idle, Waiting, Exposing, Reading, Download or Error
    std::string cameraState;
    double ccdTemperature{0.0};
    bool coolerOn{false};
    double coolerPower{0.0};
    bool imageReady{false};
    int percentCompleted{0};

    [[nodiscard]] auto toJson() const -> json {
        return {{"connected", connected},
                {"camera_state", cameraState},
                {"ccd_temperature", ccdTemperature},
                {"cooler_on", coolerOn},
                {"cooler_power", coolerPower},
                {"image_ready", imageReady},
                {"percent_completed", percentCompleted}};
    }
};

struct DomeStatus {
    bool connected{false};
    bool atHome{false};
    bool atPark{false};
    bool slewing{false};
    double azimuth{0.0};
    /// Open, Closed, Opening, Closing or Error
    std::string shutterStatus;

    [[nodiscard]] auto toJson() const -> json {
        return {{"connected", connected}, {"at_home", atHome},
                {"at_park", atPark},       {"slewing", slewing},
                {"azimuth", azimuth},      {"shutter_status", shutterStatus}};
    }
};

struct FocuserStatus {
    bool connected{false};
    bool isMoving{false};
    int position{0};
    int maxStep{0};
    bool tempComp{false};
    double temperature{0.0};

    [[nodiscard]] auto toJson() const -> json {
        return {{"connected", connected}, {"is_moving", isMoving},
                {"position", position},   {"max_step", maxStep},
                {"temp_comp", tempComp},  {"temperature", temperature}};
    }
};

struct FilterWheelStatus {
    bool connected{false};
    int position{0};
    std::vector<std::string> names;

    [[nodiscard]] auto toJson() const -> json {
        return {{"connected", connected},
                {"position", position},
                {"names", names}};
    }
};

}  // namespace skygate::client::alpaca

#endif  // SKYGATE_CLIENT_ALPACA_ALPACA_TYPES_HPP
