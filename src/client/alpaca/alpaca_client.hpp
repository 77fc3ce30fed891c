/*
 * alpaca_client.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-10

Description: ASCOM Alpaca REST API client

*************************************************/

#ifndef SKYGATE_CLIENT_ALPACA_ALPACA_CLIENT_HPP
#define SKYGATE_CLIENT_ALPACA_ALPACA_CLIENT_HPP

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "alpaca/alpaca_response.hpp"
#include "alpaca/transaction_counter.hpp"
#include "alpaca_types.hpp"
#include "http_transport.hpp"

namespace skygate::client::alpaca {

/**
 * @brief Alpaca API client for communicating with remote Alpaca devices
 *
 * Every request carries ClientID 1 and the next ClientTransactionID.
 * Transport failures and non-200 answers throw TransportException, a
 * non-zero ErrorNumber throws AlpacaApiException.
 */
class AlpacaClient {
public:
    static constexpr std::int32_t kClientId = 1;
    static constexpr std::chrono::milliseconds kDiscoveryTimeout{5000};
    static constexpr std::chrono::milliseconds kRequestTimeout{30000};

    explicit AlpacaClient(std::shared_ptr<HttpTransport> transport,
                          std::chrono::milliseconds timeout = kRequestTimeout);

    AlpacaClient(const AlpacaClient&) = delete;
    AlpacaClient& operator=(const AlpacaClient&) = delete;

    // ==================== Discovery ====================

    /**
     * @brief Broadcast a discovery message and list the devices of every
     * server that answers before the timeout
     *
     * Unparsable replies and servers whose device list cannot be fetched
     * are logged and skipped.
     */
    auto discoverDevices(int port,
                         std::chrono::milliseconds timeout = kDiscoveryTimeout,
                         const std::string& broadcastAddress =
                             "255.255.255.255") -> std::vector<AlpacaDevice>;

    /**
     * @brief GET `{serverUrl}/management/v1/configureddevices`
     */
    auto getConfiguredDevices(const std::string& serverUrl)
        -> std::vector<AlpacaDevice>;

    // ==================== Generic API Access ====================

    auto get(const AlpacaDevice& device, const std::string& method,
             const FormParams& params = {}) -> ::skygate::alpaca::AlpacaResponse;

    auto put(const AlpacaDevice& device, const std::string& method,
             const FormParams& params = {}) -> ::skygate::alpaca::AlpacaResponse;

    // ==================== Common Device Operations ====================

    void connect(const AlpacaDevice& device);
    void disconnect(const AlpacaDevice& device);
    auto isConnected(const AlpacaDevice& device) -> bool;
    auto getName(const AlpacaDevice& device) -> std::string;
    auto getDescription(const AlpacaDevice& device) -> std::string;

    // ==================== Telescope ====================

    auto getTelescopeStatus(const AlpacaDevice& device) -> TelescopeStatus;
    void slewToCoordinates(const AlpacaDevice& device, double ra, double dec);
    void park(const AlpacaDevice& device);
    void unpark(const AlpacaDevice& device);
    void setTracking(const AlpacaDevice& device, bool tracking);
    void abortSlew(const AlpacaDevice& device);

    // ==================== Camera ====================

    auto getCameraStatus(const AlpacaDevice& device) -> CameraStatus;
    void startExposure(const AlpacaDevice& device, double duration,
                       bool light);
    void stopExposure(const AlpacaDevice& device);
    void abortExposure(const AlpacaDevice& device);
    void setCoolerOn(const AlpacaDevice& device, bool on);

    // ==================== Dome ====================

    auto getDomeStatus(const AlpacaDevice& device) -> DomeStatus;
    void slewDomeToAzimuth(const AlpacaDevice& device, double azimuth);
    void openDomeShutter(const AlpacaDevice& device);
    void closeDomeShutter(const AlpacaDevice& device);

    // ==================== Focuser ====================

    auto getFocuserStatus(const AlpacaDevice& device) -> FocuserStatus;
    void moveFocuser(const AlpacaDevice& device, int position);
    void haltFocuser(const AlpacaDevice& device);

    // ==================== Filter wheel ====================

    auto getFilterWheelStatus(const AlpacaDevice& device)
        -> FilterWheelStatus;
    void setFilterWheelPosition(const AlpacaDevice& device, int position);

    [[nodiscard]] auto lastTransactionId() const -> std::int32_t {
        return transaction_.current();
    }

private:
    auto nextTransactionId() -> std::int32_t;

    static auto buildUrl(const AlpacaDevice& device,
                         const std::string& method) -> std::string;

    auto execute(HttpMethod method, const std::string& url,
                 const FormParams& params) -> ::skygate::alpaca::AlpacaResponse;

    /// Read one property, leaving `out` untouched on any failure
    template <typename T>
    void readProperty(const AlpacaDevice& device, const std::string& method,
                      T& out);

    std::shared_ptr<HttpTransport> transport_;
    std::chrono::milliseconds timeout_;
    ::skygate::alpaca::TransactionCounter transaction_;
};

}  // namespace skygate::client::alpaca

#endif  // SKYGATE_CLIENT_ALPACA_ALPACA_CLIENT_HPP
