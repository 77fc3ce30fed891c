/*
 * exception.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-2

Description: Exception types shared by the reflector server, the backend
dispatchers and the device pool engine

**************************************************/

#ifndef SKYGATE_EXCEPTION_EXCEPTION_HPP
#define SKYGATE_EXCEPTION_EXCEPTION_HPP

#include <string>
#include <string_view>

#include "atom/error/exception.hpp"

namespace skygate {

/**
 * @brief Base exception for configuration errors. Fatal at startup.
 */
class BadConfigException : public atom::error::Exception {
    using atom::error::Exception::Exception;
};

#define THROW_BAD_CONFIG_EXCEPTION(...)                               \
    throw skygate::BadConfigException(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                      ATOM_FUNC_NAME, __VA_ARGS__)

/**
 * @brief A configuration value is present but not acceptable
 */
class InvalidConfigException : public BadConfigException {
    using BadConfigException::BadConfigException;
};

#define THROW_INVALID_CONFIG_EXCEPTION(...)                               \
    throw skygate::InvalidConfigException(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                          ATOM_FUNC_NAME, __VA_ARGS__)

/**
 * @brief The configuration file could not be found or read
 */
class ConfigNotFoundException : public BadConfigException {
    using BadConfigException::BadConfigException;
};

#define THROW_CONFIG_NOT_FOUND_EXCEPTION(...)                              \
    throw skygate::ConfigNotFoundException(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                           ATOM_FUNC_NAME, __VA_ARGS__)

/**
 * @brief Lookup of a device, telescope pool or pool role failed
 */
class DeviceNotFoundException : public atom::error::Exception {
    using atom::error::Exception::Exception;
};

#define THROW_DEVICE_NOT_FOUND(...)                                        \
    throw skygate::DeviceNotFoundException(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                           ATOM_FUNC_NAME, __VA_ARGS__)

/**
 * @brief Generic device engine failure (duplicate registration, bad input)
 */
class DeviceEngineException : public atom::error::Exception {
    using atom::error::Exception::Exception;
};

#define THROW_DEVICE_ENGINE_EXCEPTION(...)                               \
    throw skygate::DeviceEngineException(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                         ATOM_FUNC_NAME, __VA_ARGS__)

/**
 * @brief HTTP transport failure: host unreachable, non-200 status or a
 * payload that is not an Alpaca envelope
 */
class TransportException : public atom::error::Exception {
public:
    TransportException(const char* file, int line, const char* func,
                       int httpStatus, const std::string& message)
        : atom::error::Exception(file, line, func, message),
          httpStatus_(httpStatus) {}

    /// HTTP status of the failed exchange, 0 when no response arrived
    [[nodiscard]] int httpStatus() const noexcept { return httpStatus_; }

private:
    int httpStatus_;
};

#define THROW_TRANSPORT_EXCEPTION(status, message)                         \
    throw skygate::TransportException(ATOM_FILE_NAME, ATOM_FILE_LINE,      \
                                      ATOM_FUNC_NAME, status, message)

/**
 * @brief A remote Alpaca device answered with a non-zero ErrorNumber
 */
class AlpacaApiException : public atom::error::Exception {
public:
    AlpacaApiException(const char* file, int line, const char* func,
                       int errorNumber, const std::string& message)
        : atom::error::Exception(file, line, func, message),
          errorNumber_(errorNumber),
          remoteMessage_(message) {}

    [[nodiscard]] int errorNumber() const noexcept { return errorNumber_; }
    [[nodiscard]] const std::string& remoteMessage() const noexcept {
        return remoteMessage_;
    }

private:
    int errorNumber_;
    std::string remoteMessage_;
};

#define THROW_ALPACA_API_EXCEPTION(number, message)                     \
    throw skygate::AlpacaApiException(ATOM_FILE_NAME, ATOM_FILE_LINE,   \
                                      ATOM_FUNC_NAME, number, message)

/**
 * @brief Failure categories of a device backend
 */
enum class BackendErrorKind {
    NotConnected,
    Timeout,
    Unavailable,
    Remote,
    NotImplemented,
    Protocol
};

[[nodiscard]] std::string_view backendErrorKindName(BackendErrorKind kind);

/**
 * @brief Failure raised by a device backend while forwarding an operation
 *
 * Carries enough information for a REST handler to pick the ASCOM error
 * code without inspecting the message text.
 */
class BackendException : public atom::error::Exception {
public:
    BackendException(const char* file, int line, const char* func,
                     BackendErrorKind kind, const std::string& backend,
                     const std::string& message, int remoteErrorNumber = 0)
        : atom::error::Exception(file, line, func, message),
          kind_(kind),
          backend_(backend),
          detail_(message),
          remoteErrorNumber_(remoteErrorNumber) {}

    [[nodiscard]] BackendErrorKind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::string& backend() const noexcept {
        return backend_;
    }
    [[nodiscard]] const std::string& detail() const noexcept {
        return detail_;
    }
    [[nodiscard]] int remoteErrorNumber() const noexcept {
        return remoteErrorNumber_;
    }

    /// ASCOM error number a REST handler should report for this failure
    [[nodiscard]] int ascomCode() const noexcept;

private:
    BackendErrorKind kind_;
    std::string backend_;
    std::string detail_;
    int remoteErrorNumber_;
};

#define THROW_BACKEND_EXCEPTION(...)                                   \
    throw skygate::BackendException(ATOM_FILE_NAME, ATOM_FILE_LINE,    \
                                    ATOM_FUNC_NAME, __VA_ARGS__)

}  // namespace skygate

#endif  // SKYGATE_EXCEPTION_EXCEPTION_HPP
