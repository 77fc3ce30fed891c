/*
 * exception.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "exception.hpp"

#include "alpaca/ascom_types.hpp"

namespace skygate {

std::string_view backendErrorKindName(BackendErrorKind kind) {
    switch (kind) {
        case BackendErrorKind::NotConnected: return "not_connected";
        case BackendErrorKind::Timeout: return "timeout";
        case BackendErrorKind::Unavailable: return "unavailable";
        case BackendErrorKind::Remote: return "remote";
        case BackendErrorKind::NotImplemented: return "not_implemented";
        case BackendErrorKind::Protocol: return "protocol";
    }
    return "unknown";
}

int BackendException::ascomCode() const noexcept {
    using alpaca::ASCOMErrorCode;
    switch (kind_) {
        case BackendErrorKind::NotConnected:
        case BackendErrorKind::Unavailable:
            return ASCOMErrorCode::NotConnected;
        case BackendErrorKind::NotImplemented:
            return ASCOMErrorCode::NotImplemented;
        case BackendErrorKind::Remote:
            return remoteErrorNumber_ != 0 ? remoteErrorNumber_
                                           : ASCOMErrorCode::UnspecifiedError;
        case BackendErrorKind::Timeout:
        case BackendErrorKind::Protocol:
            break;
    }
    return ASCOMErrorCode::UnspecifiedError;
}

}  // namespace skygate
