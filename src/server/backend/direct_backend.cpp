/*
 * direct_backend.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "direct_backend.hpp"

#include "exception/exception.hpp"

namespace skygate::server::backend {

void DirectBackend::unsupported(const std::string& operation) const {
    THROW_BACKEND_EXCEPTION(
        BackendErrorKind::NotImplemented,
        config_.port.empty() ? std::string("direct") : config_.port,
        "direct backend does not implement " + operation);
}

void DirectBackend::connect() { unsupported("connect"); }

auto DirectBackend::get(const std::string& method, const Params& /*params*/)
    -> json {
    unsupported("GET " + method);
}

auto DirectBackend::put(const std::string& method, const Params& /*params*/)
    -> json {
    unsupported("PUT " + method);
}

void DirectBackend::healthCheck() { unsupported("health check"); }

}  // namespace skygate::server::backend
