/*
 * mock_device_backend.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef SKYGATE_TESTS_MOCKS_MOCK_DEVICE_BACKEND_HPP
#define SKYGATE_TESTS_MOCKS_MOCK_DEVICE_BACKEND_HPP

#include <gmock/gmock.h>

#include <string>

#include "server/backend/device_backend.hpp"

namespace skygate::test {

class MockDeviceBackend : public server::backend::DeviceBackend {
public:
    using json = server::backend::json;
    using Params = server::backend::Params;

    MOCK_METHOD(std::string_view, name, (), (const, override));
    MOCK_METHOD(void, connect, (), (override));
    MOCK_METHOD(void, disconnect, (), (override));
    MOCK_METHOD(bool, isConnected, (), (const, override));
    MOCK_METHOD(json, get, (const std::string&, const Params&), (override));
    MOCK_METHOD(json, put, (const std::string&, const Params&), (override));
    MOCK_METHOD(void, healthCheck, (), (override));
    MOCK_METHOD(server::backend::BackendMetrics, metrics, (),
                (const, override));
};

}  // namespace skygate::test

#endif  // SKYGATE_TESTS_MOCKS_MOCK_DEVICE_BACKEND_HPP
