#pragma once

#include <gmock/gmock.h>
#include "tether/core/connection_driver.hpp"

namespace tether {
namespace core {

class MockConnectionDriver : public ConnectionDriver {
public:
    MOCK_METHOD(std::string, name, (), (const, override));
    MOCK_METHOD(DriverCapabilities, capabilities, (), (const, override));
    MOCK_METHOD(std::shared_ptr<ConnectionHandle>, connect, (const EndpointConfig& endpoint), (override));
    MOCK_METHOD(std::unique_ptr<EventStream>, events, (const std::shared_ptr<ConnectionHandle>& handle), (override));
    MOCK_METHOD(void, disconnect, (const std::shared_ptr<ConnectionHandle>& handle), (override));
    MOCK_METHOD(ErrorKind, classify, (std::exception_ptr error), (const, override));
    MOCK_METHOD(nlohmann::json, discover, (const std::shared_ptr<ConnectionHandle>& handle, const std::string& resourceKey), (override));
};

class MockEventStream : public EventStream {
public:
    MOCK_METHOD(std::optional<DriverMessage>, next, (), (override));
};

} // namespace core
} // namespace tether
