#ifndef TETHER_CORE_STATUS_EVENT_HPP
#define TETHER_CORE_STATUS_EVENT_HPP

#include <chrono>
#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>
#include "tether/core/connection_state.hpp"

namespace tether {
namespace core {

/**
 * @brief Lifecycle transition of one connection
 */
struct StatusEvent {
    std::string type;
    std::string connectionId;
    ConnectionState state{ConnectionState::Disconnected};
    std::optional<std::string> error;
    std::chrono::system_clock::time_point timestamp;
};

/**
 * @brief Online/offline change of one sub-resource behind a connection
 */
struct ResourceStatusEvent {
    std::string type;
    std::string connectionId;
    std::string resourceId;
    bool isOnline{false};
    std::chrono::system_clock::time_point timestamp;
};

using BroadcastMessage = std::variant<StatusEvent, ResourceStatusEvent>;

/**
 * @brief {"type", "data": {"connection_id", "status", "error"?}, "timestamp"}
 */
nlohmann::json toJson(const StatusEvent& event);

/**
 * @brief {"type", "data": {"connection_id", "resource_id", "is_online"}, "timestamp"}
 */
nlohmann::json toJson(const ResourceStatusEvent& event);

nlohmann::json toJson(const BroadcastMessage& message);

/** @brief Compact single-line JSON of a broadcast message */
std::string toWire(const BroadcastMessage& message);

const std::string& connectionIdOf(const BroadcastMessage& message);

} // namespace core
} // namespace tether

#endif // TETHER_CORE_STATUS_EVENT_HPP
