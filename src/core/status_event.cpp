#include "tether/core/status_event.hpp"

#include "tether/utils/time_format.hpp"

namespace tether {
namespace core {

nlohmann::json toJson(const StatusEvent& event) {
    nlohmann::json data = {
        {"connection_id", event.connectionId},
        {"status", toString(event.state)}
    };
    if (event.error) {
        data["error"] = *event.error;
    }
    return {
        {"type", event.type},
        {"data", data},
        {"timestamp", utils::formatIso8601(event.timestamp)}
    };
}

nlohmann::json toJson(const ResourceStatusEvent& event) {
    return {
        {"type", event.type},
        {"data", {
            {"connection_id", event.connectionId},
            {"resource_id", event.resourceId},
            {"is_online", event.isOnline}
        }},
        {"timestamp", utils::formatIso8601(event.timestamp)}
    };
}

nlohmann::json toJson(const BroadcastMessage& message) {
    return std::visit([](const auto& event) { return toJson(event); }, message);
}

std::string toWire(const BroadcastMessage& message) {
    return toJson(message).dump();
}

const std::string& connectionIdOf(const BroadcastMessage& message) {
    return std::visit([](const auto& event) -> const std::string& { return event.connectionId; }, message);
}

} // namespace core
} // namespace tether
