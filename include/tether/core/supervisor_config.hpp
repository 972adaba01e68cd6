#ifndef TETHER_CORE_SUPERVISOR_CONFIG_HPP
#define TETHER_CORE_SUPERVISOR_CONFIG_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "tether/core/backoff_policy.hpp"
#include "tether/core/connection_driver.hpp"
#include "tether/utils/result.hpp"

namespace tether {
namespace core {

/**
 * @brief Configuration of one supervised connection
 */
struct SupervisorConfig {
    std::string id;                        ///< Connection id, unique within a registry
    bool enabled{true};
    std::string driver{"tcp"};             ///< Driver name, resolved by the DriverFactory
    EndpointConfig endpoint;
    BackoffConfig backoff;                 ///< Defaults to 1s doubling to 30s
    std::uint32_t errorAfterFailures{3};   ///< Consecutive failures reported as Reconnecting
    std::chrono::milliseconds debounceWindow{5000};
    std::chrono::seconds discoveryTtl{60};
    std::string statusEventType{"CONNECTION_STATUS"};
    std::string resourceEventType{"RESOURCE_STATUS_CHANGED"};
    std::chrono::milliseconds stopGrace{5000};
};

/**
 * @brief Configuration of a SupervisorRegistry and the connections it manages
 */
struct RegistryConfig {
    std::vector<SupervisorConfig> connections;
    std::chrono::milliseconds shutdownTimeout{10000};
    std::string statusStorePath;           ///< Empty disables status persistence
    std::string logLevel{"info"};
};

/**
 * @brief Parse an endpoint object. Missing keys keep their defaults.
 * @throws nlohmann::json::exception on type mismatches
 */
EndpointConfig endpointFromJson(const nlohmann::json& j);

/**
 * @brief Serialize an endpoint. The secret is only written when includeSecret is set.
 */
nlohmann::json endpointToJson(const EndpointConfig& endpoint, bool includeSecret = false);

/**
 * @brief Parse one connection entry
 * @throws nlohmann::json::exception on type mismatches
 * @throws std::invalid_argument if the id is missing or the backoff is invalid
 */
SupervisorConfig supervisorConfigFromJson(const nlohmann::json& j);

Result<RegistryConfig> parseRegistryConfig(const nlohmann::json& j);
Result<RegistryConfig> loadRegistryConfig(const std::string& path);

} // namespace core
} // namespace tether

#endif // TETHER_CORE_SUPERVISOR_CONFIG_HPP
