#ifndef TETHER_CORE_CONNECTION_SUPERVISOR_HPP
#define TETHER_CORE_CONNECTION_SUPERVISOR_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "tether/core/backoff_policy.hpp"
#include "tether/core/connection_driver.hpp"
#include "tether/core/connection_state.hpp"
#include "tether/core/discovery_cache.hpp"
#include "tether/core/status_broadcaster.hpp"
#include "tether/core/supervisor_config.hpp"

namespace tether {
namespace core {

/**
 * @brief Retry bookkeeping of one connection
 *
 * attemptCount is the number of consecutive failures (failed connects and lost
 * connections) since the last successful connect. While retrying,
 * currentDelay == policy.nextDelay(attemptCount - 1).
 */
struct RetryState {
    std::uint32_t attemptCount{0};
    std::chrono::milliseconds currentDelay{0};
    std::optional<std::string> lastError;
    std::optional<std::chrono::system_clock::time_point> lastSuccessAt;
};

/**
 * @brief Full status of a supervised connection
 */
struct SupervisorStatus {
    ConnectionState state{ConnectionState::Disconnected};
    std::optional<std::string> lastError;
    std::optional<ErrorKind> lastErrorKind;
    std::optional<std::chrono::system_clock::time_point> lastConnectedAt;
    std::uint32_t reconnectAttemptCount{0};
    std::chrono::milliseconds currentDelay{0};
    std::uint64_t messagesReceived{0};
};

/**
 * @brief Read-only view for callers such as UIs
 */
struct ConnectionSnapshot {
    bool isConnected{false};
    std::optional<std::chrono::system_clock::time_point> lastConnectedAt;
    std::optional<std::string> lastError;
    std::uint32_t reconnectAttemptCount{0};
};

/**
 * @brief Optional callbacks into the owner of a supervisor
 */
struct SupervisorHooks {
    /// Every message read from the connection, on the supervisor's worker thread.
    std::function<void(const std::string& connectionId, const DriverMessage& message)> onMessage;

    /// Current endpoint, called before each reconnect attempt. std::nullopt means
    /// the configuration is gone and supervision ends.
    std::function<std::optional<EndpointConfig>(const std::string& connectionId)> refreshEndpoint;

    /// Supervision ended for a reason other than stop().
    std::function<void(const std::string& connectionId, const std::string& reason)> onFatal;
};

/**
 * @brief Keeps one connection to an external endpoint alive.
 *
 * start() connects once on the calling thread (bounded by the endpoint's
 * connect timeout) and hands the connection to a worker thread that reads
 * its events. When the connection is lost or a connect fails, the worker
 * waits according to the backoff policy and reconnects, indefinitely, until
 * stop(). Every state transition is published through the broadcaster, in
 * order, from one place.
 *
 * All public methods are thread safe. Destruction stops the supervisor.
 */
class ConnectionSupervisor {
public:
    /**
     * @throws std::invalid_argument if the config has no id
     */
    ConnectionSupervisor(SupervisorConfig config,
                         std::shared_ptr<StatusBroadcaster> broadcaster,
                         SupervisorHooks hooks = SupervisorHooks{});
    ~ConnectionSupervisor();

    ConnectionSupervisor(const ConnectionSupervisor&) = delete;
    ConnectionSupervisor& operator=(const ConnectionSupervisor&) = delete;

    /**
     * @brief Start supervising with the given driver and retry policy
     * @return true if the first connect succeeded. On false the supervisor is
     *         still running and retrying, unless start was refused or stopped.
     */
    bool start(std::shared_ptr<ConnectionDriver> driver, BackoffPolicy policy);

    /** @brief Start with the policy built from the configured backoff */
    bool start(std::shared_ptr<ConnectionDriver> driver);

    /**
     * @brief Stop supervising and close the connection.
     *
     * Cancels a pending backoff sleep or connect attempt, waits for the worker
     * for at most graceTimeout, closes the connection and publishes
     * Disconnected. Returns within graceTimeout even if the driver hangs.
     *
     * @return false if some cleanup was still running at the deadline and was abandoned
     */
    bool stop(std::chrono::milliseconds graceTimeout);

    /** @brief Stop with the configured grace period */
    bool stop();

    bool isRunning() const;

    const std::string& id() const;
    SupervisorConfig config() const;

    SupervisorStatus status() const;
    ConnectionSnapshot snapshot() const;
    RetryState retryState() const;

    /**
     * @brief Enumerate sub-resources of the connection through the discovery cache
     *
     * Served from cache within the configured ttl. While the connection is down
     * the last known result is returned with a warning instead of calling the driver.
     */
    DiscoveryResult<nlohmann::json> discover(const std::string& resourceKey, bool forceRefresh = false);

    /**
     * @brief One-shot connection test against the configured endpoint with the running
     *        driver, or the given one
     */
    ConnectionTestResult probeConnection(std::shared_ptr<ConnectionDriver> driver = nullptr) const;

    /**
     * @brief Seed lastConnectedAt from persisted state before start()
     */
    void restoreLastConnected(std::chrono::system_clock::time_point at);

private:
    class Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace core
} // namespace tether

#endif // TETHER_CORE_CONNECTION_SUPERVISOR_HPP
