#ifndef TETHER_CORE_SUPERVISOR_REGISTRY_HPP
#define TETHER_CORE_SUPERVISOR_REGISTRY_HPP

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "tether/core/connection_supervisor.hpp"
#include "tether/core/status_broadcaster.hpp"
#include "tether/core/status_store.hpp"

namespace tether {
namespace core {

/**
 * @brief Builds the driver for a connection configuration
 */
using DriverFactory = std::function<std::shared_ptr<ConnectionDriver>(const SupervisorConfig&)>;

/**
 * @brief Which supervisors shutdownAll() stopped and which it had to leave behind
 */
struct ShutdownReport {
    std::vector<std::string> stopped;
    std::vector<std::string> abandoned;
    std::chrono::milliseconds elapsed{0};

    bool complete() const { return abandoned.empty(); }
};

struct ReconcileReport {
    std::vector<std::string> added;
    std::vector<std::string> removed;
    std::vector<std::string> restarted;
};

/**
 * @brief Owns the supervisors of all configured connections, one per connection id.
 *
 * Construct one at startup and pass it to whatever needs connection status.
 * Supervisors run independently; the registry lock only guards the map and is
 * never held while a supervisor starts or stops.
 */
class SupervisorRegistry {
public:
    /**
     * @param broadcaster Receives the status events of every supervisor
     * @param store Optional persistence; seeds lastConnectedAt of new supervisors
     * @param shutdownTimeout Used by the destructor
     */
    explicit SupervisorRegistry(std::shared_ptr<StatusBroadcaster> broadcaster,
                                std::shared_ptr<StatusStore> store = nullptr,
                                std::chrono::milliseconds shutdownTimeout = std::chrono::seconds(10));
    ~SupervisorRegistry();

    SupervisorRegistry(const SupervisorRegistry&) = delete;
    SupervisorRegistry& operator=(const SupervisorRegistry&) = delete;

    /**
     * @brief Create and start a supervisor for a connection
     * @return false without side effects if the id is already managed or the
     *         registry has shut down
     */
    bool add(const SupervisorConfig& config, const DriverFactory& factory,
             SupervisorHooks hooks = SupervisorHooks{});

    /**
     * @brief Stop and discard the supervisor of a connection
     * @return false if the id is unknown
     */
    bool remove(const std::string& connectionId);

    std::shared_ptr<ConnectionSupervisor> get(const std::string& connectionId) const;
    bool contains(const std::string& connectionId) const;
    std::vector<std::string> ids() const;
    std::size_t size() const;

    /** @brief Status of every managed connection, keyed by id */
    std::map<std::string, SupervisorStatus> statuses() const;

    /**
     * @brief Discovery through the named connection's cache
     */
    DiscoveryResult<nlohmann::json> discover(const std::string& connectionId,
                                             const std::string& resourceKey,
                                             bool forceRefresh = false);

    /**
     * @brief Bring the managed set in line with a list of configurations.
     *
     * Enabled configurations that are not running are added; running ones that
     * are disabled or absent are removed; running ones whose endpoint or retry
     * settings changed are restarted.
     */
    ReconcileReport reconcile(const std::vector<SupervisorConfig>& configs, const DriverFactory& factory,
                              const SupervisorHooks& hooks = SupervisorHooks{});

    /**
     * @brief Stop every supervisor concurrently and return within the timeout.
     *
     * Supervisors whose cleanup has not finished by the deadline are abandoned.
     * The registry accepts no new connections afterwards.
     */
    ShutdownReport shutdownAll(std::chrono::milliseconds timeout);

    std::shared_ptr<StatusBroadcaster> broadcaster() const;

private:
    struct State;
    std::shared_ptr<State> state_;
};

} // namespace core
} // namespace tether

#endif // TETHER_CORE_SUPERVISOR_REGISTRY_HPP
