#include "tether/core/supervisor_registry.hpp"

#include <atomic>
#include <mutex>
#include <set>
#include <stdexcept>
#include "tether/utils/detached_task.hpp"
#include "tether/utils/logging.hpp"

namespace tether {
namespace core {

namespace {

bool sameBackoff(const BackoffConfig& a, const BackoffConfig& b) {
    return a.initialDelay == b.initialDelay && a.multiplier == b.multiplier && a.maxDelay == b.maxDelay;
}

bool needsRestart(const SupervisorConfig& running, const SupervisorConfig& wanted) {
    return running.endpoint != wanted.endpoint ||
           running.driver != wanted.driver ||
           !sameBackoff(running.backoff, wanted.backoff) ||
           running.errorAfterFailures != wanted.errorAfterFailures ||
           running.debounceWindow != wanted.debounceWindow ||
           running.discoveryTtl != wanted.discoveryTtl ||
           running.statusEventType != wanted.statusEventType ||
           running.resourceEventType != wanted.resourceEventType;
}

} // namespace

struct SupervisorRegistry::State {
    std::shared_ptr<StatusBroadcaster> broadcaster;
    std::shared_ptr<StatusStore> store;
    std::chrono::milliseconds shutdownTimeout{10000};

    mutable std::mutex mutex;
    std::map<std::string, std::shared_ptr<ConnectionSupervisor>> supervisors;
    bool closed{false};

    /**
     * @brief Unregister and stop a supervisor
     * @param expected Only remove if this instance is the registered one (nullptr: any)
     * @param discard Also drop retained and persisted status of the connection
     */
    bool remove(const std::string& id, const ConnectionSupervisor* expected, bool discard) {
        std::shared_ptr<ConnectionSupervisor> supervisor;
        {
            std::lock_guard<std::mutex> lock(mutex);
            auto it = supervisors.find(id);
            if (it == supervisors.end()) {
                return false;
            }
            if (expected && it->second.get() != expected) {
                return false;
            }
            supervisor = it->second;
            supervisors.erase(it);
        }

        TLOG_INFO("Removing connection " << id);
        if (!supervisor->stop()) {
            TLOG_WARN("Connection " << id << " was removed before its cleanup finished");
        }
        if (discard) {
            if (broadcaster) {
                broadcaster->forget(id);
            }
            if (store && store->erase(id)) {
                auto saved = store->save();
                if (saved.has_error()) {
                    TLOG_WARN("Status persistence failed: " << saved.error());
                }
            }
        }
        return true;
    }
};

SupervisorRegistry::SupervisorRegistry(std::shared_ptr<StatusBroadcaster> broadcaster,
                                       std::shared_ptr<StatusStore> store,
                                       std::chrono::milliseconds shutdownTimeout)
    : state_(std::make_shared<State>()) {
    if (!broadcaster) {
        throw std::invalid_argument("SupervisorRegistry requires a broadcaster");
    }
    state_->broadcaster = std::move(broadcaster);
    state_->store = std::move(store);
    state_->shutdownTimeout = shutdownTimeout;
}

SupervisorRegistry::~SupervisorRegistry() {
    bool closed = false;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        closed = state_->closed;
    }
    if (!closed) {
        shutdownAll(state_->shutdownTimeout);
    }
}

bool SupervisorRegistry::add(const SupervisorConfig& config, const DriverFactory& factory, SupervisorHooks hooks) {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->closed) {
            TLOG_WARN("Registry is shut down, not adding connection " << config.id);
            return false;
        }
        if (state_->supervisors.count(config.id) > 0) {
            TLOG_DEBUG("Connection " << config.id << " is already supervised");
            return false;
        }
    }

    auto driver = factory(config);
    if (!driver) {
        throw std::invalid_argument("No driver '" + config.driver + "' for connection " + config.id);
    }

    // Fatal errors unregister the supervisor from a separate thread, since the
    // supervisor reports them from its own worker.
    auto self = std::make_shared<std::weak_ptr<ConnectionSupervisor>>();
    std::weak_ptr<State> registry = state_;
    auto ownerFatal = hooks.onFatal;
    hooks.onFatal = [registry, self, ownerFatal](const std::string& id, const std::string& reason) {
        if (ownerFatal) {
            ownerFatal(id, reason);
        }
        utils::DetachedTask removal([registry, self, id]() {
            auto state = registry.lock();
            auto supervisor = self->lock();
            if (state && supervisor) {
                state->remove(id, supervisor.get(), true);
            }
        });
        (void)removal;
    };

    auto supervisor = std::make_shared<ConnectionSupervisor>(config, state_->broadcaster, std::move(hooks));
    *self = supervisor;
    if (state_->store) {
        auto persisted = state_->store->get(config.id);
        if (persisted && persisted->lastConnectedAt) {
            supervisor->restoreLastConnected(*persisted->lastConnectedAt);
        }
    }

    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->closed || state_->supervisors.count(config.id) > 0) {
            return false;
        }
        state_->supervisors.emplace(config.id, supervisor);
    }

    TLOG_INFO("Supervising connection " << config.id << " (" << driver->name() << ")");
    supervisor->start(driver);

    bool stillRegistered = false;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        auto it = state_->supervisors.find(config.id);
        stillRegistered = it != state_->supervisors.end() && it->second == supervisor;
    }
    if (!stillRegistered) {
        // Removed or shut down while starting
        supervisor->stop();
    }
    return true;
}

bool SupervisorRegistry::remove(const std::string& connectionId) {
    return state_->remove(connectionId, nullptr, true);
}

std::shared_ptr<ConnectionSupervisor> SupervisorRegistry::get(const std::string& connectionId) const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    auto it = state_->supervisors.find(connectionId);
    return it == state_->supervisors.end() ? nullptr : it->second;
}

bool SupervisorRegistry::contains(const std::string& connectionId) const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->supervisors.count(connectionId) > 0;
}

std::vector<std::string> SupervisorRegistry::ids() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    std::vector<std::string> result;
    result.reserve(state_->supervisors.size());
    for (const auto& item : state_->supervisors) {
        result.push_back(item.first);
    }
    return result;
}

std::size_t SupervisorRegistry::size() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->supervisors.size();
}

std::map<std::string, SupervisorStatus> SupervisorRegistry::statuses() const {
    std::map<std::string, std::shared_ptr<ConnectionSupervisor>> supervisors;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        supervisors = state_->supervisors;
    }
    std::map<std::string, SupervisorStatus> result;
    for (const auto& item : supervisors) {
        result.emplace(item.first, item.second->status());
    }
    return result;
}

DiscoveryResult<nlohmann::json> SupervisorRegistry::discover(const std::string& connectionId,
                                                             const std::string& resourceKey,
                                                             bool forceRefresh) {
    auto supervisor = get(connectionId);
    if (!supervisor) {
        DiscoveryResult<nlohmann::json> result;
        result.warning = "Unknown connection " + connectionId;
        return result;
    }
    return supervisor->discover(resourceKey, forceRefresh);
}

ReconcileReport SupervisorRegistry::reconcile(const std::vector<SupervisorConfig>& configs,
                                              const DriverFactory& factory,
                                              const SupervisorHooks& hooks) {
    ReconcileReport report;
    std::set<std::string> wanted;

    for (const auto& config : configs) {
        if (!config.enabled) {
            continue;
        }
        wanted.insert(config.id);
        auto existing = get(config.id);
        if (!existing) {
            if (add(config, factory, hooks)) {
                report.added.push_back(config.id);
            }
            continue;
        }
        if (needsRestart(existing->config(), config)) {
            TLOG_INFO("Configuration of connection " << config.id << " changed, restarting");
            state_->remove(config.id, existing.get(), false);
            if (add(config, factory, hooks)) {
                report.restarted.push_back(config.id);
            }
        }
    }

    for (const auto& id : ids()) {
        if (wanted.count(id) == 0 && remove(id)) {
            report.removed.push_back(id);
        }
    }
    return report;
}

ShutdownReport SupervisorRegistry::shutdownAll(std::chrono::milliseconds timeout) {
    const auto started = utils::DetachedTask::Clock::now();
    const auto deadline = started + timeout;

    std::map<std::string, std::shared_ptr<ConnectionSupervisor>> supervisors;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->closed = true;
        supervisors.swap(state_->supervisors);
    }
    TLOG_INFO("Shutting down " << supervisors.size() << " connection(s), timeout " << timeout.count() << "ms");

    // Leave the registry some slack to collect results before the deadline
    const auto grace = timeout - timeout / 10;

    struct Pending {
        std::string id;
        utils::DetachedTask task;
        std::shared_ptr<std::atomic<bool>> clean;
    };
    std::vector<Pending> pending;
    pending.reserve(supervisors.size());
    for (const auto& item : supervisors) {
        auto supervisor = item.second;
        auto clean = std::make_shared<std::atomic<bool>>(false);
        pending.push_back(Pending{
            item.first,
            utils::DetachedTask([supervisor, grace, clean]() { clean->store(supervisor->stop(grace)); }),
            clean});
    }

    ShutdownReport report;
    for (const auto& p : pending) {
        if (p.task.waitUntil(deadline) && p.clean->load()) {
            report.stopped.push_back(p.id);
        } else {
            TLOG_ERROR("Connection " << p.id << " did not shut down in time, abandoning it");
            report.abandoned.push_back(p.id);
        }
    }

    report.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        utils::DetachedTask::Clock::now() - started);
    TLOG_INFO("Shutdown finished in " << report.elapsed.count() << "ms: " << report.stopped.size()
              << " stopped, " << report.abandoned.size() << " abandoned");
    return report;
}

std::shared_ptr<StatusBroadcaster> SupervisorRegistry::broadcaster() const {
    return state_->broadcaster;
}

} // namespace core
} // namespace tether
