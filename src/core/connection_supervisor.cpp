#include "tether/core/connection_supervisor.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <vector>
#include "tether/core/resource_debouncer.hpp"
#include "tether/utils/detached_task.hpp"
#include "tether/utils/logging.hpp"

namespace tether {
namespace core {

namespace {

enum class AttemptResult {
    Connected,
    Failed,
    Stopped,
    Fatal
};

struct Loss {
    ErrorKind kind{ErrorKind::Unknown};
    std::string reason;
};

/**
 * @brief State owned by one start() call and the worker it spawns
 */
struct Run {
    Run(std::uint64_t gen, std::shared_ptr<ConnectionDriver> drv, BackoffPolicy pol)
        : generation(gen), driver(std::move(drv)), policy(std::move(pol)) {}

    const std::uint64_t generation;
    const std::shared_ptr<ConnectionDriver> driver;
    BackoffPolicy policy;
    // Connect that timed out but has not returned yet; at most one per run
    std::shared_ptr<PendingConnect> straggler;
};

// Launch driver.disconnect() on a helper and wait for it until the deadline
bool closeWithin(const std::shared_ptr<ConnectionDriver>& driver,
                 const std::shared_ptr<ConnectionHandle>& handle,
                 const std::string& id,
                 utils::DetachedTask::Clock::time_point deadline) {
    if (utils::DetachedTask::Clock::now() >= deadline) {
        TLOG_ERROR("Connection " << id << ": no time left to disconnect, abandoning it");
        return false;
    }
    utils::DetachedTask closer([driver, handle]() { driver->disconnect(handle); });
    if (!closer.waitUntil(deadline)) {
        TLOG_ERROR("Connection " << id << ": disconnect did not return in time, abandoning it");
        return false;
    }
    if (auto error = closer.error()) {
        TLOG_WARN("Connection " << id << ": disconnect failed: " << describeException(error));
    }
    return true;
}

} // namespace

class ConnectionSupervisor::Impl {
public:
    Impl(SupervisorConfig cfg, std::shared_ptr<StatusBroadcaster> bus, SupervisorHooks callbacks)
        : id(cfg.id),
          config(std::move(cfg)),
          broadcaster(std::move(bus)),
          hooks(std::move(callbacks)),
          debouncer(config.debounceWindow),
          discovery([this](const std::string&) { return isLive(); }) {}

    const std::string id;

    // Only config.endpoint changes after construction, under stateMutex
    SupervisorConfig config;
    const std::shared_ptr<StatusBroadcaster> broadcaster;
    const SupervisorHooks hooks;

    std::mutex lifecycleMutex;                 // serializes start() and stop()
    std::optional<utils::DetachedTask> worker; // guarded by lifecycleMutex
    std::atomic<bool> running{false};
    std::atomic<bool> stopRequested{false};
    std::atomic<std::uint64_t> generation{0};

    std::recursive_mutex transitionMutex;      // one transition and its publish at a time

    mutable std::mutex stateMutex;
    ConnectionState state{ConnectionState::Disconnected};
    RetryState retry;
    std::optional<ErrorKind> lastErrorKind;
    std::optional<std::chrono::system_clock::time_point> lastConnectedAt;
    std::shared_ptr<ConnectionDriver> activeDriver;
    std::shared_ptr<ConnectionHandle> handle;

    std::atomic<std::uint64_t> messagesReceived{0};

    std::mutex wakeMutex;
    std::condition_variable wakeCv;
    std::shared_ptr<PendingConnect> pendingConnect; // guarded by wakeMutex

    std::mutex backgroundMutex;
    std::vector<utils::DetachedTask> background;    // disconnects and given-up connects

    ResourceDebouncer debouncer;
    DiscoveryCache<nlohmann::json> discovery;

    bool active(const Run& run) const {
        return !stopRequested.load() && generation.load() == run.generation;
    }

    bool isLive() const {
        std::lock_guard<std::mutex> lock(stateMutex);
        return state == ConnectionState::Connected && handle != nullptr;
    }

    bool transition(std::uint64_t gen, ConnectionState next, const std::optional<std::string>& error);
    bool awaitStraggler(Run& run);
    AttemptResult attemptConnect(Run& run);
    void recordFailure(Run& run, ErrorKind kind, const std::string& message);
    void fatal(Run& run, const std::string& reason);
    Loss listen(Run& run);
    void dispatch(const DriverMessage& message);
    void releaseHandle(Run& run);
    void closeInBackground(const std::shared_ptr<ConnectionDriver>& driver,
                           const std::shared_ptr<ConnectionHandle>& handle);
    void track(const utils::DetachedTask& task);
    bool joinBackground(utils::DetachedTask::Clock::time_point deadline);
    bool sleepFor(Run& run, std::chrono::milliseconds delay);
    void runWorker(const std::shared_ptr<Run>& run, bool connected);
    void wake();
};

bool ConnectionSupervisor::Impl::transition(std::uint64_t gen, ConnectionState next,
                                            const std::optional<std::string>& error) {
    std::lock_guard<std::recursive_mutex> guard(transitionMutex);
    if (generation.load() != gen) {
        return false;
    }
    if (stopRequested.load() && next != ConnectionState::Disconnected) {
        return false;
    }

    const auto now = std::chrono::system_clock::now();
    ConnectionState previous;
    {
        std::lock_guard<std::mutex> lock(stateMutex);
        previous = state;
        state = next;
        if (next == ConnectionState::Connected) {
            retry = RetryState{};
            retry.lastSuccessAt = now;
            lastErrorKind.reset();
            lastConnectedAt = now;
        }
    }

    if (previous != next && !isValidTransition(previous, next)) {
        TLOG_WARN("Connection " << id << ": unexpected transition " << toString(previous)
                  << " -> " << toString(next));
    }
    if (error) {
        TLOG_INFO("Connection " << id << ": " << toString(previous) << " -> " << toString(next)
                  << " (" << *error << ")");
    } else {
        TLOG_INFO("Connection " << id << ": " << toString(previous) << " -> " << toString(next));
    }

    if (broadcaster) {
        broadcaster->publish(StatusEvent{config.statusEventType, id, next, error, now});
    }
    return true;
}

/**
 * @brief Block until the run's timed-out connect returns before another one starts
 * @return false if supervision stopped meanwhile
 */
bool ConnectionSupervisor::Impl::awaitStraggler(Run& run) {
    auto straggler = std::move(run.straggler);
    run.straggler.reset();
    if (!straggler || straggler->finished()) {
        return active(run);
    }

    TLOG_INFO("Connection " << id << ": previous connect still running, waiting for it before retrying");
    {
        std::lock_guard<std::mutex> lock(wakeMutex);
        pendingConnect = straggler;
    }
    if (!active(run)) {
        straggler->interrupt();
    }
    const auto& task = straggler->task();
    while (active(run) && !task.interrupted() &&
           !task.waitUntil(utils::DetachedTask::Clock::now() + std::chrono::seconds(1))) {
    }
    {
        std::lock_guard<std::mutex> lock(wakeMutex);
        if (pendingConnect == straggler) {
            pendingConnect.reset();
        }
    }
    if (!task.finished()) {
        run.straggler = straggler;
    }
    return active(run);
}

AttemptResult ConnectionSupervisor::Impl::attemptConnect(Run& run) {
    if (!awaitStraggler(run)) {
        return AttemptResult::Stopped;
    }

    EndpointConfig endpoint;
    if (hooks.refreshEndpoint) {
        std::optional<EndpointConfig> fresh;
        try {
            fresh = hooks.refreshEndpoint(id);
        } catch (...) {
            recordFailure(run, ErrorKind::Unknown,
                          "endpoint refresh failed: " + describeException(std::current_exception()));
            return AttemptResult::Failed;
        }
        if (!fresh) {
            fatal(run, "configuration removed");
            return AttemptResult::Fatal;
        }
        std::lock_guard<std::mutex> lock(stateMutex);
        config.endpoint = *fresh;
        endpoint = *fresh;
    } else {
        std::lock_guard<std::mutex> lock(stateMutex);
        endpoint = config.endpoint;
    }

    if (!transition(run.generation, ConnectionState::Connecting, std::nullopt)) {
        return AttemptResult::Stopped;
    }

    auto pending = std::make_shared<PendingConnect>(run.driver, endpoint);
    {
        std::lock_guard<std::mutex> lock(wakeMutex);
        pendingConnect = pending;
    }
    if (!active(run)) {
        pending->interrupt();
    }

    auto outcome = pending->wait(utils::DetachedTask::Clock::now() + endpoint.connectTimeout);
    {
        std::lock_guard<std::mutex> lock(wakeMutex);
        if (pendingConnect == pending) {
            pendingConnect.reset();
        }
    }

    switch (outcome.status) {
        case ConnectOutcome::Status::Connected: {
            {
                std::lock_guard<std::mutex> lock(stateMutex);
                handle = outcome.handle;
            }
            run.policy.reset();
            if (!active(run) || !transition(run.generation, ConnectionState::Connected, std::nullopt)) {
                {
                    std::lock_guard<std::mutex> lock(stateMutex);
                    if (handle == outcome.handle) {
                        handle.reset();
                    }
                }
                closeInBackground(run.driver, outcome.handle);
                return AttemptResult::Stopped;
            }
            TLOG_INFO("Connection " << id << ": connected to " << endpoint.host << ":" << endpoint.port
                      << " via " << run.driver->name());
            return AttemptResult::Connected;
        }
        case ConnectOutcome::Status::Interrupted:
            if (!pending->finished()) {
                track(pending->task());
            }
            return AttemptResult::Stopped;
        case ConnectOutcome::Status::TimedOut:
            if (!pending->finished()) {
                run.straggler = pending;
                track(pending->task());
            }
            break;
        case ConnectOutcome::Status::Failed:
            break;
    }

    if (!active(run)) {
        return AttemptResult::Stopped;
    }
    recordFailure(run, outcome.errorKind, outcome.message);
    return AttemptResult::Failed;
}

void ConnectionSupervisor::Impl::recordFailure(Run& run, ErrorKind kind, const std::string& message) {
    const auto delay = run.policy.advance();
    std::uint32_t attempts = 0;
    {
        std::lock_guard<std::mutex> lock(stateMutex);
        retry.attemptCount = run.policy.attempts();
        retry.currentDelay = delay;
        retry.lastError = message;
        lastErrorKind = kind;
        attempts = retry.attemptCount;
    }

    const bool credential = severityOf(kind) == ErrorSeverity::Credential;
    const auto next = (credential || attempts > config.errorAfterFailures)
        ? ConnectionState::Error
        : ConnectionState::Reconnecting;

    TLOG_WARN("Connection " << id << ": failure #" << attempts << " (" << toString(kind) << ", "
              << toString(severityOf(kind)) << "): " << message << "; retrying in " << delay.count() << "ms");
    transition(run.generation, next, message);
}

void ConnectionSupervisor::Impl::fatal(Run& run, const std::string& reason) {
    TLOG_ERROR("Connection " << id << ": " << reason << ", supervision ends");
    {
        std::lock_guard<std::mutex> lock(stateMutex);
        retry.lastError = reason;
        lastErrorKind.reset();
    }
    stopRequested = true;
    running = false;
    wake();
    transition(run.generation, ConnectionState::Disconnected, reason);

    if (hooks.onFatal) {
        try {
            hooks.onFatal(id, reason);
        } catch (const std::exception& e) {
            TLOG_ERROR("Connection " << id << ": fatal handler failed: " << e.what());
        }
    }
}

Loss ConnectionSupervisor::Impl::listen(Run& run) {
    std::shared_ptr<ConnectionHandle> current;
    {
        std::lock_guard<std::mutex> lock(stateMutex);
        current = handle;
    }
    if (!current) {
        return Loss{ErrorKind::Unknown, "no live connection"};
    }

    Loss loss;
    try {
        auto stream = run.driver->events(current);
        if (!stream) {
            return Loss{ErrorKind::Unknown, "driver returned no event stream"};
        }
        while (active(run)) {
            auto message = stream->next();
            if (!message) {
                loss.reason = "event stream ended";
                break;
            }
            dispatch(*message);
        }
        if (loss.reason.empty()) {
            loss.reason = "stopped";
        }
    } catch (...) {
        auto error = std::current_exception();
        loss.kind = run.driver->classify(error);
        loss.reason = describeException(error);
    }

    if (active(run)) {
        TLOG_WARN("Connection " << id << ": connection lost (" << toString(loss.kind) << "): " << loss.reason);
    }
    return loss;
}

void ConnectionSupervisor::Impl::dispatch(const DriverMessage& message) {
    ++messagesReceived;

    if (message.kind == MessageKind::ResourceStatus && message.isOnline && !message.resourceId.empty()) {
        const bool isOnline = *message.isOnline;
        if (debouncer.admit(message.resourceId, isOnline) && broadcaster) {
            broadcaster->publishResourceStatus(ResourceStatusEvent{
                config.resourceEventType, id, message.resourceId, isOnline,
                std::chrono::system_clock::now()});
        }
    }

    if (hooks.onMessage) {
        try {
            hooks.onMessage(id, message);
        } catch (const std::exception& e) {
            TLOG_WARN("Connection " << id << ": message handler failed: " << e.what());
        }
    }
}

// The old connection closes in the background; stop() waits for it
void ConnectionSupervisor::Impl::releaseHandle(Run& run) {
    std::shared_ptr<ConnectionHandle> current;
    {
        std::lock_guard<std::mutex> lock(stateMutex);
        current = std::move(handle);
        handle.reset();
    }
    if (current) {
        closeInBackground(run.driver, current);
    }
}

void ConnectionSupervisor::Impl::closeInBackground(const std::shared_ptr<ConnectionDriver>& driver,
                                                   const std::shared_ptr<ConnectionHandle>& handle) {
    const std::string connectionId = id;
    utils::DetachedTask closer([driver, handle, connectionId]() {
        try {
            driver->disconnect(handle);
        } catch (...) {
            TLOG_WARN("Connection " << connectionId << ": disconnect failed: "
                      << describeException(std::current_exception()));
        }
    });
    track(closer);
}

void ConnectionSupervisor::Impl::track(const utils::DetachedTask& task) {
    std::lock_guard<std::mutex> lock(backgroundMutex);
    background.erase(std::remove_if(background.begin(), background.end(),
                                    [](const utils::DetachedTask& t) { return t.finished(); }),
                     background.end());
    background.push_back(task);
}

bool ConnectionSupervisor::Impl::joinBackground(utils::DetachedTask::Clock::time_point deadline) {
    std::vector<utils::DetachedTask> tasks;
    {
        std::lock_guard<std::mutex> lock(backgroundMutex);
        tasks.swap(background);
    }
    std::size_t abandoned = 0;
    for (const auto& task : tasks) {
        if (!task.joinUntil(deadline)) {
            ++abandoned;
        }
    }
    if (abandoned > 0) {
        TLOG_ERROR("Connection " << id << ": " << abandoned
                   << " driver call(s) still running after the grace period, abandoning them");
        return false;
    }
    return true;
}

bool ConnectionSupervisor::Impl::sleepFor(Run& run, std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(wakeMutex);
    wakeCv.wait_for(lock, delay, [this, &run] { return !active(run); });
    return active(run);
}

void ConnectionSupervisor::Impl::wake() {
    {
        std::lock_guard<std::mutex> lock(wakeMutex);
        if (pendingConnect) {
            pendingConnect->interrupt();
        }
    }
    wakeCv.notify_all();
}

void ConnectionSupervisor::Impl::runWorker(const std::shared_ptr<Run>& run, bool connected) {
    bool live = connected;
    while (active(*run)) {
        try {
            if (live) {
                auto loss = listen(*run);
                if (!active(*run)) {
                    break;
                }
                live = false;
                recordFailure(*run, loss.kind, "connection lost: " + loss.reason);
                releaseHandle(*run);
            }

            std::chrono::milliseconds delay;
            {
                std::lock_guard<std::mutex> lock(stateMutex);
                delay = retry.currentDelay;
            }
            if (!sleepFor(*run, delay)) {
                break;
            }

            auto result = attemptConnect(*run);
            if (result == AttemptResult::Stopped || result == AttemptResult::Fatal) {
                break;
            }
            live = result == AttemptResult::Connected;
        } catch (...) {
            const auto reason = describeException(std::current_exception());
            TLOG_ERROR("Connection " << id << ": supervisor worker failed: " << reason);
            live = false;
            releaseHandle(*run);
            recordFailure(*run, ErrorKind::Unknown, "supervisor failure: " + reason);
        }
    }
    TLOG_DEBUG("Connection " << id << ": worker finished");
}

ConnectionSupervisor::ConnectionSupervisor(SupervisorConfig config,
                                           std::shared_ptr<StatusBroadcaster> broadcaster,
                                           SupervisorHooks hooks) {
    if (config.id.empty()) {
        throw std::invalid_argument("Connection id must not be empty");
    }
    impl_ = std::make_shared<Impl>(std::move(config), std::move(broadcaster), std::move(hooks));
}

ConnectionSupervisor::~ConnectionSupervisor() {
    if (impl_) {
        stop();
    }
}

bool ConnectionSupervisor::start(std::shared_ptr<ConnectionDriver> driver) {
    BackoffPolicy policy(impl_->config.backoff);
    return start(std::move(driver), std::move(policy));
}

bool ConnectionSupervisor::start(std::shared_ptr<ConnectionDriver> driver, BackoffPolicy policy) {
    if (!driver) {
        throw std::invalid_argument("Connection " + impl_->id + ": driver must not be null");
    }

    std::unique_lock<std::mutex> lifecycle(impl_->lifecycleMutex);
    if (impl_->running.load()) {
        TLOG_WARN("Connection " << impl_->id << ": already running");
        return false;
    }
    impl_->stopRequested = false;
    impl_->running = true;
    const auto gen = ++impl_->generation;
    policy.reset();
    auto run = std::make_shared<Run>(gen, driver, std::move(policy));
    {
        std::lock_guard<std::mutex> lock(impl_->stateMutex);
        impl_->activeDriver = driver;
        impl_->retry = RetryState{};
        impl_->lastErrorKind.reset();
    }
    impl_->debouncer.reset();
    TLOG_INFO("Connection " << impl_->id << ": starting with driver " << driver->name());
    lifecycle.unlock();

    // First attempt on the caller's thread, bounded by the connect timeout
    auto self = impl_;
    AttemptResult first = AttemptResult::Failed;
    try {
        first = self->attemptConnect(*run);
    } catch (...) {
        const auto reason = describeException(std::current_exception());
        TLOG_ERROR("Connection " << self->id << ": first connect attempt failed: " << reason);
        self->releaseHandle(*run);
        self->recordFailure(*run, ErrorKind::Unknown, "supervisor failure: " + reason);
    }

    lifecycle.lock();
    if (first == AttemptResult::Stopped || first == AttemptResult::Fatal || !self->active(*run)) {
        return false;
    }
    const bool connected = first == AttemptResult::Connected;
    self->worker.emplace([self, run, connected]() { self->runWorker(run, connected); });
    return connected;
}

bool ConnectionSupervisor::stop() {
    std::chrono::milliseconds grace;
    {
        std::lock_guard<std::mutex> lock(impl_->stateMutex);
        grace = impl_->config.stopGrace;
    }
    return stop(grace);
}

bool ConnectionSupervisor::stop(std::chrono::milliseconds graceTimeout) {
    const auto deadline = utils::DetachedTask::Clock::now() + graceTimeout;
    auto& impl = *impl_;

    std::lock_guard<std::mutex> lifecycle(impl.lifecycleMutex);
    if (!impl.running.exchange(false)) {
        return true;
    }
    const auto gen = impl.generation.load();
    impl.stopRequested = true;
    impl.wake();
    TLOG_INFO("Connection " << impl.id << ": stopping");

    std::shared_ptr<ConnectionDriver> driver;
    std::shared_ptr<ConnectionHandle> current;
    {
        std::lock_guard<std::mutex> lock(impl.stateMutex);
        driver = impl.activeDriver;
        current = impl.handle;
    }

    bool clean = true;
    // Unblocks a listener waiting for the next event
    if (driver && current) {
        clean = closeWithin(driver, current, impl.id, deadline) && clean;
    }

    if (impl.worker) {
        if (impl.worker->runsOnCurrentThread()) {
            TLOG_DEBUG("Connection " << impl.id << ": stop called from the worker itself");
        } else if (!impl.worker->waitUntil(deadline)) {
            TLOG_ERROR("Connection " << impl.id << ": worker did not finish within "
                       << graceTimeout.count() << "ms, abandoning it");
            clean = false;
        } else if (auto error = impl.worker->error()) {
            TLOG_ERROR("Connection " << impl.id << ": worker ended with " << describeException(error));
        }
        impl.worker.reset();
    }
    // Connects that timed out and disconnects of lost connections
    clean = impl.joinBackground(deadline) && clean;

    std::shared_ptr<ConnectionHandle> last;
    {
        std::lock_guard<std::mutex> lock(impl.stateMutex);
        last = std::move(impl.handle);
        impl.handle.reset();
    }
    if (!last) {
        last = current;
    }
    if (driver && last) {
        clean = closeWithin(driver, last, impl.id, deadline) && clean;
    }

    impl.transition(gen, ConnectionState::Disconnected, std::nullopt);
    return clean;
}

bool ConnectionSupervisor::isRunning() const {
    return impl_->running.load();
}

const std::string& ConnectionSupervisor::id() const {
    return impl_->id;
}

SupervisorConfig ConnectionSupervisor::config() const {
    std::lock_guard<std::mutex> lock(impl_->stateMutex);
    return impl_->config;
}

SupervisorStatus ConnectionSupervisor::status() const {
    SupervisorStatus status;
    std::lock_guard<std::mutex> lock(impl_->stateMutex);
    status.state = impl_->state;
    status.lastError = impl_->retry.lastError;
    status.lastErrorKind = impl_->lastErrorKind;
    status.lastConnectedAt = impl_->lastConnectedAt;
    status.reconnectAttemptCount = impl_->retry.attemptCount;
    status.currentDelay = impl_->retry.currentDelay;
    status.messagesReceived = impl_->messagesReceived.load();
    return status;
}

ConnectionSnapshot ConnectionSupervisor::snapshot() const {
    ConnectionSnapshot snapshot;
    std::lock_guard<std::mutex> lock(impl_->stateMutex);
    snapshot.isConnected = impl_->state == ConnectionState::Connected;
    snapshot.lastConnectedAt = impl_->lastConnectedAt;
    snapshot.lastError = impl_->retry.lastError;
    snapshot.reconnectAttemptCount = impl_->retry.attemptCount;
    return snapshot;
}

RetryState ConnectionSupervisor::retryState() const {
    std::lock_guard<std::mutex> lock(impl_->stateMutex);
    return impl_->retry;
}

DiscoveryResult<nlohmann::json> ConnectionSupervisor::discover(const std::string& resourceKey, bool forceRefresh) {
    std::shared_ptr<ConnectionDriver> driver;
    {
        std::lock_guard<std::mutex> lock(impl_->stateMutex);
        driver = impl_->activeDriver;
    }
    if (!driver || !driver->capabilities().supportsDiscovery) {
        DiscoveryResult<nlohmann::json> result;
        result.warning = "Connection " + impl_->id + " cannot discover '" + resourceKey + "'";
        return result;
    }

    auto self = impl_;
    auto refresh = [self, driver, resourceKey]() {
        std::shared_ptr<ConnectionHandle> current;
        {
            std::lock_guard<std::mutex> lock(self->stateMutex);
            current = self->handle;
        }
        if (!current) {
            throw std::runtime_error("not connected");
        }
        return driver->discover(current, resourceKey);
    };
    return impl_->discovery.getOrRefresh(impl_->id, resourceKey, refresh,
                                         impl_->config.discoveryTtl, forceRefresh);
}

ConnectionTestResult ConnectionSupervisor::probeConnection(std::shared_ptr<ConnectionDriver> driver) const {
    EndpointConfig endpoint;
    {
        std::lock_guard<std::mutex> lock(impl_->stateMutex);
        endpoint = impl_->config.endpoint;
        if (!driver) {
            driver = impl_->activeDriver;
        }
    }
    if (!driver) {
        ConnectionTestResult result;
        result.message = "Connection " + impl_->id + " has no driver";
        return result;
    }
    return core::probeConnection(driver, endpoint);
}

void ConnectionSupervisor::restoreLastConnected(std::chrono::system_clock::time_point at) {
    std::lock_guard<std::mutex> lock(impl_->stateMutex);
    if (!impl_->lastConnectedAt || *impl_->lastConnectedAt < at) {
        impl_->lastConnectedAt = at;
    }
}

} // namespace core
} // namespace tether
