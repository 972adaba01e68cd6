#ifndef TETHER_CORE_CONNECTION_DRIVER_HPP
#define TETHER_CORE_CONNECTION_DRIVER_HPP

#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>
#include "tether/core/connection_state.hpp"
#include "tether/utils/detached_task.hpp"

namespace tether {
namespace core {

/**
 * @brief Where and how to reach one external endpoint
 */
struct EndpointConfig {
    std::string host;
    std::uint16_t port{0};
    bool useTls{false};
    bool verifyTls{true};
    std::string username;
    std::string secret;                             ///< Never logged
    std::chrono::milliseconds connectTimeout{10000};
    nlohmann::json extra = nlohmann::json::object(); ///< Driver specific settings
};

bool operator==(const EndpointConfig& lhs, const EndpointConfig& rhs);
bool operator!=(const EndpointConfig& lhs, const EndpointConfig& rhs);

/**
 * @brief Raised by ConnectionDriver::connect() with the failure already classified
 */
class ConnectError : public std::runtime_error {
public:
    ConnectError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

/**
 * @brief Opaque live connection owned by a driver
 */
class ConnectionHandle {
public:
    virtual ~ConnectionHandle() = default;
};

enum class MessageKind {
    Data,           ///< Opaque payload for the message handler
    ResourceStatus  ///< Online/offline signal for one sub-resource
};

/**
 * @brief One message read from a live connection
 */
struct DriverMessage {
    MessageKind kind{MessageKind::Data};
    std::string resourceId;
    std::optional<bool> isOnline;
    nlohmann::json payload;

    static DriverMessage data(nlohmann::json payload);
    static DriverMessage resourceStatus(std::string resourceId, bool isOnline,
                                        nlohmann::json payload = nlohmann::json::object());
};

/**
 * @brief Sequence of messages from one connection
 *
 * next() blocks until a message arrives. It returns std::nullopt when the
 * connection ended cleanly and throws when it broke; either way the connection
 * is gone. A concurrent ConnectionDriver::disconnect() must make a blocked
 * next() return.
 */
class EventStream {
public:
    virtual ~EventStream() = default;
    virtual std::optional<DriverMessage> next() = 0;
};

/**
 * @brief Optional driver features, declared up front
 */
struct DriverCapabilities {
    bool supportsDiscovery{false};   ///< discover() is implemented
    bool blockingIo{false};          ///< Reads run on a dedicated thread
    bool emitsResourceStatus{false}; ///< Stream carries MessageKind::ResourceStatus
};

/**
 * @brief Protocol specific adapter used by a ConnectionSupervisor.
 *
 * A driver instance serves one supervisor. The supervisor may call connect()
 * and disconnect() from helper threads, and disconnect() concurrently with a
 * blocked EventStream::next().
 */
class ConnectionDriver {
public:
    virtual ~ConnectionDriver() = default;

    virtual std::string name() const = 0;
    virtual DriverCapabilities capabilities() const { return DriverCapabilities{}; }

    /**
     * @brief Open a connection
     * @throws ConnectError classified as auth_error, tls_error, unreachable, timeout or unknown.
     *         Other exceptions are classified with classify().
     */
    virtual std::shared_ptr<ConnectionHandle> connect(const EndpointConfig& endpoint) = 0;

    /**
     * @brief Start reading from a connection returned by connect()
     */
    virtual std::unique_ptr<EventStream> events(const std::shared_ptr<ConnectionHandle>& handle) = 0;

    /**
     * @brief Close a connection. Must be idempotent and must tolerate a dead handle.
     */
    virtual void disconnect(const std::shared_ptr<ConnectionHandle>& handle) = 0;

    /**
     * @brief Map an exception raised by this driver to an ErrorKind.
     *
     * The default understands ConnectError and std::system_error and reports
     * everything else as ErrorKind::Unknown.
     */
    virtual ErrorKind classify(std::exception_ptr error) const;

    /**
     * @brief Enumerate sub-resources of a live connection
     * @throws std::logic_error unless capabilities().supportsDiscovery is set
     */
    virtual nlohmann::json discover(const std::shared_ptr<ConnectionHandle>& handle,
                                    const std::string& resourceKey);
};

/**
 * @brief Result of a connect() raced against a deadline
 */
struct ConnectOutcome {
    enum class Status {
        Connected,
        Failed,
        TimedOut,
        Interrupted
    };

    Status status{Status::Failed};
    std::shared_ptr<ConnectionHandle> handle;
    ErrorKind errorKind{ErrorKind::Unknown};
    std::string message;
};

/**
 * @brief Runs driver.connect() on a detached helper so the caller can give up on it.
 *
 * A connection that completes after the caller gave up is disconnected by the
 * helper itself.
 */
class PendingConnect {
public:
    PendingConnect(std::shared_ptr<ConnectionDriver> driver, EndpointConfig endpoint);

    /**
     * @brief Wait for the connect to finish, the deadline to pass or interrupt()
     */
    ConnectOutcome wait(utils::DetachedTask::Clock::time_point deadline);

    void interrupt() { task_.interrupt(); }

    /** @brief true once driver.connect() has returned or thrown */
    bool finished() const { return task_.finished(); }

    /** @brief The helper running driver.connect(), for callers that track it after giving up */
    const utils::DetachedTask& task() const { return task_; }

private:
    struct Slot {
        std::mutex mutex;
        std::shared_ptr<ConnectionHandle> handle;
        bool abandoned{false};
    };

    static utils::DetachedTask launch(const std::shared_ptr<Slot>& slot,
                                      std::shared_ptr<ConnectionDriver> driver,
                                      EndpointConfig endpoint);

    std::shared_ptr<ConnectionDriver> driver_;
    std::chrono::milliseconds timeout_;
    std::shared_ptr<Slot> slot_;
    utils::DetachedTask task_;
};

/**
 * @brief Outcome of a one-shot connection test
 */
struct ConnectionTestResult {
    bool success{false};
    std::string message;
    std::optional<ErrorKind> errorKind;
    std::chrono::milliseconds elapsed{0};
};

/**
 * @brief Connect once, disconnect, and report how it went, without supervising anything
 */
ConnectionTestResult probeConnection(const std::shared_ptr<ConnectionDriver>& driver,
                                     const EndpointConfig& endpoint);

/**
 * @brief Human readable message for any exception
 */
std::string describeException(std::exception_ptr error);

} // namespace core
} // namespace tether

#endif // TETHER_CORE_CONNECTION_DRIVER_HPP
