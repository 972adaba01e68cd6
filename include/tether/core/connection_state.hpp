#ifndef TETHER_CORE_CONNECTION_STATE_HPP
#define TETHER_CORE_CONNECTION_STATE_HPP

#include <optional>
#include <string>

namespace tether {
namespace core {

/**
 * @brief Lifecycle state of one supervised connection
 */
enum class ConnectionState {
    Disconnected,
    Connecting,
    Connected,
    Reconnecting,
    Error
};

/**
 * @brief Classification of a connect or stream failure
 */
enum class ErrorKind {
    AuthError,
    TlsError,
    Unreachable,
    Timeout,
    Unknown
};

/**
 * @brief How a failure is treated by the supervisor
 *
 * Transient and Credential failures are both retried; Credential failures are
 * reported at Error severity. Fatal failures end supervision.
 */
enum class ErrorSeverity {
    Transient,
    Credential,
    Fatal
};

/** @brief Wire name: "disconnected", "connecting", "connected", "reconnecting" or "error". */
const char* toString(ConnectionState state);
std::optional<ConnectionState> connectionStateFromString(const std::string& name);

/** @brief Wire name: "auth_error", "tls_error", "unreachable", "timeout" or "unknown". */
const char* toString(ErrorKind kind);
std::optional<ErrorKind> errorKindFromString(const std::string& name);

const char* toString(ErrorSeverity severity);
ErrorSeverity severityOf(ErrorKind kind);

/**
 * @brief Whether the supervisor state machine allows moving from one state to another.
 *
 * Every state may move to Disconnected. Re-entering the current state is not a transition.
 */
bool isValidTransition(ConnectionState from, ConnectionState to);

} // namespace core
} // namespace tether

#endif // TETHER_CORE_CONNECTION_STATE_HPP
