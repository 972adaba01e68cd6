#include "tether/core/connection_state.hpp"

namespace tether {
namespace core {

const char* toString(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Connecting: return "connecting";
        case ConnectionState::Connected: return "connected";
        case ConnectionState::Reconnecting: return "reconnecting";
        case ConnectionState::Error: return "error";
    }
    return "unknown";
}

std::optional<ConnectionState> connectionStateFromString(const std::string& name) {
    if (name == "disconnected") return ConnectionState::Disconnected;
    if (name == "connecting") return ConnectionState::Connecting;
    if (name == "connected") return ConnectionState::Connected;
    if (name == "reconnecting") return ConnectionState::Reconnecting;
    if (name == "error") return ConnectionState::Error;
    return std::nullopt;
}

const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::AuthError: return "auth_error";
        case ErrorKind::TlsError: return "tls_error";
        case ErrorKind::Unreachable: return "unreachable";
        case ErrorKind::Timeout: return "timeout";
        case ErrorKind::Unknown: return "unknown";
    }
    return "unknown";
}

std::optional<ErrorKind> errorKindFromString(const std::string& name) {
    if (name == "auth_error") return ErrorKind::AuthError;
    if (name == "tls_error") return ErrorKind::TlsError;
    if (name == "unreachable") return ErrorKind::Unreachable;
    if (name == "timeout") return ErrorKind::Timeout;
    if (name == "unknown") return ErrorKind::Unknown;
    return std::nullopt;
}

const char* toString(ErrorSeverity severity) {
    switch (severity) {
        case ErrorSeverity::Transient: return "transient";
        case ErrorSeverity::Credential: return "credential";
        case ErrorSeverity::Fatal: return "fatal";
    }
    return "unknown";
}

ErrorSeverity severityOf(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::AuthError:
        case ErrorKind::TlsError:
            return ErrorSeverity::Credential;
        case ErrorKind::Unreachable:
        case ErrorKind::Timeout:
        case ErrorKind::Unknown:
            return ErrorSeverity::Transient;
    }
    return ErrorSeverity::Transient;
}

bool isValidTransition(ConnectionState from, ConnectionState to) {
    if (from == to) {
        return false;
    }
    if (to == ConnectionState::Disconnected) {
        return true;
    }
    switch (from) {
        case ConnectionState::Disconnected:
            return to == ConnectionState::Connecting;
        case ConnectionState::Connecting:
            return to == ConnectionState::Connected ||
                   to == ConnectionState::Reconnecting ||
                   to == ConnectionState::Error;
        case ConnectionState::Connected:
            return to == ConnectionState::Reconnecting ||
                   to == ConnectionState::Error;
        case ConnectionState::Reconnecting:
        case ConnectionState::Error:
            return to == ConnectionState::Connecting;
    }
    return false;
}

} // namespace core
} // namespace tether
