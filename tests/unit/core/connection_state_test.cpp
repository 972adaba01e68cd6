#include <gtest/gtest.h>
#include "tether/core/connection_state.hpp"

using namespace tether::core;

TEST(ConnectionStateTest, WireNames) {
    EXPECT_STREQ(toString(ConnectionState::Disconnected), "disconnected");
    EXPECT_STREQ(toString(ConnectionState::Connecting), "connecting");
    EXPECT_STREQ(toString(ConnectionState::Connected), "connected");
    EXPECT_STREQ(toString(ConnectionState::Reconnecting), "reconnecting");
    EXPECT_STREQ(toString(ConnectionState::Error), "error");

    EXPECT_EQ(connectionStateFromString("reconnecting"), ConnectionState::Reconnecting);
    EXPECT_FALSE(connectionStateFromString("Connected").has_value());
    EXPECT_FALSE(connectionStateFromString("").has_value());
}

TEST(ConnectionStateTest, ErrorKindNames) {
    EXPECT_STREQ(toString(ErrorKind::AuthError), "auth_error");
    EXPECT_STREQ(toString(ErrorKind::TlsError), "tls_error");
    EXPECT_EQ(errorKindFromString("unreachable"), ErrorKind::Unreachable);
    EXPECT_EQ(errorKindFromString("timeout"), ErrorKind::Timeout);
    EXPECT_FALSE(errorKindFromString("refused").has_value());
}

TEST(ConnectionStateTest, CredentialErrorsAreNotTransient) {
    EXPECT_EQ(severityOf(ErrorKind::AuthError), ErrorSeverity::Credential);
    EXPECT_EQ(severityOf(ErrorKind::TlsError), ErrorSeverity::Credential);
    EXPECT_EQ(severityOf(ErrorKind::Unreachable), ErrorSeverity::Transient);
    EXPECT_EQ(severityOf(ErrorKind::Timeout), ErrorSeverity::Transient);
    EXPECT_EQ(severityOf(ErrorKind::Unknown), ErrorSeverity::Transient);
    EXPECT_STREQ(toString(ErrorSeverity::Credential), "credential");
}

TEST(ConnectionStateTest, Transitions) {
    EXPECT_TRUE(isValidTransition(ConnectionState::Disconnected, ConnectionState::Connecting));
    EXPECT_TRUE(isValidTransition(ConnectionState::Connecting, ConnectionState::Connected));
    EXPECT_TRUE(isValidTransition(ConnectionState::Connecting, ConnectionState::Reconnecting));
    EXPECT_TRUE(isValidTransition(ConnectionState::Connecting, ConnectionState::Error));
    EXPECT_TRUE(isValidTransition(ConnectionState::Connected, ConnectionState::Reconnecting));
    EXPECT_TRUE(isValidTransition(ConnectionState::Reconnecting, ConnectionState::Connecting));
    EXPECT_TRUE(isValidTransition(ConnectionState::Error, ConnectionState::Connecting));

    // stop() is allowed from anywhere
    EXPECT_TRUE(isValidTransition(ConnectionState::Connected, ConnectionState::Disconnected));
    EXPECT_TRUE(isValidTransition(ConnectionState::Error, ConnectionState::Disconnected));

    EXPECT_FALSE(isValidTransition(ConnectionState::Disconnected, ConnectionState::Connected));
    EXPECT_FALSE(isValidTransition(ConnectionState::Reconnecting, ConnectionState::Connected));
    EXPECT_FALSE(isValidTransition(ConnectionState::Error, ConnectionState::Connected));
    EXPECT_FALSE(isValidTransition(ConnectionState::Connected, ConnectionState::Connected));
}
