#ifndef TETHER_CORE_TCP_LINE_DRIVER_HPP
#define TETHER_CORE_TCP_LINE_DRIVER_HPP

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include "tether/core/connection_driver.hpp"

// Forward declare OpenSSL types
typedef struct ssl_ctx_st SSL_CTX;

namespace tether {
namespace core {

/**
 * @brief Options for TcpLineDriver
 */
struct TcpLineDriverOptions {
    std::size_t maxLineLength{1024 * 1024};
    std::chrono::milliseconds pollInterval{250};  ///< How often a blocked read rechecks for disconnect
};

/**
 * @brief Driver for endpoints that stream newline-delimited JSON over TCP, optionally TLS.
 *
 * Protocol:
 * - When EndpointConfig::username is set the driver sends
 *   {"op":"auth","username":...,"token":<secret>} and expects {"op":"auth","ok":true}
 *   before the connect timeout; anything else is an auth_error.
 * - Every following line is one JSON value. Objects carrying "resource_id" and a
 *   boolean "is_online" become ResourceStatus messages; everything else is Data.
 * - {"op":"resources","resources":[{"resource_id":...}, ...]} replaces the table
 *   of known resources returned by discover("resources").
 *
 * Failures map to ErrorKind: resolution failures and refused or unreachable
 * hosts are unreachable, a connect or handshake past its deadline is timeout,
 * TLS handshake and certificate failures are tls_error.
 */
class TcpLineDriver : public ConnectionDriver {
public:
    explicit TcpLineDriver(TcpLineDriverOptions options = TcpLineDriverOptions{});
    ~TcpLineDriver() override;

    TcpLineDriver(const TcpLineDriver&) = delete;
    TcpLineDriver& operator=(const TcpLineDriver&) = delete;

    std::string name() const override { return "tcp-line"; }
    DriverCapabilities capabilities() const override;

    std::shared_ptr<ConnectionHandle> connect(const EndpointConfig& endpoint) override;
    std::unique_ptr<EventStream> events(const std::shared_ptr<ConnectionHandle>& handle) override;
    void disconnect(const std::shared_ptr<ConnectionHandle>& handle) override;
    nlohmann::json discover(const std::shared_ptr<ConnectionHandle>& handle,
                            const std::string& resourceKey) override;

private:
    class Socket;
    class Stream;

    static std::shared_ptr<Socket> asSocket(const std::shared_ptr<ConnectionHandle>& handle);
    SSL_CTX* tlsContext(bool verify);

    TcpLineDriverOptions options_;
    std::mutex tlsMutex_;
    SSL_CTX* verifyingContext_{nullptr};
    SSL_CTX* permissiveContext_{nullptr};
};

} // namespace core
} // namespace tether

#endif // TETHER_CORE_TCP_LINE_DRIVER_HPP
