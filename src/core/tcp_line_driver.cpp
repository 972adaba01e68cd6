#include "tether/core/tcp_line_driver.hpp"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <optional>
#include <sstream>
#include <system_error>

#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509v3.h>

#include "tether/utils/logging.hpp"
#include "tether/utils/time_format.hpp"

namespace tether {
namespace core {

namespace {

using Clock = std::chrono::steady_clock;

std::string openSslErrors() {
    std::stringstream ss;
    unsigned long err;
    while ((err = ERR_get_error()) != 0) {
        char buf[256];
        ERR_error_string_n(err, buf, sizeof(buf));
        if (ss.tellp() > 0) {
            ss << "; ";
        }
        ss << buf;
    }
    return ss.str();
}

ErrorKind kindForErrno(int error) {
    switch (error) {
        case ETIMEDOUT:
            return ErrorKind::Timeout;
        case ECONNREFUSED:
        case EHOSTUNREACH:
        case ENETUNREACH:
        case EHOSTDOWN:
        case ENETDOWN:
            return ErrorKind::Unreachable;
        default:
            return ErrorKind::Unknown;
    }
}

int remainingMs(Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

bool setNonBlocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    return flags != -1 && fcntl(fd, F_SETFL, flags | O_NONBLOCK) != -1;
}

// Non-blocking connect to one address, bounded by the deadline. Returns the fd or -1 with error set.
int connectOne(const addrinfo* address, Clock::time_point deadline, int& error, bool& timedOut) {
    int fd = ::socket(address->ai_family, address->ai_socktype, address->ai_protocol);
    if (fd == -1) {
        error = errno;
        return -1;
    }
    if (!setNonBlocking(fd)) {
        error = errno;
        ::close(fd);
        return -1;
    }
    int one = 1;
    setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
    setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &one, sizeof(one));

    if (::connect(fd, address->ai_addr, address->ai_addrlen) == 0) {
        return fd;
    }
    if (errno != EINPROGRESS) {
        error = errno;
        ::close(fd);
        return -1;
    }

    while (true) {
        pollfd pfd{fd, POLLOUT, 0};
        int ready = ::poll(&pfd, 1, remainingMs(deadline));
        if (ready < 0 && errno == EINTR) {
            continue;
        }
        if (ready < 0) {
            error = errno;
            ::close(fd);
            return -1;
        }
        if (ready == 0) {
            timedOut = true;
            error = ETIMEDOUT;
            ::close(fd);
            return -1;
        }
        break;
    }

    int soError = 0;
    socklen_t length = sizeof(soError);
    if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &soError, &length) != 0) {
        soError = errno;
    }
    if (soError != 0) {
        error = soError;
        ::close(fd);
        return -1;
    }
    return fd;
}

} // namespace

/**
 * @brief One live TCP (or TLS) connection
 */
class TcpLineDriver::Socket : public ConnectionHandle {
public:
    Socket(int fd, SSL* ssl, std::string peer, std::size_t maxLineLength, std::chrono::milliseconds pollInterval)
        : fd_(fd), ssl_(ssl), peer_(std::move(peer)),
          maxLineLength_(maxLineLength), pollInterval_(pollInterval) {}

    ~Socket() override {
        if (ssl_) {
            SSL_free(ssl_);
        }
        if (fd_ != -1) {
            ::close(fd_);
        }
    }

    const std::string& peer() const { return peer_; }

    /**
     * @brief Wake a blocked reader and refuse further reads. Safe from any thread.
     */
    void shutdown() {
        if (closed_.exchange(true)) {
            return;
        }
        ::shutdown(fd_, SHUT_RDWR);
    }

    bool closed() const { return closed_.load(); }

    /**
     * @brief Read one line without its terminator
     * @param deadline Throw ConnectError(Timeout) when passed; none means wait forever
     * @return std::nullopt at end of stream or after shutdown()
     */
    std::optional<std::string> readLine(std::optional<Clock::time_point> deadline) {
        while (true) {
            auto newline = buffer_.find('\n');
            if (newline != std::string::npos) {
                std::string line = buffer_.substr(0, newline);
                buffer_.erase(0, newline + 1);
                if (!line.empty() && line.back() == '\r') {
                    line.pop_back();
                }
                return line;
            }
            if (buffer_.size() > maxLineLength_) {
                throw std::runtime_error("line from " + peer_ + " exceeds " +
                                         std::to_string(maxLineLength_) + " bytes");
            }
            if (closed_.load()) {
                return std::nullopt;
            }

            if (!(ssl_ && SSL_pending(ssl_) > 0)) {
                int wait = static_cast<int>(pollInterval_.count());
                if (deadline) {
                    wait = std::min(wait, remainingMs(*deadline));
                }
                pollfd pfd{fd_, POLLIN, 0};
                int ready = ::poll(&pfd, 1, wait);
                if (ready < 0) {
                    if (errno == EINTR) {
                        continue;
                    }
                    throw std::system_error(errno, std::generic_category(), "poll on " + peer_);
                }
                if (ready == 0) {
                    if (deadline && Clock::now() >= *deadline) {
                        throw ConnectError(ErrorKind::Timeout, "no response from " + peer_);
                    }
                    continue;
                }
            }

            char chunk[4096];
            if (ssl_) {
                int n = SSL_read(ssl_, chunk, sizeof(chunk));
                if (n > 0) {
                    buffer_.append(chunk, static_cast<std::size_t>(n));
                    continue;
                }
                int err = SSL_get_error(ssl_, n);
                if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
                    continue;
                }
                if (err == SSL_ERROR_ZERO_RETURN || closed_.load()) {
                    return std::nullopt;
                }
                if (err == SSL_ERROR_SYSCALL && errno == 0) {
                    return std::nullopt;
                }
                throw ConnectError(ErrorKind::TlsError, "TLS read from " + peer_ + " failed: " + openSslErrors());
            }

            ssize_t n = ::recv(fd_, chunk, sizeof(chunk), 0);
            if (n > 0) {
                buffer_.append(chunk, static_cast<std::size_t>(n));
                continue;
            }
            if (n == 0 || closed_.load()) {
                return std::nullopt;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
                continue;
            }
            throw std::system_error(errno, std::generic_category(), "recv from " + peer_);
        }
    }

    void writeLine(const std::string& line, Clock::time_point deadline) {
        const std::string data = line + "\n";
        std::size_t sent = 0;
        while (sent < data.size()) {
            if (ssl_) {
                int n = SSL_write(ssl_, data.data() + sent, static_cast<int>(data.size() - sent));
                if (n > 0) {
                    sent += static_cast<std::size_t>(n);
                    continue;
                }
                int err = SSL_get_error(ssl_, n);
                if (err != SSL_ERROR_WANT_READ && err != SSL_ERROR_WANT_WRITE) {
                    throw ConnectError(ErrorKind::TlsError, "TLS write to " + peer_ + " failed: " + openSslErrors());
                }
                waitFor(err == SSL_ERROR_WANT_READ ? POLLIN : POLLOUT, deadline);
                continue;
            }

            ssize_t n = ::send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
            if (n > 0) {
                sent += static_cast<std::size_t>(n);
                continue;
            }
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) {
                waitFor(POLLOUT, deadline);
                continue;
            }
            throw std::system_error(errno, std::generic_category(), "send to " + peer_);
        }
    }

    /**
     * @brief Client side TLS handshake on the non-blocking socket
     */
    void handshake(Clock::time_point deadline) {
        while (true) {
            int result = SSL_connect(ssl_);
            if (result == 1) {
                return;
            }
            int err = SSL_get_error(ssl_, result);
            if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
                waitFor(err == SSL_ERROR_WANT_READ ? POLLIN : POLLOUT, deadline);
                continue;
            }
            std::string reason = openSslErrors();
            long verify = SSL_get_verify_result(ssl_);
            if (verify != X509_V_OK) {
                reason = std::string("certificate verification failed: ") +
                         X509_verify_cert_error_string(verify);
            }
            if (reason.empty()) {
                reason = "handshake failed (error " + std::to_string(err) + ")";
            }
            throw ConnectError(ErrorKind::TlsError, "TLS handshake with " + peer_ + " failed: " + reason);
        }
    }

    void updateResource(const std::string& resourceId, bool isOnline) {
        std::lock_guard<std::mutex> lock(resourcesMutex_);
        resources_[resourceId] = {
            {"resource_id", resourceId},
            {"is_online", isOnline},
            {"last_seen", utils::formatIso8601(std::chrono::system_clock::now())}
        };
    }

    void replaceResources(const nlohmann::json& list) {
        nlohmann::json table = nlohmann::json::object();
        for (const auto& item : list) {
            if (item.is_object() && item.contains("resource_id") && item.at("resource_id").is_string()) {
                table[item.at("resource_id").get<std::string>()] = item;
            }
        }
        std::lock_guard<std::mutex> lock(resourcesMutex_);
        resources_ = std::move(table);
    }

    nlohmann::json resources() const {
        nlohmann::json list = nlohmann::json::array();
        std::lock_guard<std::mutex> lock(resourcesMutex_);
        for (const auto& item : resources_.items()) {
            list.push_back(item.value());
        }
        return list;
    }

private:
    void waitFor(short events, Clock::time_point deadline) {
        while (true) {
            pollfd pfd{fd_, events, 0};
            int ready = ::poll(&pfd, 1, remainingMs(deadline));
            if (ready > 0) {
                return;
            }
            if (ready < 0 && errno == EINTR) {
                continue;
            }
            if (ready < 0) {
                throw std::system_error(errno, std::generic_category(), "poll on " + peer_);
            }
            throw ConnectError(ErrorKind::Timeout, "timed out talking to " + peer_);
        }
    }

    int fd_;
    SSL* ssl_;
    std::string peer_;
    std::size_t maxLineLength_;
    std::chrono::milliseconds pollInterval_;
    std::atomic<bool> closed_{false};
    std::string buffer_;   // reader thread only

    mutable std::mutex resourcesMutex_;
    nlohmann::json resources_ = nlohmann::json::object();
};

class TcpLineDriver::Stream : public EventStream {
public:
    explicit Stream(std::shared_ptr<Socket> socket) : socket_(std::move(socket)) {}

    std::optional<DriverMessage> next() override {
        while (true) {
            auto line = socket_->readLine(std::nullopt);
            if (!line) {
                return std::nullopt;
            }
            if (line->empty()) {
                continue;
            }

            nlohmann::json value = nlohmann::json::parse(*line, nullptr, false);
            if (value.is_discarded()) {
                TLOG_WARN("Ignoring malformed line from " << socket_->peer());
                continue;
            }

            if (value.is_object() && value.contains("resource_id") && value.at("resource_id").is_string() &&
                value.contains("is_online") && value.at("is_online").is_boolean()) {
                auto resourceId = value.at("resource_id").get<std::string>();
                bool isOnline = value.at("is_online").get<bool>();
                socket_->updateResource(resourceId, isOnline);
                return DriverMessage::resourceStatus(std::move(resourceId), isOnline, std::move(value));
            }

            if (value.is_object() && value.value("op", std::string()) == "resources" &&
                value.contains("resources") && value.at("resources").is_array()) {
                socket_->replaceResources(value.at("resources"));
            }
            return DriverMessage::data(std::move(value));
        }
    }

private:
    std::shared_ptr<Socket> socket_;
};

TcpLineDriver::TcpLineDriver(TcpLineDriverOptions options)
    : options_(options) {}

TcpLineDriver::~TcpLineDriver() {
    if (verifyingContext_) {
        SSL_CTX_free(verifyingContext_);
    }
    if (permissiveContext_) {
        SSL_CTX_free(permissiveContext_);
    }
}

DriverCapabilities TcpLineDriver::capabilities() const {
    DriverCapabilities capabilities;
    capabilities.supportsDiscovery = true;
    capabilities.emitsResourceStatus = true;
    return capabilities;
}

SSL_CTX* TcpLineDriver::tlsContext(bool verify) {
    std::lock_guard<std::mutex> lock(tlsMutex_);
    SSL_CTX*& context = verify ? verifyingContext_ : permissiveContext_;
    if (context) {
        return context;
    }

    context = SSL_CTX_new(TLS_client_method());
    if (!context) {
        throw ConnectError(ErrorKind::TlsError, "Failed to create TLS context: " + openSslErrors());
    }
    SSL_CTX_set_min_proto_version(context, TLS1_2_VERSION);
    if (verify) {
        SSL_CTX_set_verify(context, SSL_VERIFY_PEER, nullptr);
        if (SSL_CTX_set_default_verify_paths(context) != 1) {
            TLOG_WARN("Could not load default certificate locations: " << openSslErrors());
        }
    } else {
        SSL_CTX_set_verify(context, SSL_VERIFY_NONE, nullptr);
    }
    return context;
}

std::shared_ptr<ConnectionHandle> TcpLineDriver::connect(const EndpointConfig& endpoint) {
    if (endpoint.host.empty() || endpoint.port == 0) {
        throw ConnectError(ErrorKind::Unreachable, "Invalid endpoint '" + endpoint.host + ":" +
                                                    std::to_string(endpoint.port) + "'");
    }
    const auto deadline = Clock::now() + endpoint.connectTimeout;
    const std::string peer = endpoint.host + ":" + std::to_string(endpoint.port);

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    addrinfo* result = nullptr;
    const std::string portStr = std::to_string(endpoint.port);
    int status = getaddrinfo(endpoint.host.c_str(), portStr.c_str(), &hints, &result);
    if (status != 0) {
        throw ConnectError(ErrorKind::Unreachable, "Failed to resolve " + endpoint.host + ": " + gai_strerror(status));
    }
    std::unique_ptr<addrinfo, decltype(&freeaddrinfo)> resultPtr(result, freeaddrinfo);

    int fd = -1;
    int lastError = 0;
    bool timedOut = false;
    for (const addrinfo* address = result; address && fd == -1 && !timedOut; address = address->ai_next) {
        fd = connectOne(address, deadline, lastError, timedOut);
    }
    if (fd == -1) {
        if (timedOut) {
            throw ConnectError(ErrorKind::Timeout, "Connect to " + peer + " timed out after " +
                                                    std::to_string(endpoint.connectTimeout.count()) + "ms");
        }
        throw ConnectError(kindForErrno(lastError), "Connect to " + peer + " failed: " + std::strerror(lastError));
    }

    SSL* ssl = nullptr;
    if (endpoint.useTls) {
        SSL_CTX* context = nullptr;
        try {
            context = tlsContext(endpoint.verifyTls);
        } catch (...) {
            ::close(fd);
            throw;
        }
        ssl = SSL_new(context);
        if (!ssl) {
            ::close(fd);
            throw ConnectError(ErrorKind::TlsError, "Failed to create TLS session: " + openSslErrors());
        }
        SSL_set_fd(ssl, fd);
        SSL_set_tlsext_host_name(ssl, endpoint.host.c_str());
        if (endpoint.verifyTls) {
            SSL_set1_host(ssl, endpoint.host.c_str());
        }
    }

    // From here on the socket owns fd and ssl
    auto socket = std::make_shared<Socket>(fd, ssl, peer, options_.maxLineLength, options_.pollInterval);
    if (ssl) {
        socket->handshake(deadline);
    }

    if (!endpoint.username.empty()) {
        nlohmann::json auth = {
            {"op", "auth"},
            {"username", endpoint.username},
            {"token", endpoint.secret}
        };
        socket->writeLine(auth.dump(), deadline);

        auto reply = socket->readLine(deadline);
        if (!reply) {
            throw ConnectError(ErrorKind::AuthError, peer + " closed the connection during authentication");
        }
        nlohmann::json answer = nlohmann::json::parse(*reply, nullptr, false);
        if (answer.is_discarded() || !answer.is_object() || answer.value("op", std::string()) != "auth") {
            throw ConnectError(ErrorKind::AuthError, peer + " sent an unexpected authentication reply");
        }
        if (!answer.value("ok", false)) {
            throw ConnectError(ErrorKind::AuthError, "Authentication as " + endpoint.username + " rejected: " +
                                                     answer.value("reason", std::string("no reason given")));
        }
    }

    TLOG_DEBUG("Connected to " << peer << (ssl ? " over TLS" : ""));
    return socket;
}

std::unique_ptr<EventStream> TcpLineDriver::events(const std::shared_ptr<ConnectionHandle>& handle) {
    return std::make_unique<Stream>(asSocket(handle));
}

void TcpLineDriver::disconnect(const std::shared_ptr<ConnectionHandle>& handle) {
    if (!handle) {
        return;
    }
    asSocket(handle)->shutdown();
}

nlohmann::json TcpLineDriver::discover(const std::shared_ptr<ConnectionHandle>& handle,
                                       const std::string& resourceKey) {
    auto socket = asSocket(handle);
    if (resourceKey != "resources") {
        throw std::invalid_argument("tcp-line driver cannot discover '" + resourceKey + "'");
    }
    if (socket->closed()) {
        throw std::runtime_error("connection to " + socket->peer() + " is closed");
    }
    return socket->resources();
}

std::shared_ptr<TcpLineDriver::Socket> TcpLineDriver::asSocket(const std::shared_ptr<ConnectionHandle>& handle) {
    auto socket = std::dynamic_pointer_cast<Socket>(handle);
    if (!socket) {
        throw std::invalid_argument("Handle does not belong to a TcpLineDriver");
    }
    return socket;
}

} // namespace core
} // namespace tether
