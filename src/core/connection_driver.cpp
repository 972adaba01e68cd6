#include "tether/core/connection_driver.hpp"

#include <cerrno>
#include <system_error>
#include "tether/utils/logging.hpp"

namespace tether {
namespace core {

bool operator==(const EndpointConfig& lhs, const EndpointConfig& rhs) {
    return lhs.host == rhs.host &&
           lhs.port == rhs.port &&
           lhs.useTls == rhs.useTls &&
           lhs.verifyTls == rhs.verifyTls &&
           lhs.username == rhs.username &&
           lhs.secret == rhs.secret &&
           lhs.connectTimeout == rhs.connectTimeout &&
           lhs.extra == rhs.extra;
}

bool operator!=(const EndpointConfig& lhs, const EndpointConfig& rhs) {
    return !(lhs == rhs);
}

DriverMessage DriverMessage::data(nlohmann::json payload) {
    DriverMessage message;
    message.kind = MessageKind::Data;
    message.payload = std::move(payload);
    return message;
}

DriverMessage DriverMessage::resourceStatus(std::string resourceId, bool isOnline, nlohmann::json payload) {
    DriverMessage message;
    message.kind = MessageKind::ResourceStatus;
    message.resourceId = std::move(resourceId);
    message.isOnline = isOnline;
    message.payload = std::move(payload);
    return message;
}

ErrorKind ConnectionDriver::classify(std::exception_ptr error) const {
    if (!error) {
        return ErrorKind::Unknown;
    }
    try {
        std::rethrow_exception(error);
    } catch (const ConnectError& e) {
        return e.kind();
    } catch (const std::system_error& e) {
        if (e.code().category() != std::generic_category() &&
            e.code().category() != std::system_category()) {
            return ErrorKind::Unknown;
        }
        switch (e.code().value()) {
            case ETIMEDOUT:
                return ErrorKind::Timeout;
            case ECONNREFUSED:
            case EHOSTUNREACH:
            case ENETUNREACH:
            case ECONNRESET:
                return ErrorKind::Unreachable;
            case EACCES:
            case EPERM:
                return ErrorKind::AuthError;
            default:
                return ErrorKind::Unknown;
        }
    } catch (...) {
        return ErrorKind::Unknown;
    }
}

nlohmann::json ConnectionDriver::discover(const std::shared_ptr<ConnectionHandle>&,
                                          const std::string& resourceKey) {
    throw std::logic_error("Driver " + name() + " cannot discover '" + resourceKey + "'");
}

std::string describeException(std::exception_ptr error) {
    if (!error) {
        return "no error";
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "non-standard exception";
    }
}

PendingConnect::PendingConnect(std::shared_ptr<ConnectionDriver> driver, EndpointConfig endpoint)
    : driver_(driver),
      timeout_(endpoint.connectTimeout),
      slot_(std::make_shared<Slot>()),
      task_(launch(slot_, std::move(driver), std::move(endpoint))) {}

utils::DetachedTask PendingConnect::launch(const std::shared_ptr<Slot>& slot,
                                           std::shared_ptr<ConnectionDriver> driver,
                                           EndpointConfig endpoint) {
    return utils::DetachedTask([slot, driver, endpoint]() {
        auto handle = driver->connect(endpoint);
        std::unique_lock<std::mutex> lock(slot->mutex);
        if (slot->abandoned) {
            lock.unlock();
            if (handle) {
                TLOG_DEBUG("Closing late connection to " << endpoint.host << ":" << endpoint.port);
                driver->disconnect(handle);
            }
            return;
        }
        slot->handle = std::move(handle);
    });
}

ConnectOutcome PendingConnect::wait(utils::DetachedTask::Clock::time_point deadline) {
    ConnectOutcome outcome;
    if (task_.waitUntil(deadline)) {
        if (auto error = task_.error()) {
            outcome.status = ConnectOutcome::Status::Failed;
            outcome.errorKind = driver_->classify(error);
            outcome.message = describeException(error);
            return outcome;
        }
        std::lock_guard<std::mutex> lock(slot_->mutex);
        if (!slot_->handle) {
            outcome.status = ConnectOutcome::Status::Failed;
            outcome.errorKind = ErrorKind::Unknown;
            outcome.message = "Driver " + driver_->name() + " returned no connection";
            return outcome;
        }
        outcome.status = ConnectOutcome::Status::Connected;
        outcome.handle = slot_->handle;
        return outcome;
    }

    std::lock_guard<std::mutex> lock(slot_->mutex);
    if (slot_->handle) {
        // Finished between the wait and the lock
        outcome.status = ConnectOutcome::Status::Connected;
        outcome.handle = slot_->handle;
        return outcome;
    }
    slot_->abandoned = true;
    if (task_.interrupted()) {
        outcome.status = ConnectOutcome::Status::Interrupted;
        outcome.message = "Connect interrupted";
    } else {
        outcome.status = ConnectOutcome::Status::TimedOut;
        outcome.errorKind = ErrorKind::Timeout;
        outcome.message = "Connect timed out after " + std::to_string(timeout_.count()) + "ms";
    }
    return outcome;
}

ConnectionTestResult probeConnection(const std::shared_ptr<ConnectionDriver>& driver,
                                     const EndpointConfig& endpoint) {
    ConnectionTestResult result;
    const auto started = std::chrono::steady_clock::now();
    const auto target = endpoint.host + ":" + std::to_string(endpoint.port);

    PendingConnect pending(driver, endpoint);
    auto outcome = pending.wait(started + endpoint.connectTimeout);
    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    if (outcome.status != ConnectOutcome::Status::Connected) {
        result.success = false;
        result.errorKind = outcome.errorKind;
        result.message = outcome.message;
        TLOG_INFO("Connection test to " << target << " via " << driver->name()
                  << " failed (" << toString(outcome.errorKind) << "): " << outcome.message);
        return result;
    }

    auto handle = outcome.handle;
    utils::DetachedTask closer([driver, handle]() { driver->disconnect(handle); });
    if (!closer.waitUntil(started + 2 * endpoint.connectTimeout)) {
        TLOG_WARN("Connection test to " << target << " left a disconnect running");
    } else if (auto error = closer.error()) {
        TLOG_WARN("Connection test to " << target << " disconnect failed: " << describeException(error));
    }

    result.success = true;
    result.message = "Connected to " + target;
    TLOG_INFO("Connection test to " << target << " via " << driver->name() << " succeeded in "
              << result.elapsed.count() << "ms");
    return result;
}

} // namespace core
} // namespace tether
