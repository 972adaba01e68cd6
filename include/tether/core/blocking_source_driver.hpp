#ifndef TETHER_CORE_BLOCKING_SOURCE_DRIVER_HPP
#define TETHER_CORE_BLOCKING_SOURCE_DRIVER_HPP

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include "tether/core/connection_driver.hpp"
#include "tether/core/event_queue.hpp"

namespace tether {
namespace core {

/**
 * @brief A message source whose calls block, such as a native capture or decode API
 */
class BlockingSource {
public:
    virtual ~BlockingSource() = default;

    /**
     * @throws ConnectError or any exception; classified like a driver connect failure
     */
    virtual void open(const EndpointConfig& endpoint) = 0;

    /**
     * @brief Block until the next message. std::nullopt ends the stream.
     */
    virtual std::optional<DriverMessage> read() = 0;

    /**
     * @brief Release the source. Called from another thread while read() may be
     *        blocked, and must make it return.
     */
    virtual void close() = 0;
};

using BlockingSourceFactory = std::function<std::unique_ptr<BlockingSource>()>;

/**
 * @brief Driver that runs a BlockingSource on its own reader thread.
 *
 * Messages are handed to the supervisor through a bounded EventQueue; when the
 * supervisor falls behind, the oldest messages are dropped.
 */
class BlockingSourceDriver : public ConnectionDriver {
public:
    BlockingSourceDriver(std::string label, BlockingSourceFactory factory,
                         std::size_t queueCapacity = 256,
                         DriverCapabilities capabilities = DriverCapabilities{});

    std::string name() const override;
    DriverCapabilities capabilities() const override;

    std::shared_ptr<ConnectionHandle> connect(const EndpointConfig& endpoint) override;
    std::unique_ptr<EventStream> events(const std::shared_ptr<ConnectionHandle>& handle) override;
    void disconnect(const std::shared_ptr<ConnectionHandle>& handle) override;

    /**
     * @brief Messages dropped for a connection because its queue was full
     */
    static std::size_t droppedCount(const std::shared_ptr<ConnectionHandle>& handle);

private:
    class Handle;
    static std::shared_ptr<Handle> asHandle(const std::shared_ptr<ConnectionHandle>& handle);

    std::string label_;
    BlockingSourceFactory factory_;
    std::size_t queueCapacity_;
    DriverCapabilities capabilities_;
};

} // namespace core
} // namespace tether

#endif // TETHER_CORE_BLOCKING_SOURCE_DRIVER_HPP
