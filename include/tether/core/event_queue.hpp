#ifndef TETHER_CORE_EVENT_QUEUE_HPP
#define TETHER_CORE_EVENT_QUEUE_HPP

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include "tether/core/connection_driver.hpp"

namespace tether {
namespace core {

/**
 * @brief Bounded multi-producer queue of driver messages with end-of-stream.
 *
 * When full, the oldest message is dropped. close() ends the stream; pop()
 * drains what is left and then returns std::nullopt, or rethrows the error
 * passed to close().
 */
class EventQueue {
public:
    explicit EventQueue(std::size_t capacity = 1024);

    /** @return false if the queue is closed */
    bool push(DriverMessage message);

    /**
     * @brief Block until a message is available or the queue is closed
     */
    std::optional<DriverMessage> pop();

    /**
     * @brief Like pop() but gives up after the timeout
     * @return std::nullopt on timeout or end of stream; check closed() to tell them apart
     */
    std::optional<DriverMessage> popFor(std::chrono::milliseconds timeout);

    /**
     * @brief End the stream. Only the first call has an effect.
     */
    void close(std::exception_ptr error = nullptr);

    bool closed() const;
    std::size_t size() const;
    std::size_t capacity() const { return capacity_; }
    std::size_t droppedCount() const;

private:
    std::optional<DriverMessage> takeLocked();

    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable available_;
    std::deque<DriverMessage> messages_;
    bool closed_{false};
    std::exception_ptr error_;
    std::size_t dropped_{0};
};

/**
 * @brief EventStream reading from an EventQueue
 */
class QueuedEventStream : public EventStream {
public:
    explicit QueuedEventStream(std::shared_ptr<EventQueue> queue) : queue_(std::move(queue)) {}

    std::optional<DriverMessage> next() override { return queue_->pop(); }

private:
    std::shared_ptr<EventQueue> queue_;
};

} // namespace core
} // namespace tether

#endif // TETHER_CORE_EVENT_QUEUE_HPP
