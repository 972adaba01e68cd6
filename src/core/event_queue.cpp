#include "tether/core/event_queue.hpp"

#include <stdexcept>

namespace tether {
namespace core {

EventQueue::EventQueue(std::size_t capacity)
    : capacity_(capacity) {
    if (capacity_ == 0) {
        throw std::invalid_argument("EventQueue capacity must be positive");
    }
}

bool EventQueue::push(DriverMessage message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        if (messages_.size() >= capacity_) {
            messages_.pop_front();
            ++dropped_;
        }
        messages_.push_back(std::move(message));
    }
    available_.notify_one();
    return true;
}

std::optional<DriverMessage> EventQueue::pop() {
    std::unique_lock<std::mutex> lock(mutex_);
    available_.wait(lock, [this] { return !messages_.empty() || closed_; });
    return takeLocked();
}

std::optional<DriverMessage> EventQueue::popFor(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!available_.wait_for(lock, timeout, [this] { return !messages_.empty() || closed_; })) {
        return std::nullopt;
    }
    return takeLocked();
}

std::optional<DriverMessage> EventQueue::takeLocked() {
    if (!messages_.empty()) {
        DriverMessage message = std::move(messages_.front());
        messages_.pop_front();
        return message;
    }
    if (error_) {
        std::rethrow_exception(error_);
    }
    return std::nullopt;
}

void EventQueue::close(std::exception_ptr error) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
        error_ = error;
    }
    available_.notify_all();
}

bool EventQueue::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::size_t EventQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_.size();
}

std::size_t EventQueue::droppedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

} // namespace core
} // namespace tether
