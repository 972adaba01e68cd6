#include "tether/core/blocking_source_driver.hpp"

#include <atomic>
#include <stdexcept>
#include "tether/utils/detached_task.hpp"
#include "tether/utils/logging.hpp"

namespace tether {
namespace core {

class BlockingSourceDriver::Handle : public ConnectionHandle {
public:
    Handle(std::unique_ptr<BlockingSource> source, std::size_t capacity)
        : shared_(std::make_shared<Shared>()) {
        shared_->source = std::move(source);
        shared_->queue = std::make_shared<EventQueue>(capacity);
    }

    ~Handle() override {
        try {
            close();
        } catch (const std::exception& e) {
            TLOG_WARN("Closing blocking source failed: " << e.what());
        }
    }

    std::shared_ptr<EventQueue> startReader() {
        if (shared_->readerStarted.exchange(true)) {
            throw std::logic_error("Blocking source is already being read");
        }
        auto shared = shared_;
        utils::DetachedTask reader([shared]() {
            try {
                while (!shared->closed.load()) {
                    auto message = shared->source->read();
                    if (!message) {
                        break;
                    }
                    shared->queue->push(std::move(*message));
                }
                shared->queue->close();
            } catch (...) {
                shared->queue->close(std::current_exception());
            }
        });
        (void)reader;
        return shared_->queue;
    }

    void close() {
        if (shared_->closed.exchange(true)) {
            return;
        }
        shared_->queue->close();
        shared_->source->close();
    }

    std::size_t dropped() const { return shared_->queue->droppedCount(); }

private:
    // Shared with the reader thread, which may outlive the handle
    struct Shared {
        std::unique_ptr<BlockingSource> source;
        std::shared_ptr<EventQueue> queue;
        std::atomic<bool> closed{false};
        std::atomic<bool> readerStarted{false};
    };

    std::shared_ptr<Shared> shared_;
};

BlockingSourceDriver::BlockingSourceDriver(std::string label, BlockingSourceFactory factory,
                                           std::size_t queueCapacity, DriverCapabilities capabilities)
    : label_(std::move(label)),
      factory_(std::move(factory)),
      queueCapacity_(queueCapacity),
      capabilities_(capabilities) {
    if (!factory_) {
        throw std::invalid_argument("BlockingSourceDriver requires a source factory");
    }
    capabilities_.blockingIo = true;
}

std::string BlockingSourceDriver::name() const {
    return "blocking:" + label_;
}

DriverCapabilities BlockingSourceDriver::capabilities() const {
    return capabilities_;
}

std::shared_ptr<ConnectionHandle> BlockingSourceDriver::connect(const EndpointConfig& endpoint) {
    auto source = factory_();
    if (!source) {
        throw ConnectError(ErrorKind::Unknown, "No source available for " + label_);
    }
    source->open(endpoint);
    return std::make_shared<Handle>(std::move(source), queueCapacity_);
}

std::unique_ptr<EventStream> BlockingSourceDriver::events(const std::shared_ptr<ConnectionHandle>& handle) {
    return std::make_unique<QueuedEventStream>(asHandle(handle)->startReader());
}

void BlockingSourceDriver::disconnect(const std::shared_ptr<ConnectionHandle>& handle) {
    if (!handle) {
        return;
    }
    asHandle(handle)->close();
}

std::size_t BlockingSourceDriver::droppedCount(const std::shared_ptr<ConnectionHandle>& handle) {
    return asHandle(handle)->dropped();
}

std::shared_ptr<BlockingSourceDriver::Handle>
BlockingSourceDriver::asHandle(const std::shared_ptr<ConnectionHandle>& handle) {
    auto typed = std::dynamic_pointer_cast<Handle>(handle);
    if (!typed) {
        throw std::invalid_argument("Handle does not belong to a BlockingSourceDriver");
    }
    return typed;
}

} // namespace core
} // namespace tether
