#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <condition_variable>
#include <deque>

#include "support/scripted_driver.hpp"
#include "tether/core/blocking_source_driver.hpp"
#include "tether/core/connection_supervisor.hpp"
#include "tether/core/event_queue.hpp"

using namespace tether::core;
using tether::test_support::Recorder;
using tether::test_support::eventually;
using std::chrono::milliseconds;

namespace {

/**
 * @brief Source whose read() blocks until the test feeds it, like a serial port
 */
class FakeSource : public BlockingSource {
public:
    struct Shared {
        std::mutex mutex;
        std::condition_variable cv;
        std::deque<DriverMessage> pending;
        bool finished{false};
        bool closed{false};
        std::exception_ptr failure;
        std::exception_ptr openError;
        std::vector<std::string> openedHosts;
        int closeCalls{0};
    };

    explicit FakeSource(std::shared_ptr<Shared> shared) : shared_(std::move(shared)) {}

    void open(const EndpointConfig& endpoint) override {
        std::lock_guard<std::mutex> lock(shared_->mutex);
        if (shared_->openError) {
            std::rethrow_exception(shared_->openError);
        }
        shared_->openedHosts.push_back(endpoint.host);
    }

    std::optional<DriverMessage> read() override {
        std::unique_lock<std::mutex> lock(shared_->mutex);
        shared_->cv.wait(lock, [this] {
            return !shared_->pending.empty() || shared_->finished || shared_->closed || shared_->failure;
        });
        if (!shared_->pending.empty()) {
            DriverMessage message = std::move(shared_->pending.front());
            shared_->pending.pop_front();
            return message;
        }
        if (shared_->failure && !shared_->closed) {
            std::rethrow_exception(shared_->failure);
        }
        return std::nullopt;
    }

    void close() override {
        {
            std::lock_guard<std::mutex> lock(shared_->mutex);
            shared_->closed = true;
            ++shared_->closeCalls;
        }
        shared_->cv.notify_all();
    }

private:
    std::shared_ptr<Shared> shared_;
};

} // namespace

class BlockingSourceDriverTest : public ::testing::Test {
protected:
    void feed(DriverMessage message) {
        {
            std::lock_guard<std::mutex> lock(shared->mutex);
            shared->pending.push_back(std::move(message));
        }
        shared->cv.notify_all();
    }

    void finish() {
        {
            std::lock_guard<std::mutex> lock(shared->mutex);
            shared->finished = true;
        }
        shared->cv.notify_all();
    }

    void fail(std::exception_ptr error) {
        {
            std::lock_guard<std::mutex> lock(shared->mutex);
            shared->failure = error;
        }
        shared->cv.notify_all();
    }

    int closeCalls() {
        std::lock_guard<std::mutex> lock(shared->mutex);
        return shared->closeCalls;
    }

    std::shared_ptr<FakeSource::Shared> shared = std::make_shared<FakeSource::Shared>();
    std::shared_ptr<BlockingSourceDriver> driver = std::make_shared<BlockingSourceDriver>(
        "zwave-serial", [this]() { return std::make_unique<FakeSource>(shared); }, 8);
    EndpointConfig endpoint = [] {
        EndpointConfig e;
        e.host = "/dev/ttyACM0";
        return e;
    }();
};

TEST_F(BlockingSourceDriverTest, NameAndCapabilities) {
    EXPECT_EQ(driver->name(), "blocking:zwave-serial");
    EXPECT_TRUE(driver->capabilities().blockingIo);
    EXPECT_FALSE(driver->capabilities().supportsDiscovery);
    EXPECT_THROW(BlockingSourceDriver("empty", BlockingSourceFactory()), std::invalid_argument);
}

TEST_F(BlockingSourceDriverTest, StreamsMessagesUntilSourceEnds) {
    auto handle = driver->connect(endpoint);
    auto stream = driver->events(handle);
    feed(DriverMessage::resourceStatus("node-4", true));
    feed(DriverMessage::data({{"value", 21.5}}));

    auto first = stream->next();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->kind, MessageKind::ResourceStatus);
    EXPECT_EQ(first->resourceId, "node-4");
    auto second = stream->next();
    ASSERT_TRUE(second.has_value());
    EXPECT_DOUBLE_EQ(second->payload["value"].get<double>(), 21.5);

    finish();
    EXPECT_FALSE(stream->next().has_value());
    driver->disconnect(handle);
}

TEST_F(BlockingSourceDriverTest, ReadErrorsReachTheStream) {
    auto handle = driver->connect(endpoint);
    auto stream = driver->events(handle);
    fail(std::make_exception_ptr(std::runtime_error("device unplugged")));
    EXPECT_THROW(stream->next(), std::runtime_error);
    driver->disconnect(handle);
}

TEST_F(BlockingSourceDriverTest, DisconnectUnblocksTheReader) {
    auto handle = driver->connect(endpoint);
    auto stream = driver->events(handle);

    std::atomic<bool> ended{false};
    std::thread consumer([&]() {
        while (stream->next()) {
        }
        ended = true;
    });
    driver->disconnect(handle);
    driver->disconnect(handle);
    consumer.join();
    EXPECT_TRUE(ended.load());
    EXPECT_EQ(closeCalls(), 1);
}

TEST_F(BlockingSourceDriverTest, StreamCanOnlyBeOpenedOnce) {
    auto handle = driver->connect(endpoint);
    auto stream = driver->events(handle);
    EXPECT_THROW(driver->events(handle), std::logic_error);
    driver->disconnect(handle);
}

TEST_F(BlockingSourceDriverTest, OpenFailureIsAConnectError) {
    shared->openError = std::make_exception_ptr(ConnectError(ErrorKind::AuthError, "pairing key rejected"));
    try {
        driver->connect(endpoint);
        FAIL() << "connect should throw";
    } catch (...) {
        EXPECT_EQ(driver->classify(std::current_exception()), ErrorKind::AuthError);
    }
}

TEST_F(BlockingSourceDriverTest, SlowConsumerDropsOldest) {
    auto handle = driver->connect(endpoint);
    auto stream = driver->events(handle);
    for (int i = 0; i < 12; ++i) {
        feed(DriverMessage::data({{"seq", i}}));
    }
    ASSERT_TRUE(eventually([&] { return BlockingSourceDriver::droppedCount(handle) == 4; }));
    auto next = stream->next();
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(next->payload["seq"], 4);
    driver->disconnect(handle);
}

TEST_F(BlockingSourceDriverTest, SupervisedBlockingSourceReconnectsWhenItEnds) {
    auto broadcaster = std::make_shared<StatusBroadcaster>();
    Recorder recorder;
    recorder.attach(*broadcaster);

    SupervisorConfig config;
    config.id = "zwave";
    config.endpoint = endpoint;
    config.backoff = BackoffConfig{milliseconds(10), 2.0, milliseconds(50)};
    config.stopGrace = milliseconds(500);
    ConnectionSupervisor supervisor(config, broadcaster);
    ASSERT_TRUE(supervisor.start(driver));

    feed(DriverMessage::resourceStatus("node-9", false));
    ASSERT_TRUE(eventually([&] { return recorder.resourceEvents().size() == 1; }));
    EXPECT_EQ(recorder.resourceEvents()[0].resourceId, "node-9");

    finish();
    ASSERT_TRUE(eventually([&] {
        std::lock_guard<std::mutex> lock(shared->mutex);
        return shared->openedHosts.size() >= 2;
    }));
    EXPECT_TRUE(supervisor.stop());
}

TEST(EventQueueTest, RejectsZeroCapacity) {
    EXPECT_THROW(EventQueue(0), std::invalid_argument);
}

TEST(EventQueueTest, DrainsBeforeReportingClose) {
    EventQueue queue(4);
    EXPECT_TRUE(queue.push(DriverMessage::data({{"n", 1}})));
    queue.close(std::make_exception_ptr(std::runtime_error("eof")));
    queue.close();
    EXPECT_FALSE(queue.push(DriverMessage::data({{"n", 2}})));

    auto first = queue.pop();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->payload["n"], 1);
    EXPECT_THROW(queue.pop(), std::runtime_error);
    EXPECT_TRUE(queue.closed());
}

TEST(EventQueueTest, PopForTimesOut) {
    EventQueue queue(4);
    const auto started = std::chrono::steady_clock::now();
    EXPECT_FALSE(queue.popFor(milliseconds(30)).has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - started, milliseconds(25));
    EXPECT_FALSE(queue.closed());
}
