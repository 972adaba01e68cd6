#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <map>
#include <mutex>

#include "support/scripted_driver.hpp"
#include "tether/core/supervisor_registry.hpp"

using namespace tether::core;
using tether::test_support::Recorder;
using tether::test_support::ScriptedDriver;
using tether::test_support::eventually;
using ::testing::ElementsAre;
using ::testing::UnorderedElementsAre;
using std::chrono::milliseconds;

namespace {

SupervisorConfig makeConfig(const std::string& id, const std::string& host = "controller.local") {
    SupervisorConfig config;
    config.id = id;
    config.driver = "scripted";
    config.endpoint.host = host;
    config.endpoint.port = 8443;
    config.endpoint.connectTimeout = milliseconds(500);
    config.backoff = BackoffConfig{milliseconds(20), 2.0, milliseconds(80)};
    config.stopGrace = milliseconds(500);
    return config;
}

} // namespace

class SupervisorRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        recorder.attach(*broadcaster);
        registry = std::make_unique<SupervisorRegistry>(broadcaster, nullptr, milliseconds(2000));
    }

    void TearDown() override {
        std::lock_guard<std::mutex> lock(mutex);
        for (auto& item : drivers) {
            item.second->release();
        }
    }

    DriverFactory factory() {
        return [this](const SupervisorConfig& config) { return driverFor(config.id); };
    }

    std::shared_ptr<ScriptedDriver> driverFor(const std::string& id) {
        std::lock_guard<std::mutex> lock(mutex);
        auto& driver = drivers[id];
        if (!driver) {
            driver = std::make_shared<ScriptedDriver>();
        }
        return driver;
    }

    Recorder recorder;
    std::shared_ptr<StatusBroadcaster> broadcaster = std::make_shared<StatusBroadcaster>();
    std::unique_ptr<SupervisorRegistry> registry;
    std::mutex mutex;
    std::map<std::string, std::shared_ptr<ScriptedDriver>> drivers;
};

TEST_F(SupervisorRegistryTest, RequiresBroadcaster) {
    EXPECT_THROW(SupervisorRegistry(nullptr), std::invalid_argument);
}

TEST_F(SupervisorRegistryTest, AddStartsSupervisor) {
    ASSERT_TRUE(registry->add(makeConfig("unifi"), factory()));
    EXPECT_TRUE(registry->contains("unifi"));
    EXPECT_EQ(registry->size(), 1u);

    auto supervisor = registry->get("unifi");
    ASSERT_NE(supervisor, nullptr);
    EXPECT_EQ(supervisor->status().state, ConnectionState::Connected);
    EXPECT_THAT(recorder.states("unifi"),
                ElementsAre(ConnectionState::Connecting, ConnectionState::Connected));
}

TEST_F(SupervisorRegistryTest, AddIsIdempotentPerId) {
    ASSERT_TRUE(registry->add(makeConfig("unifi"), factory()));
    EXPECT_FALSE(registry->add(makeConfig("unifi", "other.local"), factory()));
    EXPECT_EQ(registry->size(), 1u);
    EXPECT_EQ(driverFor("unifi")->connectCalls(), 1);
    EXPECT_EQ(registry->get("unifi")->config().endpoint.host, "controller.local");
}

TEST_F(SupervisorRegistryTest, NullDriverIsRejected) {
    DriverFactory none = [](const SupervisorConfig&) { return std::shared_ptr<ConnectionDriver>(); };
    EXPECT_THROW(registry->add(makeConfig("broken"), none), std::invalid_argument);
    EXPECT_FALSE(registry->contains("broken"));
}

TEST_F(SupervisorRegistryTest, RemoveStopsAndForgets) {
    ASSERT_TRUE(registry->add(makeConfig("unifi"), factory()));
    EXPECT_TRUE(registry->remove("unifi"));
    EXPECT_FALSE(registry->contains("unifi"));
    EXPECT_FALSE(registry->remove("unifi"));
    EXPECT_FALSE(broadcaster->latest("unifi").has_value());
    EXPECT_EQ(recorder.states("unifi").back(), ConnectionState::Disconnected);
    EXPECT_GE(driverFor("unifi")->disconnectCalls(), 1);
}

TEST_F(SupervisorRegistryTest, ConnectionsAreIndependent) {
    driverFor("down")->setFallback(ScriptedDriver::Outcome::Fail, ErrorKind::Unreachable);
    ASSERT_TRUE(registry->add(makeConfig("up"), factory()));
    ASSERT_TRUE(registry->add(makeConfig("down"), factory()));

    auto statuses = registry->statuses();
    ASSERT_EQ(statuses.size(), 2u);
    EXPECT_EQ(statuses["up"].state, ConnectionState::Connected);
    EXPECT_NE(statuses["down"].state, ConnectionState::Connected);
    EXPECT_THAT(registry->ids(), ElementsAre("down", "up"));
}

TEST_F(SupervisorRegistryTest, DiscoverUnknownConnectionWarns) {
    auto result = registry->discover("missing", "cameras");
    EXPECT_FALSE(result.hasData());
    ASSERT_TRUE(result.warning.has_value());
    EXPECT_EQ(*result.warning, "Unknown connection missing");
}

TEST_F(SupervisorRegistryTest, ReconcileAddsRemovesAndRestarts) {
    ASSERT_TRUE(registry->add(makeConfig("keep"), factory()));
    ASSERT_TRUE(registry->add(makeConfig("moved"), factory()));
    ASSERT_TRUE(registry->add(makeConfig("gone"), factory()));

    auto disabled = makeConfig("disabled");
    disabled.enabled = false;
    std::vector<SupervisorConfig> wanted{
        makeConfig("keep"),
        makeConfig("moved", "new-host.local"),
        makeConfig("fresh"),
        disabled};

    auto report = registry->reconcile(wanted, factory());
    EXPECT_THAT(report.added, ElementsAre("fresh"));
    EXPECT_THAT(report.restarted, ElementsAre("moved"));
    EXPECT_THAT(report.removed, ElementsAre("gone"));
    EXPECT_THAT(registry->ids(), UnorderedElementsAre("keep", "moved", "fresh"));

    EXPECT_EQ(driverFor("keep")->connectCalls(), 1);
    EXPECT_EQ(registry->get("moved")->config().endpoint.host, "new-host.local");
    EXPECT_EQ(registry->get("moved")->status().state, ConnectionState::Connected);
}

TEST_F(SupervisorRegistryTest, FatalErrorRemovesConnection) {
    std::atomic<int> refreshes{0};
    std::atomic<bool> fatalSeen{false};
    SupervisorHooks hooks;
    hooks.refreshEndpoint = [&refreshes](const std::string& id) -> std::optional<EndpointConfig> {
        if (refreshes++ == 0) {
            return makeConfig(id).endpoint;
        }
        return std::nullopt;
    };
    hooks.onFatal = [&fatalSeen](const std::string&, const std::string&) { fatalSeen = true; };

    driverFor("deleted")->setFallback(ScriptedDriver::Outcome::Fail, ErrorKind::Unreachable);
    ASSERT_TRUE(registry->add(makeConfig("deleted"), factory(), hooks));

    ASSERT_TRUE(eventually([&] { return !registry->contains("deleted"); }));
    EXPECT_TRUE(fatalSeen.load());
    EXPECT_TRUE(eventually([&] { return !broadcaster->latest("deleted").has_value(); }));
}

TEST_F(SupervisorRegistryTest, ShutdownAllIsBoundedByTimeout) {
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(registry->add(makeConfig("conn-" + std::to_string(i)), factory()));
    }
    driverFor("conn-2")->setHangOnDisconnect(true);

    const auto started = std::chrono::steady_clock::now();
    auto report = registry->shutdownAll(milliseconds(400));
    const auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_LT(elapsed, milliseconds(1000));
    EXPECT_FALSE(report.complete());
    EXPECT_THAT(report.abandoned, ElementsAre("conn-2"));
    EXPECT_THAT(report.stopped, UnorderedElementsAre("conn-0", "conn-1", "conn-3", "conn-4"));
    EXPECT_EQ(registry->size(), 0u);

    EXPECT_FALSE(registry->add(makeConfig("late"), factory()));
}

TEST_F(SupervisorRegistryTest, ShutdownInterruptsBackoffSleeps) {
    for (int i = 0; i < 3; ++i) {
        auto config = makeConfig("retrying-" + std::to_string(i));
        config.backoff = BackoffConfig{milliseconds(4000), 2.0, milliseconds(30000)};
        driverFor(config.id)->setFallback(ScriptedDriver::Outcome::Fail, ErrorKind::Timeout);
        ASSERT_TRUE(registry->add(config, factory()));
    }

    auto report = registry->shutdownAll(milliseconds(1000));
    EXPECT_TRUE(report.complete());
    EXPECT_EQ(report.stopped.size(), 3u);
    EXPECT_LT(report.elapsed, milliseconds(1000));
}
