#include <gtest/gtest.h>

#include <atomic>
#include <cstdio>
#include <fstream>
#include <thread>
#include <vector>

#include "tether/core/status_store.hpp"
#include "tether/utils/time_format.hpp"

using namespace tether::core;

class StatusStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        path = ::testing::TempDir() + "tether_status_store_" +
               ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".json";
        std::remove(path.c_str());
    }

    void TearDown() override {
        std::remove(path.c_str());
    }

    StatusEvent event(const std::string& id, ConnectionState state,
                      std::optional<std::string> error = std::nullopt) {
        return StatusEvent{"CONNECTION_STATUS", id, state, std::move(error),
                           *tether::utils::parseIso8601("2024-05-01T10:00:00.000Z")};
    }

    std::string path;
};

TEST_F(StatusStoreTest, MissingFileLoadsEmpty) {
    StatusStore store(path);
    EXPECT_TRUE(store.load().has_value());
    EXPECT_TRUE(store.all().empty());
}

TEST_F(StatusStoreTest, ApplyTracksLastConnectedAndError) {
    StatusStore store(path);
    store.apply(event("nvr", ConnectionState::Connected));
    store.apply(event("nvr", ConnectionState::Reconnecting, std::string("connection reset")));

    auto record = store.get("nvr");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->state, ConnectionState::Reconnecting);
    EXPECT_FALSE(record->isConnected);
    ASSERT_TRUE(record->lastConnectedAt.has_value());
    EXPECT_EQ(tether::utils::formatIso8601(*record->lastConnectedAt), "2024-05-01T10:00:00.000Z");
    EXPECT_EQ(record->lastError, std::optional<std::string>("connection reset"));

    store.apply(event("nvr", ConnectionState::Connected));
    EXPECT_FALSE(store.get("nvr")->lastError.has_value());
}

TEST_F(StatusStoreTest, SaveAndLoadRoundTrip) {
    {
        StatusStore store(path);
        store.apply(event("nvr", ConnectionState::Connected));
        store.apply(event("mqtt", ConnectionState::Error, std::string("bad credentials")));
        ASSERT_TRUE(store.save().has_value());
    }

    StatusStore reloaded(path);
    ASSERT_TRUE(reloaded.load().has_value());
    auto all = reloaded.all();
    ASSERT_EQ(all.size(), 2u);
    EXPECT_TRUE(all["nvr"].isConnected);
    EXPECT_EQ(all["mqtt"].state, ConnectionState::Error);
    EXPECT_EQ(all["mqtt"].lastError, std::optional<std::string>("bad credentials"));
    EXPECT_FALSE(all["mqtt"].lastConnectedAt.has_value());

    std::ifstream file(path);
    auto j = nlohmann::json::parse(file);
    EXPECT_EQ(j["nvr"]["status"], "connected");
    EXPECT_EQ(j["nvr"]["last_connected_at"], "2024-05-01T10:00:00.000Z");
    EXPECT_TRUE(j["mqtt"]["last_connected_at"].is_null());
}

TEST_F(StatusStoreTest, CorruptFileIsReported) {
    {
        std::ofstream file(path);
        file << "{not json";
    }
    StatusStore store(path);
    auto loaded = store.load();
    ASSERT_TRUE(loaded.has_error());
    EXPECT_NE(loaded.error().find(path), std::string::npos);
}

TEST_F(StatusStoreTest, AttachedStoreFollowsBroadcasts) {
    auto broadcaster = std::make_shared<StatusBroadcaster>();
    StatusStore store(path);
    store.attach(broadcaster);

    broadcaster->publish(event("zwave", ConnectionState::Connecting));
    broadcaster->publish(event("zwave", ConnectionState::Connected));
    EXPECT_TRUE(store.get("zwave")->isConnected);

    StatusStore reader(path);
    ASSERT_TRUE(reader.load().has_value());
    EXPECT_EQ(reader.get("zwave")->state, ConnectionState::Connected);

    store.detach();
    broadcaster->publish(event("zwave", ConnectionState::Disconnected));
    EXPECT_EQ(store.get("zwave")->state, ConnectionState::Connected);
    EXPECT_EQ(broadcaster->subscriberCount(), 0u);
}

TEST_F(StatusStoreTest, EraseRemovesRecord) {
    StatusStore store(path);
    store.apply(event("gone", ConnectionState::Connected));
    EXPECT_TRUE(store.erase("gone"));
    EXPECT_FALSE(store.erase("gone"));
    EXPECT_FALSE(store.get("gone").has_value());
}

TEST_F(StatusStoreTest, ConcurrentSavesLeaveAValidFile) {
    StatusStore store(path);
    for (int i = 0; i < 200; ++i) {
        store.apply(event("conn-" + std::to_string(i), ConnectionState::Reconnecting, std::string("refused")));
    }

    std::atomic<int> failures{0};
    std::vector<std::thread> writers;
    for (int t = 0; t < 3; ++t) {
        writers.emplace_back([&store, &failures]() {
            for (int i = 0; i < 200; ++i) {
                if (store.save().has_error()) {
                    ++failures;
                }
            }
        });
    }
    for (auto& writer : writers) {
        writer.join();
    }
    EXPECT_EQ(failures.load(), 0);

    StatusStore reader(path);
    ASSERT_TRUE(reader.load().has_value());
    EXPECT_EQ(reader.all().size(), 200u);
    EXPECT_EQ(reader.get("conn-199")->lastError, std::optional<std::string>("refused"));
}
