#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

#include "tether/core/discovery_cache.hpp"

using namespace tether::core;
using std::chrono::seconds;

using Cameras = std::vector<std::string>;

class DiscoveryCacheTest : public ::testing::Test {
protected:
    DiscoveryCache<Cameras>::RefreshFn listing(Cameras cameras) {
        return [this, cameras]() {
            ++calls;
            return cameras;
        };
    }

    DiscoveryCache<Cameras>::RefreshFn failing(const std::string& reason) {
        return [this, reason]() -> Cameras {
            ++calls;
            throw std::runtime_error(reason);
        };
    }

    std::chrono::system_clock::time_point now{std::chrono::system_clock::now()};
    bool live{true};
    int calls{0};
    DiscoveryCache<Cameras> cache{[this](const std::string&) { return live; }, [this]() { return now; }};
};

TEST_F(DiscoveryCacheTest, ServesWithinTtlAndRefreshesAfter) {
    auto first = cache.getOrRefresh("nvr", "cameras", listing({"front", "back"}), seconds(60));
    ASSERT_TRUE(first.hasData());
    EXPECT_FALSE(first.cached);
    EXPECT_EQ(first.source, DiscoverySource::Fresh);
    EXPECT_EQ(calls, 1);

    now += seconds(30);
    auto second = cache.getOrRefresh("nvr", "cameras", listing({"other"}), seconds(60));
    EXPECT_TRUE(second.cached);
    EXPECT_EQ(second.source, DiscoverySource::Cache);
    EXPECT_EQ(*second.payload, (Cameras{"front", "back"}));
    EXPECT_EQ(calls, 1);

    now += seconds(31);
    auto third = cache.getOrRefresh("nvr", "cameras", listing({"front", "back", "garage"}), seconds(60));
    EXPECT_FALSE(third.cached);
    EXPECT_EQ(third.payload->size(), 3u);
    EXPECT_EQ(calls, 2);

    auto stats = cache.stats();
    EXPECT_EQ(stats.hits, 1u);
    EXPECT_EQ(stats.refreshes, 2u);
}

TEST_F(DiscoveryCacheTest, FailedRefreshServesLastKnownEntry) {
    cache.getOrRefresh("nvr", "cameras", listing({"front"}), seconds(60));
    now += seconds(61);

    auto result = cache.getOrRefresh("nvr", "cameras", failing("HTTP 503"), seconds(60));
    ASSERT_TRUE(result.hasData());
    EXPECT_EQ(*result.payload, Cameras{"front"});
    EXPECT_TRUE(result.cached);
    EXPECT_EQ(result.source, DiscoverySource::Stale);
    ASSERT_TRUE(result.warning.has_value());
    EXPECT_EQ(*result.warning, "HTTP 503 - returning cached results");
    EXPECT_EQ(cache.stats().failures, 1u);
}

TEST_F(DiscoveryCacheTest, FailedRefreshWithoutEntryReturnsNothing) {
    auto result = cache.getOrRefresh("nvr", "cameras", failing("HTTP 503"), seconds(60));
    EXPECT_FALSE(result.hasData());
    EXPECT_EQ(result.source, DiscoverySource::None);
    EXPECT_EQ(*result.warning, "HTTP 503 - no cached results available");
    EXPECT_EQ(cache.size(), 0u);
}

TEST_F(DiscoveryCacheTest, DownConnectionSkipsRefresh) {
    cache.getOrRefresh("nvr", "cameras", listing({"front"}), seconds(60));
    now += seconds(120);
    live = false;

    auto result = cache.getOrRefresh("nvr", "cameras", listing({"never"}), seconds(60));
    EXPECT_EQ(calls, 1);
    ASSERT_TRUE(result.hasData());
    EXPECT_EQ(*result.payload, Cameras{"front"});
    EXPECT_EQ(*result.warning, "Connection nvr is down - returning cached results");

    auto missing = cache.getOrRefresh("nvr", "doorbells", listing({"never"}), seconds(60));
    EXPECT_EQ(calls, 1);
    EXPECT_FALSE(missing.hasData());
    EXPECT_EQ(*missing.warning, "Connection nvr is down - no cached results available");
    EXPECT_EQ(cache.stats().skippedDown, 2u);
}

TEST_F(DiscoveryCacheTest, ForceRefreshBypassesTtl) {
    cache.getOrRefresh("nvr", "cameras", listing({"front"}), seconds(60));
    auto forced = cache.getOrRefresh("nvr", "cameras", listing({"front", "side"}), seconds(60), true);
    EXPECT_EQ(forced.source, DiscoverySource::Fresh);
    EXPECT_EQ(forced.payload->size(), 2u);
    EXPECT_EQ(calls, 2);
}

TEST_F(DiscoveryCacheTest, EntriesAreKeyedPerConnection) {
    cache.getOrRefresh("nvr-a", "cameras", listing({"a"}), seconds(60));
    cache.getOrRefresh("nvr-b", "cameras", listing({"b"}), seconds(60));
    EXPECT_EQ(cache.size(), 2u);
    ASSERT_TRUE(cache.peek("nvr-b", "cameras").has_value());
    EXPECT_EQ(cache.peek("nvr-b", "cameras")->payload, Cameras{"b"});

    cache.invalidate("nvr-a", "cameras");
    EXPECT_FALSE(cache.peek("nvr-a", "cameras").has_value());
    cache.clear();
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_STREQ(toString(DiscoverySource::Stale), "stale");
}
