#include <gtest/gtest.h>
#include "tether/core/resource_debouncer.hpp"

using namespace tether::core;
using std::chrono::milliseconds;

class ResourceDebouncerTest : public ::testing::Test {
protected:
    ResourceDebouncer::Clock::time_point now{};
    ResourceDebouncer debouncer{milliseconds(5000), [this]() { return now; }};
};

TEST_F(ResourceDebouncerTest, FirstSignalIsAlwaysPublished) {
    EXPECT_TRUE(debouncer.admit("cam-1", true));
    EXPECT_TRUE(debouncer.admit("cam-2", true));
    EXPECT_EQ(debouncer.trackedResources(), 2u);
}

TEST_F(ResourceDebouncerTest, RepeatWithinWindowIsSuppressed) {
    EXPECT_TRUE(debouncer.admit("cam-1", false));
    now += milliseconds(1000);
    EXPECT_FALSE(debouncer.admit("cam-1", false));
    now += milliseconds(3999);
    EXPECT_FALSE(debouncer.admit("cam-1", false));
    EXPECT_EQ(debouncer.suppressedCount(), 2u);
}

TEST_F(ResourceDebouncerTest, RepeatAfterWindowIsPublished) {
    EXPECT_TRUE(debouncer.admit("cam-1", false));
    now += milliseconds(5000);
    EXPECT_TRUE(debouncer.admit("cam-1", false));
}

TEST_F(ResourceDebouncerTest, SuppressedSignalsDoNotExtendTheWindow) {
    EXPECT_TRUE(debouncer.admit("cam-1", true));
    now += milliseconds(4000);
    EXPECT_FALSE(debouncer.admit("cam-1", true));
    now += milliseconds(1000);
    EXPECT_TRUE(debouncer.admit("cam-1", true));
}

TEST_F(ResourceDebouncerTest, ChangedStateIsAlwaysPublished) {
    EXPECT_TRUE(debouncer.admit("cam-1", true));
    now += milliseconds(10);
    EXPECT_TRUE(debouncer.admit("cam-1", false));
    now += milliseconds(10);
    EXPECT_TRUE(debouncer.admit("cam-1", true));

    bool online = false;
    ASSERT_TRUE(debouncer.lastPublished("cam-1", online));
    EXPECT_TRUE(online);
    EXPECT_FALSE(debouncer.lastPublished("cam-9", online));
}

TEST_F(ResourceDebouncerTest, ResetForgetsHistory) {
    EXPECT_TRUE(debouncer.admit("cam-1", true));
    EXPECT_FALSE(debouncer.admit("cam-1", true));
    debouncer.reset();
    EXPECT_EQ(debouncer.trackedResources(), 0u);
    EXPECT_EQ(debouncer.suppressedCount(), 0u);
    EXPECT_TRUE(debouncer.admit("cam-1", true));
}
