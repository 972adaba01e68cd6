#include <gtest/gtest.h>
#include "tether/utils/time_format.hpp"

using namespace tether::utils;
using namespace std::chrono;

TEST(TimeFormatTest, FormatsUtcWithMilliseconds) {
    system_clock::time_point epoch{};
    EXPECT_EQ(formatIso8601(epoch), "1970-01-01T00:00:00.000Z");
    EXPECT_EQ(formatIso8601(epoch + hours(24) + milliseconds(7)), "1970-01-02T00:00:00.007Z");
}

TEST(TimeFormatTest, ParsesWhatItFormats) {
    auto parsed = parseIso8601("2024-02-29T23:59:58.120Z");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(formatIso8601(*parsed), "2024-02-29T23:59:58.120Z");

    auto now = time_point_cast<milliseconds>(system_clock::now());
    auto back = parseIso8601(formatIso8601(now));
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(time_point_cast<milliseconds>(*back), now);
}

TEST(TimeFormatTest, AcceptsMissingFraction) {
    auto parsed = parseIso8601("2023-11-05T08:00:00Z");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(formatIso8601(*parsed), "2023-11-05T08:00:00.000Z");
}

TEST(TimeFormatTest, RejectsGarbage) {
    EXPECT_FALSE(parseIso8601("").has_value());
    EXPECT_FALSE(parseIso8601("yesterday").has_value());
    EXPECT_FALSE(parseIso8601("2024-13-01T00:00:00Z").has_value());
    EXPECT_FALSE(parseIso8601("2024-01-01T00:00:00Z trailing").has_value());
}
