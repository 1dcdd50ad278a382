#include <gtest/gtest.h>
#include "core/time_format.hpp"

using namespace draftlink;
using namespace std::chrono;

namespace {

// 2024-05-01T18:22:03Z
WallTime sample_time() {
    return system_clock::from_time_t(1714587723);
}

}  // namespace

TEST(TimeFormatTest, Rfc3339HasSecondPrecision) {
    auto t = sample_time() + milliseconds(250);
    EXPECT_EQ(timefmt::rfc3339(t), "2024-05-01T18:22:03Z");
}

TEST(TimeFormatTest, Rfc3339NanoTrimsTrailingZeros) {
    auto t = sample_time() + microseconds(41200);
    EXPECT_EQ(timefmt::rfc3339_nano(t), "2024-05-01T18:22:03.0412Z");
}

TEST(TimeFormatTest, Rfc3339NanoOmitsZeroFraction) {
    EXPECT_EQ(timefmt::rfc3339_nano(sample_time()), "2024-05-01T18:22:03Z");
}

TEST(TimeFormatTest, ParseUtcWithFraction) {
    auto parsed = timefmt::parse_rfc3339("2024-05-01T18:22:03.0412Z");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, sample_time() + microseconds(41200));
}

TEST(TimeFormatTest, ParseAppliesOffset) {
    auto parsed = timefmt::parse_rfc3339("2024-05-01T20:22:03+02:00");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, sample_time());
}

TEST(TimeFormatTest, ParseRoundTripsNanoOutput) {
    auto t = sample_time() + microseconds(123456);
    auto parsed = timefmt::parse_rfc3339(timefmt::rfc3339_nano(t));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, t);
}

TEST(TimeFormatTest, ParseRejectsMalformedText) {
    EXPECT_FALSE(timefmt::parse_rfc3339("").has_value());
    EXPECT_FALSE(timefmt::parse_rfc3339("not a time").has_value());
    EXPECT_FALSE(timefmt::parse_rfc3339("2024-05-01 18:22:03Z").has_value());
    EXPECT_FALSE(timefmt::parse_rfc3339("2024-05-01T18:22:03").has_value());
    EXPECT_FALSE(timefmt::parse_rfc3339("2024-05-01T18:22:03.Z").has_value());
    EXPECT_FALSE(timefmt::parse_rfc3339("2024-05-01T18:22:03Zjunk").has_value());
}

TEST(TimeFormatTest, FileStampShape) {
    auto stamp = timefmt::file_stamp(sample_time());
    ASSERT_EQ(stamp.size(), 15u);
    EXPECT_EQ(stamp[8], '_');
    EXPECT_EQ(stamp.substr(0, 4), "2024");
}

TEST(TimeFormatTest, DurationFormatting) {
    EXPECT_EQ(timefmt::duration(seconds(0)), "0s");
    EXPECT_EQ(timefmt::duration(seconds(42)), "42s");
    EXPECT_EQ(timefmt::duration(seconds(125)), "2m5s");
    EXPECT_EQ(timefmt::duration(seconds(3603)), "1h0m3s");
    EXPECT_EQ(timefmt::duration(seconds(-5)), "0s");
}
