/**
 * @file test_types.cpp
 * @brief Unit tests for core types and time helpers.
 */

#include "core/time_format.hpp"
#include "core/types.hpp"

#include <gtest/gtest.h>
#include <limits>

using namespace slot_reserver;

TEST(TimeTest, FloorToMinuteTruncates) {
    const EpochMillis t = make_timestamp(2024, 5, 15, 10, 0) + 59'999;
    EXPECT_EQ(to_epoch_millis(floor_to_minute(t)), make_timestamp(2024, 5, 15, 10, 0));
}

TEST(TimeTest, CeilToMinuteRoundsUp) {
    const EpochMillis exact = make_timestamp(2024, 5, 15, 10, 0);
    EXPECT_EQ(to_epoch_millis(ceil_to_minute(exact)), exact);
    EXPECT_EQ(to_epoch_millis(ceil_to_minute(exact + 1)), exact + kMillisPerMinute);
}

TEST(TimeTest, FloorBeforeEpoch) {
    // -1 ms is 1969-12-31T23:59:59.999
    EXPECT_EQ(to_epoch_millis(floor_to_minute(-1)), -kMillisPerMinute);
    EXPECT_EQ(to_epoch_millis(ceil_to_minute(-1)), 0);
}

TEST(TimeTest, SaturatingAddMillis) {
    EXPECT_EQ(saturating_add(EpochMillis{1000}, Millis{500}), 1500);
    EXPECT_EQ(saturating_add(kNever - 10, Millis{100}), kNever);
    EXPECT_EQ(saturating_add(kNever, Millis{1}), kNever);
    EXPECT_EQ(saturating_add(EpochMillis{1000}, Millis{0}), 1000);
}

TEST(SlotCountTest, SaturatingAdd) {
    constexpr SlotCount max = std::numeric_limits<SlotCount>::max();
    EXPECT_EQ(saturating_add(SlotCount{2}, SlotCount{3}), 5u);
    EXPECT_EQ(saturating_add(max - 1, SlotCount{5}), max);
    EXPECT_EQ(saturating_add(max, max), max);
}

TEST(TimeFormatTest, FormatsUtc) {
    EXPECT_EQ(format_timestamp(0), "1970-01-01T00:00:00.000Z");
    EXPECT_EQ(format_timestamp(1715767200000), "2024-05-15T10:00:00.000Z");
    EXPECT_EQ(format_timestamp(kNever), "never");
}

TEST(TimeFormatTest, ParsesIsoAndEpoch) {
    auto iso = parse_timestamp("2024-05-15T10:00");
    ASSERT_TRUE(iso.has_value()) << iso.error().message;
    EXPECT_EQ(*iso, 1715767200000);

    auto with_seconds = parse_timestamp("2024-05-15T10:00:30Z");
    ASSERT_TRUE(with_seconds.has_value());
    EXPECT_EQ(*with_seconds, 1715767200000 + 30'000);

    auto epoch = parse_timestamp("1715767200000");
    ASSERT_TRUE(epoch.has_value());
    EXPECT_EQ(*epoch, 1715767200000);
}

TEST(TimeFormatTest, RejectsGarbage) {
    EXPECT_FALSE(parse_timestamp("").has_value());
    EXPECT_FALSE(parse_timestamp("yesterday").has_value());
    EXPECT_FALSE(parse_timestamp("2024-13-01T00:00").has_value());
    EXPECT_FALSE(parse_timestamp("2024-02-30T00:00").has_value());
}
