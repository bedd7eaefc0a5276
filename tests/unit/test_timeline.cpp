/**
 * @file test_timeline.cpp
 * @brief Unit tests for build_timeline and the ReservationPolicyLike concept.
 * @author Dimitris Kafetzis
 */

#include "core/time_format.hpp"
#include "host/timeline.hpp"
#include "reservation/policy.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace slot_reserver;

namespace {

constexpr int64_t kMinute = 60'000;
constexpr int64_t kHour = 60 * kMinute;

EpochMillis at(int y, unsigned mo, unsigned d, int h = 0, int mi = 0) {
    return make_timestamp(y, mo, d, h, mi);
}

/// Reserves one slot in odd hours and always reports "may change now".
struct AlternatingPolicy {
    Result<SlotCount, InvalidPatternError> size_of_reservation(const INode& /*node*/,
                                                               EpochMillis t) const {
        return static_cast<SlotCount>((t / kHour) % 2);
    }
    Result<EpochMillis, InvalidPatternError> time_of_next_change(const INode& /*node*/,
                                                                 EpochMillis t) const {
        return t;
    }
    std::string_view name() const { return "alternating"; }
};

CronReservationPolicy cron_policy(const std::string& text) {
    auto policy = CronReservationPolicy::from_format(text);
    EXPECT_TRUE(policy.has_value());
    return std::move(*policy);
}

}  // namespace

static_assert(ReservationPolicyLike<CronReservationPolicy>);
static_assert(ReservationPolicyLike<AlternatingPolicy>);
static_assert(!ReservationPolicyLike<int>);

TEST(TimelineTest, WeekdayWindows) {
    StaticNode node(4);
    auto policy = cron_policy("2:0 9 * * 1-5:480");

    auto timeline = build_timeline(policy, node, at(2024, 5, 15), at(2024, 5, 17));
    ASSERT_TRUE(timeline.has_value()) << timeline.error().message;

    const std::vector<Transition> expected{
        {at(2024, 5, 15), 0},
        {at(2024, 5, 15, 9), 2},
        {at(2024, 5, 15, 17), 0},
        {at(2024, 5, 16, 9), 2},
        {at(2024, 5, 16, 17), 0},
    };
    EXPECT_EQ(*timeline, expected);
}

TEST(TimelineTest, WeekendHasNoTransitions) {
    StaticNode node(4);
    auto policy = cron_policy("2:0 9 * * 1-5:480");
    auto timeline = build_timeline(policy, node, at(2024, 5, 18), at(2024, 5, 19, 23, 59));
    ASSERT_TRUE(timeline.has_value());
    ASSERT_EQ(timeline->size(), 1u);
    EXPECT_EQ(timeline->front().reserved, 0u);
}

TEST(TimelineTest, AdjacentWindowsDoNotFlap) {
    StaticNode node(4);
    auto policy = cron_policy("1:0 * * * *:60");
    auto timeline = build_timeline(policy, node, at(2024, 5, 15, 0, 30), at(2024, 5, 15, 5));
    ASSERT_TRUE(timeline.has_value());
    ASSERT_EQ(timeline->size(), 1u);
    EXPECT_EQ(timeline->front().reserved, 1u);
}

TEST(TimelineTest, EmptyScheduleStopsImmediately) {
    StaticNode node(4);
    auto policy = cron_policy("# nothing\n");
    auto timeline = build_timeline(policy, node, 0, kNever);
    ASSERT_TRUE(timeline.has_value());
    EXPECT_EQ(*timeline, (std::vector<Transition>{{0, 0}}));
}

TEST(TimelineTest, ChangeAtQueryInstantStillAdvances) {
    StaticNode node(1);
    AlternatingPolicy policy;
    auto timeline = build_timeline(policy, node, 0, 3 * kHour);
    ASSERT_TRUE(timeline.has_value());

    const std::vector<Transition> expected{
        {0, 0}, {kHour, 1}, {2 * kHour, 0}, {3 * kHour, 1},
    };
    EXPECT_EQ(*timeline, expected);
}

TEST(TimelineTest, QueryErrorPropagates) {
    StaticNode node(4);
    auto policy = cron_policy("1:0 0 30 2 *:60");
    auto timeline = build_timeline(policy, node, at(2024, 5, 15), at(2024, 5, 16));
    ASSERT_FALSE(timeline.has_value());
    EXPECT_NE(timeline.error().message.find("no occurrence"), std::string::npos);
}
