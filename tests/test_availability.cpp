#include <gtest/gtest.h>

#include "availability.hpp"
#include "fakes.hpp"

namespace {
const LocalDate kWednesday = Day(2026, 10, 14);
const LocalDate kSaturday = Day(2026, 10, 17);
} // namespace

class AvailabilityModelTest : public ::testing::Test {
  protected:
    SchedulerConfig config;
    LifeBlocks blocks;
    DurationEstimator estimator{config, nullptr};
    std::unordered_map<std::string, int> resolved;
};

TEST_F(AvailabilityModelTest, TodaysTasksOccupyTheirBlocks) {
    Task a = MakeTask("a", "Write notes", "20m");
    a.due = TimedDue(At(kWednesday, 17, 0));
    Task standup = MakeTask("s", "Standup", "30m");
    standup.due = TimedDue(At(kWednesday, 16, 0), true, "every weekday");

    AvailabilityModel model(config, blocks, kWednesday);
    model.Build({a, standup}, estimator, resolved);

    EXPECT_EQ(model.Occupied().size(), 10u);
    EXPECT_EQ(model.Recurring().size(), 6u);
    EXPECT_TRUE(model.IsOccupied(At(kWednesday, 17, 15)));
    EXPECT_FALSE(model.IsOccupied(At(kWednesday, 17, 20)));
    EXPECT_TRUE(model.IsRecurring(At(kWednesday, 16, 25)));
    EXPECT_FALSE(model.IsRecurring(At(kWednesday, 17, 0)));
}

TEST_F(AvailabilityModelTest, UnmarkedTaskWithoutAiOccupiesTheFallback) {
    Task t = MakeTask("t", "Gardening");
    t.due = TimedDue(At(kWednesday, 18, 0));

    AvailabilityModel model(config, blocks, kWednesday);
    model.Build({t}, estimator, resolved);

    EXPECT_EQ(model.Occupied().size(), 2u);
    EXPECT_EQ(resolved.at("t"), 10);
}

TEST_F(AvailabilityModelTest, ResolvedMinutesAreReusedAcrossRebuilds) {
    FakeAi ai;
    ai.minutes = 40;
    DurationEstimator with_ai(config, &ai);
    Task t = MakeTask("t", "Gardening");
    t.due = TimedDue(At(kWednesday, 18, 0));

    AvailabilityModel first(config, blocks, kWednesday);
    first.Build({t}, with_ai, resolved);
    AvailabilityModel second(config, blocks, kWednesday);
    second.Build({t}, with_ai, resolved);

    EXPECT_EQ(second.Occupied().size(), 8u);
    EXPECT_EQ(ai.minute_calls, 1);
}

TEST_F(AvailabilityModelTest, IgnoresTasksThatHoldNoTimeToday) {
    Task done = MakeTask("done", "Done", "30m");
    done.due = TimedDue(At(kWednesday, 17, 0));
    done.completed = true;
    Task pinned = MakeTask("pinned", "Pinned", "30m");
    pinned.due = TimedDue(At(kWednesday, 17, 0));
    pinned.labels = {"#dontchangetime"};
    Task tomorrow = MakeTask("tomorrow", "Tomorrow", "30m");
    tomorrow.due = TimedDue(At(kWednesday + std::chrono::days(1), 17, 0));
    Task date_only = MakeTask("date", "Someday", "30m");
    date_only.due = DateDue(kWednesday);

    AvailabilityModel model(config, blocks, kWednesday);
    model.Build({done, pinned, tomorrow, date_only}, estimator, resolved);
    EXPECT_TRUE(model.Occupied().empty());
}

TEST_F(AvailabilityModelTest, LifeBlocksAreOccupiedAndOutsideTheEnvelope) {
    blocks.AddWeekly({{"wed"}, std::chrono::hours(18), std::chrono::hours(19), "Dinner"});
    AvailabilityModel model(config, blocks, kWednesday);
    model.Build({}, estimator, resolved);

    EXPECT_EQ(model.Occupied().size(), 12u);
    EXPECT_FALSE(model.InEnvelope(At(kWednesday, 18, 30)));
    EXPECT_TRUE(model.InEnvelope(At(kWednesday, 19, 0)));
    // next Wednesday is checked against its own blocks
    EXPECT_FALSE(model.InEnvelope(At(kWednesday + std::chrono::days(7), 18, 0)));
}

TEST_F(AvailabilityModelTest, EnvelopeFollowsStartHourAndSleepTime) {
    AvailabilityModel model(config, blocks, kWednesday);
    EXPECT_FALSE(model.InEnvelope(At(kWednesday, 14, 55)));
    EXPECT_TRUE(model.InEnvelope(At(kWednesday, 15, 0)));
    EXPECT_TRUE(model.InEnvelope(At(kWednesday, 20, 40)));
    EXPECT_FALSE(model.InEnvelope(At(kWednesday, 20, 45)));
    EXPECT_TRUE(model.InEnvelope(At(kSaturday, 9, 0)));
    EXPECT_FALSE(model.InEnvelope(At(kSaturday, 8, 55)));
}

TEST_F(AvailabilityModelTest, ReleaseFreesOnlyWhatNobodyElseHolds) {
    blocks.AddOneOff({kWednesday, std::chrono::hours(17), std::chrono::minutes(17 * 60 + 5), ""});
    AvailabilityModel model(config, blocks, kWednesday);
    model.Build({}, estimator, resolved);

    model.Occupy("t", At(kWednesday, 17, 0), 3, false);
    EXPECT_FALSE(model.IsLegal(At(kWednesday, 17, 10)));

    model.Release("t");
    EXPECT_TRUE(model.IsOccupied(At(kWednesday, 17, 0)));
    EXPECT_FALSE(model.IsOccupied(At(kWednesday, 17, 5)));
    EXPECT_TRUE(model.IsLegal(At(kWednesday, 17, 10)));
}

TEST_F(AvailabilityModelTest, RangeAvailabilityChecksEveryBlock) {
    Task standup = MakeTask("s", "Standup", "5m");
    standup.due = TimedDue(At(kWednesday, 16, 20), true, "every day");
    AvailabilityModel model(config, blocks, kWednesday);
    model.Build({standup}, estimator, resolved);

    EXPECT_TRUE(model.IsRangeAvailable(At(kWednesday, 16, 0), 4));
    EXPECT_FALSE(model.IsRangeAvailable(At(kWednesday, 16, 0), 5));
    EXPECT_FALSE(model.IsRangeAvailable(At(kWednesday, 20, 30), 4));
}
