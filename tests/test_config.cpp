#include <gtest/gtest.h>

#include "config.hpp"
#include "fakes.hpp"

using std::chrono::hours;
using std::chrono::minutes;

TEST(ConfigTest, EmptyObjectKeepsDefaults) {
    const Config config = ConfigFromJson("{}");
    EXPECT_EQ(config.scheduler.interval_minutes, 5);
    EXPECT_EQ(config.scheduler.sleep_time, hours(20) + minutes(45));
    EXPECT_EQ(config.scheduler.weekday_start_hour, 15);
    EXPECT_EQ(config.scheduler.weekend_start_hour, 9);
    EXPECT_EQ(config.scheduler.lead_minutes, 60);
    EXPECT_EQ(config.scheduler.skip_label, "#dontchangetime");
    EXPECT_EQ(config.daemon.pass_interval_minutes, 5);
    EXPECT_EQ(config.daemon.port, 7717u);
}

TEST(ConfigTest, KeysOverrideDefaults) {
    const Config config = ConfigFromJson(R"({
        "interval_minutes": 10,
        "sleep_time": "22:30",
        "weekday_start_hour": 17,
        "lead_minutes": 30,
        "auto_priority": false,
        "carry_overdue_date_only": false,
        "skip_label": "#pinned",
        "pass_interval_minutes": 15,
        "port": 8080
    })");

    EXPECT_EQ(config.scheduler.interval_minutes, 10);
    EXPECT_EQ(config.scheduler.sleep_time, hours(22) + minutes(30));
    EXPECT_EQ(config.scheduler.weekday_start_hour, 17);
    EXPECT_EQ(config.scheduler.lead_minutes, 30);
    EXPECT_FALSE(config.scheduler.auto_priority);
    EXPECT_FALSE(config.scheduler.carry_overdue_date_only);
    EXPECT_EQ(config.scheduler.skip_label, "#pinned");
    EXPECT_EQ(config.daemon.pass_interval_minutes, 15);
    EXPECT_EQ(config.daemon.port, 8080u);
}

TEST(ConfigTest, IntervalThatDoesNotDivideAnHourFallsBack) {
    EXPECT_EQ(ConfigFromJson(R"({"interval_minutes": 7})").scheduler.interval_minutes, 5);
    EXPECT_EQ(ConfigFromJson(R"({"interval_minutes": 0})").scheduler.interval_minutes, 5);
    EXPECT_EQ(ConfigFromJson(R"({"interval_minutes": 15})").scheduler.interval_minutes, 15);
}

TEST(ConfigTest, BadValuesKeepDefaults) {
    EXPECT_EQ(ConfigFromJson(R"({"sleep_time": "late"})").scheduler.sleep_time,
              hours(20) + minutes(45));
    EXPECT_EQ(ConfigFromJson("not json").scheduler.interval_minutes, 5);
    EXPECT_EQ(ConfigFromJson("[1, 2]").daemon.port, 7717u);
    EXPECT_EQ(ConfigFromJson(R"({"pass_interval_minutes": 0})").daemon.pass_interval_minutes, 1);
}

TEST(TimeGridTest, RoundUpDropsSecondsThenRounds) {
    const LocalDate day = Day(2026, 10, 14);
    EXPECT_EQ(RoundUpToInterval(AtSeconds(day, 15, 0, 0), 5), At(day, 15, 0));
    EXPECT_EQ(RoundUpToInterval(AtSeconds(day, 15, 0, 59), 5), At(day, 15, 0));
    EXPECT_EQ(RoundUpToInterval(AtSeconds(day, 15, 1, 0), 5), At(day, 15, 5));
    EXPECT_EQ(RoundUpToInterval(AtSeconds(day, 15, 58, 0), 5), At(day, 16, 0));
    EXPECT_EQ(RoundUpToInterval(AtSeconds(day, 23, 59, 0), 15), At(day + std::chrono::days(1), 0, 0));
}

TEST(TimeGridTest, FloorToInterval) {
    const LocalDate day = Day(2026, 10, 14);
    EXPECT_EQ(FloorToInterval(At(day, 9, 7), 5), At(day, 9, 5));
    EXPECT_EQ(FloorToInterval(At(day, 9, 10), 5), At(day, 9, 10));
}

TEST(TimeGridTest, ParseClock) {
    EXPECT_EQ(ParseClock("20:45"), hours(20) + minutes(45));
    EXPECT_EQ(ParseClock(" 9:05 "), hours(9) + minutes(5));
    EXPECT_FALSE(ParseClock("24:00").has_value());
    EXPECT_FALSE(ParseClock("9:61").has_value());
    EXPECT_FALSE(ParseClock("20:45pm").has_value());
    EXPECT_FALSE(ParseClock("noon").has_value());
}

TEST(TimeGridTest, DatesAndWeekdays) {
    EXPECT_EQ(ParseDate("2026-10-14"), Day(2026, 10, 14));
    EXPECT_FALSE(ParseDate("2026-02-30").has_value());
    EXPECT_EQ(FormatDate(Day(2026, 1, 5)), "2026-01-05");
    EXPECT_EQ(WeekdaySlug(Day(2026, 10, 14)), "wed");
    EXPECT_FALSE(IsWeekend(Day(2026, 10, 16)));
    EXPECT_TRUE(IsWeekend(Day(2026, 10, 17)));
    EXPECT_TRUE(IsWeekend(Day(2026, 10, 18)));
}

TEST(TimeGridTest, ParseDatetimeWithoutZoneIsWallClock) {
    EXPECT_EQ(ParseDatetime("2026-10-14T15:05:00"), At(Day(2026, 10, 14), 15, 5));
    EXPECT_EQ(ParseDatetime("2026-10-14T15:05"), At(Day(2026, 10, 14), 15, 5));
    EXPECT_FALSE(ParseDatetime("2026-10-14").has_value());
    EXPECT_EQ(FormatDatetime(At(Day(2026, 10, 14), 9, 0)), "2026-10-14T09:00:00");
}
