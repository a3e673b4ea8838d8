#include "core/SimTime.h"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <stdexcept>

using namespace CampusSim;

TEST(SimTimeTest, ParsesDateCaseInsensitively)
{
    auto date = SimDate::parse("week 3, SATURDAY");
    ASSERT_TRUE(date.has_value());
    EXPECT_EQ(date->week, 3);
    EXPECT_EQ(date->day, Weekday::Saturday);
    EXPECT_EQ(date->toString(), "Week 3, Saturday");
}

TEST(SimTimeTest, DateCommasAreOptional)
{
    EXPECT_EQ(SimDate::parse("Week 1 Monday"), SimDate::parse("Week 1, Monday"));
}

TEST(SimTimeTest, RejectsMalformedDates)
{
    EXPECT_FALSE(SimDate::parse("").has_value());
    EXPECT_FALSE(SimDate::parse("Week 0, Monday").has_value());
    EXPECT_FALSE(SimDate::parse("Week one, Monday").has_value());
    EXPECT_FALSE(SimDate::parse("Week 1, Funday").has_value());
    EXPECT_FALSE(SimDate::parse("Week 1, Monday, 10:00").has_value());
}

TEST(SimTimeTest, DatesOrderByWeekThenDay)
{
    const SimDate mondayWeek2{ .week = 2, .day = Weekday::Monday };
    const SimDate sundayWeek1{ .week = 1, .day = Weekday::Sunday };
    EXPECT_LT(sundayWeek1, mondayWeek2);
}

TEST(SimTimeTest, TimeRangeParsesWithSpacesAndEnDash)
{
    const auto expected = TimeRange{ .startMinute = 14 * 60, .endMinute = 16 * 60 };
    EXPECT_EQ(TimeRange::parse("14:00-16:00"), expected);
    EXPECT_EQ(TimeRange::parse("14:00 - 16:00"), expected);
    EXPECT_EQ(TimeRange::parse("14:00\xE2\x80\x93" "16:00"), expected);
}

TEST(SimTimeTest, TimeRangeRequiresStartBeforeEnd)
{
    EXPECT_FALSE(TimeRange::parse("16:00-14:00").has_value());
    EXPECT_FALSE(TimeRange::parse("10:00-10:00").has_value());
    EXPECT_FALSE(TimeRange::parse("25:00-26:00").has_value());
    EXPECT_FALSE(TimeRange::parse("10:60-11:00").has_value());
}

TEST(SimTimeTest, TimeRangesAreHalfOpen)
{
    const auto morning = TimeRange::parse("09:00-10:00").value();
    const auto next = TimeRange::parse("10:00-11:00").value();
    const auto inside = TimeRange::parse("09:30-09:45").value();

    EXPECT_FALSE(morning.overlaps(next));
    EXPECT_TRUE(morning.overlaps(inside));
    EXPECT_TRUE(morning.contains(inside));
    EXPECT_FALSE(inside.contains(morning));
    EXPECT_EQ(morning.durationMinutes(), 60);
}

TEST(SimTimeTest, EventTimeRoundTripsThroughText)
{
    auto time = EventTime::parse("Week 1, Saturday, 14:00-16:00");
    ASSERT_TRUE(time.has_value());
    EXPECT_EQ(time->date.day, Weekday::Saturday);
    EXPECT_EQ(time->range.startMinute, 14 * 60);
    EXPECT_EQ(time->toString(), "Week 1, Saturday, 14:00-16:00");
}

TEST(SimTimeTest, EventTimesOnDifferentDatesNeverOverlap)
{
    const auto monday = EventTime::parse("Week 1, Monday, 10:00-12:00").value();
    const auto tuesday = EventTime::parse("Week 1, Tuesday, 10:00-12:00").value();
    const auto mondayLater = EventTime::parse("Week 1, Monday, 11:00-13:00").value();

    EXPECT_FALSE(monday.overlaps(tuesday));
    EXPECT_TRUE(monday.overlaps(mondayLater));
}

TEST(SimTimeTest, SimTimeParsesClockAndRejectsMidnightEnd)
{
    auto time = SimTime::parse("Week 2, Friday, 08:30");
    ASSERT_TRUE(time.has_value());
    EXPECT_EQ(time->minuteOfDay, 8 * 60 + 30);
    EXPECT_EQ(time->toString(), "Week 2, Friday, 08:30");

    EXPECT_FALSE(SimTime::parse("Week 2, Friday, 24:00").has_value());
    EXPECT_FALSE(SimTime::parse("Week 2, Friday").has_value());
}

TEST(SimTimeTest, JsonUsesTextualForms)
{
    const auto time = EventTime::parse("Week 1, Monday, 09:00-10:00").value();
    const nlohmann::json j = time;
    EXPECT_EQ(j.get<std::string>(), "Week 1, Monday, 09:00-10:00");
    EXPECT_EQ(j.get<EventTime>(), time);
}

TEST(SimTimeTest, JsonRejectsMalformedText)
{
    const nlohmann::json bad = "Week 1, Monday, noon";
    EXPECT_THROW(bad.get<EventTime>(), std::invalid_argument);

    const nlohmann::json notString = 42;
    EXPECT_THROW(notString.get<SimDate>(), std::invalid_argument);
}
