#include "core/CalendarStore.h"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace CampusSim;

namespace {

EventTime at(const std::string& text)
{
    return EventTime::parse(text).value();
}

SimDate day(const std::string& text)
{
    return SimDate::parse(text).value();
}

TimeRange range(const std::string& text)
{
    return TimeRange::parse(text).value();
}

} // namespace

class CalendarStoreTest : public ::testing::Test {
protected:
    CalendarStore store_{ { range("09:00-10:00"), range("10:00-11:00"), range("14:00-15:00") } };
    SimTime now_ = SimTime::parse("Week 1, Monday, 08:00").value();
};

TEST_F(CalendarStoreTest, AddsEventsWithPerCalendarIds)
{
    auto first = store_.addEvent(
        "self", "Study Group", "Library", at("Week 1, Monday, 10:00-11:00"), std::nullopt, now_);
    auto second = store_.addEvent(
        "self", "Lunch", "Cafeteria", at("Week 1, Monday, 12:00-13:00"), std::nullopt, now_);
    auto club = store_.addEvent(
        "club_chess", "Practice", "Hall", at("Week 1, Monday, 10:00-11:00"), std::nullopt, now_);

    ASSERT_TRUE(first.isValue());
    ASSERT_TRUE(second.isValue());
    ASSERT_TRUE(club.isValue());
    EXPECT_EQ(first.value().id, EventId{ 1 });
    EXPECT_EQ(second.value().id, EventId{ 2 });
    EXPECT_EQ(club.value().id, EventId{ 1 });
}

TEST_F(CalendarStoreTest, OverlappingEventIsAConflictAndNotStored)
{
    ASSERT_TRUE(store_
                    .addEvent(
                        "self",
                        "Study Group",
                        "Library",
                        at("Week 1, Tuesday, 14:00-16:00"),
                        std::nullopt,
                        now_)
                    .isValue());

    auto clash = store_.addEvent(
        "self", "Club Meeting", "Hall", at("Week 1, Tuesday, 15:00-17:00"), std::nullopt, now_);
    ASSERT_TRUE(clash.isError());
    EXPECT_EQ(clash.errorValue().code, ErrorCode::Conflict);
    EXPECT_NE(clash.errorValue().message.find("Study Group"), std::string::npos);
    EXPECT_EQ(store_.eventsOf("self").size(), 1u);
}

TEST_F(CalendarStoreTest, BackToBackEventsDoNotOverlap)
{
    ASSERT_TRUE(
        store_.addEvent("self", "A", "X", at("Week 1, Monday, 09:00-10:00"), std::nullopt, now_)
            .isValue());
    EXPECT_TRUE(
        store_.addEvent("self", "B", "X", at("Week 1, Monday, 10:00-11:00"), std::nullopt, now_)
            .isValue());
}

TEST_F(CalendarStoreTest, PermissionTableIsEnforced)
{
    auto advisorAdd = store_.addEvent(
        "advisor_lee", "Meeting", "Office", at("Week 1, Monday, 09:00-10:00"), std::nullopt, now_);
    ASSERT_TRUE(advisorAdd.isError());
    EXPECT_EQ(advisorAdd.errorValue().code, ErrorCode::PermissionDenied);

    auto clubView = store_.viewSchedule("club_chess", day("Week 1, Monday"));
    EXPECT_TRUE(clubView.isValue());

    auto clubRemove = store_.removeEvent("club_chess", EventId{ 1 }, now_);
    ASSERT_TRUE(clubRemove.isError());
    EXPECT_EQ(clubRemove.errorValue().code, ErrorCode::PermissionDenied);

    auto advisorView = store_.viewSchedule("advisor_lee", day("Week 1, Monday"));
    ASSERT_TRUE(advisorView.isError());
    EXPECT_EQ(advisorView.errorValue().code, ErrorCode::PermissionDenied);
}

TEST_F(CalendarStoreTest, UnknownCalendarIdIsValidationError)
{
    for (const char* id : { "", "me", "club_", "advisor_", "Self" }) {
        auto result = store_.viewSchedule(id, day("Week 1, Monday"));
        ASSERT_TRUE(result.isError()) << id;
        EXPECT_EQ(result.errorValue().code, ErrorCode::Validation) << id;
    }
}

TEST_F(CalendarStoreTest, EmptyTitleIsRejectedBeforeAnythingIsCreated)
{
    auto result = store_.addEvent(
        "club_x", "", "Hall", at("Week 1, Monday, 09:00-10:00"), std::nullopt, now_);
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().code, ErrorCode::Validation);
    EXPECT_TRUE(store_.calendarIds().empty());
}

TEST_F(CalendarStoreTest, RemovedIdsAreNeverReused)
{
    ASSERT_TRUE(
        store_.addEvent("self", "A", "X", at("Week 1, Monday, 09:00-10:00"), std::nullopt, now_)
            .isValue());
    ASSERT_TRUE(store_.removeEvent("self", EventId{ 1 }, now_).isValue());

    auto again =
        store_.addEvent("self", "B", "X", at("Week 1, Monday, 09:00-10:00"), std::nullopt, now_);
    ASSERT_TRUE(again.isValue());
    EXPECT_EQ(again.value().id, EventId{ 2 });

    auto missing = store_.removeEvent("self", EventId{ 1 }, now_);
    ASSERT_TRUE(missing.isError());
    EXPECT_EQ(missing.errorValue().code, ErrorCode::NotFound);
}

TEST_F(CalendarStoreTest, UpdateChecksOverlapAgainstOtherEventsOnly)
{
    ASSERT_TRUE(
        store_.addEvent("self", "A", "X", at("Week 1, Monday, 09:00-10:00"), std::nullopt, now_)
            .isValue());
    ASSERT_TRUE(
        store_.addEvent("self", "B", "X", at("Week 1, Monday, 11:00-12:00"), std::nullopt, now_)
            .isValue());

    // Shifting an event within its own slot is fine.
    EventUpdate shift;
    shift.time = at("Week 1, Monday, 09:30-10:30");
    auto shifted = store_.updateEvent("self", EventId{ 1 }, shift, now_);
    ASSERT_TRUE(shifted.isValue());
    EXPECT_EQ(shifted.value().time.toString(), "Week 1, Monday, 09:30-10:30");

    EventUpdate collide;
    collide.time = at("Week 1, Monday, 10:00-11:30");
    auto clash = store_.updateEvent("self", EventId{ 1 }, collide, now_);
    ASSERT_TRUE(clash.isError());
    EXPECT_EQ(clash.errorValue().code, ErrorCode::Conflict);
    EXPECT_EQ(store_.eventsOf("self")[0].time.toString(), "Week 1, Monday, 09:30-10:30");
}

TEST_F(CalendarStoreTest, UpdateNeedsAtLeastOneField)
{
    ASSERT_TRUE(
        store_.addEvent("self", "A", "X", at("Week 1, Monday, 09:00-10:00"), std::nullopt, now_)
            .isValue());
    auto result = store_.updateEvent("self", EventId{ 1 }, EventUpdate{}, now_);
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().code, ErrorCode::Validation);
}

TEST_F(CalendarStoreTest, ViewScheduleFiltersByDateAndSortsByStart)
{
    ASSERT_TRUE(
        store_.addEvent("self", "Late", "X", at("Week 1, Monday, 15:00-16:00"), std::nullopt, now_)
            .isValue());
    ASSERT_TRUE(
        store_.addEvent("self", "Early", "X", at("Week 1, Monday, 08:00-09:00"), std::nullopt, now_)
            .isValue());
    ASSERT_TRUE(
        store_.addEvent("self", "Other", "X", at("Week 1, Friday, 08:00-09:00"), std::nullopt, now_)
            .isValue());

    auto schedule = store_.viewSchedule("self", day("Week 1, Monday"));
    ASSERT_TRUE(schedule.isValue());
    ASSERT_EQ(schedule.value().size(), 2u);
    EXPECT_EQ(schedule.value()[0].title, "Early");
    EXPECT_EQ(schedule.value()[1].title, "Late");
}

TEST_F(CalendarStoreTest, AdvisorAvailabilitySubtractsCommitments)
{
    ASSERT_TRUE(
        store_.seedAdvisorCommitment("lee", "Faculty Meeting", at("Week 1, Monday, 09:30-10:15"))
            .isValue());

    auto free = store_.queryAdvisorAvailability("advisor_lee", day("Week 1, Monday"));
    ASSERT_TRUE(free.isValue());
    EXPECT_EQ(free.value(), (std::vector<TimeRange>{ range("14:00-15:00") }));

    auto otherDay = store_.queryAdvisorAvailability("lee", day("Week 1, Tuesday"));
    ASSERT_TRUE(otherDay.isValue());
    EXPECT_EQ(otherDay.value().size(), 3u);
}

TEST_F(CalendarStoreTest, AvailabilityOverrideTakesPrecedence)
{
    store_.setAdvisorAvailability("lee", day("Week 1, Monday"), { range("16:00-17:00") });
    auto free = store_.queryAdvisorAvailability("lee", day("Week 1, Monday"));
    ASSERT_TRUE(free.isValue());
    EXPECT_EQ(free.value(), (std::vector<TimeRange>{ range("16:00-17:00") }));
}

TEST_F(CalendarStoreTest, OnlySelfMutationsAreLogged)
{
    const SimTime later = SimTime::parse("Week 1, Monday, 09:15").value();
    ASSERT_TRUE(
        store_.addEvent("self", "A", "X", at("Week 1, Monday, 09:00-10:00"), std::nullopt, later)
            .isValue());
    ASSERT_TRUE(
        store_.addEvent("club_x", "B", "X", at("Week 1, Monday, 09:00-10:00"), std::nullopt, later)
            .isValue());
    ASSERT_TRUE(store_.removeEvent("self", EventId{ 1 }, later).isValue());

    auto changes = store_.drainSelfScheduleChanges();
    ASSERT_EQ(changes.size(), 2u);
    EXPECT_EQ(changes[0].action, "add");
    EXPECT_EQ(changes[0].timestamp, later);
    EXPECT_FALSE(changes[0].before.has_value());
    EXPECT_EQ(changes[1].action, "remove");
    EXPECT_TRUE(changes[1].before.has_value());

    EXPECT_TRUE(store_.drainSelfScheduleChanges().empty());
}

TEST_F(CalendarStoreTest, EventJsonUsesWireKeys)
{
    auto added = store_.addEvent(
        "self", "A", "X", at("Week 1, Monday, 09:00-10:00"), std::string("notes"), now_);
    ASSERT_TRUE(added.isValue());

    const nlohmann::json j = added.value();
    EXPECT_EQ(j["event_id"], 1);
    EXPECT_EQ(j["calendar_id"], "self");
    EXPECT_EQ(j["time"], "Week 1, Monday, 09:00-10:00");
    EXPECT_EQ(j["description"], "notes");
}
