#pragma once

#include "CalendarIdentity.h"
#include "Result.h"
#include "SimError.h"
#include "SimTime.h"
#include "StrongType.h"
#include <map>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <vector>

namespace CampusSim {

using EventId = StrongType<struct EventIdTag>;

struct CalendarEvent {
    EventId id;
    std::string calendarId;
    std::string title;
    std::string location;
    EventTime time;
    std::optional<std::string> description;
};

// Fields left empty keep their current value.
struct EventUpdate {
    std::optional<std::string> title;
    std::optional<std::string> location;
    std::optional<EventTime> time;
    std::optional<std::string> description;

    bool empty() const { return !title && !location && !time && !description; }
};

struct ScheduleChange {
    std::string action; // "add", "remove" or "update".
    SimTime timestamp;
    std::optional<CalendarEvent> before;
    std::optional<CalendarEvent> after;
};

void to_json(nlohmann::json& j, const CalendarEvent& event);
void to_json(nlohmann::json& j, const ScheduleChange& change);

/**
 * @brief Events of every calendar identity, with permissions checked on each call.
 *
 * No two events on one calendar overlap. Event ids are allocated per calendar starting
 * at 1 and never reused, even after removal. Mutations of the "self" calendar are also
 * recorded in a change log stamped with the simulated time of the change.
 */
class CalendarStore {
public:
    explicit CalendarStore(std::vector<TimeRange> advisorWorkingSlots);

    Result<CalendarEvent, SimError> addEvent(
        const std::string& calendarId,
        const std::string& title,
        const std::string& location,
        const EventTime& time,
        const std::optional<std::string>& description,
        const SimTime& now);

    Result<CalendarEvent, SimError> removeEvent(
        const std::string& calendarId, EventId eventId, const SimTime& now);

    Result<CalendarEvent, SimError> updateEvent(
        const std::string& calendarId,
        EventId eventId,
        const EventUpdate& update,
        const SimTime& now);

    // Events on the date, ordered by start time.
    Result<std::vector<CalendarEvent>, SimError> viewSchedule(
        const std::string& calendarId, const SimDate& date) const;

    // Free working slots of the advisor on the date. Commitment details stay private.
    Result<std::vector<TimeRange>, SimError> queryAdvisorAvailability(
        const std::string& advisorId, const SimDate& date) const;

    // Controller operations.
    Result<CalendarEvent, SimError> seedAdvisorCommitment(
        const std::string& advisorId, const std::string& title, const EventTime& time);
    void setAdvisorAvailability(
        const std::string& advisorId, const SimDate& date, std::vector<TimeRange> slots);
    std::vector<ScheduleChange> drainSelfScheduleChanges();

    // All events of a calendar in insertion order; empty for unknown calendars.
    std::vector<CalendarEvent> eventsOf(const std::string& calendarId) const;
    std::vector<std::string> calendarIds() const;

private:
    struct Calendar {
        std::vector<CalendarEvent> events;
        EventId nextId{ 1 };
    };

    Result<CalendarIdentity, SimError> authorize(
        const std::string& calendarId, CalendarAction action) const;
    const CalendarEvent* findOverlap(
        const Calendar& calendar,
        const EventTime& time,
        std::optional<EventId> ignore = std::nullopt) const;
    CalendarEvent& insert(Calendar& calendar, CalendarEvent event);
    void recordChange(
        const std::string& calendarId,
        const std::string& action,
        const SimTime& now,
        std::optional<CalendarEvent> before,
        std::optional<CalendarEvent> after);

    std::vector<TimeRange> advisorWorkingSlots_;
    std::map<std::string, Calendar> calendars_;
    std::map<std::pair<std::string, SimDate>, std::vector<TimeRange>> availabilityOverrides_;
    std::vector<ScheduleChange> selfChanges_;
};

} // namespace CampusSim
