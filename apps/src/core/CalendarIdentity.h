#pragma once

#include <optional>
#include <string>
#include <variant>

namespace CampusSim {

struct SelfCalendar {};

struct ClubCalendar {
    std::string clubId;
};

struct AdvisorCalendar {
    std::string advisorId;
};

// Calendar ids: "self", "club_<id>", "advisor_<id>".
using CalendarIdentity = std::variant<SelfCalendar, ClubCalendar, AdvisorCalendar>;

enum class CalendarAction {
    Add = 0,
    Remove,
    Update,
    View,
    QueryAvailability,
};

std::string toString(CalendarAction action);

std::optional<CalendarIdentity> parseCalendarIdentity(const std::string& calendarId);

// Calendar id of an advisor, accepting either "advisor_<id>" or the bare id.
std::string advisorCalendarId(const std::string& advisorId);

bool isPermitted(const CalendarIdentity& identity, CalendarAction action);

} // namespace CampusSim
