#include "CalendarIdentity.h"
#include <array>
#include <string_view>

namespace CampusSim {

namespace {

constexpr std::string_view kClubPrefix = "club_";
constexpr std::string_view kAdvisorPrefix = "advisor_";

// Rows follow the CalendarIdentity alternatives, columns follow CalendarAction.
//                                        Add    Remove Update View   QueryAvailability
constexpr std::array<std::array<bool, 5>, 3> kPermissions = { {
    /* self    */ { { true, true, true, true, false } },
    /* club_   */ { { true, false, false, true, false } },
    /* advisor_*/ { { false, false, false, false, true } },
} };

bool startsWith(const std::string& str, std::string_view prefix)
{
    return str.size() > prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

std::string toString(CalendarAction action)
{
    switch (action) {
        case CalendarAction::Add:
            return "add";
        case CalendarAction::Remove:
            return "remove";
        case CalendarAction::Update:
            return "update";
        case CalendarAction::View:
            return "view";
        case CalendarAction::QueryAvailability:
            return "query availability";
    }
    return "unknown";
}

std::optional<CalendarIdentity> parseCalendarIdentity(const std::string& calendarId)
{
    if (calendarId == "self") {
        return SelfCalendar{};
    }
    if (startsWith(calendarId, kClubPrefix)) {
        return ClubCalendar{ calendarId.substr(kClubPrefix.size()) };
    }
    if (startsWith(calendarId, kAdvisorPrefix)) {
        return AdvisorCalendar{ calendarId.substr(kAdvisorPrefix.size()) };
    }
    return std::nullopt;
}

std::string advisorCalendarId(const std::string& advisorId)
{
    if (startsWith(advisorId, kAdvisorPrefix)) {
        return advisorId;
    }
    return std::string(kAdvisorPrefix) + advisorId;
}

bool isPermitted(const CalendarIdentity& identity, CalendarAction action)
{
    return kPermissions[identity.index()][static_cast<size_t>(action)];
}

} // namespace CampusSim
