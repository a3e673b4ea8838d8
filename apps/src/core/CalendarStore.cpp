#include "CalendarStore.h"
#include "LoggingChannels.h"
#include <algorithm>
#include <nlohmann/json.hpp>

namespace CampusSim {

void to_json(nlohmann::json& j, const CalendarEvent& event)
{
    j = nlohmann::json{
        { "event_id", event.id },
        { "calendar_id", event.calendarId },
        { "title", event.title },
        { "location", event.location },
        { "time", event.time },
    };
    if (event.description) {
        j["description"] = *event.description;
    }
}

void to_json(nlohmann::json& j, const ScheduleChange& change)
{
    j = nlohmann::json{ { "action", change.action }, { "timestamp", change.timestamp } };
    j["before"] = change.before ? nlohmann::json(*change.before) : nlohmann::json(nullptr);
    j["after"] = change.after ? nlohmann::json(*change.after) : nlohmann::json(nullptr);
}

CalendarStore::CalendarStore(std::vector<TimeRange> advisorWorkingSlots)
    : advisorWorkingSlots_(std::move(advisorWorkingSlots))
{
    std::sort(advisorWorkingSlots_.begin(), advisorWorkingSlots_.end());
}

// =================================================================
// Agent operations.
// =================================================================

Result<CalendarEvent, SimError> CalendarStore::addEvent(
    const std::string& calendarId,
    const std::string& title,
    const std::string& location,
    const EventTime& time,
    const std::optional<std::string>& description,
    const SimTime& now)
{
    using R = Result<CalendarEvent, SimError>;

    auto auth = authorize(calendarId, CalendarAction::Add);
    if (auth.isError()) {
        return R::error(auth.errorValue());
    }
    if (title.empty() || location.empty()) {
        return R::error(
            SimError(ErrorCode::Validation, "Event title and location must not be empty."));
    }

    auto calIt = calendars_.find(calendarId);
    const CalendarEvent* clash =
        calIt != calendars_.end() ? findOverlap(calIt->second, time) : nullptr;
    if (clash) {
        LOG_DEBUG(
            Calendar, "Rejected '{}' on {}: overlaps event {}", title, calendarId, clash->id);
        return R::error(SimError(
            ErrorCode::Conflict,
            "Time conflict with existing event '" + clash->title + "' at "
                + clash->time.toString() + "."));
    }

    CalendarEvent event{
        .id = EventId{},
        .calendarId = calendarId,
        .title = title,
        .location = location,
        .time = time,
        .description = description,
    };
    const CalendarEvent& stored = insert(calendars_[calendarId], std::move(event));
    LOG_INFO(
        Calendar, "Added event {} '{}' to {} at {}", stored.id, title, calendarId, time.toString());
    recordChange(calendarId, "add", now, std::nullopt, stored);
    return R::okay(stored);
}

Result<CalendarEvent, SimError> CalendarStore::removeEvent(
    const std::string& calendarId, EventId eventId, const SimTime& now)
{
    using R = Result<CalendarEvent, SimError>;

    auto auth = authorize(calendarId, CalendarAction::Remove);
    if (auth.isError()) {
        return R::error(auth.errorValue());
    }

    auto calIt = calendars_.find(calendarId);
    if (calIt != calendars_.end()) {
        auto& events = calIt->second.events;
        auto it = std::find_if(events.begin(), events.end(), [&](const CalendarEvent& e) {
            return e.id == eventId;
        });
        if (it != events.end()) {
            CalendarEvent removed = *it;
            events.erase(it);
            LOG_INFO(Calendar, "Removed event {} '{}' from {}", eventId, removed.title, calendarId);
            recordChange(calendarId, "remove", now, removed, std::nullopt);
            return R::okay(std::move(removed));
        }
    }

    return R::error(SimError(
        ErrorCode::NotFound,
        "Event " + std::to_string(eventId.get()) + " not found in calendar '" + calendarId
            + "'."));
}

Result<CalendarEvent, SimError> CalendarStore::updateEvent(
    const std::string& calendarId,
    EventId eventId,
    const EventUpdate& update,
    const SimTime& now)
{
    using R = Result<CalendarEvent, SimError>;

    auto auth = authorize(calendarId, CalendarAction::Update);
    if (auth.isError()) {
        return R::error(auth.errorValue());
    }
    if (update.empty()) {
        return R::error(SimError(ErrorCode::Validation, "No event fields to update."));
    }
    if ((update.title && update.title->empty()) || (update.location && update.location->empty())) {
        return R::error(
            SimError(ErrorCode::Validation, "Event title and location must not be empty."));
    }

    auto calIt = calendars_.find(calendarId);
    CalendarEvent* event = nullptr;
    if (calIt != calendars_.end()) {
        for (auto& candidate : calIt->second.events) {
            if (candidate.id == eventId) {
                event = &candidate;
                break;
            }
        }
    }
    if (!event) {
        return R::error(SimError(
            ErrorCode::NotFound,
            "Event " + std::to_string(eventId.get()) + " not found in calendar '" + calendarId
                + "'."));
    }

    if (update.time) {
        if (const CalendarEvent* clash = findOverlap(calIt->second, *update.time, eventId)) {
            LOG_DEBUG(
                Calendar, "Rejected update of event {}: overlaps event {}", eventId, clash->id);
            return R::error(SimError(
                ErrorCode::Conflict,
                "Time conflict with existing event '" + clash->title + "' at "
                    + clash->time.toString() + "."));
        }
    }

    CalendarEvent before = *event;
    if (update.title) {
        event->title = *update.title;
    }
    if (update.location) {
        event->location = *update.location;
    }
    if (update.time) {
        event->time = *update.time;
    }
    if (update.description) {
        event->description = *update.description;
    }

    LOG_INFO(Calendar, "Updated event {} on {}", eventId, calendarId);
    recordChange(calendarId, "update", now, before, *event);
    return R::okay(*event);
}

Result<std::vector<CalendarEvent>, SimError> CalendarStore::viewSchedule(
    const std::string& calendarId, const SimDate& date) const
{
    using R = Result<std::vector<CalendarEvent>, SimError>;

    auto auth = authorize(calendarId, CalendarAction::View);
    if (auth.isError()) {
        return R::error(auth.errorValue());
    }

    std::vector<CalendarEvent> result;
    auto calIt = calendars_.find(calendarId);
    if (calIt != calendars_.end()) {
        for (const auto& event : calIt->second.events) {
            if (event.time.date == date) {
                result.push_back(event);
            }
        }
    }
    std::sort(result.begin(), result.end(), [](const CalendarEvent& a, const CalendarEvent& b) {
        if (a.time.range != b.time.range) {
            return a.time.range < b.time.range;
        }
        return a.id < b.id;
    });
    return R::okay(std::move(result));
}

Result<std::vector<TimeRange>, SimError> CalendarStore::queryAdvisorAvailability(
    const std::string& advisorId, const SimDate& date) const
{
    using R = Result<std::vector<TimeRange>, SimError>;

    if (advisorId.empty()) {
        return R::error(SimError(ErrorCode::Validation, "Advisor id must not be empty."));
    }
    const std::string calendarId = advisorCalendarId(advisorId);
    auto auth = authorize(calendarId, CalendarAction::QueryAvailability);
    if (auth.isError()) {
        return R::error(auth.errorValue());
    }

    auto overrideIt = availabilityOverrides_.find({ calendarId, date });
    if (overrideIt != availabilityOverrides_.end()) {
        return R::okay(overrideIt->second);
    }

    std::vector<TimeRange> free;
    auto calIt = calendars_.find(calendarId);
    for (const auto& slot : advisorWorkingSlots_) {
        bool busy = false;
        if (calIt != calendars_.end()) {
            busy = std::any_of(
                calIt->second.events.begin(),
                calIt->second.events.end(),
                [&](const CalendarEvent& e) {
                    return e.time.date == date && e.time.range.overlaps(slot);
                });
        }
        if (!busy) {
            free.push_back(slot);
        }
    }
    return R::okay(std::move(free));
}

// =================================================================
// Controller operations.
// =================================================================

Result<CalendarEvent, SimError> CalendarStore::seedAdvisorCommitment(
    const std::string& advisorId, const std::string& title, const EventTime& time)
{
    using R = Result<CalendarEvent, SimError>;

    if (advisorId.empty()) {
        return R::error(SimError(ErrorCode::Validation, "Advisor id must not be empty."));
    }
    const std::string calendarId = advisorCalendarId(advisorId);
    auto calIt = calendars_.find(calendarId);
    const CalendarEvent* clash =
        calIt != calendars_.end() ? findOverlap(calIt->second, time) : nullptr;
    if (clash) {
        return R::error(SimError(
            ErrorCode::Conflict,
            "Commitment overlaps '" + clash->title + "' on " + calendarId + "."));
    }

    CalendarEvent event{
        .id = EventId{},
        .calendarId = calendarId,
        .title = title,
        .location = "",
        .time = time,
        .description = std::nullopt,
    };
    const CalendarEvent& stored = insert(calendars_[calendarId], std::move(event));
    LOG_DEBUG(Calendar, "Seeded commitment {} on {} at {}", stored.id, calendarId, time.toString());
    return R::okay(stored);
}

void CalendarStore::setAdvisorAvailability(
    const std::string& advisorId, const SimDate& date, std::vector<TimeRange> slots)
{
    std::sort(slots.begin(), slots.end());
    const std::string calendarId = advisorCalendarId(advisorId);
    LOG_DEBUG(
        Calendar,
        "Availability override for {} on {}: {} slots",
        calendarId,
        date.toString(),
        slots.size());
    availabilityOverrides_[{ calendarId, date }] = std::move(slots);
}

std::vector<ScheduleChange> CalendarStore::drainSelfScheduleChanges()
{
    std::vector<ScheduleChange> drained;
    drained.swap(selfChanges_);
    return drained;
}

std::vector<CalendarEvent> CalendarStore::eventsOf(const std::string& calendarId) const
{
    auto it = calendars_.find(calendarId);
    if (it == calendars_.end()) {
        return {};
    }
    return it->second.events;
}

std::vector<std::string> CalendarStore::calendarIds() const
{
    std::vector<std::string> ids;
    ids.reserve(calendars_.size());
    for (const auto& [id, calendar] : calendars_) {
        ids.push_back(id);
    }
    return ids;
}

// =================================================================
// Helpers.
// =================================================================

Result<CalendarIdentity, SimError> CalendarStore::authorize(
    const std::string& calendarId, CalendarAction action) const
{
    using R = Result<CalendarIdentity, SimError>;

    auto identity = parseCalendarIdentity(calendarId);
    if (!identity) {
        return R::error(SimError(
            ErrorCode::Validation,
            "Unknown calendar '" + calendarId
                + "'. Expected 'self', 'club_<id>' or 'advisor_<id>'."));
    }
    if (!isPermitted(*identity, action)) {
        LOG_DEBUG(Calendar, "Denied {} on {}", toString(action), calendarId);
        return R::error(SimError(
            ErrorCode::PermissionDenied,
            "Permission denied: cannot " + toString(action) + " on calendar '" + calendarId
                + "'."));
    }
    return R::okay(*identity);
}

const CalendarEvent* CalendarStore::findOverlap(
    const Calendar& calendar, const EventTime& time, std::optional<EventId> ignore) const
{
    for (const auto& event : calendar.events) {
        if (ignore && event.id == *ignore) {
            continue;
        }
        if (event.time.overlaps(time)) {
            return &event;
        }
    }
    return nullptr;
}

CalendarEvent& CalendarStore::insert(Calendar& calendar, CalendarEvent event)
{
    event.id = calendar.nextId++;
    calendar.events.push_back(std::move(event));
    return calendar.events.back();
}

void CalendarStore::recordChange(
    const std::string& calendarId,
    const std::string& action,
    const SimTime& now,
    std::optional<CalendarEvent> before,
    std::optional<CalendarEvent> after)
{
    if (calendarId != "self") {
        return;
    }
    selfChanges_.push_back(ScheduleChange{
        .action = action,
        .timestamp = now,
        .before = std::move(before),
        .after = std::move(after),
    });
}

} // namespace CampusSim
