#include "CalendarCommands.h"
#include "ApiJson.h"

namespace CampusSim {
namespace Api {

using namespace ApiJson;

nlohmann::json AddEvent::Command::toJson() const
{
    nlohmann::json j{
        { "calendar_id", calendar_id },
        { "event_title", event_title },
        { "location", location },
        { "time", time },
    };
    putOptional(j, "description", description);
    return j;
}

AddEvent::Command AddEvent::Command::fromJson(const nlohmann::json& j)
{
    return Command{
        .calendar_id = requireString(j, "calendar_id"),
        .event_title = requireString(j, "event_title"),
        .location = requireString(j, "location"),
        .time = requireString(j, "time"),
        .description = optionalString(j, "description"),
    };
}

nlohmann::json RemoveEvent::Command::toJson() const
{
    return nlohmann::json{ { "calendar_id", calendar_id }, { "event_id", event_id } };
}

RemoveEvent::Command RemoveEvent::Command::fromJson(const nlohmann::json& j)
{
    return Command{
        .calendar_id = requireString(j, "calendar_id"),
        .event_id = requireInt(j, "event_id"),
    };
}

nlohmann::json UpdateEvent::Command::toJson() const
{
    nlohmann::json details = nlohmann::json::object();
    putOptional(details, "event_title", event_title);
    putOptional(details, "location", location);
    putOptional(details, "time", time);
    putOptional(details, "description", description);
    return nlohmann::json{
        { "calendar_id", calendar_id },
        { "event_id", event_id },
        { "new_details", details },
    };
}

UpdateEvent::Command UpdateEvent::Command::fromJson(const nlohmann::json& j)
{
    const nlohmann::json& details = optionalObject(j, "new_details");
    return Command{
        .calendar_id = requireString(j, "calendar_id"),
        .event_id = requireInt(j, "event_id"),
        .event_title = optionalString(details, "event_title"),
        .location = optionalString(details, "location"),
        .time = optionalString(details, "time"),
        .description = optionalString(details, "description"),
    };
}

nlohmann::json ViewSchedule::Command::toJson() const
{
    return nlohmann::json{ { "calendar_id", calendar_id }, { "date", date } };
}

ViewSchedule::Command ViewSchedule::Command::fromJson(const nlohmann::json& j)
{
    return Command{
        .calendar_id = requireString(j, "calendar_id"),
        .date = requireString(j, "date"),
    };
}

nlohmann::json QueryAdvisorAvailability::Command::toJson() const
{
    return nlohmann::json{ { "advisor_id", advisor_id }, { "date", date } };
}

QueryAdvisorAvailability::Command QueryAdvisorAvailability::Command::fromJson(
    const nlohmann::json& j)
{
    return Command{
        .advisor_id = requireString(j, "advisor_id"),
        .date = requireString(j, "date"),
    };
}

nlohmann::json SeedAdvisorCommitment::Command::toJson() const
{
    return nlohmann::json{ { "advisor_id", advisor_id }, { "title", title }, { "time", time } };
}

SeedAdvisorCommitment::Command SeedAdvisorCommitment::Command::fromJson(const nlohmann::json& j)
{
    return Command{
        .advisor_id = requireString(j, "advisor_id"),
        .title = optionalString(j, "title").value_or("Busy"),
        .time = requireString(j, "time"),
    };
}

nlohmann::json SetAdvisorAvailability::Command::toJson() const
{
    return nlohmann::json{ { "advisor_id", advisor_id }, { "date", date }, { "slots", slots } };
}

SetAdvisorAvailability::Command SetAdvisorAvailability::Command::fromJson(const nlohmann::json& j)
{
    return Command{
        .advisor_id = requireString(j, "advisor_id"),
        .date = requireString(j, "date"),
        .slots = stringList(j, "slots"),
    };
}

nlohmann::json DrainSelfScheduleChanges::Command::toJson() const
{
    return nlohmann::json::object();
}

DrainSelfScheduleChanges::Command DrainSelfScheduleChanges::Command::fromJson(
    const nlohmann::json& /*j*/)
{
    return Command{};
}

} // namespace Api
} // namespace CampusSim
