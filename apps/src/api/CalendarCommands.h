#pragma once

#include "ApiMacros.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace CampusSim {
namespace Api {

namespace AddEvent {
DEFINE_API_NAME("add_event");

struct Command {
    std::string calendar_id;
    std::string event_title;
    std::string location;
    std::string time; // "Week N, Day, HH:MM-HH:MM"
    std::optional<std::string> description;

    API_COMMAND();
};
} // namespace AddEvent

namespace RemoveEvent {
DEFINE_API_NAME("remove_event");

struct Command {
    std::string calendar_id;
    int event_id = 0;

    API_COMMAND();
};
} // namespace RemoveEvent

namespace UpdateEvent {
DEFINE_API_NAME("update_event");

// "new_details": {"event_title", "location", "time", "description"}, all optional.
struct Command {
    std::string calendar_id;
    int event_id = 0;
    std::optional<std::string> event_title;
    std::optional<std::string> location;
    std::optional<std::string> time;
    std::optional<std::string> description;

    API_COMMAND();
};
} // namespace UpdateEvent

namespace ViewSchedule {
DEFINE_API_NAME("view_schedule");

struct Command {
    std::string calendar_id;
    std::string date;

    API_COMMAND();
};
} // namespace ViewSchedule

namespace QueryAdvisorAvailability {
DEFINE_API_NAME("query_advisor_availability");

struct Command {
    std::string advisor_id;
    std::string date;

    API_COMMAND();
};
} // namespace QueryAdvisorAvailability

namespace SeedAdvisorCommitment {
DEFINE_API_NAME("seed_advisor_commitment");

struct Command {
    std::string advisor_id;
    std::string title;
    std::string time;

    API_COMMAND();
};
} // namespace SeedAdvisorCommitment

namespace SetAdvisorAvailability {
DEFINE_API_NAME("set_advisor_availability");

struct Command {
    std::string advisor_id;
    std::string date;
    std::vector<std::string> slots;

    API_COMMAND();
};
} // namespace SetAdvisorAvailability

namespace DrainSelfScheduleChanges {
DEFINE_API_NAME("drain_self_schedule_changes");

struct Command {
    API_COMMAND();
};
} // namespace DrainSelfScheduleChanges

} // namespace Api
} // namespace CampusSim
