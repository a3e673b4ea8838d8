#pragma once

#include "ApiMacros.h"
#include <nlohmann/json.hpp>
#include <string>

namespace CampusSim {
namespace Api {

namespace GetCurrentTime {
DEFINE_API_NAME("get_current_time");

struct Command {
    API_COMMAND();
};
} // namespace GetCurrentTime

namespace AdvanceTime {
DEFINE_API_NAME("advance_time");

struct Command {
    std::string time; // "Week N, Day, HH:MM"

    API_COMMAND();
};
} // namespace AdvanceTime

namespace StartNewDay {
DEFINE_API_NAME("start_new_day");

struct Command {
    std::string date; // "Week N, Day"

    API_COMMAND();
};
} // namespace StartNewDay

namespace BeginTask {
DEFINE_API_NAME("begin_task");

struct Command {
    std::string task_id;

    API_COMMAND();
};
} // namespace BeginTask

namespace SnapshotGet {
DEFINE_API_NAME("get_snapshot");

struct Command {
    API_COMMAND();
};
} // namespace SnapshotGet

} // namespace Api
} // namespace CampusSim
