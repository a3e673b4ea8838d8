#include "WorldCommands.h"
#include "ApiJson.h"

namespace CampusSim {
namespace Api {

using namespace ApiJson;

nlohmann::json GetCurrentTime::Command::toJson() const
{
    return nlohmann::json::object();
}

GetCurrentTime::Command GetCurrentTime::Command::fromJson(const nlohmann::json& /*j*/)
{
    return Command{};
}

nlohmann::json AdvanceTime::Command::toJson() const
{
    return nlohmann::json{ { "time", time } };
}

AdvanceTime::Command AdvanceTime::Command::fromJson(const nlohmann::json& j)
{
    return Command{ .time = requireString(j, "time") };
}

nlohmann::json StartNewDay::Command::toJson() const
{
    return nlohmann::json{ { "date", date } };
}

StartNewDay::Command StartNewDay::Command::fromJson(const nlohmann::json& j)
{
    return Command{ .date = requireString(j, "date") };
}

nlohmann::json BeginTask::Command::toJson() const
{
    return nlohmann::json{ { "task_id", task_id } };
}

BeginTask::Command BeginTask::Command::fromJson(const nlohmann::json& j)
{
    return Command{ .task_id = requireString(j, "task_id") };
}

nlohmann::json SnapshotGet::Command::toJson() const
{
    return nlohmann::json::object();
}

SnapshotGet::Command SnapshotGet::Command::fromJson(const nlohmann::json& /*j*/)
{
    return Command{};
}

} // namespace Api
} // namespace CampusSim
