#include "CommandDeserializerJson.h"
#include "core/LoggingChannels.h"

namespace CampusSim {

Result<ApiCommand, SimError> CommandDeserializerJson::deserialize(const std::string& commandJson)
{
    using R = Result<ApiCommand, SimError>;

    // Parse JSON command.
    nlohmann::json cmd;
    try {
        cmd = nlohmann::json::parse(commandJson);
    }
    catch (const nlohmann::json::parse_error& e) {
        return R::error(
            SimError(ErrorCode::Validation, std::string("JSON parse error: ") + e.what()));
    }
    return deserialize(cmd);
}

Result<ApiCommand, SimError> CommandDeserializerJson::deserialize(const nlohmann::json& cmd)
{
    using R = Result<ApiCommand, SimError>;

    if (!cmd.is_object()) {
        return R::error(SimError(ErrorCode::Validation, "Command must be a JSON object"));
    }
    if (!cmd.contains("command") || !cmd["command"].is_string()) {
        return R::error(SimError(
            ErrorCode::Validation, "Command must have 'command' field with string value"));
    }

    // Tool-style names carry a system prefix ("calendar.add_event").
    const std::string requested = cmd["command"].get<std::string>();
    std::string commandName = requested;
    if (requested == "draft.view") {
        commandName = Api::ViewDraft::Command::name();
    }
    else if (const auto dot = requested.find('.'); dot != std::string::npos) {
        commandName = requested.substr(dot + 1);
    }
    LOG_DEBUG(Api, "Deserializing command: {}", commandName);

    // Dispatch to appropriate handler.
    try {
        if (commandName == Api::AddCourse::Command::name()) {
            return R::okay(Api::AddCourse::Command::fromJson(cmd));
        }
        else if (commandName == Api::AddEvent::Command::name()) {
            return R::okay(Api::AddEvent::Command::fromJson(cmd));
        }
        else if (commandName == Api::AdvanceTime::Command::name()) {
            return R::okay(Api::AdvanceTime::Command::fromJson(cmd));
        }
        else if (commandName == Api::AssignPass::Command::name()) {
            return R::okay(Api::AssignPass::Command::fromJson(cmd));
        }
        else if (commandName == Api::BeginTask::Command::name()) {
            return R::okay(Api::BeginTask::Command::fromJson(cmd));
        }
        else if (commandName == Api::BrowseCourses::Command::name()) {
            return R::okay(Api::BrowseCourses::Command::fromJson(cmd));
        }
        else if (commandName == Api::DrainSelfScheduleChanges::Command::name()) {
            return R::okay(Api::DrainSelfScheduleChanges::Command::fromJson(cmd));
        }
        else if (commandName == Api::FindBuildingId::Command::name()) {
            return R::okay(Api::FindBuildingId::Command::fromJson(cmd));
        }
        else if (commandName == Api::FindOptimalPath::Command::name()) {
            return R::okay(Api::FindOptimalPath::Command::fromJson(cmd));
        }
        else if (commandName == Api::FindRoomLocation::Command::name()) {
            return R::okay(Api::FindRoomLocation::Command::fromJson(cmd));
        }
        else if (commandName == Api::GetBuildingComplexInfo::Command::name()) {
            return R::okay(Api::GetBuildingComplexInfo::Command::fromJson(cmd));
        }
        else if (commandName == Api::GetBuildingDetails::Command::name()) {
            return R::okay(Api::GetBuildingDetails::Command::fromJson(cmd));
        }
        else if (commandName == Api::GetCurrentLocation::Command::name()) {
            return R::okay(Api::GetCurrentLocation::Command::fromJson(cmd));
        }
        else if (commandName == Api::GetCurrentTime::Command::name()) {
            return R::okay(Api::GetCurrentTime::Command::fromJson(cmd));
        }
        else if (commandName == Api::ListBookings::Command::name()) {
            return R::okay(Api::ListBookings::Command::fromJson(cmd));
        }
        else if (commandName == Api::ListEnrollment::Command::name()) {
            return R::okay(Api::ListEnrollment::Command::fromJson(cmd));
        }
        else if (commandName == Api::ListValidQueryProperties::Command::name()) {
            return R::okay(Api::ListValidQueryProperties::Command::fromJson(cmd));
        }
        else if (commandName == Api::MakeBooking::Command::name()) {
            return R::okay(Api::MakeBooking::Command::fromJson(cmd));
        }
        else if (commandName == Api::OpenRegistrationRound::Command::name()) {
            return R::okay(Api::OpenRegistrationRound::Command::fromJson(cmd));
        }
        else if (commandName == Api::PinAvailability::Command::name()) {
            return R::okay(Api::PinAvailability::Command::fromJson(cmd));
        }
        else if (commandName == Api::QueryAdvisorAvailability::Command::name()) {
            return R::okay(Api::QueryAdvisorAvailability::Command::fromJson(cmd));
        }
        else if (commandName == Api::QueryAvailability::Command::name()) {
            return R::okay(Api::QueryAvailability::Command::fromJson(cmd));
        }
        else if (commandName == Api::QueryBuildingsByProperty::Command::name()) {
            return R::okay(Api::QueryBuildingsByProperty::Command::fromJson(cmd));
        }
        else if (commandName == Api::RegisterAvailabilityPuzzle::Command::name()) {
            return R::okay(Api::RegisterAvailabilityPuzzle::Command::fromJson(cmd));
        }
        else if (commandName == Api::RemoveCourse::Command::name()) {
            return R::okay(Api::RemoveCourse::Command::fromJson(cmd));
        }
        else if (commandName == Api::RemoveEvent::Command::name()) {
            return R::okay(Api::RemoveEvent::Command::fromJson(cmd));
        }
        else if (commandName == Api::SeedAdvisorCommitment::Command::name()) {
            return R::okay(Api::SeedAdvisorCommitment::Command::fromJson(cmd));
        }
        else if (commandName == Api::SetAdvisorAvailability::Command::name()) {
            return R::okay(Api::SetAdvisorAvailability::Command::fromJson(cmd));
        }
        else if (commandName == Api::SnapshotGet::Command::name()) {
            return R::okay(Api::SnapshotGet::Command::fromJson(cmd));
        }
        else if (commandName == Api::StartNewDay::Command::name()) {
            return R::okay(Api::StartNewDay::Command::fromJson(cmd));
        }
        else if (commandName == Api::SubmitDraft::Command::name()) {
            return R::okay(Api::SubmitDraft::Command::fromJson(cmd));
        }
        else if (commandName == Api::UpdateCoursePopularity::Command::name()) {
            return R::okay(Api::UpdateCoursePopularity::Command::fromJson(cmd));
        }
        else if (commandName == Api::UpdateCourseSeats::Command::name()) {
            return R::okay(Api::UpdateCourseSeats::Command::fromJson(cmd));
        }
        else if (commandName == Api::UpdateEvent::Command::name()) {
            return R::okay(Api::UpdateEvent::Command::fromJson(cmd));
        }
        else if (commandName == Api::ViewDraft::Command::name()) {
            return R::okay(Api::ViewDraft::Command::fromJson(cmd));
        }
        else if (commandName == Api::ViewSchedule::Command::name()) {
            return R::okay(Api::ViewSchedule::Command::fromJson(cmd));
        }
        else if (commandName == Api::WalkTo::Command::name()) {
            return R::okay(Api::WalkTo::Command::fromJson(cmd));
        }
        else {
            return R::error(SimError(ErrorCode::Validation, "Unknown command: " + requested));
        }
    }
    catch (const std::exception& e) {
        LOG_DEBUG(Api, "Rejected {}: {}", commandName, e.what());
        return R::error(SimError(
            ErrorCode::Validation, std::string("Error deserializing command: ") + e.what()));
    }
}

} // namespace CampusSim
