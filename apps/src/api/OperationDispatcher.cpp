#include "OperationDispatcher.h"
#include "core/CampusWorldState.h"
#include "core/LoggingChannels.h"
#include <exception>

namespace CampusSim {

OperationDispatcher::OperationDispatcher(CampusWorldState& world) : world_(world)
{}

OperationResult OperationDispatcher::dispatch(const ApiCommand& command)
{
    const std::string_view name = apiCommandName(command);
    try {
        OperationResult result =
            std::visit([this](const auto& cmd) { return onCommand(cmd); }, command);
        LOG_DEBUG(Api, "{} -> {}: {}", name, toString(result.status), result.message);
        return result;
    }
    catch (const std::exception& e) {
        LOG_ERROR(Api, "{} raised: {}", name, e.what());
        return OperationResult::error(std::string("Internal error in ") + std::string(name) + ": "
                                      + e.what());
    }
}

OperationResult OperationDispatcher::handleLine(const std::string& line)
{
    auto command = deserializer_.deserialize(line);
    if (command.isError()) {
        LOG_DEBUG(Api, "Rejected command line: {}", command.errorValue().message);
        return OperationResult::failure(command.errorValue());
    }
    return dispatch(command.value());
}

// =================================================================
// Clock and task context.
// =================================================================

OperationResult OperationDispatcher::onCommand(const Api::GetCurrentTime::Command& /*cmd*/)
{
    return world_.getCurrentTime();
}

OperationResult OperationDispatcher::onCommand(const Api::AdvanceTime::Command& cmd)
{
    return world_.advanceTime(cmd.time);
}

OperationResult OperationDispatcher::onCommand(const Api::StartNewDay::Command& cmd)
{
    return world_.startNewDay(cmd.date);
}

OperationResult OperationDispatcher::onCommand(const Api::BeginTask::Command& cmd)
{
    return world_.beginTask(cmd.task_id);
}

OperationResult OperationDispatcher::onCommand(const Api::SnapshotGet::Command& /*cmd*/)
{
    return OperationResult::success("World snapshot.", world_.snapshot());
}

// =================================================================
// Map and navigation.
// =================================================================

OperationResult OperationDispatcher::onCommand(const Api::FindBuildingId::Command& cmd)
{
    return world_.findBuildingId(cmd.building_name);
}

OperationResult OperationDispatcher::onCommand(const Api::GetBuildingDetails::Command& cmd)
{
    return world_.getBuildingDetails(cmd.building_id);
}

OperationResult OperationDispatcher::onCommand(const Api::FindRoomLocation::Command& cmd)
{
    return world_.findRoomLocation(cmd.room_query, cmd.building_id, cmd.zone);
}

OperationResult OperationDispatcher::onCommand(const Api::QueryBuildingsByProperty::Command& cmd)
{
    return world_.queryBuildingsByProperty(cmd.zone, cmd.building_type, cmd.amenity);
}

OperationResult OperationDispatcher::onCommand(const Api::GetBuildingComplexInfo::Command& cmd)
{
    return world_.getBuildingComplexInfo(cmd.building_id);
}

OperationResult OperationDispatcher::onCommand(
    const Api::ListValidQueryProperties::Command& /*cmd*/)
{
    return world_.listValidQueryProperties();
}

OperationResult OperationDispatcher::onCommand(const Api::FindOptimalPath::Command& cmd)
{
    const PathConstraintInput constraints{
        .exposure = cmd.exposure,
        .surface = cmd.surface,
        .accessibility = cmd.accessibility,
    };
    return world_.findOptimalPath(cmd.source_building_id, cmd.target_building_id, constraints);
}

OperationResult OperationDispatcher::onCommand(const Api::WalkTo::Command& cmd)
{
    return world_.walkTo(cmd.path);
}

OperationResult OperationDispatcher::onCommand(const Api::GetCurrentLocation::Command& /*cmd*/)
{
    return world_.getCurrentLocation();
}

// =================================================================
// Calendar.
// =================================================================

OperationResult OperationDispatcher::onCommand(const Api::AddEvent::Command& cmd)
{
    return world_.addEvent(
        cmd.calendar_id, cmd.event_title, cmd.location, cmd.time, cmd.description);
}

OperationResult OperationDispatcher::onCommand(const Api::RemoveEvent::Command& cmd)
{
    return world_.removeEvent(cmd.calendar_id, cmd.event_id);
}

OperationResult OperationDispatcher::onCommand(const Api::UpdateEvent::Command& cmd)
{
    const EventDetailsInput details{
        .title = cmd.event_title,
        .location = cmd.location,
        .time = cmd.time,
        .description = cmd.description,
    };
    return world_.updateEvent(cmd.calendar_id, cmd.event_id, details);
}

OperationResult OperationDispatcher::onCommand(const Api::ViewSchedule::Command& cmd)
{
    return world_.viewSchedule(cmd.calendar_id, cmd.date);
}

OperationResult OperationDispatcher::onCommand(const Api::QueryAdvisorAvailability::Command& cmd)
{
    return world_.queryAdvisorAvailability(cmd.advisor_id, cmd.date);
}

OperationResult OperationDispatcher::onCommand(const Api::SeedAdvisorCommitment::Command& cmd)
{
    return world_.seedAdvisorCommitment(cmd.advisor_id, cmd.title, cmd.time);
}

OperationResult OperationDispatcher::onCommand(const Api::SetAdvisorAvailability::Command& cmd)
{
    return world_.setAdvisorAvailability(cmd.advisor_id, cmd.date, cmd.slots);
}

OperationResult OperationDispatcher::onCommand(
    const Api::DrainSelfScheduleChanges::Command& /*cmd*/)
{
    return world_.drainSelfScheduleChanges();
}

// =================================================================
// Reservations.
// =================================================================

OperationResult OperationDispatcher::onCommand(const Api::QueryAvailability::Command& cmd)
{
    return world_.queryAvailability(cmd.location_id, cmd.date);
}

OperationResult OperationDispatcher::onCommand(const Api::MakeBooking::Command& cmd)
{
    return world_.makeBooking(cmd.location_id, cmd.item_name, cmd.date, cmd.time_slot, cmd.seat_id);
}

OperationResult OperationDispatcher::onCommand(const Api::RegisterAvailabilityPuzzle::Command& cmd)
{
    std::vector<GroundTruthItem> groundTruth;
    groundTruth.reserve(cmd.ground_truth.size());
    for (const auto& item : cmd.ground_truth) {
        groundTruth.push_back(GroundTruthItem{ .item = item.item_name, .seat = item.seat_id });
    }
    return world_.registerAvailabilityPuzzle(
        cmd.location_id,
        cmd.date,
        cmd.time_slot,
        groundTruth,
        cmd.required_properties,
        cmd.distractor_count);
}

OperationResult OperationDispatcher::onCommand(const Api::PinAvailability::Command& cmd)
{
    return world_.pinAvailability(
        cmd.location_id, cmd.item_name, cmd.seat_id, cmd.date, cmd.time_slot, cmd.properties);
}

OperationResult OperationDispatcher::onCommand(const Api::ListBookings::Command& cmd)
{
    return world_.listBookings(cmd.task_id);
}

// =================================================================
// Course selection.
// =================================================================

OperationResult OperationDispatcher::onCommand(const Api::BrowseCourses::Command& cmd)
{
    const CourseFilters filters{
        .credits = cmd.credits,
        .courseCode = cmd.course_code,
        .courseName = cmd.course_name,
        .type = cmd.type,
        .maxPopularity = cmd.max_popularity,
    };
    return world_.browseCourses(filters);
}

OperationResult OperationDispatcher::onCommand(const Api::AddCourse::Command& cmd)
{
    return world_.addCourse(cmd.section_id);
}

OperationResult OperationDispatcher::onCommand(const Api::RemoveCourse::Command& cmd)
{
    return world_.removeCourse(cmd.section_id);
}

OperationResult OperationDispatcher::onCommand(const Api::AssignPass::Command& cmd)
{
    return world_.assignPass(cmd.section_id, cmd.pass_type);
}

OperationResult OperationDispatcher::onCommand(const Api::ViewDraft::Command& /*cmd*/)
{
    return world_.viewDraft();
}

OperationResult OperationDispatcher::onCommand(const Api::SubmitDraft::Command& /*cmd*/)
{
    return world_.submitDraft();
}

OperationResult OperationDispatcher::onCommand(const Api::UpdateCoursePopularity::Command& cmd)
{
    return world_.updateCoursePopularity(cmd.course_code, cmd.popularity_index);
}

OperationResult OperationDispatcher::onCommand(const Api::UpdateCourseSeats::Command& cmd)
{
    return world_.updateCourseSeats(cmd.course_code, cmd.seats_left);
}

OperationResult OperationDispatcher::onCommand(const Api::OpenRegistrationRound::Command& /*cmd*/)
{
    return world_.openRegistrationRound();
}

OperationResult OperationDispatcher::onCommand(const Api::ListEnrollment::Command& /*cmd*/)
{
    return world_.listEnrollment();
}

} // namespace CampusSim
