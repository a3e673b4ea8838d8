#pragma once

#include "ApiCommand.h"
#include "CommandDeserializerJson.h"
#include "core/OperationResult.h"
#include <string>

namespace CampusSim {

class CampusWorldState;

/**
 * @brief Routes typed commands to the world and returns the structured result.
 *
 * One onCommand() overload per ApiCommand alternative; dispatch() visits the variant.
 * Exceptions escaping an operation become ERROR results with code INTERNAL.
 */
class OperationDispatcher {
public:
    explicit OperationDispatcher(CampusWorldState& world);

    OperationResult dispatch(const ApiCommand& command);

    // Deserialize one JSON command line and dispatch it.
    OperationResult handleLine(const std::string& line);

private:
    OperationResult onCommand(const Api::GetCurrentTime::Command& cmd);
    OperationResult onCommand(const Api::AdvanceTime::Command& cmd);
    OperationResult onCommand(const Api::StartNewDay::Command& cmd);
    OperationResult onCommand(const Api::BeginTask::Command& cmd);
    OperationResult onCommand(const Api::SnapshotGet::Command& cmd);

    OperationResult onCommand(const Api::FindBuildingId::Command& cmd);
    OperationResult onCommand(const Api::GetBuildingDetails::Command& cmd);
    OperationResult onCommand(const Api::FindRoomLocation::Command& cmd);
    OperationResult onCommand(const Api::QueryBuildingsByProperty::Command& cmd);
    OperationResult onCommand(const Api::GetBuildingComplexInfo::Command& cmd);
    OperationResult onCommand(const Api::ListValidQueryProperties::Command& cmd);
    OperationResult onCommand(const Api::FindOptimalPath::Command& cmd);
    OperationResult onCommand(const Api::WalkTo::Command& cmd);
    OperationResult onCommand(const Api::GetCurrentLocation::Command& cmd);

    OperationResult onCommand(const Api::AddEvent::Command& cmd);
    OperationResult onCommand(const Api::RemoveEvent::Command& cmd);
    OperationResult onCommand(const Api::UpdateEvent::Command& cmd);
    OperationResult onCommand(const Api::ViewSchedule::Command& cmd);
    OperationResult onCommand(const Api::QueryAdvisorAvailability::Command& cmd);
    OperationResult onCommand(const Api::SeedAdvisorCommitment::Command& cmd);
    OperationResult onCommand(const Api::SetAdvisorAvailability::Command& cmd);
    OperationResult onCommand(const Api::DrainSelfScheduleChanges::Command& cmd);

    OperationResult onCommand(const Api::QueryAvailability::Command& cmd);
    OperationResult onCommand(const Api::MakeBooking::Command& cmd);
    OperationResult onCommand(const Api::RegisterAvailabilityPuzzle::Command& cmd);
    OperationResult onCommand(const Api::PinAvailability::Command& cmd);
    OperationResult onCommand(const Api::ListBookings::Command& cmd);

    OperationResult onCommand(const Api::BrowseCourses::Command& cmd);
    OperationResult onCommand(const Api::AddCourse::Command& cmd);
    OperationResult onCommand(const Api::RemoveCourse::Command& cmd);
    OperationResult onCommand(const Api::AssignPass::Command& cmd);
    OperationResult onCommand(const Api::ViewDraft::Command& cmd);
    OperationResult onCommand(const Api::SubmitDraft::Command& cmd);
    OperationResult onCommand(const Api::UpdateCoursePopularity::Command& cmd);
    OperationResult onCommand(const Api::UpdateCourseSeats::Command& cmd);
    OperationResult onCommand(const Api::OpenRegistrationRound::Command& cmd);
    OperationResult onCommand(const Api::ListEnrollment::Command& cmd);

    CampusWorldState& world_;
    CommandDeserializerJson deserializer_;
};

} // namespace CampusSim
