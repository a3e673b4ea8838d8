#pragma once

#include "ApiMacros.h"
#include "CalendarCommands.h"
#include "CourseCommands.h"
#include "MapCommands.h"
#include "ReservationCommands.h"
#include "WorldCommands.h"
#include <concepts>
#include <nlohmann/json.hpp>
#include <string_view>
#include <type_traits>
#include <variant>

namespace CampusSim {

/**
 * @brief Concept for types that represent API commands.
 *
 * An API command type must provide a static name() returning the wire name and a
 * toJson() method for serialization.
 */
template <typename T>
concept ApiCommandType = requires(T cmd) {
    { cmd.toJson() } -> std::convertible_to<nlohmann::json>;
    { T::name() } -> std::convertible_to<std::string_view>;
};

/**
 * @brief Variant containing all API command types.
 */
using ApiCommand = std::variant<
    Api::AddCourse::Command,
    Api::AddEvent::Command,
    Api::AdvanceTime::Command,
    Api::AssignPass::Command,
    Api::BeginTask::Command,
    Api::BrowseCourses::Command,
    Api::DrainSelfScheduleChanges::Command,
    Api::FindBuildingId::Command,
    Api::FindOptimalPath::Command,
    Api::FindRoomLocation::Command,
    Api::GetBuildingComplexInfo::Command,
    Api::GetBuildingDetails::Command,
    Api::GetCurrentLocation::Command,
    Api::GetCurrentTime::Command,
    Api::ListBookings::Command,
    Api::ListEnrollment::Command,
    Api::ListValidQueryProperties::Command,
    Api::MakeBooking::Command,
    Api::OpenRegistrationRound::Command,
    Api::PinAvailability::Command,
    Api::QueryAdvisorAvailability::Command,
    Api::QueryAvailability::Command,
    Api::QueryBuildingsByProperty::Command,
    Api::RegisterAvailabilityPuzzle::Command,
    Api::RemoveCourse::Command,
    Api::RemoveEvent::Command,
    Api::SeedAdvisorCommitment::Command,
    Api::SetAdvisorAvailability::Command,
    Api::SnapshotGet::Command,
    Api::StartNewDay::Command,
    Api::SubmitDraft::Command,
    Api::UpdateCoursePopularity::Command,
    Api::UpdateCourseSeats::Command,
    Api::UpdateEvent::Command,
    Api::ViewDraft::Command,
    Api::ViewSchedule::Command,
    Api::WalkTo::Command>;

// Wire name of whichever command the variant holds.
inline std::string_view apiCommandName(const ApiCommand& command)
{
    return std::visit([](const auto& cmd) { return std::decay_t<decltype(cmd)>::name(); }, command);
}

} // namespace CampusSim
