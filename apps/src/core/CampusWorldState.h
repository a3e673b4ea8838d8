#pragma once

#include "AvailabilityEngine.h"
#include "BookingLedger.h"
#include "CalendarStore.h"
#include "CampusData.h"
#include "CourseCatalog.h"
#include "DraftRegistrar.h"
#include "LocationTracker.h"
#include "MapGraph.h"
#include "OperationResult.h"
#include "PathPlanner.h"
#include "Result.h"
#include "SimConfig.h"
#include "WorldClock.h"
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace CampusSim {

// Path constraints as the caller spells them; parsed inside the operation.
struct PathConstraintInput {
    std::optional<std::string> exposure;
    std::optional<std::string> surface;
    std::vector<std::string> accessibility;
};

struct EventDetailsInput {
    std::optional<std::string> title;
    std::optional<std::string> location;
    std::optional<std::string> time;
    std::optional<std::string> description;
};

/**
 * @brief The persistent world: sole owner of every subsystem's state.
 *
 * Each operation validates against the current state, mutates only when every check
 * has passed, and reports a structured OperationResult. State persists across tasks;
 * only startNewDay() resets the day-scoped parts (agent position, walk history and
 * issued paths).
 */
class CampusWorldState {
public:
    // Checks the configured default location and seeds the advisor commitments.
    static Result<std::unique_ptr<CampusWorldState>, std::string> create(
        CampusData data, SimConfig config);

    // Subsystems keep references into this object.
    CampusWorldState(const CampusWorldState&) = delete;
    CampusWorldState& operator=(const CampusWorldState&) = delete;

    // =================================================================
    // Clock.
    // =================================================================
    OperationResult getCurrentTime() const;
    OperationResult advanceTime(const std::string& time);
    OperationResult startNewDay(const std::string& date);

    // =================================================================
    // Map and navigation.
    // =================================================================
    OperationResult findBuildingId(const std::string& name) const;
    OperationResult getBuildingDetails(const std::string& buildingId) const;
    OperationResult findRoomLocation(
        const std::string& query,
        const std::optional<std::string>& buildingId,
        const std::optional<std::string>& zone) const;
    OperationResult queryBuildingsByProperty(
        const std::optional<std::string>& zone,
        const std::optional<std::string>& type,
        const std::optional<std::string>& amenity) const;
    OperationResult getBuildingComplexInfo(const std::string& buildingId) const;
    OperationResult listValidQueryProperties() const;
    OperationResult findOptimalPath(
        const std::string& sourceId,
        const std::string& targetId,
        const PathConstraintInput& constraints);
    OperationResult walkTo(const std::vector<std::string>& path);
    OperationResult getCurrentLocation() const;

    // =================================================================
    // Calendar.
    // =================================================================
    OperationResult addEvent(
        const std::string& calendarId,
        const std::string& title,
        const std::string& location,
        const std::string& time,
        const std::optional<std::string>& description);
    OperationResult removeEvent(const std::string& calendarId, int eventId);
    OperationResult updateEvent(
        const std::string& calendarId, int eventId, const EventDetailsInput& details);
    OperationResult viewSchedule(const std::string& calendarId, const std::string& date) const;
    OperationResult queryAdvisorAvailability(
        const std::string& advisorId, const std::string& date) const;

    // =================================================================
    // Reservations.
    // =================================================================
    OperationResult queryAvailability(const std::string& locationId, const std::string& date);
    OperationResult makeBooking(
        const std::string& locationId,
        const std::string& item,
        const std::string& date,
        const std::string& timeSlot,
        const std::optional<std::string>& seat);

    // =================================================================
    // Course selection.
    // =================================================================
    OperationResult browseCourses(const CourseFilters& filters) const;
    OperationResult addCourse(const std::string& sectionId);
    OperationResult removeCourse(const std::string& sectionId);
    OperationResult assignPass(const std::string& sectionId, const std::string& pass);
    OperationResult viewDraft() const;
    OperationResult submitDraft();

    // =================================================================
    // Controller operations.
    // =================================================================
    OperationResult beginTask(const std::string& taskId);
    OperationResult registerAvailabilityPuzzle(
        const std::string& locationId,
        const std::string& date,
        const std::string& timeSlot,
        const std::vector<GroundTruthItem>& groundTruth,
        const std::vector<std::string>& requiredProperties,
        int distractorCount);
    OperationResult pinAvailability(
        const std::string& locationId,
        const std::string& item,
        const std::optional<std::string>& seat,
        const std::string& date,
        const std::string& timeSlot,
        const std::vector<std::string>& properties);
    OperationResult listBookings(const std::optional<std::string>& taskId) const;
    OperationResult seedAdvisorCommitment(
        const std::string& advisorId, const std::string& title, const std::string& time);
    OperationResult setAdvisorAvailability(
        const std::string& advisorId,
        const std::string& date,
        const std::vector<std::string>& slots);
    OperationResult drainSelfScheduleChanges();
    OperationResult updateCoursePopularity(const std::string& sectionId, int popularity);
    OperationResult updateCourseSeats(const std::string& sectionId, int seatsLeft);
    OperationResult openRegistrationRound();
    OperationResult listEnrollment() const;

    // Full inspectable state, for evaluation and the CLI --snapshot flag.
    nlohmann::json snapshot() const;

    const SimConfig& config() const { return config_; }
    const MapGraph& map() const { return map_; }
    const WorldClock& clock() const { return clock_; }
    const LocationTracker& tracker() const { return tracker_; }
    const CalendarStore& calendars() const { return calendars_; }
    const AvailabilityEngine& availability() const { return availability_; }
    const BookingLedger& bookings() const { return bookings_; }
    const CourseCatalog& catalog() const { return catalog_; }
    const DraftRegistrar& registrar() const { return registrar_; }
    const std::vector<std::vector<std::string>>& issuedPaths() const { return issuedPaths_; }
    const std::string& currentTaskId() const { return currentTaskId_; }

private:
    CampusWorldState(CampusData data, SimConfig config);

    nlohmann::json locationJson(const Location& location) const;

    SimConfig config_;
    MapGraph map_;
    PathPlanner planner_;
    WorldClock clock_;
    LocationTracker tracker_;
    CalendarStore calendars_;
    AvailabilityEngine availability_;
    BookingLedger bookings_;
    CourseCatalog catalog_;
    DraftRegistrar registrar_;
    std::vector<std::vector<std::string>> issuedPaths_;
    std::string currentTaskId_;
};

} // namespace CampusSim
