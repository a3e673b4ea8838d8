#include "CampusWorldState.h"
#include "Assert.h"
#include "LoggingChannels.h"
#include <algorithm>

namespace CampusSim {

namespace {

OperationResult invalid(std::string message)
{
    return OperationResult::failure(SimError(ErrorCode::Validation, std::move(message)));
}

OperationResult notFound(std::string message)
{
    return OperationResult::failure(SimError(ErrorCode::NotFound, std::move(message)));
}

std::string joined(const std::vector<std::string>& parts, const std::string& separator)
{
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            out += separator;
        }
        out += parts[i];
    }
    return out;
}

std::optional<std::string> nonEmpty(const std::optional<std::string>& value)
{
    if (value && value->empty()) {
        return std::nullopt;
    }
    return value;
}

} // namespace

CampusWorldState::CampusWorldState(CampusData data, SimConfig config)
    : config_(std::move(config)),
      map_(std::move(data.map)),
      planner_(map_),
      clock_(config_.startTime),
      tracker_(config_.defaultLocationId),
      calendars_(config_.advisorWorkingSlots),
      availability_(map_, config_.availability),
      catalog_(std::move(data.courses))
{}

Result<std::unique_ptr<CampusWorldState>, std::string> CampusWorldState::create(
    CampusData data, SimConfig config)
{
    using R = Result<std::unique_ptr<CampusWorldState>, std::string>;

    if (!data.map.findLocation(config.defaultLocationId)) {
        return R::error("Default location '" + config.defaultLocationId + "' is not on the map");
    }

    std::vector<AdvisorCommitment> commitments = std::move(data.advisorCommitments);
    std::unique_ptr<CampusWorldState> world(
        new CampusWorldState(std::move(data), std::move(config)));

    for (const auto& commitment : commitments) {
        auto seeded = world->calendars_.seedAdvisorCommitment(
            commitment.advisorId, commitment.title, commitment.time);
        if (seeded.isError()) {
            return R::error("Advisor commitment seed rejected: " + seeded.errorValue().message);
        }
    }

    LOG_INFO(
        World,
        "World ready at {}, agent at {}",
        world->clock_.now().toString(),
        world->tracker_.current());
    return R::okay(std::move(world));
}

// =================================================================
// Clock.
// =================================================================

OperationResult CampusWorldState::getCurrentTime() const
{
    const SimTime& now = clock_.now();
    return OperationResult::success(
        "It is now " + now.toString() + ".",
        nlohmann::json{
            { "time", now },
            { "date", now.date },
            { "week", now.date.week },
            { "day", toString(now.date.day) },
            { "clock", formatClockTime(now.minuteOfDay) },
        });
}

OperationResult CampusWorldState::advanceTime(const std::string& time)
{
    const auto parsed = SimTime::parse(time);
    if (!parsed) {
        return invalid("Invalid time '" + time + "'. Expected 'Week N, Day, HH:MM'.");
    }
    auto result = clock_.advanceTo(*parsed);
    if (result.isError()) {
        return OperationResult::failure(result.errorValue());
    }
    return OperationResult::success(
        "System Prompt: It is now " + result.value().toString() + ".",
        nlohmann::json{ { "time", result.value() } });
}

OperationResult CampusWorldState::startNewDay(const std::string& date)
{
    const auto parsed = SimDate::parse(date);
    if (!parsed) {
        return invalid("Invalid date '" + date + "'. Expected 'Week N, Day'.");
    }
    auto result = clock_.startDay(*parsed, config_.dayStartMinute);
    if (result.isError()) {
        return OperationResult::failure(result.errorValue());
    }

    tracker_.resetToDefault();
    issuedPaths_.clear();
    LOG_INFO(World, "New day {}: agent back at {}", parsed->toString(), tracker_.current());
    return OperationResult::success(
        "System Announcement: Today is " + parsed->toString() + ".",
        nlohmann::json{ { "time", result.value() }, { "location_id", tracker_.current() } });
}

// =================================================================
// Map and navigation.
// =================================================================

nlohmann::json CampusWorldState::locationJson(const Location& location) const
{
    nlohmann::json amenities = nlohmann::json::object();
    for (const auto& room : location.subRooms) {
        amenities[room.floor].push_back(room.name);
    }
    nlohmann::json bookable = nlohmann::json::array();
    for (const auto& item : location.bookableItems) {
        bookable.push_back(nlohmann::json{
            { "name", item.name },
            { "floor", item.floor },
            { "seats", item.seats },
            { "properties", item.properties },
        });
    }
    return nlohmann::json{
        { "id", location.id },
        { "name", location.name },
        { "aliases", location.aliases },
        { "zone", location.zone },
        { "type", location.type },
        { "amenities", location.amenities },
        { "internal_amenities", amenities },
        { "bookable_items", bookable },
    };
}

OperationResult CampusWorldState::findBuildingId(const std::string& name) const
{
    if (name.empty()) {
        return invalid("Building name is required.");
    }
    const Location* location = map_.findByNameOrAlias(name);
    if (!location) {
        return notFound("Building '" + name + "' not found.");
    }
    return OperationResult::success(
        "Found building '" + location->name + "' with ID '" + location->id + "'.",
        nlohmann::json{ { "building_id", location->id }, { "building_name", location->name } });
}

OperationResult CampusWorldState::getBuildingDetails(const std::string& buildingId) const
{
    if (buildingId.empty()) {
        return invalid("Building ID is required.");
    }
    const Location* location = map_.findLocation(buildingId);
    if (!location) {
        return notFound("Building with ID '" + buildingId + "' not found.");
    }

    std::string message = "Building Details for " + location->name + " (ID: " + location->id + "):";
    message += "\n- Type: " + location->type;
    message += "\n- Zone: " + location->zone;
    message += "\n- Aliases: " + joined(location->aliases, ", ");
    return OperationResult::success(message, locationJson(*location));
}

OperationResult CampusWorldState::findRoomLocation(
    const std::string& query,
    const std::optional<std::string>& buildingId,
    const std::optional<std::string>& zone) const
{
    if (query.empty()) {
        return invalid("Room query is required.");
    }
    const auto rooms = map_.findRooms(query, nonEmpty(buildingId), nonEmpty(zone));
    if (rooms.empty()) {
        return notFound("No rooms found matching '" + query + "'.");
    }

    nlohmann::json data = nlohmann::json::array();
    std::string message =
        "Found " + std::to_string(rooms.size()) + " room(s) matching '" + query + "':";
    for (const auto& room : rooms) {
        message += "\n- " + room.roomName + " on " + room.floor + " of " + room.buildingName
            + " (ID: " + room.buildingId + ")";
        data.push_back(nlohmann::json{
            { "building_id", room.buildingId },
            { "building_name", room.buildingName },
            { "floor", room.floor },
            { "room_name", room.roomName },
        });
    }
    return OperationResult::success(message, nlohmann::json{ { "rooms", data } });
}

OperationResult CampusWorldState::queryBuildingsByProperty(
    const std::optional<std::string>& zone,
    const std::optional<std::string>& type,
    const std::optional<std::string>& amenity) const
{
    const auto matches = map_.queryByProperty(nonEmpty(zone), nonEmpty(type), nonEmpty(amenity));
    if (matches.empty()) {
        return notFound("No buildings found matching the specified criteria.");
    }

    nlohmann::json data = nlohmann::json::array();
    std::string message =
        "Found " + std::to_string(matches.size()) + " building(s) matching criteria:";
    for (const Location* location : matches) {
        message += "\n- " + location->name + " (ID: " + location->id + ", Type: " + location->type
            + ", Zone: " + location->zone + ")";
        data.push_back(nlohmann::json{
            { "id", location->id },
            { "name", location->name },
            { "type", location->type },
            { "zone", location->zone },
        });
    }
    return OperationResult::success(message, nlohmann::json{ { "buildings", data } });
}

OperationResult CampusWorldState::getBuildingComplexInfo(const std::string& buildingId) const
{
    if (buildingId.empty()) {
        return invalid("Building ID is required.");
    }
    if (!map_.findLocation(buildingId)) {
        return notFound("Building with ID '" + buildingId + "' not found.");
    }

    const BuildingComplex* complex = map_.complexOf(buildingId);
    if (!complex) {
        return OperationResult::success(
            "Building " + buildingId + " is not part of any building complex.",
            nlohmann::json{ { "building_id", buildingId }, { "is_complex_member", false } });
    }
    return OperationResult::success(
        "Building " + buildingId + " is part of the '" + complex->name
            + "' complex. Complex members: " + joined(complex->memberIds, ", ") + ".",
        nlohmann::json{
            { "building_id", buildingId },
            { "is_complex_member", true },
            { "complex_id", complex->id },
            { "name", complex->name },
            { "member_ids", complex->memberIds },
        });
}

OperationResult CampusWorldState::listValidQueryProperties() const
{
    const auto zones = map_.zones();
    const auto types = map_.types();
    return OperationResult::success(
        "Valid query properties:\n- Zones: " + joined(zones, ", ") + "\n- Building Types: "
            + joined(types, ", "),
        nlohmann::json{ { "zones", zones }, { "building_types", types } });
}

OperationResult CampusWorldState::findOptimalPath(
    const std::string& sourceId, const std::string& targetId, const PathConstraintInput& input)
{
    PathConstraints constraints;
    if (nonEmpty(input.exposure)) {
        constraints.exposure = exposureFromString(*input.exposure);
        if (!constraints.exposure) {
            return invalid(
                "Unknown exposure constraint '" + *input.exposure
                + "'. Use Covered, Partially Exposed or Exposed.");
        }
    }
    constraints.surface = nonEmpty(input.surface);
    constraints.accessibility = input.accessibility;

    auto result = planner_.findPath(sourceId, targetId, constraints);
    if (result.isError()) {
        return OperationResult::failure(result.errorValue());
    }

    const PlannedPath& path = result.value();
    std::vector<std::string> names;
    for (const auto& id : path.ids) {
        const Location* location = map_.findLocation(id);
        CAMPUSSIM_ASSERT(location != nullptr, "Planned path left the map");
        names.push_back(location->name);
    }
    // Issued paths are kept once each; re-planning the same route does not grow the list.
    if (path.ids.size() >= 2
        && std::find(issuedPaths_.begin(), issuedPaths_.end(), path.ids) == issuedPaths_.end()) {
        issuedPaths_.push_back(path.ids);
    }

    return OperationResult::success(
        "Optimal path found: " + joined(names, " -> ") + ".",
        nlohmann::json{
            { "path", path.ids },
            { "path_names", names },
            { "total_time_cost", path.totalCost },
        });
}

OperationResult CampusWorldState::walkTo(const std::vector<std::string>& path)
{
    if (path.size() < 2) {
        return invalid("Invalid path. Must be a list with at least 2 locations.");
    }

    auto issued = std::find(issuedPaths_.begin(), issuedPaths_.end(), path);
    if (issued == issuedPaths_.end()) {
        LOG_DEBUG(Map, "Rejected walk along a path that was not issued today");
        return OperationResult::failure(SimError(
            ErrorCode::InvalidPath,
            "This path was not provided by find_optimal_path today. Plan a path first."));
    }

    auto result = tracker_.walk(map_, path);
    if (result.isError()) {
        return OperationResult::failure(result.errorValue());
    }
    issuedPaths_.erase(issued);

    const Location* destination = map_.findLocation(result.value());
    CAMPUSSIM_ASSERT(destination != nullptr, "Walk ended off the map");
    return OperationResult::success(
        "Successfully walked to " + destination->name + ". You are now at " + destination->name
            + ".",
        nlohmann::json{
            { "current_location_id", destination->id },
            { "current_location_name", destination->name },
        });
}

OperationResult CampusWorldState::getCurrentLocation() const
{
    const Location* location = map_.findLocation(tracker_.current());
    const std::string name = location ? location->name : tracker_.current();
    return OperationResult::success(
        "You are currently at " + name + " (ID: " + tracker_.current() + ").",
        nlohmann::json{
            { "current_location_id", tracker_.current() },
            { "current_location_name", name },
        });
}

// =================================================================
// Calendar.
// =================================================================

OperationResult CampusWorldState::addEvent(
    const std::string& calendarId,
    const std::string& title,
    const std::string& location,
    const std::string& time,
    const std::optional<std::string>& description)
{
    if (calendarId.empty() || title.empty() || location.empty() || time.empty()) {
        return invalid("All parameters (calendar_id, event_title, location, time) are required.");
    }
    const auto eventTime = EventTime::parse(time);
    if (!eventTime) {
        return invalid("Invalid time '" + time + "'. Expected 'Week N, Day, HH:MM-HH:MM'.");
    }

    auto result = calendars_.addEvent(
        calendarId, title, location, *eventTime, description, clock_.now());
    if (result.isError()) {
        return OperationResult::failure(result.errorValue());
    }
    return OperationResult::success(
        "Event '" + title + "' has been successfully added to the calendar.", result.value());
}

OperationResult CampusWorldState::removeEvent(const std::string& calendarId, int eventId)
{
    if (calendarId.empty()) {
        return invalid("Both calendar_id and event_id are required.");
    }
    auto result = calendars_.removeEvent(calendarId, EventId{ eventId }, clock_.now());
    if (result.isError()) {
        return OperationResult::failure(result.errorValue());
    }
    return OperationResult::success(
        "Event '" + result.value().title + "' has been successfully removed from the calendar.",
        result.value());
}

OperationResult CampusWorldState::updateEvent(
    const std::string& calendarId, int eventId, const EventDetailsInput& details)
{
    if (calendarId.empty()) {
        return invalid("Both calendar_id and event_id are required.");
    }

    EventUpdate update;
    update.title = details.title;
    update.location = details.location;
    update.description = details.description;
    if (details.time) {
        update.time = EventTime::parse(*details.time);
        if (!update.time) {
            return invalid(
                "Invalid time '" + *details.time + "'. Expected 'Week N, Day, HH:MM-HH:MM'.");
        }
    }

    auto result = calendars_.updateEvent(calendarId, EventId{ eventId }, update, clock_.now());
    if (result.isError()) {
        return OperationResult::failure(result.errorValue());
    }
    return OperationResult::success(
        "Event '" + result.value().title + "' has been successfully updated.", result.value());
}

OperationResult CampusWorldState::viewSchedule(
    const std::string& calendarId, const std::string& date) const
{
    if (calendarId.empty() || date.empty()) {
        return invalid("Both calendar_id and date are required.");
    }
    const auto parsed = SimDate::parse(date);
    if (!parsed) {
        return invalid("Invalid date '" + date + "'. Expected 'Week N, Day'.");
    }

    auto result = calendars_.viewSchedule(calendarId, *parsed);
    if (result.isError()) {
        return OperationResult::failure(result.errorValue());
    }

    const auto& events = result.value();
    if (events.empty()) {
        return OperationResult::success(
            "No events found for " + parsed->toString() + " in calendar '" + calendarId + "'.",
            nlohmann::json{ { "events", nlohmann::json::array() } });
    }

    std::string message =
        "Found " + std::to_string(events.size()) + " event(s) for " + parsed->toString() + ":";
    for (const auto& event : events) {
        message +=
            "\n- " + event.title + " at " + event.location + " (" + event.time.toString() + ")";
        if (event.description) {
            message += "\n  Description: " + *event.description;
        }
    }
    return OperationResult::success(message, nlohmann::json{ { "events", events } });
}

OperationResult CampusWorldState::queryAdvisorAvailability(
    const std::string& advisorId, const std::string& date) const
{
    if (advisorId.empty() || date.empty()) {
        return invalid("Both advisor_id and date are required.");
    }
    const auto parsed = SimDate::parse(date);
    if (!parsed) {
        return invalid("Invalid date '" + date + "'. Expected 'Week N, Day'.");
    }

    auto result = calendars_.queryAdvisorAvailability(advisorId, *parsed);
    if (result.isError()) {
        return OperationResult::failure(result.errorValue());
    }

    std::vector<std::string> slots;
    for (const auto& range : result.value()) {
        slots.push_back(range.toString());
    }
    const std::string message = slots.empty()
        ? "Advisor " + advisorId + " has no available time slots on " + parsed->toString() + "."
        : "Advisor " + advisorId + " is available on " + parsed->toString()
            + " during the following time slots: " + joined(slots, ", ") + ".";
    return OperationResult::success(
        message,
        nlohmann::json{
            { "advisor_id", advisorId },
            { "date", *parsed },
            { "available_slots", slots },
        });
}

// =================================================================
// Reservations.
// =================================================================

OperationResult CampusWorldState::queryAvailability(
    const std::string& locationId, const std::string& date)
{
    if (locationId.empty() || date.empty()) {
        return invalid("Both location_id and date are required.");
    }
    const auto parsed = SimDate::parse(date);
    if (!parsed) {
        return invalid("Invalid date '" + date + "'. Expected 'Week N, Day'.");
    }

    auto gridResult = availability_.grid(locationId, *parsed);
    if (gridResult.isError()) {
        return OperationResult::failure(gridResult.errorValue());
    }

    AvailabilityGrid grid = *gridResult.value();
    for (auto& [range, entries] : grid.slots) {
        for (auto& entry : entries) {
            const Booking* holder =
                bookings_.findConflict(locationId, *parsed, entry.item, entry.seat, range);
            entry.booked = holder != nullptr;
        }
    }

    const Location* location = map_.findLocation(locationId);
    CAMPUSSIM_ASSERT(location != nullptr, "Availability grid for an unknown location");
    std::string message =
        "Availability query successful! " + location->name + " on " + parsed->toString() + ":";
    for (const auto& [range, entries] : grid.slots) {
        if (entries.empty()) {
            continue;
        }
        message += "\n- Time slot " + range.toString() + ":";
        for (const auto& entry : entries) {
            message += entry.seat ? "\n  - Seat " + *entry.seat + " in " + entry.item
                                  : "\n  - Facility: " + entry.item;
            message += " [" + joined(entry.properties, ", ") + "]";
            if (entry.booked) {
                message += " (booked)";
            }
        }
    }

    nlohmann::json data = grid;
    data["building_name"] = location->name;
    return OperationResult::success(message, data);
}

OperationResult CampusWorldState::makeBooking(
    const std::string& locationId,
    const std::string& item,
    const std::string& date,
    const std::string& timeSlot,
    const std::optional<std::string>& seat)
{
    if (locationId.empty() || item.empty() || date.empty() || timeSlot.empty()) {
        return invalid("Location ID, item name, date, and time slot are all required.");
    }
    const auto parsedDate = SimDate::parse(date);
    if (!parsedDate) {
        return invalid("Invalid date '" + date + "'. Expected 'Week N, Day'.");
    }
    const auto range = TimeRange::parse(timeSlot);
    if (!range) {
        return invalid("Invalid time slot '" + timeSlot + "'. Expected 'HH:MM-HH:MM'.");
    }
    const std::optional<std::string> seatId = nonEmpty(seat);

    // The grid is cached only once the booking is accepted.
    auto preview = availability_.preview(locationId, *parsedDate);
    if (preview.isError()) {
        return OperationResult::failure(preview.errorValue());
    }
    if (!preview.value().findEntry(item, seatId, *range)) {
        return notFound(
            "The requested " + (seatId ? "seat " + *seatId + " in " : std::string()) + item
            + " is not offered at " + locationId + " on " + parsedDate->toString() + " "
            + range->toString() + ".");
    }

    auto booked = bookings_.record(Booking{
        .id = BookingId{},
        .locationId = locationId,
        .item = item,
        .seat = seatId,
        .date = *parsedDate,
        .timeSlot = *range,
        .taskId = currentTaskId_,
    });
    if (booked.isError()) {
        return OperationResult::failure(booked.errorValue());
    }
    const auto materialized = availability_.grid(locationId, *parsedDate);
    CAMPUSSIM_ASSERT(materialized.isValue(), "Booked location has no availability grid");

    const Booking& booking = booked.value();
    const std::string message = booking.seat
        ? "Booking successful! You have successfully reserved seat " + *booking.seat + " in "
            + item + " for " + parsedDate->toString() + " from " + range->toString() + "."
        : "Booking successful! You have successfully reserved " + item + " for "
            + parsedDate->toString() + " from " + range->toString() + ".";
    return OperationResult::success(message, booking);
}

// =================================================================
// Course selection.
// =================================================================

OperationResult CampusWorldState::browseCourses(const CourseFilters& filters) const
{
    auto result = catalog_.browse(filters);
    if (result.isError()) {
        return OperationResult::failure(result.errorValue());
    }

    const auto& courses = result.value();
    std::string message = "Found " + std::to_string(courses.size()) + " course(s):";
    for (const auto& course : courses) {
        message += "\n- " + course.sectionId + ": " + course.name + " (Credits: "
            + std::to_string(course.credits) + ", Popularity: " + std::to_string(course.popularity)
            + ")";
    }
    return OperationResult::success(message, nlohmann::json{ { "courses", courses } });
}

OperationResult CampusWorldState::addCourse(const std::string& sectionId)
{
    auto result = registrar_.add(catalog_, sectionId);
    if (result.isError()) {
        return OperationResult::failure(result.errorValue());
    }
    return OperationResult::success(
        "Course '" + sectionId + "' has been added to your draft schedule.", result.value());
}

OperationResult CampusWorldState::removeCourse(const std::string& sectionId)
{
    auto result = registrar_.remove(sectionId);
    if (result.isError()) {
        return OperationResult::failure(result.errorValue());
    }
    return OperationResult::success(
        "Course '" + sectionId + "' has been removed from your draft schedule.", result.value());
}

OperationResult CampusWorldState::assignPass(const std::string& sectionId, const std::string& pass)
{
    if (sectionId.empty() || pass.empty()) {
        return invalid("Both section ID and pass type are required.");
    }
    auto result = registrar_.assignPass(sectionId, pass);
    if (result.isError()) {
        return OperationResult::failure(result.errorValue());
    }
    return OperationResult::success(
        toString(*result.value().pass) + " has been assigned to course '" + sectionId + "'.",
        result.value());
}

OperationResult CampusWorldState::viewDraft() const
{
    const auto& draft = registrar_.draft();
    if (draft.empty()) {
        return OperationResult::success(
            "Your draft schedule is empty.",
            nlohmann::json{ { "courses", nlohmann::json::array() } });
    }

    nlohmann::json courses = nlohmann::json::array();
    std::string message =
        "Your draft schedule contains " + std::to_string(draft.size()) + " course(s):";
    for (const auto& entry : draft) {
        const CourseSection* section = catalog_.find(entry.sectionId);
        const std::string name = section ? section->name : entry.sectionId;
        const std::string pass = entry.pass ? toString(*entry.pass) : "No pass assigned";
        message += "\n- " + entry.sectionId + ": " + name + " (" + pass + ")";

        nlohmann::json json = entry;
        json["course_name"] = name;
        courses.push_back(std::move(json));
    }
    return OperationResult::success(message, nlohmann::json{ { "courses", courses } });
}

OperationResult CampusWorldState::submitDraft()
{
    auto result = registrar_.submit(catalog_);
    if (result.isError()) {
        return OperationResult::failure(result.errorValue());
    }

    const SubmissionResult& submission = result.value();
    std::string message = "Registration completed! " + std::to_string(submission.successCount) + "/"
        + std::to_string(submission.outcomes.size()) + " courses successfully registered:";
    for (const auto& outcome : submission.outcomes) {
        message += std::string("\n") + (outcome.success ? "[SUCCESS] " : "[FAILED] ")
            + outcome.sectionId + ": " + (outcome.success ? "Success" : "Failed") + " - "
            + outcome.reason;
    }
    return OperationResult::success(message, submission);
}

// =================================================================
// Controller operations.
// =================================================================

OperationResult CampusWorldState::beginTask(const std::string& taskId)
{
    if (taskId.empty()) {
        return invalid("Task id is required.");
    }
    LOG_INFO(World, "Task '{}' begins at {}", taskId, clock_.now().toString());
    currentTaskId_ = taskId;
    return OperationResult::success(
        "Task '" + taskId + "' started.", nlohmann::json{ { "task_id", taskId } });
}

OperationResult CampusWorldState::registerAvailabilityPuzzle(
    const std::string& locationId,
    const std::string& date,
    const std::string& timeSlot,
    const std::vector<GroundTruthItem>& groundTruth,
    const std::vector<std::string>& requiredProperties,
    int distractorCount)
{
    const auto parsedDate = SimDate::parse(date);
    if (!parsedDate) {
        return invalid("Invalid date '" + date + "'. Expected 'Week N, Day'.");
    }
    const auto range = TimeRange::parse(timeSlot);
    if (!range) {
        return invalid("Invalid time slot '" + timeSlot + "'. Expected 'HH:MM-HH:MM'.");
    }

    auto result = availability_.registerPuzzle(AvailabilityPuzzle{
        .locationId = locationId,
        .date = *parsedDate,
        .timeSlot = *range,
        .groundTruth = groundTruth,
        .requiredProperties = requiredProperties,
        .distractorCount = distractorCount,
    });
    if (result.isError()) {
        return OperationResult::failure(result.errorValue());
    }
    return OperationResult::success(
        "Availability puzzle registered for " + locationId + " on " + parsedDate->toString() + " "
        + range->toString() + ".");
}

OperationResult CampusWorldState::pinAvailability(
    const std::string& locationId,
    const std::string& item,
    const std::optional<std::string>& seat,
    const std::string& date,
    const std::string& timeSlot,
    const std::vector<std::string>& properties)
{
    const auto parsedDate = SimDate::parse(date);
    if (!parsedDate) {
        return invalid("Invalid date '" + date + "'. Expected 'Week N, Day'.");
    }
    const auto range = TimeRange::parse(timeSlot);
    if (!range) {
        return invalid("Invalid time slot '" + timeSlot + "'. Expected 'HH:MM-HH:MM'.");
    }

    auto result = availability_.pin(PinnedAvailability{
        .locationId = locationId,
        .item = item,
        .seat = nonEmpty(seat),
        .date = *parsedDate,
        .timeSlot = *range,
        .properties = properties,
    });
    if (result.isError()) {
        return OperationResult::failure(result.errorValue());
    }
    return OperationResult::success(
        "Pinned " + item + " at " + locationId + " on " + parsedDate->toString() + " "
        + range->toString() + ".");
}

OperationResult CampusWorldState::listBookings(const std::optional<std::string>& taskId) const
{
    const std::vector<Booking> bookings = taskId ? bookings_.forTask(*taskId) : bookings_.all();
    return OperationResult::success(
        std::to_string(bookings.size()) + " booking(s).",
        nlohmann::json{ { "bookings", bookings } });
}

OperationResult CampusWorldState::seedAdvisorCommitment(
    const std::string& advisorId, const std::string& title, const std::string& time)
{
    const auto eventTime = EventTime::parse(time);
    if (!eventTime) {
        return invalid("Invalid time '" + time + "'. Expected 'Week N, Day, HH:MM-HH:MM'.");
    }
    auto result = calendars_.seedAdvisorCommitment(advisorId, title, *eventTime);
    if (result.isError()) {
        return OperationResult::failure(result.errorValue());
    }
    return OperationResult::success(
        "Commitment seeded for " + advisorCalendarId(advisorId) + ".", result.value());
}

OperationResult CampusWorldState::setAdvisorAvailability(
    const std::string& advisorId, const std::string& date, const std::vector<std::string>& slots)
{
    if (advisorId.empty()) {
        return invalid("Advisor id is required.");
    }
    const auto parsedDate = SimDate::parse(date);
    if (!parsedDate) {
        return invalid("Invalid date '" + date + "'. Expected 'Week N, Day'.");
    }
    std::vector<TimeRange> ranges;
    for (const auto& slot : slots) {
        const auto range = TimeRange::parse(slot);
        if (!range) {
            return invalid("Invalid time slot '" + slot + "'. Expected 'HH:MM-HH:MM'.");
        }
        ranges.push_back(*range);
    }

    calendars_.setAdvisorAvailability(advisorId, *parsedDate, std::move(ranges));
    return OperationResult::success(
        "Availability of " + advisorCalendarId(advisorId) + " on " + parsedDate->toString()
        + " set.");
}

OperationResult CampusWorldState::drainSelfScheduleChanges()
{
    const auto changes = calendars_.drainSelfScheduleChanges();
    return OperationResult::success(
        std::to_string(changes.size()) + " schedule change(s).",
        nlohmann::json{ { "changes", changes } });
}

OperationResult CampusWorldState::updateCoursePopularity(
    const std::string& sectionId, int popularity)
{
    auto result = catalog_.updatePopularity(sectionId, popularity);
    if (result.isError()) {
        return OperationResult::failure(result.errorValue());
    }
    return OperationResult::success(
        "Popularity of " + sectionId + " set to " + std::to_string(popularity) + ".",
        result.value());
}

OperationResult CampusWorldState::updateCourseSeats(const std::string& sectionId, int seatsLeft)
{
    auto result = catalog_.updateSeats(sectionId, seatsLeft);
    if (result.isError()) {
        return OperationResult::failure(result.errorValue());
    }
    return OperationResult::success(
        "Seats left of " + sectionId + " set to " + std::to_string(seatsLeft) + ".",
        result.value());
}

OperationResult CampusWorldState::openRegistrationRound()
{
    registrar_.openRound();
    return OperationResult::success(
        "Registration round " + std::to_string(registrar_.round()) + " is open.",
        nlohmann::json{ { "round", registrar_.round() } });
}

OperationResult CampusWorldState::listEnrollment() const
{
    const auto& enrollment = registrar_.enrollment();
    return OperationResult::success(
        std::to_string(enrollment.size()) + " enrolled course(s).",
        nlohmann::json{ { "enrollment", enrollment } });
}

nlohmann::json CampusWorldState::snapshot() const
{
    nlohmann::json calendars = nlohmann::json::object();
    for (const auto& id : calendars_.calendarIds()) {
        calendars[id] = calendars_.eventsOf(id);
    }

    nlohmann::json popularity = nlohmann::json::object();
    for (const auto& section : catalog_.sections()) {
        popularity[section.sectionId] = {
            { "popularity_index", section.popularity },
            { "seats_left", section.seatsLeft },
        };
    }

    return nlohmann::json{
        { "time", clock_.now() },
        { "task_id", currentTaskId_ },
        { "location", { { "current", tracker_.current() }, { "walks", tracker_.walkHistory() } } },
        { "issued_paths", issuedPaths_ },
        { "calendars", calendars },
        { "bookings", bookings_.all() },
        { "availability_grids", availability_.materializedCount() },
        { "courses", popularity },
        { "draft", registrar_.draft() },
        { "registration_open", registrar_.isRoundOpen() },
        { "enrollment", registrar_.enrollment() },
    };
}

} // namespace CampusSim
