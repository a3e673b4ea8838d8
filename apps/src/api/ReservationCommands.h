#pragma once

#include "ApiMacros.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace CampusSim {
namespace Api {

namespace QueryAvailability {
DEFINE_API_NAME("query_availability");

struct Command {
    std::string location_id;
    std::string date;

    API_COMMAND();
};
} // namespace QueryAvailability

namespace MakeBooking {
DEFINE_API_NAME("make_booking");

struct Command {
    std::string location_id;
    std::string item_name;
    std::string date;
    std::string time_slot; // "HH:MM-HH:MM"
    std::optional<std::string> seat_id;

    API_COMMAND();
};
} // namespace MakeBooking

namespace RegisterAvailabilityPuzzle {
DEFINE_API_NAME("register_availability_puzzle");

struct GroundTruth {
    std::string item_name;
    std::optional<std::string> seat_id;
};

struct Command {
    std::string location_id;
    std::string date;
    std::string time_slot;
    std::vector<GroundTruth> ground_truth;
    std::vector<std::string> required_properties;
    int distractor_count = 2;

    API_COMMAND();
};
} // namespace RegisterAvailabilityPuzzle

namespace PinAvailability {
DEFINE_API_NAME("pin_availability");

struct Command {
    std::string location_id;
    std::string item_name;
    std::optional<std::string> seat_id;
    std::string date;
    std::string time_slot;
    std::vector<std::string> properties;

    API_COMMAND();
};
} // namespace PinAvailability

namespace ListBookings {
DEFINE_API_NAME("list_bookings");

// Without task_id every booking in the world is listed.
struct Command {
    std::optional<std::string> task_id;

    API_COMMAND();
};
} // namespace ListBookings

} // namespace Api
} // namespace CampusSim
