#include "ReservationCommands.h"
#include "ApiJson.h"
#include <stdexcept>

namespace CampusSim {
namespace Api {

using namespace ApiJson;

nlohmann::json QueryAvailability::Command::toJson() const
{
    return nlohmann::json{ { "location_id", location_id }, { "date", date } };
}

QueryAvailability::Command QueryAvailability::Command::fromJson(const nlohmann::json& j)
{
    return Command{
        .location_id = requireString(j, "location_id"),
        .date = requireString(j, "date"),
    };
}

nlohmann::json MakeBooking::Command::toJson() const
{
    nlohmann::json j{
        { "location_id", location_id },
        { "item_name", item_name },
        { "date", date },
        { "time_slot", time_slot },
    };
    putOptional(j, "seat_id", seat_id);
    return j;
}

MakeBooking::Command MakeBooking::Command::fromJson(const nlohmann::json& j)
{
    return Command{
        .location_id = requireString(j, "location_id"),
        .item_name = requireString(j, "item_name"),
        .date = requireString(j, "date"),
        .time_slot = requireString(j, "time_slot"),
        .seat_id = optionalString(j, "seat_id"),
    };
}

nlohmann::json RegisterAvailabilityPuzzle::Command::toJson() const
{
    nlohmann::json truth = nlohmann::json::array();
    for (const auto& item : ground_truth) {
        nlohmann::json entry{ { "item_name", item.item_name } };
        putOptional(entry, "seat_id", item.seat_id);
        truth.push_back(std::move(entry));
    }
    return nlohmann::json{
        { "location_id", location_id },
        { "date", date },
        { "time_slot", time_slot },
        { "ground_truth", truth },
        { "required_properties", required_properties },
        { "distractor_count", distractor_count },
    };
}

RegisterAvailabilityPuzzle::Command RegisterAvailabilityPuzzle::Command::fromJson(
    const nlohmann::json& j)
{
    Command cmd{
        .location_id = requireString(j, "location_id"),
        .date = requireString(j, "date"),
        .time_slot = requireString(j, "time_slot"),
        .ground_truth = {},
        .required_properties = stringList(j, "required_properties"),
        .distractor_count = optionalInt(j, "distractor_count").value_or(2),
    };

    if (!j.contains("ground_truth") || !j.at("ground_truth").is_array()) {
        throw std::invalid_argument("Field 'ground_truth' must be an array");
    }
    for (const auto& item : j.at("ground_truth")) {
        if (item.is_string()) {
            cmd.ground_truth.push_back(GroundTruth{ .item_name = item.get<std::string>() });
            continue;
        }
        cmd.ground_truth.push_back(GroundTruth{
            .item_name = requireString(item, "item_name"),
            .seat_id = optionalString(item, "seat_id"),
        });
    }
    return cmd;
}

nlohmann::json PinAvailability::Command::toJson() const
{
    nlohmann::json j{
        { "location_id", location_id },
        { "item_name", item_name },
        { "date", date },
        { "time_slot", time_slot },
        { "properties", properties },
    };
    putOptional(j, "seat_id", seat_id);
    return j;
}

PinAvailability::Command PinAvailability::Command::fromJson(const nlohmann::json& j)
{
    return Command{
        .location_id = requireString(j, "location_id"),
        .item_name = requireString(j, "item_name"),
        .seat_id = optionalString(j, "seat_id"),
        .date = requireString(j, "date"),
        .time_slot = requireString(j, "time_slot"),
        .properties = stringList(j, "properties"),
    };
}

nlohmann::json ListBookings::Command::toJson() const
{
    nlohmann::json j = nlohmann::json::object();
    putOptional(j, "task_id", task_id);
    return j;
}

ListBookings::Command ListBookings::Command::fromJson(const nlohmann::json& j)
{
    return Command{ .task_id = optionalString(j, "task_id") };
}

} // namespace Api
} // namespace CampusSim
