#pragma once

#include "ApiMacros.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace CampusSim {
namespace Api {

namespace FindBuildingId {
DEFINE_API_NAME("find_building_id");

struct Command {
    std::string building_name;

    API_COMMAND();
};
} // namespace FindBuildingId

namespace GetBuildingDetails {
DEFINE_API_NAME("get_building_details");

struct Command {
    std::string building_id;

    API_COMMAND();
};
} // namespace GetBuildingDetails

namespace FindRoomLocation {
DEFINE_API_NAME("find_room_location");

struct Command {
    std::string room_query;
    std::optional<std::string> building_id;
    std::optional<std::string> zone;

    API_COMMAND();
};
} // namespace FindRoomLocation

namespace QueryBuildingsByProperty {
DEFINE_API_NAME("query_buildings_by_property");

struct Command {
    std::optional<std::string> zone;
    std::optional<std::string> building_type;
    std::optional<std::string> amenity;

    API_COMMAND();
};
} // namespace QueryBuildingsByProperty

namespace GetBuildingComplexInfo {
DEFINE_API_NAME("get_building_complex_info");

struct Command {
    std::string building_id;

    API_COMMAND();
};
} // namespace GetBuildingComplexInfo

namespace ListValidQueryProperties {
DEFINE_API_NAME("list_valid_query_properties");

struct Command {
    API_COMMAND();
};
} // namespace ListValidQueryProperties

namespace FindOptimalPath {
DEFINE_API_NAME("find_optimal_path");

// "constraints": {"rain_exposure": "Covered", "surface": "Paved", "accessibility": [...]}
struct Command {
    std::string source_building_id;
    std::string target_building_id;
    std::optional<std::string> exposure;
    std::optional<std::string> surface;
    std::vector<std::string> accessibility;

    API_COMMAND();
};
} // namespace FindOptimalPath

namespace WalkTo {
DEFINE_API_NAME("walk_to");

// Accepts {"path": [...]} or the planner's own {"path_info": {"path": [...]}}.
struct Command {
    std::vector<std::string> path;

    API_COMMAND();
};
} // namespace WalkTo

namespace GetCurrentLocation {
DEFINE_API_NAME("get_current_location");

struct Command {
    API_COMMAND();
};
} // namespace GetCurrentLocation

} // namespace Api
} // namespace CampusSim
