#include "MapCommands.h"
#include "ApiJson.h"

namespace CampusSim {
namespace Api {

using namespace ApiJson;

nlohmann::json FindBuildingId::Command::toJson() const
{
    return nlohmann::json{ { "building_name", building_name } };
}

FindBuildingId::Command FindBuildingId::Command::fromJson(const nlohmann::json& j)
{
    return Command{ .building_name = requireString(j, "building_name") };
}

nlohmann::json GetBuildingDetails::Command::toJson() const
{
    return nlohmann::json{ { "building_id", building_id } };
}

GetBuildingDetails::Command GetBuildingDetails::Command::fromJson(const nlohmann::json& j)
{
    return Command{ .building_id = requireString(j, "building_id") };
}

nlohmann::json FindRoomLocation::Command::toJson() const
{
    nlohmann::json j{ { "room_query", room_query } };
    putOptional(j, "building_id", building_id);
    putOptional(j, "zone", zone);
    return j;
}

FindRoomLocation::Command FindRoomLocation::Command::fromJson(const nlohmann::json& j)
{
    return Command{
        .room_query = requireString(j, "room_query"),
        .building_id = optionalString(j, "building_id"),
        .zone = optionalString(j, "zone"),
    };
}

nlohmann::json QueryBuildingsByProperty::Command::toJson() const
{
    nlohmann::json j = nlohmann::json::object();
    putOptional(j, "zone", zone);
    putOptional(j, "building_type", building_type);
    putOptional(j, "amenity", amenity);
    return j;
}

QueryBuildingsByProperty::Command QueryBuildingsByProperty::Command::fromJson(
    const nlohmann::json& j)
{
    return Command{
        .zone = optionalString(j, "zone"),
        .building_type = optionalString(j, "building_type"),
        .amenity = optionalString(j, "amenity"),
    };
}

nlohmann::json GetBuildingComplexInfo::Command::toJson() const
{
    return nlohmann::json{ { "building_id", building_id } };
}

GetBuildingComplexInfo::Command GetBuildingComplexInfo::Command::fromJson(const nlohmann::json& j)
{
    return Command{ .building_id = requireString(j, "building_id") };
}

nlohmann::json ListValidQueryProperties::Command::toJson() const
{
    return nlohmann::json::object();
}

ListValidQueryProperties::Command ListValidQueryProperties::Command::fromJson(
    const nlohmann::json& /*j*/)
{
    return Command{};
}

nlohmann::json FindOptimalPath::Command::toJson() const
{
    nlohmann::json constraints = nlohmann::json::object();
    putOptional(constraints, "rain_exposure", exposure);
    putOptional(constraints, "surface", surface);
    if (!accessibility.empty()) {
        constraints["accessibility"] = accessibility;
    }
    return nlohmann::json{
        { "source_building_id", source_building_id },
        { "target_building_id", target_building_id },
        { "constraints", constraints },
    };
}

FindOptimalPath::Command FindOptimalPath::Command::fromJson(const nlohmann::json& j)
{
    const nlohmann::json& constraints = optionalObject(j, "constraints");
    auto exposure = optionalString(constraints, "rain_exposure");
    if (!exposure) {
        exposure = optionalString(constraints, "exposure");
    }
    return Command{
        .source_building_id = requireString(j, "source_building_id"),
        .target_building_id = requireString(j, "target_building_id"),
        .exposure = exposure,
        .surface = optionalString(constraints, "surface"),
        .accessibility = stringList(constraints, "accessibility"),
    };
}

nlohmann::json WalkTo::Command::toJson() const
{
    return nlohmann::json{ { "path", path } };
}

WalkTo::Command WalkTo::Command::fromJson(const nlohmann::json& j)
{
    const nlohmann::json& pathInfo = optionalObject(j, "path_info");
    if (pathInfo.contains("path")) {
        return Command{ .path = stringList(pathInfo, "path") };
    }
    return Command{ .path = stringList(j, "path") };
}

nlohmann::json GetCurrentLocation::Command::toJson() const
{
    return nlohmann::json::object();
}

GetCurrentLocation::Command GetCurrentLocation::Command::fromJson(const nlohmann::json& /*j*/)
{
    return Command{};
}

} // namespace Api
} // namespace CampusSim
