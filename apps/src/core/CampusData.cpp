#include "CampusData.h"
#include "ConfigLoader.h"
#include "LoggingChannels.h"
#include <cmath>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <stdexcept>

namespace CampusSim {

namespace {

// Accepts a list of strings or a single string.
std::vector<std::string> stringList(const nlohmann::json& j, const char* key)
{
    if (!j.contains(key) || j.at(key).is_null()) {
        return {};
    }
    const auto& value = j.at(key);
    if (value.is_string()) {
        return { value.get<std::string>() };
    }
    return value.get<std::vector<std::string>>();
}

Location parseLocation(const nlohmann::json& node)
{
    Location location;
    location.id = node.at("id").get<std::string>();
    location.name = node.at("name").get<std::string>();
    location.aliases = stringList(node, "aliases");
    location.zone = node.value("zone", "");
    location.type = node.value("type", "");
    location.amenities = stringList(node, "amenities");

    // internal_amenities: {"floor_1": ["Lobby", ...], ...}. nlohmann orders object keys.
    if (node.contains("internal_amenities")) {
        for (const auto& [floor, rooms] : node.at("internal_amenities").items()) {
            for (const auto& room : rooms) {
                location.subRooms.push_back(
                    SubRoom{ .name = room.get<std::string>(), .floor = floor });
            }
        }
    }

    if (node.contains("bookable_items")) {
        for (const auto& item : node.at("bookable_items")) {
            BookableItem bookable;
            bookable.name = item.at("name").get<std::string>();
            bookable.floor = item.value("floor", "");
            bookable.seats = item.value("seats", 0);
            bookable.properties = stringList(item, "properties");
            if (bookable.seats < 0) {
                throw std::invalid_argument(
                    "bookable item '" + bookable.name + "' in " + location.id
                    + " has a negative seat count");
            }
            location.bookableItems.push_back(std::move(bookable));
        }
    }
    return location;
}

Edge parseEdge(const nlohmann::json& j)
{
    Edge edge;
    edge.source = j.at("source").get<std::string>();
    edge.target = j.at("target").get<std::string>();

    const auto& cost = j.contains("time_cost") ? j.at("time_cost") : j.at("cost");
    edge.cost = static_cast<int>(std::lround(cost.get<double>()));
    edge.oneWay = j.value("one_way", false);

    if (j.contains("properties")) {
        const auto& properties = j.at("properties");
        if (properties.contains("rain_exposure")) {
            const auto text = properties.at("rain_exposure").get<std::string>();
            const auto exposure = exposureFromString(text);
            if (!exposure) {
                throw std::invalid_argument(
                    "edge " + edge.source + " -> " + edge.target + " has unknown exposure '"
                    + text + "'");
            }
            edge.properties.exposure = *exposure;
        }
        edge.properties.surface = properties.value("surface", "");
        edge.properties.accessibility = stringList(properties, "accessibility");
    }
    return edge;
}

BuildingComplex parseComplex(const nlohmann::json& j, size_t position)
{
    BuildingComplex complex;
    complex.id = j.contains("complex_id") ? j.at("complex_id").get<std::string>()
                                          : j.value("id", "C" + std::to_string(position + 1));
    complex.name = j.value("name", complex.id);
    complex.memberIds = j.at("member_ids").get<std::vector<std::string>>();
    return complex;
}

CourseSection parseCourse(const nlohmann::json& j)
{
    CourseSection section;
    section.sectionId = j.at("course_code").get<std::string>();
    section.name = j.at("course_name").get<std::string>();
    section.credits = j.value("credits", 0);
    if (j.contains("instructor")) {
        const auto& instructor = j.at("instructor");
        section.instructor = instructor.is_object() ? instructor.value("name", "")
                                                    : instructor.get<std::string>();
    }
    section.description = j.value("description", "");
    if (j.contains("prerequisites")) {
        for (const auto& prerequisite : j.at("prerequisites")) {
            section.prerequisites.push_back(
                prerequisite.is_object() ? prerequisite.value("course_code", "")
                                         : prerequisite.get<std::string>());
        }
    }
    section.capacity = j.value("enrollment_capacity", 0);
    section.type = j.value("type", "");
    section.popularity = j.value("popularity_index", 50);
    section.seatsLeft = j.value("seats_left", section.capacity);

    if (j.contains("schedule")) {
        const auto& schedule = j.at("schedule");
        if (schedule.contains("weeks")) {
            section.schedule.startWeek = schedule.at("weeks").value("start", 1);
            section.schedule.endWeek = schedule.at("weeks").value("end", 16);
        }
        for (const auto& dayText : stringList(schedule, "days")) {
            const auto day = weekdayFromString(dayText);
            if (!day) {
                throw std::invalid_argument(
                    "course " + section.sectionId + " has unknown day '" + dayText + "'");
            }
            section.schedule.days.push_back(*day);
        }
        if (schedule.contains("time")) {
            section.schedule.time = schedule.at("time").get<TimeRange>();
        }
        if (schedule.contains("location")) {
            const auto& location = schedule.at("location");
            section.schedule.buildingId = location.value("building_id", "");
            section.schedule.buildingName = location.value("building_name", "");
            section.schedule.room = location.value("room_number", "");
        }
    }
    return section;
}

} // namespace

Result<CampusData, std::string> CampusData::fromJson(
    const nlohmann::json& map, const nlohmann::json& courses, const nlohmann::json* calendarSeed)
{
    using R = Result<CampusData, std::string>;

    std::vector<Location> locations;
    std::vector<Edge> edges;
    std::vector<BuildingComplex> complexes;
    CampusData data;

    try {
        for (const auto& node : map.at("nodes")) {
            locations.push_back(parseLocation(node));
        }
        if (map.contains("edges")) {
            for (const auto& edge : map.at("edges")) {
                edges.push_back(parseEdge(edge));
            }
        }
        if (map.contains("building_complexes")) {
            const auto& groups = map.at("building_complexes");
            for (size_t i = 0; i < groups.size(); ++i) {
                complexes.push_back(parseComplex(groups.at(i), i));
            }
        }

        for (const auto& course : courses.at("courses")) {
            data.courses.push_back(parseCourse(course));
        }

        if (calendarSeed && calendarSeed->contains("advisor_commitments")) {
            for (const auto& commitment : calendarSeed->at("advisor_commitments")) {
                data.advisorCommitments.push_back(AdvisorCommitment{
                    .advisorId = commitment.at("advisor_id").get<std::string>(),
                    .title = commitment.value("title", "Busy"),
                    .time = commitment.at("time").get<EventTime>(),
                });
            }
        }
    }
    catch (const std::exception& e) {
        return R::error(std::string("Invalid campus data: ") + e.what());
    }

    std::set<std::string> sectionIds;
    for (const auto& section : data.courses) {
        if (section.sectionId.empty()) {
            return R::error("Course with an empty course_code");
        }
        if (!sectionIds.insert(section.sectionId).second) {
            return R::error("Duplicate course_code '" + section.sectionId + "'");
        }
        if (section.popularity < 0 || section.popularity > 100) {
            return R::error(
                "Course " + section.sectionId + " has popularity "
                + std::to_string(section.popularity) + " outside 0-100");
        }
    }

    auto graph = MapGraph::build(std::move(locations), std::move(edges), std::move(complexes));
    if (graph.isError()) {
        return R::error(graph.errorValue());
    }
    data.map = std::move(graph).value();

    LOG_INFO(
        World,
        "Campus data: {} locations, {} courses, {} advisor commitments",
        data.map.locationCount(),
        data.courses.size(),
        data.advisorCommitments.size());
    return R::okay(std::move(data));
}

Result<CampusData, std::string> CampusData::loadFromDirectory(const std::filesystem::path& dir)
{
    using R = Result<CampusData, std::string>;

    auto map = ConfigLoader::readJsonFile(dir / "map.json");
    if (map.isError()) {
        return R::error(map.errorValue());
    }
    auto courses = ConfigLoader::readJsonFile(dir / "courses.json");
    if (courses.isError()) {
        return R::error(courses.errorValue());
    }

    std::optional<nlohmann::json> seed;
    const auto seedPath = dir / "calendar_seed.json";
    if (std::filesystem::exists(seedPath)) {
        auto seedResult = ConfigLoader::readJsonFile(seedPath);
        if (seedResult.isError()) {
            return R::error(seedResult.errorValue());
        }
        seed = std::move(seedResult).value();
    }

    LOG_DEBUG(World, "Loading campus data from {}", dir.string());
    return fromJson(map.value(), courses.value(), seed ? &*seed : nullptr);
}

} // namespace CampusSim
