#include "CampusFixture.h"

namespace CampusSim {
namespace Test {

nlohmann::json campusMapJson()
{
    return nlohmann::json::parse(R"({
        "nodes": [
            {"id": "B001", "name": "Grand Library", "aliases": ["Main Library", "Library"],
             "zone": "Central", "type": "Library", "amenities": ["Printing", "Cafe"],
             "internal_amenities": {"floor_1": ["Reading Hall"],
                                    "floor_2": ["Study Room 201", "Study Room 202"]},
             "bookable_items": [
                {"name": "Study Room 201", "floor": "floor_2", "properties": ["whiteboard"]},
                {"name": "Study Room 202", "floor": "floor_2"},
                {"name": "Reading Hall", "floor": "floor_1", "seats": 24,
                 "properties": ["quiet"]}
             ]},
            {"id": "B002", "name": "Science Lab", "zone": "Central", "type": "Laboratory",
             "internal_amenities": {"floor_1": ["Lab 101"]}},
            {"id": "B010", "name": "Student Center", "aliases": ["SC"], "zone": "South",
             "type": "Service", "amenities": ["Cafe"]},
            {"id": "B083", "name": "Lakeside Dormitory", "zone": "South", "type": "Residential"},
            {"id": "B084", "name": "Lakeside Annex", "zone": "South", "type": "Residential"}
        ],
        "edges": [
            {"source": "B083", "target": "B001", "time_cost": 7,
             "properties": {"rain_exposure": "Exposed", "surface": "Gravel"}},
            {"source": "B083", "target": "B010", "time_cost": 5,
             "properties": {"rain_exposure": "Covered", "surface": "Paved"}},
            {"source": "B010", "target": "B001", "time_cost": 4,
             "properties": {"rain_exposure": "Covered", "surface": "Paved"}},
            {"source": "B001", "target": "B002", "time_cost": 3,
             "properties": {"rain_exposure": "Partially Exposed", "surface": "Paved"}}
        ],
        "building_complexes": [
            {"complex_id": "C1", "name": "Lakeside Halls", "member_ids": ["B083", "B084"]}
        ]
    })");
}

nlohmann::json campusCoursesJson()
{
    return nlohmann::json::parse(R"({
        "courses": [
            {"course_code": "WXK003111107", "course_name": "Military Theory", "credits": 2,
             "instructor": "Prof. Wang", "type": "Compulsory", "popularity_index": 90,
             "enrollment_capacity": 200, "seats_left": 15,
             "schedule": {"weeks": {"start": 1, "end": 16}, "days": ["Tuesday"],
                          "time": "10:00-11:40",
                          "location": {"building_id": "B002", "room_number": "101"}}},
            {"course_code": "CS101", "course_name": "Intro to Programming", "credits": 3,
             "instructor": "Dr. Li", "type": "Elective", "popularity_index": 60,
             "enrollment_capacity": 80, "seats_left": 40}
        ]
    })");
}

nlohmann::json campusSeedJson()
{
    return nlohmann::json::parse(R"({
        "advisor_commitments": [
            {"advisor_id": "advisor_lee", "title": "Faculty Meeting",
             "time": "Week 1, Monday, 09:00-10:00"}
        ]
    })");
}

CampusData makeCampusData()
{
    const nlohmann::json seed = campusSeedJson();
    auto result = CampusData::fromJson(campusMapJson(), campusCoursesJson(), &seed);
    EXPECT_TRUE(result.isValue()) << (result.isError() ? result.errorValue() : "");
    return std::move(result).value();
}

std::unique_ptr<CampusWorldState> makeWorld(SimConfig config)
{
    auto result = CampusWorldState::create(makeCampusData(), std::move(config));
    if (result.isError()) {
        ADD_FAILURE() << result.errorValue();
        return nullptr;
    }
    return std::move(result).value();
}

} // namespace Test
} // namespace CampusSim
