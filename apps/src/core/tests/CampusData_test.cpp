#include "core/CampusData.h"
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace CampusSim;

namespace {

nlohmann::json sampleMap()
{
    return nlohmann::json::parse(R"({
        "nodes": [
            {"id": "B001", "name": "Grand Library", "aliases": ["Main Library"], "zone": "North",
             "type": "Library", "amenities": ["Printing"],
             "internal_amenities": {"floor_2": ["Study Room 201"]},
             "bookable_items": [{"name": "Study Room 201", "floor": "floor_2"}]},
            {"id": "B083", "name": "Lakeside Dormitory", "zone": "South", "type": "Residential"},
            {"id": "B084", "name": "Lakeside Annex", "zone": "South", "type": "Residential"}
        ],
        "edges": [
            {"source": "B083", "target": "B001", "time_cost": 9.6,
             "properties": {"rain_exposure": "Partially Exposed", "surface": "Paved",
                            "accessibility": ["Ramp"]}}
        ],
        "building_complexes": [{"name": "Lakeside Halls", "member_ids": ["B083", "B084"]}]
    })");
}

nlohmann::json sampleCourses()
{
    return nlohmann::json::parse(R"({
        "courses": [
            {"course_code": "WXK003111107", "course_name": "Military Theory", "credits": 2,
             "instructor": {"name": "Prof. Wang"}, "popularity_index": 90,
             "schedule": {"weeks": {"start": 1, "end": 8}, "days": ["Monday", "Wednesday"],
                          "time": "10:00-11:40",
                          "location": {"building_id": "B001", "room_number": "101"}}},
            {"course_code": "CS101", "course_name": "Intro", "instructor": "Dr. Li"}
        ]
    })");
}

} // namespace

TEST(CampusDataTest, ParsesMapCoursesAndSeed)
{
    const auto seed = nlohmann::json::parse(R"({
        "advisor_commitments": [
            {"advisor_id": "advisor_lee", "title": "Faculty Meeting",
             "time": "Week 1, Monday, 09:00-10:00"}
        ]
    })");

    auto result = CampusData::fromJson(sampleMap(), sampleCourses(), &seed);
    ASSERT_TRUE(result.isValue()) << result.errorValue();
    const CampusData& data = result.value();

    EXPECT_EQ(data.map.locationCount(), 3u);
    const Location* library = data.map.findLocation("B001");
    ASSERT_NE(library, nullptr);
    ASSERT_EQ(library->subRooms.size(), 1u);
    EXPECT_EQ(library->subRooms[0].floor, "floor_2");
    ASSERT_EQ(library->bookableItems.size(), 1u);

    ASSERT_EQ(data.map.edges().size(), 1u);
    EXPECT_EQ(data.map.edges()[0].cost, 10);
    EXPECT_EQ(data.map.edges()[0].properties.exposure, Exposure::PartiallyExposed);

    ASSERT_EQ(data.map.complexes().size(), 1u);
    EXPECT_EQ(data.map.complexes()[0].id, "C1");
    EXPECT_TRUE(data.map.hasDirectLink("B084", "B083"));

    ASSERT_EQ(data.courses.size(), 2u);
    EXPECT_EQ(data.courses[0].instructor, "Prof. Wang");
    EXPECT_EQ(data.courses[0].schedule.days.size(), 2u);
    EXPECT_EQ(data.courses[0].schedule.endWeek, 8);
    EXPECT_EQ(data.courses[1].instructor, "Dr. Li");
    EXPECT_EQ(data.courses[1].popularity, 50);

    ASSERT_EQ(data.advisorCommitments.size(), 1u);
    EXPECT_EQ(data.advisorCommitments[0].time.toString(), "Week 1, Monday, 09:00-10:00");
}

TEST(CampusDataTest, SeedIsOptional)
{
    auto result = CampusData::fromJson(sampleMap(), sampleCourses(), nullptr);
    ASSERT_TRUE(result.isValue());
    EXPECT_TRUE(result.value().advisorCommitments.empty());
}

TEST(CampusDataTest, DuplicateCourseCodesAreRejected)
{
    auto courses = sampleCourses();
    courses["courses"][1]["course_code"] = "CS101";
    courses["courses"].push_back(courses["courses"][1]);

    auto result = CampusData::fromJson(sampleMap(), courses, nullptr);
    ASSERT_TRUE(result.isError());
    EXPECT_NE(result.errorValue().find("Duplicate course_code"), std::string::npos);
}

TEST(CampusDataTest, PopularityOutOfRangeIsRejected)
{
    auto courses = sampleCourses();
    courses["courses"][0]["popularity_index"] = 120;
    EXPECT_TRUE(CampusData::fromJson(sampleMap(), courses, nullptr).isError());
}

TEST(CampusDataTest, EdgeToUnknownLocationIsRejected)
{
    auto map = sampleMap();
    map["edges"][0]["target"] = "B999";
    auto result = CampusData::fromJson(map, sampleCourses(), nullptr);
    ASSERT_TRUE(result.isError());
    EXPECT_NE(result.errorValue().find("unknown location"), std::string::npos);
}

TEST(CampusDataTest, MalformedFieldsBecomeErrors)
{
    auto map = sampleMap();
    map["edges"][0]["properties"]["rain_exposure"] = "Sunny";
    auto result = CampusData::fromJson(map, sampleCourses(), nullptr);
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().rfind("Invalid campus data", 0), 0u);
}

TEST(CampusDataTest, LoadsFromDirectory)
{
    const auto dir = std::filesystem::temp_directory_path() / "campus_data_test";
    std::filesystem::create_directories(dir);
    std::ofstream(dir / "map.json") << sampleMap().dump();
    std::ofstream(dir / "courses.json") << sampleCourses().dump();

    auto result = CampusData::loadFromDirectory(dir);
    std::filesystem::remove_all(dir);

    ASSERT_TRUE(result.isValue()) << result.errorValue();
    EXPECT_EQ(result.value().courses.size(), 2u);
}

TEST(CampusDataTest, MissingDirectoryReportsTheFile)
{
    auto result = CampusData::loadFromDirectory("/nonexistent/campus");
    ASSERT_TRUE(result.isError());
    EXPECT_NE(result.errorValue().find("map.json"), std::string::npos);
}
