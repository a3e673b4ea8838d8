#pragma once

#include "CourseCatalog.h"
#include "MapGraph.h"
#include "Result.h"
#include "SimTime.h"
#include <filesystem>
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <vector>

namespace CampusSim {

struct AdvisorCommitment {
    std::string advisorId;
    std::string title;
    EventTime time;
};

/**
 * @brief Static campus content, parsed and validated before the world is built.
 *
 * Directory layout:
 *   map.json            {"nodes": [...], "edges": [...], "building_complexes": [...]}
 *   courses.json        {"courses": [...]}
 *   calendar_seed.json  {"advisor_commitments": [...]}   (optional)
 */
struct CampusData {
    MapGraph map;
    std::vector<CourseSection> courses;
    std::vector<AdvisorCommitment> advisorCommitments;

    static Result<CampusData, std::string> loadFromDirectory(const std::filesystem::path& dir);

    // calendarSeed may be null.
    static Result<CampusData, std::string> fromJson(
        const nlohmann::json& map,
        const nlohmann::json& courses,
        const nlohmann::json* calendarSeed);
};

} // namespace CampusSim
