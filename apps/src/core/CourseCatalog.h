#pragma once

#include "Result.h"
#include "SimError.h"
#include "SimTime.h"
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <vector>

namespace CampusSim {

struct CourseSchedule {
    int startWeek = 1;
    int endWeek = 16;
    std::vector<Weekday> days;
    TimeRange time;
    std::string buildingId;
    std::string buildingName;
    std::string room;
};

struct CourseSection {
    std::string sectionId;
    std::string name;
    int credits = 0;
    std::string instructor;
    CourseSchedule schedule;
    std::string description;
    std::vector<std::string> prerequisites;
    int capacity = 0;
    std::string type;
    int popularity = 0; // 0-100.
    int seatsLeft = 0;
};

void to_json(nlohmann::json& j, const CourseSchedule& schedule);
void to_json(nlohmann::json& j, const CourseSection& section);

struct CourseFilters {
    std::optional<std::string> credits; // "<=3", ">=2", "<3", ">2", "==3" or "3".
    std::optional<std::string> courseCode;
    std::optional<std::string> courseName;
    std::optional<std::string> type;
    std::optional<int> maxPopularity;
};

struct CreditFilter {
    enum class Op { Less, LessEqual, Equal, GreaterEqual, Greater };

    Op op = Op::Equal;
    int value = 0;

    bool admits(int credits) const;
    static std::optional<CreditFilter> parse(const std::string& expression);
};

/**
 * @brief Course sections with their mutable popularity and seat counts.
 */
class CourseCatalog {
public:
    CourseCatalog() = default;
    explicit CourseCatalog(std::vector<CourseSection> sections);

    const CourseSection* find(const std::string& sectionId) const;
    const std::vector<CourseSection>& sections() const { return sections_; }

    // All filters are conjunctive. NotFound when nothing matches.
    Result<std::vector<CourseSection>, SimError> browse(const CourseFilters& filters) const;

    Result<CourseSection, SimError> updatePopularity(const std::string& sectionId, int popularity);
    Result<CourseSection, SimError> updateSeats(const std::string& sectionId, int seatsLeft);

private:
    CourseSection* findMutable(const std::string& sectionId);

    std::vector<CourseSection> sections_;
};

} // namespace CampusSim
