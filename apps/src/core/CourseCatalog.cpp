#include "CourseCatalog.h"
#include "LoggingChannels.h"
#include <algorithm>
#include <cctype>
#include <nlohmann/json.hpp>
#include <utility>

namespace CampusSim {

namespace {

std::string toLower(const std::string& str)
{
    std::string out = str;
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

std::string trim(const std::string& str)
{
    const auto first = str.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = str.find_last_not_of(" \t");
    return str.substr(first, last - first + 1);
}

} // namespace

void to_json(nlohmann::json& j, const CourseSchedule& schedule)
{
    nlohmann::json days = nlohmann::json::array();
    for (Weekday day : schedule.days) {
        days.push_back(toString(day));
    }
    j = nlohmann::json{
        { "weeks", { { "start", schedule.startWeek }, { "end", schedule.endWeek } } },
        { "days", days },
        { "time", schedule.time },
        { "location",
          { { "building_id", schedule.buildingId },
            { "building_name", schedule.buildingName },
            { "room_number", schedule.room } } },
    };
}

void to_json(nlohmann::json& j, const CourseSection& section)
{
    j = nlohmann::json{
        { "course_code", section.sectionId },
        { "course_name", section.name },
        { "credits", section.credits },
        { "instructor", section.instructor },
        { "schedule", section.schedule },
        { "description", section.description },
        { "prerequisites", section.prerequisites },
        { "enrollment_capacity", section.capacity },
        { "type", section.type },
        { "popularity_index", section.popularity },
        { "seats_left", section.seatsLeft },
    };
}

// =================================================================
// CreditFilter.
// =================================================================

bool CreditFilter::admits(int credits) const
{
    switch (op) {
        case Op::Less:
            return credits < value;
        case Op::LessEqual:
            return credits <= value;
        case Op::Equal:
            return credits == value;
        case Op::GreaterEqual:
            return credits >= value;
        case Op::Greater:
            return credits > value;
    }
    return false;
}

std::optional<CreditFilter> CreditFilter::parse(const std::string& expression)
{
    struct Prefix {
        const char* text;
        Op op;
    };
    // Two-character operators first so "<=" is not read as "<".
    static const Prefix kPrefixes[] = {
        { "<=", Op::LessEqual }, { ">=", Op::GreaterEqual }, { "==", Op::Equal },
        { "<", Op::Less },       { ">", Op::Greater },
    };

    const std::string text = trim(expression);
    CreditFilter filter;
    std::string number = text;
    for (const auto& prefix : kPrefixes) {
        const std::string token = prefix.text;
        if (text.compare(0, token.size(), token) == 0) {
            filter.op = prefix.op;
            number = trim(text.substr(token.size()));
            break;
        }
    }

    if (number.empty()
        || !std::all_of(number.begin(), number.end(), [](unsigned char c) {
               return std::isdigit(c);
           })) {
        return std::nullopt;
    }
    try {
        filter.value = std::stoi(number);
    }
    catch (const std::out_of_range&) {
        return std::nullopt;
    }
    return filter;
}

// =================================================================
// CourseCatalog.
// =================================================================

CourseCatalog::CourseCatalog(std::vector<CourseSection> sections) : sections_(std::move(sections))
{
    std::sort(sections_.begin(), sections_.end(), [](const auto& a, const auto& b) {
        return a.sectionId < b.sectionId;
    });
}

const CourseSection* CourseCatalog::find(const std::string& sectionId) const
{
    auto it = std::lower_bound(
        sections_.begin(),
        sections_.end(),
        sectionId,
        [](const CourseSection& s, const std::string& id) { return s.sectionId < id; });
    if (it == sections_.end() || it->sectionId != sectionId) {
        return nullptr;
    }
    return &*it;
}

CourseSection* CourseCatalog::findMutable(const std::string& sectionId)
{
    return const_cast<CourseSection*>(std::as_const(*this).find(sectionId));
}

Result<std::vector<CourseSection>, SimError> CourseCatalog::browse(
    const CourseFilters& filters) const
{
    using R = Result<std::vector<CourseSection>, SimError>;

    std::optional<CreditFilter> credits;
    if (filters.credits) {
        credits = CreditFilter::parse(*filters.credits);
        if (!credits) {
            return R::error(SimError(
                ErrorCode::Validation,
                "Invalid credits filter '" + *filters.credits
                    + "'. Use a number or one of <=, >=, <, >, == followed by a number."));
        }
    }

    const std::string codeNeedle = filters.courseCode ? toLower(*filters.courseCode) : "";
    const std::string nameNeedle = filters.courseName ? toLower(*filters.courseName) : "";

    std::vector<CourseSection> matches;
    for (const auto& section : sections_) {
        if (credits && !credits->admits(section.credits)) {
            continue;
        }
        if (filters.courseCode
            && toLower(section.sectionId).find(codeNeedle) == std::string::npos) {
            continue;
        }
        if (filters.courseName && toLower(section.name).find(nameNeedle) == std::string::npos) {
            continue;
        }
        if (filters.type && section.type != *filters.type) {
            continue;
        }
        if (filters.maxPopularity && section.popularity > *filters.maxPopularity) {
            continue;
        }
        matches.push_back(section);
    }

    if (matches.empty()) {
        return R::error(
            SimError(ErrorCode::NotFound, "No courses found matching the specified criteria."));
    }
    return R::okay(std::move(matches));
}

Result<CourseSection, SimError> CourseCatalog::updatePopularity(
    const std::string& sectionId, int popularity)
{
    using R = Result<CourseSection, SimError>;

    if (popularity < 0 || popularity > 100) {
        return R::error(SimError(ErrorCode::Validation, "Popularity must be between 0 and 100."));
    }
    CourseSection* section = findMutable(sectionId);
    if (!section) {
        return R::error(
            SimError(ErrorCode::NotFound, "Course '" + sectionId + "' does not exist."));
    }

    LOG_INFO(Courses, "Popularity of {}: {} -> {}", sectionId, section->popularity, popularity);
    section->popularity = popularity;
    return R::okay(*section);
}

Result<CourseSection, SimError> CourseCatalog::updateSeats(
    const std::string& sectionId, int seatsLeft)
{
    using R = Result<CourseSection, SimError>;

    if (seatsLeft < 0) {
        return R::error(SimError(ErrorCode::Validation, "Seats left must not be negative."));
    }
    CourseSection* section = findMutable(sectionId);
    if (!section) {
        return R::error(
            SimError(ErrorCode::NotFound, "Course '" + sectionId + "' does not exist."));
    }

    LOG_INFO(Courses, "Seats left of {}: {} -> {}", sectionId, section->seatsLeft, seatsLeft);
    section->seatsLeft = seatsLeft;
    return R::okay(*section);
}

} // namespace CampusSim
