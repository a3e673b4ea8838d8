#include "CourseCommands.h"
#include "ApiJson.h"
#include <stdexcept>

namespace CampusSim {
namespace Api {

using namespace ApiJson;

nlohmann::json BrowseCourses::Command::toJson() const
{
    nlohmann::json filters = nlohmann::json::object();
    putOptional(filters, "credits", credits);
    putOptional(filters, "course_code", course_code);
    putOptional(filters, "course_name", course_name);
    putOptional(filters, "type", type);
    putOptional(filters, "max_popularity", max_popularity);
    return nlohmann::json{ { "filters", filters } };
}

BrowseCourses::Command BrowseCourses::Command::fromJson(const nlohmann::json& j)
{
    const nlohmann::json& filters = optionalObject(j, "filters");

    std::optional<std::string> credits;
    if (filters.contains("credits") && !filters.at("credits").is_null()) {
        const auto& value = filters.at("credits");
        if (value.is_number_integer()) {
            credits = std::to_string(value.get<int>());
        }
        else if (value.is_string()) {
            credits = value.get<std::string>();
        }
        else {
            throw std::invalid_argument("field 'credits' must be a number or a comparison string");
        }
    }

    return Command{
        .credits = credits,
        .course_code = optionalString(filters, "course_code"),
        .course_name = optionalString(filters, "course_name"),
        .type = optionalString(filters, "type"),
        .max_popularity = optionalInt(filters, "max_popularity"),
    };
}

nlohmann::json AddCourse::Command::toJson() const
{
    return nlohmann::json{ { "section_id", section_id } };
}

AddCourse::Command AddCourse::Command::fromJson(const nlohmann::json& j)
{
    return Command{ .section_id = requireString(j, "section_id") };
}

nlohmann::json RemoveCourse::Command::toJson() const
{
    return nlohmann::json{ { "section_id", section_id } };
}

RemoveCourse::Command RemoveCourse::Command::fromJson(const nlohmann::json& j)
{
    return Command{ .section_id = requireString(j, "section_id") };
}

nlohmann::json AssignPass::Command::toJson() const
{
    return nlohmann::json{ { "section_id", section_id }, { "pass_type", pass_type } };
}

AssignPass::Command AssignPass::Command::fromJson(const nlohmann::json& j)
{
    return Command{
        .section_id = requireString(j, "section_id"),
        .pass_type = requireString(j, "pass_type"),
    };
}

nlohmann::json ViewDraft::Command::toJson() const
{
    return nlohmann::json::object();
}

ViewDraft::Command ViewDraft::Command::fromJson(const nlohmann::json& /*j*/)
{
    return Command{};
}

nlohmann::json SubmitDraft::Command::toJson() const
{
    return nlohmann::json::object();
}

SubmitDraft::Command SubmitDraft::Command::fromJson(const nlohmann::json& /*j*/)
{
    return Command{};
}

nlohmann::json UpdateCoursePopularity::Command::toJson() const
{
    return nlohmann::json{
        { "course_code", course_code },
        { "popularity_index", popularity_index },
    };
}

UpdateCoursePopularity::Command UpdateCoursePopularity::Command::fromJson(const nlohmann::json& j)
{
    return Command{
        .course_code = requireString(j, "course_code"),
        .popularity_index = requireInt(j, "popularity_index"),
    };
}

nlohmann::json UpdateCourseSeats::Command::toJson() const
{
    return nlohmann::json{ { "course_code", course_code }, { "seats_left", seats_left } };
}

UpdateCourseSeats::Command UpdateCourseSeats::Command::fromJson(const nlohmann::json& j)
{
    return Command{
        .course_code = requireString(j, "course_code"),
        .seats_left = requireInt(j, "seats_left"),
    };
}

nlohmann::json OpenRegistrationRound::Command::toJson() const
{
    return nlohmann::json::object();
}

OpenRegistrationRound::Command OpenRegistrationRound::Command::fromJson(
    const nlohmann::json& /*j*/)
{
    return Command{};
}

nlohmann::json ListEnrollment::Command::toJson() const
{
    return nlohmann::json::object();
}

ListEnrollment::Command ListEnrollment::Command::fromJson(const nlohmann::json& /*j*/)
{
    return Command{};
}

} // namespace Api
} // namespace CampusSim
