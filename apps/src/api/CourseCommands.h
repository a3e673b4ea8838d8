#pragma once

#include "ApiMacros.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace CampusSim {
namespace Api {

namespace BrowseCourses {
DEFINE_API_NAME("browse_courses");

// "filters": {"credits", "course_code", "course_name", "type", "max_popularity"}.
struct Command {
    std::optional<std::string> credits; // Comparison expression; a bare number means "==".
    std::optional<std::string> course_code;
    std::optional<std::string> course_name;
    std::optional<std::string> type;
    std::optional<int> max_popularity;

    API_COMMAND();
};
} // namespace BrowseCourses

namespace AddCourse {
DEFINE_API_NAME("add_course");

struct Command {
    std::string section_id;

    API_COMMAND();
};
} // namespace AddCourse

namespace RemoveCourse {
DEFINE_API_NAME("remove_course");

struct Command {
    std::string section_id;

    API_COMMAND();
};
} // namespace RemoveCourse

namespace AssignPass {
DEFINE_API_NAME("assign_pass");

struct Command {
    std::string section_id;
    std::string pass_type;

    API_COMMAND();
};
} // namespace AssignPass

namespace ViewDraft {
DEFINE_API_NAME("view_draft");

struct Command {
    API_COMMAND();
};
} // namespace ViewDraft

namespace SubmitDraft {
DEFINE_API_NAME("submit_draft");

struct Command {
    API_COMMAND();
};
} // namespace SubmitDraft

namespace UpdateCoursePopularity {
DEFINE_API_NAME("update_course_popularity");

struct Command {
    std::string course_code;
    int popularity_index = 0;

    API_COMMAND();
};
} // namespace UpdateCoursePopularity

namespace UpdateCourseSeats {
DEFINE_API_NAME("update_course_seats");

struct Command {
    std::string course_code;
    int seats_left = 0;

    API_COMMAND();
};
} // namespace UpdateCourseSeats

namespace OpenRegistrationRound {
DEFINE_API_NAME("open_registration_round");

struct Command {
    API_COMMAND();
};
} // namespace OpenRegistrationRound

namespace ListEnrollment {
DEFINE_API_NAME("list_enrollment");

struct Command {
    API_COMMAND();
};
} // namespace ListEnrollment

} // namespace Api
} // namespace CampusSim
