#include "DraftRegistrar.h"
#include "LoggingChannels.h"
#include <algorithm>
#include <cctype>
#include <nlohmann/json.hpp>

namespace CampusSim {

std::string toString(PassType pass)
{
    switch (pass) {
        case PassType::S:
            return "S-Pass";
        case PassType::A:
            return "A-Pass";
        case PassType::B:
            return "B-Pass";
    }
    return "";
}

std::optional<PassType> passTypeFromString(const std::string& str)
{
    std::string upper = str;
    std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });

    if (upper == "S-PASS" || upper == "S") {
        return PassType::S;
    }
    if (upper == "A-PASS" || upper == "A") {
        return PassType::A;
    }
    if (upper == "B-PASS" || upper == "B") {
        return PassType::B;
    }
    return std::nullopt;
}

bool passAdmits(PassType pass, int popularity)
{
    switch (pass) {
        case PassType::S:
            return true;
        case PassType::A:
            return popularity < 95;
        case PassType::B:
            return popularity < 85;
    }
    return false;
}

namespace {

nlohmann::json passJson(const std::optional<PassType>& pass)
{
    return pass ? nlohmann::json(toString(*pass)) : nlohmann::json(nullptr);
}

} // namespace

void to_json(nlohmann::json& j, const DraftEntry& entry)
{
    j = nlohmann::json{
        { "course_code", entry.sectionId },
        { "assigned_pass", passJson(entry.pass) },
    };
}

void to_json(nlohmann::json& j, const RegistrationOutcome& outcome)
{
    j = nlohmann::json{
        { "course_code", outcome.sectionId },
        { "assigned_pass", passJson(outcome.pass) },
        { "popularity_index", outcome.popularity },
        { "status", outcome.success ? "Success" : "Failed" },
        { "reason", outcome.reason },
    };
}

void to_json(nlohmann::json& j, const SubmissionResult& result)
{
    j = nlohmann::json{
        { "total_courses", result.outcomes.size() },
        { "successful_registrations", result.successCount },
        { "results", result.outcomes },
    };
}

void to_json(nlohmann::json& j, const Enrollment& enrollment)
{
    j = nlohmann::json{
        { "course_code", enrollment.sectionId },
        { "pass", toString(enrollment.pass) },
        { "round", enrollment.round },
    };
}

// =================================================================
// DraftRegistrar.
// =================================================================

Result<std::monostate, SimError> DraftRegistrar::requireOpen() const
{
    using R = Result<std::monostate, SimError>;

    if (!roundOpen_) {
        return R::error(SimError(
            ErrorCode::AlreadyFinalized,
            "Course registration has already been submitted for this round."));
    }
    return R::okay(std::monostate{});
}

DraftEntry* DraftRegistrar::findDraft(const std::string& sectionId)
{
    auto it = std::find_if(draft_.begin(), draft_.end(), [&](const DraftEntry& entry) {
        return entry.sectionId == sectionId;
    });
    return it == draft_.end() ? nullptr : &*it;
}

Result<DraftEntry, SimError> DraftRegistrar::add(
    const CourseCatalog& catalog, const std::string& sectionId)
{
    using R = Result<DraftEntry, SimError>;

    auto open = requireOpen();
    if (open.isError()) {
        return R::error(open.errorValue());
    }
    if (sectionId.empty()) {
        return R::error(SimError(ErrorCode::Validation, "Section ID is required."));
    }
    if (!catalog.find(sectionId)) {
        return R::error(
            SimError(ErrorCode::NotFound, "Course '" + sectionId + "' does not exist."));
    }
    if (findDraft(sectionId)) {
        return R::error(SimError(
            ErrorCode::Conflict, "Course '" + sectionId + "' is already in your draft schedule."));
    }

    draft_.push_back(DraftEntry{ .sectionId = sectionId, .pass = std::nullopt });
    LOG_INFO(Courses, "Drafted {}", sectionId);
    return R::okay(draft_.back());
}

Result<DraftEntry, SimError> DraftRegistrar::remove(const std::string& sectionId)
{
    using R = Result<DraftEntry, SimError>;

    auto open = requireOpen();
    if (open.isError()) {
        return R::error(open.errorValue());
    }
    auto it = std::find_if(draft_.begin(), draft_.end(), [&](const DraftEntry& entry) {
        return entry.sectionId == sectionId;
    });
    if (it == draft_.end()) {
        return R::error(SimError(
            ErrorCode::NotFound, "Course '" + sectionId + "' is not in your draft schedule."));
    }

    DraftEntry removed = *it;
    draft_.erase(it);
    LOG_INFO(Courses, "Removed {} from draft", sectionId);
    return R::okay(std::move(removed));
}

Result<DraftEntry, SimError> DraftRegistrar::assignPass(
    const std::string& sectionId, const std::string& pass)
{
    using R = Result<DraftEntry, SimError>;

    auto open = requireOpen();
    if (open.isError()) {
        return R::error(open.errorValue());
    }
    const auto passType = passTypeFromString(pass);
    if (!passType) {
        return R::error(
            SimError(ErrorCode::Validation, "Pass type must be 'S-Pass', 'A-Pass', or 'B-Pass'."));
    }
    DraftEntry* entry = findDraft(sectionId);
    if (!entry) {
        return R::error(SimError(
            ErrorCode::NotFound, "Course '" + sectionId + "' is not in your draft schedule."));
    }

    entry->pass = *passType;
    LOG_INFO(Courses, "Assigned {} to {}", toString(*passType), sectionId);
    return R::okay(*entry);
}

Result<SubmissionResult, SimError> DraftRegistrar::submit(const CourseCatalog& catalog)
{
    using R = Result<SubmissionResult, SimError>;

    auto open = requireOpen();
    if (open.isError()) {
        return R::error(open.errorValue());
    }
    if (draft_.empty()) {
        return R::error(SimError(ErrorCode::Validation, "Cannot submit empty draft schedule."));
    }

    SubmissionResult result;
    for (const auto& entry : draft_) {
        RegistrationOutcome outcome{ .sectionId = entry.sectionId, .pass = entry.pass };
        const CourseSection* section = catalog.find(entry.sectionId);
        if (!section) {
            outcome.reason = "Course not found";
        }
        else if (!entry.pass) {
            outcome.popularity = section->popularity;
            outcome.reason = "No pass assigned";
        }
        else {
            outcome.popularity = section->popularity;
            outcome.success = passAdmits(*entry.pass, section->popularity);
            outcome.reason = outcome.success
                ? "Registered with " + toString(*entry.pass)
                : "Course too popular for " + toString(*entry.pass)
                    + " (popularity: " + std::to_string(section->popularity) + ")";
        }

        if (outcome.success) {
            ++result.successCount;
            const bool enrolled = std::any_of(
                enrollment_.begin(), enrollment_.end(), [&](const Enrollment& e) {
                    return e.sectionId == entry.sectionId;
                });
            if (!enrolled) {
                enrollment_.push_back(
                    Enrollment{
                        .sectionId = entry.sectionId, .pass = *entry.pass, .round = round_ });
            }
        }
        LOG_DEBUG(Courses, "Submit {}: {}", entry.sectionId, outcome.reason);
        result.outcomes.push_back(std::move(outcome));
    }

    draft_.clear();
    roundOpen_ = false;
    LOG_INFO(
        Courses,
        "Registration round {} submitted: {}/{} registered",
        round_,
        result.successCount,
        result.outcomes.size());
    return R::okay(std::move(result));
}

void DraftRegistrar::openRound()
{
    ++round_;
    roundOpen_ = true;
    draft_.clear();
    LOG_INFO(Courses, "Registration round {} opened", round_);
}

} // namespace CampusSim
