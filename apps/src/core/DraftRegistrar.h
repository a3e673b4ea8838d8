#pragma once

#include "CourseCatalog.h"
#include "Result.h"
#include "SimError.h"
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace CampusSim {

enum class PassType { S, A, B };

// "S-Pass", "A-Pass", "B-Pass".
std::string toString(PassType pass);

// Accepts the full names above or the bare letters, case-insensitively.
std::optional<PassType> passTypeFromString(const std::string& str);

// S always succeeds; A below popularity 95; B below popularity 85.
bool passAdmits(PassType pass, int popularity);

struct DraftEntry {
    std::string sectionId;
    std::optional<PassType> pass;
};

struct RegistrationOutcome {
    std::string sectionId;
    std::optional<PassType> pass;
    int popularity = 0;
    bool success = false;
    std::string reason;
};

struct SubmissionResult {
    std::vector<RegistrationOutcome> outcomes;
    int successCount = 0;
};

struct Enrollment {
    std::string sectionId;
    PassType pass = PassType::S;
    int round = 1;
};

void to_json(nlohmann::json& j, const DraftEntry& entry);
void to_json(nlohmann::json& j, const RegistrationOutcome& outcome);
void to_json(nlohmann::json& j, const SubmissionResult& result);
void to_json(nlohmann::json& j, const Enrollment& enrollment);

/**
 * @brief The agent's course draft and the pass-based commit step.
 *
 * A registration round accepts draft edits until a successful submit. Submission reads
 * popularity from the catalog at that moment, records each admitted entry as an
 * enrollment, clears the draft and closes the round. Only openRound() starts another.
 */
class DraftRegistrar {
public:
    Result<DraftEntry, SimError> add(const CourseCatalog& catalog, const std::string& sectionId);
    Result<DraftEntry, SimError> remove(const std::string& sectionId);
    Result<DraftEntry, SimError> assignPass(const std::string& sectionId, const std::string& pass);
    Result<SubmissionResult, SimError> submit(const CourseCatalog& catalog);

    void openRound();

    const std::vector<DraftEntry>& draft() const { return draft_; }
    const std::vector<Enrollment>& enrollment() const { return enrollment_; }
    bool isRoundOpen() const { return roundOpen_; }
    int round() const { return round_; }

private:
    Result<std::monostate, SimError> requireOpen() const;
    DraftEntry* findDraft(const std::string& sectionId);

    std::vector<DraftEntry> draft_;
    std::vector<Enrollment> enrollment_;
    bool roundOpen_ = true;
    int round_ = 1;
};

} // namespace CampusSim
