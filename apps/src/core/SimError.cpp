#include "SimError.h"
#include <array>
#include <utility>

namespace CampusSim {

namespace {

constexpr std::array<std::pair<ErrorCode, const char*>, 7> kErrorCodeNames = { {
    { ErrorCode::Validation, "VALIDATION" },
    { ErrorCode::PermissionDenied, "PERMISSION_DENIED" },
    { ErrorCode::NotFound, "NOT_FOUND" },
    { ErrorCode::Conflict, "CONFLICT" },
    { ErrorCode::InvalidPath, "INVALID_PATH" },
    { ErrorCode::AlreadyFinalized, "ALREADY_FINALIZED" },
    { ErrorCode::Internal, "INTERNAL" },
} };

} // namespace

const char* toString(ErrorCode code)
{
    for (const auto& [value, name] : kErrorCodeNames) {
        if (value == code) {
            return name;
        }
    }
    return "INTERNAL";
}

std::optional<ErrorCode> errorCodeFromString(const std::string& str)
{
    for (const auto& [value, name] : kErrorCodeNames) {
        if (str == name) {
            return value;
        }
    }
    return std::nullopt;
}

} // namespace CampusSim
