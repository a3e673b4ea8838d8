#pragma once

#include <optional>
#include <string>
#include <utility>

namespace CampusSim {

/**
 * @brief Machine-readable failure classes reported by every operation.
 *
 * All codes except Internal are recoverable validation outcomes; Internal marks an
 * unexpected inconsistency and is surfaced as an ERROR result.
 */
enum class ErrorCode {
    Validation,
    PermissionDenied,
    NotFound,
    Conflict,
    InvalidPath,
    AlreadyFinalized,
    Internal,
};

const char* toString(ErrorCode code);
std::optional<ErrorCode> errorCodeFromString(const std::string& str);

struct SimError {
    SimError() = default;
    SimError(ErrorCode code, std::string message) : code(code), message(std::move(message)) {}

    ErrorCode code = ErrorCode::Internal;
    std::string message;
};

} // namespace CampusSim
