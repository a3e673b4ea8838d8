#pragma once

#include "SimError.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace CampusSim {

enum class OperationStatus { Success, Failure, Error };

const char* toString(OperationStatus status);

/**
 * @brief Structured outcome of every world operation.
 *
 * Failure carries a recoverable ErrorCode; Error marks an internal fault. Serialized as
 * {"status", "message", "data", "error_code"}.
 */
struct OperationResult {
    OperationStatus status = OperationStatus::Success;
    std::string message;
    std::optional<nlohmann::json> data;
    std::optional<ErrorCode> errorCode;

    static OperationResult success(
        std::string message, std::optional<nlohmann::json> data = std::nullopt);
    static OperationResult failure(const SimError& error);
    static OperationResult error(std::string message);

    bool isSuccess() const { return status == OperationStatus::Success; }

    nlohmann::json toJson() const;
};

} // namespace CampusSim
