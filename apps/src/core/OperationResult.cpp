#include "OperationResult.h"

namespace CampusSim {

const char* toString(OperationStatus status)
{
    switch (status) {
        case OperationStatus::Success:
            return "success";
        case OperationStatus::Failure:
            return "failure";
        case OperationStatus::Error:
            return "error";
    }
    return "error";
}

OperationResult OperationResult::success(std::string message, std::optional<nlohmann::json> data)
{
    return OperationResult{
        .status = OperationStatus::Success,
        .message = std::move(message),
        .data = std::move(data),
        .errorCode = std::nullopt,
    };
}

OperationResult OperationResult::failure(const SimError& error)
{
    // Internal faults are never reported as ordinary failures.
    const OperationStatus status =
        error.code == ErrorCode::Internal ? OperationStatus::Error : OperationStatus::Failure;
    return OperationResult{
        .status = status,
        .message = error.message,
        .data = std::nullopt,
        .errorCode = error.code,
    };
}

OperationResult OperationResult::error(std::string message)
{
    return OperationResult{
        .status = OperationStatus::Error,
        .message = std::move(message),
        .data = std::nullopt,
        .errorCode = ErrorCode::Internal,
    };
}

nlohmann::json OperationResult::toJson() const
{
    return nlohmann::json{
        { "status", toString(status) },
        { "message", message },
        { "data", data ? *data : nlohmann::json(nullptr) },
        { "error_code",
          errorCode ? nlohmann::json(toString(*errorCode)) : nlohmann::json(nullptr) },
    };
}

} // namespace CampusSim
