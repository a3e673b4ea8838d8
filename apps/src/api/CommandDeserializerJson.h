#pragma once

#include "ApiCommand.h"
#include "core/Result.h"
#include "core/SimError.h"
#include <nlohmann/json.hpp>
#include <string>

namespace CampusSim {

/**
 * @brief Turns a JSON command object into a typed ApiCommand.
 *
 * Input shape: {"command": "<wire name>", ...arguments}. Malformed JSON, a missing or
 * unknown command name and bad arguments are all reported as Validation errors.
 */
class CommandDeserializerJson {
public:
    Result<ApiCommand, SimError> deserialize(const std::string& commandJson);
    Result<ApiCommand, SimError> deserialize(const nlohmann::json& cmd);
};

} // namespace CampusSim
