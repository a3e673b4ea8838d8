#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace CampusSim {
namespace ApiJson {

// Field readers for command arguments. All throw std::invalid_argument with the field
// name when a value is missing or has the wrong type.
std::string requireString(const nlohmann::json& j, const char* key);
std::optional<std::string> optionalString(const nlohmann::json& j, const char* key);
int requireInt(const nlohmann::json& j, const char* key);
std::optional<int> optionalInt(const nlohmann::json& j, const char* key);

// A list of strings, a single string, or absent (empty).
std::vector<std::string> stringList(const nlohmann::json& j, const char* key);

const nlohmann::json& optionalObject(const nlohmann::json& j, const char* key);

template <typename T>
void putOptional(nlohmann::json& j, const char* key, const std::optional<T>& value)
{
    if (value) {
        j[key] = *value;
    }
}

} // namespace ApiJson
} // namespace CampusSim
