#include "ApiJson.h"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace CampusSim {
namespace ApiJson {

namespace {

bool present(const nlohmann::json& j, const char* key)
{
    return j.is_object() && j.contains(key) && !j.at(key).is_null();
}

} // namespace

std::string requireString(const nlohmann::json& j, const char* key)
{
    if (!present(j, key)) {
        throw std::invalid_argument(std::string("missing required field '") + key + "'");
    }
    const auto& value = j.at(key);
    if (!value.is_string()) {
        throw std::invalid_argument(std::string("field '") + key + "' must be a string");
    }
    return value.get<std::string>();
}

std::optional<std::string> optionalString(const nlohmann::json& j, const char* key)
{
    if (!present(j, key)) {
        return std::nullopt;
    }
    return requireString(j, key);
}

int requireInt(const nlohmann::json& j, const char* key)
{
    if (!present(j, key)) {
        throw std::invalid_argument(std::string("missing required field '") + key + "'");
    }
    const auto& value = j.at(key);
    if (value.is_number_integer()) {
        return value.get<int>();
    }
    // Ids are often sent as strings ("3").
    if (value.is_string()) {
        const std::string text = value.get<std::string>();
        const bool digits = !text.empty() && text.size() <= 9
            && std::all_of(text.begin(), text.end(), [](unsigned char c) {
                   return std::isdigit(c);
               });
        if (digits) {
            return std::stoi(text);
        }
    }
    throw std::invalid_argument(std::string("field '") + key + "' must be an integer");
}

std::optional<int> optionalInt(const nlohmann::json& j, const char* key)
{
    if (!present(j, key)) {
        return std::nullopt;
    }
    return requireInt(j, key);
}

std::vector<std::string> stringList(const nlohmann::json& j, const char* key)
{
    if (!present(j, key)) {
        return {};
    }
    const auto& value = j.at(key);
    if (value.is_string()) {
        return { value.get<std::string>() };
    }
    if (!value.is_array()) {
        throw std::invalid_argument(std::string("field '") + key + "' must be a list of strings");
    }
    std::vector<std::string> out;
    for (const auto& element : value) {
        if (!element.is_string()) {
            throw std::invalid_argument(
                std::string("field '") + key + "' must be a list of strings");
        }
        out.push_back(element.get<std::string>());
    }
    return out;
}

const nlohmann::json& optionalObject(const nlohmann::json& j, const char* key)
{
    static const nlohmann::json kEmpty = nlohmann::json::object();
    if (!present(j, key)) {
        return kEmpty;
    }
    const auto& value = j.at(key);
    if (!value.is_object()) {
        throw std::invalid_argument(std::string("field '") + key + "' must be an object");
    }
    return value;
}

} // namespace ApiJson
} // namespace CampusSim
