#pragma once

#include "Result.h"
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace CampusSim {

using JsonResult = Result<nlohmann::json, std::string>;

/**
 * @brief Finds and parses campussim JSON files.
 *
 * Search order for named config files (first match wins):
 * 1. Directory set with setConfigDir() (the CLI's --config-dir)
 * 2. $CAMPUSSIM_CONFIG_DIR
 * 3. ./config/
 * 4. ~/.config/campussim/
 * 5. /etc/campussim/
 *
 * In each directory a "<name>.local" file shadows "<name>" completely; the two are never
 * merged. Campus data files are read by exact path with readJsonFile().
 */
class ConfigLoader {
public:
    static void setConfigDir(const std::string& path);
    static void clearConfigDir();

    static std::vector<std::filesystem::path> getSearchPaths();
    static std::optional<std::filesystem::path> findConfigFile(const std::string& filename);

    static JsonResult readJsonFile(const std::filesystem::path& path);

    // Error when the file is absent, unreadable, or rejected by T's from_json.
    template <typename T>
    static Result<T, std::string> load(const std::string& filename);

    // Like load(), but a file that exists nowhere on the search path yields T{}.
    template <typename T>
    static Result<T, std::string> loadOrDefault(const std::string& filename);

private:
    template <typename T>
    static Result<T, std::string> parseAs(const nlohmann::json& json, const std::string& origin);

    static std::optional<std::string> explicitConfigDir_;
};

template <typename T>
Result<T, std::string> ConfigLoader::parseAs(const nlohmann::json& json, const std::string& origin)
{
    try {
        T config;
        // Unqualified so ADL finds the config type's from_json.
        from_json(json, config);
        return Result<T, std::string>::okay(std::move(config));
    }
    catch (const std::exception& e) {
        return Result<T, std::string>::error("Failed to parse " + origin + ": " + e.what());
    }
}

template <typename T>
Result<T, std::string> ConfigLoader::load(const std::string& filename)
{
    const auto path = findConfigFile(filename);
    if (!path) {
        return Result<T, std::string>::error("Config file not found: " + filename);
    }
    auto json = readJsonFile(*path);
    if (json.isError()) {
        return Result<T, std::string>::error(json.errorValue());
    }
    return parseAs<T>(json.value(), path->filename().string());
}

template <typename T>
Result<T, std::string> ConfigLoader::loadOrDefault(const std::string& filename)
{
    if (!findConfigFile(filename)) {
        return Result<T, std::string>::okay(T{});
    }
    return load<T>(filename);
}

} // namespace CampusSim
