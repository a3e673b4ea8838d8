#include "ConfigLoader.h"
#include "LoggingChannels.h"
#include <cstdlib>
#include <fstream>

namespace CampusSim {

namespace {

JsonResult fail(std::string message)
{
    SLOG_WARN("ConfigLoader: {}", message);
    return JsonResult::error(std::move(message));
}

bool isFile(const std::filesystem::path& path)
{
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

} // namespace

std::optional<std::string> ConfigLoader::explicitConfigDir_ = std::nullopt;

void ConfigLoader::setConfigDir(const std::string& path)
{
    explicitConfigDir_ = path;
}

void ConfigLoader::clearConfigDir()
{
    explicitConfigDir_ = std::nullopt;
}

std::vector<std::filesystem::path> ConfigLoader::getSearchPaths()
{
    namespace fs = std::filesystem;
    std::vector<fs::path> paths;

    if (explicitConfigDir_) {
        paths.emplace_back(*explicitConfigDir_);
    }
    if (const char* dir = std::getenv("CAMPUSSIM_CONFIG_DIR"); dir && *dir) {
        paths.emplace_back(dir);
    }
    paths.push_back(fs::current_path() / "config");
    if (const char* home = std::getenv("HOME")) {
        paths.push_back(fs::path(home) / ".config" / "campussim");
    }
    paths.emplace_back("/etc/campussim");

    return paths;
}

std::optional<std::filesystem::path> ConfigLoader::findConfigFile(const std::string& filename)
{
    for (const auto& dir : getSearchPaths()) {
        for (const auto& candidate : { dir / (filename + ".local"), dir / filename }) {
            if (isFile(candidate)) {
                SLOG_DEBUG("ConfigLoader: {} resolved to {}", filename, candidate.string());
                return candidate;
            }
        }
    }
    return std::nullopt;
}

JsonResult ConfigLoader::readJsonFile(const std::filesystem::path& path)
{
    if (!isFile(path)) {
        // Missing files are routine for optional inputs; no warning.
        return JsonResult::error("File not found: " + path.string());
    }

    try {
        if (std::filesystem::file_size(path) == 0) {
            return fail("Empty config file: " + path.string());
        }
        std::ifstream file(path);
        if (!file.is_open()) {
            return fail("Cannot open file: " + path.string());
        }
        return JsonResult::okay(nlohmann::json::parse(file));
    }
    catch (const nlohmann::json::parse_error& e) {
        return fail("Parse error in " + path.string() + ": " + e.what());
    }
    catch (const std::exception& e) {
        return fail("Error reading " + path.string() + ": " + e.what());
    }
}

} // namespace CampusSim
