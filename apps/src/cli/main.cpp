#include "api/OperationDispatcher.h"
#include "core/CampusData.h"
#include "core/CampusWorldState.h"
#include "core/ConfigLoader.h"
#include "core/LoggingChannels.h"
#include "core/SimConfig.h"
#include <args.hxx>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>

using namespace CampusSim;

namespace {

std::string getExamplesHelp()
{
    return "Reads one JSON command per line and prints one JSON result per line.\n\n"
           "Examples:\n"
           "  echo '{\"command\": \"get_current_time\"}' | campussim-cli --data-dir data\n"
           "  campussim-cli --config-dir config --log '*:warn,booking:debug' task.jsonl\n"
           "  campussim-cli --snapshot task.jsonl\n";
}

// Missing campussim.json is fine; a present but broken one is a startup error.
std::optional<SimConfig> loadConfig()
{
    auto result = ConfigLoader::loadOrDefault<SimConfig>("campussim.json");
    if (result.isError()) {
        std::cerr << "Error: " << result.errorValue() << std::endl;
        return std::nullopt;
    }
    return result.value();
}

// Comments (#) and blank lines are skipped.
bool isCommandLine(const std::string& line)
{
    const auto first = line.find_first_not_of(" \t\r");
    return first != std::string::npos && line[first] != '#';
}

int runScript(std::istream& input, OperationDispatcher& dispatcher)
{
    std::string line;
    size_t processed = 0;
    while (std::getline(input, line)) {
        if (!isCommandLine(line)) {
            continue;
        }
        const OperationResult result = dispatcher.handleLine(line);
        std::cout << result.toJson().dump() << std::endl;
        ++processed;
    }
    SLOG_DEBUG("Processed {} commands", processed);
    return 0;
}

} // namespace

int main(int argc, char** argv)
{
    // Initialize logging channels (creates default logger named "cli" to stderr).
    LoggingChannels::initialize(spdlog::level::warn, spdlog::level::debug, "cli", true);

    // Parse command line arguments.
    args::ArgumentParser parser(
        "Campus Simulator CLI",
        "Drive the campus world with JSON commands.\n\n" + getExamplesHelp());

    args::HelpFlag help(parser, "help", "Display this help menu", { 'h', "help" });
    args::ValueFlag<std::string> configDir(
        parser, "config-dir", "Directory searched first for campussim.json", { "config-dir" });
    args::ValueFlag<std::string> dataDir(
        parser,
        "data-dir",
        "Directory holding map.json, courses.json and calendar_seed.json",
        { "data-dir" });
    args::ValueFlag<std::string> logSpec(
        parser, "log", "Channel log levels, e.g. '*:warn,booking:debug'", { "log" });
    args::Flag snapshot(
        parser, "snapshot", "Print the full world snapshot after the last command", { "snapshot" });
    args::Positional<std::string> script(
        parser, "script", "File with one JSON command per line (default: stdin)");

    try {
        parser.ParseCLI(argc, argv);
    }
    catch (const args::Help&) {
        std::cout << parser;
        return 0;
    }
    catch (const args::ParseError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return 1;
    }

    if (configDir) {
        ConfigLoader::setConfigDir(args::get(configDir));
    }
    auto config = loadConfig();
    if (!config) {
        return 1;
    }
    if (dataDir) {
        config->dataDir = args::get(dataDir);
    }

    // The --log flag wins over log_spec from the config file.
    if (!config->logSpec.empty()) {
        LoggingChannels::configureFromString(config->logSpec);
    }
    if (logSpec) {
        LoggingChannels::configureFromString(args::get(logSpec));
    }

    auto data = CampusData::loadFromDirectory(config->dataDir);
    if (data.isError()) {
        std::cerr << "Error: " << data.errorValue() << std::endl;
        return 1;
    }

    auto world = CampusWorldState::create(std::move(data).value(), *config);
    if (world.isError()) {
        std::cerr << "Error: " << world.errorValue() << std::endl;
        return 1;
    }

    OperationDispatcher dispatcher(*world.value());

    int exitCode = 0;
    if (script) {
        const std::filesystem::path path = args::get(script);
        std::ifstream input(path);
        if (!input.is_open()) {
            std::cerr << "Error: cannot open script " << path.string() << std::endl;
            return 1;
        }
        exitCode = runScript(input, dispatcher);
    }
    else {
        exitCode = runScript(std::cin, dispatcher);
    }

    if (snapshot) {
        std::cout << world.value()->snapshot().dump(2) << std::endl;
    }
    return exitCode;
}
