#pragma once

#include <string_view>

namespace CampusSim {

/**
 * @brief Define the wire name of the command declared in the enclosing namespace.
 *
 * Usage: DEFINE_API_NAME("find_optimal_path"); at the top of the command's namespace.
 */
#define DEFINE_API_NAME(WireName)                                 \
    inline constexpr std::string_view api_name = WireName;        \
    static_assert(!api_name.empty(), "API name must not be empty")

/**
 * @brief Add name() method to Command structs.
 *
 * Usage: API_COMMAND_NAME() inside the Command struct definition.
 * Returns the api_name defined in the namespace.
 */
#define API_COMMAND_NAME()                   \
    static constexpr std::string_view name() \
    {                                        \
        return api_name;                     \
    }

/**
 * @brief Declare toJson()/fromJson() for a Command struct.
 *
 * Usage: API_COMMAND() inside the Command struct; define both in the .cpp.
 */
#define API_COMMAND()                      \
    API_COMMAND_NAME()                     \
    nlohmann::json toJson() const;         \
    static Command fromJson(const nlohmann::json& j)

} // namespace CampusSim
