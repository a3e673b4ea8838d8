#pragma once

#include "SimTime.h"
#include <cstdint>
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <vector>

namespace CampusSim {

/**
 * @brief Parameters of the seeded availability grid generator.
 */
struct AvailabilityConfig {
    std::vector<TimeRange> timeSlots = {
        { .startMinute = 9 * 60, .endMinute = 10 * 60 + 30 },
        { .startMinute = 10 * 60 + 30, .endMinute = 12 * 60 },
        { .startMinute = 14 * 60, .endMinute = 15 * 60 + 30 },
        { .startMinute = 15 * 60 + 30, .endMinute = 17 * 60 },
        { .startMinute = 16 * 60 + 30, .endMinute = 18 * 60 },
    };
    std::vector<std::string> propertyPool = { "good_wifi", "projector", "whiteboard", "quiet" };
    int minItemsPerSlot = 1;
    int maxItemsPerSlot = 3;
    int propertiesPerItem = 2;
    uint64_t seedSalt = 0;
};

/**
 * @brief Runtime configuration, loaded from campussim.json via ConfigLoader.
 *
 * Every key is optional; missing keys keep the defaults below.
 */
struct SimConfig {
    std::string dataDir = "data";
    std::string defaultLocationId = "B083";
    SimTime startTime = { .date = { .week = 1, .day = Weekday::Monday }, .minuteOfDay = 8 * 60 };
    int dayStartMinute = 8 * 60;
    std::vector<TimeRange> advisorWorkingSlots = {
        { .startMinute = 9 * 60, .endMinute = 10 * 60 },
        { .startMinute = 10 * 60, .endMinute = 11 * 60 },
        { .startMinute = 11 * 60, .endMinute = 12 * 60 },
        { .startMinute = 13 * 60, .endMinute = 14 * 60 },
        { .startMinute = 14 * 60, .endMinute = 15 * 60 },
        { .startMinute = 15 * 60, .endMinute = 16 * 60 },
        { .startMinute = 16 * 60, .endMinute = 17 * 60 },
    };
    AvailabilityConfig availability;
    std::string logSpec;
};

void from_json(const nlohmann::json& j, AvailabilityConfig& config);
void to_json(nlohmann::json& j, const AvailabilityConfig& config);

void from_json(const nlohmann::json& j, SimConfig& config);
void to_json(nlohmann::json& j, const SimConfig& config);

} // namespace CampusSim
