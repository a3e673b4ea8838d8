#include "SimConfig.h"
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace CampusSim {

void from_json(const nlohmann::json& j, AvailabilityConfig& config)
{
    if (!j.is_object()) {
        throw std::runtime_error("availability config must be a JSON object");
    }

    if (j.contains("time_slots")) {
        config.timeSlots = j.at("time_slots").get<std::vector<TimeRange>>();
    }
    if (j.contains("property_pool")) {
        config.propertyPool = j.at("property_pool").get<std::vector<std::string>>();
    }
    config.minItemsPerSlot = j.value("min_items_per_slot", config.minItemsPerSlot);
    config.maxItemsPerSlot = j.value("max_items_per_slot", config.maxItemsPerSlot);
    config.propertiesPerItem = j.value("properties_per_item", config.propertiesPerItem);
    config.seedSalt = j.value("seed_salt", config.seedSalt);

    if (config.timeSlots.empty()) {
        throw std::runtime_error("availability.time_slots must not be empty");
    }
    if (config.minItemsPerSlot < 0 || config.maxItemsPerSlot < config.minItemsPerSlot) {
        throw std::runtime_error("availability item counts must satisfy 0 <= min <= max");
    }
    if (config.propertiesPerItem < 0
        || config.propertiesPerItem > static_cast<int>(config.propertyPool.size())) {
        throw std::runtime_error("availability.properties_per_item exceeds the property pool");
    }
}

void to_json(nlohmann::json& j, const AvailabilityConfig& config)
{
    j = nlohmann::json{
        { "time_slots", config.timeSlots },
        { "property_pool", config.propertyPool },
        { "min_items_per_slot", config.minItemsPerSlot },
        { "max_items_per_slot", config.maxItemsPerSlot },
        { "properties_per_item", config.propertiesPerItem },
        { "seed_salt", config.seedSalt },
    };
}

void from_json(const nlohmann::json& j, SimConfig& config)
{
    if (!j.is_object()) {
        throw std::runtime_error("SimConfig must be a JSON object");
    }

    config.dataDir = j.value("data_dir", config.dataDir);
    config.defaultLocationId = j.value("default_location_id", config.defaultLocationId);
    if (j.contains("start_time")) {
        config.startTime = j.at("start_time").get<SimTime>();
    }
    if (j.contains("day_start")) {
        auto minute = parseClockTime(j.at("day_start").get<std::string>());
        if (!minute.has_value() || minute.value() >= kMinutesPerDay) {
            throw std::runtime_error("day_start must be HH:MM");
        }
        config.dayStartMinute = minute.value();
    }
    if (j.contains("advisor_working_slots")) {
        config.advisorWorkingSlots = j.at("advisor_working_slots").get<std::vector<TimeRange>>();
    }
    if (j.contains("availability")) {
        from_json(j.at("availability"), config.availability);
    }
    config.logSpec = j.value("log_spec", config.logSpec);
}

void to_json(nlohmann::json& j, const SimConfig& config)
{
    j = nlohmann::json{
        { "data_dir", config.dataDir },
        { "default_location_id", config.defaultLocationId },
        { "start_time", config.startTime },
        { "day_start", formatClockTime(config.dayStartMinute) },
        { "advisor_working_slots", config.advisorWorkingSlots },
        { "availability", config.availability },
        { "log_spec", config.logSpec },
    };
}

} // namespace CampusSim
