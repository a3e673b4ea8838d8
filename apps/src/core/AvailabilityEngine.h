#pragma once

#include "MapGraph.h"
#include "Result.h"
#include "SimConfig.h"
#include "SimError.h"
#include "SimTime.h"
#include <map>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace CampusSim {

struct SlotEntry {
    std::string item;
    std::optional<std::string> seat;
    std::vector<std::string> properties;
    bool booked = false;
};

struct AvailabilityGrid {
    std::string locationId;
    SimDate date;
    std::map<TimeRange, std::vector<SlotEntry>> slots;

    // Entry offered in a slot that covers timeSlot. Without a seat only whole-item
    // entries match.
    const SlotEntry* findEntry(
        const std::string& item,
        const std::optional<std::string>& seat,
        const TimeRange& timeSlot) const;
};

struct GroundTruthItem {
    std::string item;
    std::optional<std::string> seat;
};

/**
 * @brief Hidden-constraint booking puzzle for one (location, date).
 *
 * The target slot offers the ground-truth items carrying every required property and
 * distractors that each lack at least one of them.
 */
struct AvailabilityPuzzle {
    std::string locationId;
    SimDate date;
    TimeRange timeSlot;
    std::vector<GroundTruthItem> groundTruth;
    std::vector<std::string> requiredProperties;
    int distractorCount = 2;
};

struct PinnedAvailability {
    std::string locationId;
    std::string item;
    std::optional<std::string> seat;
    SimDate date;
    TimeRange timeSlot;
    std::vector<std::string> properties;
};

void to_json(nlohmann::json& j, const SlotEntry& entry);
void to_json(nlohmann::json& j, const AvailabilityGrid& grid);

// Seat identifier "<location>-<ITEM_CODE>-S<nnn>".
std::string makeSeatId(const std::string& locationId, const std::string& item, int seatNumber);

/**
 * @brief Seeded, cached availability grids per (location, date).
 *
 * A grid is generated the first time its key is requested and never changes after
 * that. Generation is a pure function of the location, the date, the registered puzzle
 * and pins for the key, and the configuration. Random draws come straight from
 * std::mt19937_64, whose output sequence is fixed by the standard.
 */
class AvailabilityEngine {
public:
    AvailabilityEngine(const MapGraph& graph, AvailabilityConfig config);

    Result<std::monostate, SimError> registerPuzzle(AvailabilityPuzzle puzzle);
    Result<std::monostate, SimError> pin(PinnedAvailability pinned);

    // Generates on first use. NotFound for unknown locations.
    Result<const AvailabilityGrid*, SimError> grid(
        const std::string& locationId, const SimDate& date);

    // The grid grid() would return, without caching a newly generated one.
    Result<AvailabilityGrid, SimError> preview(
        const std::string& locationId, const SimDate& date) const;

    bool isMaterialized(const std::string& locationId, const SimDate& date) const;
    size_t materializedCount() const { return cache_.size(); }

    static uint64_t seedFor(const std::string& locationId, const SimDate& date, uint64_t salt);

private:
    using Key = std::pair<std::string, SimDate>;

    Result<std::monostate, SimError> checkOpen(
        const std::string& locationId, const SimDate& date) const;
    AvailabilityGrid generate(const Location& location, const SimDate& date) const;

    const MapGraph& graph_;
    AvailabilityConfig config_;
    std::map<Key, AvailabilityGrid> cache_;
    std::map<Key, AvailabilityPuzzle> puzzles_;
    std::map<Key, std::vector<PinnedAvailability>> pins_;
};

} // namespace CampusSim
