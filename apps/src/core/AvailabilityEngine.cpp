#include "AvailabilityEngine.h"
#include "Hash.h"
#include "LoggingChannels.h"
#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>
#include <nlohmann/json.hpp>
#include <random>

namespace CampusSim {

namespace {

constexpr std::array<const char*, 4> kItemTemplates = {
    "Study Room", "Meeting Room", "Conference Room", "Seminar Room"
};
constexpr int kFirstRoomNumber = 101;
constexpr int kRoomNumberCount = 199;

class Draws {
public:
    explicit Draws(uint64_t seed) : rng_(seed) {}

    // Raw modulo keeps the sequence independent of the standard library's distributions.
    size_t below(size_t n) { return n == 0 ? 0 : static_cast<size_t>(rng_() % n); }

private:
    std::mt19937_64 rng_;
};

bool sameOffer(const SlotEntry& a, const SlotEntry& b)
{
    return a.item == b.item && a.seat == b.seat;
}

bool containsOffer(const std::vector<SlotEntry>& entries, const SlotEntry& entry)
{
    return std::any_of(entries.begin(), entries.end(), [&](const SlotEntry& existing) {
        return sameOffer(existing, entry);
    });
}

void normalizeProperties(std::vector<std::string>& properties)
{
    std::sort(properties.begin(), properties.end());
    properties.erase(std::unique(properties.begin(), properties.end()), properties.end());
}

std::vector<std::string> drawProperties(const AvailabilityConfig& config, Draws& draws)
{
    std::vector<std::string> pool = config.propertyPool;
    const size_t count = std::min(static_cast<size_t>(config.propertiesPerItem), pool.size());
    for (size_t i = 0; i < count; ++i) {
        std::swap(pool[i], pool[i + draws.below(pool.size() - i)]);
    }
    pool.resize(count);
    normalizeProperties(pool);
    return pool;
}

SlotEntry drawEntry(const Location& location, const AvailabilityConfig& config, Draws& draws)
{
    SlotEntry entry;
    if (!location.bookableItems.empty()) {
        const auto& items = location.bookableItems;
        const BookableItem& item = items[draws.below(items.size())];
        entry.item = item.name;
        if (item.seats > 0) {
            const size_t seat = draws.below(static_cast<size_t>(item.seats));
            entry.seat = makeSeatId(location.id, item.name, 1 + static_cast<int>(seat));
        }
        if (item.properties.empty()) {
            entry.properties = drawProperties(config, draws);
        }
        else {
            entry.properties = item.properties;
            normalizeProperties(entry.properties);
        }
        return entry;
    }

    const char* name = kItemTemplates[draws.below(kItemTemplates.size())];
    const int number = kFirstRoomNumber + static_cast<int>(draws.below(kRoomNumberCount));
    entry.item = std::string(name) + " " + std::to_string(number);
    entry.properties = drawProperties(config, draws);
    return entry;
}

std::vector<SlotEntry> drawSlot(
    const Location& location, const AvailabilityConfig& config, Draws& draws)
{
    const int span = std::max(0, config.maxItemsPerSlot - config.minItemsPerSlot);
    const int count =
        config.minItemsPerSlot + static_cast<int>(draws.below(static_cast<size_t>(span) + 1));

    std::vector<SlotEntry> entries;
    for (int i = 0; i < count; ++i) {
        SlotEntry entry = drawEntry(location, config, draws);
        if (!containsOffer(entries, entry)) {
            entries.push_back(std::move(entry));
        }
    }
    return entries;
}

std::vector<std::string> catalogProperties(const Location& location, const std::string& item)
{
    for (const auto& bookable : location.bookableItems) {
        if (bookable.name == item) {
            return bookable.properties;
        }
    }
    return {};
}

std::vector<SlotEntry> puzzleSlot(
    const Location& location,
    const AvailabilityPuzzle& puzzle,
    const AvailabilityConfig& config,
    Draws& draws)
{
    std::vector<SlotEntry> entries;
    for (const auto& truth : puzzle.groundTruth) {
        SlotEntry entry{
            .item = truth.item, .seat = truth.seat, .properties = {}, .booked = false
        };
        entry.properties = catalogProperties(location, truth.item);
        entry.properties.insert(
            entry.properties.end(),
            puzzle.requiredProperties.begin(),
            puzzle.requiredProperties.end());
        if (entry.properties.empty()) {
            entry.properties = drawProperties(config, draws);
        }
        normalizeProperties(entry.properties);
        if (!containsOffer(entries, entry)) {
            entries.push_back(std::move(entry));
        }
    }

    // Without hidden requirements every item would satisfy them, so no distractors.
    if (puzzle.requiredProperties.empty()) {
        return entries;
    }

    auto isGroundTruthItem = [&](const std::string& item) {
        return std::any_of(
            puzzle.groundTruth.begin(), puzzle.groundTruth.end(), [&](const GroundTruthItem& g) {
                return g.item == item;
            });
    };

    int placed = 0;
    const int maxAttempts = puzzle.distractorCount * 4;
    for (int attempt = 0; attempt < maxAttempts && placed < puzzle.distractorCount; ++attempt) {
        SlotEntry distractor = drawEntry(location, config, draws);
        if (isGroundTruthItem(distractor.item) || containsOffer(entries, distractor)) {
            continue;
        }

        std::vector<std::string> properties = puzzle.requiredProperties;
        normalizeProperties(properties);
        properties.erase(
            properties.begin() + static_cast<std::ptrdiff_t>(draws.below(properties.size())));
        for (const auto& filler : config.propertyPool) {
            if (properties.size() >= static_cast<size_t>(config.propertiesPerItem)) {
                break;
            }
            const bool required =
                std::find(
                    puzzle.requiredProperties.begin(), puzzle.requiredProperties.end(), filler)
                != puzzle.requiredProperties.end();
            if (!required) {
                properties.push_back(filler);
            }
        }
        normalizeProperties(properties);
        distractor.properties = std::move(properties);
        entries.push_back(std::move(distractor));
        ++placed;
    }
    return entries;
}

} // namespace

std::string makeSeatId(const std::string& locationId, const std::string& item, int seatNumber)
{
    std::string code;
    for (char c : item) {
        if (std::isalnum(static_cast<unsigned char>(c))) {
            code.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
        }
        else if (!code.empty() && code.back() != '_') {
            code.push_back('_');
        }
    }
    while (!code.empty() && code.back() == '_') {
        code.pop_back();
    }

    char seat[16];
    std::snprintf(seat, sizeof(seat), "S%03d", seatNumber);
    return locationId + "-" + code + "-" + seat;
}

const SlotEntry* AvailabilityGrid::findEntry(
    const std::string& item,
    const std::optional<std::string>& seat,
    const TimeRange& timeSlot) const
{
    for (const auto& [range, entries] : slots) {
        if (!range.contains(timeSlot)) {
            continue;
        }
        for (const auto& entry : entries) {
            if (entry.item == item && entry.seat == seat) {
                return &entry;
            }
        }
    }
    return nullptr;
}

void to_json(nlohmann::json& j, const SlotEntry& entry)
{
    j = nlohmann::json{ { "item_name", entry.item } };
    if (entry.seat) {
        j["seat_id"] = *entry.seat;
    }
    j["properties"] = entry.properties;
    j["booked"] = entry.booked;
}

void to_json(nlohmann::json& j, const AvailabilityGrid& grid)
{
    nlohmann::json availability = nlohmann::json::object();
    for (const auto& [range, entries] : grid.slots) {
        availability[range.toString()] = entries;
    }
    j = nlohmann::json{
        { "location_id", grid.locationId },
        { "date", grid.date },
        { "availability", availability },
    };
}

// =================================================================
// AvailabilityEngine.
// =================================================================

AvailabilityEngine::AvailabilityEngine(const MapGraph& graph, AvailabilityConfig config)
    : graph_(graph), config_(std::move(config))
{}

uint64_t AvailabilityEngine::seedFor(
    const std::string& locationId, const SimDate& date, uint64_t salt)
{
    const std::string key =
        locationId + "|W" + std::to_string(date.week) + "|" + toString(date.day);
    return fnv1aAppendString(0, key) ^ salt;
}

Result<std::monostate, SimError> AvailabilityEngine::checkOpen(
    const std::string& locationId, const SimDate& date) const
{
    using R = Result<std::monostate, SimError>;

    if (!graph_.findLocation(locationId)) {
        return R::error(SimError(ErrorCode::NotFound, "Building '" + locationId + "' not found."));
    }
    if (isMaterialized(locationId, date)) {
        return R::error(SimError(
            ErrorCode::Conflict,
            "Availability for " + locationId + " on " + date.toString()
                + " has already been generated."));
    }
    return R::okay(std::monostate{});
}

Result<std::monostate, SimError> AvailabilityEngine::registerPuzzle(AvailabilityPuzzle puzzle)
{
    using R = Result<std::monostate, SimError>;

    if (puzzle.groundTruth.empty()) {
        return R::error(
            SimError(ErrorCode::Validation, "Puzzle needs at least one ground-truth item."));
    }
    if (puzzle.distractorCount < 0) {
        return R::error(SimError(ErrorCode::Validation, "Distractor count must not be negative."));
    }
    for (const auto& truth : puzzle.groundTruth) {
        if (truth.item.empty()) {
            return R::error(
                SimError(ErrorCode::Validation, "Ground-truth item name must not be empty."));
        }
    }
    auto open = checkOpen(puzzle.locationId, puzzle.date);
    if (open.isError()) {
        return open;
    }

    LOG_INFO(
        Booking,
        "Registered puzzle for {} on {} slot {} ({} ground-truth items)",
        puzzle.locationId,
        puzzle.date.toString(),
        puzzle.timeSlot.toString(),
        puzzle.groundTruth.size());
    Key key{ puzzle.locationId, puzzle.date };
    puzzles_[key] = std::move(puzzle);
    return R::okay(std::monostate{});
}

Result<std::monostate, SimError> AvailabilityEngine::pin(PinnedAvailability pinned)
{
    using R = Result<std::monostate, SimError>;

    if (pinned.item.empty()) {
        return R::error(SimError(ErrorCode::Validation, "Pinned item name must not be empty."));
    }
    auto open = checkOpen(pinned.locationId, pinned.date);
    if (open.isError()) {
        return open;
    }

    LOG_INFO(
        Booking,
        "Pinned {} at {} on {} {}",
        pinned.item,
        pinned.locationId,
        pinned.date.toString(),
        pinned.timeSlot.toString());
    Key key{ pinned.locationId, pinned.date };
    pins_[key].push_back(std::move(pinned));
    return R::okay(std::monostate{});
}

Result<const AvailabilityGrid*, SimError> AvailabilityEngine::grid(
    const std::string& locationId, const SimDate& date)
{
    using R = Result<const AvailabilityGrid*, SimError>;

    Key key{ locationId, date };
    auto it = cache_.find(key);
    if (it != cache_.end()) {
        return R::okay(&it->second);
    }

    const Location* location = graph_.findLocation(locationId);
    if (!location) {
        return R::error(SimError(ErrorCode::NotFound, "Building '" + locationId + "' not found."));
    }

    auto inserted = cache_.emplace(key, generate(*location, date)).first;
    LOG_DEBUG(
        Booking,
        "Generated availability for {} on {} ({} slots)",
        locationId,
        date.toString(),
        inserted->second.slots.size());
    return R::okay(&inserted->second);
}

Result<AvailabilityGrid, SimError> AvailabilityEngine::preview(
    const std::string& locationId, const SimDate& date) const
{
    using R = Result<AvailabilityGrid, SimError>;

    auto it = cache_.find(Key{ locationId, date });
    if (it != cache_.end()) {
        return R::okay(it->second);
    }

    const Location* location = graph_.findLocation(locationId);
    if (!location) {
        return R::error(SimError(ErrorCode::NotFound, "Building '" + locationId + "' not found."));
    }
    return R::okay(generate(*location, date));
}

bool AvailabilityEngine::isMaterialized(const std::string& locationId, const SimDate& date) const
{
    return cache_.contains(Key{ locationId, date });
}

AvailabilityGrid AvailabilityEngine::generate(const Location& location, const SimDate& date) const
{
    Draws draws(seedFor(location.id, date, config_.seedSalt));
    AvailabilityGrid grid{ .locationId = location.id, .date = date, .slots = {} };

    const Key key{ location.id, date };
    auto puzzleIt = puzzles_.find(key);
    const AvailabilityPuzzle* puzzle = puzzleIt != puzzles_.end() ? &puzzleIt->second : nullptr;

    if (puzzle) {
        grid.slots[puzzle->timeSlot] = puzzleSlot(location, *puzzle, config_, draws);
    }
    for (const auto& slot : config_.timeSlots) {
        if (puzzle && slot == puzzle->timeSlot) {
            continue;
        }
        grid.slots[slot] = drawSlot(location, config_, draws);
    }

    auto pinIt = pins_.find(key);
    if (pinIt != pins_.end()) {
        for (const auto& pinned : pinIt->second) {
            SlotEntry entry{
                .item = pinned.item,
                .seat = pinned.seat,
                .properties = pinned.properties,
                .booked = false,
            };
            normalizeProperties(entry.properties);
            auto& entries = grid.slots[pinned.timeSlot];
            if (!containsOffer(entries, entry)) {
                entries.push_back(std::move(entry));
            }
        }
    }

    return grid;
}

} // namespace CampusSim
