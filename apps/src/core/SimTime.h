#pragma once

/**
 * \file
 * Simulated calendar values: weekday, date (week + weekday), minute-resolution time
 * ranges and points in simulated time.
 *
 * Textual forms follow the campus convention:
 *   SimDate    "Week 1, Monday"
 *   TimeRange  "14:00-16:00"
 *   EventTime  "Week 1, Monday, 14:00-16:00"
 *   SimTime    "Week 1, Monday, 08:00"
 * Parsing is case-insensitive, commas are optional, and an en dash is accepted in
 * place of the hyphen.
 */

#include <compare>
#include <cstdint>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace CampusSim {

enum class Weekday : uint8_t {
    Monday = 0,
    Tuesday,
    Wednesday,
    Thursday,
    Friday,
    Saturday,
    Sunday,
};

std::string toString(Weekday day);
std::optional<Weekday> weekdayFromString(std::string_view str);

constexpr int kMinutesPerDay = 24 * 60;

// "HH:MM" <-> minute of day.
std::optional<int> parseClockTime(std::string_view str);
std::string formatClockTime(int minuteOfDay);

struct SimDate {
    int week = 1;
    Weekday day = Weekday::Monday;

    auto operator<=>(const SimDate&) const = default;

    std::string toString() const;
    static std::optional<SimDate> parse(std::string_view str);
};

// Half-open interval [start, end) in minutes of the day.
struct TimeRange {
    int startMinute = 0;
    int endMinute = 0;

    auto operator<=>(const TimeRange&) const = default;

    bool overlaps(const TimeRange& other) const
    {
        return startMinute < other.endMinute && other.startMinute < endMinute;
    }
    bool contains(const TimeRange& other) const
    {
        return startMinute <= other.startMinute && other.endMinute <= endMinute;
    }
    int durationMinutes() const { return endMinute - startMinute; }

    std::string toString() const;
    static std::optional<TimeRange> parse(std::string_view str);
};

struct EventTime {
    SimDate date;
    TimeRange range;

    auto operator<=>(const EventTime&) const = default;

    bool overlaps(const EventTime& other) const
    {
        return date == other.date && range.overlaps(other.range);
    }

    std::string toString() const;
    static std::optional<EventTime> parse(std::string_view str);
};

struct SimTime {
    SimDate date;
    int minuteOfDay = 0;

    auto operator<=>(const SimTime&) const = default;

    std::string toString() const;
    static std::optional<SimTime> parse(std::string_view str);
};

// JSON uses the textual forms above; from_json throws std::invalid_argument on bad input.
void to_json(nlohmann::json& j, const SimDate& date);
void from_json(const nlohmann::json& j, SimDate& date);
void to_json(nlohmann::json& j, const TimeRange& range);
void from_json(const nlohmann::json& j, TimeRange& range);
void to_json(nlohmann::json& j, const EventTime& time);
void from_json(const nlohmann::json& j, EventTime& time);
void to_json(nlohmann::json& j, const SimTime& time);
void from_json(const nlohmann::json& j, SimTime& time);

} // namespace CampusSim
