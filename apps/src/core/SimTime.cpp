#include "SimTime.h"
#include <array>
#include <cctype>
#include <charconv>
#include <cstdio>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <vector>

namespace CampusSim {

namespace {

constexpr std::array<const char*, 7> kWeekdayNames = {
    "Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday", "Sunday",
};

std::string toLower(std::string_view str)
{
    std::string out(str);
    for (char& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

// Lowercases, maps en dashes to '-', turns commas into spaces, and splits on whitespace.
std::vector<std::string> tokenize(std::string_view str)
{
    std::string normalized;
    normalized.reserve(str.size());
    for (size_t i = 0; i < str.size(); ++i) {
        // U+2013 EN DASH is E2 80 93 in UTF-8.
        if (i + 2 < str.size() && static_cast<unsigned char>(str[i]) == 0xE2
            && static_cast<unsigned char>(str[i + 1]) == 0x80
            && static_cast<unsigned char>(str[i + 2]) == 0x93) {
            normalized.push_back('-');
            i += 2;
            continue;
        }
        const char c = str[i] == ',' ? ' ' : str[i];
        normalized.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    std::vector<std::string> tokens;
    std::string current;
    for (char c : normalized) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!current.empty()) {
                tokens.push_back(current);
                current.clear();
            }
        }
        else {
            current.push_back(c);
        }
    }
    if (!current.empty()) {
        tokens.push_back(current);
    }
    return tokens;
}

std::optional<int> parseInt(std::string_view str)
{
    int value = 0;
    const auto* begin = str.data();
    const auto* end = str.data() + str.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc() || ptr != end) {
        return std::nullopt;
    }
    return value;
}

// Parses the leading "week N day" tokens.
std::optional<SimDate> parseDateTokens(const std::vector<std::string>& tokens)
{
    if (tokens.size() < 3 || tokens[0] != "week") {
        return std::nullopt;
    }
    auto week = parseInt(tokens[1]);
    if (!week.has_value() || week.value() < 1) {
        return std::nullopt;
    }
    auto day = weekdayFromString(tokens[2]);
    if (!day.has_value()) {
        return std::nullopt;
    }
    return SimDate{ .week = week.value(), .day = day.value() };
}

std::string joinTail(const std::vector<std::string>& tokens, size_t from)
{
    std::string out;
    for (size_t i = from; i < tokens.size(); ++i) {
        out += tokens[i];
    }
    return out;
}

template <typename T>
T parseOrThrow(const nlohmann::json& j, const char* what)
{
    if (!j.is_string()) {
        throw std::invalid_argument(std::string(what) + " must be a string");
    }
    auto parsed = T::parse(j.get<std::string>());
    if (!parsed.has_value()) {
        throw std::invalid_argument(
            std::string("Invalid ") + what + ": '" + j.get<std::string>() + "'");
    }
    return parsed.value();
}

} // namespace

std::string toString(Weekday day)
{
    return kWeekdayNames[static_cast<size_t>(day)];
}

std::optional<Weekday> weekdayFromString(std::string_view str)
{
    const std::string lower = toLower(str);
    for (size_t i = 0; i < kWeekdayNames.size(); ++i) {
        if (lower == toLower(kWeekdayNames[i])) {
            return static_cast<Weekday>(i);
        }
    }
    return std::nullopt;
}

std::optional<int> parseClockTime(std::string_view str)
{
    const size_t colon = str.find(':');
    if (colon == std::string_view::npos) {
        return std::nullopt;
    }
    auto hour = parseInt(str.substr(0, colon));
    auto minute = parseInt(str.substr(colon + 1));
    if (!hour.has_value() || !minute.has_value()) {
        return std::nullopt;
    }
    if (hour.value() < 0 || hour.value() > 24 || minute.value() < 0 || minute.value() > 59) {
        return std::nullopt;
    }
    const int total = hour.value() * 60 + minute.value();
    if (total > kMinutesPerDay) {
        return std::nullopt;
    }
    return total;
}

std::string formatClockTime(int minuteOfDay)
{
    char buffer[8];
    std::snprintf(buffer, sizeof(buffer), "%02d:%02d", minuteOfDay / 60, minuteOfDay % 60);
    return buffer;
}

std::string SimDate::toString() const
{
    return "Week " + std::to_string(week) + ", " + CampusSim::toString(day);
}

std::optional<SimDate> SimDate::parse(std::string_view str)
{
    const auto tokens = tokenize(str);
    if (tokens.size() != 3) {
        return std::nullopt;
    }
    return parseDateTokens(tokens);
}

std::string TimeRange::toString() const
{
    return formatClockTime(startMinute) + "-" + formatClockTime(endMinute);
}

std::optional<TimeRange> TimeRange::parse(std::string_view str)
{
    const std::string joined = joinTail(tokenize(str), 0);
    const size_t dash = joined.find('-');
    if (dash == std::string::npos) {
        return std::nullopt;
    }
    auto start = parseClockTime(std::string_view(joined).substr(0, dash));
    auto end = parseClockTime(std::string_view(joined).substr(dash + 1));
    if (!start.has_value() || !end.has_value() || start.value() >= end.value()) {
        return std::nullopt;
    }
    return TimeRange{ .startMinute = start.value(), .endMinute = end.value() };
}

std::string EventTime::toString() const
{
    return date.toString() + ", " + range.toString();
}

std::optional<EventTime> EventTime::parse(std::string_view str)
{
    const auto tokens = tokenize(str);
    auto date = parseDateTokens(tokens);
    if (!date.has_value() || tokens.size() < 4) {
        return std::nullopt;
    }
    auto range = TimeRange::parse(joinTail(tokens, 3));
    if (!range.has_value()) {
        return std::nullopt;
    }
    return EventTime{ .date = date.value(), .range = range.value() };
}

std::string SimTime::toString() const
{
    return date.toString() + ", " + formatClockTime(minuteOfDay);
}

std::optional<SimTime> SimTime::parse(std::string_view str)
{
    const auto tokens = tokenize(str);
    auto date = parseDateTokens(tokens);
    if (!date.has_value() || tokens.size() != 4) {
        return std::nullopt;
    }
    auto minute = parseClockTime(tokens[3]);
    if (!minute.has_value() || minute.value() >= kMinutesPerDay) {
        return std::nullopt;
    }
    return SimTime{ .date = date.value(), .minuteOfDay = minute.value() };
}

void to_json(nlohmann::json& j, const SimDate& date)
{
    j = date.toString();
}

void from_json(const nlohmann::json& j, SimDate& date)
{
    date = parseOrThrow<SimDate>(j, "date");
}

void to_json(nlohmann::json& j, const TimeRange& range)
{
    j = range.toString();
}

void from_json(const nlohmann::json& j, TimeRange& range)
{
    range = parseOrThrow<TimeRange>(j, "time slot");
}

void to_json(nlohmann::json& j, const EventTime& time)
{
    j = time.toString();
}

void from_json(const nlohmann::json& j, EventTime& time)
{
    time = parseOrThrow<EventTime>(j, "event time");
}

void to_json(nlohmann::json& j, const SimTime& time)
{
    j = time.toString();
}

void from_json(const nlohmann::json& j, SimTime& time)
{
    time = parseOrThrow<SimTime>(j, "time");
}

} // namespace CampusSim
