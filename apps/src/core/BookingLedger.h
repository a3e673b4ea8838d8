#pragma once

#include "Result.h"
#include "SimError.h"
#include "SimTime.h"
#include "StrongType.h"
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <vector>

namespace CampusSim {

using BookingId = StrongType<struct BookingIdTag>;

struct Booking {
    BookingId id;
    std::string locationId;
    std::string item;
    std::optional<std::string> seat;
    SimDate date;
    TimeRange timeSlot;
    std::string taskId;
};

void to_json(nlohmann::json& j, const Booking& booking);

/**
 * @brief Append-only record of confirmed reservations.
 *
 * Two bookings conflict when they name the same location, date and item, their time
 * slots overlap, and either one books the whole item or both book the same seat.
 */
class BookingLedger {
public:
    // Assigns the next id. Fails with Conflict when an existing booking clashes.
    Result<Booking, SimError> record(Booking request);

    const Booking* findConflict(
        const std::string& locationId,
        const SimDate& date,
        const std::string& item,
        const std::optional<std::string>& seat,
        const TimeRange& timeSlot) const;

    const std::vector<Booking>& all() const { return bookings_; }
    std::vector<Booking> forTask(const std::string& taskId) const;

private:
    std::vector<Booking> bookings_;
    BookingId nextId_{ 1 };
};

} // namespace CampusSim
