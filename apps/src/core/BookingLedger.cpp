#include "BookingLedger.h"
#include "LoggingChannels.h"
#include <nlohmann/json.hpp>

namespace CampusSim {

void to_json(nlohmann::json& j, const Booking& booking)
{
    j = nlohmann::json{
        { "booking_id", booking.id },
        { "location_id", booking.locationId },
        { "item_name", booking.item },
        { "seat_id", booking.seat ? nlohmann::json(*booking.seat) : nlohmann::json(nullptr) },
        { "date", booking.date },
        { "time_slot", booking.timeSlot },
        { "task_id", booking.taskId },
    };
}

Result<Booking, SimError> BookingLedger::record(Booking request)
{
    using R = Result<Booking, SimError>;

    if (const Booking* clash = findConflict(
            request.locationId, request.date, request.item, request.seat, request.timeSlot)) {
        LOG_DEBUG(
            Booking,
            "Booking of {} at {} {} rejected: held by booking {}",
            request.item,
            request.locationId,
            request.timeSlot.toString(),
            clash->id);
        return R::error(SimError(
            ErrorCode::Conflict,
            "The requested " + request.item + " is already booked for the specified time slot."));
    }

    request.id = nextId_++;
    bookings_.push_back(std::move(request));
    const Booking& stored = bookings_.back();
    LOG_INFO(
        Booking,
        "Booking {}: {} {}{} on {} {} (task '{}')",
        stored.id,
        stored.locationId,
        stored.item,
        stored.seat ? " seat " + *stored.seat : std::string(),
        stored.date.toString(),
        stored.timeSlot.toString(),
        stored.taskId);
    return R::okay(stored);
}

const Booking* BookingLedger::findConflict(
    const std::string& locationId,
    const SimDate& date,
    const std::string& item,
    const std::optional<std::string>& seat,
    const TimeRange& timeSlot) const
{
    for (const auto& booking : bookings_) {
        if (booking.locationId != locationId || booking.date != date || booking.item != item) {
            continue;
        }
        if (!booking.timeSlot.overlaps(timeSlot)) {
            continue;
        }
        if (!booking.seat || !seat || *booking.seat == *seat) {
            return &booking;
        }
    }
    return nullptr;
}

std::vector<Booking> BookingLedger::forTask(const std::string& taskId) const
{
    std::vector<Booking> result;
    for (const auto& booking : bookings_) {
        if (booking.taskId == taskId) {
            result.push_back(booking);
        }
    }
    return result;
}

} // namespace CampusSim
