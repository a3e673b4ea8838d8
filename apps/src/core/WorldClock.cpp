#include "WorldClock.h"
#include "LoggingChannels.h"

namespace CampusSim {

Result<SimTime, SimError> WorldClock::advanceTo(const SimTime& time)
{
    if (time < now_) {
        return Result<SimTime, SimError>::error(SimError(
            ErrorCode::Validation,
            "Cannot move time backwards from " + now_.toString() + " to " + time.toString()
                + "."));
    }
    if (time.date != now_.date) {
        return Result<SimTime, SimError>::error(SimError(
            ErrorCode::Validation,
            "Cannot advance from " + now_.date.toString() + " into " + time.date.toString()
                + "; use start_new_day to begin a new date."));
    }

    LOG_INFO(Clock, "Time advanced: {} -> {}", now_.toString(), time.toString());
    now_ = time;
    return Result<SimTime, SimError>::okay(now_);
}

Result<SimTime, SimError> WorldClock::startDay(const SimDate& date, int dayStartMinute)
{
    if (date <= now_.date) {
        return Result<SimTime, SimError>::error(SimError(
            ErrorCode::Validation,
            "A new day must be later than " + now_.date.toString() + ", got " + date.toString()
                + "."));
    }

    now_ = SimTime{ .date = date, .minuteOfDay = dayStartMinute };
    LOG_INFO(Clock, "New day: {}", now_.toString());
    return Result<SimTime, SimError>::okay(now_);
}

} // namespace CampusSim
