#pragma once

#include "Result.h"
#include "SimError.h"
#include "SimTime.h"

namespace CampusSim {

/**
 * @brief Authoritative simulated time. Only the controller moves it, and only forward.
 */
class WorldClock {
public:
    explicit WorldClock(SimTime start) : now_(start) {}

    const SimTime& now() const { return now_; }

    // Moves to a later (or equal) time on the current date. Dates change only via startDay.
    Result<SimTime, SimError> advanceTo(const SimTime& time);

    // Moves to the start of a strictly later date.
    Result<SimTime, SimError> startDay(const SimDate& date, int dayStartMinute);

private:
    SimTime now_;
};

} // namespace CampusSim
