/**
 * @file dawn_patrol.cpp
 */

#include "dawn_patrol.hpp"
#include "time_format.hpp"
#include <cmath>

namespace surfcast::core {

std::string toString(DawnPatrolState state) {
    switch (state) {
        case DawnPatrolState::TooEarly: return "too-early";
        case DawnPatrolState::LeaveNow: return "leave-now";
        case DawnPatrolState::OnTheWay: return "on-the-way";
        case DawnPatrolState::Surfing:  return "surfing";
        case DawnPatrolState::Missed:   return "missed";
    }
    return "unknown";
}

DawnPatrolStatus dawnPatrolStatus(
    LocalTime now,
    const SunTimes& sun,
    std::optional<std::chrono::minutes> drive
) {
    DawnPatrolStatus status;

    if (!drive || drive->count() <= 0) {
        if (now < sun.first_light) {
            status.state = DawnPatrolState::TooEarly;
            status.message = "First light at " + formatClock(sun.first_light);
        } else if (now < sun.sunset) {
            status.state = DawnPatrolState::Surfing;
            status.message = now < sun.sunrise
                ? "Sunrise at " + formatClock(sun.sunrise)
                : "Sun is up until " + formatClock(sun.sunset);
        } else {
            status.state = DawnPatrolState::Missed;
            status.message = "Sun has set";
        }
        return status;
    }

    const LocalTime leave = leaveBy(sun.first_light, *drive, kArrivalBuffer);
    const LocalTime arrival = leave + *drive + kArrivalBuffer;

    if (now < leave - kLeaveNowLead) {
        status.state = DawnPatrolState::TooEarly;
        status.message = "Leave by " + formatClock(leave) + " for first light";
        status.leave_by = leave;
    } else if (now < leave) {
        const double seconds = static_cast<double>((leave - now).count());
        status.state = DawnPatrolState::LeaveNow;
        status.message = "Leave in " + std::to_string(std::lround(seconds / 60.0)) +
                         " min for dawn patrol!";
        status.leave_by = leave;
    } else if (now < arrival) {
        status.state = DawnPatrolState::OnTheWay;
        status.message = "Go now to catch first light!";
        status.leave_by = leave;
    } else if (now < sun.sunset) {
        status.state = DawnPatrolState::Surfing;
        status.message = "Sun up until " + formatClock(sun.sunset);
    } else {
        status.state = DawnPatrolState::Missed;
        status.message = "Sun has set";
    }

    return status;
}

} // namespace surfcast::core
