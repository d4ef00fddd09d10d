/**
 * @file time_format.cpp
 */

#include "time_format.hpp"
#include <array>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace surfcast::core {

namespace {

constexpr std::array<const char*, 7> kWeekdays = {
    "Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"
};

constexpr std::array<const char*, 12> kMonthsShort = {
    "Jan", "Feb", "Mar", "Apr", "May", "Jun",
    "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"
};

constexpr std::array<const char*, 12> kMonthsFull = {
    "January", "February", "March", "April", "May", "June",
    "July", "August", "September", "October", "November", "December"
};

} // anonymous namespace

std::string formatClock(LocalTime t) {
    const auto day = dateOf(t);
    const std::chrono::hh_mm_ss hms{std::chrono::floor<std::chrono::minutes>(t - day)};

    int hour = static_cast<int>(hms.hours().count());
    const int minute = static_cast<int>(hms.minutes().count());
    const char* suffix = hour < 12 ? "AM" : "PM";

    hour %= 12;
    if (hour == 0) hour = 12;

    std::ostringstream ss;
    ss << hour << ':' << std::setw(2) << std::setfill('0') << minute << ' ' << suffix;
    return ss.str();
}

std::string timeUntil(LocalTime target, LocalTime now) {
    const double diff_seconds = static_cast<double>((target - now).count());
    const long mins = std::lround(diff_seconds / 60.0);

    if (mins < 0) {
        return "passed";
    }
    if (mins < 60) {
        return "in " + std::to_string(mins) + " min";
    }

    const long hours = mins / 60;
    const long rest = mins % 60;
    if (rest == 0) {
        return "in " + std::to_string(hours) + "h";
    }
    return "in " + std::to_string(hours) + "h " + std::to_string(rest) + "m";
}

std::string weekdayName(LocalDate date) {
    const std::chrono::weekday wd{date};
    return kWeekdays[wd.c_encoding()];
}

std::string monthShortName(unsigned month) {
    if (month < 1 || month > 12) return "?";
    return kMonthsShort[month - 1];
}

std::string monthFullName(unsigned month) {
    if (month < 1 || month > 12) return "?";
    return kMonthsFull[month - 1];
}

std::string dateLabel(LocalDate date) {
    const std::chrono::year_month_day ymd{date};
    return weekdayName(date) + " " + monthShortName(static_cast<unsigned>(ymd.month())) +
           " " + std::to_string(static_cast<unsigned>(ymd.day()));
}

} // namespace surfcast::core
