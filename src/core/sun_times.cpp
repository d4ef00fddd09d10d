/**
 * @file sun_times.cpp
 * @brief Реализация расчёта солнечных событий
 */

#include "sun_times.hpp"
#include <algorithm>
#include <cmath>
#include <numbers>

namespace surfcast::core {

namespace {

constexpr double kPi = std::numbers::pi;

struct SolarParams {
    double eqtime_min = 0.0;   ///< Уравнение времени, минуты
    double decl_rad = 0.0;     ///< Склонение, радианы
};

SolarParams solarParams(int day_of_year) noexcept {
    const double g = 2.0 * kPi / 365.0 * (day_of_year - 1);

    SolarParams p;
    p.eqtime_min = 229.18 * (
        0.000075 +
        0.001868 * std::cos(g) -
        0.032077 * std::sin(g) -
        0.014615 * std::cos(2.0 * g) -
        0.040849 * std::sin(2.0 * g));

    p.decl_rad =
        0.006918 -
        0.399912 * std::cos(g) +
        0.070257 * std::sin(g) -
        0.006758 * std::cos(2.0 * g) +
        0.000907 * std::sin(2.0 * g) -
        0.002697 * std::cos(3.0 * g) +
        0.00148 * std::sin(3.0 * g);
    return p;
}

LocalTime minutesPastMidnight(LocalDate date, double minutes) noexcept {
    return LocalTime{date} + std::chrono::minutes{std::lround(minutes)};
}

} // anonymous namespace

double hourAngleDeg(double lat_rad, double decl_rad, double elevation_deg) noexcept {
    const double elev_rad = Degrees{elevation_deg}.toRadians().value;
    const double cos_ha = (std::sin(elev_rad) - std::sin(lat_rad) * std::sin(decl_rad)) /
                          (std::cos(lat_rad) * std::cos(decl_rad));

    return Radians{std::acos(std::clamp(cos_ha, -1.0, 1.0))}.toDegrees().value;
}

SunTimes computeSunTimes(const GeoPoint& point, LocalDate date, int utc_offset_minutes) noexcept {
    const auto params = solarParams(dayOfYear(date));
    const double lat_rad = Degrees{point.lat}.toRadians().value;

    const double ha = hourAngleDeg(lat_rad, params.decl_rad, kSunriseElevation);
    const double ha_civil = hourAngleDeg(lat_rad, params.decl_rad, kCivilTwilightElevation);

    const double noon = 720.0 - 4.0 * point.lng - params.eqtime_min + utc_offset_minutes;

    SunTimes sun;
    sun.sunrise = minutesPastMidnight(date, noon - 4.0 * ha);
    sun.sunset = minutesPastMidnight(date, noon + 4.0 * ha);
    sun.first_light = minutesPastMidnight(date, noon - 4.0 * ha_civil);
    sun.last_light = minutesPastMidnight(date, noon + 4.0 * ha_civil);
    return sun;
}

bool isDaylight(const SunTimes& sun, LocalTime now) noexcept {
    return now >= sun.first_light && now <= sun.last_light;
}

LocalTime leaveBy(LocalTime target, std::chrono::minutes drive, std::chrono::minutes buffer) noexcept {
    return target - drive - buffer;
}

} // namespace surfcast::core
