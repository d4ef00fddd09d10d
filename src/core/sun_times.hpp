/**
 * @file sun_times.hpp
 * @brief Восход, закат и гражданские сумерки
 *
 * Стандартное приближение положения Солнца: дробный год γ по номеру
 * дня, уравнение времени и склонение рядами по γ, часовой угол из
 * широты, склонения и порога высоты Солнца.
 */

#pragma once

#include "model/local_time.hpp"
#include "model/types.hpp"
#include <chrono>

namespace surfcast::core {

using namespace surfcast::model;

/// Высота центра Солнца при восходе/закате с учётом рефракции, градусы
constexpr double kSunriseElevation = -0.833;

/// Высота Солнца на границе гражданских сумерек, градусы
constexpr double kCivilTwilightElevation = -6.0;

/**
 * @brief Солнечные события дня (местное время)
 *
 * Инвариант: first_light <= sunrise <= sunset <= last_light.
 */
struct SunTimes {
    LocalTime sunrise;
    LocalTime sunset;
    LocalTime first_light;   ///< Начало гражданских сумерек
    LocalTime last_light;    ///< Конец гражданских сумерек
};

/**
 * @brief Часовой угол Солнца для заданной высоты, градусы
 *
 * Аргумент arccos ограничивается [-1, 1]: в полярный день угол 180°,
 * в полярную ночь 0°. NaN наружу не выходит.
 */
[[nodiscard]] double hourAngleDeg(double lat_rad, double decl_rad, double elevation_deg) noexcept;

/**
 * @brief Расчёт солнечных событий
 *
 * Полдень (минуты от местной полуночи) = 720 - 4·lng - eqtime + utc_offset;
 * восход = полдень - 4·HA, закат = полдень + 4·HA, с округлением до минут.
 *
 * В полярных условиях события сходятся к солнечному полудню
 * или разносятся на полные сутки; реальных восхода и заката нет.
 *
 * @param point Координаты спота
 * @param date Местная дата
 * @param utc_offset_minutes Смещение местного времени от UTC (PDT = -420)
 */
[[nodiscard]] SunTimes computeSunTimes(const GeoPoint& point, LocalDate date,
                                       int utc_offset_minutes) noexcept;

/**
 * @brief Светло ли для катания: first_light <= now <= last_light
 */
[[nodiscard]] bool isDaylight(const SunTimes& sun, LocalTime now) noexcept;

/**
 * @brief Когда выезжать, чтобы успеть к target
 * @param buffer Запас на парковку и переодевание
 */
[[nodiscard]] LocalTime leaveBy(LocalTime target, std::chrono::minutes drive,
                                std::chrono::minutes buffer = std::chrono::minutes{10}) noexcept;

} // namespace surfcast::core
