/**
 * @file moon_phase.hpp
 * @brief Фаза Луны по известному новолунию и длине синодического месяца
 */

#pragma once

#include "model/local_time.hpp"
#include <string>

namespace surfcast::core {

using namespace surfcast::model;

/// Синодический месяц, сутки
constexpr double kSynodicMonthDays = 29.53058867;

enum class MoonPhase {
    New,
    WaxingCrescent,
    FirstQuarter,
    WaxingGibbous,
    Full,
    WaningGibbous,
    LastQuarter,
    WaningCrescent
};

/// "waxing-crescent"
[[nodiscard]] std::string toString(MoonPhase phase);

/// "Waxing Crescent"
[[nodiscard]] std::string displayName(MoonPhase phase);

struct MoonInfo {
    MoonPhase phase = MoonPhase::New;
    int illumination = 0;      ///< Освещённость, % (0–100)
    double age_days = 0.0;     ///< Возраст Луны, сутки
};

/**
 * @brief Фаза Луны в момент времени
 *
 * Опорное новолуние 2024-01-11 11:57 UTC. Возраст берётся по модулю
 * синодического месяца (в том числе для дат до опорной).
 *
 * @param t Местное время
 * @param utc_offset_minutes Смещение местного времени от UTC
 */
[[nodiscard]] MoonInfo moonPhase(LocalTime t, int utc_offset_minutes) noexcept;

/**
 * @brief Новолуние, полнолуние или четверть
 */
[[nodiscard]] constexpr bool isSignificant(MoonPhase phase) noexcept {
    return phase == MoonPhase::New || phase == MoonPhase::Full ||
           phase == MoonPhase::FirstQuarter || phase == MoonPhase::LastQuarter;
}

} // namespace surfcast::core
