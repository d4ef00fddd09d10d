/**
 * @file week_forecast.hpp
 * @brief Недельный прогноз по приливу и выбор лучшего дня
 *
 * Прогноза волн на будущие дни нет: день оценивается по приливу,
 * дню недели и экстремальности воды относительно базовых 50 баллов.
 */

#pragma once

#include "best_window.hpp"
#include "moon_phase.hpp"
#include "sun_times.hpp"
#include "model/location.hpp"
#include "model/tide_series.hpp"
#include <optional>
#include <string>
#include <vector>

namespace surfcast::core {

/// Количество дней прогноза
constexpr int kForecastDays = 7;

/// Базовый балл дня
constexpr int kBaseDayScore = 50;

struct DayForecast {
    LocalDate date;
    std::string day_name;         ///< "Sat"
    std::string date_label;       ///< "Jun 1"
    SunTimes sun;
    MoonInfo moon;
    int score = kBaseDayScore;    ///< 0–100
    std::string analysis;         ///< Бонусы через " • "
    std::optional<TimeWindow> best_window;
    bool has_tide_data = false;
};

struct WeekForecast {
    std::vector<DayForecast> days;
    std::optional<size_t> best_day;   ///< Индекс в days
    std::string best_day_reason;
};

/**
 * @brief Параметры недельного анализа
 */
struct WeekOptions {
    int utc_offset_minutes = -420;
    DiurnalWindCurve wind_curve = defaultWindCurve();
};

/**
 * @brief Идеален ли уровень воды для предпочтения спота
 *
 * Low: < 2 фт; Mid: 1.5–4 фт; High: > 3.5 фт; Any: всегда.
 */
[[nodiscard]] bool isTideIdeal(Feet height, TidePreference preference) noexcept;

/**
 * @brief Оценка одного дня
 *
 * @param day_tides Прилив за этот день (пустой → "Tide data unavailable")
 */
[[nodiscard]] DayForecast analyzeDay(
    LocalDate date,
    const TideSeries& day_tides,
    const LocationProfile& location,
    const WeekOptions& options = {}
);

/**
 * @brief Прогноз на 7 дней начиная с start
 *
 * @param tides Ряд прилива станции, может покрывать несколько суток
 */
[[nodiscard]] WeekForecast analyzeWeek(
    const TideSeries& tides,
    const LocationProfile& location,
    LocalDate start,
    const WeekOptions& options = {}
);

/**
 * @brief Обоснование выбора лучшего дня
 */
[[nodiscard]] std::string bestDayReason(const DayForecast& best, const std::vector<DayForecast>& all);

} // namespace surfcast::core
