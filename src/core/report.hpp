/**
 * @file report.hpp
 * @brief Сводный отчёт по региону на текущий момент
 *
 * Собирает результаты всех модулей: рейтинг спотов, прилив,
 * лучшее окно, солнце, утренний патруль, неделю и историю.
 */

#pragma once

#include "best_window.hpp"
#include "dawn_patrol.hpp"
#include "historical.hpp"
#include "moon_phase.hpp"
#include "tide_analysis.hpp"
#include "week_forecast.hpp"
#include "model/conditions.hpp"
#include "model/region_config.hpp"
#include "model/score_result.hpp"
#include <optional>
#include <string>
#include <vector>

namespace surfcast::core {

/**
 * @brief Данные по одному споту
 */
struct LocationReport {
    RankedLocation ranked;
    std::string quality;                      ///< "Excellent conditions"
    std::optional<Measurement> measurement;

    std::string swell_cardinal;               ///< Только при наличии замера
    std::string swell_source;
    std::string wind_cardinal;

    bool has_tides = false;
    Feet tide_height{0.0};
    TidePhase tide_phase = TidePhase::Rising;
    NextTides next_tides;
    std::optional<TimeWindow> best_window;

    SunTimes sun;
    bool daylight = false;
    DawnPatrolStatus dawn_patrol;

    std::optional<HistoricalComparison> history;
    WeekForecast week;
};

/**
 * @brief Отчёт по региону
 */
struct SurfReport {
    std::string region;
    LocalTime generated_for;
    int utc_offset_minutes = 0;
    SurferProfile profile;
    MoonInfo moon;
    std::vector<LocationReport> locations;    ///< По убыванию балла
    std::vector<std::string> warnings;        ///< Некритичные замечания к данным

    /// Лучший спот с замером
    [[nodiscard]] const LocationReport* top() const noexcept {
        for (const auto& loc : locations) {
            if (loc.ranked.has_data) return &loc;
        }
        return nullptr;
    }
};

/**
 * @brief Параметры построения отчёта
 */
struct ReportOptions {
    std::optional<int> utc_offset_minutes;    ///< Переопределяет смещение региона
    std::string region_filter = "all";        ///< Только споты этого региона
    int min_score = 0;                        ///< Порог балла для попадания в отчёт
};

/**
 * @brief Построение отчёта
 *
 * Замечания (нет замера, нет ряда прилива, предупреждения валидации)
 * собираются в warnings, расчёт при этом продолжается.
 *
 * @throws ScoringError Если какой-либо замер недопустим
 */
[[nodiscard]] SurfReport buildSurfReport(
    const RegionConfig& region,
    const ConditionsSnapshot& snapshot,
    const SurferProfile& profile,
    const ReportOptions& options = {}
);

} // namespace surfcast::core
