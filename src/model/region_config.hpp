/**
 * @file region_config.hpp
 * @brief Региональная конфигурация: таблицы и список спотов
 *
 * Все эмпирические таблицы (профили сёрферов, суточная кривая ветра,
 * помесячная статистика) хранятся как данные, чтобы их можно было
 * заменить для другого побережья без правки логики расчёта.
 */

#pragma once

#include "location.hpp"
#include "surfer_profile.hpp"
#include <array>
#include <string>
#include <vector>

namespace surfcast::model {

/**
 * @brief Интервал суточной кривой ветра [from_hour, to_hour)
 */
struct WindCurveBand {
    int from_hour = 0;
    int to_hour = 0;
    double value = 0.0;   ///< Баллы качества ветра за час

    constexpr bool operator==(const WindCurveBand&) const noexcept = default;
};

/**
 * @brief Типичная суточная картина ветра
 *
 * Не зависит от фактического ветра: прогноза ветра на будущие окна нет.
 */
struct DiurnalWindCurve {
    std::vector<WindCurveBand> bands;
    double fallback = 25.0;   ///< Для часов вне всех интервалов

    [[nodiscard]] double valueAt(int hour) const noexcept {
        for (const auto& band : bands) {
            if (hour >= band.from_hour && hour < band.to_hour) {
                return band.value;
            }
        }
        return fallback;
    }
};

/**
 * @brief Средние показатели месяца
 */
struct MonthlyAverage {
    double avg_score = 50.0;        ///< Средний балл
    double avg_wave_height = 0.0;   ///< Средняя высота волны, футы
    double good_days_pct = 0.0;     ///< Доля хороших дней, %
};

/**
 * @brief Помесячная статистика, индекс 0 = январь
 */
using HistoryTable = std::array<MonthlyAverage, 12>;

/**
 * @brief Конфигурация региона
 */
struct RegionConfig {
    std::string name;
    int utc_offset_minutes = 0;      ///< Смещение местного времени от UTC
    SkillTable skill_table;
    DiurnalWindCurve wind_curve;
    HistoryTable history{};
    LocationList locations;

    /**
     * @brief Поиск спота по идентификатору
     * @return nullptr если не найден
     */
    [[nodiscard]] const LocationProfile* findLocation(const std::string& id) const noexcept {
        for (const auto& loc : locations) {
            if (loc.id == id) return &loc;
        }
        return nullptr;
    }
};

/// Таблица профилей по умолчанию (Северная Калифорния)
[[nodiscard]] SkillTable defaultSkillTable();

/// Суточная кривая ветра по умолчанию: утро и вечер лучше полудня
[[nodiscard]] DiurnalWindCurve defaultWindCurve();

/// Синтетическая помесячная статистика для побережья Северной Калифорнии
[[nodiscard]] HistoryTable defaultHistoryTable();

/// Споты района Сан-Франциско
[[nodiscard]] LocationList defaultLocations();

/**
 * @brief Полная конфигурация региона по умолчанию (NorCal, PDT)
 */
[[nodiscard]] const RegionConfig& defaultRegionConfig();

} // namespace surfcast::model
