/**
 * @file historical.hpp
 * @brief Сравнение балла со среднемесячной статистикой
 *
 * Не обучаемая модель: фиксированная таблица месяцев и
 * логистическое отображение z-оценки в процентиль.
 */

#pragma once

#include "model/region_config.hpp"
#include <string>

namespace surfcast::core {

using namespace surfcast::model;

/// Фиксированное стандартное отклонение балла
constexpr double kHistoricalStdDev = 15.0;

/// Коэффициент крутизны tanh
constexpr double kPercentileScale = 0.8;

struct HistoricalComparison {
    int percentile = 50;         ///< 1–99
    std::string context;         ///< "Better than 82% of June days"
    MonthlyAverage month_average;
};

/**
 * @brief Процентиль балла для месяца
 *
 * z = (score - avg) / 15; percentile = round(50 · (1 + tanh(0.8 · z))),
 * ограничено [1, 99].
 *
 * @param month Номер месяца 1–12
 * @throws std::out_of_range Для месяца вне 1–12
 */
[[nodiscard]] int historicalPercentile(int score, unsigned month, const HistoryTable& table);

/**
 * @brief Фраза по процентилю ("Top 10% day for June!" и т.п.)
 */
[[nodiscard]] std::string percentileContext(int percentile, unsigned month);

/**
 * @brief Процентиль, фраза и данные месяца одним вызовом
 * @throws std::out_of_range Для месяца вне 1–12
 */
[[nodiscard]] HistoricalComparison compareWithHistory(int score, unsigned month,
                                                      const HistoryTable& table);

} // namespace surfcast::core
