/**
 * @file best_window.hpp
 * @brief Поиск лучшего окна катания в течение дня
 */

#pragma once

#include "model/region_config.hpp"
#include "model/tide_series.hpp"
#include <optional>
#include <string>
#include <vector>

namespace surfcast::core {

using namespace surfcast::model;

/**
 * @brief Окно катания [start_hour, end_hour)
 */
struct TimeWindow {
    int start_hour = 0;        ///< 0–23
    int end_hour = 0;          ///< Последний час окна + 1 (до 24)
    double avg_tide = 0.0;     ///< Средняя высота прилива в окне, футы
    double avg_score = 0.0;    ///< Средний суммарный балл часа
    std::string reason;        ///< "Mid tide + light morning winds"

    /// "6:00 AM"
    [[nodiscard]] std::string startLabel() const;
    /// "9:00 AM"
    [[nodiscard]] std::string endLabel() const;
};

/**
 * @brief Параметры поиска окна
 */
struct WindowSearchOptions {
    int first_hour = 5;        ///< Начало окна не раньше этого часа
    int end_hour = 20;         ///< Конец окна не позже этого часа
    DiurnalWindCurve wind_curve = defaultWindCurve();
};

/**
 * @brief Балл прилива для окна (0–100)
 *
 * Та же форма, что scoreTide, но другие пороги: доля считается
 * по типичному для залива диапазону -1..6 футов.
 */
[[nodiscard]] int scoreTideForWindow(Feet height, TidePreference preference) noexcept;

/**
 * @brief Словесная оценка уровня воды ("Low tide" ... "High tide")
 */
[[nodiscard]] std::string tideDescription(double height_ft);

/**
 * @brief Час в виде "6:00 AM"; 0 и 24 дают "12:00 AM"
 */
[[nodiscard]] std::string formatHour(int hour);

/**
 * @brief Лучшее окно за указанные сутки
 *
 * Каждый час получает 0.5 * scoreTideForWindow + значение кривой ветра.
 * Окна длиной 3, затем 2 часа скользят по последовательности
 * оценённых часов [first_hour, end_hour); выигрывает наибольшее
 * среднее, при равенстве раньше найденное. Окно целиком лежит
 * в диапазоне, end_hour результата не больше options.end_hour.
 * Если в диапазоне всего один час, окном становится он сам.
 *
 * @param hourly Почасовые значения (учитываются только за day)
 * @return nullopt, если ни одного часа не попало в диапазон
 */
[[nodiscard]] std::optional<TimeWindow> findBestTimeWindow(
    const std::vector<TideSample>& hourly,
    LocalDate day,
    TidePreference preference,
    const WindowSearchOptions& options = {}
);

} // namespace surfcast::core
