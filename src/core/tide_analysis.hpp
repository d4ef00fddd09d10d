/**
 * @file tide_analysis.hpp
 * @brief Текущая высота и фаза прилива по прогнозному ряду
 */

#pragma once

#include "model/tide_series.hpp"
#include <chrono>
#include <optional>

namespace surfcast::core {

using namespace surfcast::model;

/**
 * @brief Окрестность экстремума, в которой прилив считается "полным"/"малым"
 */
constexpr std::chrono::minutes kTidePeakWindow{30};

/**
 * @brief Текущая высота прилива
 *
 * Линейная интерполяция между почасовыми значениями, между которыми
 * лежит now. До первого значения - первое, начиная с последнего - последнее
 * (без экстраполяции). Пустой ряд - 0.
 */
[[nodiscard]] Feet currentTideHeight(const TideSeries& series, LocalTime now) noexcept;

/**
 * @brief Текущая фаза прилива
 *
 * Ищутся ближайшие прошедший (t <= now) и будущий экстремумы.
 * - до будущего меньше kTidePeakWindow → его тип (High/Low);
 * - после прошедшего меньше kTidePeakWindow → его тип;
 * - иначе после малой воды Rising, после полной Falling;
 * - прошедшего экстремума нет → Rising.
 *
 * Это приближение, а не синусоидальная аппроксимация.
 */
[[nodiscard]] TidePhase tidePhase(const TideSeries& series, LocalTime now) noexcept;

/**
 * @brief Ближайшие будущие полная и малая вода
 */
struct NextTides {
    std::optional<TideEvent> next_high;
    std::optional<TideEvent> next_low;
};

[[nodiscard]] NextTides nextTides(const TideSeries& series, LocalTime now);

/**
 * @brief Максимум и минимум экстремумов ряда
 * @return nullopt для пустого списка экстремумов
 */
struct TideExtremes {
    Feet max_high{0.0};
    Feet min_low{0.0};
};

[[nodiscard]] std::optional<TideExtremes> tideExtremes(const TideSeries& series) noexcept;

} // namespace surfcast::core
