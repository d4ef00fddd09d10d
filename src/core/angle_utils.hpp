/**
 * @file angle_utils.hpp
 * @brief Утилиты для работы с румбами
 *
 * Единая нормализация направлений для оценки ветра и свелла
 * с учётом перехода через 0°/360°.
 */

#pragma once

#include "model/units.hpp"
#include <cmath>

namespace surfcast::core {

using namespace surfcast::model;

/**
 * @brief Нормализация угла к диапазону [0°, 360°)
 */
[[nodiscard]] Degrees normalizeAngle(Degrees angle) noexcept;

/**
 * @brief Свёртка угла к диапазону (-180°, 180°]
 *
 * Все сравнения направлений обязаны проходить через эту функцию:
 * только остаток от деления без свёртки даёт неверную разность
 * для направлений около 180°.
 * Идемпотентна, normalizeSignedAngle(x + 360) == normalizeSignedAngle(x).
 * Для NaN и бесконечности возвращает NaN.
 */
[[nodiscard]] Degrees normalizeSignedAngle(Degrees angle) noexcept;

/**
 * @brief Разность направлений a - b по короткой дуге, (-180°, 180°]
 */
[[nodiscard]] inline Degrees angleDifference(Degrees a, Degrees b) noexcept {
    return normalizeSignedAngle(a - b);
}

/**
 * @brief Абсолютное угловое расстояние, [0°, 180°]
 */
[[nodiscard]] inline Degrees angularDistance(Degrees a, Degrees b) noexcept {
    return abs(angleDifference(a, b));
}

/**
 * @brief Проверка близости двух направлений
 */
[[nodiscard]] bool anglesClose(Degrees a1, Degrees a2, Degrees tolerance = Degrees{0.01}) noexcept;

/**
 * @brief Линейная интерполяция числового значения
 */
[[nodiscard]] inline double interpolate(
    double target,
    double v1, double d1,
    double v2, double d2
) noexcept {
    if (std::abs(d2 - d1) < 1e-9) {
        return v1;
    }
    double ratio = (target - d1) / (d2 - d1);
    return v1 + ratio * (v2 - v1);
}

} // namespace surfcast::core
