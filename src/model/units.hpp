/**
 * @file units.hpp
 * @brief Строго типизированные единицы измерения
 *
 * Данные буя и прогноза приходят в футах, милях в час и градусах.
 * Обёртки не дают перепутать высоту волны со скоростью ветра.
 */

#pragma once

#include <cmath>
#include <compare>
#include <numbers>

namespace surfcast::model {

struct Radians;

/**
 * @brief Румб в градусах (откуда идёт свелл или дует ветер)
 */
struct Degrees {
    double value;

    constexpr explicit Degrees(double v = 0.0) noexcept : value(v) {}

    [[nodiscard]] constexpr Radians toRadians() const noexcept;

    constexpr Degrees operator-(Degrees other) const noexcept {
        return Degrees{value - other.value};
    }

    constexpr auto operator<=>(const Degrees& other) const noexcept = default;
};

/**
 * @brief Угол в радианах (только для астрономических расчётов)
 */
struct Radians {
    double value;

    constexpr explicit Radians(double v = 0.0) noexcept : value(v) {}

    [[nodiscard]] constexpr Degrees toDegrees() const noexcept {
        return Degrees{value * 180.0 / std::numbers::pi};
    }

    constexpr auto operator<=>(const Radians& other) const noexcept = default;
};

constexpr Radians Degrees::toRadians() const noexcept {
    return Radians{value * std::numbers::pi / 180.0};
}

/**
 * @brief Высота (волны, прилива) в футах
 *
 * Для прилива значение знаковое (отсчёт от MLLW).
 */
struct Feet {
    double value;

    constexpr explicit Feet(double v = 0.0) noexcept : value(v) {}

    constexpr auto operator<=>(const Feet& other) const noexcept = default;
};

/**
 * @brief Скорость ветра в милях в час
 */
struct MilesPerHour {
    double value;

    constexpr explicit MilesPerHour(double v = 0.0) noexcept : value(v) {}

    constexpr auto operator<=>(const MilesPerHour& other) const noexcept = default;
};

[[nodiscard]] inline Degrees abs(Degrees d) noexcept { return Degrees{std::abs(d.value)}; }

} // namespace surfcast::model
