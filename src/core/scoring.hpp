/**
 * @file scoring.hpp
 * @brief Частные оценки условий (0–100)
 *
 * Пять независимых функций: высота волны, период, ветер,
 * направление свелла, прилив. Чем ближе к идеалу, тем выше балл.
 */

#pragma once

#include "model/surfer_profile.hpp"
#include "model/types.hpp"
#include <cmath>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace surfcast::core {

using namespace surfcast::model;

/**
 * @brief Недопустимые входные данные оценки (отрицательная высота, NaN и т.п.)
 */
class ScoringError : public std::runtime_error {
public:
    explicit ScoringError(const std::string& message)
        : std::runtime_error(message) {}
};

/// Балл высоты волны, если профиля нет в таблице
constexpr int kUnknownProfileScore = 50;

/// Типичная амплитуда прилива для оценки текущего прилива, футы
constexpr double kTideRangeFeet = 6.0;

/// Балл прилива для спотов без предпочтений
constexpr int kAnyTideScore = 80;

/**
 * @brief Округление половины вверх (как в исходной модели баллов)
 */
[[nodiscard]] inline int roundScore(double value) noexcept {
    return static_cast<int>(std::floor(value + 0.5));
}

/**
 * @brief Оценка высоты волны для профиля
 *
 * - в [ideal_min, ideal_max]: 100;
 * - ниже идеала, но >= surfable_min: 60–100 линейно;
 * - выше идеала, но <= surfable_max: 50–100 линейно;
 * - ниже surfable_min: 0–30 пропорционально height / surfable_min;
 * - выше surfable_max: 30 минус 10 за каждый фут сверх, не ниже 0.
 *
 * @param range Диапазон профиля; nullopt → kUnknownProfileScore
 * @throws ScoringError Для отрицательной или нечисловой высоты
 */
[[nodiscard]] int scoreWaveHeight(Feet height, const std::optional<WaveRange>& range);

/**
 * @brief Оценка периода волны (ступенчатая: 15/13/11/9/7 с)
 * @throws ScoringError Для отрицательного или нечислового периода
 */
[[nodiscard]] int scoreWavePeriod(double period);

/**
 * @brief Оценка ветра: балл скорости × множитель направления
 *
 * Множитель по отклонению от оффшорного направления:
 * ≤45° → 1.0, ≤90° → 0.85, ≤135° → 0.6, иначе 0.4.
 * При скорости < 5 миль/ч множитель не ниже 0.9.
 *
 * @throws ScoringError Для отрицательной скорости или румба вне [0°, 360°]
 */
[[nodiscard]] int scoreWind(MilesPerHour speed, Degrees direction, Degrees offshore_direction);

/**
 * @brief Балл скорости ветра без учёта направления
 */
[[nodiscard]] int windSpeedScore(MilesPerHour speed) noexcept;

/**
 * @brief Множитель направления ветра (без поправки на штиль)
 */
[[nodiscard]] double windDirectionMultiplier(Degrees direction, Degrees offshore_direction) noexcept;

/**
 * @brief Оценка направления свелла по ближайшему оптимальному румбу
 *
 * ≤15° → 100, ≤30° → 85, ≤45° → 70, ≤60° → 50, ≤90° → 30, иначе 10.
 * Пустой список оптимальных румбов даёт 10.
 *
 * @throws ScoringError Для румба вне [0°, 360°]
 */
[[nodiscard]] int scoreSwellDirection(Degrees direction, const std::vector<Degrees>& optimal_directions);

/**
 * @brief Оценка текущего прилива для предпочтения спота
 *
 * Высота нормируется на диапазон 0–6 футов и сравнивается
 * с нужной третью диапазона. Фаза пока не учитывается.
 *
 * @throws ScoringError Для нечисловой высоты
 */
[[nodiscard]] int scoreTide(Feet height, TidePhase phase, TidePreference preference);

} // namespace surfcast::core
