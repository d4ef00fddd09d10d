/**
 * @file skill_profile.hpp
 * @brief Доступ к таблице комфортных высот волн
 */

#pragma once

#include "model/surfer_profile.hpp"
#include <optional>

namespace surfcast::core {

using namespace surfcast::model;

/**
 * @brief Идеальный диапазон высот (для подсказок в интерфейсе)
 */
struct IdealRange {
    double min = 0.0;
    double max = 0.0;
};

/// Диапазон по умолчанию, если профиля нет в таблице
constexpr IdealRange kDefaultIdealRange{2.0, 5.0};

/**
 * @brief Диапазон высот для профиля
 * @return nullopt если ячейка таблицы отсутствует
 */
[[nodiscard]] std::optional<WaveRange> lookupWaveRange(
    const SkillTable& table,
    const SurferProfile& profile
) noexcept;

/**
 * @brief Идеальный диапазон высот или kDefaultIdealRange
 */
[[nodiscard]] IdealRange idealWaveRange(
    const SkillTable& table,
    const SurferProfile& profile
) noexcept;

} // namespace surfcast::core
