/**
 * @file surfer_profile.hpp
 * @brief Профиль сёрфера и таблица комфортных высот волн
 */

#pragma once

#include "types.hpp"
#include <array>
#include <optional>

namespace surfcast::model {

/**
 * @brief Диапазон высот волны для профиля, футы
 *
 * Инвариант: surfable_min <= ideal_min <= ideal_max <= surfable_max.
 */
struct WaveRange {
    double ideal_min = 0.0;
    double ideal_max = 0.0;
    double surfable_min = 0.0;
    double surfable_max = 0.0;

    [[nodiscard]] constexpr bool isConsistent() const noexcept {
        return surfable_min <= ideal_min && ideal_min <= ideal_max &&
               ideal_max <= surfable_max && surfable_min > 0.0;
    }

    constexpr bool operator==(const WaveRange&) const noexcept = default;
};

/**
 * @brief Профиль сёрфера
 */
struct SurferProfile {
    BoardType board = BoardType::Mediumboard;
    SkillLevel skill = SkillLevel::Advanced;
};

/**
 * @brief Таблица {доска × уровень} → диапазон высот
 *
 * Ячейка может отсутствовать (неполная региональная конфигурация).
 */
class SkillTable {
public:
    [[nodiscard]] std::optional<WaveRange> find(BoardType board, SkillLevel skill) const noexcept {
        return cells_[index(board)][index(skill)];
    }

    [[nodiscard]] std::optional<WaveRange> find(const SurferProfile& profile) const noexcept {
        return find(profile.board, profile.skill);
    }

    void set(BoardType board, SkillLevel skill, const WaveRange& range) noexcept {
        cells_[index(board)][index(skill)] = range;
    }

    void erase(BoardType board, SkillLevel skill) noexcept {
        cells_[index(board)][index(skill)].reset();
    }

private:
    template <typename E>
    static constexpr size_t index(E value) noexcept {
        return static_cast<size_t>(value);
    }

    std::array<std::array<std::optional<WaveRange>, 3>, 3> cells_{};
};

} // namespace surfcast::model
