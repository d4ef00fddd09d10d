/**
 * @file score_result.hpp
 * @brief Результат оценки спота
 */

#pragma once

#include "location.hpp"
#include "types.hpp"
#include <string>
#include <vector>

namespace surfcast::model {

/**
 * @brief Частные оценки (0–100)
 */
struct SubScores {
    int wave_height = 0;
    int wave_period = 0;
    int wind = 0;
    int swell_direction = 0;
    int tide = 0;
};

/**
 * @brief Итоговая оценка спота
 *
 * Пересчитывается целиком при любом изменении входных данных.
 */
struct ScoreResult {
    int score = 0;                 ///< 0–100
    Rating rating = Rating::Poor;
    std::string breakdown;         ///< Текстовое пояснение (показывается как есть)
    SubScores components;
};

/**
 * @brief Спот с оценкой (элемент рейтинга)
 */
struct RankedLocation {
    LocationProfile location;
    ScoreResult result;
    bool has_data = false;   ///< false - для спота не было замера
};

using RankedLocationList = std::vector<RankedLocation>;

} // namespace surfcast::model
