/**
 * @file directions.hpp
 * @brief Румбы и источник свелла по направлению
 */

#pragma once

#include "model/units.hpp"
#include <string>

namespace surfcast::core {

using namespace surfcast::model;

/**
 * @brief Румб из 16 ("N", "NNE", ... "NNW")
 *
 * Направление приводится к [0, 360) и округляется до ближайших 22.5°.
 */
[[nodiscard]] std::string cardinalDirection(Degrees direction);

/**
 * @brief Откуда пришёл свелл
 *
 * - [270, 315] → "North Pacific / Alaska"
 * - [225, 270) → "West Pacific"
 * - [180, 225) → "South Pacific / Southern Hemisphere"
 * - >= 315 или < 45 → "North Pacific / Gulf of Alaska"
 * - остальное → "Local wind swell"
 */
[[nodiscard]] std::string swellSource(Degrees direction);

} // namespace surfcast::core
