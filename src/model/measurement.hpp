/**
 * @file measurement.hpp
 * @brief Мгновенный замер условий на споте
 */

#pragma once

#include "types.hpp"
#include <map>
#include <optional>
#include <string>

namespace surfcast::model {

/**
 * @brief Замер условий в один момент времени
 *
 * Данные буя и прогноза прилива, уже приведённые к футам, милям в час
 * и градусам. Неизменяем, используется один раз на расчёт балла.
 */
struct Measurement {
    Feet wave_height{0.0};            ///< Высота волны (>= 0)
    double wave_period = 0.0;         ///< Период волны, с (>= 0)
    Degrees swell_direction{0.0};     ///< Откуда идёт свелл, [0°, 360°]
    MilesPerHour wind_speed{0.0};     ///< Скорость ветра (>= 0)
    Degrees wind_direction{0.0};      ///< Откуда дует ветер, [0°, 360°]
    Feet tide_height{0.0};            ///< Высота прилива (знаковая, от MLLW)
    TidePhase tide_phase = TidePhase::Rising;

    std::optional<double> water_temp_f;  ///< Температура воды, °F (справочно)
    std::optional<double> air_temp_f;    ///< Температура воздуха, °F (справочно)
};

/**
 * @brief Замеры по идентификатору спота
 */
using MeasurementMap = std::map<std::string, Measurement>;

} // namespace surfcast::model
