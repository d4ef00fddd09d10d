/**
 * @file location.hpp
 * @brief Статический профиль серф-спота
 */

#pragma once

#include "types.hpp"
#include <string>
#include <vector>

namespace surfcast::model {

/**
 * @brief Профиль спота (конфигурация, не меняется во время работы)
 */
struct LocationProfile {
    std::string id;                             ///< Идентификатор ("ocean-beach-sf")
    std::string name;                           ///< Отображаемое имя
    std::string region;                         ///< Регион ("Bay Area", "Marin")
    std::string description;
    GeoPoint coordinates;
    std::vector<Degrees> optimal_swell_directions;  ///< Лучшие направления свелла
    Degrees offshore_wind_direction{0.0};       ///< Направление оффшорного ветра
    TidePreference best_tide = TidePreference::Any;
    std::string tide_station;                   ///< Станция прогноза прилива (NOAA)
    std::string buoy_station;                   ///< Буй NOAA
    std::string break_type;                     ///< beach / point / reef / rivermouth
    std::string recommended_skill;              ///< Рекомендуемый уровень (справочно)
};

using LocationList = std::vector<LocationProfile>;

} // namespace surfcast::model
