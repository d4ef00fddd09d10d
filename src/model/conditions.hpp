/**
 * @file conditions.hpp
 * @brief Снимок входных данных на момент расчёта
 */

#pragma once

#include "local_time.hpp"
#include "measurement.hpp"
#include "tide_series.hpp"
#include <map>
#include <string>
#include <vector>

namespace surfcast::model {

/**
 * @brief Все данные, собранные вызывающей стороной к моменту now
 *
 * Движок не обращается к сети и часам: всё нужное передаётся здесь.
 */
struct ConditionsSnapshot {
    LocalTime now;                            ///< Текущее местное время
    MeasurementMap measurements;              ///< По идентификатору спота
    TideSeriesMap tides;                      ///< По идентификатору станции
    std::map<std::string, int> drive_minutes; ///< Время в пути до спота, мин
    std::vector<std::string> notes;           ///< Замечания, возникшие при сборке снимка
};

} // namespace surfcast::model
