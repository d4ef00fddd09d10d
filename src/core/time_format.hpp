/**
 * @file time_format.hpp
 * @brief Текстовое представление времени и дат для сообщений
 */

#pragma once

#include "model/local_time.hpp"
#include <string>

namespace surfcast::core {

using namespace surfcast::model;

/**
 * @brief 12-часовой формат "6:45 AM"
 */
[[nodiscard]] std::string formatClock(LocalTime t);

/**
 * @brief Сколько осталось до момента
 *
 * Разница округляется до минут: "passed", "in 25 min", "in 2h", "in 1h 5m".
 */
[[nodiscard]] std::string timeUntil(LocalTime target, LocalTime now);

/// "Sat"
[[nodiscard]] std::string weekdayName(LocalDate date);

/// "Jun"
[[nodiscard]] std::string monthShortName(unsigned month);

/// "June"
[[nodiscard]] std::string monthFullName(unsigned month);

/**
 * @brief Метка дня "Sat Jun 1"
 */
[[nodiscard]] std::string dateLabel(LocalDate date);

} // namespace surfcast::core
