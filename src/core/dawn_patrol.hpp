/**
 * @file dawn_patrol.hpp
 * @brief Статус "утреннего патруля": пора ли выезжать к первому свету
 */

#pragma once

#include "sun_times.hpp"
#include <chrono>
#include <optional>
#include <string>

namespace surfcast::core {

/**
 * @brief Состояние в порядке течения дня
 */
enum class DawnPatrolState {
    TooEarly,   ///< До выезда больше 30 минут
    LeaveNow,   ///< Выезжать в ближайшие 30 минут
    OnTheWay,   ///< Уже пора быть в пути
    Surfing,    ///< Светло, до заката
    Missed      ///< Солнце село
};

[[nodiscard]] std::string toString(DawnPatrolState state);

/// За сколько до момента выезда начинается LeaveNow
constexpr std::chrono::minutes kLeaveNowLead{30};

/// Запас на парковку и переодевание
constexpr std::chrono::minutes kArrivalBuffer{10};

struct DawnPatrolStatus {
    DawnPatrolState state = DawnPatrolState::TooEarly;
    std::string message;
    std::optional<LocalTime> leave_by;   ///< Только при известном времени в пути
};

/**
 * @brief Классификация текущего момента
 *
 * Чистая функция: состояние каждый раз вычисляется заново по now.
 * Нулевое время в пути считается неизвестным.
 *
 * @param now Текущее местное время
 * @param sun Солнечные события дня
 * @param drive Время в пути до спота
 */
[[nodiscard]] DawnPatrolStatus dawnPatrolStatus(
    LocalTime now,
    const SunTimes& sun,
    std::optional<std::chrono::minutes> drive = std::nullopt
);

} // namespace surfcast::core
