/**
 * @file local_time.hpp
 * @brief Местное время спота
 *
 * Все метки времени движка - местное "настенное" время спота,
 * часовой пояс уже учтён вызывающей стороной.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace surfcast::model {

using LocalTime = std::chrono::local_time<std::chrono::seconds>;
using LocalDate = std::chrono::local_days;

/**
 * @brief Построить момент времени из календарных полей
 */
[[nodiscard]] LocalTime makeLocalTime(int year, unsigned month, unsigned day,
                                      int hour = 0, int minute = 0, int second = 0);

/**
 * @brief Календарная дата момента времени
 */
[[nodiscard]] inline LocalDate dateOf(LocalTime t) noexcept {
    return std::chrono::floor<std::chrono::days>(t);
}

/**
 * @brief Час суток (0–23)
 */
[[nodiscard]] int hourOf(LocalTime t) noexcept;

/**
 * @brief Номер дня в году (1 = 1 января)
 */
[[nodiscard]] int dayOfYear(LocalDate date) noexcept;

/**
 * @brief Номер месяца (1–12)
 */
[[nodiscard]] unsigned monthOf(LocalDate date) noexcept;

/**
 * @brief Суббота или воскресенье
 */
[[nodiscard]] bool isWeekend(LocalDate date) noexcept;

/**
 * @brief Парсинг ISO-строки "YYYY-MM-DD[T| ]HH:MM[:SS]" или "YYYY-MM-DD"
 *
 * Формат NOAA ("2024-06-01 05:00") также поддерживается.
 * @return nullopt при ошибке формата
 */
[[nodiscard]] std::optional<LocalTime> parseLocalTime(std::string_view str);

/**
 * @brief Форматирование в ISO "YYYY-MM-DDTHH:MM:SS"
 */
[[nodiscard]] std::string formatIsoLocal(LocalTime t);

} // namespace surfcast::model
