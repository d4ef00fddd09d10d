/**
 * @file types.hpp
 * @brief Базовые перечисления и координаты
 */

#pragma once

#include "units.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace surfcast::model {

/**
 * @brief Тип доски
 */
enum class BoardType {
    Longboard,    ///< Лонгборд
    Mediumboard,  ///< Доска средней длины (mid-length)
    Shortboard    ///< Шортборд
};

/**
 * @brief Уровень катания
 */
enum class SkillLevel {
    Beginner,  ///< Начинающий
    Advanced,  ///< Продвинутый (в профилях спотов также "intermediate")
    Expert     ///< Эксперт
};

/**
 * @brief Предпочтительный прилив для спота
 */
enum class TidePreference {
    Low,
    Mid,
    High,
    Any
};

/**
 * @brief Фаза прилива
 */
enum class TidePhase {
    Rising,   ///< Прилив растёт
    Falling,  ///< Прилив спадает
    High,     ///< Около полной воды
    Low       ///< Около малой воды
};

/**
 * @brief Тип экстремума прилива
 */
enum class TideEventType {
    High,  ///< Полная вода ('H')
    Low    ///< Малая вода ('L')
};

/**
 * @brief Оценка условий
 */
enum class Rating {
    Poor,       ///< < 40
    Fair,       ///< 40–59
    Good,       ///< 60–79
    Excellent   ///< >= 80
};

/**
 * @brief Географические координаты
 */
struct GeoPoint {
    double lat = 0.0;  ///< Широта, градусы (+ север)
    double lng = 0.0;  ///< Долгота, градусы (+ восток)
};

[[nodiscard]] std::string toString(BoardType board);
[[nodiscard]] std::string toString(SkillLevel skill);
[[nodiscard]] std::string toString(TidePreference preference);
[[nodiscard]] std::string toString(TidePhase phase);
[[nodiscard]] std::string toString(Rating rating);

/// "H" / "L", как в прогнозах NOAA
[[nodiscard]] std::string toString(TideEventType type);

/**
 * @brief Парсинг типа доски ("longboard", "mediumboard"/"midlength", "shortboard")
 * @return nullopt для неизвестного значения
 */
[[nodiscard]] std::optional<BoardType> parseBoardType(std::string_view str);

/**
 * @brief Парсинг уровня ("beginner", "advanced"/"intermediate", "expert")
 */
[[nodiscard]] std::optional<SkillLevel> parseSkillLevel(std::string_view str);

[[nodiscard]] std::optional<TidePreference> parseTidePreference(std::string_view str);
[[nodiscard]] std::optional<TidePhase> parseTidePhase(std::string_view str);

/**
 * @brief Парсинг типа экстремума ("H"/"high", "L"/"low")
 */
[[nodiscard]] std::optional<TideEventType> parseTideEventType(std::string_view str);

/**
 * @brief Оценка по итоговому баллу (пороги 80/60/40)
 */
[[nodiscard]] constexpr Rating ratingForScore(int score) noexcept {
    if (score >= 80) return Rating::Excellent;
    if (score >= 60) return Rating::Good;
    if (score >= 40) return Rating::Fair;
    return Rating::Poor;
}

} // namespace surfcast::model
