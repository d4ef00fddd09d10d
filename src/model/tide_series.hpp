/**
 * @file tide_series.hpp
 * @brief Ряд прогноза прилива
 */

#pragma once

#include "local_time.hpp"
#include "types.hpp"
#include <map>
#include <string>
#include <vector>

namespace surfcast::model {

/**
 * @brief Почасовое значение прилива
 */
struct TideSample {
    LocalTime time;
    Feet height{0.0};
};

/**
 * @brief Экстремум прилива (полная или малая вода)
 */
struct TideEvent {
    LocalTime time;
    Feet height{0.0};
    TideEventType type = TideEventType::High;
};

/**
 * @brief Прогноз прилива по станции
 *
 * Почасовая часть упорядочена по времени без пропусков больше часа.
 * Экстремумы должны чередоваться, но потребители допускают нарушение.
 */
struct TideSeries {
    std::vector<TideSample> hourly;
    std::vector<TideEvent> high_low;

    [[nodiscard]] bool empty() const noexcept {
        return hourly.empty() && high_low.empty();
    }

    /**
     * @brief Подмножество ряда за одни сутки
     */
    [[nodiscard]] TideSeries forDate(LocalDate date) const {
        TideSeries day;
        for (const auto& s : hourly) {
            if (dateOf(s.time) == date) day.hourly.push_back(s);
        }
        for (const auto& e : high_low) {
            if (dateOf(e.time) == date) day.high_low.push_back(e);
        }
        return day;
    }
};

/**
 * @brief Ряды прилива по идентификатору станции
 */
using TideSeriesMap = std::map<std::string, TideSeries>;

} // namespace surfcast::model
