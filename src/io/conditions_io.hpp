/**
 * @file conditions_io.hpp
 * @brief Чтение и запись снимка условий (замеры буёв и прогноз прилива)
 */

#pragma once

#include "model/conditions.hpp"
#include "model/region_config.hpp"
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

namespace surfcast::io {

using namespace surfcast::model;

/// Идентификатор формата снимка
constexpr const char* CONDITIONS_FORMAT_ID = "surfcast-conditions";

/// Текущая версия формата снимка
constexpr const char* CONDITIONS_FORMAT_VERSION = "1.0.0";

/**
 * @brief Ошибка чтения или проверки снимка условий
 */
class ConditionsError : public std::runtime_error {
public:
    explicit ConditionsError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Загрузка снимка из файла
 *
 * Если у замера не указаны tide_height/tide_phase, они вычисляются
 * по ряду прилива станции спота на момент now. Если ряда нет,
 * прилив считается нулевым и растущим, в notes добавляется замечание.
 *
 * @param region Конфигурация для сопоставления спота и станции
 * @param now_override Заменяет поле now из файла
 * @throws ConditionsError При ошибке чтения, парсинга или проверки
 */
[[nodiscard]] ConditionsSnapshot loadConditions(
    const std::filesystem::path& path,
    const RegionConfig& region,
    std::optional<LocalTime> now_override = std::nullopt
);

/**
 * @brief Снимок из JSON-строки
 * @throws ConditionsError
 */
[[nodiscard]] ConditionsSnapshot conditionsFromJson(
    const std::string& json,
    const RegionConfig& region,
    std::optional<LocalTime> now_override = std::nullopt
);

/**
 * @brief Снимок в JSON (высота и фаза прилива записываются явно)
 */
[[nodiscard]] std::string conditionsToJson(const ConditionsSnapshot& snapshot, int indent = 2);

/**
 * @brief Сохранение снимка (атомарная запись)
 * @throws ConditionsError При ошибке записи
 */
void saveConditions(const ConditionsSnapshot& snapshot, const std::filesystem::path& path);

} // namespace surfcast::io
