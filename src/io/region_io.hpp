/**
 * @file region_io.hpp
 * @brief Чтение и запись конфигурации региона (JSON)
 */

#pragma once

#include "model/region_config.hpp"
#include <filesystem>
#include <stdexcept>
#include <string>

namespace surfcast::io {

using namespace surfcast::model;

/// Текущая версия формата конфигурации региона
constexpr const char* REGION_FORMAT_VERSION = "1.0.0";

/// Идентификатор формата
constexpr const char* REGION_FORMAT_ID = "surfcast-region";

/**
 * @brief Ошибка чтения или записи конфигурации региона
 */
class RegionConfigError : public std::runtime_error {
public:
    explicit RegionConfigError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Загрузка конфигурации из файла
 *
 * Отсутствующие разделы (skill_table, wind_curve, monthly_history,
 * locations) берутся из встроенной конфигурации NorCal.
 * Таблица профилей и споты проверяются валидацией.
 *
 * @throws RegionConfigError При ошибке чтения, парсинга или валидации
 */
[[nodiscard]] RegionConfig loadRegionConfig(const std::filesystem::path& path);

/**
 * @brief Сохранение конфигурации (атомарная запись)
 * @throws RegionConfigError При ошибке записи
 */
void saveRegionConfig(const RegionConfig& config, const std::filesystem::path& path);

/**
 * @brief Конфигурация в JSON с отступами
 */
[[nodiscard]] std::string regionToJson(const RegionConfig& config, int indent = 2);

/**
 * @brief Конфигурация из JSON-строки
 * @throws RegionConfigError При ошибке парсинга или валидации
 */
[[nodiscard]] RegionConfig regionFromJson(const std::string& json);

/**
 * @brief Является ли файл конфигурацией региона
 */
[[nodiscard]] bool isRegionFile(const std::filesystem::path& path) noexcept;

} // namespace surfcast::io
