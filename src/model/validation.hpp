/**
 * @file validation.hpp
 * @brief Валидация входных данных движка
 */

#pragma once

#include "measurement.hpp"
#include "region_config.hpp"
#include "tide_series.hpp"
#include <optional>
#include <string>
#include <vector>

namespace surfcast::model {

/**
 * @brief Тип ошибки валидации
 */
enum class ValidationErrorType {
    NegativeValue,        ///< Отрицательная высота/период/скорость
    DirectionOutOfRange,  ///< Румб вне [0°, 360°]
    NotANumber,           ///< NaN или бесконечность
    NonMonotonicTime,     ///< Метки времени не по возрастанию
    InconsistentRange,    ///< Нарушен порядок границ диапазона высот
    MissingRequiredField  ///< Отсутствует обязательное поле
};

/**
 * @brief Ошибка валидации
 */
struct ValidationError {
    ValidationErrorType type;
    std::string field;                 ///< Имя поля с ошибкой
    std::string message;               ///< Описание ошибки
    std::optional<size_t> item_index;  ///< Индекс элемента (для массивов)

    [[nodiscard]] std::string toString() const {
        if (item_index.has_value()) {
            return field + "[" + std::to_string(*item_index) + "]: " + message;
        }
        return field + ": " + message;
    }
};

/**
 * @brief Результат валидации
 */
struct ValidationResult {
    bool is_valid = true;
    std::vector<ValidationError> errors;
    std::vector<std::string> warnings;  ///< Некритичные замечания

    void addError(ValidationErrorType type, const std::string& field,
                  const std::string& message, std::optional<size_t> idx = std::nullopt) {
        is_valid = false;
        errors.push_back({type, field, message, idx});
    }

    void addWarning(const std::string& message) {
        warnings.push_back(message);
    }

    void merge(const ValidationResult& other) {
        for (const auto& err : other.errors) {
            errors.push_back(err);
        }
        for (const auto& w : other.warnings) {
            warnings.push_back(w);
        }
        if (!other.is_valid) {
            is_valid = false;
        }
    }

    /**
     * @brief Все ошибки одной строкой через "; "
     */
    [[nodiscard]] std::string summary() const {
        std::string text;
        for (const auto& err : errors) {
            if (!text.empty()) text += "; ";
            text += err.toString();
        }
        return text;
    }

    [[nodiscard]] bool hasErrors() const noexcept { return !errors.empty(); }
    [[nodiscard]] bool hasWarnings() const noexcept { return !warnings.empty(); }
};

/**
 * @brief Константы валидации
 */
namespace validation_limits {
    constexpr double kMinDirection = 0.0;     ///< Мин. румб
    constexpr double kMaxDirection = 360.0;   ///< Макс. румб
    constexpr double kMaxWaveHeight = 100.0;  ///< Выше - почти наверняка ошибка единиц
    constexpr double kMaxWindSpeed = 150.0;   ///< Выше - почти наверняка ошибка единиц
}

/**
 * @brief Проверка высоты волны (>= 0, конечная)
 */
[[nodiscard]] ValidationResult validateWaveHeight(Feet height);

/**
 * @brief Проверка периода волны (>= 0, конечный)
 */
[[nodiscard]] ValidationResult validateWavePeriod(double period);

/**
 * @brief Проверка скорости ветра (>= 0, конечная)
 */
[[nodiscard]] ValidationResult validateWindSpeed(MilesPerHour speed);

/**
 * @brief Проверка румба ([0°, 360°], конечный)
 */
[[nodiscard]] ValidationResult validateDirection(Degrees direction, const std::string& field);

/**
 * @brief Полная проверка замера
 *
 * Значения, подозрительно большие для футов/миль в час, дают предупреждение.
 */
[[nodiscard]] ValidationResult validateMeasurement(const Measurement& m);

/**
 * @brief Проверка ряда прилива: конечные высоты, время по возрастанию
 *
 * Нарушение чередования полной/малой воды - только предупреждение.
 */
[[nodiscard]] ValidationResult validateTideSeries(const TideSeries& series);

/**
 * @brief Проверка таблицы профилей (инвариант порядка границ)
 */
[[nodiscard]] ValidationResult validateSkillTable(const SkillTable& table);

/**
 * @brief Проверка конфигурации спота
 */
[[nodiscard]] ValidationResult validateLocation(const LocationProfile& location);

} // namespace surfcast::model
