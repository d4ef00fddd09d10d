/**
 * @file validation.cpp
 * @brief Реализация валидации входных данных
 */

#include "validation.hpp"
#include <cmath>

namespace surfcast::model {

namespace {

std::string num(double v) {
    return std::to_string(v);
}

} // anonymous namespace

ValidationResult validateWaveHeight(Feet height) {
    ValidationResult result;
    if (!std::isfinite(height.value)) {
        result.addError(ValidationErrorType::NotANumber, "wave_height",
            "Высота волны не является числом");
    } else if (height.value < 0.0) {
        result.addError(ValidationErrorType::NegativeValue, "wave_height",
            "Отрицательная высота волны: " + num(height.value) + " фт");
    } else if (height.value > validation_limits::kMaxWaveHeight) {
        result.addWarning("Высота волны " + num(height.value) + " фт - проверьте единицы");
    }
    return result;
}

ValidationResult validateWavePeriod(double period) {
    ValidationResult result;
    if (!std::isfinite(period)) {
        result.addError(ValidationErrorType::NotANumber, "wave_period",
            "Период волны не является числом");
    } else if (period < 0.0) {
        result.addError(ValidationErrorType::NegativeValue, "wave_period",
            "Отрицательный период волны: " + num(period) + " с");
    }
    return result;
}

ValidationResult validateWindSpeed(MilesPerHour speed) {
    ValidationResult result;
    if (!std::isfinite(speed.value)) {
        result.addError(ValidationErrorType::NotANumber, "wind_speed",
            "Скорость ветра не является числом");
    } else if (speed.value < 0.0) {
        result.addError(ValidationErrorType::NegativeValue, "wind_speed",
            "Отрицательная скорость ветра: " + num(speed.value) + " миль/ч");
    } else if (speed.value > validation_limits::kMaxWindSpeed) {
        result.addWarning("Скорость ветра " + num(speed.value) + " миль/ч - проверьте единицы");
    }
    return result;
}

ValidationResult validateDirection(Degrees direction, const std::string& field) {
    ValidationResult result;
    if (!std::isfinite(direction.value)) {
        result.addError(ValidationErrorType::NotANumber, field,
            "Направление не является числом");
    } else if (direction.value < validation_limits::kMinDirection ||
               direction.value > validation_limits::kMaxDirection) {
        result.addError(ValidationErrorType::DirectionOutOfRange, field,
            "Направление " + num(direction.value) + "° вне диапазона [0°, 360°]");
    }
    return result;
}

ValidationResult validateMeasurement(const Measurement& m) {
    ValidationResult result;
    result.merge(validateWaveHeight(m.wave_height));
    result.merge(validateWavePeriod(m.wave_period));
    result.merge(validateWindSpeed(m.wind_speed));
    result.merge(validateDirection(m.swell_direction, "swell_direction"));
    result.merge(validateDirection(m.wind_direction, "wind_direction"));

    if (!std::isfinite(m.tide_height.value)) {
        result.addError(ValidationErrorType::NotANumber, "tide_height",
            "Высота прилива не является числом");
    }
    return result;
}

ValidationResult validateTideSeries(const TideSeries& series) {
    ValidationResult result;

    for (size_t i = 0; i < series.hourly.size(); ++i) {
        if (!std::isfinite(series.hourly[i].height.value)) {
            result.addError(ValidationErrorType::NotANumber, "hourly",
                "Высота прилива не является числом", i);
        }
        if (i > 0 && series.hourly[i].time <= series.hourly[i - 1].time) {
            result.addError(ValidationErrorType::NonMonotonicTime, "hourly",
                "Метка времени не больше предыдущей", i);
        }
    }

    for (size_t i = 0; i < series.high_low.size(); ++i) {
        const auto& e = series.high_low[i];
        if (!std::isfinite(e.height.value)) {
            result.addError(ValidationErrorType::NotANumber, "high_low",
                "Высота экстремума не является числом", i);
        }
        if (i > 0) {
            const auto& prev = series.high_low[i - 1];
            if (e.time <= prev.time) {
                result.addError(ValidationErrorType::NonMonotonicTime, "high_low",
                    "Метка времени не больше предыдущей", i);
            }
            if (e.type == prev.type) {
                result.addWarning("Экстремумы прилива не чередуются (элемент " +
                                  std::to_string(i) + ")");
            }
        }
    }

    return result;
}

ValidationResult validateSkillTable(const SkillTable& table) {
    ValidationResult result;
    for (auto board : {BoardType::Longboard, BoardType::Mediumboard, BoardType::Shortboard}) {
        for (auto skill : {SkillLevel::Beginner, SkillLevel::Advanced, SkillLevel::Expert}) {
            auto range = table.find(board, skill);
            std::string field = "skill_table." + toString(board) + "." + toString(skill);
            if (!range.has_value()) {
                result.addWarning("Нет диапазона для " + toString(board) + "/" + toString(skill));
                continue;
            }
            if (!range->isConsistent()) {
                result.addError(ValidationErrorType::InconsistentRange, field,
                    "Ожидается 0 < surfable_min <= ideal_min <= ideal_max <= surfable_max");
            }
        }
    }
    return result;
}

ValidationResult validateLocation(const LocationProfile& location) {
    ValidationResult result;
    if (location.id.empty()) {
        result.addError(ValidationErrorType::MissingRequiredField, "id",
            "Пустой идентификатор спота");
    }
    if (location.optimal_swell_directions.empty()) {
        result.addError(ValidationErrorType::MissingRequiredField, "optimal_swell_directions",
            "Не заданы направления свелла для " + location.id);
    }
    for (size_t i = 0; i < location.optimal_swell_directions.size(); ++i) {
        auto r = validateDirection(location.optimal_swell_directions[i], "optimal_swell_directions");
        for (auto err : r.errors) {
            err.item_index = i;
            result.errors.push_back(err);
            result.is_valid = false;
        }
    }
    result.merge(validateDirection(location.offshore_wind_direction, "offshore_wind_direction"));

    if (std::abs(location.coordinates.lat) > 90.0 || std::abs(location.coordinates.lng) > 180.0) {
        result.addError(ValidationErrorType::DirectionOutOfRange, "coordinates",
            "Координаты вне допустимого диапазона");
    }
    return result;
}

} // namespace surfcast::model
