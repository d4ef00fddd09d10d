/**
 * @file scoring.cpp
 * @brief Реализация частных оценок условий
 */

#include "scoring.hpp"
#include "angle_utils.hpp"
#include "model/validation.hpp"
#include <algorithm>

namespace surfcast::core {

namespace {

void throwIfInvalid(const ValidationResult& result) {
    if (!result.is_valid) {
        throw ScoringError(result.summary());
    }
}

} // anonymous namespace

int scoreWaveHeight(Feet height, const std::optional<WaveRange>& range) {
    throwIfInvalid(validateWaveHeight(height));

    if (!range.has_value()) {
        return kUnknownProfileScore;
    }

    const double h = height.value;
    const WaveRange& r = *range;

    // Идеальный диапазон
    if (h >= r.ideal_min && h <= r.ideal_max) {
        return 100;
    }

    // Меньше идеала, но катабельно: 60–100
    if (h >= r.surfable_min && h < r.ideal_min) {
        double span = r.ideal_min - r.surfable_min;
        double diff = r.ideal_min - h;
        return roundScore(100.0 - (diff / span) * 40.0);
    }

    // Больше идеала, но катабельно: 50–100
    if (h > r.ideal_max && h <= r.surfable_max) {
        double span = r.surfable_max - r.ideal_max;
        double diff = h - r.ideal_max;
        return roundScore(100.0 - (diff / span) * 50.0);
    }

    // Слишком мелко
    if (h < r.surfable_min) {
        return std::max(0, roundScore((h / r.surfable_min) * 30.0));
    }

    // Слишком крупно
    return std::max(0, roundScore(30.0 - (h - r.surfable_max) * 10.0));
}

int scoreWavePeriod(double period) {
    throwIfInvalid(validateWavePeriod(period));

    if (period >= 15.0) return 100;  // Дальний грундсвелл
    if (period >= 13.0) return 90;
    if (period >= 11.0) return 75;   // Хороший грундсвелл
    if (period >= 9.0) return 55;
    if (period >= 7.0) return 35;
    return 20;                       // Ветровая волна
}

int windSpeedScore(MilesPerHour speed) noexcept {
    const double v = speed.value;
    if (v < 5.0) return 100;   // Штиль, "стекло"
    if (v < 10.0) return 85;
    if (v < 15.0) return 65;
    if (v < 20.0) return 40;
    if (v < 25.0) return 20;
    return 5;
}

double windDirectionMultiplier(Degrees direction, Degrees offshore_direction) noexcept {
    double diff = angularDistance(direction, offshore_direction).value;

    if (diff <= 45.0) return 1.0;    // Оффшор
    if (diff <= 90.0) return 0.85;   // Боковой с берега
    if (diff <= 135.0) return 0.6;   // Боковой с моря
    return 0.4;                      // Оншор
}

int scoreWind(MilesPerHour speed, Degrees direction, Degrees offshore_direction) {
    ValidationResult check = validateWindSpeed(speed);
    check.merge(validateDirection(direction, "wind_direction"));
    throwIfInvalid(check);

    double multiplier = windDirectionMultiplier(direction, offshore_direction);

    // При слабом ветре направление почти не важно
    if (speed.value < 5.0) {
        multiplier = std::max(0.9, multiplier);
    }

    return roundScore(windSpeedScore(speed) * multiplier);
}

int scoreSwellDirection(Degrees direction, const std::vector<Degrees>& optimal_directions) {
    throwIfInvalid(validateDirection(direction, "swell_direction"));

    double min_diff = 180.0;
    for (const auto& optimal : optimal_directions) {
        min_diff = std::min(min_diff, angularDistance(direction, optimal).value);
    }

    if (min_diff <= 15.0) return 100;
    if (min_diff <= 30.0) return 85;
    if (min_diff <= 45.0) return 70;
    if (min_diff <= 60.0) return 50;
    if (min_diff <= 90.0) return 30;
    return 10;
}

int scoreTide(Feet height, [[maybe_unused]] TidePhase phase, TidePreference preference) {
    if (!std::isfinite(height.value)) {
        throw ScoringError("tide_height: Высота прилива не является числом");
    }

    if (preference == TidePreference::Any) {
        return kAnyTideScore;
    }

    const double pct = std::clamp(height.value / kTideRangeFeet, 0.0, 1.0);

    switch (preference) {
        case TidePreference::Low:
            if (pct < 0.33) return 100;
            if (pct < 0.5) return 75;
            if (pct < 0.67) return 50;
            return 30;

        case TidePreference::Mid:
            if (pct >= 0.33 && pct <= 0.67) return 100;
            if (pct >= 0.2 && pct <= 0.8) return 75;
            return 50;

        case TidePreference::High:
            if (pct > 0.67) return 100;
            if (pct > 0.5) return 75;
            if (pct > 0.33) return 50;
            return 30;

        case TidePreference::Any:
            break;
    }

    return 50;
}

} // namespace surfcast::core
