/**
 * @file spot_score.cpp
 * @brief Реализация итоговой оценки спота
 */

#include "spot_score.hpp"
#include "scoring.hpp"
#include "skill_profile.hpp"
#include "model/validation.hpp"
#include <algorithm>
#include <iomanip>
#include <iterator>
#include <sstream>

namespace surfcast::core {

namespace {

std::string fixed1(double v) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << v;
    return ss.str();
}

std::string joinSentences(const std::vector<std::string>& parts) {
    std::string text;
    for (const auto& p : parts) {
        if (!text.empty()) text += ' ';
        text += p;
    }
    return text;
}

} // anonymous namespace

ScoreResult calculateSpotScore(
    const Measurement& measurement,
    const LocationProfile& location,
    const SurferProfile& profile,
    const SkillTable& skill_table
) {
    auto check = validateMeasurement(measurement);
    if (!check.is_valid) {
        throw ScoringError("Недопустимый замер для " + location.id + ": " + check.summary());
    }

    SubScores s;
    s.wave_height = scoreWaveHeight(measurement.wave_height, lookupWaveRange(skill_table, profile));
    s.wave_period = scoreWavePeriod(measurement.wave_period);
    s.wind = scoreWind(measurement.wind_speed, measurement.wind_direction,
                       location.offshore_wind_direction);
    s.swell_direction = scoreSwellDirection(measurement.swell_direction,
                                            location.optimal_swell_directions);
    s.tide = scoreTide(measurement.tide_height, measurement.tide_phase, location.best_tide);

    double weighted =
        s.wave_height * ScoreWeights::kWaveHeight +
        s.wave_period * ScoreWeights::kWavePeriod +
        s.wind * ScoreWeights::kWind +
        s.swell_direction * ScoreWeights::kSwellDirection +
        s.wind * ScoreWeights::kWindDirection +
        s.tide * ScoreWeights::kTide;

    ScoreResult result;
    result.score = std::clamp(roundScore(weighted), 0, 100);
    result.rating = ratingForScore(result.score);
    result.components = s;
    result.breakdown = buildBreakdown(measurement, profile, s);
    return result;
}

ScoreResult calculateSpotScore(
    const Measurement& measurement,
    const LocationProfile& location,
    const SurferProfile& profile
) {
    return calculateSpotScore(measurement, location, profile,
                              defaultRegionConfig().skill_table);
}

std::string buildBreakdown(
    const Measurement& m,
    const SurferProfile& profile,
    const SubScores& scores
) {
    std::vector<std::string> parts;
    const std::string height = fixed1(m.wave_height.value) + "ft";

    // Высота волны
    if (scores.wave_height >= 80) {
        parts.push_back("Excellent wave size (" + height + ") for " +
                        toString(profile.skill) + " " + toString(profile.board) + " surfers.");
    } else if (scores.wave_height >= 60) {
        parts.push_back("Good wave size (" + height + ") for developing skills.");
    } else if (m.wave_height.value > 6.0) {
        parts.push_back("Large waves (" + height + ") - challenging for most surfers.");
    } else if (m.wave_height.value < 2.0) {
        parts.push_back("Small waves (" + height + ") - may be underwhelming.");
    } else {
        parts.push_back("Waves at " + height + ".");
    }

    // Период
    const std::string period = fixed1(m.wave_period) + "s";
    if (scores.wave_period >= 75) {
        parts.push_back("Good wave period (" + period + ") indicates organized groundswell.");
    } else if (scores.wave_period <= 35) {
        parts.push_back("Short period (" + period +
                        ") suggests wind swell - expect choppier conditions.");
    }

    // Ветер
    const double wind = m.wind_speed.value;
    const std::string mph = std::to_string(roundScore(wind)) + "mph";
    if (wind < 5.0) {
        parts.push_back("Light winds with glassy conditions.");
    } else if (wind < 10.0) {
        parts.push_back("Light winds (" + mph + ") with clean conditions.");
    } else if (wind < 15.0) {
        parts.push_back("Moderate winds (" + mph + ") with manageable texture.");
    } else {
        parts.push_back("Strong winds (" + mph + ") creating challenging conditions.");
    }

    // Направление свелла
    if (scores.swell_direction >= 85) {
        parts.push_back("Swell direction is ideal for this spot.");
    } else if (scores.swell_direction <= 30) {
        parts.push_back("Swell direction is not optimal for this spot.");
    }

    return joinSentences(parts);
}

RankedLocationList rankLocations(
    const LocationList& locations,
    const MeasurementMap& measurements,
    const SurferProfile& profile,
    const SkillTable& skill_table
) {
    RankedLocationList ranked;
    ranked.reserve(locations.size());

    for (const auto& loc : locations) {
        RankedLocation entry;
        entry.location = loc;

        auto it = measurements.find(loc.id);
        if (it == measurements.end()) {
            entry.result.score = 0;
            entry.result.rating = Rating::Poor;
            entry.result.breakdown = kNoDataBreakdown;
            entry.has_data = false;
        } else {
            entry.result = calculateSpotScore(it->second, loc, profile, skill_table);
            entry.has_data = true;
        }
        ranked.push_back(std::move(entry));
    }

    std::stable_sort(ranked.begin(), ranked.end(),
        [](const RankedLocation& a, const RankedLocation& b) {
            return a.result.score > b.result.score;
        });

    return ranked;
}

RankedLocationList filterByRegion(const RankedLocationList& ranked, const std::string& region) {
    if (region == "all") {
        return ranked;
    }
    RankedLocationList result;
    std::copy_if(ranked.begin(), ranked.end(), std::back_inserter(result),
        [&region](const RankedLocation& r) { return r.location.region == region; });
    return result;
}

RankedLocationList filterByMinScore(const RankedLocationList& ranked, int min_score) {
    RankedLocationList result;
    std::copy_if(ranked.begin(), ranked.end(), std::back_inserter(result),
        [min_score](const RankedLocation& r) { return r.result.score >= min_score; });
    return result;
}

std::vector<std::string> uniqueRegions(const LocationList& locations) {
    std::vector<std::string> regions;
    for (const auto& loc : locations) {
        if (std::find(regions.begin(), regions.end(), loc.region) == regions.end()) {
            regions.push_back(loc.region);
        }
    }
    return regions;
}

std::string conditionsQuality(int score) {
    if (score >= 90) return "Epic conditions";
    if (score >= 80) return "Excellent conditions";
    if (score >= 70) return "Very good conditions";
    if (score >= 60) return "Good conditions";
    if (score >= 50) return "Fair conditions";
    if (score >= 40) return "Below average";
    if (score >= 30) return "Poor conditions";
    return "Not recommended";
}

} // namespace surfcast::core
