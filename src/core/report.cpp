/**
 * @file report.cpp
 * @brief Построение сводного отчёта
 */

#include "report.hpp"
#include "directions.hpp"
#include "spot_score.hpp"
#include "sun_times.hpp"
#include "model/validation.hpp"
#include <utility>

namespace surfcast::core {

namespace {

void collectWarnings(const std::string& prefix, const ValidationResult& check,
                     std::vector<std::string>& warnings) {
    for (const auto& err : check.errors) {
        warnings.push_back(prefix + err.toString());
    }
    for (const auto& w : check.warnings) {
        warnings.push_back(prefix + w);
    }
}

} // anonymous namespace

SurfReport buildSurfReport(
    const RegionConfig& region,
    const ConditionsSnapshot& snapshot,
    const SurferProfile& profile,
    const ReportOptions& options
) {
    SurfReport report;
    report.region = region.name;
    report.generated_for = snapshot.now;
    report.utc_offset_minutes = options.utc_offset_minutes.value_or(region.utc_offset_minutes);
    report.profile = profile;
    report.moon = moonPhase(snapshot.now, report.utc_offset_minutes);

    const LocalDate today = dateOf(snapshot.now);

    // Проверка входных данных: замечания не прерывают расчёт
    report.warnings = snapshot.notes;
    for (const auto& [id, m] : snapshot.measurements) {
        if (region.findLocation(id) == nullptr) {
            report.warnings.push_back("Замер для неизвестного спота: " + id);
            continue;
        }
        // Ошибки замера обрабатывает rankLocations, здесь только предупреждения
        for (const auto& w : validateMeasurement(m).warnings) {
            report.warnings.push_back("Замер " + id + ": " + w);
        }
    }
    for (const auto& [station, series] : snapshot.tides) {
        collectWarnings("Прилив " + station + ": ", validateTideSeries(series), report.warnings);
    }

    auto ranked = rankLocations(region.locations, snapshot.measurements, profile, region.skill_table);
    ranked = filterByRegion(ranked, options.region_filter);
    if (options.min_score > 0) {
        ranked = filterByMinScore(ranked, options.min_score);
    }

    WeekOptions week_opts;
    week_opts.utc_offset_minutes = report.utc_offset_minutes;
    week_opts.wind_curve = region.wind_curve;

    WindowSearchOptions window_opts;
    window_opts.wind_curve = region.wind_curve;

    for (auto& entry : ranked) {
        const LocationProfile& loc = entry.location;

        LocationReport lr;
        lr.quality = conditionsQuality(entry.result.score);

        if (auto it = snapshot.measurements.find(loc.id); it != snapshot.measurements.end()) {
            const Measurement& m = it->second;
            lr.measurement = m;
            lr.swell_cardinal = cardinalDirection(m.swell_direction);
            lr.swell_source = swellSource(m.swell_direction);
            lr.wind_cardinal = cardinalDirection(m.wind_direction);
            lr.history = compareWithHistory(entry.result.score, monthOf(today), region.history);
        } else {
            report.warnings.push_back("Нет замера для спота " + loc.id);
        }

        const TideSeries* series = nullptr;
        if (auto it = snapshot.tides.find(loc.tide_station); it != snapshot.tides.end()) {
            series = &it->second;
        }

        if (series != nullptr && !series->empty()) {
            lr.has_tides = true;
            lr.tide_height = currentTideHeight(*series, snapshot.now);
            lr.tide_phase = tidePhase(*series, snapshot.now);
            lr.next_tides = nextTides(*series, snapshot.now);
            lr.best_window = findBestTimeWindow(series->hourly, today, loc.best_tide, window_opts);
            lr.week = analyzeWeek(*series, loc, today, week_opts);
        } else {
            report.warnings.push_back("Нет прогноза прилива для спота " + loc.id +
                                      " (станция " + loc.tide_station + ")");
            lr.week = analyzeWeek(TideSeries{}, loc, today, week_opts);
        }

        lr.sun = computeSunTimes(loc.coordinates, today, report.utc_offset_minutes);
        lr.daylight = isDaylight(lr.sun, snapshot.now);

        std::optional<std::chrono::minutes> drive;
        if (auto it = snapshot.drive_minutes.find(loc.id); it != snapshot.drive_minutes.end()) {
            drive = std::chrono::minutes{it->second};
        }
        lr.dawn_patrol = dawnPatrolStatus(snapshot.now, lr.sun, drive);

        lr.ranked = std::move(entry);
        report.locations.push_back(std::move(lr));
    }

    return report;
}

} // namespace surfcast::core
