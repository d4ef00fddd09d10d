/**
 * @file week_forecast.cpp
 * @brief Реализация недельного прогноза
 */

#include "week_forecast.hpp"
#include "tide_analysis.hpp"
#include "time_format.hpp"
#include <algorithm>
#include <cctype>

namespace surfcast::core {

namespace {

// Часы катания для анализа прилива (включительно);
// лучшее окно дня заканчивается не позже kDayLastHour
constexpr int kDayFirstHour = 6;
constexpr int kDayLastHour = 18;

// Утреннее окно
constexpr int kDawnLastHour = 9;

std::string joinWith(const std::vector<std::string>& parts, const std::string& sep) {
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) result += sep;
        result += parts[i];
    }
    return result;
}

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // anonymous namespace

bool isTideIdeal(Feet height, TidePreference preference) noexcept {
    switch (preference) {
        case TidePreference::Low:  return height.value < 2.0;
        case TidePreference::Mid:  return height.value >= 1.5 && height.value <= 4.0;
        case TidePreference::High: return height.value > 3.5;
        case TidePreference::Any:  return true;
    }
    return true;
}

DayForecast analyzeDay(
    LocalDate date,
    const TideSeries& day_tides,
    const LocationProfile& location,
    const WeekOptions& options
) {
    DayForecast day;
    day.date = date;
    day.day_name = weekdayName(date);
    const std::chrono::year_month_day ymd{date};
    day.date_label = monthShortName(static_cast<unsigned>(ymd.month())) + " " +
                     std::to_string(static_cast<unsigned>(ymd.day()));
    day.sun = computeSunTimes(location.coordinates, date, options.utc_offset_minutes);
    day.moon = moonPhase(LocalTime{date} + std::chrono::hours{12}, options.utc_offset_minutes);

    if (day_tides.empty()) {
        day.score = kBaseDayScore;
        day.analysis = "Tide data unavailable";
        return day;
    }
    day.has_tide_data = true;

    int ideal_hours = 0;
    int dawn_hours = 0;
    for (const auto& sample : day_tides.hourly) {
        const int hour = hourOf(sample.time);
        if (hour < kDayFirstHour || hour > kDayLastHour) continue;
        if (!isTideIdeal(sample.height, location.best_tide)) continue;

        ++ideal_hours;
        if (hour <= kDawnLastHour) ++dawn_hours;
    }

    int score = kBaseDayScore;
    std::vector<std::string> points;

    if (dawn_hours >= 2) {
        score += 25;
        points.emplace_back("Great early morning tide");
    } else if (dawn_hours >= 1) {
        score += 15;
        points.emplace_back("Good dawn patrol window");
    }

    if (ideal_hours >= 6) {
        score += 20;
        points.emplace_back("Extended surf window");
    } else if (ideal_hours >= 3) {
        score += 10;
    }

    if (isWeekend(date)) {
        score += 5;
        points.emplace_back("Weekend");
    }

    // Без списка экстремумов проверки на экстремальную воду пропускаются
    if (auto extremes = tideExtremes(day_tides)) {
        if (extremes->max_high.value > 6.0) {
            score -= 10;
            points.emplace_back("Very high tide");
        }
        if (extremes->min_low.value < -0.5) {
            score -= 5;
            points.emplace_back("Negative low tide");
        }
    }

    WindowSearchOptions window_opts;
    window_opts.first_hour = kDayFirstHour;
    window_opts.end_hour = kDayLastHour;
    window_opts.wind_curve = options.wind_curve;
    day.best_window = findBestTimeWindow(day_tides.hourly, date, location.best_tide, window_opts);

    day.score = std::clamp(score, 0, 100);
    day.analysis = points.empty() ? "Average conditions expected" : joinWith(points, " • ");
    return day;
}

WeekForecast analyzeWeek(
    const TideSeries& tides,
    const LocationProfile& location,
    LocalDate start,
    const WeekOptions& options
) {
    WeekForecast week;
    week.days.reserve(kForecastDays);

    for (int i = 0; i < kForecastDays; ++i) {
        const LocalDate date = start + std::chrono::days{i};
        week.days.push_back(analyzeDay(date, tides.forDate(date), location, options));
    }

    int best_score = -1;
    for (size_t i = 0; i < week.days.size(); ++i) {
        if (week.days[i].score > best_score) {
            best_score = week.days[i].score;
            week.best_day = i;
        }
    }

    week.best_day_reason = week.best_day
        ? bestDayReason(week.days[*week.best_day], week.days)
        : "Unable to determine best day";
    return week;
}

std::string bestDayReason(const DayForecast& best, const std::vector<DayForecast>& all) {
    std::vector<std::string> parts;
    parts.push_back(best.day_name + " " + best.date_label);

    if (!best.analysis.empty()) {
        parts.push_back(lowercase(best.analysis));
    }

    if (best.best_window) {
        parts.push_back("best from " + best.best_window->startLabel() +
                        " to " + best.best_window->endLabel());
    }

    if (!all.empty()) {
        double sum = 0.0;
        for (const auto& d : all) sum += d.score;
        if (best.score > sum / static_cast<double>(all.size()) + 15.0) {
            parts.push_back("significantly better than other days");
        }
    }

    return joinWith(parts, " — ");
}

} // namespace surfcast::core
