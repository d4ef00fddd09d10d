/**
 * @file best_window.cpp
 * @brief Реализация поиска лучшего окна
 */

#include "best_window.hpp"
#include <algorithm>

namespace surfcast::core {

namespace {

struct ScoredHour {
    int hour = 0;
    double score = 0.0;
    double tide = 0.0;
};

std::optional<TimeWindow> bestOfSize(const std::vector<ScoredHour>& hours, size_t size,
                                     std::optional<TimeWindow> best) {
    if (hours.size() < size) {
        return best;
    }

    for (size_t i = 0; i + size <= hours.size(); ++i) {
        double score_sum = 0.0;
        double tide_sum = 0.0;
        for (size_t j = i; j < i + size; ++j) {
            score_sum += hours[j].score;
            tide_sum += hours[j].tide;
        }
        const double avg_score = score_sum / static_cast<double>(size);

        if (!best || avg_score > best->avg_score) {
            TimeWindow w;
            w.start_hour = hours[i].hour;
            w.end_hour = hours[i + size - 1].hour + 1;
            w.avg_score = avg_score;
            w.avg_tide = tide_sum / static_cast<double>(size);
            best = w;
        }
    }
    return best;
}

std::string windowReason(const TimeWindow& w) {
    const std::string tide = tideDescription(w.avg_tide);
    if (w.start_hour >= 5 && w.start_hour < 9) {
        return tide + " + light morning winds";
    }
    if (w.start_hour >= 17) {
        return tide + " + evening glass-off";
    }
    return tide + " conditions";
}

} // anonymous namespace

std::string TimeWindow::startLabel() const {
    return formatHour(start_hour);
}

std::string TimeWindow::endLabel() const {
    return formatHour(end_hour);
}

int scoreTideForWindow(Feet height, TidePreference preference) noexcept {
    if (preference == TidePreference::Any) {
        return 70;
    }

    const double pct = std::clamp((height.value + 1.0) / 7.0, 0.0, 1.0);

    switch (preference) {
        case TidePreference::Low:
            if (pct < 0.3) return 100;
            if (pct < 0.45) return 80;
            if (pct < 0.6) return 50;
            return 20;
        case TidePreference::Mid:
            if (pct >= 0.35 && pct <= 0.65) return 100;
            if (pct >= 0.25 && pct <= 0.75) return 80;
            return 50;
        case TidePreference::High:
            if (pct > 0.7) return 100;
            if (pct > 0.55) return 80;
            if (pct > 0.4) return 50;
            return 20;
        case TidePreference::Any:
            break;
    }
    return 50;
}

std::string tideDescription(double height_ft) {
    if (height_ft < 1.0) return "Low tide";
    if (height_ft < 2.5) return "Low-mid tide";
    if (height_ft < 4.0) return "Mid tide";
    if (height_ft < 5.0) return "Mid-high tide";
    return "High tide";
}

std::string formatHour(int hour) {
    if (hour == 0 || hour == 24) return "12:00 AM";
    if (hour == 12) return "12:00 PM";
    if (hour < 12) return std::to_string(hour) + ":00 AM";
    return std::to_string(hour - 12) + ":00 PM";
}

std::optional<TimeWindow> findBestTimeWindow(
    const std::vector<TideSample>& hourly,
    LocalDate day,
    TidePreference preference,
    const WindowSearchOptions& options
) {
    std::vector<ScoredHour> hours;

    for (const auto& sample : hourly) {
        if (dateOf(sample.time) != day) {
            continue;
        }
        const int hour = hourOf(sample.time);
        if (hour < options.first_hour || hour >= options.end_hour) {
            continue;
        }

        ScoredHour h;
        h.hour = hour;
        h.tide = sample.height.value;
        h.score = scoreTideForWindow(sample.height, preference) * 0.5 +
                  options.wind_curve.valueAt(hour);
        hours.push_back(h);
    }

    if (hours.empty()) {
        return std::nullopt;
    }

    std::optional<TimeWindow> best;
    best = bestOfSize(hours, 3, best);
    best = bestOfSize(hours, 2, best);
    if (!best) {
        best = bestOfSize(hours, 1, best);
    }

    best->reason = windowReason(*best);
    return best;
}

} // namespace surfcast::core
