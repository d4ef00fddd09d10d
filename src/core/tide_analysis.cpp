/**
 * @file tide_analysis.cpp
 * @brief Реализация анализа прилива
 */

#include "tide_analysis.hpp"
#include "angle_utils.hpp"
#include <algorithm>

namespace surfcast::core {

namespace {

TidePhase peakPhase(TideEventType type) noexcept {
    return type == TideEventType::High ? TidePhase::High : TidePhase::Low;
}

} // anonymous namespace

Feet currentTideHeight(const TideSeries& series, LocalTime now) noexcept {
    const auto& hourly = series.hourly;

    if (hourly.empty()) {
        return Feet{0.0};
    }

    if (now < hourly.front().time) {
        return hourly.front().height;
    }

    // Пара значений, между которыми лежит now
    for (size_t i = 0; i + 1 < hourly.size(); ++i) {
        const auto& cur = hourly[i];
        const auto& next = hourly[i + 1];

        if (now >= cur.time && now < next.time) {
            auto t = static_cast<double>(now.time_since_epoch().count());
            auto t1 = static_cast<double>(cur.time.time_since_epoch().count());
            auto t2 = static_cast<double>(next.time.time_since_epoch().count());
            return Feet{interpolate(t, cur.height.value, t1, next.height.value, t2)};
        }
    }

    return hourly.back().height;
}

TidePhase tidePhase(const TideSeries& series, LocalTime now) noexcept {
    const TideEvent* prev = nullptr;
    const TideEvent* next = nullptr;

    for (const auto& event : series.high_low) {
        if (event.time <= now) {
            prev = &event;
        } else {
            next = &event;
            break;
        }
    }

    if (next != nullptr && next->time - now < kTidePeakWindow) {
        return peakPhase(next->type);
    }

    if (prev != nullptr) {
        if (now - prev->time < kTidePeakWindow) {
            return peakPhase(prev->type);
        }
        return prev->type == TideEventType::Low ? TidePhase::Rising : TidePhase::Falling;
    }

    return TidePhase::Rising;
}

NextTides nextTides(const TideSeries& series, LocalTime now) {
    NextTides result;
    for (const auto& event : series.high_low) {
        if (event.time <= now) {
            continue;
        }
        if (event.type == TideEventType::High && !result.next_high) {
            result.next_high = event;
        } else if (event.type == TideEventType::Low && !result.next_low) {
            result.next_low = event;
        }
        if (result.next_high && result.next_low) {
            break;
        }
    }
    return result;
}

std::optional<TideExtremes> tideExtremes(const TideSeries& series) noexcept {
    if (series.high_low.empty()) {
        return std::nullopt;
    }

    auto [min_it, max_it] = std::minmax_element(series.high_low.begin(), series.high_low.end(),
        [](const TideEvent& a, const TideEvent& b) { return a.height < b.height; });

    return TideExtremes{max_it->height, min_it->height};
}

} // namespace surfcast::core
