/**
 * @file test_tide_analysis.cpp
 * @brief Unit-тесты текущей высоты и фазы прилива
 */

#include <doctest/doctest.h>
#include "core/tide_analysis.hpp"

using namespace surfcast::core;
using namespace surfcast::model;

namespace {

TideSeries juneFirst() {
    const double heights[] = {
        3.0, 2.4, 1.6, 0.9, 0.4, 0.2, 0.4, 1.0, 1.8, 2.7, 3.6, 4.4,
        4.9, 5.1, 4.9, 4.3, 3.5, 2.6, 1.8, 1.2, 0.9, 1.0, 1.4, 2.0
    };
    TideSeries series;
    for (int h = 0; h < 24; ++h) {
        series.hourly.push_back({makeLocalTime(2024, 6, 1, h), Feet{heights[h]}});
    }
    series.high_low = {
        {makeLocalTime(2024, 6, 1, 5, 12), Feet{0.2}, TideEventType::Low},
        {makeLocalTime(2024, 6, 1, 13, 6), Feet{5.1}, TideEventType::High},
        {makeLocalTime(2024, 6, 1, 20, 24), Feet{0.9}, TideEventType::Low},
    };
    return series;
}

} // namespace

TEST_CASE("currentTideHeight") {
    const auto series = juneFirst();

    SUBCASE("Интерполяция между часами") {
        CHECK(currentTideHeight(series, makeLocalTime(2024, 6, 1, 8, 30)).value == doctest::Approx(2.25));
        CHECK(currentTideHeight(series, makeLocalTime(2024, 6, 1, 12, 15)).value == doctest::Approx(4.95));
    }

    SUBCASE("Точно на часе") {
        CHECK(currentTideHeight(series, makeLocalTime(2024, 6, 1, 13)).value == doctest::Approx(5.1));
    }

    SUBCASE("Без экстраполяции за границы ряда") {
        CHECK(currentTideHeight(series, makeLocalTime(2024, 5, 31, 22)).value == doctest::Approx(3.0));
        CHECK(currentTideHeight(series, makeLocalTime(2024, 6, 1, 23)).value == doctest::Approx(2.0));
        CHECK(currentTideHeight(series, makeLocalTime(2024, 6, 2, 6)).value == doctest::Approx(2.0));
    }

    SUBCASE("Пустой ряд") {
        CHECK(currentTideHeight(TideSeries{}, makeLocalTime(2024, 6, 1, 8)).value == doctest::Approx(0.0));
    }
}

TEST_CASE("tidePhase") {
    const auto series = juneFirst();

    SUBCASE("Между экстремумами") {
        CHECK(tidePhase(series, makeLocalTime(2024, 6, 1, 8, 30)) == TidePhase::Rising);
        CHECK(tidePhase(series, makeLocalTime(2024, 6, 1, 16, 0)) == TidePhase::Falling);
    }

    SUBCASE("Около экстремума") {
        // За 20 минут до полной воды
        CHECK(tidePhase(series, makeLocalTime(2024, 6, 1, 12, 46)) == TidePhase::High);
        // Через 20 минут после малой воды
        CHECK(tidePhase(series, makeLocalTime(2024, 6, 1, 5, 32)) == TidePhase::Low);
        // Ровно 30 минут после - уже не около
        CHECK(tidePhase(series, makeLocalTime(2024, 6, 1, 5, 42)) == TidePhase::Rising);
    }

    SUBCASE("Будущий экстремум важнее прошедшего") {
        TideSeries close;
        close.high_low = {
            {makeLocalTime(2024, 6, 1, 10, 0), Feet{4.0}, TideEventType::High},
            {makeLocalTime(2024, 6, 1, 10, 40), Feet{3.8}, TideEventType::Low},
        };
        CHECK(tidePhase(close, makeLocalTime(2024, 6, 1, 10, 20)) == TidePhase::Low);
    }

    SUBCASE("До первого экстремума") {
        CHECK(tidePhase(series, makeLocalTime(2024, 6, 1, 2, 0)) == TidePhase::Rising);
    }

    SUBCASE("Без экстремумов") {
        CHECK(tidePhase(TideSeries{}, makeLocalTime(2024, 6, 1, 2, 0)) == TidePhase::Rising);
    }
}

TEST_CASE("nextTides") {
    const auto series = juneFirst();

    auto next = nextTides(series, makeLocalTime(2024, 6, 1, 8, 30));
    REQUIRE(next.next_high.has_value());
    REQUIRE(next.next_low.has_value());
    CHECK(next.next_high->time == makeLocalTime(2024, 6, 1, 13, 6));
    CHECK(next.next_high->height.value == doctest::Approx(5.1));
    CHECK(next.next_low->time == makeLocalTime(2024, 6, 1, 20, 24));

    auto evening = nextTides(series, makeLocalTime(2024, 6, 1, 21, 0));
    CHECK_FALSE(evening.next_high.has_value());
    CHECK_FALSE(evening.next_low.has_value());
}

TEST_CASE("tideExtremes") {
    auto extremes = tideExtremes(juneFirst());
    REQUIRE(extremes.has_value());
    CHECK(extremes->max_high.value == doctest::Approx(5.1));
    CHECK(extremes->min_low.value == doctest::Approx(0.2));

    CHECK_FALSE(tideExtremes(TideSeries{}).has_value());
}

TEST_CASE("TideSeries::forDate") {
    auto series = juneFirst();
    series.hourly.push_back({makeLocalTime(2024, 6, 2, 0), Feet{2.6}});

    auto day = series.forDate(LocalDate{std::chrono::year{2024} / 6 / 2});
    CHECK(day.hourly.size() == 1);
    CHECK(day.high_low.empty());
    CHECK_FALSE(day.empty());

    CHECK(series.forDate(LocalDate{std::chrono::year{2024} / 6 / 5}).empty());
}
