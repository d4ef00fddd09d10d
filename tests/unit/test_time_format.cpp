/**
 * @file test_time_format.cpp
 * @brief Unit-тесты текстового представления времени
 */

#include <doctest/doctest.h>
#include "core/time_format.hpp"

using namespace surfcast::core;
using namespace surfcast::model;

TEST_CASE("formatClock") {
    CHECK(formatClock(makeLocalTime(2024, 6, 1, 6, 45)) == "6:45 AM");
    CHECK(formatClock(makeLocalTime(2024, 6, 1, 0, 5)) == "12:05 AM");
    CHECK(formatClock(makeLocalTime(2024, 6, 1, 12, 0)) == "12:00 PM");
    CHECK(formatClock(makeLocalTime(2024, 6, 1, 20, 26)) == "8:26 PM");
    // Секунды отбрасываются
    CHECK(formatClock(makeLocalTime(2024, 6, 1, 9, 7, 59)) == "9:07 AM");
}

TEST_CASE("timeUntil") {
    const auto now = makeLocalTime(2024, 6, 1, 4, 20);

    CHECK(timeUntil(makeLocalTime(2024, 6, 1, 4, 45), now) == "in 25 min");
    CHECK(timeUntil(makeLocalTime(2024, 6, 1, 6, 20), now) == "in 2h");
    CHECK(timeUntil(makeLocalTime(2024, 6, 1, 5, 25), now) == "in 1h 5m");
    CHECK(timeUntil(now, now) == "in 0 min");
    CHECK(timeUntil(makeLocalTime(2024, 6, 1, 4, 0), now) == "passed");

    SUBCASE("Округление до минут") {
        CHECK(timeUntil(makeLocalTime(2024, 6, 1, 4, 20, 40), now) == "in 1 min");
        CHECK(timeUntil(makeLocalTime(2024, 6, 1, 4, 20, 20), now) == "in 0 min");
    }
}

TEST_CASE("Названия дней и месяцев") {
    const LocalDate saturday{std::chrono::year{2024} / 6 / 1};

    CHECK(weekdayName(saturday) == "Sat");
    CHECK(weekdayName(saturday + std::chrono::days{1}) == "Sun");
    CHECK(monthShortName(6) == "Jun");
    CHECK(monthFullName(12) == "December");
    CHECK(monthShortName(0) == "?");
    CHECK(monthFullName(13) == "?");
    CHECK(dateLabel(saturday) == "Sat Jun 1");
    CHECK(dateLabel(LocalDate{std::chrono::year{2024} / 12 / 25}) == "Wed Dec 25");
}
