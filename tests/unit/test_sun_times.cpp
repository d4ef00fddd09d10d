/**
 * @file test_sun_times.cpp
 * @brief Unit-тесты восхода, заката и сумерек
 */

#include <doctest/doctest.h>
#include "core/sun_times.hpp"

using namespace surfcast::core;
using namespace surfcast::model;

namespace {

constexpr GeoPoint kOceanBeach{37.76, -122.51};

LocalDate date(int y, unsigned m, unsigned d) {
    return LocalDate{std::chrono::year{y} / m / d};
}

} // namespace

TEST_CASE("computeSunTimes: Ocean Beach летом") {
    auto sun = computeSunTimes(kOceanBeach, date(2024, 6, 1), -420);

    CHECK(sun.first_light == makeLocalTime(2024, 6, 1, 5, 19));
    CHECK(sun.sunrise == makeLocalTime(2024, 6, 1, 5, 50));
    CHECK(sun.sunset == makeLocalTime(2024, 6, 1, 20, 26));
    CHECK(sun.last_light == makeLocalTime(2024, 6, 1, 20, 56));
}

TEST_CASE("computeSunTimes: Ocean Beach в день зимнего солнцестояния") {
    auto sun = computeSunTimes(kOceanBeach, date(2024, 12, 21), -480);

    CHECK(sun.first_light == makeLocalTime(2024, 12, 21, 6, 52));
    CHECK(sun.sunrise == makeLocalTime(2024, 12, 21, 7, 22));
    CHECK(sun.sunset == makeLocalTime(2024, 12, 21, 16, 55));
    CHECK(sun.last_light == makeLocalTime(2024, 12, 21, 17, 24));
}

TEST_CASE("computeSunTimes: порядок событий") {
    for (unsigned month = 1; month <= 12; ++month) {
        auto sun = computeSunTimes(kOceanBeach, date(2024, month, 15), -480);
        CHECK(sun.first_light <= sun.sunrise);
        CHECK(sun.sunrise <= sun.sunset);
        CHECK(sun.sunset <= sun.last_light);
    }
}

TEST_CASE("computeSunTimes: полярные условия") {
    constexpr GeoPoint kSvalbard{78.2, 15.6};

    SUBCASE("Полярный день: события разнесены на сутки") {
        auto sun = computeSunTimes(kSvalbard, date(2024, 6, 21), 120);
        CHECK(sun.sunrise == makeLocalTime(2024, 6, 21, 0, 59));
        CHECK(sun.sunset == makeLocalTime(2024, 6, 22, 0, 59));
        CHECK(sun.first_light == sun.sunrise);
        CHECK(sun.last_light == sun.sunset);
    }

    SUBCASE("Полярная ночь: события сходятся к полудню") {
        auto sun = computeSunTimes(kSvalbard, date(2024, 12, 21), 60);
        const auto noon = makeLocalTime(2024, 12, 21, 11, 56);
        CHECK(sun.sunrise == noon);
        CHECK(sun.sunset == noon);
        CHECK(sun.first_light == noon);
        CHECK(sun.last_light == noon);
    }
}

TEST_CASE("hourAngleDeg без NaN") {
    const double lat = Degrees{85.0}.toRadians().value;
    const double summer = Degrees{23.0}.toRadians().value;
    CHECK(hourAngleDeg(lat, summer, kSunriseElevation) == doctest::Approx(180.0));
    CHECK(hourAngleDeg(lat, -summer, kSunriseElevation) == doctest::Approx(0.0));
    // Экватор в равноденствие: около 90°
    CHECK(hourAngleDeg(0.0, 0.0, 0.0) == doctest::Approx(90.0));
}

TEST_CASE("isDaylight") {
    auto sun = computeSunTimes(kOceanBeach, date(2024, 6, 1), -420);
    CHECK_FALSE(isDaylight(sun, makeLocalTime(2024, 6, 1, 5, 0)));
    CHECK(isDaylight(sun, makeLocalTime(2024, 6, 1, 5, 19)));
    CHECK(isDaylight(sun, makeLocalTime(2024, 6, 1, 12, 0)));
    CHECK(isDaylight(sun, makeLocalTime(2024, 6, 1, 20, 56)));
    CHECK_FALSE(isDaylight(sun, makeLocalTime(2024, 6, 1, 21, 0)));
}

TEST_CASE("leaveBy") {
    using std::chrono::minutes;
    const auto first_light = makeLocalTime(2024, 6, 1, 5, 19);
    CHECK(leaveBy(first_light, minutes{25}) == makeLocalTime(2024, 6, 1, 4, 44));
    CHECK(leaveBy(first_light, minutes{25}, minutes{0}) == makeLocalTime(2024, 6, 1, 4, 54));
    CHECK(leaveBy(makeLocalTime(2024, 6, 1, 0, 30), minutes{50}) == makeLocalTime(2024, 5, 31, 23, 30));
}
