/**
 * @file test_dawn_patrol.cpp
 * @brief Unit-тесты статуса утреннего патруля
 */

#include <doctest/doctest.h>
#include "core/dawn_patrol.hpp"

using namespace surfcast::core;
using namespace surfcast::model;
using std::chrono::minutes;

namespace {

// Ocean Beach, 1 июня 2024, PDT
SunTimes oceanBeachJune1() {
    SunTimes sun;
    sun.first_light = makeLocalTime(2024, 6, 1, 5, 19);
    sun.sunrise = makeLocalTime(2024, 6, 1, 5, 50);
    sun.sunset = makeLocalTime(2024, 6, 1, 20, 26);
    sun.last_light = makeLocalTime(2024, 6, 1, 20, 56);
    return sun;
}

LocalTime at(int hour, int minute) {
    return makeLocalTime(2024, 6, 1, hour, minute);
}

} // namespace

TEST_CASE("dawnPatrolStatus с временем в пути") {
    const auto sun = oceanBeachJune1();
    const minutes drive{25};
    const auto leave = at(4, 44);

    SUBCASE("Рано") {
        auto s = dawnPatrolStatus(at(4, 0), sun, drive);
        CHECK(s.state == DawnPatrolState::TooEarly);
        CHECK(s.message == "Leave by 4:44 AM for first light");
        REQUIRE(s.leave_by.has_value());
        CHECK(*s.leave_by == leave);
    }

    SUBCASE("Пора собираться") {
        auto s = dawnPatrolStatus(at(4, 20), sun, drive);
        CHECK(s.state == DawnPatrolState::LeaveNow);
        CHECK(s.message == "Leave in 24 min for dawn patrol!");
        CHECK(s.leave_by == leave);
    }

    SUBCASE("Граница LeaveNow включительно") {
        CHECK(dawnPatrolStatus(at(4, 14), sun, drive).state == DawnPatrolState::LeaveNow);
        CHECK(dawnPatrolStatus(at(4, 13), sun, drive).state == DawnPatrolState::TooEarly);
    }

    SUBCASE("В пути") {
        auto s = dawnPatrolStatus(at(4, 50), sun, drive);
        CHECK(s.state == DawnPatrolState::OnTheWay);
        CHECK(s.message == "Go now to catch first light!");
        CHECK(s.leave_by == leave);
    }

    SUBCASE("Катаемся") {
        auto s = dawnPatrolStatus(at(8, 30), sun, drive);
        CHECK(s.state == DawnPatrolState::Surfing);
        CHECK(s.message == "Sun up until 8:26 PM");
        CHECK_FALSE(s.leave_by.has_value());
    }

    SUBCASE("Солнце село") {
        auto s = dawnPatrolStatus(at(21, 0), sun, drive);
        CHECK(s.state == DawnPatrolState::Missed);
        CHECK(s.message == "Sun has set");
    }
}

TEST_CASE("dawnPatrolStatus без времени в пути") {
    const auto sun = oceanBeachJune1();

    SUBCASE("До первого света") {
        auto s = dawnPatrolStatus(at(5, 0), sun);
        CHECK(s.state == DawnPatrolState::TooEarly);
        CHECK(s.message == "First light at 5:19 AM");
        CHECK_FALSE(s.leave_by.has_value());
    }

    SUBCASE("Сумерки до восхода") {
        auto s = dawnPatrolStatus(at(5, 30), sun);
        CHECK(s.state == DawnPatrolState::Surfing);
        CHECK(s.message == "Sunrise at 5:50 AM");
    }

    SUBCASE("День") {
        auto s = dawnPatrolStatus(at(12, 0), sun);
        CHECK(s.state == DawnPatrolState::Surfing);
        CHECK(s.message == "Sun is up until 8:26 PM");
    }

    SUBCASE("После заката") {
        CHECK(dawnPatrolStatus(at(20, 30), sun).state == DawnPatrolState::Missed);
    }

    SUBCASE("Нулевое время в пути равно неизвестному") {
        auto s = dawnPatrolStatus(at(5, 0), sun, minutes{0});
        CHECK(s.state == DawnPatrolState::TooEarly);
        CHECK(s.message == "First light at 5:19 AM");
    }
}

TEST_CASE("Состояние пересчитывается по каждому now") {
    const auto sun = oceanBeachJune1();
    const minutes drive{25};

    std::vector<DawnPatrolState> states;
    for (int m = 4 * 60; m <= 21 * 60; m += 5) {
        states.push_back(dawnPatrolStatus(at(m / 60, m % 60), sun, drive).state);
    }
    // Состояния идут только вперёд по дню
    for (size_t i = 1; i < states.size(); ++i) {
        CHECK(static_cast<int>(states[i - 1]) <= static_cast<int>(states[i]));
    }
    CHECK(states.front() == DawnPatrolState::TooEarly);
    CHECK(states.back() == DawnPatrolState::Missed);
}

TEST_CASE("toString(DawnPatrolState)") {
    CHECK(toString(DawnPatrolState::TooEarly) == "too-early");
    CHECK(toString(DawnPatrolState::LeaveNow) == "leave-now");
    CHECK(toString(DawnPatrolState::OnTheWay) == "on-the-way");
    CHECK(toString(DawnPatrolState::Surfing) == "surfing");
    CHECK(toString(DawnPatrolState::Missed) == "missed");
}
