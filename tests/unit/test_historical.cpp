/**
 * @file test_historical.cpp
 * @brief Unit-тесты сравнения с помесячной статистикой
 */

#include <doctest/doctest.h>
#include "core/historical.hpp"
#include <stdexcept>

using namespace surfcast::core;
using namespace surfcast::model;

TEST_CASE("historicalPercentile") {
    const HistoryTable table = defaultHistoryTable();

    SUBCASE("Балл выше среднего месяца") {
        CHECK(historicalPercentile(70, 6, table) == 94);
        CHECK(historicalPercentile(70, 7, table) == 95);
        CHECK(historicalPercentile(60, 6, table) == 83);
    }

    SUBCASE("Балл равен среднему") {
        CHECK(historicalPercentile(45, 6, table) == 50);
        CHECK(historicalPercentile(68, 1, table) == 50);
    }

    SUBCASE("Ограничение [1, 99]") {
        CHECK(historicalPercentile(95, 6, table) == 99);
        CHECK(historicalPercentile(100, 7, table) == 99);
        CHECK(historicalPercentile(0, 12, table) == 1);
    }

    SUBCASE("Монотонность по баллу") {
        int prev = 0;
        for (int score = 0; score <= 100; score += 5) {
            int p = historicalPercentile(score, 3, table);
            CHECK(p >= prev);
            prev = p;
        }
    }

    SUBCASE("Месяц вне диапазона") {
        CHECK_THROWS_AS((void)historicalPercentile(50, 0, table), std::out_of_range);
        CHECK_THROWS_AS((void)historicalPercentile(50, 13, table), std::out_of_range);
    }
}

TEST_CASE("percentileContext") {
    CHECK(percentileContext(94, 6) == "Top 10% day for June!");
    CHECK(percentileContext(83, 6) == "Better than 83% of June days");
    CHECK(percentileContext(50, 6) == "Above average for June");
    CHECK(percentileContext(26, 6) == "Typical June conditions");
    CHECK(percentileContext(5, 1) == "Below average for January");
}

TEST_CASE("compareWithHistory") {
    auto cmp = compareWithHistory(55, 6, defaultHistoryTable());
    CHECK(cmp.percentile == 74);
    CHECK(cmp.context == "Above average for June");
    CHECK(cmp.month_average.avg_score == doctest::Approx(45.0));
    CHECK(cmp.month_average.avg_wave_height == doctest::Approx(2.5));

    SUBCASE("Своя таблица региона") {
        HistoryTable custom = defaultHistoryTable();
        custom[0].avg_score = 60.0;
        CHECK(compareWithHistory(60, 1, custom).percentile == 50);
        CHECK(compareWithHistory(40, 1, defaultHistoryTable()).context == "Below average for January");
    }
}
