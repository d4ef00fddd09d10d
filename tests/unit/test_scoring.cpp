/**
 * @file test_scoring.cpp
 * @brief Unit-тесты частных оценок условий
 */

#include <doctest/doctest.h>
#include "core/scoring.hpp"
#include "core/skill_profile.hpp"
#include "core/angle_utils.hpp"
#include "model/region_config.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

using namespace surfcast::core;
using namespace surfcast::model;

namespace {

// mediumboard / advanced
const WaveRange kMidAdvanced{3.0, 6.0, 2.0, 8.0};

} // namespace

TEST_CASE("roundScore округляет половину вверх") {
    CHECK(roundScore(94.5) == 95);
    CHECK(roundScore(94.49) == 94);
    CHECK(roundScore(0.5) == 1);
    CHECK(roundScore(-0.5) == 0);
}

TEST_CASE("scoreWaveHeight") {
    SUBCASE("Идеальный диапазон включая границы") {
        CHECK(scoreWaveHeight(Feet{3.0}, kMidAdvanced) == 100);
        CHECK(scoreWaveHeight(Feet{4.5}, kMidAdvanced) == 100);
        CHECK(scoreWaveHeight(Feet{6.0}, kMidAdvanced) == 100);
    }

    SUBCASE("Ниже идеала, но катабельно: 60–100") {
        CHECK(scoreWaveHeight(Feet{2.0}, kMidAdvanced) == 60);
        CHECK(scoreWaveHeight(Feet{2.5}, kMidAdvanced) == 80);
    }

    SUBCASE("Выше идеала, но катабельно: 50–100") {
        CHECK(scoreWaveHeight(Feet{7.0}, kMidAdvanced) == 75);
        CHECK(scoreWaveHeight(Feet{8.0}, kMidAdvanced) == 50);
    }

    SUBCASE("Слишком мелко") {
        CHECK(scoreWaveHeight(Feet{1.0}, kMidAdvanced) == 15);
        CHECK(scoreWaveHeight(Feet{0.0}, kMidAdvanced) == 0);
    }

    SUBCASE("Слишком крупно") {
        CHECK(scoreWaveHeight(Feet{9.0}, kMidAdvanced) == 20);
        CHECK(scoreWaveHeight(Feet{11.0}, kMidAdvanced) == 0);
        CHECK(scoreWaveHeight(Feet{25.0}, kMidAdvanced) == 0);
    }

    SUBCASE("Профиля нет в таблице") {
        CHECK(scoreWaveHeight(Feet{4.0}, std::nullopt) == kUnknownProfileScore);
    }

    SUBCASE("Недопустимая высота") {
        CHECK_THROWS_AS((void)scoreWaveHeight(Feet{-1.0}, kMidAdvanced), ScoringError);
        CHECK_THROWS_AS((void)scoreWaveHeight(Feet{std::nan("")}, kMidAdvanced), ScoringError);
    }
}

TEST_CASE("scoreWaveHeight: все ячейки таблицы профилей") {
    const SkillTable table = defaultSkillTable();

    for (auto board : {BoardType::Longboard, BoardType::Mediumboard, BoardType::Shortboard}) {
        for (auto skill : {SkillLevel::Beginner, SkillLevel::Advanced, SkillLevel::Expert}) {
            const auto range = table.find(board, skill);
            REQUIRE(range.has_value());
            INFO(toString(board) << " / " << toString(skill));

            // Шаг 0.1 фт от 0 до 15 фт
            for (int i = 0; i <= 150; ++i) {
                const double h = i / 10.0;
                const int score = scoreWaveHeight(Feet{h}, range);
                CHECK(score >= 0);
                CHECK(score <= 100);

                if (h >= range->ideal_min && h <= range->ideal_max) {
                    CHECK(score == 100);
                } else if (h < range->ideal_min) {
                    // Ниже идеала балл растёт к идеальному диапазону
                    CHECK(score <= scoreWaveHeight(Feet{(i + 1) / 10.0}, range));
                } else {
                    // Выше идеала балл падает от него
                    CHECK(score <= scoreWaveHeight(Feet{(i - 1) / 10.0}, range));
                }
            }
        }
    }
}

TEST_CASE("scoreWavePeriod") {
    CHECK(scoreWavePeriod(16.0) == 100);
    CHECK(scoreWavePeriod(15.0) == 100);
    CHECK(scoreWavePeriod(14.0) == 90);
    CHECK(scoreWavePeriod(12.0) == 75);
    CHECK(scoreWavePeriod(10.0) == 55);
    CHECK(scoreWavePeriod(8.0) == 35);
    CHECK(scoreWavePeriod(6.9) == 20);
    CHECK(scoreWavePeriod(0.0) == 20);
    CHECK_THROWS_AS((void)scoreWavePeriod(-3.0), ScoringError);
}

TEST_CASE("scoreWind") {
    SUBCASE("Оффшор") {
        CHECK(scoreWind(MilesPerHour{4.0}, Degrees{50.0}, Degrees{45.0}) == 100);
        CHECK(scoreWind(MilesPerHour{8.0}, Degrees{90.0}, Degrees{90.0}) == 85);
    }

    SUBCASE("Сторона ветра относительно берега") {
        // 12 миль/ч: 65 баллов скорости
        CHECK(scoreWind(MilesPerHour{12.0}, Degrees{160.0}, Degrees{90.0}) == 55);   // 70°: 0.85
        CHECK(scoreWind(MilesPerHour{12.0}, Degrees{210.0}, Degrees{90.0}) == 39);   // 120°: 0.6
        CHECK(scoreWind(MilesPerHour{12.0}, Degrees{270.0}, Degrees{90.0}) == 26);   // оншор: 0.4
    }

    SUBCASE("Штиль почти не зависит от направления") {
        CHECK(scoreWind(MilesPerHour{3.0}, Degrees{270.0}, Degrees{90.0}) == 90);
    }

    SUBCASE("Переход через 0/360") {
        CHECK(scoreWind(MilesPerHour{8.0}, Degrees{350.0}, Degrees{20.0}) == 85);
    }

    SUBCASE("Сильный ветер") {
        CHECK(windSpeedScore(MilesPerHour{22.0}) == 20);
        CHECK(windSpeedScore(MilesPerHour{30.0}) == 5);
    }

    SUBCASE("Недопустимые значения") {
        CHECK_THROWS_AS((void)scoreWind(MilesPerHour{-1.0}, Degrees{0.0}, Degrees{0.0}), ScoringError);
        CHECK_THROWS_AS((void)scoreWind(MilesPerHour{5.0}, Degrees{400.0}, Degrees{0.0}), ScoringError);
    }
}

TEST_CASE("scoreWind не растёт с усилением ветра") {
    const Degrees offshore{90.0};

    for (double dir : {90.0, 45.0, 150.0, 200.0, 270.0, 0.0}) {
        INFO("direction = " << dir);
        int previous = scoreWind(MilesPerHour{0.0}, Degrees{dir}, offshore);
        for (int i = 1; i <= 80; ++i) {
            const double speed = i * 0.5;
            const int score = scoreWind(MilesPerHour{speed}, Degrees{dir}, offshore);
            CHECK(score <= previous);
            previous = score;
        }
    }
}

TEST_CASE("scoreWind: максимум при ветре с берега") {
    for (double offshore : {0.0, 60.0, 90.0, 180.0, 350.0}) {
        for (double speed : {5.0, 8.0, 12.0, 18.0, 22.0, 30.0}) {
            INFO("offshore = " << offshore << ", speed = " << speed);
            const int at_offshore =
                scoreWind(MilesPerHour{speed}, Degrees{offshore}, Degrees{offshore});

            int best = 0;
            for (int dir = 0; dir < 360; ++dir) {
                const int score =
                    scoreWind(MilesPerHour{speed}, Degrees{static_cast<double>(dir)}, Degrees{offshore});
                CHECK(score <= at_offshore);
                best = std::max(best, score);
            }
            CHECK(best == at_offshore);

            // Прямо с моря хуже, чем с берега
            const Degrees onshore = normalizeAngle(Degrees{offshore + 180.0});
            CHECK(scoreWind(MilesPerHour{speed}, onshore, Degrees{offshore}) < at_offshore);
        }
    }
}

TEST_CASE("windDirectionMultiplier") {
    CHECK(windDirectionMultiplier(Degrees{45.0}, Degrees{0.0}) == doctest::Approx(1.0));
    CHECK(windDirectionMultiplier(Degrees{90.0}, Degrees{0.0}) == doctest::Approx(0.85));
    CHECK(windDirectionMultiplier(Degrees{135.0}, Degrees{0.0}) == doctest::Approx(0.6));
    CHECK(windDirectionMultiplier(Degrees{180.0}, Degrees{0.0}) == doctest::Approx(0.4));
}

TEST_CASE("scoreSwellDirection") {
    const std::vector<Degrees> optimal{Degrees{270.0}, Degrees{290.0}, Degrees{310.0}};

    CHECK(scoreSwellDirection(Degrees{280.0}, optimal) == 100);
    CHECK(scoreSwellDirection(Degrees{245.0}, optimal) == 85);
    CHECK(scoreSwellDirection(Degrees{230.0}, optimal) == 70);
    CHECK(scoreSwellDirection(Degrees{215.0}, optimal) == 50);
    CHECK(scoreSwellDirection(Degrees{190.0}, optimal) == 30);
    CHECK(scoreSwellDirection(Degrees{90.0}, optimal) == 10);

    SUBCASE("Ближайший румб через 0/360") {
        const std::vector<Degrees> north{Degrees{350.0}};
        CHECK(scoreSwellDirection(Degrees{5.0}, north) == 100);
        CHECK(scoreSwellDirection(Degrees{20.0}, north) == 85);
    }

    SUBCASE("Пустой список румбов") {
        CHECK(scoreSwellDirection(Degrees{280.0}, {}) == 10);
    }

    SUBCASE("Румб вне диапазона") {
        CHECK_THROWS_AS((void)scoreSwellDirection(Degrees{-10.0}, optimal), ScoringError);
    }
}

TEST_CASE("scoreTide") {
    SUBCASE("Средний прилив") {
        CHECK(scoreTide(Feet{2.5}, TidePhase::Rising, TidePreference::Mid) == 100);
        CHECK(scoreTide(Feet{1.5}, TidePhase::Rising, TidePreference::Mid) == 75);
        CHECK(scoreTide(Feet{0.5}, TidePhase::Rising, TidePreference::Mid) == 50);
    }

    SUBCASE("Низкий прилив") {
        CHECK(scoreTide(Feet{1.0}, TidePhase::Falling, TidePreference::Low) == 100);
        CHECK(scoreTide(Feet{2.5}, TidePhase::Falling, TidePreference::Low) == 75);
        CHECK(scoreTide(Feet{3.5}, TidePhase::Falling, TidePreference::Low) == 50);
        CHECK(scoreTide(Feet{5.0}, TidePhase::Falling, TidePreference::Low) == 30);
    }

    SUBCASE("Высокий прилив") {
        CHECK(scoreTide(Feet{5.0}, TidePhase::High, TidePreference::High) == 100);
        CHECK(scoreTide(Feet{3.5}, TidePhase::High, TidePreference::High) == 75);
        CHECK(scoreTide(Feet{2.5}, TidePhase::High, TidePreference::High) == 50);
        CHECK(scoreTide(Feet{1.0}, TidePhase::High, TidePreference::High) == 30);
    }

    SUBCASE("Без предпочтений") {
        CHECK(scoreTide(Feet{-1.0}, TidePhase::Low, TidePreference::Any) == kAnyTideScore);
    }

    SUBCASE("Высота вне 0–6 футов ограничивается") {
        CHECK(scoreTide(Feet{-1.5}, TidePhase::Low, TidePreference::Low) == 100);
        CHECK(scoreTide(Feet{8.0}, TidePhase::High, TidePreference::High) == 100);
    }

    SUBCASE("Нечисловая высота") {
        CHECK_THROWS_AS((void)scoreTide(Feet{std::numeric_limits<double>::infinity()},
                                        TidePhase::Rising, TidePreference::Mid), ScoringError);
    }
}

TEST_CASE("Таблица профилей") {
    const SkillTable table = defaultSkillTable();

    SUBCASE("lookupWaveRange") {
        auto range = lookupWaveRange(table, {BoardType::Mediumboard, SkillLevel::Advanced});
        REQUIRE(range.has_value());
        CHECK(*range == kMidAdvanced);
    }

    SUBCASE("Все ячейки по умолчанию согласованы") {
        for (auto board : {BoardType::Longboard, BoardType::Mediumboard, BoardType::Shortboard}) {
            for (auto skill : {SkillLevel::Beginner, SkillLevel::Advanced, SkillLevel::Expert}) {
                auto range = table.find(board, skill);
                REQUIRE(range.has_value());
                CHECK(range->isConsistent());
            }
        }
    }

    SUBCASE("idealWaveRange без ячейки") {
        SkillTable partial = table;
        partial.erase(BoardType::Longboard, SkillLevel::Expert);
        auto ideal = idealWaveRange(partial, {BoardType::Longboard, SkillLevel::Expert});
        CHECK(ideal.min == doctest::Approx(kDefaultIdealRange.min));
        CHECK(ideal.max == doctest::Approx(kDefaultIdealRange.max));

        auto known = idealWaveRange(partial, {BoardType::Shortboard, SkillLevel::Expert});
        CHECK(known.min == doctest::Approx(4.0));
        CHECK(known.max == doctest::Approx(10.0));
    }
}
