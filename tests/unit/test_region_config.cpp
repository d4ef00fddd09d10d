/**
 * @file test_region_config.cpp
 * @brief Unit-тесты встроенной конфигурации региона
 */

#include <doctest/doctest.h>
#include "model/region_config.hpp"
#include <set>

using namespace surfcast::model;

TEST_CASE("defaultRegionConfig") {
    const auto& config = defaultRegionConfig();

    CHECK(config.name == "NorCal");
    CHECK(config.utc_offset_minutes == -420);
    REQUIRE(config.locations.size() == 10);
    CHECK(config.locations.front().id == "half-moon-bay");
    CHECK(config.locations.back().id == "salmon-creek");

    SUBCASE("Идентификаторы уникальны") {
        std::set<std::string> ids;
        for (const auto& loc : config.locations) {
            ids.insert(loc.id);
        }
        CHECK(ids.size() == config.locations.size());
    }

    SUBCASE("Станции прилива") {
        for (const auto& loc : config.locations) {
            INFO("Спот: " << loc.id);
            CHECK_FALSE(loc.tide_station.empty());
            if (loc.region == "Bay Area") {
                CHECK(loc.tide_station == "9414290");
            }
        }
        CHECK(config.findLocation("bolinas")->tide_station == "9415020");
        CHECK(config.findLocation("salmon-creek")->tide_station == "9415020");
    }

    SUBCASE("Все ячейки таблицы заполнены") {
        for (auto board : {BoardType::Longboard, BoardType::Mediumboard, BoardType::Shortboard}) {
            for (auto skill : {SkillLevel::Beginner, SkillLevel::Advanced, SkillLevel::Expert}) {
                auto range = config.skill_table.find(board, skill);
                REQUIRE(range.has_value());
                CHECK(range->isConsistent());
            }
        }
        auto mid = config.skill_table.find(SurferProfile{BoardType::Mediumboard, SkillLevel::Advanced});
        REQUIRE(mid.has_value());
        CHECK(*mid == WaveRange{3.0, 6.0, 2.0, 8.0});
    }
}

TEST_CASE("findLocation") {
    const auto& config = defaultRegionConfig();

    const auto* ob = config.findLocation("ocean-beach-sf");
    REQUIRE(ob != nullptr);
    CHECK(ob->name == "Ocean Beach SF");
    CHECK(ob->offshore_wind_direction.value == doctest::Approx(90.0));
    CHECK(ob->best_tide == TidePreference::Mid);
    CHECK(ob->optimal_swell_directions.size() == 3);

    CHECK(config.findLocation("bolinas")->best_tide == TidePreference::Any);
    CHECK(config.findLocation("mavericks") == nullptr);
    CHECK(config.findLocation("") == nullptr);
}

TEST_CASE("DiurnalWindCurve") {
    const auto curve = defaultWindCurve();

    SUBCASE("Интервалы полуоткрытые") {
        CHECK(curve.valueAt(5) == doctest::Approx(50.0));
        CHECK(curve.valueAt(8) == doctest::Approx(50.0));
        CHECK(curve.valueAt(9) == doctest::Approx(35.0));
        CHECK(curve.valueAt(11) == doctest::Approx(10.0));
        CHECK(curve.valueAt(14) == doctest::Approx(10.0));
        CHECK(curve.valueAt(15) == doctest::Approx(20.0));
        CHECK(curve.valueAt(17) == doctest::Approx(40.0));
        CHECK(curve.valueAt(18) == doctest::Approx(40.0));
    }

    SUBCASE("Вне интервалов") {
        CHECK(curve.valueAt(4) == doctest::Approx(25.0));
        CHECK(curve.valueAt(19) == doctest::Approx(25.0));
        CHECK(curve.valueAt(23) == doctest::Approx(25.0));
    }

    SUBCASE("Пустая кривая") {
        DiurnalWindCurve empty;
        empty.fallback = 12.0;
        CHECK(empty.valueAt(7) == doctest::Approx(12.0));
    }
}

TEST_CASE("defaultHistoryTable") {
    const auto history = defaultHistoryTable();
    CHECK(history[0].avg_score == doctest::Approx(68.0));
    CHECK(history[5].avg_score == doctest::Approx(45.0));
    CHECK(history[6].avg_score == doctest::Approx(42.0));
    CHECK(history[11].avg_score == doctest::Approx(72.0));
    for (const auto& month : history) {
        CHECK(month.avg_score > 0.0);
        CHECK(month.avg_score < 100.0);
    }
}
