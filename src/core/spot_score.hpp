/**
 * @file spot_score.hpp
 * @brief Итоговая оценка спота и рейтинг спотов
 */

#pragma once

#include "model/measurement.hpp"
#include "model/region_config.hpp"
#include "model/score_result.hpp"
#include <string>

namespace surfcast::core {

using namespace surfcast::model;

/**
 * @brief Веса частных оценок
 *
 * Ветер входит дважды: 0.20 и ещё 0.10 как "направление ветра",
 * хотя направление уже учтено внутри scoreWind. Поведение сохранено
 * как есть; является ли это намеренным акцентом или ошибкой - открытый вопрос.
 */
struct ScoreWeights {
    static constexpr double kWaveHeight = 0.30;
    static constexpr double kWavePeriod = 0.20;
    static constexpr double kWind = 0.20;
    static constexpr double kSwellDirection = 0.15;
    static constexpr double kWindDirection = 0.10;
    static constexpr double kTide = 0.05;
};

/// Пояснение для спота без замера
constexpr const char* kNoDataBreakdown = "No conditions data available.";

/**
 * @brief Итоговая оценка спота
 *
 * Взвешенная сумма частных оценок, округлённая и ограниченная [0, 100],
 * плюс оценка (Poor/Fair/Good/Excellent) и текстовое пояснение.
 * Чистая функция входных данных.
 *
 * Если профиля нет в таблице, высота волны получает нейтральные 50 баллов.
 *
 * @throws ScoringError Если замер не проходит validateMeasurement
 */
[[nodiscard]] ScoreResult calculateSpotScore(
    const Measurement& measurement,
    const LocationProfile& location,
    const SurferProfile& profile,
    const SkillTable& skill_table
);

/**
 * @brief То же с таблицей профилей региона по умолчанию
 */
[[nodiscard]] ScoreResult calculateSpotScore(
    const Measurement& measurement,
    const LocationProfile& location,
    const SurferProfile& profile
);

/**
 * @brief Текстовое пояснение оценки
 *
 * Фразы по порогам частных оценок с фактическими значениями.
 */
[[nodiscard]] std::string buildBreakdown(
    const Measurement& measurement,
    const SurferProfile& profile,
    const SubScores& scores
);

/**
 * @brief Оценка и сортировка спотов по убыванию балла
 *
 * Споты без замера получают 0 / Poor / kNoDataBreakdown.
 * Сортировка устойчивая: при равных баллах сохраняется порядок конфигурации.
 *
 * @throws ScoringError Если какой-либо замер недопустим
 */
[[nodiscard]] RankedLocationList rankLocations(
    const LocationList& locations,
    const MeasurementMap& measurements,
    const SurferProfile& profile,
    const SkillTable& skill_table
);

/**
 * @brief Фильтр по региону ("all" - без фильтра)
 */
[[nodiscard]] RankedLocationList filterByRegion(const RankedLocationList& ranked, const std::string& region);

/**
 * @brief Фильтр по минимальному баллу
 */
[[nodiscard]] RankedLocationList filterByMinScore(const RankedLocationList& ranked, int min_score);

/**
 * @brief Уникальные регионы в порядке конфигурации
 */
[[nodiscard]] std::vector<std::string> uniqueRegions(const LocationList& locations);

/**
 * @brief Словесное описание качества условий по баллу
 */
[[nodiscard]] std::string conditionsQuality(int score);

} // namespace surfcast::core
