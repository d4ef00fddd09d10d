/**
 * @file report_runner.hpp
 * @brief Построение и запись отчёта из CLI
 */

#pragma once

#include "core/historical.hpp"
#include "core/report.hpp"
#include "io/report_writer.hpp"
#include "model/region_config.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace surfcast::app {

struct ReportCommandOptions {
    std::filesystem::path conditions_path;
    std::optional<std::filesystem::path> region_path;   ///< Без файла - встроенный NorCal
    std::filesystem::path output_dir;
    surfcast::model::SurferProfile profile;
    std::optional<surfcast::model::LocalTime> now;      ///< Заменяет now из снимка
    std::optional<int> utc_offset_minutes;
    std::string region_filter = "all";
    int min_score = 0;
};

struct ReportCommandResult {
    int exit_code = 1;
    std::filesystem::path output_dir;
    surfcast::core::SurfReport report;
    surfcast::io::ReportWriteResult files;
};

struct PercentileCommandOptions {
    int score = 0;
    unsigned month = 0;                                 ///< 1–12
    std::optional<std::filesystem::path> region_path;   ///< Без файла - встроенный NorCal
};

struct PercentileCommandResult {
    int exit_code = 1;
    surfcast::core::HistoricalComparison comparison;
    std::string quality;                                ///< "Excellent conditions"
};

/**
 * @brief Конфигурация региона из файла или встроенная
 * @throws surfcast::io::RegionConfigError
 */
[[nodiscard]] surfcast::model::RegionConfig loadRegionOrDefault(
    const std::optional<std::filesystem::path>& path
);

/**
 * @brief Загрузить снимок, построить отчёт и сохранить report.json/report.md.
 *
 * @throws surfcast::io::RegionConfigError, surfcast::io::ConditionsError,
 *         surfcast::core::ScoringError
 */
ReportCommandResult runReportCommand(const ReportCommandOptions& options);

/**
 * @brief Разбор аргументов команды --percentile
 *
 * @param args Аргументы после "--percentile": балл, затем --month и --region
 * @throws std::invalid_argument Нет балла или месяца, неизвестный аргумент
 */
[[nodiscard]] PercentileCommandOptions parsePercentileArguments(const std::vector<std::string>& args);

/**
 * @brief Процентиль балла относительно средних за месяц
 * @throws surfcast::io::RegionConfigError, std::out_of_range
 */
PercentileCommandResult runPercentileCommand(const PercentileCommandOptions& options);

} // namespace surfcast::app
