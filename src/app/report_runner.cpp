/**
 * @file report_runner.cpp
 * @brief Построение и запись отчёта из CLI
 */

#include "report_runner.hpp"
#include "io/conditions_io.hpp"
#include "io/region_io.hpp"
#include "core/spot_score.hpp"
#include <stdexcept>

namespace surfcast::app {

using namespace surfcast::model;

RegionConfig loadRegionOrDefault(const std::optional<std::filesystem::path>& path) {
    if (path) {
        return surfcast::io::loadRegionConfig(*path);
    }
    return defaultRegionConfig();
}

ReportCommandResult runReportCommand(const ReportCommandOptions& options) {
    ReportCommandResult result;
    result.output_dir = options.output_dir;

    const RegionConfig region = loadRegionOrDefault(options.region_path);
    const ConditionsSnapshot snapshot =
        surfcast::io::loadConditions(options.conditions_path, region, options.now);

    surfcast::core::ReportOptions report_opts;
    report_opts.utc_offset_minutes = options.utc_offset_minutes;
    report_opts.region_filter = options.region_filter;
    report_opts.min_score = options.min_score;

    result.report = surfcast::core::buildSurfReport(region, snapshot, options.profile, report_opts);
    result.files = surfcast::io::writeSurfReport(result.report, options.output_dir);
    result.exit_code = 0;
    return result;
}

PercentileCommandOptions parsePercentileArguments(const std::vector<std::string>& args) {
    if (args.empty()) {
        throw std::invalid_argument("Не указан балл");
    }

    PercentileCommandOptions options;
    options.score = std::stoi(args[0]);
    bool has_month = false;

    for (size_t i = 1; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--month" && i + 1 < args.size()) {
            options.month = static_cast<unsigned>(std::stoul(args[++i]));
            has_month = true;
        } else if (arg == "--region" && i + 1 < args.size()) {
            options.region_path = std::filesystem::path(args[++i]);
        } else {
            throw std::invalid_argument("Неизвестный аргумент: " + arg);
        }
    }

    if (!has_month) {
        throw std::invalid_argument("Не указан месяц (--month 1..12)");
    }
    return options;
}

PercentileCommandResult runPercentileCommand(const PercentileCommandOptions& options) {
    PercentileCommandResult result;
    const RegionConfig region = loadRegionOrDefault(options.region_path);

    result.comparison = surfcast::core::compareWithHistory(options.score, options.month, region.history);
    result.quality = surfcast::core::conditionsQuality(options.score);
    result.exit_code = 0;
    return result;
}

} // namespace surfcast::app
