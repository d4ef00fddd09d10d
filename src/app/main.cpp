/**
 * @file main.cpp
 * @brief Точка входа утилиты SurfCast
 */

#include "report_runner.hpp"
#include "io/region_io.hpp"
#include "model/types.hpp"
#include <iostream>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace {

using namespace surfcast::model;

void printUsage() {
    std::cout
        << "Использование:\n"
        << "  surfcast --report <conditions.json> [--region <region.json>] [--board B] [--skill S]\n"
        << "           [--out <каталог>] [--now YYYY-MM-DDTHH:MM] [--utc-offset MIN]\n"
        << "           [--filter-region R] [--min-score N]\n"
        << "  surfcast --print-region [--region <region.json>]\n"
        << "  surfcast --percentile <балл> --month <1..12> [--region <region.json>]\n";
}

int runReport(int argc, char* argv[]) {
    surfcast::app::ReportCommandOptions options;
    options.conditions_path = std::filesystem::path(argv[2]);

    for (int i = 3; i < argc; ++i) {
        std::string_view arg(argv[i]);
        if (arg == "--region" && i + 1 < argc) {
            options.region_path = std::filesystem::path(argv[++i]);
        } else if (arg == "--board" && i + 1 < argc) {
            std::string value = argv[++i];
            auto board = parseBoardType(value);
            if (!board) {
                throw std::invalid_argument("Неизвестный тип доски: " + value);
            }
            options.profile.board = *board;
        } else if (arg == "--skill" && i + 1 < argc) {
            std::string value = argv[++i];
            auto skill = parseSkillLevel(value);
            if (!skill) {
                throw std::invalid_argument("Неизвестный уровень: " + value);
            }
            options.profile.skill = *skill;
        } else if (arg == "--out" && i + 1 < argc) {
            options.output_dir = std::filesystem::path(argv[++i]);
        } else if (arg == "--now" && i + 1 < argc) {
            std::string value = argv[++i];
            auto now = parseLocalTime(value);
            if (!now) {
                throw std::invalid_argument("Некорректное время --now: " + value);
            }
            options.now = *now;
        } else if (arg == "--utc-offset" && i + 1 < argc) {
            options.utc_offset_minutes = std::stoi(argv[++i]);
        } else if (arg == "--filter-region" && i + 1 < argc) {
            options.region_filter = argv[++i];
        } else if (arg == "--min-score" && i + 1 < argc) {
            options.min_score = std::stoi(argv[++i]);
        } else {
            std::cerr << "Неизвестный аргумент: " << arg << std::endl;
            return 1;
        }
    }

    if (options.output_dir.empty()) {
        options.output_dir = std::filesystem::temp_directory_path() / "surfcast_report";
    }

    auto result = surfcast::app::runReportCommand(options);

    if (const auto* top = result.report.top()) {
        const auto& res = top->ranked.result;
        std::cout << "Лучший спот: " << top->ranked.location.name << " - " << res.score
                  << " (" << toString(res.rating) << ")" << std::endl;
        std::cout << res.breakdown << std::endl;
    } else {
        std::cout << "Нет данных ни по одному споту" << std::endl;
    }
    for (const auto& w : result.report.warnings) {
        std::cerr << "Предупреждение: " << w << std::endl;
    }
    std::cout << "Отчёт сохранён в: " << result.output_dir << std::endl;
    return result.exit_code;
}

std::optional<std::filesystem::path> regionArgument(int argc, char* argv[], int first) {
    for (int i = first; i + 1 < argc; ++i) {
        if (std::string_view(argv[i]) == "--region") {
            return std::filesystem::path(argv[i + 1]);
        }
    }
    return std::nullopt;
}

int runPercentile(int argc, char* argv[]) {
    surfcast::app::PercentileCommandOptions options;
    try {
        options = surfcast::app::parsePercentileArguments(std::vector<std::string>(argv + 2, argv + argc));
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    auto result = surfcast::app::runPercentileCommand(options);
    std::cout << "Процентиль: " << result.comparison.percentile << std::endl;
    std::cout << result.comparison.context << std::endl;
    std::cout << result.quality << std::endl;
    return result.exit_code;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        // Отчёт по снимку условий: --report <conditions.json> [опции]
        if (argc >= 3 && std::string_view(argv[1]) == "--report") {
            return runReport(argc, argv);
        }

        // Эффективная конфигурация региона: --print-region [--region <файл>]
        if (argc >= 2 && std::string_view(argv[1]) == "--print-region") {
            auto region = surfcast::app::loadRegionOrDefault(regionArgument(argc, argv, 2));
            std::cout << surfcast::io::regionToJson(region) << std::endl;
            return 0;
        }

        // Процентиль балла: --percentile <балл> --month <1..12>
        if (argc >= 3 && std::string_view(argv[1]) == "--percentile") {
            return runPercentile(argc, argv);
        }

        printUsage();
        return argc >= 2 ? 1 : 0;
    } catch (const std::exception& e) {
        std::cerr << "Критическая ошибка: " << e.what() << std::endl;
        return 1;
    }
}
