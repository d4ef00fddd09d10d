/**
 * @file report_writer.hpp
 * @brief Запись сводного отчёта в Markdown и JSON
 */

#pragma once

#include "core/report.hpp"
#include <filesystem>
#include <string>

namespace surfcast::io {

/// Версия схемы report.json
constexpr const char* REPORT_SCHEMA_VERSION = "1.0.0";

struct ReportWriteResult {
    std::filesystem::path json_path;
    std::filesystem::path markdown_path;
};

/**
 * @brief Отчёт в виде JSON
 */
[[nodiscard]] std::string reportToJson(const surfcast::core::SurfReport& report, int indent = 2);

/**
 * @brief Отчёт в виде Markdown
 */
[[nodiscard]] std::string reportToMarkdown(const surfcast::core::SurfReport& report);

/**
 * @brief Записать report.json и report.md в указанный каталог.
 */
ReportWriteResult writeSurfReport(
    const surfcast::core::SurfReport& report,
    const std::filesystem::path& output_dir
);

} // namespace surfcast::io
