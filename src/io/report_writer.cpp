/**
 * @file report_writer.cpp
 * @brief Запись сводного отчёта
 */

#include "report_writer.hpp"
#include "file_utils.hpp"
#include "core/time_format.hpp"
#include <nlohmann/json.hpp>
#include <iomanip>
#include <sstream>

namespace surfcast::io {
namespace {

using namespace surfcast::core;
using json = nlohmann::json;

std::string fixed1(double v) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << v;
    return ss.str();
}

json optionalTimeWindowToJson(const std::optional<TimeWindow>& w) {
    if (!w) {
        return nullptr;
    }
    return {
        {"start_hour", w->start_hour},
        {"end_hour", w->end_hour},
        {"start", w->startLabel()},
        {"end", w->endLabel()},
        {"avg_tide", w->avg_tide},
        {"avg_score", w->avg_score},
        {"reason", w->reason}
    };
}

json optionalTideEventToJson(const std::optional<TideEvent>& e) {
    if (!e) {
        return nullptr;
    }
    return {
        {"time", formatIsoLocal(e->time)},
        {"height", e->height.value},
        {"type", toString(e->type)}
    };
}

json sunToJson(const SunTimes& sun) {
    return {
        {"first_light", formatIsoLocal(sun.first_light)},
        {"sunrise", formatIsoLocal(sun.sunrise)},
        {"sunset", formatIsoLocal(sun.sunset)},
        {"last_light", formatIsoLocal(sun.last_light)}
    };
}

json moonToJson(const MoonInfo& moon) {
    return {
        {"phase", toString(moon.phase)},
        {"name", displayName(moon.phase)},
        {"illumination", moon.illumination}
    };
}

json weekToJson(const WeekForecast& week) {
    json j;
    j["days"] = json::array();
    for (const auto& day : week.days) {
        j["days"].push_back({
            {"date", formatIsoLocal(LocalTime{day.date}).substr(0, 10)},
            {"day_name", day.day_name},
            {"date_label", day.date_label},
            {"score", day.score},
            {"analysis", day.analysis},
            {"has_tide_data", day.has_tide_data},
            {"best_window", optionalTimeWindowToJson(day.best_window)},
            {"sun", sunToJson(day.sun)},
            {"moon", moonToJson(day.moon)}
        });
    }
    j["best_day"] = week.best_day.has_value() ? json(*week.best_day) : json(nullptr);
    j["best_day_reason"] = week.best_day_reason;
    return j;
}

json locationToJson(const LocationReport& lr) {
    const auto& loc = lr.ranked.location;
    const auto& res = lr.ranked.result;

    json j;
    j["id"] = loc.id;
    j["name"] = loc.name;
    j["region"] = loc.region;
    j["has_data"] = lr.ranked.has_data;
    j["score"] = res.score;
    j["rating"] = toString(res.rating);
    j["quality"] = lr.quality;
    j["breakdown"] = res.breakdown;
    j["components"] = {
        {"wave_height", res.components.wave_height},
        {"wave_period", res.components.wave_period},
        {"wind", res.components.wind},
        {"swell_direction", res.components.swell_direction},
        {"tide", res.components.tide}
    };

    if (lr.measurement) {
        const auto& m = *lr.measurement;
        j["conditions"] = {
            {"wave_height", m.wave_height.value},
            {"wave_period", m.wave_period},
            {"swell_direction", m.swell_direction.value},
            {"swell_cardinal", lr.swell_cardinal},
            {"swell_source", lr.swell_source},
            {"wind_speed", m.wind_speed.value},
            {"wind_direction", m.wind_direction.value},
            {"wind_cardinal", lr.wind_cardinal},
            {"tide_height", m.tide_height.value},
            {"tide_phase", toString(m.tide_phase)}
        };
    } else {
        j["conditions"] = nullptr;
    }

    if (lr.has_tides) {
        j["tide"] = {
            {"height", lr.tide_height.value},
            {"phase", toString(lr.tide_phase)},
            {"next_high", optionalTideEventToJson(lr.next_tides.next_high)},
            {"next_low", optionalTideEventToJson(lr.next_tides.next_low)}
        };
    } else {
        j["tide"] = nullptr;
    }

    j["best_window"] = optionalTimeWindowToJson(lr.best_window);
    j["sun"] = sunToJson(lr.sun);
    j["daylight"] = lr.daylight;

    j["dawn_patrol"] = {
        {"state", toString(lr.dawn_patrol.state)},
        {"message", lr.dawn_patrol.message},
        {"leave_by", lr.dawn_patrol.leave_by.has_value()
            ? json(formatIsoLocal(*lr.dawn_patrol.leave_by)) : json(nullptr)}
    };

    if (lr.history) {
        j["history"] = {
            {"percentile", lr.history->percentile},
            {"context", lr.history->context},
            {"month_avg_score", lr.history->month_average.avg_score}
        };
    } else {
        j["history"] = nullptr;
    }

    j["week"] = weekToJson(lr.week);
    return j;
}

json buildJson(const SurfReport& report) {
    json j;
    j["schema_version"] = REPORT_SCHEMA_VERSION;
    j["meta"] = {
        {"region", report.region},
        {"now", formatIsoLocal(report.generated_for)},
        {"utc_offset_minutes", report.utc_offset_minutes},
        {"board", toString(report.profile.board)},
        {"skill", toString(report.profile.skill)}
    };
    j["moon"] = moonToJson(report.moon);

    j["locations"] = json::array();
    for (const auto& lr : report.locations) {
        j["locations"].push_back(locationToJson(lr));
    }

    j["warnings"] = report.warnings;
    return j;
}

std::string buildMarkdown(const SurfReport& report) {
    std::ostringstream out;

    out << "# Отчёт SurfCast: " << report.region << "\n\n";
    out << "- Время: " << formatIsoLocal(report.generated_for) << "\n";
    out << "- Профиль: " << toString(report.profile.board) << " / "
        << toString(report.profile.skill) << "\n";
    out << "- Луна: " << displayName(report.moon.phase) << " ("
        << report.moon.illumination << "%)\n\n";

    out << "## Рейтинг\n";
    out << "| # | Спот | Балл | Оценка | Лучшее окно | Утренний патруль |\n";
    out << "|---|------|------|--------|-------------|------------------|\n";
    int place = 1;
    for (const auto& lr : report.locations) {
        const auto& res = lr.ranked.result;
        out << "| " << place++ << " | " << lr.ranked.location.name
            << " | " << res.score << " | " << toString(res.rating) << " | ";
        if (lr.best_window) {
            out << lr.best_window->startLabel() << " – " << lr.best_window->endLabel();
        } else {
            out << "—";
        }
        out << " | " << lr.dawn_patrol.message << " |\n";
    }
    out << "\n";

    for (const auto& lr : report.locations) {
        const auto& loc = lr.ranked.location;
        out << "## " << loc.name << "\n";
        out << "- " << lr.quality << ": " << lr.ranked.result.breakdown << "\n";

        if (lr.measurement) {
            out << "- Свелл: " << fixed1(lr.measurement->wave_height.value) << " ft @ "
                << fixed1(lr.measurement->wave_period) << " s, " << lr.swell_cardinal
                << " (" << lr.swell_source << ")\n";
            out << "- Ветер: " << fixed1(lr.measurement->wind_speed.value) << " mph "
                << lr.wind_cardinal << "\n";
        }
        if (lr.has_tides) {
            out << "- Прилив: " << fixed1(lr.tide_height.value) << " ft, "
                << toString(lr.tide_phase) << "\n";
        }
        if (lr.best_window) {
            out << "- Лучшее окно: " << lr.best_window->startLabel() << " – "
                << lr.best_window->endLabel() << " (" << lr.best_window->reason << ")\n";
        }
        out << "- Солнце: первый свет " << formatClock(lr.sun.first_light)
            << ", восход " << formatClock(lr.sun.sunrise)
            << ", закат " << formatClock(lr.sun.sunset) << "\n";
        if (lr.history) {
            out << "- История: " << lr.history->context << " (процентиль "
                << lr.history->percentile << ")\n";
        }
        out << "- Неделя: " << lr.week.best_day_reason << "\n\n";
    }

    if (!report.warnings.empty()) {
        out << "## Замечания\n";
        for (const auto& w : report.warnings) {
            out << "- " << w << "\n";
        }
    }

    return out.str();
}

} // namespace

std::string reportToJson(const SurfReport& report, int indent) {
    return buildJson(report).dump(indent);
}

std::string reportToMarkdown(const SurfReport& report) {
    return buildMarkdown(report);
}

ReportWriteResult writeSurfReport(
    const SurfReport& report,
    const std::filesystem::path& output_dir
) {
    std::filesystem::create_directories(output_dir);
    ReportWriteResult result;

    auto json_path = output_dir / "report.json";
    auto md_path = output_dir / "report.md";

    atomicWrite(json_path, reportToJson(report));
    atomicWrite(md_path, reportToMarkdown(report));

    result.json_path = json_path;
    result.markdown_path = md_path;
    return result;
}

} // namespace surfcast::io
