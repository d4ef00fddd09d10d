/**
 * @file region_io.cpp
 * @brief Реализация чтения и записи конфигурации региона
 */

#include "region_io.hpp"
#include "file_utils.hpp"
#include "model/validation.hpp"
#include <nlohmann/json.hpp>
#include <fstream>

namespace surfcast::io {

using json = nlohmann::json;

namespace {

// === Таблица профилей ===

json skillTableToJson(const SkillTable& table) {
    json arr = json::array();
    for (auto board : {BoardType::Longboard, BoardType::Mediumboard, BoardType::Shortboard}) {
        for (auto skill : {SkillLevel::Beginner, SkillLevel::Advanced, SkillLevel::Expert}) {
            auto range = table.find(board, skill);
            if (!range) continue;

            json j;
            j["board"] = toString(board);
            j["skill"] = toString(skill);
            j["ideal_min"] = range->ideal_min;
            j["ideal_max"] = range->ideal_max;
            j["surfable_min"] = range->surfable_min;
            j["surfable_max"] = range->surfable_max;
            arr.push_back(j);
        }
    }
    return arr;
}

SkillTable skillTableFromJson(const json& arr) {
    SkillTable table;
    for (const auto& j : arr) {
        auto board_str = j.value("board", "");
        auto skill_str = j.value("skill", "");
        auto board = parseBoardType(board_str);
        auto skill = parseSkillLevel(skill_str);
        if (!board) {
            throw RegionConfigError("Неизвестный тип доски: " + board_str);
        }
        if (!skill) {
            throw RegionConfigError("Неизвестный уровень: " + skill_str);
        }

        WaveRange range;
        range.ideal_min = j.at("ideal_min").get<double>();
        range.ideal_max = j.at("ideal_max").get<double>();
        range.surfable_min = j.at("surfable_min").get<double>();
        range.surfable_max = j.at("surfable_max").get<double>();
        table.set(*board, *skill, range);
    }
    return table;
}

// === Кривая ветра ===

json windCurveToJson(const DiurnalWindCurve& curve) {
    json bands = json::array();
    for (const auto& b : curve.bands) {
        bands.push_back({{"from_hour", b.from_hour}, {"to_hour", b.to_hour}, {"value", b.value}});
    }
    return {{"bands", bands}, {"fallback", curve.fallback}};
}

DiurnalWindCurve windCurveFromJson(const json& j) {
    DiurnalWindCurve curve;
    curve.fallback = j.value("fallback", 25.0);
    if (j.contains("bands")) {
        for (const auto& bj : j.at("bands")) {
            WindCurveBand band;
            band.from_hour = bj.at("from_hour").get<int>();
            band.to_hour = bj.at("to_hour").get<int>();
            band.value = bj.at("value").get<double>();
            if (band.from_hour < 0 || band.to_hour > 24 || band.from_hour >= band.to_hour) {
                throw RegionConfigError("Некорректный интервал кривой ветра: " +
                    std::to_string(band.from_hour) + "–" + std::to_string(band.to_hour));
            }
            curve.bands.push_back(band);
        }
    }
    return curve;
}

// === Помесячная статистика ===

json historyToJson(const HistoryTable& history) {
    json arr = json::array();
    for (size_t i = 0; i < history.size(); ++i) {
        const auto& m = history[i];
        arr.push_back({
            {"month", i + 1},
            {"avg_score", m.avg_score},
            {"avg_wave_height", m.avg_wave_height},
            {"good_days_pct", m.good_days_pct}
        });
    }
    return arr;
}

HistoryTable historyFromJson(const json& arr) {
    // Неуказанные месяцы остаются из таблицы по умолчанию
    HistoryTable history = defaultHistoryTable();
    for (const auto& j : arr) {
        int month = j.at("month").get<int>();
        if (month < 1 || month > 12) {
            throw RegionConfigError("Номер месяца вне диапазона 1–12: " + std::to_string(month));
        }
        auto& m = history[static_cast<size_t>(month - 1)];
        m.avg_score = j.value("avg_score", m.avg_score);
        m.avg_wave_height = j.value("avg_wave_height", m.avg_wave_height);
        m.good_days_pct = j.value("good_days_pct", m.good_days_pct);
    }
    return history;
}

// === Споты ===

json locationToJson(const LocationProfile& loc) {
    json j;
    j["id"] = loc.id;
    j["name"] = loc.name;
    j["region"] = loc.region;
    j["description"] = loc.description;
    j["coordinates"] = {{"lat", loc.coordinates.lat}, {"lng", loc.coordinates.lng}};

    json swell = json::array();
    for (const auto& d : loc.optimal_swell_directions) {
        swell.push_back(d.value);
    }
    j["optimal_swell_directions"] = swell;
    j["offshore_wind_direction"] = loc.offshore_wind_direction.value;
    j["best_tide"] = toString(loc.best_tide);
    j["tide_station"] = loc.tide_station;
    j["buoy_station"] = loc.buoy_station;
    j["break_type"] = loc.break_type;
    j["recommended_skill"] = loc.recommended_skill;
    return j;
}

LocationProfile locationFromJson(const json& j) {
    LocationProfile loc;
    loc.id = j.at("id").get<std::string>();
    loc.name = j.value("name", loc.id);
    loc.region = j.value("region", "");
    loc.description = j.value("description", "");

    if (j.contains("coordinates")) {
        const auto& c = j.at("coordinates");
        loc.coordinates.lat = c.at("lat").get<double>();
        loc.coordinates.lng = c.at("lng").get<double>();
    }

    if (j.contains("optimal_swell_directions")) {
        for (const auto& d : j.at("optimal_swell_directions")) {
            loc.optimal_swell_directions.push_back(Degrees{d.get<double>()});
        }
    }
    loc.offshore_wind_direction = Degrees{j.value("offshore_wind_direction", 0.0)};

    auto tide_str = j.value("best_tide", "any");
    auto tide = parseTidePreference(tide_str);
    if (!tide) {
        throw RegionConfigError("Неизвестное предпочтение прилива у " + loc.id + ": " + tide_str);
    }
    loc.best_tide = *tide;

    loc.tide_station = j.value("tide_station", "");
    loc.buoy_station = j.value("buoy_station", "");
    loc.break_type = j.value("break_type", "");
    loc.recommended_skill = j.value("recommended_skill", "");
    return loc;
}

// === Конфигурация целиком ===

json regionToJsonInternal(const RegionConfig& config) {
    json j;
    j["format"] = REGION_FORMAT_ID;
    j["version"] = REGION_FORMAT_VERSION;
    j["name"] = config.name;
    j["utc_offset_minutes"] = config.utc_offset_minutes;
    j["skill_table"] = skillTableToJson(config.skill_table);
    j["wind_curve"] = windCurveToJson(config.wind_curve);
    j["monthly_history"] = historyToJson(config.history);

    json locations = json::array();
    for (const auto& loc : config.locations) {
        locations.push_back(locationToJson(loc));
    }
    j["locations"] = locations;
    return j;
}

void throwIfInvalid(const ValidationResult& check, const std::string& what) {
    if (!check.is_valid) {
        throw RegionConfigError(what + ": " + check.summary());
    }
}

RegionConfig regionFromJsonInternal(const json& j) {
    std::string format = j.value("format", "");
    if (format != REGION_FORMAT_ID) {
        throw RegionConfigError("Неверный формат файла конфигурации региона");
    }

    const RegionConfig& defaults = defaultRegionConfig();
    RegionConfig config;
    config.name = j.value("name", defaults.name);
    config.utc_offset_minutes = j.value("utc_offset_minutes", defaults.utc_offset_minutes);

    config.skill_table = j.contains("skill_table")
        ? skillTableFromJson(j.at("skill_table"))
        : defaults.skill_table;
    config.wind_curve = j.contains("wind_curve")
        ? windCurveFromJson(j.at("wind_curve"))
        : defaults.wind_curve;
    config.history = j.contains("monthly_history")
        ? historyFromJson(j.at("monthly_history"))
        : defaults.history;

    if (j.contains("locations")) {
        for (const auto& lj : j.at("locations")) {
            config.locations.push_back(locationFromJson(lj));
        }
    } else {
        config.locations = defaults.locations;
    }

    throwIfInvalid(validateSkillTable(config.skill_table), "Таблица профилей");
    for (const auto& loc : config.locations) {
        throwIfInvalid(validateLocation(loc), "Спот " + loc.id);
    }
    return config;
}

RegionConfig parseChecked(const json& j) {
    try {
        return regionFromJsonInternal(j);
    } catch (const json::exception& e) {
        throw RegionConfigError("Ошибка структуры конфигурации региона: " + std::string(e.what()));
    }
}

} // anonymous namespace

bool isRegionFile(const std::filesystem::path& path) noexcept {
    try {
        if (!std::filesystem::exists(path)) {
            return false;
        }
        std::ifstream file(path);
        if (!file) return false;

        json j = json::parse(file, nullptr, false);
        if (j.is_discarded() || !j.is_object()) {
            return false;
        }
        return j.value("format", "") == REGION_FORMAT_ID;
    } catch (const std::exception&) {
        return false;
    }
}

RegionConfig loadRegionConfig(const std::filesystem::path& path) {
    std::string text;
    try {
        text = readTextFile(path);
    } catch (const std::runtime_error& e) {
        throw RegionConfigError(e.what());
    }
    return regionFromJson(text);
}

void saveRegionConfig(const RegionConfig& config, const std::filesystem::path& path) {
    try {
        atomicWrite(path, regionToJson(config, 2));
    } catch (const std::runtime_error& e) {
        throw RegionConfigError(e.what());
    }
}

std::string regionToJson(const RegionConfig& config, int indent) {
    return regionToJsonInternal(config).dump(indent);
}

RegionConfig regionFromJson(const std::string& json_str) {
    json j;
    try {
        j = json::parse(json_str);
    } catch (const json::parse_error& e) {
        throw RegionConfigError("Ошибка парсинга JSON: " + std::string(e.what()));
    }

    return parseChecked(j);
}

} // namespace surfcast::io
