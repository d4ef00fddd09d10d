/**
 * @file conditions_io.cpp
 * @brief Реализация чтения снимка условий
 */

#include "conditions_io.hpp"
#include "file_utils.hpp"
#include "core/tide_analysis.hpp"
#include "model/validation.hpp"
#include <nlohmann/json.hpp>

namespace surfcast::io {

using json = nlohmann::json;

namespace {

LocalTime timeFromJson(const json& j, const std::string& field) {
    auto str = j.get<std::string>();
    auto t = parseLocalTime(str);
    if (!t) {
        throw ConditionsError("Некорректное время в поле " + field + ": " + str);
    }
    return *t;
}

// === Прилив ===

TideSeries tideSeriesFromJson(const json& j, const std::string& station) {
    TideSeries series;

    if (j.contains("hourly")) {
        for (const auto& sj : j.at("hourly")) {
            TideSample s;
            s.time = timeFromJson(sj.at("time"), "tides." + station + ".hourly");
            s.height = Feet{sj.at("height").get<double>()};
            series.hourly.push_back(s);
        }
    }

    if (j.contains("high_low")) {
        for (const auto& ej : j.at("high_low")) {
            TideEvent e;
            e.time = timeFromJson(ej.at("time"), "tides." + station + ".high_low");
            e.height = Feet{ej.at("height").get<double>()};
            auto type_str = ej.value("type", "");
            auto type = parseTideEventType(type_str);
            if (!type) {
                throw ConditionsError("Неизвестный тип экстремума прилива на станции " +
                                      station + ": " + type_str);
            }
            e.type = *type;
            series.high_low.push_back(e);
        }
    }

    auto check = validateTideSeries(series);
    if (!check.is_valid) {
        throw ConditionsError("Ряд прилива станции " + station + ": " + check.summary());
    }
    return series;
}

json tideSeriesToJson(const TideSeries& series) {
    json hourly = json::array();
    for (const auto& s : series.hourly) {
        hourly.push_back({{"time", formatIsoLocal(s.time)}, {"height", s.height.value}});
    }
    json high_low = json::array();
    for (const auto& e : series.high_low) {
        high_low.push_back({
            {"time", formatIsoLocal(e.time)},
            {"height", e.height.value},
            {"type", toString(e.type)}
        });
    }
    return {{"hourly", hourly}, {"high_low", high_low}};
}

// === Замеры ===

/// Прилив в замере: указан явно или вычисляется позже по ряду станции
struct TideFields {
    bool has_height = false;
    bool has_phase = false;
};

Measurement measurementFromJson(const json& j, const std::string& id, TideFields& tide) {
    Measurement m;
    m.wave_height = Feet{j.at("wave_height").get<double>()};
    m.wave_period = j.at("wave_period").get<double>();
    m.swell_direction = Degrees{j.at("swell_direction").get<double>()};
    m.wind_speed = MilesPerHour{j.at("wind_speed").get<double>()};
    m.wind_direction = Degrees{j.at("wind_direction").get<double>()};

    if (j.contains("tide_height") && !j.at("tide_height").is_null()) {
        m.tide_height = Feet{j.at("tide_height").get<double>()};
        tide.has_height = true;
    }
    if (j.contains("tide_phase") && !j.at("tide_phase").is_null()) {
        auto phase_str = j.at("tide_phase").get<std::string>();
        auto phase = parseTidePhase(phase_str);
        if (!phase) {
            throw ConditionsError("Неизвестная фаза прилива у " + id + ": " + phase_str);
        }
        m.tide_phase = *phase;
        tide.has_phase = true;
    }

    if (j.contains("water_temp_f") && !j.at("water_temp_f").is_null()) {
        m.water_temp_f = j.at("water_temp_f").get<double>();
    }
    if (j.contains("air_temp_f") && !j.at("air_temp_f").is_null()) {
        m.air_temp_f = j.at("air_temp_f").get<double>();
    }
    return m;
}

json measurementToJson(const Measurement& m) {
    json j;
    j["wave_height"] = m.wave_height.value;
    j["wave_period"] = m.wave_period;
    j["swell_direction"] = m.swell_direction.value;
    j["wind_speed"] = m.wind_speed.value;
    j["wind_direction"] = m.wind_direction.value;
    j["tide_height"] = m.tide_height.value;
    j["tide_phase"] = toString(m.tide_phase);
    j["water_temp_f"] = m.water_temp_f.has_value() ? json(*m.water_temp_f) : json(nullptr);
    j["air_temp_f"] = m.air_temp_f.has_value() ? json(*m.air_temp_f) : json(nullptr);
    return j;
}

// === Снимок целиком ===

ConditionsSnapshot conditionsFromJsonInternal(
    const json& j,
    const RegionConfig& region,
    std::optional<LocalTime> now_override
) {
    std::string format = j.value("format", "");
    if (format != CONDITIONS_FORMAT_ID) {
        throw ConditionsError("Неверный формат файла условий");
    }

    ConditionsSnapshot snapshot;

    if (now_override) {
        snapshot.now = *now_override;
    } else if (j.contains("now")) {
        snapshot.now = timeFromJson(j.at("now"), "now");
    } else {
        throw ConditionsError("Не задано текущее время (поле now)");
    }

    if (j.contains("tides")) {
        for (const auto& [station, sj] : j.at("tides").items()) {
            snapshot.tides[station] = tideSeriesFromJson(sj, station);
        }
    }

    if (j.contains("drive_minutes")) {
        for (const auto& [id, dj] : j.at("drive_minutes").items()) {
            int minutes = dj.get<int>();
            if (minutes < 0) {
                throw ConditionsError("Отрицательное время в пути для " + id);
            }
            snapshot.drive_minutes[id] = minutes;
        }
    }

    if (j.contains("measurements")) {
        for (const auto& [id, mj] : j.at("measurements").items()) {
            TideFields tide;
            Measurement m = measurementFromJson(mj, id, tide);

            if (!tide.has_height || !tide.has_phase) {
                const LocationProfile* loc = region.findLocation(id);
                const TideSeries* series = nullptr;
                if (loc != nullptr) {
                    auto it = snapshot.tides.find(loc->tide_station);
                    if (it != snapshot.tides.end() && !it->second.empty()) {
                        series = &it->second;
                    }
                }

                if (series != nullptr) {
                    if (!tide.has_height) m.tide_height = core::currentTideHeight(*series, snapshot.now);
                    if (!tide.has_phase) m.tide_phase = core::tidePhase(*series, snapshot.now);
                } else {
                    snapshot.notes.push_back("Прилив для " + id +
                        " не указан и не может быть вычислен: нет ряда станции");
                }
            }

            auto check = validateMeasurement(m);
            if (!check.is_valid) {
                throw ConditionsError("Замер " + id + ": " + check.summary());
            }
            snapshot.measurements[id] = m;
        }
    }

    return snapshot;
}

json conditionsToJsonInternal(const ConditionsSnapshot& snapshot) {
    json j;
    j["format"] = CONDITIONS_FORMAT_ID;
    j["version"] = CONDITIONS_FORMAT_VERSION;
    j["now"] = formatIsoLocal(snapshot.now);

    json measurements = json::object();
    for (const auto& [id, m] : snapshot.measurements) {
        measurements[id] = measurementToJson(m);
    }
    j["measurements"] = measurements;

    json tides = json::object();
    for (const auto& [station, series] : snapshot.tides) {
        tides[station] = tideSeriesToJson(series);
    }
    j["tides"] = tides;

    json drive = json::object();
    for (const auto& [id, minutes] : snapshot.drive_minutes) {
        drive[id] = minutes;
    }
    j["drive_minutes"] = drive;
    return j;
}

ConditionsSnapshot parseChecked(const json& j, const RegionConfig& region,
                                std::optional<LocalTime> now_override) {
    try {
        return conditionsFromJsonInternal(j, region, now_override);
    } catch (const json::exception& e) {
        throw ConditionsError("Ошибка структуры файла условий: " + std::string(e.what()));
    }
}

} // anonymous namespace

ConditionsSnapshot loadConditions(
    const std::filesystem::path& path,
    const RegionConfig& region,
    std::optional<LocalTime> now_override
) {
    std::string text;
    try {
        text = readTextFile(path);
    } catch (const std::runtime_error& e) {
        throw ConditionsError(e.what());
    }
    return conditionsFromJson(text, region, now_override);
}

ConditionsSnapshot conditionsFromJson(
    const std::string& json_str,
    const RegionConfig& region,
    std::optional<LocalTime> now_override
) {
    json j;
    try {
        j = json::parse(json_str);
    } catch (const json::parse_error& e) {
        throw ConditionsError("Ошибка парсинга JSON: " + std::string(e.what()));
    }

    return parseChecked(j, region, now_override);
}

std::string conditionsToJson(const ConditionsSnapshot& snapshot, int indent) {
    return conditionsToJsonInternal(snapshot).dump(indent);
}

void saveConditions(const ConditionsSnapshot& snapshot, const std::filesystem::path& path) {
    try {
        atomicWrite(path, conditionsToJson(snapshot, 2));
    } catch (const std::runtime_error& e) {
        throw ConditionsError(e.what());
    }
}

} // namespace surfcast::io
