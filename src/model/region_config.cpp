/**
 * @file region_config.cpp
 * @brief Встроенная конфигурация региона (Северная Калифорния)
 */

#include "region_config.hpp"
#include <utility>

namespace surfcast::model {

namespace {

LocationProfile makeLocation(
    std::string id, std::string name, std::string region, std::string description,
    GeoPoint coordinates, std::vector<double> swell, double offshore,
    TidePreference tide, std::string buoy, std::string tide_station,
    std::string break_type, std::string skill
) {
    LocationProfile loc;
    loc.id = std::move(id);
    loc.name = std::move(name);
    loc.region = std::move(region);
    loc.description = std::move(description);
    loc.coordinates = coordinates;
    for (double bearing : swell) {
        loc.optimal_swell_directions.push_back(Degrees{bearing});
    }
    loc.offshore_wind_direction = Degrees{offshore};
    loc.best_tide = tide;
    loc.buoy_station = std::move(buoy);
    loc.tide_station = std::move(tide_station);
    loc.break_type = std::move(break_type);
    loc.recommended_skill = std::move(skill);
    return loc;
}

RegionConfig buildNorCal() {
    RegionConfig config;
    config.name = "NorCal";
    config.utc_offset_minutes = -7 * 60;  // PDT
    config.skill_table = defaultSkillTable();
    config.wind_curve = defaultWindCurve();
    config.history = defaultHistoryTable();
    config.locations = defaultLocations();
    return config;
}

} // anonymous namespace

SkillTable defaultSkillTable() {
    SkillTable table;
    //                                               ideal_min ideal_max surf_min surf_max
    table.set(BoardType::Longboard, SkillLevel::Beginner,   {1.5, 3.0, 1.0, 5.0});
    table.set(BoardType::Longboard, SkillLevel::Advanced,   {2.0, 5.0, 1.5, 7.0});
    table.set(BoardType::Longboard, SkillLevel::Expert,     {3.0, 6.0, 2.0, 10.0});
    table.set(BoardType::Mediumboard, SkillLevel::Beginner, {2.0, 4.0, 1.5, 6.0});
    table.set(BoardType::Mediumboard, SkillLevel::Advanced, {3.0, 6.0, 2.0, 8.0});
    table.set(BoardType::Mediumboard, SkillLevel::Expert,   {4.0, 8.0, 2.5, 12.0});
    table.set(BoardType::Shortboard, SkillLevel::Beginner,  {2.5, 4.0, 2.0, 6.0});
    table.set(BoardType::Shortboard, SkillLevel::Advanced,  {3.0, 7.0, 2.5, 10.0});
    table.set(BoardType::Shortboard, SkillLevel::Expert,    {4.0, 10.0, 3.0, 15.0});
    return table;
}

DiurnalWindCurve defaultWindCurve() {
    DiurnalWindCurve curve;
    curve.bands = {
        {5, 9, 50.0},    // Рассвет - самый слабый ветер
        {9, 11, 35.0},   // Позднее утро
        {11, 15, 10.0},  // Полдень - обычно самый сильный ветер
        {15, 17, 20.0},  // Ветер ещё держится
        {17, 19, 40.0},  // Вечерний штиль (glass-off)
    };
    curve.fallback = 25.0;
    return curve;
}

HistoryTable defaultHistoryTable() {
    return {{
        {68.0, 6.5, 45.0},  // январь
        {65.0, 5.8, 40.0},
        {58.0, 4.5, 35.0},
        {52.0, 3.5, 30.0},
        {48.0, 3.0, 25.0},
        {45.0, 2.5, 20.0},  // июнь
        {42.0, 2.2, 18.0},
        {44.0, 2.5, 20.0},
        {55.0, 3.5, 35.0},
        {65.0, 5.0, 45.0},
        {70.0, 6.0, 50.0},
        {72.0, 7.0, 52.0},  // декабрь
    }};
}

LocationList defaultLocations() {
    using TP = TidePreference;
    return {
        makeLocation("half-moon-bay", "Half Moon Bay (Mavericks)", "Bay Area",
            "World-famous big wave spot, also has smaller breaks nearby",
            {37.494, -122.501}, {270, 290, 310}, 45, TP::Mid, "46012", "9414290", "reef", "expert"),
        makeLocation("pacifica-linda-mar", "Pacifica (Linda Mar)", "Bay Area",
            "Popular beginner-friendly beach break with consistent waves",
            {37.593, -122.504}, {260, 280, 300}, 90, TP::Mid, "46026", "9414290", "beach", "beginner"),
        makeLocation("ocean-beach-sf", "Ocean Beach SF", "Bay Area",
            "Powerful beach break, can get heavy. Not for beginners.",
            {37.76, -122.51}, {270, 285, 300}, 90, TP::Mid, "46026", "9414290", "beach", "advanced"),
        makeLocation("fort-point", "Fort Point", "Bay Area",
            "Historic spot under the Golden Gate Bridge, needs big NW swell",
            {37.811, -122.477}, {270, 290, 310}, 135, TP::Mid, "46237", "9414290", "point", "advanced"),
        makeLocation("bolinas", "Bolinas", "Marin",
            "Mellow point break, great for longboarders",
            {37.909, -122.686}, {250, 270, 290}, 45, TP::Any, "46214", "9415020", "point", "intermediate"),
        makeLocation("stinson-beach", "Stinson Beach", "Marin",
            "Beautiful beach break with scenic views",
            {37.902, -122.644}, {250, 270, 290}, 45, TP::Mid, "46214", "9415020", "beach", "intermediate"),
        makeLocation("rodeo-beach", "Rodeo Beach", "Bay Area",
            "Secluded beach break in the Marin Headlands",
            {37.833, -122.538}, {270, 285, 300}, 90, TP::Mid, "46026", "9414290", "beach", "intermediate"),
        makeLocation("muir-beach", "Muir Beach", "Marin",
            "Small cove with occasional quality waves",
            {37.859, -122.578}, {250, 270, 290}, 90, TP::Mid, "46214", "9415020", "beach", "intermediate"),
        makeLocation("dillon-beach", "Dillon Beach", "Marin",
            "Remote beach break with uncrowded waves",
            {38.248, -122.965}, {270, 285, 300}, 45, TP::Mid, "46013", "9415020", "beach", "intermediate"),
        makeLocation("salmon-creek", "Salmon Creek", "Sonoma",
            "Quality beach break on the Sonoma Coast",
            {38.315, -123.048}, {285, 300, 315}, 90, TP::Mid, "46013", "9415020", "beach", "intermediate"),
    };
}

const RegionConfig& defaultRegionConfig() {
    static const RegionConfig config = buildNorCal();
    return config;
}

} // namespace surfcast::model
