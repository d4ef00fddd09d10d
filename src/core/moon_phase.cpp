/**
 * @file moon_phase.cpp
 */

#include "moon_phase.hpp"
#include <array>
#include <cmath>
#include <numbers>

namespace surfcast::core {

namespace {

constexpr std::array<MoonPhase, 8> kPhases = {
    MoonPhase::New, MoonPhase::WaxingCrescent, MoonPhase::FirstQuarter, MoonPhase::WaxingGibbous,
    MoonPhase::Full, MoonPhase::WaningGibbous, MoonPhase::LastQuarter, MoonPhase::WaningCrescent
};

/// Опорное новолуние как UTC-время
std::chrono::sys_seconds referenceNewMoon() noexcept {
    using namespace std::chrono;
    return sys_days{year{2024} / January / 11} + hours{11} + minutes{57};
}

} // anonymous namespace

std::string toString(MoonPhase phase) {
    switch (phase) {
        case MoonPhase::New:            return "new";
        case MoonPhase::WaxingCrescent: return "waxing-crescent";
        case MoonPhase::FirstQuarter:   return "first-quarter";
        case MoonPhase::WaxingGibbous:  return "waxing-gibbous";
        case MoonPhase::Full:           return "full";
        case MoonPhase::WaningGibbous:  return "waning-gibbous";
        case MoonPhase::LastQuarter:    return "last-quarter";
        case MoonPhase::WaningCrescent: return "waning-crescent";
    }
    return "unknown";
}

std::string displayName(MoonPhase phase) {
    switch (phase) {
        case MoonPhase::New:            return "New Moon";
        case MoonPhase::WaxingCrescent: return "Waxing Crescent";
        case MoonPhase::FirstQuarter:   return "First Quarter";
        case MoonPhase::WaxingGibbous:  return "Waxing Gibbous";
        case MoonPhase::Full:           return "Full Moon";
        case MoonPhase::WaningGibbous:  return "Waning Gibbous";
        case MoonPhase::LastQuarter:    return "Last Quarter";
        case MoonPhase::WaningCrescent: return "Waning Crescent";
    }
    return "Unknown";
}

MoonInfo moonPhase(LocalTime t, int utc_offset_minutes) noexcept {
    using namespace std::chrono;

    // Местное время -> UTC
    const sys_seconds utc{t.time_since_epoch() - minutes{utc_offset_minutes}};
    const double days = duration<double, std::ratio<86400>>(utc - referenceNewMoon()).count();

    const double age = std::fmod(std::fmod(days, kSynodicMonthDays) + kSynodicMonthDays,
                                 kSynodicMonthDays);
    const double fraction = age / kSynodicMonthDays;

    MoonInfo info;
    info.age_days = age;
    info.illumination = static_cast<int>(
        std::floor((1.0 - std::cos(fraction * 2.0 * std::numbers::pi)) / 2.0 * 100.0 + 0.5));
    info.phase = kPhases[static_cast<size_t>(std::floor(fraction * 8.0)) % kPhases.size()];
    return info;
}

} // namespace surfcast::core
