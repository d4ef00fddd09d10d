/**
 * @file directions.cpp
 */

#include "directions.hpp"
#include "angle_utils.hpp"
#include <array>
#include <cmath>

namespace surfcast::core {

namespace {

constexpr std::array<const char*, 16> kCardinals = {
    "N", "NNE", "NE", "ENE", "E", "ESE", "SE", "SSE",
    "S", "SSW", "SW", "WSW", "W", "WNW", "NW", "NNW"
};

} // anonymous namespace

std::string cardinalDirection(Degrees direction) {
    const double deg = normalizeAngle(direction).value;
    const auto index = static_cast<size_t>(std::floor(deg / 22.5 + 0.5)) % kCardinals.size();
    return kCardinals[index];
}

std::string swellSource(Degrees direction) {
    const double deg = direction.value;

    if (deg >= 270.0 && deg <= 315.0) return "North Pacific / Alaska";
    if (deg >= 225.0 && deg < 270.0) return "West Pacific";
    if (deg >= 180.0 && deg < 225.0) return "South Pacific / Southern Hemisphere";
    if (deg >= 315.0 || deg < 45.0) return "North Pacific / Gulf of Alaska";
    return "Local wind swell";
}

} // namespace surfcast::core
