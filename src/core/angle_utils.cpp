/**
 * @file angle_utils.cpp
 * @brief Реализация утилит для работы с румбами
 */

#include "angle_utils.hpp"
#include <cmath>

namespace surfcast::core {

Degrees normalizeAngle(Degrees angle) noexcept {
    double a = angle.value;

    if (!std::isfinite(a)) {
        return Degrees{std::nan("")};
    }

    a = std::fmod(a, 360.0);
    if (a < 0.0) {
        a += 360.0;
    }
    // fmod(-1e-17, 360) + 360 округляется до 360
    if (a >= 360.0) {
        a -= 360.0;
    }

    return Degrees{a};
}

Degrees normalizeSignedAngle(Degrees angle) noexcept {
    double a = angle.value;

    if (!std::isfinite(a)) {
        return Degrees{std::nan("")};
    }

    // Сокращение больших значений, затем свёртка в (-180, 180]
    a = std::fmod(a, 360.0);
    while (a <= -180.0) {
        a += 360.0;
    }
    while (a > 180.0) {
        a -= 360.0;
    }

    return Degrees{a};
}

bool anglesClose(Degrees a1, Degrees a2, Degrees tolerance) noexcept {
    return angularDistance(a1, a2).value <= tolerance.value;
}

} // namespace surfcast::core
