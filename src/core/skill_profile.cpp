/**
 * @file skill_profile.cpp
 * @brief Доступ к таблице комфортных высот волн
 */

#include "skill_profile.hpp"

namespace surfcast::core {

std::optional<WaveRange> lookupWaveRange(
    const SkillTable& table,
    const SurferProfile& profile
) noexcept {
    return table.find(profile);
}

IdealRange idealWaveRange(
    const SkillTable& table,
    const SurferProfile& profile
) noexcept {
    auto range = lookupWaveRange(table, profile);
    if (!range.has_value()) {
        return kDefaultIdealRange;
    }
    return {range->ideal_min, range->ideal_max};
}

} // namespace surfcast::core
