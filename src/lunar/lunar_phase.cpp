/// @file src/lunar/lunar_phase.cpp
/// @brief LunarPhaseCalculator: synodic age, illumination, phase table.

#include "natal/lunar.hpp"
#include "natal/constants.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cmath>

namespace natal::lunar {

using constants::SYNODIC_MONTH_DAYS;

// ─── Names ────────────────────────────────────────────────────────────────────

const char* to_string(MoonPhase p) noexcept {
    switch (p) {
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

const char* to_string(LunarEnergy e) noexcept {
    switch (e) {
        case LunarEnergy::Building:  return "building";
        case LunarEnergy::Releasing: return "releasing";
        case LunarEnergy::Stable:    return "stable";
    }
    return "unknown";
}

const char* to_string(LunarMood m) noexcept {
    switch (m) {
        case LunarMood::Heightened:    return "heightened";
        case LunarMood::Calm:          return "calm";
        case LunarMood::Introspective: return "introspective";
    }
    return "unknown";
}

const char* to_string(LunarManifestation m) noexcept {
    switch (m) {
        case LunarManifestation::Planting:   return "planting";
        case LunarManifestation::Growing:    return "growing";
        case LunarManifestation::Harvesting: return "harvesting";
        case LunarManifestation::Releasing:  return "releasing";
    }
    return "unknown";
}

std::string LunarPhaseInfo::to_string() const {
    return fmt::format("{}, age {:.1f} d, {:.0f}% lit",
                       lunar::to_string(phase), age_days, illumination * 100.0);
}

// ─── LunarPhaseCalculator ─────────────────────────────────────────────────────

double LunarPhaseCalculator::age_days(double jd) noexcept {
    const double days = jd - constants::REFERENCE_NEW_MOON_JD;
    const double age  = std::fmod(std::fmod(days, SYNODIC_MONTH_DAYS) + SYNODIC_MONTH_DAYS,
                                  SYNODIC_MONTH_DAYS);
    // fmod of a tiny negative plus the month can round up to the month itself
    return age >= SYNODIC_MONTH_DAYS ? 0.0 : age;
}

double LunarPhaseCalculator::illumination(double age_days) noexcept {
    const double fraction = (1.0 - std::cos(2.0 * constants::PI * age_days / SYNODIC_MONTH_DAYS)) / 2.0;
    return std::clamp(fraction, 0.0, 1.0);
}

MoonPhase LunarPhaseCalculator::phase_of(double age_days) noexcept {
    static constexpr std::array<MoonPhase, 8> PHASES{
        MoonPhase::New,          MoonPhase::WaxingCrescent, MoonPhase::FirstQuarter,
        MoonPhase::WaxingGibbous, MoonPhase::Full,          MoonPhase::WaningGibbous,
        MoonPhase::LastQuarter,  MoonPhase::WaningCrescent,
    };
    // Each phase is centred on a multiple of one eighth of the cycle.
    const double fraction = age_days / SYNODIC_MONTH_DAYS;
    const auto   octant   = static_cast<int>(std::floor(fraction * 8.0 + 0.5));
    return PHASES[static_cast<std::size_t>(((octant % 8) + 8) % 8)];
}

LunarInfluence LunarPhaseCalculator::influence(MoonPhase phase) noexcept {
    switch (phase) {
        case MoonPhase::New:
            return {LunarEnergy::Stable, LunarMood::Introspective, LunarManifestation::Planting};
        case MoonPhase::WaxingCrescent:
        case MoonPhase::FirstQuarter:
        case MoonPhase::WaxingGibbous:
            return {LunarEnergy::Building, LunarMood::Heightened, LunarManifestation::Growing};
        case MoonPhase::Full:
            return {LunarEnergy::Stable, LunarMood::Heightened, LunarManifestation::Harvesting};
        case MoonPhase::WaningGibbous:
        case MoonPhase::LastQuarter:
        case MoonPhase::WaningCrescent:
            break;
    }
    return {LunarEnergy::Releasing, LunarMood::Calm, LunarManifestation::Releasing};
}

LunarPhaseInfo LunarPhaseCalculator::compute(double jd) noexcept {
    const double age   = age_days(jd);
    const auto   phase = phase_of(age);
    return LunarPhaseInfo{
        .age_days     = age,
        .illumination = illumination(age),
        .phase        = phase,
        .influence    = influence(phase),
    };
}

}  // namespace natal::lunar
