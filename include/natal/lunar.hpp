#pragma once

/// @file include/natal/lunar.hpp
/// @brief Lunar phase: Moon age, illuminated fraction and the eight named
///        phases.
///
/// # Module: Lunar Phase
///
/// ## Responsibility
/// Place a Julian Day within the mean synodic month measured from the new
/// moon of 2000-01-06 18:14 UT, and derive the phase and its influence from
/// that age.
///
/// ## Guarantees
/// - `age_days` in [0, SYNODIC_MONTH_DAYS) for any finite Julian Day,
///   including days before the reference new moon
/// - `illumination` in [0, 1]: 0 at new moon, 1 at full moon
/// - Phase boundaries sit at odd sixteenths of the cycle; the last sixteenth
///   is New again

#include <string>

namespace natal::lunar {

// ─── Phase ────────────────────────────────────────────────────────────────────

enum class MoonPhase {
    New,
    WaxingCrescent,
    FirstQuarter,
    WaxingGibbous,
    Full,
    WaningGibbous,
    LastQuarter,
    WaningCrescent,
};

[[nodiscard]] const char* to_string(MoonPhase p) noexcept;

// ─── Influence ────────────────────────────────────────────────────────────────

enum class LunarEnergy { Building, Releasing, Stable };
enum class LunarMood { Heightened, Calm, Introspective };
enum class LunarManifestation { Planting, Growing, Harvesting, Releasing };

[[nodiscard]] const char* to_string(LunarEnergy e) noexcept;
[[nodiscard]] const char* to_string(LunarMood m) noexcept;
[[nodiscard]] const char* to_string(LunarManifestation m) noexcept;

/// What a phase favours.
struct LunarInfluence {
    LunarEnergy        energy;
    LunarMood          mood;
    LunarManifestation manifestation;

    bool operator==(const LunarInfluence&) const = default;
};

// ─── LunarPhaseInfo ───────────────────────────────────────────────────────────

struct LunarPhaseInfo {
    double         age_days;      ///< [0, SYNODIC_MONTH_DAYS)
    double         illumination;  ///< [0, 1]
    MoonPhase      phase;
    LunarInfluence influence;

    /// One-line summary, e.g. "Waxing Gibbous, age 10.2 d, 78% lit".
    [[nodiscard]] std::string to_string() const;

    bool operator==(const LunarPhaseInfo&) const = default;
};

// ─── LunarPhaseCalculator ─────────────────────────────────────────────────────

/// Stateless lunar phase calculator.
class LunarPhaseCalculator {
public:
    LunarPhaseCalculator() = delete;

    /// Days since the most recent mean new moon.
    [[nodiscard]] static double age_days(double jd) noexcept;

    /// Illuminated fraction, `(1 − cos(2π · age / month)) / 2`.
    [[nodiscard]] static double illumination(double age_days) noexcept;

    [[nodiscard]] static MoonPhase phase_of(double age_days) noexcept;

    [[nodiscard]] static LunarInfluence influence(MoonPhase phase) noexcept;

    /// Age, illumination, phase and influence at `jd`.
    [[nodiscard]] static LunarPhaseInfo compute(double jd) noexcept;
};

}  // namespace natal::lunar
