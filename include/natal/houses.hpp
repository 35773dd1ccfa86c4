#pragma once

/// @file include/natal/houses.hpp
/// @brief House/Ascendant Calculator: sidereal time, rising degree and the
///        twelve whole-sign houses.
///
/// # Module: House/Ascendant Calculator
///
/// ## Responsibility
/// Derive the ascendant from the Julian Day and the birth coordinate, then lay
/// out whole-sign houses from the rising sign.
///
/// ## Approximation
/// `ascendant_degree` is a simplified stand-in, `(LST + 0.5 · latitude) mod
/// 360`, not the spherical ascendant formula. Charts built from it are marked
/// with approximate provenance.
///
/// ## Guarantees
/// - Exactly twelve houses, numbered 1–12, consecutive signs from the rising
///   sign, cusp of house n at (n − 1) · 30°
/// - All angles normalised to [0, 360)

#include "natal/types.hpp"

#include <array>
#include <string_view>

namespace natal::houses {

/// Stateless sidereal-time and house calculator.
class HouseCalculator {
public:
    HouseCalculator() = delete;

    /// Greenwich mean sidereal time in degrees (IAU 1982 polynomial).
    [[nodiscard]] static double gmst_degrees(double jd) noexcept;

    /// Local sidereal time: GMST plus east longitude, normalised.
    [[nodiscard]] static double
    local_sidereal_degrees(double jd, double longitude) noexcept;

    /// Simplified ascendant, `(LST + 0.5 · latitude) mod 360`.
    [[nodiscard]] static double
    ascendant_degree(double jd, double latitude, double longitude) noexcept;

    /// Traditional/modern ruler of a sign (Scorpio → Pluto, Aquarius →
    /// Uranus, Pisces → Neptune).
    [[nodiscard]] static Body ruler_of(Sign sign) noexcept;

    /// The three life areas of house `number` (1–12). Out-of-range numbers
    /// wrap modulo 12.
    [[nodiscard]] static std::array<std::string_view, 3>
    house_themes(int number) noexcept;

    /// Twelve whole-sign houses starting from the rising sign.
    [[nodiscard]] static std::array<House, HOUSE_COUNT>
    whole_sign_houses(Sign rising);
};

}  // namespace natal::houses
