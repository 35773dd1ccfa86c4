#pragma once

/// @file include/natal/ephemeris.hpp
/// @brief Body Position Calculator: Julian Day to ecliptic longitude, sign,
///        degree and retrograde flag for every tracked body.
///
/// # Module: Body Position Calculator
///
/// ## Responsibility
/// The in-process ("fast approximation") ephemeris. Every routine here is a
/// closed-form series or a deterministic approximation; none reads data files.
///
/// ## Models
/// | Body            | Model                                                    |
/// |-----------------|----------------------------------------------------------|
/// | Sun             | Mean longitude at a fixed daily rate from J2000.0        |
/// | Moon            | Mean L, M, F polynomials + two periodic corrections      |
/// | Mercury…Pluto   | J2000 mean Keplerian elements, geocentric projection     |
/// | North Node      | Mean ascending node polynomial                           |
/// | South Node      | North node + 180°                                        |
///
/// Retrograde flags on this path come from `approximate_retrograde`, a fixed
/// statistical stand-in rather than a direction check, and every position is
/// marked `approximate = true`.
///
/// ## Guarantees
/// - Pure functions of the Julian Day (and day of year for retrograde flags)
/// - Longitudes always normalised to [0, 360)
/// - Sun and Moon are never retrograde

#include "natal/temporal.hpp"
#include "natal/types.hpp"

#include <array>
#include <optional>

namespace natal::ephemeris {

// ─── BodySet ──────────────────────────────────────────────────────────────────

/// Positions of the ten planets (enumeration order) and the two lunar nodes.
struct BodySet {
    std::array<BodyPosition, PLANET_COUNT> planets;
    std::array<BodyPosition, NODE_COUNT>   nodes;  ///< [0] north, [1] south

    bool operator==(const BodySet&) const = default;
};

// ─── OrbitalElements ──────────────────────────────────────────────────────────

/// Mean Keplerian elements at J2000.0 and their rates per Julian century.
/// Angles in degrees, semi-major axis in AU.
struct OrbitalElements {
    double a,  a_rate;       ///< Semi-major axis
    double e,  e_rate;       ///< Eccentricity
    double i,  i_rate;       ///< Inclination
    double l,  l_rate;       ///< Mean longitude
    double lp, lp_rate;      ///< Longitude of perihelion ϖ
    double node, node_rate;  ///< Longitude of ascending node Ω
};

/// Mean lunar arguments, degrees, normalised to [0, 360).
struct LunarMeanElements {
    double mean_longitude;        ///< L0
    double mean_anomaly;          ///< M
    double argument_of_latitude;  ///< F
};

// ─── BodyPositionCalculator ───────────────────────────────────────────────────

/// Stateless approximate ephemeris.
class BodyPositionCalculator {
public:
    BodyPositionCalculator() = delete;

    /// Wrap any finite angle into [0, 360).
    [[nodiscard]] static double normalize_degrees(double degrees) noexcept;

    /// Julian centuries since J2000.0: T = (JD − 2451545) / 36525.
    [[nodiscard]] static double julian_centuries(double jd) noexcept;

    /// Sign containing a longitude, consistent with `fmod(longitude, 30)`.
    [[nodiscard]] static Sign sign_of(double longitude) noexcept;

    /// Build a BodyPosition from a raw longitude (normalised here).
    [[nodiscard]] static BodyPosition
    to_position(Body body, double longitude, bool retrograde,
                bool approximate) noexcept;

    /// Mean solar longitude. No equation of centre or nutation.
    [[nodiscard]] static double sun_longitude(double jd) noexcept;

    /// Meeus polynomials in T for the Moon's mean longitude, mean anomaly and
    /// argument of latitude.
    [[nodiscard]] static LunarMeanElements lunar_mean_elements(double jd) noexcept;

    /// Lunar longitude from the mean longitude L0, mean anomaly M and argument
    /// of latitude F, corrected by 6.29·sin M + 1.27·sin(2L0 − M).
    [[nodiscard]] static double moon_longitude(double jd) noexcept;

    /// Mean longitude of the Moon's ascending node Ω.
    [[nodiscard]] static double mean_node_longitude(double jd) noexcept;

    /// The point exactly opposite a north node: same degree, sign + 6.
    [[nodiscard]] static BodyPosition south_node_of(const BodyPosition& north) noexcept;

    /// Mean elements for Mercury…Pluto, plus `Body::Sun` standing in for the
    /// Earth–Moon barycentre. `nullopt` for the Moon and the nodes.
    [[nodiscard]] static std::optional<OrbitalElements>
    orbital_elements(Body body) noexcept;

    /// Solve Kepler's equation E − e·sin E = M (radians) by Newton iteration.
    [[nodiscard]] static double
    solve_kepler(double mean_anomaly_rad, double eccentricity) noexcept;

    /// Geocentric ecliptic longitude of a planet from its mean elements.
    ///
    /// # Returns
    /// `nullopt` for the Sun, the Moon and the nodes (use the dedicated
    /// routines above).
    [[nodiscard]] static std::optional<double>
    planet_longitude(Body body, double jd) noexcept;

    /// Historical fraction of time a body spends retrograde (0 for Sun, Moon
    /// and nodes).
    [[nodiscard]] static double retrograde_frequency(Body body) noexcept;

    /// Deterministic retrograde stand-in:
    /// `(day_of_year · 17 + len(name)) mod 100 < 100 · retrograde_frequency`.
    ///
    /// An explicit statistical approximation, not a direction check.
    [[nodiscard]] static bool
    approximate_retrograde(Body body, int day_of_year) noexcept;

    /// Sun sign from the fixed civil date-boundary table
    /// (Aries 21 Mar – 19 Apr … Pisces 19 Feb – 20 Mar).
    [[nodiscard]] static Sign sun_sign_for_date(int month, int day) noexcept;

    /// Compute every tracked body for a resolved moment.
    [[nodiscard]] static BodySet
    compute(const temporal::ResolvedMoment& moment) noexcept;
};

}  // namespace natal::ephemeris
