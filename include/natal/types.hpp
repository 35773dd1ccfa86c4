#pragma once

/// @file include/natal/types.hpp
/// @brief Shared value types for the natal chart and harmonic resonance core.
///
/// Every module includes this file. It defines the zodiac, body and aspect
/// enumerations together with the plain value types that flow between the
/// calculators. Nothing in here owns a resource or holds mutable state.

#include <array>
#include <cstddef>
#include <string>
#include <vector>

namespace natal {

/// Number of zodiac signs.
static constexpr int SIGN_COUNT = 12;

/// Number of planets that take part in aspects, balances and patterns
/// (Sun through Pluto).
static constexpr std::size_t PLANET_COUNT = 10;

/// Number of lunar nodes tracked alongside the planets.
static constexpr std::size_t NODE_COUNT = 2;

/// Number of houses in every chart.
static constexpr std::size_t HOUSE_COUNT = 12;

// ─── Zodiac ───────────────────────────────────────────────────────────────────

/// The twelve tropical signs, in ecliptic order starting at 0° Aries.
enum class Sign {
    Aries,
    Taurus,
    Gemini,
    Cancer,
    Leo,
    Virgo,
    Libra,
    Scorpio,
    Sagittarius,
    Capricorn,
    Aquarius,
    Pisces,
};

/// Classical element of a sign.
enum class Element { Fire, Earth, Air, Water };

/// Modality (quality) of a sign.
enum class Modality { Cardinal, Fixed, Mutable };

[[nodiscard]] const char* to_string(Sign s) noexcept;
[[nodiscard]] const char* to_string(Element e) noexcept;
[[nodiscard]] const char* to_string(Modality m) noexcept;

/// Zero-based ecliptic index of a sign (Aries = 0).
[[nodiscard]] constexpr int sign_index(Sign s) noexcept {
    return static_cast<int>(s);
}

/// Sign for an arbitrary integer index, wrapped modulo 12 (negative allowed).
[[nodiscard]] constexpr Sign sign_from_index(int index) noexcept {
    const int wrapped = ((index % SIGN_COUNT) + SIGN_COUNT) % SIGN_COUNT;
    return static_cast<Sign>(wrapped);
}

// ─── Bodies ───────────────────────────────────────────────────────────────────

/// Every body tracked in a chart. The first PLANET_COUNT entries are the
/// planets; the lunar nodes follow.
enum class Body {
    Sun,
    Moon,
    Mercury,
    Venus,
    Mars,
    Jupiter,
    Saturn,
    Uranus,
    Neptune,
    Pluto,
    NorthNode,
    SouthNode,
};

/// Planets in enumeration order.
inline constexpr std::array<Body, PLANET_COUNT> PLANETS{
    Body::Sun,     Body::Moon,   Body::Mercury, Body::Venus,   Body::Mars,
    Body::Jupiter, Body::Saturn, Body::Uranus,  Body::Neptune, Body::Pluto,
};

[[nodiscard]] const char* to_string(Body b) noexcept;

/// True for Sun through Pluto.
[[nodiscard]] constexpr bool is_planet(Body b) noexcept {
    return static_cast<std::size_t>(b) < PLANET_COUNT;
}

// ─── Positions ────────────────────────────────────────────────────────────────

/// Where one body sits on the ecliptic at the birth moment.
struct BodyPosition {
    Body   body;            ///< Which body
    double longitude;       ///< Ecliptic longitude in [0, 360)
    Sign   sign;            ///< floor(longitude / 30)
    double degree_in_sign;  ///< longitude mod 30, in [0, 30)
    bool   is_retrograde;   ///< Apparent backwards motion
    bool   approximate;     ///< Produced by an in-process approximation

    bool operator==(const BodyPosition&) const = default;
};

// ─── Houses ───────────────────────────────────────────────────────────────────

/// One whole-sign house.
struct House {
    int                        number;       ///< 1–12
    Sign                       sign;         ///< Sign occupying the house
    double                     cusp_degree;  ///< (number − 1) · 30
    Body                       ruler;        ///< Ruling body of `sign`
    std::array<std::string, 3> themes;       ///< Life areas of the house

    bool operator==(const House&) const = default;
};

// ─── Aspects ──────────────────────────────────────────────────────────────────

/// Named angular relationships recognised by the aspect engine.
enum class AspectKind {
    Conjunction,
    Sextile,
    Square,
    Trine,
    Opposition,
    Quincunx,
};

/// Coarse strength band of an aspect, from its orb.
enum class AspectStrength { Strong, Moderate, Weak };

[[nodiscard]] const char* to_string(AspectKind k) noexcept;
[[nodiscard]] const char* to_string(AspectStrength s) noexcept;

/// A classified angular relationship between two bodies.
struct Aspect {
    Body           body_a;          ///< Earlier body in enumeration order
    Body           body_b;          ///< Later body in enumeration order
    AspectKind     kind;
    double         separation;      ///< Folded separation in [0, 180]
    double         orb;             ///< |separation − kind angle|, ≥ 0
    bool           exact;           ///< orb ≤ 1°
    AspectStrength strength;
    std::string    interpretation;  ///< Short descriptive text

    bool operator==(const Aspect&) const = default;
};

// ─── Balances ─────────────────────────────────────────────────────────────────

/// Planet count per element.
struct ElementBalance {
    int fire  = 0;
    int earth = 0;
    int air   = 0;
    int water = 0;

    [[nodiscard]] int total() const noexcept { return fire + earth + air + water; }

    bool operator==(const ElementBalance&) const = default;
};

/// Planet count per modality.
struct ModalityBalance {
    int cardinal = 0;
    int fixed    = 0;
    int mutable_ = 0;  ///< Trailing underscore: `mutable` is a keyword

    [[nodiscard]] int total() const noexcept { return cardinal + fixed + mutable_; }

    bool operator==(const ModalityBalance&) const = default;
};

// ─── Chart geometry ───────────────────────────────────────────────────────────

/// Overall distribution shape of the planets around the wheel.
enum class ChartPattern {
    Bucket,
    Bundle,
    Bowl,
    SeeSaw,
    Splash,
    Locomotive,
    Splay,
};

[[nodiscard]] const char* to_string(ChartPattern p) noexcept;

/// Which calculator produced the positions and ascendant of a chart.
enum class PositionProvenance {
    Approximate,  ///< In-process series approximations
    External,     ///< Injected high-precision calculator
};

[[nodiscard]] const char* to_string(PositionProvenance p) noexcept;

}  // namespace natal
