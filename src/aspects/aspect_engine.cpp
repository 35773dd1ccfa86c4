/// @file src/aspects/aspect_engine.cpp
/// @brief AspectEngine: separation, classification and interpretation.

#include "natal/aspects.hpp"
#include "natal/constants.hpp"
#include "natal/ephemeris.hpp"

#include <cmath>
#include <utility>

namespace natal::aspects {

// ─── Internal helpers (file-local) ────────────────────────────────────────────

namespace {

constexpr std::array<AspectDefinition, 6> ASPECT_TABLE{{
    {AspectKind::Conjunction,   0.0, 8.0},
    {AspectKind::Opposition,  180.0, 8.0},
    {AspectKind::Trine,       120.0, 6.0},
    {AspectKind::Square,       90.0, 6.0},
    {AspectKind::Sextile,      60.0, 4.0},
    {AspectKind::Quincunx,    150.0, 3.0},
}};

struct PairReading {
    Body        a;
    Body        b;
    AspectKind  kind;
    const char* text;
};

constexpr std::array<PairReading, 13> PAIR_READINGS{{
    {Body::Sun,  Body::Moon,    AspectKind::Conjunction, "Harmony between conscious will and emotions"},
    {Body::Sun,  Body::Mercury, AspectKind::Conjunction, "Strong mental focus and self-expression"},
    {Body::Sun,  Body::Venus,   AspectKind::Conjunction, "Natural charm and artistic abilities"},
    {Body::Sun,  Body::Mars,    AspectKind::Conjunction, "Dynamic energy and leadership qualities"},
    {Body::Sun,  Body::Moon,    AspectKind::Opposition,  "Internal tension between ego and emotions"},
    {Body::Sun,  Body::Saturn,  AspectKind::Opposition,  "Conflict between self-expression and responsibility"},
    {Body::Sun,  Body::Jupiter, AspectKind::Trine,       "Natural optimism and expansion opportunities"},
    {Body::Moon, Body::Venus,   AspectKind::Trine,       "Emotional harmony and artistic sensitivity"},
    {Body::Sun,  Body::Mars,    AspectKind::Square,      "Dynamic tension driving achievement"},
    {Body::Moon, Body::Saturn,  AspectKind::Square,      "Emotional challenges building strength"},
    {Body::Sun,  Body::Mercury, AspectKind::Sextile,     "Easy communication and mental clarity"},
    {Body::Venus, Body::Mars,   AspectKind::Sextile,     "Balanced creative and active energies"},
    {Body::Moon, Body::Mars,    AspectKind::Quincunx,    "Emotional reactions needing constant adjustment"},
}};

[[nodiscard]] const char* generic_reading(AspectKind kind) noexcept {
    switch (kind) {
        case AspectKind::Conjunction: return "Unified energy between planetary forces";
        case AspectKind::Opposition:  return "Tension requiring balance and integration";
        case AspectKind::Trine:       return "Harmonious flow of energy and natural talents";
        case AspectKind::Square:      return "Creative tension requiring active resolution";
        case AspectKind::Sextile:     return "Cooperative energy with growth potential";
        case AspectKind::Quincunx:    return "Adjustment between energies with little in common";
    }
    return "Unclassified planetary relationship";
}

}  // namespace

// ─── Table ────────────────────────────────────────────────────────────────────

std::span<const AspectDefinition> AspectEngine::table() noexcept {
    return ASPECT_TABLE;
}

double AspectEngine::allowed_orb(AspectKind kind) noexcept {
    for (const auto& def : ASPECT_TABLE) {
        if (def.kind == kind) return def.orb;
    }
    return 0.0;
}

// ─── Geometry ─────────────────────────────────────────────────────────────────

double AspectEngine::separation(double a, double b) noexcept {
    const double diff = std::abs(ephemeris::BodyPositionCalculator::normalize_degrees(a) -
                                 ephemeris::BodyPositionCalculator::normalize_degrees(b));
    return diff > 180.0 ? 360.0 - diff : diff;
}

std::optional<AspectMatch> AspectEngine::classify(double separation) noexcept {
    std::optional<AspectMatch> best;
    for (const auto& def : ASPECT_TABLE) {
        const double orb = std::abs(separation - def.angle);
        if (orb > def.orb) continue;
        if (!best || orb < best->orb) {
            best = AspectMatch{.kind = def.kind, .orb = orb};
        }
    }
    return best;
}

AspectStrength AspectEngine::strength_for(double orb) noexcept {
    if (orb <= constants::STRONG_ORB)   return AspectStrength::Strong;
    if (orb <= constants::MODERATE_ORB) return AspectStrength::Moderate;
    return AspectStrength::Weak;
}

// ─── Interpretation ───────────────────────────────────────────────────────────

const char* AspectEngine::interpret(Body a, Body b, AspectKind kind) noexcept {
    for (const auto& reading : PAIR_READINGS) {
        if (reading.kind != kind) continue;
        if ((reading.a == a && reading.b == b) || (reading.a == b && reading.b == a)) {
            return reading.text;
        }
    }
    return generic_reading(kind);
}

// ─── Aspect construction ──────────────────────────────────────────────────────

std::optional<Aspect> AspectEngine::aspect_between(const BodyPosition& a,
                                                   const BodyPosition& b) {
    const double sep  = separation(a.longitude, b.longitude);
    const auto  match = classify(sep);
    if (!match) return std::nullopt;

    Body first  = a.body;
    Body second = b.body;
    if (static_cast<int>(second) < static_cast<int>(first)) std::swap(first, second);

    return Aspect{
        .body_a         = first,
        .body_b         = second,
        .kind           = match->kind,
        .separation     = sep,
        .orb            = match->orb,
        .exact          = match->orb <= constants::EXACT_ORB,
        .strength       = strength_for(match->orb),
        .interpretation = interpret(first, second, match->kind),
    };
}

std::vector<Aspect> AspectEngine::find_aspects(std::span<const BodyPosition> positions) {
    std::vector<Aspect> found;
    found.reserve(constants::MAX_ASPECT_PAIRS);

    for (std::size_t i = 0; i < positions.size(); ++i) {
        for (std::size_t j = i + 1; j < positions.size(); ++j) {
            if (auto aspect = aspect_between(positions[i], positions[j])) {
                found.push_back(std::move(*aspect));
            }
        }
    }
    return found;
}

}  // namespace natal::aspects
