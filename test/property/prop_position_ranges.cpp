/**
 * @file  prop_position_ranges.cpp
 * @brief Property: ∀ Julian days: every position is normalised and consistent
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_position_ranges
 *
 * Basis:
 *   Every longitude is reduced modulo 360, and sign and degree-in-sign are
 *   both derived from that one longitude, so
 *     longitude = 30 · sign_index + degree_in_sign.
 *
 * Failure modes this test guards against:
 *   • fmod returning negative values for dates before J2000
 *   • Sign rounded up just below a sign boundary
 *   • Kepler solver diverging for eccentric orbits
 *   • Sun or Moon flagged retrograde
 */

#include <rapidcheck.h>
#include <cmath>

#include "natal/ephemeris.hpp"
#include "natal/houses.hpp"
#include "natal/position_source.hpp"

using namespace natal;
using namespace natal::ephemeris;

namespace {

/// A resolved moment with a Julian day between 1800 and 2200.
temporal::ResolvedMoment any_moment() {
    const double jd  = 2378497.0 + static_cast<double>(*rc::gen::inRange(0, 146100 * 100)) / 100.0;
    const double lat = static_cast<double>(*rc::gen::inRange(-6600, 6601)) / 100.0;
    const double lon = static_cast<double>(*rc::gen::inRange(-18000, 18001)) / 100.0;
    return temporal::ResolvedMoment{
        .source         = {},
        .date           = {2000, 1, 1},
        .time           = {12, 0},
        .day_of_year    = *rc::gen::inRange(1, 367),
        .julian_day     = jd,
        .latitude       = lat,
        .longitude      = lon,
        .location_known = true,
    };
}

bool consistent(const BodyPosition& p) {
    return std::isfinite(p.longitude) && p.longitude >= 0.0 && p.longitude < 360.0 &&
           p.degree_in_sign >= 0.0 && p.degree_in_sign < 30.0 &&
           std::abs(30.0 * sign_index(p.sign) + p.degree_in_sign - p.longitude) < 1e-6;
}

}  // namespace

int main() {
    // ── Property 1: planets and nodes are normalised ────────────────────────
    rc::check(
        "position_ranges: longitude in [0, 360), sign and degree consistent",
        []() {
            const auto set = BodyPositionCalculator::compute(any_moment());
            for (const auto& p : set.planets) RC_ASSERT(consistent(p));
            for (const auto& p : set.nodes)   RC_ASSERT(consistent(p));
        }
    );

    // ── Property 2: luminaries never retrograde ─────────────────────────────
    rc::check(
        "position_ranges: Sun and Moon direct",
        []() {
            const auto set = BodyPositionCalculator::compute(any_moment());
            RC_ASSERT(!set.planets[0].is_retrograde);
            RC_ASSERT(!set.planets[1].is_retrograde);
        }
    );

    // ── Property 3: ascendant normalised ────────────────────────────────────
    rc::check(
        "position_ranges: ascendant in [0, 360)",
        []() {
            const auto m   = any_moment();
            const double a = houses::HouseCalculator::ascendant_degree(m.julian_day, m.latitude,
                                                                       m.longitude);
            RC_ASSERT(std::isfinite(a));
            RC_ASSERT(a >= 0.0);
            RC_ASSERT(a < 360.0);
        }
    );

    // ── Property 4: the approximate source always validates ─────────────────
    rc::check(
        "position_ranges: approximate positions pass validation",
        []() {
            const auto positions = core::ApproximatePositionSource{}.compute(any_moment());
            RC_ASSERT(positions.has_value());
            RC_ASSERT(core::validate_positions(*positions));
        }
    );

    return 0;
}
