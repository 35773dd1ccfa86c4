/**
 * @file  prop_pattern_total.cpp
 * @brief Property: PatternClassifier is total and order independent
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_pattern_total
 *
 * Basis:
 *   The circular gaps of n ≥ 2 sorted longitudes partition the full circle,
 *   so they are non-negative and sum to 360°. Classification reads only the
 *   sorted longitudes, so any permutation of the input classifies the same.
 *
 * Failure modes this test guards against:
 *   • Wrap-around gap computed with the wrong sign
 *   • Unnormalised longitudes (negative or ≥ 360) skewing the gaps
 *   • Classification depending on the caller's body order
 */

#include <rapidcheck.h>
#include <algorithm>
#include <cmath>
#include <vector>

#include "natal/pattern.hpp"

using namespace natal;
using namespace natal::pattern;

namespace {

/// Ten longitudes, including values outside [0, 360) that must be normalised.
std::vector<double> any_longitudes() {
    const auto raw = *rc::gen::container<std::vector<int>>(
        10, rc::gen::inRange(-7200000, 7200000));
    std::vector<double> out;
    out.reserve(raw.size());
    for (const int r : raw) out.push_back(static_cast<double>(r) / 10000.0);
    return out;
}

}  // namespace

int main() {
    // ── Property 1: gaps are non-negative and sum to 360° ───────────────────
    rc::check(
        "pattern_total: circular gaps partition the circle",
        []() {
            const auto longitudes = any_longitudes();
            const Eigen::ArrayXd gaps = PatternClassifier::circular_gaps(longitudes);

            RC_ASSERT(static_cast<std::size_t>(gaps.size()) == longitudes.size());
            RC_ASSERT((gaps >= 0.0).all());
            RC_ASSERT(std::abs(gaps.sum() - 360.0) < 1e-9);
        }
    );

    // ── Property 2: spread lies in [0, 360) ─────────────────────────────────
    rc::check(
        "pattern_total: spread in [0, 360)",
        []() {
            const double width = PatternClassifier::spread(any_longitudes());
            RC_ASSERT(width >= 0.0);
            RC_ASSERT(width < 360.0);
        }
    );

    // ── Property 3: permutation invariance ──────────────────────────────────
    rc::check(
        "pattern_total: classify ignores input order",
        []() {
            auto longitudes = any_longitudes();
            const ChartPattern before = PatternClassifier::classify(longitudes);

            std::reverse(longitudes.begin(), longitudes.end());
            std::rotate(longitudes.begin(), longitudes.begin() + 3, longitudes.end());
            const ChartPattern after = PatternClassifier::classify(longitudes);

            RC_ASSERT(before == after);
        }
    );

    // ── Property 4: every result is one of the seven patterns ───────────────
    rc::check(
        "pattern_total: result is a named pattern",
        []() {
            const ChartPattern p = PatternClassifier::classify(any_longitudes());
            const int index = static_cast<int>(p);
            RC_ASSERT(index >= static_cast<int>(ChartPattern::Bucket));
            RC_ASSERT(index <= static_cast<int>(ChartPattern::Splay));
        }
    );

    return 0;
}
