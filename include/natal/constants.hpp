#pragma once

#include <chrono>
#include <cstddef>

/// @file include/natal/constants.hpp
/// @brief Astronomical, astrological and harmonic constants.

namespace natal::constants {

// ─── Angles ───────────────────────────────────────────────────────────────────

static constexpr double PI         = 3.14159265358979323846;
static constexpr double DEG_TO_RAD = PI / 180.0;
static constexpr double RAD_TO_DEG = 180.0 / PI;

/// Width of one zodiac sign in degrees.
static constexpr double SIGN_WIDTH_DEG = 30.0;

/// General floating-point comparison epsilon.
static constexpr double FLOAT_EPSILON = 1e-12;

// ─── Time ─────────────────────────────────────────────────────────────────────

/// Julian Day of the J2000.0 epoch (2000-01-01 12:00 TT).
static constexpr double J2000_JD = 2451545.0;

/// Days per Julian century.
static constexpr double DAYS_PER_CENTURY = 36525.0;

// ─── Sun (fallback) ───────────────────────────────────────────────────────────

/// Mean solar longitude at J2000.0, degrees.
static constexpr double SUN_MEAN_LONGITUDE_J2000 = 280.46646;

/// Mean solar motion, degrees per day (36000.76983° per Julian century).
static constexpr double SUN_MEAN_DAILY_MOTION = 0.9856473563866;

// ─── Moon (fallback) ──────────────────────────────────────────────────────────

/// Amplitude of the evection-style correction on the mean anomaly, degrees.
static constexpr double MOON_EQUATION_TERM = 6.29;

/// Amplitude of the variation-style correction on 2L − M, degrees.
static constexpr double MOON_VARIATION_TERM = 1.27;

// ─── Lunar phase ──────────────────────────────────────────────────────────────

/// Mean synodic month, days.
static constexpr double SYNODIC_MONTH_DAYS = 29.53058867;

/// Julian Day of the reference new moon, 2000-01-06 18:14 UT.
static constexpr double REFERENCE_NEW_MOON_JD = 2451550.2597222;

// ─── Sidereal time ────────────────────────────────────────────────────────────

/// Mean obliquity of the ecliptic at J2000.0, degrees.
static constexpr double OBLIQUITY_J2000 = 23.439291;

/// Latitude weight of the simplified ascendant formula.
static constexpr double ASCENDANT_LATITUDE_WEIGHT = 0.5;

// ─── Locations ────────────────────────────────────────────────────────────────

/// Default coordinate used when a place name is not in the gazetteer (Ottawa).
static constexpr double DEFAULT_LATITUDE  = 45.4215;
static constexpr double DEFAULT_LONGITUDE = -75.6972;

// ─── Aspects ──────────────────────────────────────────────────────────────────

/// Orb at or below which an aspect is "exact".
static constexpr double EXACT_ORB = 1.0;

/// Strength band upper bounds.
static constexpr double STRONG_ORB   = 2.0;
static constexpr double MODERATE_ORB = 4.0;

/// Maximum number of unordered planet pairs (10 choose 2).
static constexpr std::size_t MAX_ASPECT_PAIRS = 45;

// ─── Pattern classifier thresholds ────────────────────────────────────────────

static constexpr double BUCKET_MIN_GAP      = 120.0;
static constexpr double BUCKET_TIGHT_GAP    = 30.0;
static constexpr int    BUCKET_TIGHT_COUNT  = 7;
static constexpr double BUNDLE_MAX_SPREAD   = 120.0;
static constexpr double BOWL_MAX_SPREAD     = 180.0;
static constexpr double SEESAW_GAP          = 60.0;
static constexpr int    SEESAW_GAP_COUNT    = 2;
static constexpr double SPLASH_GAP          = 40.0;
static constexpr int    SPLASH_GAP_COUNT    = 4;
static constexpr double LOCOMOTIVE_MIN_GAP  = 90.0;

// ─── Themes ───────────────────────────────────────────────────────────────────

/// Upper bound on the life-theme list.
static constexpr std::size_t MAX_LIFE_THEMES = 8;

// ─── Harmonics ────────────────────────────────────────────────────────────────

/// Relative tolerance for matching an aspect ratio against a partial.
static constexpr double RATIO_TOLERANCE = 0.05;

/// Relative difference below which a match is classed as exact.
static constexpr double EXACT_RATIO_TOLERANCE = 0.01;

/// Highest harmonic number still classed as an overtone.
static constexpr int OVERTONE_MAX_HARMONIC = 4;

/// Harmonic numbers above this are classed as composite.
static constexpr int COMPOSITE_MIN_HARMONIC = 8;

/// Reference pitch for the chart harmonic profile (C4, scientific tuning).
static constexpr double CHART_FUNDAMENTAL_HZ = 256.0;

/// Strength above which a correlation counts as strong in insights.
static constexpr double STRONG_MATCH = 0.8;

/// Overall score: weight of the mean strength.
static constexpr double OVERALL_MEAN_WEIGHT = 0.6;

/// Overall score: strength above which a match earns the strong bonus.
static constexpr double OVERALL_STRONG_MATCH = 0.7;

/// Overall score: bonus per strong match, and its cap.
static constexpr double OVERALL_STRONG_BONUS     = 0.1;
static constexpr double OVERALL_STRONG_BONUS_MAX = 0.3;

/// Overall score: weight of the complexity match.
static constexpr double OVERALL_COMPLEXITY_WEIGHT = 0.2;

/// Partials louder than this count towards a song's harmonic complexity.
static constexpr double AUDIBLE_AMPLITUDE = 0.2;

/// Number of dominant correlations in a report.
static constexpr std::size_t DOMINANT_CORRELATIONS = 3;

// ─── External calculator ──────────────────────────────────────────────────────

/// Default upper bound on a call to an external precision calculator.
static constexpr std::chrono::milliseconds DEFAULT_EXTERNAL_TIMEOUT{2000};

/// Upper bound on external-calculator workers still running past their
/// deadline.
static constexpr std::size_t MAX_PENDING_WORKERS = 4;

}  // namespace natal::constants
