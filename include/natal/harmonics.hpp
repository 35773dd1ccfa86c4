#pragma once

/// @file include/natal/harmonics.hpp
/// @brief Harmonic Correlation Mapper: aspects as musical ratios, matched
///        against the partials of a song.
///
/// # Module: Harmonic Correlation Mapper
///
/// ## Responsibility
/// Map each chart aspect to a frequency ratio and interval, match those
/// ratios against a song's harmonic series, and summarise the matches as a
/// resonance score, a chart harmonic profile and a list of insights.
///
/// ## Ratio table
/// | Aspect      | Ratio | Interval       | Harmonic | Consonance | Energy  |
/// |-------------|-------|----------------|----------|------------|---------|
/// | Conjunction |   1:1 | Unison         |        1 | consonant  | stable  |
/// | Sextile     |   5:3 | Major Sixth    |        5 | consonant  | flowing |
/// | Square      |   4:3 | Perfect Fourth |        4 | dissonant  | dynamic |
/// | Trine       |   3:2 | Perfect Fifth  |        3 | consonant  | flowing |
/// | Opposition  |   2:1 | Octave         |        2 | neutral    | tense   |
/// | Quincunx    |  15:8 | Major Seventh  |       15 | dissonant  | tense   |
///
/// ## Matching
/// A partial matches an aspect when |aspect ratio − partial ratio| is within
/// 5% of the aspect ratio. Strength is `1 − difference / tolerance`.
///
/// `CorrelationConfig` can additionally weight each strength by the
/// partial's amplitude and by the importance of the aspect (conjunction and
/// opposition 1.0, trine and square 0.9, sextile 0.7, quincunx 0.5), drop
/// matches below a minimum strength and cap the reported list. The default
/// config does none of this.
///
/// ## Overall score
/// `0.6 · mean strength + min(0.1 · strong matches, 0.3) + 0.2 · complexity
/// match`, clamped to [0, 1]. A strong match is above 0.7. Complexity match is
/// `1 − |c − m| / max(c, m, 1)` where `c` counts the chart's dominant
/// harmonics and `m` the partials with amplitude above 0.2.
///
/// ## Guarantees
/// - Pure: no I/O, no logging, no shared state
/// - Correlations sorted by strength, strongest first, stable for ties
/// - No match is a valid outcome: empty list, score 0

#include "natal/constants.hpp"
#include "natal/types.hpp"

#include <Eigen/Core>

#include <cstddef>

#include <optional>
#include <span>
#include <string>
#include <vector>

namespace natal::harmonics {

// ─── Enumerations ─────────────────────────────────────────────────────────────

enum class Consonance { Consonant, Dissonant, Neutral };

enum class Energy { Flowing, Dynamic, Stable, Tense };

/// How a partial relates to the aspect it matched.
enum class ResonanceType { Exact, Overtone, Undertone, Composite };

[[nodiscard]] const char* to_string(Consonance c) noexcept;
[[nodiscard]] const char* to_string(Energy e) noexcept;
[[nodiscard]] const char* to_string(ResonanceType r) noexcept;

// ─── HarmonicRatio ────────────────────────────────────────────────────────────

/// One row of the aspect → musical ratio table.
struct HarmonicRatio {
    AspectKind  kind;
    double      angle_degrees;
    int         numerator;
    int         denominator;
    double      ratio;            ///< numerator / denominator
    const char* ratio_label;      ///< e.g. "3:2"
    const char* interval_name;    ///< e.g. "Perfect Fifth"
    int         harmonic_number;
    Consonance  consonance;
    Energy      energy;

    bool operator==(const HarmonicRatio&) const = default;
};

// ─── Song input ───────────────────────────────────────────────────────────────

/// One measured partial of a song.
struct HarmonicPartial {
    int    harmonic_number;
    double frequency_hz;
    double amplitude;             ///< [0, 1]
    double ratio_to_fundamental;

    bool operator==(const HarmonicPartial&) const = default;
};

/// A song's harmonic series, supplied from outside.
struct SongHarmonicSeries {
    double                       fundamental_hz = 0.0;
    std::vector<HarmonicPartial> partials;

    bool operator==(const SongHarmonicSeries&) const = default;
};

// ─── Results ──────────────────────────────────────────────────────────────────

/// A chart aspect matched to a song partial.
struct HarmonicCorrelation {
    Aspect          aspect;
    HarmonicRatio   ratio;
    HarmonicPartial partial;
    double          difference;      ///< |ratio − partial ratio|
    double          match_strength;  ///< [0, 1]
    ResonanceType   resonance_type;
    std::string     explanation;

    bool operator==(const HarmonicCorrelation&) const = default;
};

/// Reference tone per element, Hz.
struct ElementalTones {
    double fire  = 0.0;
    double earth = 0.0;
    double air   = 0.0;
    double water = 0.0;

    bool operator==(const ElementalTones&) const = default;
};

/// The chart expressed as harmonic content.
struct ChartHarmonicProfile {
    double                  fundamental_hz = 0.0;
    std::vector<double>     aspect_ratios;       ///< One per chart aspect
    std::vector<int>        dominant_harmonics;  ///< Sorted, unique
    std::vector<AspectKind> harmonious_kinds;    ///< Unique, flowing energy
    std::vector<AspectKind> tension_kinds;       ///< Unique, dynamic or tense
    ElementalTones          elemental_tones;

    bool operator==(const ChartHarmonicProfile&) const = default;
};

/// Matching options. The defaults give unweighted strengths, keep every
/// match within tolerance and report all of them.
struct CorrelationConfig {
    double      tolerance            = constants::RATIO_TOLERANCE;  ///< Fraction of the aspect ratio
    double      min_strength         = 0.0;    ///< Matches below are dropped
    std::size_t max_correlations     = 0;      ///< Reported list cap; 0 = no cap
    bool        weight_by_amplitude  = false;  ///< Multiply by partial amplitude
    bool        weight_by_importance = false;  ///< Multiply by aspect importance

    /// Amplitude and importance weighting, minimum strength 0.3, at most ten
    /// reported matches.
    [[nodiscard]] static CorrelationConfig weighted() noexcept {
        return CorrelationConfig{
            .tolerance            = constants::RATIO_TOLERANCE,
            .min_strength         = 0.3,
            .max_correlations     = 10,
            .weight_by_amplitude  = true,
            .weight_by_importance = true,
        };
    }

    bool operator==(const CorrelationConfig&) const = default;
};

/// Everything the mapper says about one chart and one song.
struct ResonanceReport {
    std::vector<HarmonicCorrelation> correlations;        ///< Strongest first, capped
    std::vector<HarmonicCorrelation> dominant;            ///< Top three matches
    double                           score = 0.0;         ///< Mean strength of all matches
    double                           overall_score = 0.0; ///< Mean, strong-match and complexity bonuses
    ChartHarmonicProfile             profile;
    std::vector<std::string>         insights;

    [[nodiscard]] std::string to_string() const;
};

// ─── HarmonicMapper ───────────────────────────────────────────────────────────

/// Stateless ratio matcher.
class HarmonicMapper {
public:
    HarmonicMapper() = delete;

    /// The six fixed ratio rows.
    [[nodiscard]] static std::span<const HarmonicRatio> ratio_table() noexcept;

    /// Ratio row of an aspect kind (every kind has one).
    [[nodiscard]] static const HarmonicRatio& ratio_for(AspectKind kind) noexcept;

    /// |aspect ratio − partial ratio| for every (aspect, partial) pair.
    [[nodiscard]] static Eigen::MatrixXd
    difference_matrix(std::span<const Aspect> aspects,
                      std::span<const HarmonicPartial> partials);

    /// Exact below 1% of the ratio, else overtone (h ≤ 4), composite (h > 8)
    /// or undertone.
    [[nodiscard]] static ResonanceType
    resonance_type(double difference, double ratio, int harmonic_number) noexcept;

    /// Importance of an aspect kind when weighting is enabled.
    [[nodiscard]] static double aspect_weight(AspectKind kind) noexcept;

    /// Every match within tolerance and at or above the minimum strength,
    /// strongest first. The cap in `config` is not applied here.
    [[nodiscard]] static std::vector<HarmonicCorrelation>
    correlate(std::span<const Aspect> aspects, const SongHarmonicSeries& series,
              const CorrelationConfig& config = CorrelationConfig{});

    /// Mean match strength; 0 when empty.
    [[nodiscard]] static double
    resonance_score(std::span<const HarmonicCorrelation> correlations) noexcept;

    /// Mean strength combined with the strong-match and complexity bonuses;
    /// 0 when there are no matches.
    [[nodiscard]] static double
    overall_score(std::span<const HarmonicCorrelation> correlations,
                  const ChartHarmonicProfile& profile,
                  const SongHarmonicSeries& series) noexcept;

    /// Harmonic profile of a chart.
    [[nodiscard]] static ChartHarmonicProfile
    chart_profile(std::span<const Aspect> aspects, const ElementBalance& elements);

    /// Human-readable observations about the chart profile and the matches.
    [[nodiscard]] static std::vector<std::string>
    insights(const ChartHarmonicProfile& profile,
             std::span<const HarmonicCorrelation> correlations);

    /// One-sentence description of a match.
    [[nodiscard]] static std::string
    explain(const HarmonicRatio& ratio, const HarmonicPartial& partial,
            double match_strength);

    /// Correlate, score, profile and describe in one call.
    [[nodiscard]] static ResonanceReport
    analyze(std::span<const Aspect> aspects, const ElementBalance& elements,
            const SongHarmonicSeries& series,
            const CorrelationConfig& config = CorrelationConfig{});
};

}  // namespace natal::harmonics
