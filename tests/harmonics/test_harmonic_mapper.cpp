/// @file tests/harmonics/test_harmonic_mapper.cpp
/// @brief Unit tests for HarmonicMapper.

#include "natal/harmonics.hpp"
#include "natal/constants.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace natal;
using namespace natal::harmonics;

namespace {

Aspect make_aspect(AspectKind kind, Body a = Body::Sun, Body b = Body::Moon) {
    return Aspect{
        .body_a         = a,
        .body_b         = b,
        .kind           = kind,
        .separation     = 0.0,
        .orb            = 0.5,
        .exact          = true,
        .strength       = AspectStrength::Strong,
        .interpretation = "test",
    };
}

HarmonicPartial partial(int harmonic, double ratio, double amplitude = 0.5) {
    return HarmonicPartial{
        .harmonic_number      = harmonic,
        .frequency_hz         = 261.63 * ratio,
        .amplitude            = amplitude,
        .ratio_to_fundamental = ratio,
    };
}

SongHarmonicSeries series_of(std::vector<HarmonicPartial> partials) {
    return SongHarmonicSeries{.fundamental_hz = 261.63, .partials = std::move(partials)};
}

}  // namespace

// ─── Ratio table ──────────────────────────────────────────────────────────────

TEST(RatioTable, SixRowsOnePerKind) {
    const auto table = HarmonicMapper::ratio_table();
    ASSERT_EQ(table.size(), 6u);
    for (const auto& row : table) {
        EXPECT_DOUBLE_EQ(row.ratio, static_cast<double>(row.numerator) / row.denominator);
        EXPECT_EQ(HarmonicMapper::ratio_for(row.kind).kind, row.kind);
    }
}

TEST(RatioTable, KnownIntervals) {
    const auto& trine = HarmonicMapper::ratio_for(AspectKind::Trine);
    EXPECT_DOUBLE_EQ(trine.ratio, 1.5);
    EXPECT_STREQ(trine.interval_name, "Perfect Fifth");
    EXPECT_EQ(trine.harmonic_number, 3);
    EXPECT_EQ(trine.energy, Energy::Flowing);

    const auto& quincunx = HarmonicMapper::ratio_for(AspectKind::Quincunx);
    EXPECT_STREQ(quincunx.ratio_label, "15:8");
    EXPECT_EQ(quincunx.harmonic_number, 15);
    EXPECT_EQ(quincunx.consonance, Consonance::Dissonant);

    EXPECT_EQ(HarmonicMapper::ratio_for(AspectKind::Opposition).consonance, Consonance::Neutral);
}

// ─── correlate ────────────────────────────────────────────────────────────────

TEST(Correlate, ExactTrineMatch) {
    const std::vector<Aspect> aspects{make_aspect(AspectKind::Trine)};
    const auto found = HarmonicMapper::correlate(aspects, series_of({partial(3, 1.5)}));

    ASSERT_EQ(found.size(), 1u);
    EXPECT_DOUBLE_EQ(found[0].match_strength, 1.0);
    EXPECT_EQ(found[0].resonance_type, ResonanceType::Exact);
    EXPECT_DOUBLE_EQ(found[0].difference, 0.0);
    EXPECT_DOUBLE_EQ(HarmonicMapper::resonance_score(found), 1.0);
}

TEST(Correlate, NothingWithinTolerance) {
    const std::vector<Aspect> aspects{make_aspect(AspectKind::Trine),
                                      make_aspect(AspectKind::Square)};
    const auto found = HarmonicMapper::correlate(aspects, series_of({partial(6, 3.0)}));
    EXPECT_TRUE(found.empty());
    EXPECT_DOUBLE_EQ(HarmonicMapper::resonance_score(found), 0.0);
}

TEST(Correlate, StrengthFallsWithDistance) {
    const std::vector<Aspect> aspects{make_aspect(AspectKind::Trine)};
    // Tolerance for 3:2 is 0.075; a difference of 0.05 leaves a third.
    const auto found = HarmonicMapper::correlate(aspects, series_of({partial(3, 1.55)}));
    ASSERT_EQ(found.size(), 1u);
    EXPECT_NEAR(found[0].match_strength, 1.0 / 3.0, 1e-9);
    EXPECT_EQ(found[0].resonance_type, ResonanceType::Overtone);
}

TEST(Correlate, ToleranceScalesWithRatio) {
    // 0.09 off the octave is within 5% of 2.0 but would not be within 5% of 1.
    const std::vector<Aspect> aspects{make_aspect(AspectKind::Opposition)};
    EXPECT_EQ(HarmonicMapper::correlate(aspects, series_of({partial(2, 2.09)})).size(), 1u);
    EXPECT_TRUE(HarmonicMapper::correlate(aspects, series_of({partial(2, 2.11)})).empty());
}

TEST(Correlate, SortedStrongestFirst) {
    const std::vector<Aspect> aspects{make_aspect(AspectKind::Trine),
                                      make_aspect(AspectKind::Opposition)};
    const auto found = HarmonicMapper::correlate(
        aspects, series_of({partial(3, 1.52), partial(2, 2.0), partial(5, 1.48)}));

    ASSERT_EQ(found.size(), 3u);
    EXPECT_EQ(found[0].aspect.kind, AspectKind::Opposition);
    for (std::size_t i = 1; i < found.size(); ++i) {
        EXPECT_GE(found[i - 1].match_strength, found[i].match_strength);
    }
}

TEST(Correlate, EmptyInputs) {
    const std::vector<Aspect> aspects{make_aspect(AspectKind::Trine)};
    EXPECT_TRUE(HarmonicMapper::correlate(aspects, series_of({})).empty());
    EXPECT_TRUE(HarmonicMapper::correlate({}, series_of({partial(3, 1.5)})).empty());
}

TEST(DifferenceMatrix, AspectRowsPartialColumns) {
    const std::vector<Aspect> aspects{make_aspect(AspectKind::Trine),
                                      make_aspect(AspectKind::Conjunction)};
    const std::vector<HarmonicPartial> partials{partial(1, 1.0), partial(2, 2.0),
                                                partial(3, 1.5)};
    const auto diff = HarmonicMapper::difference_matrix(aspects, partials);
    ASSERT_EQ(diff.rows(), 2);
    ASSERT_EQ(diff.cols(), 3);
    EXPECT_DOUBLE_EQ(diff(0, 0), 0.5);
    EXPECT_DOUBLE_EQ(diff(0, 2), 0.0);
    EXPECT_DOUBLE_EQ(diff(1, 1), 1.0);
}

// ─── resonance_type ───────────────────────────────────────────────────────────

TEST(ResonanceType, Classification) {
    EXPECT_EQ(HarmonicMapper::resonance_type(0.001, 1.5, 12), ResonanceType::Exact);
    EXPECT_EQ(HarmonicMapper::resonance_type(0.05, 1.5, 4), ResonanceType::Overtone);
    EXPECT_EQ(HarmonicMapper::resonance_type(0.05, 1.5, 6), ResonanceType::Undertone);
    EXPECT_EQ(HarmonicMapper::resonance_type(0.05, 1.5, 8), ResonanceType::Undertone);
    EXPECT_EQ(HarmonicMapper::resonance_type(0.05, 1.5, 9), ResonanceType::Composite);
}

// ─── Profile, insights, explanation ───────────────────────────────────────────

TEST(ChartProfile, CollectsHarmonicsAndEnergy) {
    const std::vector<Aspect> aspects{
        make_aspect(AspectKind::Square), make_aspect(AspectKind::Trine),
        make_aspect(AspectKind::Opposition), make_aspect(AspectKind::Trine),
    };
    const ElementBalance elements{.fire = 4, .earth = 3, .air = 3, .water = 0};
    const auto profile = HarmonicMapper::chart_profile(aspects, elements);

    EXPECT_DOUBLE_EQ(profile.fundamental_hz, 256.0);
    EXPECT_EQ(profile.aspect_ratios.size(), 4u);
    EXPECT_EQ(profile.dominant_harmonics, (std::vector<int>{2, 3, 4}));
    EXPECT_EQ(profile.harmonious_kinds, (std::vector<AspectKind>{AspectKind::Trine}));
    EXPECT_EQ(profile.tension_kinds,
              (std::vector<AspectKind>{AspectKind::Square, AspectKind::Opposition}));
    EXPECT_DOUBLE_EQ(profile.elemental_tones.fire, 512.0);
    EXPECT_DOUBLE_EQ(profile.elemental_tones.earth, 128.0);
    EXPECT_DOUBLE_EQ(profile.elemental_tones.air, 384.0);
    EXPECT_DOUBLE_EQ(profile.elemental_tones.water, 0.0);
}

TEST(Insights, TensionChartWithoutMatches) {
    const std::vector<Aspect> aspects{make_aspect(AspectKind::Square),
                                      make_aspect(AspectKind::Opposition)};
    const auto profile = HarmonicMapper::chart_profile(aspects, {});
    const auto lines   = HarmonicMapper::insights(profile, {});

    ASSERT_EQ(lines.size(), 3u);
    EXPECT_NE(lines[0].find("dynamic tension"), std::string::npos);
    EXPECT_NE(lines[1].find("Octave"), std::string::npos);
    EXPECT_NE(lines[2].find("fresh perspectives"), std::string::npos);
}

TEST(Insights, CountsStrongMatches) {
    const std::vector<Aspect> aspects{make_aspect(AspectKind::Trine)};
    const auto report = HarmonicMapper::analyze(
        aspects, {}, series_of({partial(3, 1.5), partial(5, 1.505)}));

    ASSERT_EQ(report.correlations.size(), 2u);
    const auto& lines = report.insights;
    ASSERT_FALSE(lines.empty());
    EXPECT_NE(lines.front().find("harmonious"), std::string::npos);
    EXPECT_EQ(lines.back(), "Found 2 strong harmonic resonances with your astrological aspects.");
}

TEST(Explain, OrdinalsAndStrengthWords) {
    const auto& trine = HarmonicMapper::ratio_for(AspectKind::Trine);
    EXPECT_EQ(HarmonicMapper::explain(trine, partial(3, 1.5), 1.0),
              "The trine aspect (Perfect Fifth) creates a strong resonance with the 3rd "
              "harmonic in this song. This 3:2 ratio embodies flowing energy, reflecting "
              "the cosmic pattern in musical form.");
    EXPECT_NE(HarmonicMapper::explain(trine, partial(11, 1.5), 0.8).find("moderate resonance with the 11th"),
              std::string::npos);
    EXPECT_NE(HarmonicMapper::explain(trine, partial(22, 1.5), 0.2).find("subtle resonance with the 22nd"),
              std::string::npos);
    EXPECT_NE(HarmonicMapper::explain(trine, partial(1, 1.5), 0.95).find("the 1st harmonic"),
              std::string::npos);
}

TEST(ResonanceReport, ToStringMentionsScore) {
    const std::vector<Aspect> aspects{make_aspect(AspectKind::Trine)};
    const auto report = HarmonicMapper::analyze(aspects, {}, series_of({partial(3, 1.5)}));
    const auto text   = report.to_string();
    EXPECT_NE(text.find("score=1.000"), std::string::npos);
    EXPECT_NE(text.find("trine"), std::string::npos);
}

// ─── CorrelationConfig ────────────────────────────────────────────────────────

TEST(CorrelationConfig, DefaultsGivePlainStrengths) {
    EXPECT_EQ(CorrelationConfig{}, (CorrelationConfig{.tolerance = constants::RATIO_TOLERANCE}));
    EXPECT_DOUBLE_EQ(CorrelationConfig{}.min_strength, 0.0);
    EXPECT_EQ(CorrelationConfig{}.max_correlations, 0u);

    // A quiet partial on a minor aspect still counts in full.
    const std::vector<Aspect> aspects{make_aspect(AspectKind::Sextile)};
    const auto found = HarmonicMapper::correlate(
        aspects, series_of({partial(5, 5.0 / 3.0, 0.1)}));
    ASSERT_EQ(found.size(), 1u);
    EXPECT_DOUBLE_EQ(found[0].match_strength, 1.0);
}

TEST(CorrelationConfig, AmplitudeWeighting) {
    const std::vector<Aspect> aspects{make_aspect(AspectKind::Trine)};
    const auto found = HarmonicMapper::correlate(
        aspects, series_of({partial(3, 1.5, 0.5)}),
        CorrelationConfig{.weight_by_amplitude = true});
    ASSERT_EQ(found.size(), 1u);
    EXPECT_DOUBLE_EQ(found[0].match_strength, 0.5);
}

TEST(CorrelationConfig, ImportanceWeighting) {
    EXPECT_DOUBLE_EQ(HarmonicMapper::aspect_weight(AspectKind::Conjunction), 1.0);
    EXPECT_DOUBLE_EQ(HarmonicMapper::aspect_weight(AspectKind::Opposition), 1.0);
    EXPECT_DOUBLE_EQ(HarmonicMapper::aspect_weight(AspectKind::Trine), 0.9);
    EXPECT_DOUBLE_EQ(HarmonicMapper::aspect_weight(AspectKind::Square), 0.9);
    EXPECT_DOUBLE_EQ(HarmonicMapper::aspect_weight(AspectKind::Sextile), 0.7);
    EXPECT_DOUBLE_EQ(HarmonicMapper::aspect_weight(AspectKind::Quincunx), 0.5);

    const std::vector<Aspect> aspects{make_aspect(AspectKind::Sextile)};
    const auto found = HarmonicMapper::correlate(
        aspects, series_of({partial(5, 5.0 / 3.0, 0.1)}),
        CorrelationConfig{.weight_by_importance = true});
    ASSERT_EQ(found.size(), 1u);
    EXPECT_DOUBLE_EQ(found[0].match_strength, 0.7);
}

TEST(CorrelationConfig, WeightedPresetDropsFaintMatches) {
    const auto config = CorrelationConfig::weighted();
    EXPECT_DOUBLE_EQ(config.min_strength, 0.3);
    EXPECT_EQ(config.max_correlations, 10u);
    EXPECT_TRUE(config.weight_by_amplitude);
    EXPECT_TRUE(config.weight_by_importance);

    // Trine weight 0.9: amplitude 0.3 gives 0.27, amplitude 0.5 gives 0.45.
    const std::vector<Aspect> aspects{make_aspect(AspectKind::Trine)};
    const auto found = HarmonicMapper::correlate(
        aspects, series_of({partial(3, 1.5, 0.3), partial(6, 1.5, 0.5)}), config);
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].partial.harmonic_number, 6);
    EXPECT_NEAR(found[0].match_strength, 0.45, 1e-12);
}

TEST(CorrelationConfig, CapKeepsScoreAndDominantOverAllMatches) {
    const std::vector<Aspect> aspects{make_aspect(AspectKind::Trine)};
    const auto series = series_of({partial(3, 1.50), partial(4, 1.51), partial(5, 1.52),
                                   partial(6, 1.53), partial(7, 1.54)});

    const auto full   = HarmonicMapper::analyze(aspects, {}, series);
    const auto capped = HarmonicMapper::analyze(aspects, {}, series,
                                                CorrelationConfig{.max_correlations = 2});

    EXPECT_EQ(full.correlations.size(), 5u);
    ASSERT_EQ(capped.correlations.size(), 2u);
    EXPECT_EQ(capped.correlations[0].partial.harmonic_number, 3);
    EXPECT_EQ(capped.correlations[1].partial.harmonic_number, 4);

    ASSERT_EQ(capped.dominant.size(), 3u);
    EXPECT_EQ(capped.dominant[2].partial.harmonic_number, 5);
    EXPECT_NEAR(capped.score, (1.0 + 13.0 / 15.0 + 11.0 / 15.0 + 9.0 / 15.0 + 7.0 / 15.0) / 5.0, 1e-9);
    EXPECT_DOUBLE_EQ(capped.score, full.score);
    EXPECT_DOUBLE_EQ(capped.overall_score, full.overall_score);
}

// ─── overall_score ────────────────────────────────────────────────────────────

TEST(OverallScore, ZeroWithoutMatches) {
    const auto report = HarmonicMapper::analyze(
        std::vector<Aspect>{make_aspect(AspectKind::Trine)}, {}, series_of({partial(7, 3.7)}));
    EXPECT_DOUBLE_EQ(report.overall_score, 0.0);
}

TEST(OverallScore, SingleExactMatchWithMatchingComplexity) {
    // 0.6 · 1 + one strong match 0.1 + complexity 0.2 · (1 − 0 / 1).
    const std::vector<Aspect> aspects{make_aspect(AspectKind::Conjunction)};
    const auto report = HarmonicMapper::analyze(aspects, {}, series_of({partial(1, 1.0, 1.0)}));
    EXPECT_NEAR(report.overall_score, 0.9, 1e-12);
}

TEST(OverallScore, ComplexityMismatchCostsBonus) {
    // Chart harmonics {2, 3}, one audible partial: complexity 1 − 1/2.
    const std::vector<Aspect> aspects{make_aspect(AspectKind::Trine),
                                      make_aspect(AspectKind::Opposition)};
    const auto report = HarmonicMapper::analyze(
        aspects, {}, series_of({partial(3, 1.5, 1.0), partial(9, 4.0, 0.1)}));
    ASSERT_EQ(report.correlations.size(), 1u);
    EXPECT_NEAR(report.overall_score, 0.6 + 0.1 + 0.1, 1e-12);
}

TEST(OverallScore, StrongBonusIsCapped) {
    const std::vector<Aspect> aspects{make_aspect(AspectKind::Trine)};
    const auto series = series_of({partial(3, 1.50), partial(4, 1.51), partial(5, 1.52),
                                   partial(6, 1.53), partial(7, 1.54)});
    const auto report = HarmonicMapper::analyze(aspects, {}, series);
    // Three matches above 0.7; one chart harmonic against five audible partials.
    EXPECT_NEAR(report.overall_score, report.score * 0.6 + 0.3 + 0.2 * (1.0 - 4.0 / 5.0), 1e-9);
    EXPECT_NE(report.to_string().find("overall="), std::string::npos);
}
