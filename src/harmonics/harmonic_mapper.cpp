/// @file src/harmonics/harmonic_mapper.cpp
/// @brief HarmonicMapper: ratio table, matching, scoring and insights.

#include "natal/harmonics.hpp"
#include "natal/constants.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <numeric>

namespace natal::harmonics {

// ─── Internal helpers (file-local) ────────────────────────────────────────────

namespace {

constexpr std::array<HarmonicRatio, 6> RATIO_TABLE{{
    {AspectKind::Conjunction,   0.0,  1, 1,  1.0,        "1:1",  "Unison",          1, Consonance::Consonant, Energy::Stable},
    {AspectKind::Sextile,      60.0,  5, 3,  5.0 / 3.0,  "5:3",  "Major Sixth",     5, Consonance::Consonant, Energy::Flowing},
    {AspectKind::Square,       90.0,  4, 3,  4.0 / 3.0,  "4:3",  "Perfect Fourth",  4, Consonance::Dissonant, Energy::Dynamic},
    {AspectKind::Trine,       120.0,  3, 2,  1.5,        "3:2",  "Perfect Fifth",   3, Consonance::Consonant, Energy::Flowing},
    {AspectKind::Opposition,  180.0,  2, 1,  2.0,        "2:1",  "Octave",          2, Consonance::Neutral,   Energy::Tense},
    {AspectKind::Quincunx,    150.0, 15, 8, 15.0 / 8.0,  "15:8", "Major Seventh",  15, Consonance::Dissonant, Energy::Tense},
}};

/// English ordinal suffix: 1st, 2nd, 3rd, 4th … 11th, 12th, 13th, 21st.
[[nodiscard]] const char* ordinal_suffix(int n) noexcept {
    const int last_two = n % 100;
    if (last_two >= 11 && last_two <= 13) return "th";
    switch (n % 10) {
        case 1:  return "st";
        case 2:  return "nd";
        case 3:  return "rd";
        default: return "th";
    }
}

template <typename T>
void push_unique(std::vector<T>& values, T value) {
    if (std::find(values.begin(), values.end(), value) == values.end()) {
        values.push_back(value);
    }
}

}  // namespace

// ─── Enum names ───────────────────────────────────────────────────────────────

const char* to_string(Consonance c) noexcept {
    switch (c) {
        case Consonance::Consonant: return "consonant";
        case Consonance::Dissonant: return "dissonant";
        case Consonance::Neutral:   return "neutral";
    }
    return "unknown";
}

const char* to_string(Energy e) noexcept {
    switch (e) {
        case Energy::Flowing: return "flowing";
        case Energy::Dynamic: return "dynamic";
        case Energy::Stable:  return "stable";
        case Energy::Tense:   return "tense";
    }
    return "unknown";
}

const char* to_string(ResonanceType r) noexcept {
    switch (r) {
        case ResonanceType::Exact:     return "exact";
        case ResonanceType::Overtone:  return "overtone";
        case ResonanceType::Undertone: return "undertone";
        case ResonanceType::Composite: return "composite";
    }
    return "unknown";
}

// ─── Ratio table ──────────────────────────────────────────────────────────────

std::span<const HarmonicRatio> HarmonicMapper::ratio_table() noexcept {
    return RATIO_TABLE;
}

const HarmonicRatio& HarmonicMapper::ratio_for(AspectKind kind) noexcept {
    for (const auto& row : RATIO_TABLE) {
        if (row.kind == kind) return row;
    }
    return RATIO_TABLE.front();
}

// ─── Matching ─────────────────────────────────────────────────────────────────

Eigen::MatrixXd
HarmonicMapper::difference_matrix(std::span<const Aspect> aspects,
                                  std::span<const HarmonicPartial> partials) {
    const auto rows = static_cast<Eigen::Index>(aspects.size());
    const auto cols = static_cast<Eigen::Index>(partials.size());

    Eigen::VectorXd aspect_ratios(rows);
    for (Eigen::Index i = 0; i < rows; ++i) {
        aspect_ratios(i) = ratio_for(aspects[static_cast<std::size_t>(i)].kind).ratio;
    }
    Eigen::RowVectorXd partial_ratios(cols);
    for (Eigen::Index j = 0; j < cols; ++j) {
        partial_ratios(j) = partials[static_cast<std::size_t>(j)].ratio_to_fundamental;
    }

    return (aspect_ratios.replicate(1, cols) - partial_ratios.replicate(rows, 1))
        .cwiseAbs();
}

ResonanceType HarmonicMapper::resonance_type(double difference,
                                             double ratio,
                                             int harmonic_number) noexcept {
    if (difference < constants::EXACT_RATIO_TOLERANCE * ratio) return ResonanceType::Exact;
    if (harmonic_number <= constants::OVERTONE_MAX_HARMONIC)    return ResonanceType::Overtone;
    if (harmonic_number > constants::COMPOSITE_MIN_HARMONIC)    return ResonanceType::Composite;
    return ResonanceType::Undertone;
}

double HarmonicMapper::aspect_weight(AspectKind kind) noexcept {
    switch (kind) {
        case AspectKind::Conjunction: return 1.0;
        case AspectKind::Opposition:  return 1.0;
        case AspectKind::Trine:       return 0.9;
        case AspectKind::Square:      return 0.9;
        case AspectKind::Sextile:     return 0.7;
        case AspectKind::Quincunx:    return 0.5;
    }
    return 0.5;
}

std::vector<HarmonicCorrelation>
HarmonicMapper::correlate(std::span<const Aspect> aspects,
                          const SongHarmonicSeries& series,
                          const CorrelationConfig& config) {
    std::vector<HarmonicCorrelation> found;
    if (aspects.empty() || series.partials.empty()) return found;

    const std::span<const HarmonicPartial> partials(series.partials);
    const Eigen::MatrixXd diff = difference_matrix(aspects, partials);

    for (std::size_t i = 0; i < aspects.size(); ++i) {
        const HarmonicRatio& row       = ratio_for(aspects[i].kind);
        const double         tolerance = config.tolerance * row.ratio;

        for (std::size_t j = 0; j < partials.size(); ++j) {
            const double d = diff(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j));
            if (!(d <= tolerance)) continue;  // also rejects NaN ratios

            double strength = tolerance > 0.0 ? std::clamp(1.0 - d / tolerance, 0.0, 1.0) : 1.0;
            if (config.weight_by_amplitude)  strength *= std::clamp(partials[j].amplitude, 0.0, 1.0);
            if (config.weight_by_importance) strength *= aspect_weight(row.kind);
            if (strength < config.min_strength) continue;

            found.push_back(HarmonicCorrelation{
                .aspect         = aspects[i],
                .ratio          = row,
                .partial        = partials[j],
                .difference     = d,
                .match_strength = strength,
                .resonance_type = resonance_type(d, row.ratio, partials[j].harmonic_number),
                .explanation    = explain(row, partials[j], strength),
            });
        }
    }

    std::stable_sort(found.begin(), found.end(),
                     [](const HarmonicCorrelation& a, const HarmonicCorrelation& b) {
                         return a.match_strength > b.match_strength;
                     });
    return found;
}

double HarmonicMapper::resonance_score(
    std::span<const HarmonicCorrelation> correlations) noexcept {
    if (correlations.empty()) return 0.0;
    const double total = std::accumulate(
        correlations.begin(), correlations.end(), 0.0,
        [](double sum, const HarmonicCorrelation& c) { return sum + c.match_strength; });
    return total / static_cast<double>(correlations.size());
}

// ─── Profile and insights ─────────────────────────────────────────────────────

ChartHarmonicProfile HarmonicMapper::chart_profile(std::span<const Aspect> aspects,
                                                   const ElementBalance& elements) {
    ChartHarmonicProfile profile;
    profile.fundamental_hz = constants::CHART_FUNDAMENTAL_HZ;
    profile.aspect_ratios.reserve(aspects.size());

    for (const auto& aspect : aspects) {
        const HarmonicRatio& row = ratio_for(aspect.kind);
        profile.aspect_ratios.push_back(row.ratio);
        push_unique(profile.dominant_harmonics, row.harmonic_number);
        if (row.energy == Energy::Flowing) {
            push_unique(profile.harmonious_kinds, aspect.kind);
        } else if (row.energy == Energy::Dynamic || row.energy == Energy::Tense) {
            push_unique(profile.tension_kinds, aspect.kind);
        }
    }
    std::sort(profile.dominant_harmonics.begin(), profile.dominant_harmonics.end());

    // Fire an octave up, earth an octave down, air a fifth up, water a fourth down.
    const double f = constants::CHART_FUNDAMENTAL_HZ;
    profile.elemental_tones = ElementalTones{
        .fire  = elements.fire  > 0 ? f * 2.0  : 0.0,
        .earth = elements.earth > 0 ? f * 0.5  : 0.0,
        .air   = elements.air   > 0 ? f * 1.5  : 0.0,
        .water = elements.water > 0 ? f * 0.75 : 0.0,
    };
    return profile;
}

std::vector<std::string>
HarmonicMapper::insights(const ChartHarmonicProfile& profile,
                         std::span<const HarmonicCorrelation> correlations) {
    std::vector<std::string> out;

    const auto harmonious = profile.harmonious_kinds.size();
    const auto tension    = profile.tension_kinds.size();
    if (harmonious > tension) {
        out.emplace_back("Your chart favors harmonious flowing energy - look for songs with "
                         "consonant intervals and smooth melodic lines.");
    } else if (tension > harmonious) {
        out.emplace_back("Your chart has dynamic tension - music with complex rhythms and "
                         "dissonant intervals may resonate strongly.");
    }

    const auto has_harmonic = [&](int h) {
        return std::binary_search(profile.dominant_harmonics.begin(),
                                  profile.dominant_harmonics.end(), h);
    };
    if (has_harmonic(3)) {
        out.emplace_back("The perfect fifth (3:2 ratio) appears in your chart - music featuring "
                         "strong fifths will feel especially resonant.");
    }
    if (has_harmonic(2)) {
        out.emplace_back("Octave relationships (2:1 ratio) are prominent - songs with clear "
                         "octave intervals reflect your cosmic pattern.");
    }

    if (correlations.empty()) {
        out.emplace_back("This song doesn't show strong harmonic correlations with your chart - "
                         "it may offer fresh perspectives or new energy patterns.");
    } else {
        const auto strong = std::count_if(
            correlations.begin(), correlations.end(),
            [](const HarmonicCorrelation& c) { return c.match_strength > constants::STRONG_MATCH; });
        if (strong > 0) {
            out.push_back(fmt::format("Found {} strong harmonic resonance{} with your "
                                      "astrological aspects.",
                                      strong, strong == 1 ? "" : "s"));
        }
    }
    return out;
}

std::string HarmonicMapper::explain(const HarmonicRatio& ratio,
                                    const HarmonicPartial& partial,
                                    double match_strength) {
    const char* strength = match_strength > 0.9   ? "strong"
                         : match_strength > 0.7   ? "moderate"
                                                  : "subtle";
    return fmt::format(
        "The {} aspect ({}) creates a {} resonance with the {}{} harmonic in this song. "
        "This {} ratio embodies {} energy, reflecting the cosmic pattern in musical form.",
        natal::to_string(ratio.kind), ratio.interval_name, strength,
        partial.harmonic_number, ordinal_suffix(partial.harmonic_number),
        ratio.ratio_label, to_string(ratio.energy));
}

double HarmonicMapper::overall_score(std::span<const HarmonicCorrelation> correlations,
                                     const ChartHarmonicProfile& profile,
                                     const SongHarmonicSeries& series) noexcept {
    if (correlations.empty()) return 0.0;

    const auto strong = std::count_if(
        correlations.begin(), correlations.end(),
        [](const HarmonicCorrelation& c) { return c.match_strength > constants::OVERALL_STRONG_MATCH; });
    const double strong_bonus = std::min(static_cast<double>(strong) * constants::OVERALL_STRONG_BONUS,
                                         constants::OVERALL_STRONG_BONUS_MAX);

    const auto chart_complexity = static_cast<double>(profile.dominant_harmonics.size());
    const auto song_complexity  = static_cast<double>(std::count_if(
        series.partials.begin(), series.partials.end(),
        [](const HarmonicPartial& p) { return p.amplitude > constants::AUDIBLE_AMPLITUDE; }));
    const double complexity_match =
        1.0 - std::abs(chart_complexity - song_complexity) /
                  std::max({chart_complexity, song_complexity, 1.0});

    const double total = resonance_score(correlations) * constants::OVERALL_MEAN_WEIGHT +
                         strong_bonus +
                         complexity_match * constants::OVERALL_COMPLEXITY_WEIGHT;
    return std::clamp(total, 0.0, 1.0);
}

ResonanceReport HarmonicMapper::analyze(std::span<const Aspect> aspects,
                                        const ElementBalance& elements,
                                        const SongHarmonicSeries& series,
                                        const CorrelationConfig& config) {
    ResonanceReport report;
    report.correlations  = correlate(aspects, series, config);
    report.score         = resonance_score(report.correlations);
    report.profile       = chart_profile(aspects, elements);
    report.overall_score = overall_score(report.correlations, report.profile, series);
    report.insights      = insights(report.profile, report.correlations);

    const std::size_t top = std::min(report.correlations.size(), constants::DOMINANT_CORRELATIONS);
    report.dominant.assign(report.correlations.begin(),
                           report.correlations.begin() + static_cast<std::ptrdiff_t>(top));
    if (config.max_correlations > 0 && report.correlations.size() > config.max_correlations) {
        report.correlations.resize(config.max_correlations);
    }
    return report;
}

// ─── ResonanceReport ──────────────────────────────────────────────────────────

std::string ResonanceReport::to_string() const {
    std::string out = fmt::format(
        "ResonanceReport {{ score={:.3f}, overall={:.3f}, correlations={}, dominant_harmonics=[",
        score, overall_score, correlations.size());
    for (std::size_t i = 0; i < profile.dominant_harmonics.size(); ++i) {
        out += fmt::format("{}{}", i == 0 ? "" : ", ", profile.dominant_harmonics[i]);
    }
    out += "] }\n";

    for (const auto& c : correlations) {
        out += fmt::format("  {:<11} {}-{}  h{:<3} strength={:.3f} ({})\n",
                           natal::to_string(c.aspect.kind),
                           natal::to_string(c.aspect.body_a),
                           natal::to_string(c.aspect.body_b),
                           c.partial.harmonic_number, c.match_strength,
                           harmonics::to_string(c.resonance_type));
    }
    for (const auto& line : insights) {
        out += fmt::format("  * {}\n", line);
    }
    return out;
}

}  // namespace natal::harmonics
