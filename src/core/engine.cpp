/// @file src/core/engine.cpp
/// @brief ChartEngine: chart assembly and resonance.

#include "natal/engine.hpp"
#include "natal/aspects.hpp"
#include "natal/balance.hpp"
#include "natal/ephemeris.hpp"
#include "natal/houses.hpp"
#include "natal/pattern.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace natal::core {

// ─── Chart ────────────────────────────────────────────────────────────────────

const BodyPosition& Chart::position(Body body) const noexcept {
    if (body == Body::NorthNode) return lunar_nodes[0];
    if (body == Body::SouthNode) return lunar_nodes[1];
    return bodies[static_cast<std::size_t>(body)];
}

std::string Chart::to_string() const {
    std::string out = fmt::format(
        "Chart {{ {} {} @ {} ({:.4f}, {:.4f}){}, JD {:.5f}, {} positions }}\n",
        moment.source.date, moment.source.local_time, moment.source.location_name,
        moment.latitude, moment.longitude,
        moment.location_known ? "" : " [default location]",
        moment.julian_day, natal::to_string(provenance));

    out += fmt::format("  Sun {}  Moon {}  Rising {} (ascendant {:.2f}°)\n",
                       natal::to_string(sun_sign()), natal::to_string(moon_sign()),
                       natal::to_string(rising), ascendant_degree);

    out += "  Bodies:\n";
    const auto print_body = [&out](const BodyPosition& p) {
        out += fmt::format("    {:<10} {:>8.3f}°  {:>5.2f}° {:<11}{}\n",
                           natal::to_string(p.body), p.longitude, p.degree_in_sign,
                           natal::to_string(p.sign), p.is_retrograde ? " R" : "");
    };
    for (const auto& p : bodies) print_body(p);
    for (const auto& p : lunar_nodes) print_body(p);

    out += "  Houses:\n";
    for (const auto& h : houses) {
        out += fmt::format("    {:>2} {:<11} ruler {:<8} {}, {}, {}\n",
                           h.number, natal::to_string(h.sign), natal::to_string(h.ruler),
                           h.themes[0], h.themes[1], h.themes[2]);
    }

    out += fmt::format("  Aspects ({}):\n", aspects.size());
    for (const auto& a : aspects) {
        out += fmt::format("    {}-{} {} orb {:.2f}° {}{} : {}\n",
                           natal::to_string(a.body_a), natal::to_string(a.body_b),
                           natal::to_string(a.kind), a.orb, natal::to_string(a.strength),
                           a.exact ? " exact" : "", a.interpretation);
    }

    out += fmt::format("  Elements: fire {} earth {} air {} water {}\n",
                       element_balance.fire, element_balance.earth,
                       element_balance.air, element_balance.water);
    out += fmt::format("  Modalities: cardinal {} fixed {} mutable {}\n",
                       modality_balance.cardinal, modality_balance.fixed,
                       modality_balance.mutable_);
    out += fmt::format("  Dominant: {}  Pattern: {}\n",
                       natal::to_string(dominant_body), natal::to_string(pattern));
    out += fmt::format("  Moon phase: {} ({} energy, {} mood, {})\n",
                       lunar_phase.to_string(),
                       lunar::to_string(lunar_phase.influence.energy),
                       lunar::to_string(lunar_phase.influence.mood),
                       lunar::to_string(lunar_phase.influence.manifestation));

    out += "  Themes:\n";
    for (const auto& theme : life_themes) out += fmt::format("    - {}\n", theme);
    return out;
}

// ─── ChartEngine constructor ──────────────────────────────────────────────────

ChartEngine::ChartEngine(EngineConfig config)
    : config_(std::move(config))
{
    if (config_.source == SourceKind::External) {
        if (config_.precise_calculator) {
            external_ = std::make_shared<const ExternalPositionSource>(
                config_.precise_calculator);
        } else {
            spdlog::warn("external positions requested but no calculator injected; "
                         "using approximate positions");
        }
    }
}

// ─── ChartEngine::compute_chart ───────────────────────────────────────────────

std::optional<Chart>
ChartEngine::compute_chart(const temporal::BirthMoment& birth) const {
    const auto moment = temporal::TemporalResolver::resolve(birth);
    if (!moment) return std::nullopt;
    return compute_chart(*moment);
}

std::optional<Chart>
ChartEngine::compute_chart(const temporal::ResolvedMoment& moment) const {
    std::optional<SourcedPositions> sourced;
    if (external_) {
        sourced = with_timeout_or(external_, approximate_, moment, config_.external_timeout);
    } else if (auto positions = approximate_.compute(moment)) {
        sourced = SourcedPositions{.positions  = *positions,
                                   .provenance = approximate_.provenance()};
    }
    if (!sourced) return std::nullopt;

    return assemble(moment, sourced->positions, sourced->provenance);
}

Chart ChartEngine::assemble(const temporal::ResolvedMoment& moment,
                            const PositionSet& positions,
                            PositionProvenance provenance) {
    using aspects::AspectEngine;
    using balance::BalanceSynthesizer;

    const Sign rising =
        ephemeris::BodyPositionCalculator::sign_of(positions.ascendant_degree);

    auto found      = AspectEngine::find_aspects(positions.planets);
    const Body dom  = BalanceSynthesizer::dominant_body(found);
    const Sign moon = positions.planets[1].sign;

    const Sign by_longitude = positions.planets[0].sign;
    const Sign by_date      = ephemeris::BodyPositionCalculator::sun_sign_for_date(
        moment.date.month, moment.date.day);
    const Sign sun = provenance == PositionProvenance::Approximate ? by_date : by_longitude;
    if (by_date != by_longitude) {
        spdlog::debug("Sun at {:.3f}° ({}), date-table sign {}; chart uses {}",
                      positions.planets[0].longitude, natal::to_string(by_longitude),
                      natal::to_string(by_date), natal::to_string(sun));
    }

    Chart chart{
        .moment           = moment,
        .bodies           = positions.planets,
        .lunar_nodes      = positions.nodes,
        .ascendant_degree = positions.ascendant_degree,
        .rising           = rising,
        .solar_sign       = sun,
        .houses           = houses::HouseCalculator::whole_sign_houses(rising),
        .aspects          = std::move(found),
        .element_balance  = BalanceSynthesizer::element_balance(positions.planets),
        .modality_balance = BalanceSynthesizer::modality_balance(positions.planets),
        .dominant_body    = dom,
        .pattern          = pattern::PatternClassifier::classify(
                                std::span<const BodyPosition>(positions.planets)),
        .life_themes      = BalanceSynthesizer::life_themes(sun, moon, rising, dom),
        .lunar_phase      = lunar::LunarPhaseCalculator::compute(moment.julian_day),
        .provenance       = provenance,
    };

    spdlog::debug("chart: {} aspects, pattern {}, dominant {}",
                  chart.aspects.size(), natal::to_string(chart.pattern),
                  natal::to_string(chart.dominant_body));
    return chart;
}

// ─── ChartEngine::resonate ────────────────────────────────────────────────────

harmonics::ResonanceReport
ChartEngine::resonate(const Chart& chart,
                      const harmonics::SongHarmonicSeries& series) const {
    return harmonics::HarmonicMapper::analyze(chart.aspects, chart.element_balance, series,
                                             config_.correlation);
}

}  // namespace natal::core
