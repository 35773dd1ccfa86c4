#pragma once

/// @file include/natal/engine.hpp
/// @brief Chart engine: public API for building a natal chart and measuring
///        its resonance with a song.
///
/// # Module: Chart Engine
///
/// ## Responsibility
/// Orchestrate the calculators:
///   BirthMoment → TemporalResolver → PositionSource (→ fallback) →
///   HouseCalculator → AspectEngine → PatternClassifier →
///   BalanceSynthesizer → LunarPhaseCalculator → Chart
/// and, given a chart and a song's harmonic series, HarmonicMapper →
/// ResonanceReport.
///
/// ## Usage
/// ```cpp
/// ChartEngine engine;
/// auto chart = engine.compute_chart(temporal::BirthMoment{"1990-03-15", "2:30 pm", "New York, USA"});
/// if (chart) fmt::print("{}\n", chart->to_string());
/// ```
///
/// ## Guarantees
/// - `nullopt` only for an unparseable date or time
/// - Identical inputs and configuration give field-for-field identical charts
/// - `compute_chart` and `resonate` are const and hold no mutable state
/// - Constructing an engine leaves the spdlog level alone; the CLI sets it

#include "natal/constants.hpp"
#include "natal/harmonics.hpp"
#include "natal/lunar.hpp"
#include "natal/position_source.hpp"
#include "natal/temporal.hpp"
#include "natal/types.hpp"

#include <array>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace natal::core {

// ─── EngineConfig ─────────────────────────────────────────────────────────────

/// Which calculator supplies body positions and the ascendant.
enum class SourceKind {
    Approximate,  ///< Built-in series only
    External,     ///< Injected calculator, approximate fallback
};

/// Configuration parameters for the chart engine.
struct EngineConfig {
    /// Position calculator selection.
    SourceKind source = SourceKind::Approximate;

    /// High-precision calculator used when `source == External`.
    PreciseCalculator precise_calculator{};

    /// Upper bound on one call to the external calculator.
    std::chrono::milliseconds external_timeout = constants::DEFAULT_EXTERNAL_TIMEOUT;

    /// Matching options for `resonate`.
    harmonics::CorrelationConfig correlation{};
};

// ─── Chart ────────────────────────────────────────────────────────────────────

/// A complete natal chart. Immutable value, built once per birth moment.
struct Chart {
    temporal::ResolvedMoment               moment;
    std::array<BodyPosition, PLANET_COUNT> bodies;            ///< Enumeration order
    std::array<BodyPosition, NODE_COUNT>   lunar_nodes;       ///< [0] north, [1] south
    double                                 ascendant_degree;  ///< [0, 360)
    Sign                                   rising;
    Sign                                   solar_sign;        ///< See `sun_sign()`
    std::array<House, HOUSE_COUNT>         houses;
    std::vector<Aspect>                    aspects;
    ElementBalance                         element_balance;
    ModalityBalance                        modality_balance;
    Body                                   dominant_body;
    ChartPattern                           pattern;
    std::vector<std::string>               life_themes;       ///< At most 8
    lunar::LunarPhaseInfo                  lunar_phase;
    PositionProvenance                     provenance;

    /// Sun sign of the chart: the fixed date-boundary table for approximate
    /// charts, the Sun's longitude for external ones. `bodies[0].sign` is
    /// always the longitude sign.
    [[nodiscard]] Sign sun_sign() const noexcept { return solar_sign; }
    [[nodiscard]] Sign moon_sign() const noexcept { return bodies[1].sign; }

    /// Position of any tracked body, planets and nodes alike.
    [[nodiscard]] const BodyPosition& position(Body body) const noexcept;

    /// Multi-line human-readable summary.
    [[nodiscard]] std::string to_string() const;

    bool operator==(const Chart&) const = default;
};

// ─── ChartEngine ──────────────────────────────────────────────────────────────

/// Builds charts and resonance reports.
class ChartEngine {
public:
    /// Construct with optional configuration.
    explicit ChartEngine(EngineConfig config = EngineConfig{});

    /// Resolve and compute a chart.
    ///
    /// # Returns
    /// `nullopt` when the date or time cannot be parsed.
    [[nodiscard]] std::optional<Chart>
    compute_chart(const temporal::BirthMoment& birth) const;

    /// Compute a chart for an already-resolved moment. Never fails while the
    /// approximate fallback is in place.
    [[nodiscard]] std::optional<Chart>
    compute_chart(const temporal::ResolvedMoment& moment) const;

    /// Correlate a chart's aspects with a song's harmonic series.
    [[nodiscard]] harmonics::ResonanceReport
    resonate(const Chart& chart, const harmonics::SongHarmonicSeries& series) const;

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

private:
    /// Assemble the chart from a position set.
    [[nodiscard]] static Chart
    assemble(const temporal::ResolvedMoment& moment, const PositionSet& positions,
             PositionProvenance provenance);

    EngineConfig                           config_;
    ApproximatePositionSource              approximate_;
    std::shared_ptr<const PositionSource>  external_;  ///< Null unless configured
};

}  // namespace natal::core
