#pragma once

/// @file include/natal/position_source.hpp
/// @brief Position sources: where a chart's body positions and ascendant
///        come from, and the timeout fallback between two of them.
///
/// # Module: Position Sources
///
/// ## Responsibility
/// Abstract the calculator behind a chart. The built-in approximate source
/// always answers; an external source wraps an injected high-precision
/// calculator that may be slow, fail, throw or return garbage.
///
/// ## Fallback
/// `with_timeout_or(primary, fallback, moment, timeout)` runs the primary on a
/// worker thread and waits at most `timeout`. A late, empty, throwing or
/// schema-invalid primary result is logged and replaced by the fallback
/// result. The call never retries.
///
/// A worker that misses its deadline keeps running until the calculator
/// returns. At most `constants::MAX_PENDING_WORKERS` such workers exist process-wide;
/// while that many are still running, further calls skip the primary and
/// answer from the fallback at once.
///
/// ## Guarantees
/// - A timed-out worker is detached and keeps its source alive through its
///   own `shared_ptr`; nothing it touches belongs to the caller
/// - The reported provenance names the source whose result was returned
/// - A calculator that hangs forever costs at most `MAX_PENDING_WORKERS`
///   threads

#include "natal/temporal.hpp"
#include "natal/types.hpp"

#include <array>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string_view>

namespace natal::core {

// ─── PositionSet ──────────────────────────────────────────────────────────────

/// Everything a source supplies for one moment.
struct PositionSet {
    std::array<BodyPosition, PLANET_COUNT> planets;           ///< Enumeration order
    std::array<BodyPosition, NODE_COUNT>   nodes;             ///< [0] north, [1] south
    double                                 ascendant_degree;  ///< [0, 360)

    bool operator==(const PositionSet&) const = default;
};

/// Schema check for a position set from any source: bodies in the expected
/// slots, finite longitudes in [0, 360), sign and degree consistent with the
/// longitude, south node six signs from the north node, ascendant in range.
[[nodiscard]] bool validate_positions(const PositionSet& set) noexcept;

// ─── PositionSource ───────────────────────────────────────────────────────────

/// Strategy interface for position calculators.
class PositionSource {
public:
    virtual ~PositionSource() = default;

    /// Positions for a resolved moment, or `nullopt` when unavailable.
    [[nodiscard]] virtual std::optional<PositionSet>
    compute(const temporal::ResolvedMoment& moment) const = 0;

    [[nodiscard]] virtual PositionProvenance provenance() const noexcept = 0;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

/// Built-in series approximations (ephemeris + simplified ascendant).
/// Always succeeds.
class ApproximatePositionSource final : public PositionSource {
public:
    [[nodiscard]] std::optional<PositionSet>
    compute(const temporal::ResolvedMoment& moment) const override;

    [[nodiscard]] PositionProvenance provenance() const noexcept override {
        return PositionProvenance::Approximate;
    }

    [[nodiscard]] std::string_view name() const noexcept override {
        return "approximate";
    }
};

/// Injected high-precision calculator.
using PreciseCalculator =
    std::function<std::optional<PositionSet>(const temporal::ResolvedMoment&)>;

/// Adapter from an injected `PreciseCalculator` to a PositionSource.
class ExternalPositionSource final : public PositionSource {
public:
    explicit ExternalPositionSource(PreciseCalculator calculator);

    /// Forwards to the calculator. `nullopt` when none was injected; whatever
    /// the calculator throws propagates.
    [[nodiscard]] std::optional<PositionSet>
    compute(const temporal::ResolvedMoment& moment) const override;

    [[nodiscard]] PositionProvenance provenance() const noexcept override {
        return PositionProvenance::External;
    }

    [[nodiscard]] std::string_view name() const noexcept override {
        return "external";
    }

private:
    PreciseCalculator calculator_;
};

// ─── Timeout fallback ─────────────────────────────────────────────────────────

/// A position set tagged with the source that produced it.
struct SourcedPositions {
    PositionSet        positions;
    PositionProvenance provenance;
};

/// Result-or-default combinator over two sources.
///
/// # Returns
/// The primary's result when it arrives within `timeout`, is non-empty and
/// passes `validate_positions`; otherwise the fallback's result. `nullopt`
/// only when the fallback fails as well.
[[nodiscard]] std::optional<SourcedPositions>
with_timeout_or(std::shared_ptr<const PositionSource> primary,
                const PositionSource& fallback,
                const temporal::ResolvedMoment& moment,
                std::chrono::milliseconds timeout);

/// Workers started by `with_timeout_or` that have not finished yet.
[[nodiscard]] std::size_t pending_workers() noexcept;

}  // namespace natal::core
