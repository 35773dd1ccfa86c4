#pragma once

/// @file include/natal/aspects.hpp
/// @brief Aspect Engine: angular separation, aspect classification, orb,
///        strength and interpretation for every planet pair.
///
/// # Module: Aspect Engine
///
/// ## Aspect table
/// | Kind        | Angle | Orb |
/// |-------------|-------|-----|
/// | Conjunction |    0° |  8° |
/// | Opposition  |  180° |  8° |
/// | Trine       |  120° |  6° |
/// | Square      |   90° |  6° |
/// | Sextile     |   60° |  4° |
/// | Quincunx    |  150° |  3° |
///
/// A separation qualifies for a kind when |separation − angle| ≤ orb. When
/// more than one kind qualifies the one with the smaller actual orb wins;
/// equal orbs resolve to table order.
///
/// ## Guarantees
/// - At most one aspect per unordered pair
/// - aspect(A, B) == aspect(B, A)
/// - 0 ≤ orb ≤ the kind's allowed orb; exact ⇒ strong

#include "natal/types.hpp"

#include <array>
#include <optional>
#include <span>
#include <vector>

namespace natal::aspects {

/// One row of the aspect table.
struct AspectDefinition {
    AspectKind kind;
    double     angle;  ///< Ideal separation, degrees
    double     orb;    ///< Allowed deviation, degrees
};

/// Result of classifying a separation.
struct AspectMatch {
    AspectKind kind;
    double     orb;  ///< Actual deviation from the ideal angle

    bool operator==(const AspectMatch&) const = default;
};

/// Stateless aspect finder.
class AspectEngine {
public:
    AspectEngine() = delete;

    /// The fixed aspect table, in tie-break order.
    [[nodiscard]] static std::span<const AspectDefinition> table() noexcept;

    /// Allowed orb of a kind.
    [[nodiscard]] static double allowed_orb(AspectKind kind) noexcept;

    /// Shortest arc between two longitudes, in [0, 180].
    [[nodiscard]] static double separation(double a, double b) noexcept;

    /// Closest qualifying aspect for a separation, or `nullopt`.
    [[nodiscard]] static std::optional<AspectMatch>
    classify(double separation) noexcept;

    /// ≤ 2° strong, ≤ 4° moderate, otherwise weak.
    [[nodiscard]] static AspectStrength strength_for(double orb) noexcept;

    /// Short interpretation for a pair, matched in either order, falling back
    /// to the generic description of the kind.
    [[nodiscard]] static const char*
    interpret(Body a, Body b, AspectKind kind) noexcept;

    /// Build the full aspect for two positions, or `nullopt` when no kind
    /// qualifies. The earlier body in enumeration order becomes `body_a`.
    [[nodiscard]] static std::optional<Aspect>
    aspect_between(const BodyPosition& a, const BodyPosition& b);

    /// Every aspect among the given positions (pairs i < j in input order).
    [[nodiscard]] static std::vector<Aspect>
    find_aspects(std::span<const BodyPosition> positions);
};

}  // namespace natal::aspects
