#pragma once

/// @file include/natal/pattern.hpp
/// @brief Chart Pattern Classifier: overall planetary distribution shape.
///
/// # Module: Chart Pattern Classifier
///
/// ## Rules (first match wins)
/// 1. Bucket    : largest gap > 120° and at least 7 gaps < 30°
/// 2. Bundle    : spread (last − first of the sorted longitudes) ≤ 120°
/// 3. Bowl      : spread ≤ 180°
/// 4. See-Saw   : exactly two gaps > 60°
/// 5. Splash    : at least four gaps > 40°
/// 6. Locomotive: largest gap > 90°
/// 7. Splay     : everything else
///
/// Gaps are the differences between consecutive sorted longitudes plus the
/// wrap-around gap `360 − last + first`.
///
/// ## Guarantees
/// - Total: every input, including empty, yields a pattern
/// - Deterministic: input order does not matter

#include "natal/types.hpp"

#include <Eigen/Core>

#include <span>

namespace natal::pattern {

/// Stateless distribution classifier.
class PatternClassifier {
public:
    PatternClassifier() = delete;

    /// Circular gaps between sorted longitudes (same length as the input;
    /// empty for fewer than two longitudes).
    [[nodiscard]] static Eigen::ArrayXd
    circular_gaps(std::span<const double> longitudes);

    /// Spread of the sorted longitudes, last − first (0 when fewer than two).
    [[nodiscard]] static double spread(std::span<const double> longitudes);

    /// Classify a set of longitudes. Fewer than two yields Bundle.
    [[nodiscard]] static ChartPattern classify(std::span<const double> longitudes);

    /// Convenience overload over body positions.
    [[nodiscard]] static ChartPattern
    classify(std::span<const BodyPosition> positions);
};

}  // namespace natal::pattern
