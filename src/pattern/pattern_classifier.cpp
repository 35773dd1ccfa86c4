/// @file src/pattern/pattern_classifier.cpp
/// @brief PatternClassifier: gap analysis over sorted longitudes.

#include "natal/pattern.hpp"
#include "natal/constants.hpp"
#include "natal/ephemeris.hpp"

#include <algorithm>
#include <vector>

namespace natal::pattern {

namespace {

[[nodiscard]] Eigen::ArrayXd sorted_longitudes(std::span<const double> longitudes) {
    Eigen::ArrayXd sorted(static_cast<Eigen::Index>(longitudes.size()));
    for (std::size_t i = 0; i < longitudes.size(); ++i) {
        sorted(static_cast<Eigen::Index>(i)) =
            ephemeris::BodyPositionCalculator::normalize_degrees(longitudes[i]);
    }
    std::sort(sorted.data(), sorted.data() + sorted.size());
    return sorted;
}

}  // namespace

Eigen::ArrayXd PatternClassifier::circular_gaps(std::span<const double> longitudes) {
    if (longitudes.size() < 2) return Eigen::ArrayXd{};

    const Eigen::ArrayXd sorted = sorted_longitudes(longitudes);
    const Eigen::Index   n      = sorted.size();

    Eigen::ArrayXd gaps(n);
    gaps.head(n - 1) = sorted.tail(n - 1) - sorted.head(n - 1);
    gaps(n - 1)      = 360.0 - sorted(n - 1) + sorted(0);
    return gaps;
}

double PatternClassifier::spread(std::span<const double> longitudes) {
    if (longitudes.size() < 2) return 0.0;
    const Eigen::ArrayXd sorted = sorted_longitudes(longitudes);
    return sorted(sorted.size() - 1) - sorted(0);
}

ChartPattern PatternClassifier::classify(std::span<const double> longitudes) {
    if (longitudes.size() < 2) return ChartPattern::Bundle;

    const Eigen::ArrayXd gaps    = circular_gaps(longitudes);
    const double         max_gap = gaps.maxCoeff();
    const double         width   = spread(longitudes);

    const auto count_below = [&](double limit) {
        return static_cast<int>((gaps < limit).count());
    };
    const auto count_above = [&](double limit) {
        return static_cast<int>((gaps > limit).count());
    };

    if (max_gap > constants::BUCKET_MIN_GAP &&
        count_below(constants::BUCKET_TIGHT_GAP) >= constants::BUCKET_TIGHT_COUNT) {
        return ChartPattern::Bucket;
    }
    if (width <= constants::BUNDLE_MAX_SPREAD) return ChartPattern::Bundle;
    if (width <= constants::BOWL_MAX_SPREAD)   return ChartPattern::Bowl;
    if (count_above(constants::SEESAW_GAP) == constants::SEESAW_GAP_COUNT) {
        return ChartPattern::SeeSaw;
    }
    if (count_above(constants::SPLASH_GAP) >= constants::SPLASH_GAP_COUNT) {
        return ChartPattern::Splash;
    }
    if (max_gap > constants::LOCOMOTIVE_MIN_GAP) return ChartPattern::Locomotive;
    return ChartPattern::Splay;
}

ChartPattern PatternClassifier::classify(std::span<const BodyPosition> positions) {
    std::vector<double> longitudes;
    longitudes.reserve(positions.size());
    for (const auto& p : positions) longitudes.push_back(p.longitude);
    return classify(std::span<const double>(longitudes));
}

}  // namespace natal::pattern
