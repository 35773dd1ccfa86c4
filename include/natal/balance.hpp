#pragma once

/// @file include/natal/balance.hpp
/// @brief Balance & Theme Synthesizer: element and modality counts, the
///        dominant body and the life-theme list.
///
/// # Module: Balance & Theme Synthesizer
///
/// ## Dominant body
/// Every aspect adds 3 (strong), 2 (moderate) or 1 (weak) to both of its
/// bodies. The highest score wins; ties go to the earlier body in enumeration
/// order; a chart with no aspects is dominated by the Sun.
///
/// ## Life themes
/// Three keyword tags for the Sun sign, then an emotional-nature tag when the
/// Moon sign differs from the Sun sign, then a persona tag when the rising
/// sign differs from the Sun sign, then one tag for the dominant body. The
/// list never exceeds eight entries.

#include "natal/types.hpp"

#include <array>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace natal::balance {

/// Stateless synthesizer of chart summaries.
class BalanceSynthesizer {
public:
    BalanceSynthesizer() = delete;

    [[nodiscard]] static Element  element_of(Sign sign) noexcept;
    [[nodiscard]] static Modality modality_of(Sign sign) noexcept;

    /// Element counts over the given positions.
    [[nodiscard]] static ElementBalance
    element_balance(std::span<const BodyPosition> positions) noexcept;

    /// Modality counts over the given positions.
    [[nodiscard]] static ModalityBalance
    modality_balance(std::span<const BodyPosition> positions) noexcept;

    /// Aspect score of one body (3 / 2 / 1 per strong / moderate / weak aspect).
    [[nodiscard]] static int
    aspect_score(Body body, std::span<const Aspect> aspects) noexcept;

    /// Highest-scoring planet; Sun when there are no aspects.
    [[nodiscard]] static Body
    dominant_body(std::span<const Aspect> aspects) noexcept;

    /// Keyword tags of a Sun sign.
    [[nodiscard]] static std::array<std::string_view, 3>
    sign_keywords(Sign sign) noexcept;

    /// One-line theme for a dominant body.
    [[nodiscard]] static std::string_view dominant_theme(Body body) noexcept;

    /// Ordered life-theme list, at most eight entries.
    [[nodiscard]] static std::vector<std::string>
    life_themes(Sign sun, Sign moon, Sign rising, Body dominant);
};

}  // namespace natal::balance
