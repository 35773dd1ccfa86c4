/// @file src/balance/balance_synthesizer.cpp
/// @brief BalanceSynthesizer: element/modality counts, dominance, themes.

#include "natal/balance.hpp"
#include "natal/constants.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>

namespace natal::balance {

namespace {

constexpr std::array<std::array<std::string_view, 3>, SIGN_COUNT> SIGN_KEYWORDS{{
    {"Leadership", "Initiative", "Independence"},
    {"Stability", "Sensuality", "Persistence"},
    {"Communication", "Adaptability", "Learning"},
    {"Nurturing", "Emotional depth", "Protection"},
    {"Creativity", "Self-expression", "Recognition"},
    {"Service", "Perfectionism", "Analysis"},
    {"Balance", "Relationships", "Harmony"},
    {"Transformation", "Intensity", "Depth"},
    {"Philosophy", "Adventure", "Growth"},
    {"Achievement", "Structure", "Authority"},
    {"Innovation", "Humanitarianism", "Independence"},
    {"Spirituality", "Compassion", "Intuition"},
}};

[[nodiscard]] int weight(AspectStrength strength) noexcept {
    switch (strength) {
        case AspectStrength::Strong:   return 3;
        case AspectStrength::Moderate: return 2;
        case AspectStrength::Weak:     return 1;
    }
    return 0;
}

[[nodiscard]] std::string lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

}  // namespace

// ─── Element / modality ───────────────────────────────────────────────────────

Element BalanceSynthesizer::element_of(Sign sign) noexcept {
    static constexpr std::array<Element, 4> CYCLE{
        Element::Fire, Element::Earth, Element::Air, Element::Water};
    return CYCLE[static_cast<std::size_t>(sign_index(sign) % 4)];
}

Modality BalanceSynthesizer::modality_of(Sign sign) noexcept {
    static constexpr std::array<Modality, 3> CYCLE{
        Modality::Cardinal, Modality::Fixed, Modality::Mutable};
    return CYCLE[static_cast<std::size_t>(sign_index(sign) % 3)];
}

ElementBalance
BalanceSynthesizer::element_balance(std::span<const BodyPosition> positions) noexcept {
    ElementBalance balance{};
    for (const auto& p : positions) {
        switch (element_of(p.sign)) {
            case Element::Fire:  ++balance.fire;  break;
            case Element::Earth: ++balance.earth; break;
            case Element::Air:   ++balance.air;   break;
            case Element::Water: ++balance.water; break;
        }
    }
    return balance;
}

ModalityBalance
BalanceSynthesizer::modality_balance(std::span<const BodyPosition> positions) noexcept {
    ModalityBalance balance{};
    for (const auto& p : positions) {
        switch (modality_of(p.sign)) {
            case Modality::Cardinal: ++balance.cardinal; break;
            case Modality::Fixed:    ++balance.fixed;    break;
            case Modality::Mutable:  ++balance.mutable_; break;
        }
    }
    return balance;
}

// ─── Dominance ────────────────────────────────────────────────────────────────

int BalanceSynthesizer::aspect_score(Body body, std::span<const Aspect> aspects) noexcept {
    int score = 0;
    for (const auto& a : aspects) {
        if (a.body_a == body || a.body_b == body) score += weight(a.strength);
    }
    return score;
}

Body BalanceSynthesizer::dominant_body(std::span<const Aspect> aspects) noexcept {
    Body best       = Body::Sun;
    int  best_score = 0;
    for (const Body body : PLANETS) {
        const int score = aspect_score(body, aspects);
        if (score > best_score) {
            best       = body;
            best_score = score;
        }
    }
    return best;
}

// ─── Themes ───────────────────────────────────────────────────────────────────

std::array<std::string_view, 3> BalanceSynthesizer::sign_keywords(Sign sign) noexcept {
    return SIGN_KEYWORDS[static_cast<std::size_t>(sign_index(sign))];
}

std::string_view BalanceSynthesizer::dominant_theme(Body body) noexcept {
    switch (body) {
        case Body::Sun:     return "Self-expression and vitality";
        case Body::Moon:    return "Emotional intelligence and intuition";
        case Body::Mercury: return "Communication and mental agility";
        case Body::Venus:   return "Relationships and artistic expression";
        case Body::Mars:    return "Action and assertiveness";
        case Body::Jupiter: return "Growth and philosophical expansion";
        case Body::Saturn:  return "Discipline and structural thinking";
        case Body::Uranus:  return "Innovation and revolutionary spirit";
        case Body::Neptune: return "Spirituality and mystical experiences";
        case Body::Pluto:   return "Transformation and regeneration";
        default:            return "Karmic direction and growth";
    }
}

std::vector<std::string> BalanceSynthesizer::life_themes(Sign sun,
                                                         Sign moon,
                                                         Sign rising,
                                                         Body dominant) {
    std::vector<std::string> themes;
    themes.reserve(constants::MAX_LIFE_THEMES);

    for (const auto keyword : sign_keywords(sun)) themes.emplace_back(keyword);
    if (moon != sun) {
        themes.push_back(fmt::format("Emotional {} nature", lower(to_string(moon))));
    }
    if (rising != sun) {
        themes.push_back(fmt::format("{} persona and approach to life", to_string(rising)));
    }
    themes.emplace_back(dominant_theme(dominant));

    if (themes.size() > constants::MAX_LIFE_THEMES) {
        themes.resize(constants::MAX_LIFE_THEMES);
    }
    return themes;
}

}  // namespace natal::balance
