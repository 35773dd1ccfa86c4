/// @file src/core/types.cpp
/// @brief Display names for the shared enumerations.

#include "natal/types.hpp"

namespace natal {

const char* to_string(Sign s) noexcept {
    switch (s) {
        case Sign::Aries:       return "Aries";
        case Sign::Taurus:      return "Taurus";
        case Sign::Gemini:      return "Gemini";
        case Sign::Cancer:      return "Cancer";
        case Sign::Leo:         return "Leo";
        case Sign::Virgo:       return "Virgo";
        case Sign::Libra:       return "Libra";
        case Sign::Scorpio:     return "Scorpio";
        case Sign::Sagittarius: return "Sagittarius";
        case Sign::Capricorn:   return "Capricorn";
        case Sign::Aquarius:    return "Aquarius";
        case Sign::Pisces:      return "Pisces";
    }
    return "Unknown";
}

const char* to_string(Element e) noexcept {
    switch (e) {
        case Element::Fire:  return "Fire";
        case Element::Earth: return "Earth";
        case Element::Air:   return "Air";
        case Element::Water: return "Water";
    }
    return "Unknown";
}

const char* to_string(Modality m) noexcept {
    switch (m) {
        case Modality::Cardinal: return "Cardinal";
        case Modality::Fixed:    return "Fixed";
        case Modality::Mutable:  return "Mutable";
    }
    return "Unknown";
}

const char* to_string(Body b) noexcept {
    switch (b) {
        case Body::Sun:       return "Sun";
        case Body::Moon:      return "Moon";
        case Body::Mercury:   return "Mercury";
        case Body::Venus:     return "Venus";
        case Body::Mars:      return "Mars";
        case Body::Jupiter:   return "Jupiter";
        case Body::Saturn:    return "Saturn";
        case Body::Uranus:    return "Uranus";
        case Body::Neptune:   return "Neptune";
        case Body::Pluto:     return "Pluto";
        case Body::NorthNode: return "North Node";
        case Body::SouthNode: return "South Node";
    }
    return "Unknown";
}

const char* to_string(AspectKind k) noexcept {
    switch (k) {
        case AspectKind::Conjunction: return "conjunction";
        case AspectKind::Sextile:     return "sextile";
        case AspectKind::Square:      return "square";
        case AspectKind::Trine:       return "trine";
        case AspectKind::Opposition:  return "opposition";
        case AspectKind::Quincunx:    return "quincunx";
    }
    return "unknown";
}

const char* to_string(AspectStrength s) noexcept {
    switch (s) {
        case AspectStrength::Strong:   return "strong";
        case AspectStrength::Moderate: return "moderate";
        case AspectStrength::Weak:     return "weak";
    }
    return "unknown";
}

const char* to_string(ChartPattern p) noexcept {
    switch (p) {
        case ChartPattern::Bucket:     return "Bucket";
        case ChartPattern::Bundle:     return "Bundle";
        case ChartPattern::Bowl:       return "Bowl";
        case ChartPattern::SeeSaw:     return "See-Saw";
        case ChartPattern::Splash:     return "Splash";
        case ChartPattern::Locomotive: return "Locomotive";
        case ChartPattern::Splay:      return "Splay";
    }
    return "Unknown";
}

const char* to_string(PositionProvenance p) noexcept {
    switch (p) {
        case PositionProvenance::Approximate: return "approximate";
        case PositionProvenance::External:    return "external";
    }
    return "unknown";
}

}  // namespace natal
