/// @file src/houses/house_calculator.cpp
/// @brief HouseCalculator: GMST, LST, simplified ascendant, whole-sign houses.

#include "natal/houses.hpp"
#include "natal/constants.hpp"
#include "natal/ephemeris.hpp"

#include <spdlog/spdlog.h>

namespace natal::houses {

using ephemeris::BodyPositionCalculator;

namespace {

constexpr std::array<std::array<std::string_view, 3>, HOUSE_COUNT> HOUSE_THEMES{{
    {"Self-identity", "Personality", "First impressions"},
    {"Resources", "Values", "Material security"},
    {"Communication", "Siblings", "Learning"},
    {"Home", "Family", "Emotional foundation"},
    {"Creativity", "Romance", "Self-expression"},
    {"Health", "Service", "Daily routines"},
    {"Partnerships", "Marriage", "Balance"},
    {"Transformation", "Shared resources", "Depth"},
    {"Philosophy", "Higher learning", "Travel"},
    {"Career", "Public image", "Authority"},
    {"Friendship", "Groups", "Ideals"},
    {"Spirituality", "Subconscious", "Hidden matters"},
}};

}  // namespace

double HouseCalculator::gmst_degrees(double jd) noexcept {
    const double T = BodyPositionCalculator::julian_centuries(jd);
    const double gmst = 280.46061837
                      + 360.98564736629 * (jd - constants::J2000_JD)
                      + 0.000387933 * T * T
                      - T * T * T / 38710000.0;
    return BodyPositionCalculator::normalize_degrees(gmst);
}

double HouseCalculator::local_sidereal_degrees(double jd, double longitude) noexcept {
    return BodyPositionCalculator::normalize_degrees(gmst_degrees(jd) + longitude);
}

double HouseCalculator::ascendant_degree(double jd,
                                         double latitude,
                                         double longitude) noexcept {
    const double lst = local_sidereal_degrees(jd, longitude);
    const double asc = BodyPositionCalculator::normalize_degrees(
        lst + constants::ASCENDANT_LATITUDE_WEIGHT * latitude);
    spdlog::debug("LST {:.4f}°, ascendant {:.4f}°", lst, asc);
    return asc;
}

Body HouseCalculator::ruler_of(Sign sign) noexcept {
    switch (sign) {
        case Sign::Aries:       return Body::Mars;
        case Sign::Taurus:      return Body::Venus;
        case Sign::Gemini:      return Body::Mercury;
        case Sign::Cancer:      return Body::Moon;
        case Sign::Leo:         return Body::Sun;
        case Sign::Virgo:       return Body::Mercury;
        case Sign::Libra:       return Body::Venus;
        case Sign::Scorpio:     return Body::Pluto;
        case Sign::Sagittarius: return Body::Jupiter;
        case Sign::Capricorn:   return Body::Saturn;
        case Sign::Aquarius:    return Body::Uranus;
        case Sign::Pisces:      return Body::Neptune;
    }
    return Body::Sun;
}

std::array<std::string_view, 3> HouseCalculator::house_themes(int number) noexcept {
    const int index = (((number - 1) % 12) + 12) % 12;
    return HOUSE_THEMES[static_cast<std::size_t>(index)];
}

std::array<House, HOUSE_COUNT> HouseCalculator::whole_sign_houses(Sign rising) {
    std::array<House, HOUSE_COUNT> houses{};
    for (int n = 1; n <= static_cast<int>(HOUSE_COUNT); ++n) {
        const Sign sign   = sign_from_index(sign_index(rising) + n - 1);
        const auto themes = house_themes(n);
        houses[static_cast<std::size_t>(n - 1)] = House{
            .number      = n,
            .sign        = sign,
            .cusp_degree = (n - 1) * constants::SIGN_WIDTH_DEG,
            .ruler       = ruler_of(sign),
            .themes      = {std::string(themes[0]), std::string(themes[1]),
                            std::string(themes[2])},
        };
    }
    return houses;
}

}  // namespace natal::houses
