/// @file src/ephemeris/body_positions.cpp
/// @brief BodyPositionCalculator: approximate series ephemeris.
///
/// Planet elements are the J2000 mean Keplerian elements and century rates of
/// Standish, "Keplerian Elements for Approximate Positions of the Major
/// Planets" (JPL), valid roughly 1800–2050. Lunar and nodal polynomials follow
/// Meeus, "Astronomical Algorithms", ch. 47.

#include "natal/ephemeris.hpp"
#include "natal/constants.hpp"

#include <Eigen/Geometry>

#include <cmath>
#include <cstring>

namespace natal::ephemeris {

using constants::DEG_TO_RAD;
using constants::RAD_TO_DEG;

// ─── Internal helpers (file-local) ────────────────────────────────────────────

namespace {

/// Heliocentric ecliptic position (AU, J2000 ecliptic) from mean elements.
[[nodiscard]] Eigen::Vector3d
heliocentric_position(const OrbitalElements& el, double T) noexcept {
    const double a     = el.a    + el.a_rate    * T;
    const double e     = el.e    + el.e_rate    * T;
    const double incl  = el.i    + el.i_rate    * T;
    const double l     = el.l    + el.l_rate    * T;
    const double peri  = el.lp   + el.lp_rate   * T;
    const double node  = el.node + el.node_rate * T;

    const double arg_peri = peri - node;  // ω = ϖ − Ω
    const double mean_anomaly =
        BodyPositionCalculator::normalize_degrees(l - peri) * DEG_TO_RAD;
    const double E = BodyPositionCalculator::solve_kepler(mean_anomaly, e);

    // Position in the orbital plane, x towards perihelion.
    const Eigen::Vector3d in_plane{
        a * (std::cos(E) - e),
        a * std::sqrt(1.0 - e * e) * std::sin(E),
        0.0,
    };

    // Orbital plane → ecliptic: Rz(Ω) · Rx(i) · Rz(ω).
    const Eigen::Matrix3d rotation =
        (Eigen::AngleAxisd(node * DEG_TO_RAD, Eigen::Vector3d::UnitZ()) *
         Eigen::AngleAxisd(incl * DEG_TO_RAD, Eigen::Vector3d::UnitX()) *
         Eigen::AngleAxisd(arg_peri * DEG_TO_RAD, Eigen::Vector3d::UnitZ()))
            .toRotationMatrix();

    return rotation * in_plane;
}

}  // namespace

// ─── Angles and time ──────────────────────────────────────────────────────────

double BodyPositionCalculator::normalize_degrees(double degrees) noexcept {
    double wrapped = std::fmod(degrees, 360.0);
    if (wrapped < 0.0) wrapped += 360.0;
    // fmod of a tiny negative value can round back up to exactly 360.
    if (wrapped >= 360.0) wrapped = 0.0;
    return wrapped;
}

double BodyPositionCalculator::julian_centuries(double jd) noexcept {
    return (jd - constants::J2000_JD) / constants::DAYS_PER_CENTURY;
}

Sign BodyPositionCalculator::sign_of(double longitude) noexcept {
    const double lon    = normalize_degrees(longitude);
    const double within = std::fmod(lon, constants::SIGN_WIDTH_DEG);
    // lon − within is an exact multiple of 30; dividing lon itself can round
    // up into the next sign just below a boundary.
    return sign_from_index(static_cast<int>(
        std::lround((lon - within) / constants::SIGN_WIDTH_DEG)));
}

BodyPosition BodyPositionCalculator::to_position(Body body,
                                                 double longitude,
                                                 bool retrograde,
                                                 bool approximate) noexcept {
    const double lon = normalize_degrees(longitude);

    return BodyPosition{
        .body           = body,
        .longitude      = lon,
        .sign           = sign_of(lon),
        .degree_in_sign = std::fmod(lon, constants::SIGN_WIDTH_DEG),
        .is_retrograde  = retrograde,
        .approximate    = approximate,
    };
}

// ─── Sun ──────────────────────────────────────────────────────────────────────

double BodyPositionCalculator::sun_longitude(double jd) noexcept {
    const double days = jd - constants::J2000_JD;
    return normalize_degrees(constants::SUN_MEAN_LONGITUDE_J2000 +
                             constants::SUN_MEAN_DAILY_MOTION * days);
}

// ─── Moon ─────────────────────────────────────────────────────────────────────

LunarMeanElements BodyPositionCalculator::lunar_mean_elements(double jd) noexcept {
    const double T  = julian_centuries(jd);
    const double T2 = T * T;
    const double T3 = T2 * T;
    const double T4 = T3 * T;

    const double L0 = 218.3164477 + 481267.88123421 * T - 0.0015786 * T2
                    + T3 / 538841.0 - T4 / 65194000.0;
    const double M  = 134.9633964 + 477198.8675055 * T + 0.0087414 * T2
                    + T3 / 69699.0 - T4 / 14712000.0;
    const double F  = 93.2720950 + 483202.0175273 * T - 0.0036539 * T2
                    - T3 / 3526000.0 + T4 / 863310000.0;

    return LunarMeanElements{
        .mean_longitude       = normalize_degrees(L0),
        .mean_anomaly         = normalize_degrees(M),
        .argument_of_latitude = normalize_degrees(F),
    };
}

double BodyPositionCalculator::moon_longitude(double jd) noexcept {
    const auto el = lunar_mean_elements(jd);

    // Largest periodic terms: equation of centre on M and the 2L − M term.
    const double correction =
        constants::MOON_EQUATION_TERM * std::sin(el.mean_anomaly * DEG_TO_RAD) +
        constants::MOON_VARIATION_TERM *
            std::sin((2.0 * el.mean_longitude - el.mean_anomaly) * DEG_TO_RAD);

    return normalize_degrees(el.mean_longitude + correction);
}

// ─── Lunar nodes ──────────────────────────────────────────────────────────────

double BodyPositionCalculator::mean_node_longitude(double jd) noexcept {
    const double T  = julian_centuries(jd);
    const double T2 = T * T;
    const double T3 = T2 * T;
    const double T4 = T3 * T;

    const double omega = 125.0445479 - 1934.1362891 * T + 0.0020754 * T2
                       + T3 / 467441.0 - T4 / 60616000.0;
    return normalize_degrees(omega);
}

BodyPosition BodyPositionCalculator::south_node_of(const BodyPosition& north) noexcept {
    // Built from the north node's sign and degree so that the six-sign offset
    // holds exactly, whatever rounding `north.longitude + 180` would suffer.
    const Sign sign = sign_from_index(sign_index(north.sign) + 6);
    return BodyPosition{
        .body           = Body::SouthNode,
        .longitude      = sign_index(sign) * constants::SIGN_WIDTH_DEG + north.degree_in_sign,
        .sign           = sign,
        .degree_in_sign = north.degree_in_sign,
        .is_retrograde  = north.is_retrograde,
        .approximate    = north.approximate,
    };
}

// ─── Planets ──────────────────────────────────────────────────────────────────

std::optional<OrbitalElements>
BodyPositionCalculator::orbital_elements(Body body) noexcept {
    switch (body) {
        case Body::Mercury:
            return OrbitalElements{0.38709927, 0.00000037, 0.20563593, 0.00001906,
                                   7.00497902, -0.00594749, 252.25032350, 149472.67411175,
                                   77.45779628, 0.16047689, 48.33076593, -0.12534081};
        case Body::Venus:
            return OrbitalElements{0.72333566, 0.00000390, 0.00677672, -0.00004107,
                                   3.39467605, -0.00078890, 181.97909950, 58517.81538729,
                                   131.60246718, 0.00268329, 76.67984255, -0.27769418};
        case Body::Sun:  // Earth–Moon barycentre
            return OrbitalElements{1.00000261, 0.00000562, 0.01671123, -0.00004392,
                                   -0.00001531, -0.01294668, 100.46457166, 35999.37244981,
                                   102.93768193, 0.32327364, 0.0, 0.0};
        case Body::Mars:
            return OrbitalElements{1.52371034, 0.00001847, 0.09339410, 0.00007882,
                                   1.84969142, -0.00813131, -4.55343205, 19140.30268499,
                                   -23.94362959, 0.44441088, 49.55953891, -0.29257343};
        case Body::Jupiter:
            return OrbitalElements{5.20288700, -0.00011607, 0.04838624, -0.00013253,
                                   1.30439695, -0.00183714, 34.39644051, 3034.74612775,
                                   14.72847983, 0.21252668, 100.47390909, 0.20469106};
        case Body::Saturn:
            return OrbitalElements{9.53667594, -0.00125060, 0.05386179, -0.00050991,
                                   2.48599187, 0.00193609, 49.95424423, 1222.49362201,
                                   92.59887831, -0.41897216, 113.66242448, -0.28867794};
        case Body::Uranus:
            return OrbitalElements{19.18916464, -0.00196176, 0.04725744, -0.00004397,
                                   0.77263783, -0.00242939, 313.23810451, 428.48202785,
                                   170.95427630, 0.40805281, 74.01692503, 0.04240589};
        case Body::Neptune:
            return OrbitalElements{30.06992276, 0.00026291, 0.00859048, 0.00005105,
                                   1.77004347, 0.00035372, -55.12002969, 218.45945325,
                                   44.96476227, -0.32241464, 131.78422574, -0.00508664};
        case Body::Pluto:
            return OrbitalElements{39.48211675, -0.00031596, 0.24882730, 0.00005170,
                                   17.14001206, 0.00004818, 238.92903833, 145.20780515,
                                   224.06891629, -0.04062942, 110.30393684, -0.01183482};
        case Body::Moon:
        case Body::NorthNode:
        case Body::SouthNode:
            break;
    }
    return std::nullopt;
}

double BodyPositionCalculator::solve_kepler(double mean_anomaly_rad,
                                            double eccentricity) noexcept {
    constexpr int    MAX_ITERATIONS = 16;
    constexpr double TOLERANCE      = 1e-12;

    double E = mean_anomaly_rad + eccentricity * std::sin(mean_anomaly_rad);
    for (int k = 0; k < MAX_ITERATIONS; ++k) {
        const double f     = E - eccentricity * std::sin(E) - mean_anomaly_rad;
        const double f_dot = 1.0 - eccentricity * std::cos(E);
        const double step  = f / f_dot;
        E -= step;
        if (std::abs(step) < TOLERANCE) break;
    }
    return E;
}

std::optional<double>
BodyPositionCalculator::planet_longitude(Body body, double jd) noexcept {
    if (body == Body::Sun || !is_planet(body) || body == Body::Moon) {
        return std::nullopt;
    }

    const auto planet = orbital_elements(body);
    const auto earth  = orbital_elements(Body::Sun);
    if (!planet || !earth) return std::nullopt;

    const double T = julian_centuries(jd);
    const Eigen::Vector3d geocentric =
        heliocentric_position(*planet, T) - heliocentric_position(*earth, T);

    return normalize_degrees(std::atan2(geocentric.y(), geocentric.x()) * RAD_TO_DEG);
}

// ─── Retrograde approximation ─────────────────────────────────────────────────

double BodyPositionCalculator::retrograde_frequency(Body body) noexcept {
    switch (body) {
        case Body::Mercury: return 0.19;
        case Body::Venus:   return 0.07;
        case Body::Mars:    return 0.09;
        case Body::Jupiter: return 0.33;
        case Body::Saturn:  return 0.36;
        case Body::Uranus:  return 0.42;
        case Body::Neptune: return 0.43;
        case Body::Pluto:   return 0.41;
        default:            return 0.0;
    }
}

bool BodyPositionCalculator::approximate_retrograde(Body body,
                                                    int day_of_year) noexcept {
    const double frequency = retrograde_frequency(body);
    if (frequency <= 0.0) return false;

    const int name_length = static_cast<int>(std::strlen(to_string(body)));
    const int bucket = ((day_of_year * 17 + name_length) % 100 + 100) % 100;
    return static_cast<double>(bucket) < frequency * 100.0;
}

// ─── Sun sign date table ──────────────────────────────────────────────────────

Sign BodyPositionCalculator::sun_sign_for_date(int month, int day) noexcept {
    if ((month == 3 && day >= 21) || (month == 4 && day <= 19))  return Sign::Aries;
    if ((month == 4 && day >= 20) || (month == 5 && day <= 20))  return Sign::Taurus;
    if ((month == 5 && day >= 21) || (month == 6 && day <= 20))  return Sign::Gemini;
    if ((month == 6 && day >= 21) || (month == 7 && day <= 22))  return Sign::Cancer;
    if ((month == 7 && day >= 23) || (month == 8 && day <= 22))  return Sign::Leo;
    if ((month == 8 && day >= 23) || (month == 9 && day <= 22))  return Sign::Virgo;
    if ((month == 9 && day >= 23) || (month == 10 && day <= 22)) return Sign::Libra;
    if ((month == 10 && day >= 23) || (month == 11 && day <= 21)) return Sign::Scorpio;
    if ((month == 11 && day >= 22) || (month == 12 && day <= 21)) return Sign::Sagittarius;
    if ((month == 12 && day >= 22) || (month == 1 && day <= 19)) return Sign::Capricorn;
    if ((month == 1 && day >= 20) || (month == 2 && day <= 18))  return Sign::Aquarius;
    return Sign::Pisces;
}

// ─── BodyPositionCalculator::compute ──────────────────────────────────────────

BodySet BodyPositionCalculator::compute(const temporal::ResolvedMoment& moment) noexcept {
    const double jd = moment.julian_day;
    BodySet set{};

    for (std::size_t i = 0; i < PLANET_COUNT; ++i) {
        const Body body = PLANETS[i];
        double longitude = 0.0;
        switch (body) {
            case Body::Sun:  longitude = sun_longitude(jd);  break;
            case Body::Moon: longitude = moon_longitude(jd); break;
            default:         longitude = planet_longitude(body, jd).value_or(0.0); break;
        }
        set.planets[i] = to_position(body, longitude,
                                     approximate_retrograde(body, moment.day_of_year),
                                     /*approximate=*/true);
    }

    set.nodes[0] = to_position(Body::NorthNode, mean_node_longitude(jd), false, true);
    set.nodes[1] = south_node_of(set.nodes[0]);

    return set;
}

}  // namespace natal::ephemeris
