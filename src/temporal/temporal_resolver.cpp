/// @file src/temporal/temporal_resolver.cpp
/// @brief TemporalResolver: civil date/time/place to Julian Day and coordinates.

#include "natal/temporal.hpp"
#include "natal/constants.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <string>

namespace natal::temporal {

// ─── Internal helpers (file-local) ────────────────────────────────────────────

namespace {

struct GazetteerEntry {
    std::string_view key;  ///< Lower-case substring to look for
    double latitude;
    double longitude;
};

/// Known places. First substring match wins, so order matters.
constexpr std::array<GazetteerEntry, 9> GAZETTEER{{
    {"ottawa",      45.4215,  -75.6972},
    {"toronto",     43.6532,  -79.3832},
    {"vancouver",   49.2827, -123.1207},
    {"montreal",    45.5017,  -73.5673},
    {"new york",    40.7128,  -74.0060},
    {"london",      51.5074,   -0.1278},
    {"paris",       48.8566,    2.3522},
    {"sydney",     -33.8688,  151.2093},
    {"los angeles", 34.0522, -118.2437},
}};

[[nodiscard]] std::string_view trim(std::string_view s) noexcept {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

[[nodiscard]] std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

/// Parse an all-digit field of exactly `width` characters (0 = any width ≥ 1).
[[nodiscard]] std::optional<int> parse_digits(std::string_view s,
                                              std::size_t width = 0) noexcept {
    if (s.empty()) return std::nullopt;
    if (width != 0 && s.size() != width) return std::nullopt;
    if (!std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    int value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
    return value;
}

[[nodiscard]] bool is_leap_year(int year) noexcept {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

}  // namespace

// ─── TemporalResolver::days_in_month ──────────────────────────────────────────

int TemporalResolver::days_in_month(int year, int month) noexcept {
    static constexpr std::array<int, 12> DAYS{31, 28, 31, 30, 31, 30,
                                              31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) return 0;
    if (month == 2 && is_leap_year(year)) return 29;
    return DAYS[static_cast<std::size_t>(month - 1)];
}

// ─── TemporalResolver::parse_date ─────────────────────────────────────────────

std::optional<CivilDate>
TemporalResolver::parse_date(std::string_view text) noexcept {
    const auto s = trim(text);
    if (s.size() != 10 || s[4] != '-' || s[7] != '-') {
        return std::nullopt;
    }

    const auto year  = parse_digits(s.substr(0, 4), 4);
    const auto month = parse_digits(s.substr(5, 2), 2);
    const auto day   = parse_digits(s.substr(8, 2), 2);
    if (!year || !month || !day) return std::nullopt;

    if (*month < 1 || *month > 12) return std::nullopt;
    if (*day < 1 || *day > days_in_month(*year, *month)) return std::nullopt;

    return CivilDate{.year = *year, .month = *month, .day = *day};
}

// ─── TemporalResolver::parse_time ─────────────────────────────────────────────

std::optional<ClockTime>
TemporalResolver::parse_time(std::string_view text) noexcept {
    std::string s;
    try {
        s = to_lower(trim(text));
    } catch (const std::bad_alloc&) {
        return std::nullopt;
    }

    // Detect and strip a trailing meridiem.
    enum class Meridiem { None, Am, Pm };
    Meridiem meridiem = Meridiem::None;
    std::string_view body(s);
    if (body.size() >= 2) {
        const auto tail = body.substr(body.size() - 2);
        if (tail == "am" || tail == "pm") {
            meridiem = (tail == "pm") ? Meridiem::Pm : Meridiem::Am;
            body = trim(body.substr(0, body.size() - 2));
        }
    }
    if (body.empty()) return std::nullopt;

    std::optional<int> hour;
    std::optional<int> minute;
    const auto colon = body.find(':');
    if (colon == std::string_view::npos) {
        // Bare hour is only meaningful with a meridiem ("3 pm").
        if (meridiem == Meridiem::None) return std::nullopt;
        hour   = parse_digits(body);
        minute = 0;
    } else {
        hour   = parse_digits(body.substr(0, colon));
        minute = parse_digits(body.substr(colon + 1), 2);
    }
    if (!hour || !minute) return std::nullopt;
    if (*minute < 0 || *minute > 59) return std::nullopt;

    int h = *hour;
    switch (meridiem) {
        case Meridiem::None:
            if (h < 0 || h > 23) return std::nullopt;
            break;
        case Meridiem::Am:
            if (h < 1 || h > 12) return std::nullopt;
            if (h == 12) h = 0;
            break;
        case Meridiem::Pm:
            if (h < 1 || h > 12) return std::nullopt;
            if (h != 12) h += 12;
            break;
    }

    return ClockTime{.hour = h, .minute = *minute};
}

// ─── TemporalResolver::julian_day_number ──────────────────────────────────────

long TemporalResolver::julian_day_number(const CivilDate& date) noexcept {
    // Fliegel–Van Flandern style: shift the year so March is month 0 and
    // leap days fall at the end of the computational year.
    const long a = (14 - date.month) / 12;
    const long y = date.year + 4800 - a;
    const long m = date.month + 12 * a - 3;

    return date.day
         + (153 * m + 2) / 5
         + 365 * y
         + y / 4
         - y / 100
         + y / 400
         - 32045;
}

// ─── TemporalResolver::julian_day ─────────────────────────────────────────────

double TemporalResolver::julian_day(const CivilDate& date,
                                     const ClockTime& time) noexcept {
    // The JDN of a civil date refers to its noon.
    return static_cast<double>(julian_day_number(date))
         + (time.decimal_hours() - 12.0) / 24.0;
}

// ─── TemporalResolver::day_of_year ────────────────────────────────────────────

int TemporalResolver::day_of_year(const CivilDate& date) noexcept {
    int ordinal = date.day;
    for (int m = 1; m < date.month; ++m) {
        ordinal += days_in_month(date.year, m);
    }
    return ordinal;
}

// ─── TemporalResolver::lookup_location ────────────────────────────────────────

LocationFix TemporalResolver::lookup_location(std::string_view name) noexcept {
    std::string needle;
    try {
        needle = to_lower(name);
    } catch (const std::bad_alloc&) {
        needle.clear();
    }

    for (const auto& entry : GAZETTEER) {
        if (needle.find(entry.key) != std::string::npos) {
            return LocationFix{
                .latitude  = entry.latitude,
                .longitude = entry.longitude,
                .known     = true,
            };
        }
    }

    return LocationFix{
        .latitude  = constants::DEFAULT_LATITUDE,
        .longitude = constants::DEFAULT_LONGITUDE,
        .known     = false,
    };
}

// ─── TemporalResolver::resolve ────────────────────────────────────────────────

std::optional<ResolvedMoment>
TemporalResolver::resolve(const BirthMoment& moment) noexcept {
    const auto date = parse_date(moment.date);
    if (!date) {
        spdlog::warn("format error: unparseable birth date '{}'", moment.date);
        return std::nullopt;
    }

    const auto time = parse_time(moment.local_time);
    if (!time) {
        spdlog::warn("format error: unparseable birth time '{}'", moment.local_time);
        return std::nullopt;
    }

    const LocationFix fix = lookup_location(moment.location_name);
    if (!fix.known) {
        spdlog::warn("unknown location '{}', using default coordinate ({}, {})",
                     moment.location_name, fix.latitude, fix.longitude);
    }

    const double jd = julian_day(*date, *time);
    spdlog::debug("resolved {} {} → JD {:.5f}, lat {:.4f}, lon {:.4f}",
                  moment.date, moment.local_time, jd, fix.latitude, fix.longitude);

    return ResolvedMoment{
        .source         = moment,
        .date           = *date,
        .time           = *time,
        .day_of_year    = day_of_year(*date),
        .julian_day     = jd,
        .latitude       = fix.latitude,
        .longitude      = fix.longitude,
        .location_known = fix.known,
    };
}

}  // namespace natal::temporal
