#pragma once

/// @file include/natal/temporal.hpp
/// @brief Temporal Resolver: birth date, clock time and place to Julian Day
///        and geographic coordinates.
///
/// # Module: Temporal Resolver
///
/// ## Responsibility
/// Turn the three strings a caller knows about a birth (date, local clock
/// time, place name) into the numbers every calculator downstream needs: a
/// Julian Day and a latitude/longitude pair.
///
/// ## Conventions
/// - Dates are proleptic Gregorian `YYYY-MM-DD`.
/// - Times are either 12-hour (`2:30 pm`, `12 am`) or 24-hour (`14:30`).
///   12-hour conversion: 12 am → 0h, 12 pm → 12h, other pm hours add 12.
/// - The clock time is used as given; no time-zone correction is applied.
/// - Julian Day = JDN + (hour − 12) / 24, where JDN is the integer day
///   number of the civil date (which starts at noon).
/// - Longitude is east-positive, latitude north-positive.
///
/// ## Guarantees
/// - Only an unparseable date or time fails (`std::nullopt`)
/// - Unknown places never fail: they resolve to the Ottawa default with
///   `location_known == false`
/// - No wall-clock reads; equal inputs give equal outputs

#include <optional>
#include <string>
#include <string_view>

namespace natal::temporal {

// ─── Inputs ───────────────────────────────────────────────────────────────────

/// What the caller supplies about a birth.
struct BirthMoment {
    std::string date;           ///< "YYYY-MM-DD"
    std::string local_time;     ///< "h:mm am|pm", "h am|pm" or "HH:MM"
    std::string location_name;  ///< Free-text place, e.g. "New York, USA"

    bool operator==(const BirthMoment&) const = default;
};

/// Parsed civil calendar date.
struct CivilDate {
    int year;
    int month;  ///< 1–12
    int day;    ///< 1–31

    bool operator==(const CivilDate&) const = default;
};

/// Parsed 24-hour clock time.
struct ClockTime {
    int hour;    ///< 0–23
    int minute;  ///< 0–59

    /// Hours as a decimal fraction, e.g. 14:30 → 14.5.
    [[nodiscard]] double decimal_hours() const noexcept {
        return static_cast<double>(hour) + static_cast<double>(minute) / 60.0;
    }

    bool operator==(const ClockTime&) const = default;
};

/// Coordinates resolved for a place name.
struct LocationFix {
    double latitude;   ///< Degrees, north positive
    double longitude;  ///< Degrees, east positive
    bool   known;      ///< false when the default coordinate was substituted

    bool operator==(const LocationFix&) const = default;
};

// ─── Output ───────────────────────────────────────────────────────────────────

/// A birth moment after resolution. Immutable once produced.
struct ResolvedMoment {
    BirthMoment source;         ///< Inputs as supplied
    CivilDate   date;
    ClockTime   time;
    int         day_of_year;    ///< 1-based ordinal day of `date`
    double      julian_day;
    double      latitude;
    double      longitude;
    bool        location_known;

    bool operator==(const ResolvedMoment&) const = default;
};

// ─── TemporalResolver ─────────────────────────────────────────────────────────

/// Stateless resolver from civil strings to astronomical time and place.
class TemporalResolver {
public:
    TemporalResolver() = delete;

    /// Parse a strict `YYYY-MM-DD` date.
    ///
    /// # Returns
    /// `nullopt` when the text is malformed or names a day that does not exist
    /// (e.g. 2023-02-29).
    [[nodiscard]] static std::optional<CivilDate>
    parse_date(std::string_view text) noexcept;

    /// Parse a 12-hour (`h[:mm] am|pm`) or 24-hour (`HH:MM`) clock time.
    ///
    /// Case-insensitive; surrounding whitespace and a space before the
    /// meridiem are tolerated.
    ///
    /// # Returns
    /// `nullopt` when the text is malformed or out of range.
    [[nodiscard]] static std::optional<ClockTime>
    parse_time(std::string_view text) noexcept;

    /// Integer Julian Day Number of a civil date (floor-based formula).
    [[nodiscard]] static long julian_day_number(const CivilDate& date) noexcept;

    /// Julian Day of a civil date and clock time, measured from noon.
    [[nodiscard]] static double julian_day(const CivilDate& date,
                                           const ClockTime& time) noexcept;

    /// 1-based ordinal day within the year.
    [[nodiscard]] static int day_of_year(const CivilDate& date) noexcept;

    /// Number of days in a month, honouring Gregorian leap years.
    [[nodiscard]] static int days_in_month(int year, int month) noexcept;

    /// Look a place up in the fixed gazetteer (case-insensitive substring).
    ///
    /// Never fails: unmatched names return the default coordinate with
    /// `known == false`.
    [[nodiscard]] static LocationFix lookup_location(std::string_view name) noexcept;

    /// Resolve a full birth moment.
    ///
    /// # Returns
    /// `nullopt` only when the date or time cannot be parsed (FormatError).
    [[nodiscard]] static std::optional<ResolvedMoment>
    resolve(const BirthMoment& moment) noexcept;
};

}  // namespace natal::temporal
