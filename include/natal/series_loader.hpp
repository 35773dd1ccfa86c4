#pragma once

/// @file include/natal/series_loader.hpp
/// @brief CSV loader for a song's harmonic series.
///
/// # Module: SeriesLoader
///
/// ## Expected CSV Format
/// ```
/// harmonic,frequency_hz,amplitude,ratio
/// 1,261.63,1.0,1.0
/// 3,392.44,0.3,1.5
/// ```
/// The first non-comment line is a header and is skipped. Lines starting
/// with `#` are comments.
///
/// ## Rules
/// - Rows with a missing, non-numeric or non-finite field, a harmonic number
///   below 1, or a non-positive frequency or ratio are skipped
/// - Amplitudes are clamped into [0, 1]
/// - The fundamental is the frequency of harmonic 1 when present, otherwise
///   the first row's frequency divided by its ratio

#include "natal/harmonics.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace natal::core {

/// Loads song harmonic series from CSV.
class SeriesLoader {
public:
    SeriesLoader() = delete;

    /// Load a series from a CSV file.
    ///
    /// # Returns
    /// `nullopt` if the file cannot be opened, holds no valid row or does
    /// not fit in memory.
    [[nodiscard]] static std::optional<harmonics::SongHarmonicSeries>
    load_csv(const std::string& filepath) noexcept;

    /// Parse a series from CSV text.
    ///
    /// # Returns
    /// `nullopt` when no valid row remains after skipping malformed ones, or
    /// when an allocation fails.
    [[nodiscard]] static std::optional<harmonics::SongHarmonicSeries>
    parse_csv_string(std::string_view csv_content) noexcept;

    /// Parse one data row.
    [[nodiscard]] static std::optional<harmonics::HarmonicPartial>
    parse_row(std::string_view line) noexcept;

private:
    /// `parse_csv_string` without the allocation guard.
    static std::optional<harmonics::SongHarmonicSeries>
    parse_lines(std::string_view csv_content);
};

}  // namespace natal::core
