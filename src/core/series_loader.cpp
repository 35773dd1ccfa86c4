/// @file src/core/series_loader.cpp
/// @brief SeriesLoader: CSV harmonic series for the resonance command.

#include "natal/series_loader.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <charconv>
#include <cmath>
#include <fstream>
#include <new>
#include <sstream>
#include <string>

namespace natal::core {

namespace {

[[nodiscard]] std::string_view trim(std::string_view s) noexcept {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

template <typename T>
[[nodiscard]] std::optional<T> parse_number(std::string_view token) noexcept {
    token = trim(token);
    if (token.empty()) return std::nullopt;
    T value{};
    auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
    if (ec != std::errc{} || ptr != token.data() + token.size()) return std::nullopt;
    return value;
}

}  // namespace

// ─── SeriesLoader::parse_row ──────────────────────────────────────────────────

std::optional<harmonics::HarmonicPartial>
SeriesLoader::parse_row(std::string_view line) noexcept {
    line = trim(line);
    if (line.empty() || line.front() == '#') return std::nullopt;

    std::array<std::string_view, 4> fields{};
    std::size_t count = 0;
    while (true) {
        const auto comma = line.find(',');
        if (count == fields.size()) return std::nullopt;  // too many columns
        fields[count++] = line.substr(0, comma);
        if (comma == std::string_view::npos) break;
        line.remove_prefix(comma + 1);
    }
    if (count != fields.size()) return std::nullopt;

    const auto harmonic  = parse_number<int>(fields[0]);
    const auto frequency = parse_number<double>(fields[1]);
    const auto amplitude = parse_number<double>(fields[2]);
    const auto ratio     = parse_number<double>(fields[3]);
    if (!harmonic || !frequency || !amplitude || !ratio) return std::nullopt;

    if (*harmonic < 1) return std::nullopt;
    if (!std::isfinite(*frequency) || *frequency <= 0.0) return std::nullopt;
    if (!std::isfinite(*ratio) || *ratio <= 0.0) return std::nullopt;
    if (!std::isfinite(*amplitude)) return std::nullopt;

    return harmonics::HarmonicPartial{
        .harmonic_number      = *harmonic,
        .frequency_hz         = *frequency,
        .amplitude            = std::clamp(*amplitude, 0.0, 1.0),
        .ratio_to_fundamental = *ratio,
    };
}

// ─── SeriesLoader::parse_csv_string ──────────────────────────────────────────

std::optional<harmonics::SongHarmonicSeries>
SeriesLoader::parse_csv_string(std::string_view csv_content) noexcept {
    try {
        return parse_lines(csv_content);
    } catch (const std::bad_alloc&) {
        return std::nullopt;
    }
}

std::optional<harmonics::SongHarmonicSeries>
SeriesLoader::parse_lines(std::string_view csv_content) {
    harmonics::SongHarmonicSeries series;
    bool header_skipped = false;
    std::size_t skipped = 0;

    while (!csv_content.empty()) {
        const auto newline = csv_content.find('\n');
        const auto line    = trim(csv_content.substr(0, newline));
        csv_content.remove_prefix(newline == std::string_view::npos ? csv_content.size()
                                                                    : newline + 1);

        if (line.empty() || line.front() == '#') continue;
        if (!header_skipped) {
            header_skipped = true;
            continue;
        }

        if (auto partial = parse_row(line)) {
            series.partials.push_back(*partial);
        } else {
            ++skipped;
        }
    }

    if (skipped > 0) {
        spdlog::warn("skipped {} malformed harmonic row(s)", skipped);
    }
    if (series.partials.empty()) return std::nullopt;

    const auto first_harmonic = std::find_if(
        series.partials.begin(), series.partials.end(),
        [](const harmonics::HarmonicPartial& p) { return p.harmonic_number == 1; });
    series.fundamental_hz = first_harmonic != series.partials.end()
        ? first_harmonic->frequency_hz
        : series.partials.front().frequency_hz / series.partials.front().ratio_to_fundamental;

    return series;
}

// ─── SeriesLoader::load_csv ──────────────────────────────────────────────────

std::optional<harmonics::SongHarmonicSeries>
SeriesLoader::load_csv(const std::string& filepath) noexcept {
    std::ifstream file;
    try {
        file.open(filepath);
    } catch (const std::bad_alloc&) {
        return std::nullopt;
    }
    if (!file.is_open()) {
        spdlog::warn("cannot open harmonic series '{}'", filepath);
        return std::nullopt;
    }

    std::string contents;
    try {
        std::ostringstream buffer;
        buffer << file.rdbuf();
        contents = buffer.str();
    } catch (const std::bad_alloc&) {
        return std::nullopt;
    }
    return parse_csv_string(contents);
}

}  // namespace natal::core
