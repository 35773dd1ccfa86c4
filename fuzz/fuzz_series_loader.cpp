/**
 * @file  fuzz_series_loader.cpp
 * @brief libFuzzer target for SeriesLoader::parse_csv_string
 *
 * Build:
 *   cmake -DNATAL_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_series_loader
 *
 * Run for 60 seconds:
 *   ./fuzz_series_loader -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. If a series is returned:
 *      a. at least one partial
 *      b. every harmonic number ≥ 1
 *      c. every frequency and ratio finite and > 0
 *      d. every amplitude ∈ [0, 1]
 *      e. fundamental finite and > 0
 *   3. Correlating the series against a fixed aspect set never yields a
 *      strength outside [0, 1].
 *
 * Fuzzer strategy:
 *   Input is passed directly as CSV text, covering binary garbage, "nan" and
 *   "inf" tokens, missing or extra fields, CR line endings and huge exponents.
 */

#include <cstddef>
#include <cstdint>
#include <cassert>
#include <cmath>
#include <string_view>
#include <vector>

#include "natal/harmonics.hpp"
#include "natal/series_loader.hpp"

using namespace natal;
using namespace natal::harmonics;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view text(reinterpret_cast<const char*>(data), size);

    const auto series = core::SeriesLoader::parse_csv_string(text);
    if (!series.has_value()) return 0;

    assert(!series->partials.empty());
    assert(std::isfinite(series->fundamental_hz) && series->fundamental_hz > 0.0);
    for (const auto& p : series->partials) {
        assert(p.harmonic_number >= 1);
        assert(std::isfinite(p.frequency_hz) && p.frequency_hz > 0.0);
        assert(std::isfinite(p.ratio_to_fundamental) && p.ratio_to_fundamental > 0.0);
        assert(p.amplitude >= 0.0 && p.amplitude <= 1.0);
    }

    std::vector<Aspect> aspects;
    for (const auto& row : HarmonicMapper::ratio_table()) {
        aspects.push_back(Aspect{
            .body_a         = Body::Sun,
            .body_b         = Body::Moon,
            .kind           = row.kind,
            .separation     = row.angle_degrees,
            .orb            = 0.0,
            .exact          = true,
            .strength       = AspectStrength::Strong,
            .interpretation = {},
        });
    }
    const auto correlations = HarmonicMapper::correlate(aspects, *series);
    for (const auto& c : correlations) {
        assert(c.match_strength >= 0.0 && c.match_strength <= 1.0);
    }
    const double score = HarmonicMapper::resonance_score(correlations);
    assert(score >= 0.0 && score <= 1.0);

    return 0;
}
