/**
 * @file  fuzz_pattern.cpp
 * @brief libFuzzer target for PatternClassifier and AspectEngine
 *
 * Build:
 *   cmake -DNATAL_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_pattern
 *
 * Run for 60 seconds:
 *   ./fuzz_pattern -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort.
 *   2. classify() always returns one of the seven patterns.
 *   3. For finite inputs, the circular gaps sum to 360°.
 *   4. Every separation of finite inputs lies in [0, 180] and any matched
 *      aspect keeps its orb within the allowed orb.
 *
 * Fuzzer strategy:
 *   The input bytes are interpreted as raw doubles via memcpy, exercising
 *   NaN, ±Inf, ±0, denormals and huge magnitudes.
 */

#include <cstddef>
#include <cstdint>
#include <cassert>
#include <cmath>
#include <vector>

#include "natal/aspects.hpp"
#include "natal/pattern.hpp"

using namespace natal;
using namespace natal::aspects;
using namespace natal::pattern;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const size_t n_doubles = size / sizeof(double);
    std::vector<double> longitudes;
    longitudes.reserve(n_doubles);
    for (size_t i = 0; i < n_doubles; ++i) {
        double val{};
        __builtin_memcpy(&val, data + i * sizeof(double), sizeof(double));
        longitudes.push_back(val);
    }

    const ChartPattern p = PatternClassifier::classify(longitudes);
    assert(static_cast<int>(p) >= static_cast<int>(ChartPattern::Bucket));
    assert(static_cast<int>(p) <= static_cast<int>(ChartPattern::Splay));

    bool all_finite = true;
    for (const double v : longitudes) all_finite = all_finite && std::isfinite(v);
    if (!all_finite) return 0;

    if (longitudes.size() >= 2) {
        const auto gaps = PatternClassifier::circular_gaps(longitudes);
        assert(std::abs(gaps.sum() - 360.0) < 1e-6);
    }

    for (size_t i = 1; i < longitudes.size(); ++i) {
        const double sep = AspectEngine::separation(longitudes[i - 1], longitudes[i]);
        assert(sep >= 0.0 && sep <= 180.0);
        if (const auto match = AspectEngine::classify(sep)) {
            assert(match->orb <= AspectEngine::allowed_orb(match->kind));
        }
    }

    return 0;
}
