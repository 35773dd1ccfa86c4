/**
 * @file  fuzz_temporal.cpp
 * @brief libFuzzer target for TemporalResolver::resolve
 *
 * Build:
 *   cmake -DNATAL_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_temporal
 *
 * Run for 60 seconds:
 *   ./fuzz_temporal -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort.
 *   2. If a moment is returned:
 *      a. month ∈ [1, 12], day within the month, hour ∈ [0, 23], minute ∈ [0, 59]
 *      b. day_of_year ∈ [1, 366]
 *      c. julian_day is finite
 *      d. latitude ∈ [−90, 90], longitude ∈ [−180, 180]
 *
 * Fuzzer strategy:
 *   The input is split on the first two NUL bytes into date, time and
 *   location strings, so the parsers see arbitrary bytes: stray signs,
 *   overlong digit runs, "am"/"pm" fragments and embedded whitespace.
 */

#include <cstddef>
#include <cstdint>
#include <cassert>
#include <cmath>
#include <string>
#include <string_view>

#include "natal/temporal.hpp"

using namespace natal::temporal;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view input(reinterpret_cast<const char*>(data), size);

    const auto first  = input.find('\0');
    const auto second = first == std::string_view::npos ? first : input.find('\0', first + 1);

    BirthMoment birth;
    birth.date = std::string(input.substr(0, first));
    if (first != std::string_view::npos) {
        birth.local_time = std::string(input.substr(first + 1, second - first - 1));
    }
    if (second != std::string_view::npos) {
        birth.location_name = std::string(input.substr(second + 1));
    }

    const auto moment = TemporalResolver::resolve(birth);
    if (!moment.has_value()) return 0;

    assert(moment->date.month >= 1 && moment->date.month <= 12);
    assert(moment->date.day >= 1 &&
           moment->date.day <= TemporalResolver::days_in_month(moment->date.year,
                                                               moment->date.month));
    assert(moment->time.hour >= 0 && moment->time.hour <= 23);
    assert(moment->time.minute >= 0 && moment->time.minute <= 59);
    assert(moment->day_of_year >= 1 && moment->day_of_year <= 366);
    assert(std::isfinite(moment->julian_day));
    assert(moment->latitude >= -90.0 && moment->latitude <= 90.0);
    assert(moment->longitude >= -180.0 && moment->longitude <= 180.0);

    return 0;
}
