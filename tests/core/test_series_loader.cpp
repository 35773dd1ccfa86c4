/// @file tests/core/test_series_loader.cpp
/// @brief Unit tests for SeriesLoader.

#include "natal/series_loader.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <new>
#include <string>
#include <string_view>

using namespace natal::core;

namespace {

thread_local bool g_refuse_allocations = false;

}  // namespace

void* operator new(std::size_t size) {
    if (g_refuse_allocations) throw std::bad_alloc();
    if (void* p = std::malloc(size == 0 ? 1 : size)) return p;
    throw std::bad_alloc();
}

void operator delete(void* p) noexcept { std::free(p); }
void operator delete(void* p, std::size_t) noexcept { std::free(p); }

namespace {

const std::string VALID_CSV =
    "harmonic,frequency_hz,amplitude,ratio\n"
    "1,261.63,1.0,1.0\n"
    "2,523.25,0.5,2.0\n"
    "3,392.44,0.3,1.5\n";

}  // namespace

TEST(SeriesLoader, ParsesValidCsv) {
    const auto series = SeriesLoader::parse_csv_string(VALID_CSV);
    ASSERT_TRUE(series.has_value());
    ASSERT_EQ(series->partials.size(), 3u);
    EXPECT_DOUBLE_EQ(series->fundamental_hz, 261.63);
    EXPECT_EQ(series->partials[2].harmonic_number, 3);
    EXPECT_DOUBLE_EQ(series->partials[2].ratio_to_fundamental, 1.5);
}

TEST(SeriesLoader, SkipsMalformedRows) {
    const std::string csv =
        "harmonic,frequency_hz,amplitude,ratio\n"
        "# comment\n"
        "1,261.63,1.0,1.0\n"
        "two,523.25,0.5,2.0\n"
        "3,392.44,0.3\n"
        "4,-10,0.3,1.33\n"
        "5,436.05,0.2,1.667,extra\n"
        "0,100,0.2,1.0\n"
        "\n"
        "6,nan,0.2,2.5\n"
        "7,457.85,0.1,1.75\r\n";
    const auto series = SeriesLoader::parse_csv_string(csv);
    ASSERT_TRUE(series.has_value());
    ASSERT_EQ(series->partials.size(), 2u);
    EXPECT_EQ(series->partials[0].harmonic_number, 1);
    EXPECT_EQ(series->partials[1].harmonic_number, 7);
}

TEST(SeriesLoader, ClampsAmplitude) {
    const auto series = SeriesLoader::parse_csv_string(
        "harmonic,frequency_hz,amplitude,ratio\n"
        "1,100,1.7,1.0\n"
        "2,200,-0.4,2.0\n");
    ASSERT_TRUE(series.has_value());
    EXPECT_DOUBLE_EQ(series->partials[0].amplitude, 1.0);
    EXPECT_DOUBLE_EQ(series->partials[1].amplitude, 0.0);
}

TEST(SeriesLoader, FundamentalFromFirstRowWithoutHarmonicOne) {
    const auto series = SeriesLoader::parse_csv_string(
        "harmonic,frequency_hz,amplitude,ratio\n"
        "3,330,0.4,1.5\n"
        "2,440,0.6,2.0\n");
    ASSERT_TRUE(series.has_value());
    EXPECT_DOUBLE_EQ(series->fundamental_hz, 220.0);
}

TEST(SeriesLoader, NoValidRowsYieldsNullopt) {
    EXPECT_FALSE(SeriesLoader::parse_csv_string("").has_value());
    EXPECT_FALSE(SeriesLoader::parse_csv_string("harmonic,frequency_hz,amplitude,ratio\n")
                     .has_value());
    EXPECT_FALSE(SeriesLoader::parse_csv_string("harmonic,frequency_hz,amplitude,ratio\n"
                                                "x,y,z,w\n")
                     .has_value());
}

TEST(SeriesLoader, MissingFile) {
    EXPECT_FALSE(SeriesLoader::load_csv("/nonexistent/natal/series.csv").has_value());
}

TEST(SeriesLoader, LoadsFromDisk) {
    const std::string path = ::testing::TempDir() + "natal_series_test.csv";
    {
        std::ofstream out(path);
        out << VALID_CSV;
    }
    const auto series = SeriesLoader::load_csv(path);
    std::remove(path.c_str());

    ASSERT_TRUE(series.has_value());
    EXPECT_EQ(series->partials.size(), 3u);
}

TEST(SeriesLoader, OutOfMemoryYieldsNullopt) {
    static_assert(noexcept(SeriesLoader::parse_csv_string(std::string_view{})));
    static_assert(noexcept(SeriesLoader::load_csv(std::string{})));

    g_refuse_allocations = true;
    const auto series = SeriesLoader::parse_csv_string(VALID_CSV);
    g_refuse_allocations = false;

    EXPECT_FALSE(series.has_value());
    EXPECT_TRUE(SeriesLoader::parse_csv_string(VALID_CSV).has_value());
}

TEST(SeriesLoader, ParsesLargeSeries) {
    std::string csv = "harmonic,frequency_hz,amplitude,ratio\n";
    for (int h = 1; h <= 20000; ++h) {
        csv += std::to_string(h) + "," + std::to_string(100.0 * h) + ",0.5," +
               std::to_string(static_cast<double>(h)) + "\n";
    }
    const auto series = SeriesLoader::parse_csv_string(csv);
    ASSERT_TRUE(series.has_value());
    EXPECT_EQ(series->partials.size(), 20000u);
    EXPECT_DOUBLE_EQ(series->fundamental_hz, 100.0);
}
