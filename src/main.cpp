/// @file src/main.cpp
/// @brief natal CLI entry point.
///
/// Usage:
///   natal --chart <date> <time> <location>                  Print a natal chart
///   natal --resonate <date> <time> <location> <series.csv>  Chart vs song harmonics
///   natal --help                                            Print usage
///
/// `--verbose` enables debug logging; `--quiet` silences warnings; `--weighted`
/// switches resonance matching to amplitude and aspect-importance weighting.

#include "natal/engine.hpp"
#include "natal/series_loader.hpp"

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <optional>
#include <string>
#include <vector>

namespace {

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  natal --chart <date> <time> <location>\n"
        "  natal --resonate <date> <time> <location> <series.csv>\n"
        "  natal --help\n"
        "\n"
        "Options:\n"
        "  --verbose   Debug logging\n"
        "  --quiet     Errors only\n"
        "  --weighted  Weight resonance by amplitude and aspect importance\n"
        "\n"
        "Date: YYYY-MM-DD   Time: \"2:30 pm\" or 14:30   Location: e.g. \"New York, USA\"\n"
        "Series CSV format (header required):\n"
        "  harmonic,frequency_hz,amplitude,ratio\n"
    );
}

/// Build a chart, printing it when `print` is set.
std::optional<natal::core::Chart>
build_chart(const natal::core::ChartEngine& engine,
            const std::vector<std::string>& args, bool print) {
    const natal::temporal::BirthMoment birth{
        .date          = args[0],
        .local_time    = args[1],
        .location_name = args[2],
    };

    auto chart = engine.compute_chart(birth);
    if (!chart) {
        fmt::print(stderr, "Error: cannot parse date '{}' or time '{}'\n",
                   birth.date, birth.local_time);
        return std::nullopt;
    }
    if (print) fmt::print("{}", chart->to_string());
    return chart;
}

/// Returns 0 on success, 1 on error.
int run_chart(const natal::core::ChartEngine& engine,
              const std::vector<std::string>& args) {
    return build_chart(engine, args, true) ? 0 : 1;
}

/// Returns 0 on success, 1 on error.
int run_resonate(const natal::core::ChartEngine& engine,
                 const std::vector<std::string>& args) {
    const auto series = natal::core::SeriesLoader::load_csv(args[3]);
    if (!series) {
        fmt::print(stderr, "Error: no valid harmonic rows loaded from '{}'\n", args[3]);
        return 1;
    }
    fmt::print("Loaded {} partials (fundamental {:.2f} Hz) from '{}'\n",
               series->partials.size(), series->fundamental_hz, args[3]);

    const auto chart = build_chart(engine, args, false);
    if (!chart) return 1;

    fmt::print("Sun {}  Moon {}  Rising {}  ({} aspects)\n",
               natal::to_string(chart->sun_sign()), natal::to_string(chart->moon_sign()),
               natal::to_string(chart->rising), chart->aspects.size());
    const auto report = engine.resonate(*chart, *series);
    fmt::print("{}", report.to_string());
    if (!report.dominant.empty()) {
        fmt::print("Strongest: {}\n", report.dominant.front().explanation);
    }
    return 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    natal::core::EngineConfig config;
    auto log_level = spdlog::level::info;
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        const std::string arg(argv[i]);
        if (arg == "--verbose") {
            log_level = spdlog::level::debug;
        } else if (arg == "--quiet") {
            log_level = spdlog::level::err;
        } else if (arg == "--weighted") {
            config.correlation = natal::harmonics::CorrelationConfig::weighted();
        } else {
            args.push_back(arg);
        }
    }

    spdlog::set_level(log_level);

    if (args.empty()) {
        print_usage();
        return 1;
    }

    const std::string mode = args.front();
    args.erase(args.begin());

    if (mode == "--help" || mode == "-h") {
        print_usage();
        return 0;
    }

    const natal::core::ChartEngine engine(config);

    if (mode == "--chart") {
        if (args.size() != 3) {
            fmt::print(stderr, "Error: --chart requires <date> <time> <location>\n");
            print_usage();
            return 1;
        }
        return run_chart(engine, args);
    }

    if (mode == "--resonate") {
        if (args.size() != 4) {
            fmt::print(stderr,
                       "Error: --resonate requires <date> <time> <location> <series.csv>\n");
            print_usage();
            return 1;
        }
        return run_resonate(engine, args);
    }

    fmt::print(stderr, "Unknown option: {}\n", mode);
    print_usage();
    return 1;
}
