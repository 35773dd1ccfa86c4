/// @file src/core/position_source.cpp
/// @brief Approximate and external position sources, schema check, fallback.

#include "natal/position_source.hpp"
#include "natal/constants.hpp"
#include "natal/ephemeris.hpp"
#include "natal/houses.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cmath>
#include <exception>
#include <future>
#include <system_error>
#include <thread>

namespace natal::core {

// ─── Internal helpers (file-local) ────────────────────────────────────────────

namespace {

constexpr double DEGREE_TOLERANCE = 1e-6;

[[nodiscard]] bool valid_angle(double degrees) noexcept {
    return std::isfinite(degrees) && degrees >= 0.0 && degrees < 360.0;
}

[[nodiscard]] bool valid_position(const BodyPosition& p, Body expected) noexcept {
    if (p.body != expected) return false;
    if (!valid_angle(p.longitude)) return false;
    if (!std::isfinite(p.degree_in_sign) || p.degree_in_sign < 0.0 ||
        p.degree_in_sign >= constants::SIGN_WIDTH_DEG) {
        return false;
    }
    const double expected_degree =
        p.longitude - sign_index(p.sign) * constants::SIGN_WIDTH_DEG;
    return std::abs(expected_degree - p.degree_in_sign) <= DEGREE_TOLERANCE;
}

}  // namespace

// ─── validate_positions ───────────────────────────────────────────────────────

bool validate_positions(const PositionSet& set) noexcept {
    for (std::size_t i = 0; i < PLANET_COUNT; ++i) {
        if (!valid_position(set.planets[i], PLANETS[i])) return false;
    }
    if (set.planets[0].is_retrograde || set.planets[1].is_retrograde) return false;

    const auto& north = set.nodes[0];
    const auto& south = set.nodes[1];
    if (!valid_position(north, Body::NorthNode)) return false;
    if (!valid_position(south, Body::SouthNode)) return false;
    if (sign_index(south.sign) != sign_index(sign_from_index(sign_index(north.sign) + 6))) {
        return false;
    }

    return valid_angle(set.ascendant_degree);
}

// ─── ApproximatePositionSource ────────────────────────────────────────────────

std::optional<PositionSet>
ApproximatePositionSource::compute(const temporal::ResolvedMoment& moment) const {
    const auto bodies = ephemeris::BodyPositionCalculator::compute(moment);
    return PositionSet{
        .planets          = bodies.planets,
        .nodes            = bodies.nodes,
        .ascendant_degree = houses::HouseCalculator::ascendant_degree(
            moment.julian_day, moment.latitude, moment.longitude),
    };
}

// ─── ExternalPositionSource ───────────────────────────────────────────────────

ExternalPositionSource::ExternalPositionSource(PreciseCalculator calculator)
    : calculator_(std::move(calculator))
{}

std::optional<PositionSet>
ExternalPositionSource::compute(const temporal::ResolvedMoment& moment) const {
    if (!calculator_) return std::nullopt;
    return calculator_(moment);
}

// ─── with_timeout_or ──────────────────────────────────────────────────────────

namespace {

std::atomic<std::size_t> g_pending_workers{0};

}  // namespace

std::size_t pending_workers() noexcept {
    return g_pending_workers.load();
}

std::optional<SourcedPositions>
with_timeout_or(std::shared_ptr<const PositionSource> primary,
                const PositionSource& fallback,
                const temporal::ResolvedMoment& moment,
                std::chrono::milliseconds timeout) {
    const auto use_fallback = [&]() -> std::optional<SourcedPositions> {
        auto positions = fallback.compute(moment);
        if (!positions) return std::nullopt;
        return SourcedPositions{.positions = *positions, .provenance = fallback.provenance()};
    };

    if (!primary) return use_fallback();

    // The task owns copies of everything it reads so that a detached worker
    // outliving this call never touches the caller's stack.
    auto task = std::make_shared<std::packaged_task<std::optional<PositionSet>()>>(
        [source = primary, snapshot = moment]() { return source->compute(snapshot); });
    auto future = task->get_future();

    if (g_pending_workers.fetch_add(1) >= constants::MAX_PENDING_WORKERS) {
        g_pending_workers.fetch_sub(1);
        spdlog::warn("{} calculator unavailable: {} earlier calls still running; "
                     "using {} positions", primary->name(), constants::MAX_PENDING_WORKERS,
                     fallback.name());
        return use_fallback();
    }

    try {
        std::thread([task]() {
            (*task)();
            g_pending_workers.fetch_sub(1);
        }).detach();
    } catch (const std::system_error& e) {
        g_pending_workers.fetch_sub(1);
        spdlog::warn("{} calculator unavailable: could not start worker ({}); "
                     "using {} positions", primary->name(), e.what(), fallback.name());
        return use_fallback();
    }

    if (future.wait_for(timeout) != std::future_status::ready) {
        spdlog::warn("{} calculator unavailable: no answer within {} ms; using {} positions",
                     primary->name(), timeout.count(), fallback.name());
        return use_fallback();
    }

    std::optional<PositionSet> result;
    try {
        result = future.get();
    } catch (const std::exception& e) {
        spdlog::warn("{} calculator unavailable: {}; using {} positions",
                     primary->name(), e.what(), fallback.name());
        return use_fallback();
    }

    if (!result) {
        spdlog::warn("{} calculator unavailable: no result; using {} positions",
                     primary->name(), fallback.name());
        return use_fallback();
    }
    if (!validate_positions(*result)) {
        spdlog::warn("{} calculator unavailable: result failed schema check; using {} positions",
                     primary->name(), fallback.name());
        return use_fallback();
    }

    spdlog::debug("positions from {} calculator", primary->name());
    return SourcedPositions{.positions = *result, .provenance = primary->provenance()};
}

}  // namespace natal::core
