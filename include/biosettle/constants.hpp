#pragma once

#include "biosettle/types.hpp"

#include <cstddef>

/// @file include/biosettle/constants.hpp
/// @brief Contractual and numerical constants for the settlement engine.

namespace biosettle::constants {

// ─── Billing Cycle ────────────────────────────────────────────────────────────

/// A billing cycle starts on this day of the previous month...
static constexpr unsigned CYCLE_START_DAY = 19;

/// ...and ends on this day of the settled month.
static constexpr unsigned CYCLE_END_DAY = 18;

// ─── Guaranteed Minimum Weights ───────────────────────────────────────────────

/// Minimum billable tonnage for a tipper truck when the tariff omits one.
static constexpr double MIN_WEIGHT_BATEA_TONS = 15.0;

/// Minimum billable tonnage for hook-lift configurations.
static constexpr double MIN_WEIGHT_AMPLIROLL_TONS = 7.0;

// ─── Numerical Tolerances ─────────────────────────────────────────────────────

/// Floating-point comparison epsilon for UF amounts.
static constexpr double UF_EPSILON = 1e-9;

// ─── CSV Layout ───────────────────────────────────────────────────────────────

static constexpr std::size_t ROUTE_COLUMNS             = 4;
static constexpr std::size_t CONTRACTOR_TARIFF_COLUMNS = 4;
static constexpr std::size_t CLIENT_TARIFF_COLUMNS     = 6;
static constexpr std::size_t DISPOSAL_TARIFF_COLUMNS   = 5;
static constexpr std::size_t TRIP_COLUMNS              = 9;

}  // namespace biosettle::constants

namespace biosettle {

/// Guaranteed minimum weight applied when a contractor tariff gives none.
[[nodiscard]] constexpr double default_min_weight(VehicleType type) noexcept {
    switch (type) {
        case VehicleType::Batea:
            return constants::MIN_WEIGHT_BATEA_TONS;
        case VehicleType::AmplirollSimple:
        case VehicleType::AmplirollCarro:
            return constants::MIN_WEIGHT_AMPLIROLL_TONS;
    }
    return 0.0;
}

}  // namespace biosettle
