/// @file src/fuel/fuel_adjustment.cpp
/// @brief FuelAdjustment: contractual fuel-price adjustment factor.

#include "fuel_adjustment.hpp"

#include "biosettle/errors.hpp"

#include <fmt/core.h>

#include <cmath>

namespace biosettle::fuel {

double FuelAdjustment::calculate_fuel_factor(double current_fuel_price,
                                             double base_fuel_price) {
    // A zero or negative base makes the ratio undefined.
    if (!std::isfinite(base_fuel_price) || base_fuel_price <= 0.0) {
        throw SettlementError(
            ErrorKind::InvalidFuelPrice,
            fmt::format("base_fuel_price must be positive, got {} "
                        "(current_fuel_price {})",
                        base_fuel_price, current_fuel_price));
    }

    const double delta = current_fuel_price - base_fuel_price;
    return 1.0 + delta / base_fuel_price;
}

}  // namespace biosettle::fuel
