#pragma once

/// @file src/fuel/fuel_adjustment.hpp
/// @brief FuelAdjustment: contractual fuel-price adjustment factor.
///
/// # Module: Fuel Adjustment
///
/// ## Responsibility
/// Turn a (current, base) fuel price pair into the single multiplicative
/// factor applied to every leg of a transport tariff.
///
/// ## Core Formula
/// ```
/// factor = 1 + (current_fuel_price − base_fuel_price) / base_fuel_price
/// ```
/// base = 1000, current = 1200 → 1.2 (fuel rose 20%, costs scale up 20%)
/// base = 1000, current =  800 → 0.8
///
/// ## Guarantees
/// - Pure and deterministic; no state, no allocation
/// - `current_fuel_price` is not range-checked: plausibility is the caller's
///   concern, only the base price must make the formula defined
///
/// ## NOT Responsible For
/// - Choosing the base price (it lives on TariffRule)
/// - Fetching the current price (it lives on EconomicCycle)

namespace biosettle::fuel {

class FuelAdjustment {
public:
    FuelAdjustment() = delete;

    /// Compute the fuel adjustment factor.
    ///
    /// # Arguments
    /// * `current_fuel_price`: Price in the active cycle (any real number)
    /// * `base_fuel_price`   : Contractual reference price (must be > 0)
    ///
    /// # Throws
    /// `SettlementError{InvalidFuelPrice}` if `base_fuel_price <= 0` or is
    /// not finite.
    [[nodiscard]] static double
    calculate_fuel_factor(double current_fuel_price, double base_fuel_price);
};

}  // namespace biosettle::fuel
