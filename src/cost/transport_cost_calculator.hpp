#pragma once

/// @file src/cost/transport_cost_calculator.hpp
/// @brief TransportCostCalculator: UF owed to a transport contractor per trip.
///
/// # Module: Transport Cost Calculator
///
/// ## Responsibility
/// Price one vehicle movement carrying one or two loads, applying the
/// contractor's guaranteed minimum weight per leg and the cycle's fuel
/// adjustment factor uniformly to every leg.
///
/// ## Core Formula (per leg)
/// ```
/// cost_uf = base_rate_per_ton_km · distance_km · max(weight, min_weight) · fuel_factor
/// ```
///
/// ## Trip Shapes
/// - **Single load**: direct route origin → destination.
/// - **Linked trip** (two loads, pickup order): the truck hauls the first
///   load to the second load's origin over a segment-link route (pickup
///   leg, first load's weight only), then carries both loads to the final
///   destination over a direct route (main haul, combined weight).
///
///     Planta A (10 t) ──pickup──▶ Planta B (+8 t) ──main haul──▶ Sitio C
///
/// - Three or more loads are rejected with `UnsupportedTripShape`; chained
///   pickups have no agreed tariff rule.
///
/// ## Guarantees
/// - Stateless static functions; safe to call concurrently
/// - Inputs are never modified; failures throw before any result exists
///
/// ## NOT Responsible For
/// - Deciding which tariff applies to the vehicle (caller's choice)
/// - Client billing (see client_revenue_calculator.hpp)

#include "biosettle/results.hpp"
#include "biosettle/routes.hpp"
#include "biosettle/tariffs.hpp"
#include "biosettle/types.hpp"

#include <optional>
#include <span>

namespace biosettle::cost {

class TransportCostCalculator {
public:
    TransportCostCalculator() = delete;

    /// Compute the contractor cost of one trip.
    ///
    /// # Arguments
    /// * `loads`    : Loads of the trip in pickup order (1 or 2)
    /// * `route_map`: Distance index covering the required legs
    /// * `tariff`   : Contractor rule for the vehicle (must be present)
    /// * `cycle`    : Economic cycle supplying the current fuel price
    ///
    /// # Throws
    /// `SettlementError` with kind
    /// - `EmptyLoadList`        if `loads` is empty
    /// - `MissingTariff`        if `tariff` is empty
    /// - `UnsupportedTripShape` if more than two loads are given
    /// - `InvalidWeight`        if a load weight is not finite
    /// - `InvalidFuelPrice`     if the tariff's base fuel price is not positive
    /// - `InvalidRoute`         if a required leg has no route
    [[nodiscard]] static TripCostResult
    calculate_trip_cost(std::span<const Load> loads,
                        const RouteMap& route_map,
                        const std::optional<TariffRule>& tariff,
                        const EconomicCycle& cycle);

    /// max(actual_weight, tariff minimum); a non-finite weight bills the minimum.
    [[nodiscard]] static double
    billable_weight(double actual_weight_tons, const TariffRule& tariff) noexcept;

    /// Maximum number of loads a single trip may carry.
    static constexpr std::size_t MAX_LINKED_LOADS = 2;

private:
    [[nodiscard]] static TripCostResult
    single_trip(const Load& load,
                const RouteMap& route_map,
                const TariffRule& tariff,
                double fuel_factor);

    [[nodiscard]] static TripCostResult
    linked_trip(std::span<const Load> loads,
                const RouteMap& route_map,
                const TariffRule& tariff,
                double fuel_factor);

    /// Look up a route or throw `InvalidRoute` naming the missing pair.
    [[nodiscard]] static DistanceRoute
    require_route(const RouteMap& route_map,
                  NodeId origin_id,
                  NodeId destination_id,
                  bool is_segment_link);

    /// UF cost of one leg.
    [[nodiscard]] static double
    leg_cost(const TariffRule& tariff,
             double distance_km,
             double billable_weight_tons,
             double fuel_factor) noexcept;
};

}  // namespace biosettle::cost
