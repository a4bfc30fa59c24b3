/// @file src/cost/transport_cost_calculator.cpp
/// @brief TransportCostCalculator: UF owed to a transport contractor per trip.

#include "transport_cost_calculator.hpp"
#include "../fuel/fuel_adjustment.hpp"

#include "biosettle/errors.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cmath>
#include <numeric>
#include <utility>
#include <vector>

namespace biosettle::cost {

// ─── calculate_trip_cost ──────────────────────────────────────────────────────

TripCostResult
TransportCostCalculator::calculate_trip_cost(std::span<const Load> loads,
                                             const RouteMap& route_map,
                                             const std::optional<TariffRule>& tariff,
                                             const EconomicCycle& cycle) {
    if (loads.empty()) {
        throw SettlementError(ErrorKind::EmptyLoadList,
                              "trip cost requested for an empty load list");
    }
    if (!tariff) {
        throw SettlementError(
            ErrorKind::MissingTariff,
            fmt::format("no contractor tariff supplied for trip starting at origin {}",
                        loads.front().origin_id));
    }
    if (loads.size() > MAX_LINKED_LOADS) {
        throw SettlementError(
            ErrorKind::UnsupportedTripShape,
            fmt::format("linked trips carry at most {} loads, got {} "
                        "(first origin {}, final destination {})",
                        MAX_LINKED_LOADS, loads.size(),
                        loads.front().origin_id, loads.back().destination_id));
    }

    for (const Load& load : loads) {
        if (!std::isfinite(load.net_weight_tons)) {
            throw SettlementError(
                ErrorKind::InvalidWeight,
                fmt::format("load {} net_weight_tons must be finite to cost a trip, got {}",
                            load.id, load.net_weight_tons));
        }
    }

    // One factor for every leg of the trip.
    const double fuel_factor = fuel::FuelAdjustment::calculate_fuel_factor(
        cycle.fuel_price(), tariff->base_fuel_price());

    if (loads.size() == 1) {
        return single_trip(loads.front(), route_map, *tariff, fuel_factor);
    }
    return linked_trip(loads, route_map, *tariff, fuel_factor);
}

// ─── billable_weight ──────────────────────────────────────────────────────────

double TransportCostCalculator::billable_weight(double actual_weight_tons,
                                                const TariffRule& tariff) noexcept {
    if (!std::isfinite(actual_weight_tons)) {
        return tariff.min_weight_tons();
    }
    return std::max(actual_weight_tons, tariff.min_weight_tons());
}

// ─── single_trip ──────────────────────────────────────────────────────────────

TripCostResult
TransportCostCalculator::single_trip(const Load& load,
                                     const RouteMap& route_map,
                                     const TariffRule& tariff,
                                     double fuel_factor) {
    const auto route = require_route(route_map, load.origin_id, load.destination_id,
                                     /*is_segment_link=*/false);

    const double weight = billable_weight(load.net_weight_tons, tariff);
    const double cost   = leg_cost(tariff, route.distance_km(), weight, fuel_factor);

    std::vector<BreakdownEntry> breakdown{
        {BreakdownKind::LegCost,
         fmt::format("Single Leg ({}->{})", load.origin_id, load.destination_id),
         cost},
        {BreakdownKind::TotalDistanceKm,    "total_distance_km",    route.distance_km()},
        {BreakdownKind::BillableWeightTons, "billable_weight_tons", weight},
    };

    return TripCostResult(cost, fuel_factor, weight, std::move(breakdown));
}

// ─── linked_trip ──────────────────────────────────────────────────────────────

TripCostResult
TransportCostCalculator::linked_trip(std::span<const Load> loads,
                                     const RouteMap& route_map,
                                     const TariffRule& tariff,
                                     double fuel_factor) {
    const Load& first  = loads[0];
    const Load& second = loads[1];
    const NodeId final_destination = loads.back().destination_id;

    // Leg 1: first origin → second origin, only the first load on board.
    const auto pickup_route = require_route(route_map, first.origin_id, second.origin_id,
                                            /*is_segment_link=*/true);
    const double pickup_weight = billable_weight(first.net_weight_tons, tariff);
    const double pickup_cost   = leg_cost(tariff, pickup_route.distance_km(),
                                          pickup_weight, fuel_factor);

    // Leg 2: second origin → final destination, every load on board.
    const auto main_route = require_route(route_map, second.origin_id, final_destination,
                                          /*is_segment_link=*/false);
    const double combined = std::accumulate(
        loads.begin(), loads.end(), 0.0,
        [](double acc, const Load& l) { return acc + l.net_weight_tons; });
    const double main_weight = billable_weight(combined, tariff);
    const double main_cost   = leg_cost(tariff, main_route.distance_km(),
                                        main_weight, fuel_factor);

    std::vector<BreakdownEntry> breakdown{
        {BreakdownKind::LegCost,
         fmt::format("Leg 1: Pickup ({}->{})", first.origin_id, second.origin_id),
         pickup_cost},
        {BreakdownKind::LegCost,
         fmt::format("Leg 2: Main Haul ({}->{})", second.origin_id, final_destination),
         main_cost},
        {BreakdownKind::TotalDistanceKm, "total_distance_km",
         pickup_route.distance_km() + main_route.distance_km()},
        {BreakdownKind::BillableWeightTons, "consolidated_weight_tons", main_weight},
    };

    // The reported weight is the main-haul weight, the heaviest leg.
    return TripCostResult(pickup_cost + main_cost, fuel_factor, main_weight,
                          std::move(breakdown));
}

// ─── require_route ────────────────────────────────────────────────────────────

DistanceRoute
TransportCostCalculator::require_route(const RouteMap& route_map,
                                       NodeId origin_id,
                                       NodeId destination_id,
                                       bool is_segment_link) {
    auto route = route_map.find(origin_id, destination_id, is_segment_link);
    if (!route) {
        throw SettlementError(
            ErrorKind::InvalidRoute,
            fmt::format("no {} route from {} to {} in the distance matrix",
                        is_segment_link ? "segment-link" : "direct",
                        origin_id, destination_id));
    }
    return *route;
}

// ─── leg_cost ─────────────────────────────────────────────────────────────────

double TransportCostCalculator::leg_cost(const TariffRule& tariff,
                                         double distance_km,
                                         double billable_weight_tons,
                                         double fuel_factor) noexcept {
    const double base_cost_uf = tariff.base_rate_per_ton_km() * distance_km * billable_weight_tons;
    return base_cost_uf * fuel_factor;
}

}  // namespace biosettle::cost
