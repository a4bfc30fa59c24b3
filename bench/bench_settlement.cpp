/**
 * @file  bench/bench_settlement.cpp
 * @brief Google Benchmark suite for trip costing, client billing and
 *        period settlement.
 *
 * Benchmarks
 * ----------
 *   BM_TripCost_Single       : one direct leg
 *   BM_TripCost_Linked       : pickup leg + main haul
 *   BM_LoadRevenue           : three concepts, date-filtered tariffs
 *   BM_Settle_Period         : full cycle of N trips
 *   BM_ParseTrips            : CSV parsing of N trip rows
 *
 * Build (CMake):
 *   cmake -DBIOSETTLE_BENCH=ON ..
 *   cmake --build build --target bench_settlement
 *   ./build/bench_settlement --benchmark_format=json
 *
 * Throughput units: items/second (trips or rows processed).
 */

#include "benchmark/benchmark.h"

#include "cost/transport_cost_calculator.hpp"
#include "revenue/client_revenue_calculator.hpp"

#include "biosettle/data_loader.hpp"
#include "biosettle/settlement.hpp"

#include <chrono>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

using namespace biosettle;

// ── Fixture helpers ────────────────────────────────────────────────────────────

static Date day(int y, unsigned m, unsigned d) {
    return std::chrono::year{y} / std::chrono::month{m} / std::chrono::day{d};
}

static const NodeId SITE = 9000;

/// Route map covering `n_plants` plants, each with a direct route to the site
/// and a segment link to the next plant.
static RouteMap make_routes(std::size_t n_plants) {
    RouteMap map;
    for (std::size_t i = 0; i < n_plants; ++i) {
        const auto plant = static_cast<NodeId>(i + 1);
        map.insert(*DistanceRoute::make(plant, SITE, 20.0 + static_cast<double>(i % 80)));
        map.insert(*DistanceRoute::make(plant, plant + 1, 5.0 + static_cast<double>(i % 10), true));
    }
    return map;
}

static std::vector<ClientTariff> make_client_tariffs() {
    return {
        *ClientTariff::make(7, BillingConcept::Transporte, 0.4, 0.0, day(2024, 1, 1), day(2024, 12, 31)),
        *ClientTariff::make(7, BillingConcept::Transporte, 0.5, 0.0, day(2025, 1, 1)),
        *ClientTariff::make(7, BillingConcept::Disposicion, 0.3, 0.0, day(2025, 1, 1)),
        *ClientTariff::make(7, BillingConcept::Tratamiento, 0.2, 0.0, day(2025, 1, 1)),
    };
}

/// N trips in the November 2025 cycle; every third trip is linked.
static std::vector<core::Trip> make_trips(std::size_t n, std::size_t n_plants) {
    std::vector<core::Trip> trips;
    trips.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        const auto plant = static_cast<NodeId>(i % n_plants + 1);
        const auto id    = static_cast<std::int64_t>(i);
        core::Trip trip{
            .trip_id      = "T-" + std::to_string(i),
            .date         = day(2025, 10, 19 + static_cast<unsigned>(i % 12)),
            .vehicle_type = VehicleType::Batea,
            .loads        = {Load{id * 2, 7, 8.0 + static_cast<double>(i % 12), plant, SITE, i % 2 == 0}},
        };
        if (i % 3 == 0) {
            trip.loads.push_back(Load{id * 2 + 1, 7, 6.0, plant + 1, SITE, false});
        }
        trips.push_back(std::move(trip));
    }
    return trips;
}

static const EconomicCycle& november_cycle() {
    static const EconomicCycle cycle = *EconomicCycle::for_period(2025, 11, 37000.0, 1200.0);
    return cycle;
}

// ── Calculator benchmarks ──────────────────────────────────────────────────────

static void BM_TripCost_Single(benchmark::State& state) {
    const auto routes = make_routes(64);
    const auto tariff = TariffRule::make(0.027, 15.0, VehicleType::Batea, 1000.0);
    const std::vector<Load> loads{Load{1, 7, 20.0, 1, SITE, false}};
    for (auto _ : state) {
        auto result = cost::TransportCostCalculator::calculate_trip_cost(
            loads, routes, tariff, november_cycle());
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_TripCost_Single);

static void BM_TripCost_Linked(benchmark::State& state) {
    const auto routes = make_routes(64);
    const auto tariff = TariffRule::make(0.027, 15.0, VehicleType::Batea, 1000.0);
    const std::vector<Load> loads{Load{1, 7, 10.0, 1, SITE, false}, Load{2, 7, 8.0, 2, SITE, false}};
    for (auto _ : state) {
        auto result = cost::TransportCostCalculator::calculate_trip_cost(
            loads, routes, tariff, november_cycle());
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_TripCost_Linked);

static void BM_LoadRevenue(benchmark::State& state) {
    const auto tariffs = make_client_tariffs();
    const Load load{1, 7, 20.0, 1, SITE, true};
    const Date on = day(2025, 11, 10);
    for (auto _ : state) {
        auto result = revenue::ClientRevenueCalculator::calculate_load_revenue(
            load, tariffs, 37000.0, on);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_LoadRevenue);

// ── Period benchmarks ──────────────────────────────────────────────────────────

static void BM_Settle_Period(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const core::SettlementInput input{
        .cycle              = november_cycle(),
        .routes             = make_routes(64),
        .contractor_tariffs = {*TariffRule::make(0.027, 15.0, VehicleType::Batea, 1000.0)},
        .client_tariffs     = make_client_tariffs(),
        .disposal_tariffs   = {*DisposalSiteTariff::make(SITE, 0.1, 0.0, day(2025, 1, 1))},
        .trips              = make_trips(n, 64),
    };
    const core::SettlementEngine engine;
    for (auto _ : state) {
        auto report = engine.settle(input);
        benchmark::DoNotOptimize(report);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_Settle_Period)->RangeMultiplier(4)->Range(64, 16384)->Unit(benchmark::kMicrosecond);

static void BM_ParseTrips(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    std::string csv =
        "trip_id,date,vehicle_type,load_id,client_id,net_weight_tons,"
        "origin_id,destination_id,goes_to_treatment\n";
    for (std::size_t i = 0; i < n; ++i) {
        csv += "T-" + std::to_string(i / 2) + ",2025-11-03,BATEA," + std::to_string(i)
             + ",7,12.5," + std::to_string(i % 64 + 1) + ",9000,0\n";
    }
    for (auto _ : state) {
        auto parsed = core::DataLoader::parse_trips(csv);
        benchmark::DoNotOptimize(parsed);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_ParseTrips)->RangeMultiplier(4)->Range(64, 16384)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
