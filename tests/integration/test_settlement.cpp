/// @file tests/integration/test_settlement.cpp
/// @brief End-to-end tests for period settlement.
///
/// These tests exercise the complete settlement path:
///   DataLoader → SettlementInput → SettlementEngine →
///   TransportCostCalculator + ClientRevenueCalculator + DisposalCostCalculator →
///   SettlementReport

#include "biosettle/data_loader.hpp"
#include "biosettle/settlement.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <vector>

using namespace biosettle;
using namespace biosettle::core;

namespace {

Date day(int y, unsigned m, unsigned d) {
    return std::chrono::year{y} / std::chrono::month{m} / std::chrono::day{d};
}

Load load(std::int64_t id, NodeId origin, double tons, bool treatment = false,
          NodeId dest = 900, std::int64_t client = 7) {
    return Load{
        .id                = id,
        .client_id         = client,
        .net_weight_tons   = tons,
        .origin_id         = origin,
        .destination_id    = dest,
        .goes_to_treatment = treatment,
    };
}

/// November 2025 cycle, fuel 1200 against a 1000 base (factor 1.2).
SettlementInput november_input() {
    RouteMap routes;
    routes.insert(*DistanceRoute::make(101, 900, 50.0));
    routes.insert(*DistanceRoute::make(101, 102, 30.0, true));
    routes.insert(*DistanceRoute::make(102, 900, 40.0));

    return SettlementInput{
        .cycle  = *EconomicCycle::for_period(2025, 11, 37000.0, 1200.0),
        .routes = std::move(routes),
        .contractor_tariffs = {
            *TariffRule::make(0.027, 15.0, VehicleType::Batea, 1000.0),
        },
        .client_tariffs = {
            *ClientTariff::make(7, BillingConcept::Transporte,  0.5, 0.0, day(2025, 1, 1)),
            *ClientTariff::make(7, BillingConcept::Disposicion, 0.3, 0.0, day(2025, 1, 1)),
            *ClientTariff::make(7, BillingConcept::Tratamiento, 0.2, 0.0, day(2025, 1, 1)),
        },
        .disposal_tariffs = {
            *DisposalSiteTariff::make(900, 0.1, 0.0, day(2025, 1, 1)),
        },
        .trips = {
            Trip{.trip_id = "T-1", .date = day(2025, 11, 3), .vehicle_type = VehicleType::Batea,
                 .loads = {load(1, 101, 20.0)}},
            Trip{.trip_id = "T-2", .date = day(2025, 11, 4), .vehicle_type = VehicleType::Batea,
                 .loads = {load(2, 101, 10.0), load(3, 102, 8.0)}},
        },
    };
}

}  // namespace

TEST(Settlement, SettlesEveryTripAndLoad) {
    const SettlementEngine engine;
    const auto report = engine.settle(november_input());

    EXPECT_EQ(report.period, "2025-11");
    EXPECT_EQ(report.cycle_start, day(2025, 10, 19));
    EXPECT_EQ(report.cycle_end, day(2025, 11, 18));
    EXPECT_FALSE(report.has_issues());

    ASSERT_EQ(report.trip_costs.size(), 2u);
    EXPECT_EQ(report.revenues.size(), 3u);
    EXPECT_EQ(report.disposals.size(), 3u);

    // 32.4 (single) + 37.908 (linked)
    EXPECT_NEAR(report.transport_cost_uf, 70.308, 1e-9);
    // 0.8 UF/t over 20 + 10 + 8 t
    EXPECT_NEAR(report.client_revenue_uf, 30.4, 1e-9);
    // 0.1 UF/t over 38 t
    EXPECT_NEAR(report.disposal_cost_uf, 3.8, 1e-9);
    EXPECT_NEAR(report.margin_uf(), 30.4 - 70.308 - 3.8, 1e-9);
    EXPECT_NEAR(report.to_clp(report.client_revenue_uf), 30.4 * 37000.0, 1e-6);
}

TEST(Settlement, TreatmentLoadsSkipDisposalAndBillTreatment) {
    auto input = november_input();
    input.trips = {
        Trip{.trip_id = "T-9", .date = day(2025, 11, 5), .vehicle_type = VehicleType::Batea,
             .loads = {load(9, 101, 20.0, /*treatment=*/true)}},
    };
    const auto report = SettlementEngine{}.settle(input);

    EXPECT_TRUE(report.disposals.empty());
    ASSERT_EQ(report.revenues.size(), 1u);
    EXPECT_NEAR(report.revenues[0].revenue.amount(BillingConcept::Tratamiento), 4.0, 1e-9);
}

TEST(Settlement, FailingTripBecomesIssueAndBatchContinues) {
    auto input = november_input();
    input.trips.push_back(Trip{
        .trip_id = "T-3", .date = day(2025, 11, 6), .vehicle_type = VehicleType::AmplirollCarro,
        .loads = {load(4, 101, 12.0)}});

    const auto report = SettlementEngine{}.settle(input);

    EXPECT_EQ(report.trip_costs.size(), 2u);
    ASSERT_EQ(report.issues.size(), 1u);
    EXPECT_EQ(report.issues[0].subject, "trip T-3");
    ASSERT_TRUE(report.issues[0].error.has_value());
    EXPECT_EQ(*report.issues[0].error, ErrorKind::MissingTariff);
    // Client billing does not depend on the contractor tariff.
    EXPECT_EQ(report.revenues.size(), 4u);
}

TEST(Settlement, LoadWithoutClientTariffIsReported) {
    auto input = november_input();
    input.trips = {
        Trip{.trip_id = "T-5", .date = day(2025, 11, 7), .vehicle_type = VehicleType::Batea,
             .loads = {load(5, 101, 20.0, false, 900, /*client=*/99)}},
    };
    const auto report = SettlementEngine{}.settle(input);

    EXPECT_EQ(report.trip_costs.size(), 1u);
    EXPECT_TRUE(report.revenues.empty());
    ASSERT_EQ(report.issues.size(), 1u);
    EXPECT_EQ(report.issues[0].subject, "load 5");
    EXPECT_EQ(*report.issues[0].error, ErrorKind::MissingTariff);
}

TEST(Settlement, TripOutsideCycleIsSkipped) {
    auto input = november_input();
    input.trips[0].date = day(2025, 11, 19);
    const auto report = SettlementEngine{}.settle(input);

    EXPECT_EQ(report.trip_costs.size(), 1u);
    ASSERT_EQ(report.issues.size(), 1u);
    EXPECT_FALSE(report.issues[0].error.has_value());
}

TEST(Settlement, OutOfCycleTripsSettledWhenConfigured) {
    auto input = november_input();
    input.trips[0].date = day(2025, 11, 19);
    const SettlementEngine engine(SettlementConfig{.skip_out_of_cycle_trips = false});
    const auto report = engine.settle(input);

    EXPECT_EQ(report.trip_costs.size(), 2u);
    EXPECT_FALSE(report.has_issues());
}

TEST(Settlement, NoDisposalTariffs_DisposalNotSettled) {
    auto input = november_input();
    input.disposal_tariffs.clear();
    const auto report = SettlementEngine{}.settle(input);

    EXPECT_TRUE(report.disposals.empty());
    EXPECT_EQ(report.disposal_cost_uf, 0.0);
    EXPECT_FALSE(report.has_issues());
}

TEST(Settlement, ReportTextContainsTotalsAndIssues) {
    auto input = november_input();
    input.trips[0].date = day(2025, 12, 1);
    const auto text = SettlementEngine{}.settle(input).to_string();

    EXPECT_NE(text.find("Settlement 2025-11"), std::string::npos);
    EXPECT_NE(text.find("Margin"), std::string::npos);
    EXPECT_NE(text.find("trip T-1 [OutOfCycle]"), std::string::npos);
}

TEST(Settlement, ParsedCsvSettlesLikeBuiltInput) {
    const auto routes = DataLoader::parse_routes(
        "origin_id,destination_id,distance_km,is_segment_link\n"
        "101,900,50,0\n101,102,30,1\n102,900,40,0\n");
    const auto trips = DataLoader::parse_trips(
        "trip_id,date,vehicle_type,load_id,client_id,net_weight_tons,origin_id,destination_id,goes_to_treatment\n"
        "T-2,2025-11-04,BATEA,2,7,10,101,900,0\n"
        "T-2,2025-11-04,BATEA,3,7,8,102,900,0\n");

    auto input = november_input();
    input.routes = RouteMap(routes.rows);
    input.trips  = trips.rows;
    const auto report = SettlementEngine{}.settle(input);

    ASSERT_EQ(report.trip_costs.size(), 1u);
    EXPECT_NEAR(report.trip_costs[0].cost.total_cost_uf(), 37.908, 1e-9);
}
