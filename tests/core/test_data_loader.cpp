#include <gtest/gtest.h>
#include "biosettle/data_loader.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

using namespace biosettle;
using namespace biosettle::core;

namespace {

Date day(int y, unsigned m, unsigned d) {
    return std::chrono::year{y} / std::chrono::month{m} / std::chrono::day{d};
}

void write_file(const std::filesystem::path& path, const std::string& content) {
    std::ofstream out(path);
    out << content;
}

}  // namespace

// ─── Field helpers ────────────────────────────────────────────────────────────

TEST(DataLoader_Fields, SplitRowTrimsAndKeepsEmptyFields) {
    const auto fields = DataLoader::split_row(" a , b,,c ");
    ASSERT_EQ(fields.size(), 4u);
    EXPECT_EQ(fields[0], "a");
    EXPECT_EQ(fields[1], "b");
    EXPECT_EQ(fields[2], "");
    EXPECT_EQ(fields[3], "c");
}

TEST(DataLoader_Fields, ParseDouble) {
    EXPECT_DOUBLE_EQ(*DataLoader::parse_double("0.027"), 0.027);
    EXPECT_DOUBLE_EQ(*DataLoader::parse_double("+12"), 12.0);
    EXPECT_FALSE(DataLoader::parse_double("").has_value());
    EXPECT_FALSE(DataLoader::parse_double("12abc").has_value());
    EXPECT_FALSE(DataLoader::parse_double("nan").has_value());
}

TEST(DataLoader_Fields, ParseIntAndBool) {
    EXPECT_EQ(*DataLoader::parse_int("-42"), -42);
    EXPECT_FALSE(DataLoader::parse_int("4.2").has_value());
    EXPECT_TRUE(*DataLoader::parse_bool("TRUE"));
    EXPECT_TRUE(*DataLoader::parse_bool("1"));
    EXPECT_FALSE(*DataLoader::parse_bool("no"));
    EXPECT_FALSE(DataLoader::parse_bool("maybe").has_value());
}

// ─── parse_routes ─────────────────────────────────────────────────────────────

TEST(DataLoader_Routes, ParsesRowsAndSkipsMalformed) {
    const std::string csv =
        "# distance matrix\n"
        "origin_id,destination_id,distance_km,is_segment_link\r\n"
        "101,900,50,0\r\n"
        "101,102,30,true\n"
        "\n"
        "102,900,-4,0\n"     // non-positive distance
        "102,901,abc,0\n"    // not a number
        "103,900\n";         // too few columns
    const auto result = DataLoader::parse_routes(csv);
    ASSERT_EQ(result.rows.size(), 2u);
    EXPECT_EQ(result.skipped, 3u);
    EXPECT_EQ(result.rows[0].origin_id(), 101);
    EXPECT_DOUBLE_EQ(result.rows[0].distance_km(), 50.0);
    EXPECT_TRUE(result.rows[1].is_segment_link());
}

TEST(DataLoader_Routes, HeaderOnly_NoRows) {
    const auto result = DataLoader::parse_routes("origin_id,destination_id,distance_km,is_segment_link\n");
    EXPECT_TRUE(result.rows.empty());
    EXPECT_EQ(result.skipped, 0u);
}

// ─── parse_contractor_tariffs ─────────────────────────────────────────────────

TEST(DataLoader_Contractor, EmptyMinimumUsesVehicleDefault) {
    const std::string csv =
        "vehicle_type,base_rate_per_ton_km,min_weight_tons,base_fuel_price\n"
        "BATEA,0.027,,1000\n"
        "AMPLIROLL,0.031,,1000\n"
        "AMPLIROLL_CARRO,0.029,9,1000\n"
        "TRUCK,0.02,,1000\n";
    const auto result = DataLoader::parse_contractor_tariffs(csv);
    ASSERT_EQ(result.rows.size(), 3u);
    EXPECT_EQ(result.skipped, 1u);
    EXPECT_DOUBLE_EQ(result.rows[0].min_weight_tons(), 15.0);
    EXPECT_EQ(result.rows[1].vehicle_type(), VehicleType::AmplirollSimple);
    EXPECT_DOUBLE_EQ(result.rows[1].min_weight_tons(), 7.0);
    EXPECT_DOUBLE_EQ(result.rows[2].min_weight_tons(), 9.0);
}

// ─── parse_client_tariffs / parse_disposal_tariffs ────────────────────────────

TEST(DataLoader_Client, OpenAndClosedWindows) {
    const std::string csv =
        "client_id,concept,rate_per_ton,min_weight_tons,valid_from,valid_to\n"
        "7,TRANSPORTE,0.5,0,2025-01-01,\n"
        "7,DISPOSICION,0.3,,2025-01-01,2025-12-31\n"
        "7,TRATAMIENTO,0.2,0,2025-06-01,2025-01-01\n"   // reversed window
        "7,FLETE,0.2,0,2025-01-01,\n";                   // unknown concept
    const auto result = DataLoader::parse_client_tariffs(csv);
    ASSERT_EQ(result.rows.size(), 2u);
    EXPECT_EQ(result.skipped, 2u);
    EXPECT_FALSE(result.rows[0].valid_to().has_value());
    ASSERT_TRUE(result.rows[1].valid_to().has_value());
    EXPECT_EQ(*result.rows[1].valid_to(), day(2025, 12, 31));
    EXPECT_DOUBLE_EQ(result.rows[1].min_weight_tons(), 0.0);
}

TEST(DataLoader_Disposal, ParsesSiteTariffs) {
    const std::string csv =
        "site_id,rate_per_ton,min_weight_tons,valid_from,valid_to\n"
        "900,0.25,10,2025-01-01,\n"
        "901,0.40,0,2025-01-01,bad-date\n";
    const auto result = DataLoader::parse_disposal_tariffs(csv);
    ASSERT_EQ(result.rows.size(), 1u);
    EXPECT_EQ(result.skipped, 1u);
    EXPECT_EQ(result.rows[0].site_id(), 900);
}

// ─── parse_trips ──────────────────────────────────────────────────────────────

TEST(DataLoader_Trips, GroupsRowsByTripIdInFileOrder) {
    const std::string csv =
        "trip_id,date,vehicle_type,load_id,client_id,net_weight_tons,origin_id,destination_id,goes_to_treatment\n"
        "T-1,2025-11-03,BATEA,1,7,10,101,900,0\n"
        "T-2,2025-11-04,AMPLIROLL_SIMPLE,3,8,6,103,901,1\n"
        "T-1,2025-11-03,BATEA,2,7,8,102,900,0\n";
    const auto result = DataLoader::parse_trips(csv);
    ASSERT_EQ(result.rows.size(), 2u);
    EXPECT_EQ(result.skipped, 0u);

    const Trip& linked = result.rows[0];
    EXPECT_EQ(linked.trip_id, "T-1");
    EXPECT_EQ(linked.date, day(2025, 11, 3));
    ASSERT_EQ(linked.loads.size(), 2u);
    EXPECT_EQ(linked.loads[0].id, 1);
    EXPECT_EQ(linked.loads[1].origin_id, 102);

    EXPECT_TRUE(result.rows[1].loads[0].goes_to_treatment);
}

TEST(DataLoader_Trips, RowDisagreeingWithTripDropsWholeTrip) {
    const std::string csv =
        "trip_id,date,vehicle_type,load_id,client_id,net_weight_tons,origin_id,destination_id,goes_to_treatment\n"
        "T-1,2025-11-03,BATEA,1,7,10,101,900,0\n"
        "T-1,2025-11-04,BATEA,2,7,8,102,900,0\n"
        "T-2,2025-11-03,BATEA,3,7,8,102,900,0\n"
        "T-2,2025-11-03,AMPLIROLL_CARRO,4,7,8,103,900,0\n"
        "T-3,2025-11-05,BATEA,5,7,12,104,900,0\n"
        ",2025-11-03,BATEA,6,7,8,102,900,0\n";
    const auto result = DataLoader::parse_trips(csv);
    ASSERT_EQ(result.rows.size(), 1u);
    EXPECT_EQ(result.rows[0].trip_id, "T-3");
    EXPECT_EQ(result.skipped, 5u);
}

TEST(DataLoader_Trips, MalformedFirstRowOfLinkedTripDropsWholeTrip) {
    // Keeping only the second load would cost a direct trip from 102 and
    // never bill load 1.
    const std::string csv =
        "trip_id,date,vehicle_type,load_id,client_id,net_weight_tons,origin_id,destination_id,goes_to_treatment\n"
        "T-1,2025-11-03,BATEA,1,7,abc,101,900,0\n"
        "T-1,2025-11-03,BATEA,2,7,8,102,900,0\n";
    const auto result = DataLoader::parse_trips(csv);
    EXPECT_TRUE(result.rows.empty());
    EXPECT_EQ(result.skipped, 2u);
}

TEST(DataLoader_Trips, TruncatedRowDropsItsTrip) {
    const std::string csv =
        "trip_id,date,vehicle_type,load_id,client_id,net_weight_tons,origin_id,destination_id,goes_to_treatment\n"
        "T-1,2025-11-03,BATEA,1,7,10,101,900,0\n"
        "T-1,2025-11-03,BATEA,2\n"
        "T-2,2025-11-03,BATEA,3,7,10,101,900,0\n";
    const auto result = DataLoader::parse_trips(csv);
    ASSERT_EQ(result.rows.size(), 1u);
    EXPECT_EQ(result.rows[0].trip_id, "T-2");
    EXPECT_EQ(result.skipped, 2u);
}

TEST(DataLoader_Trips, NonPositiveWeightIsKeptForTheCalculators) {
    const std::string csv =
        "trip_id,date,vehicle_type,load_id,client_id,net_weight_tons,origin_id,destination_id,goes_to_treatment\n"
        "T-1,2025-11-03,BATEA,1,7,0,101,900,0\n";
    const auto result = DataLoader::parse_trips(csv);
    ASSERT_EQ(result.rows.size(), 1u);
    EXPECT_DOUBLE_EQ(result.rows[0].loads[0].net_weight_tons, 0.0);
}

// ─── load_directory ───────────────────────────────────────────────────────────

class DataLoaderDirectory : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path()
             / ("biosettle_loader_" + std::string(
                    ::testing::UnitTest::GetInstance()->current_test_info()->name()));
        std::filesystem::create_directories(dir_);
        write_file(dir_ / "routes.csv",
                   "origin_id,destination_id,distance_km,is_segment_link\n"
                   "101,900,50,0\n101,900,55,0\n");
        write_file(dir_ / "contractor_tariffs.csv",
                   "vehicle_type,base_rate_per_ton_km,min_weight_tons,base_fuel_price\n"
                   "BATEA,0.027,15,1000\n");
        write_file(dir_ / "client_tariffs.csv",
                   "client_id,concept,rate_per_ton,min_weight_tons,valid_from,valid_to\n"
                   "7,TRANSPORTE,0.5,0,2025-01-01,\n");
        write_file(dir_ / "trips.csv",
                   "trip_id,date,vehicle_type,load_id,client_id,net_weight_tons,origin_id,destination_id,goes_to_treatment\n"
                   "T-1,2025-11-03,BATEA,1,7,20,101,900,0\n"
                   "T-2,not-a-date,BATEA,2,7,20,101,900,0\n");
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::filesystem::path dir_;
};

TEST_F(DataLoaderDirectory, LoadsAllFilesWithoutDisposal) {
    const auto cycle = *EconomicCycle::for_period(2025, 11, 37000.0, 1200.0);
    const auto loaded = DataLoader::load_directory(dir_, cycle);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->input.routes.size(), 1u);
    EXPECT_EQ(loaded->duplicate_routes, 1u);
    EXPECT_EQ(loaded->skipped_rows, 1u);
    EXPECT_EQ(loaded->input.trips.size(), 1u);
    EXPECT_TRUE(loaded->input.disposal_tariffs.empty());
    EXPECT_DOUBLE_EQ(loaded->input.cycle.uf_value(), 37000.0);
}

TEST_F(DataLoaderDirectory, ReadsOptionalDisposalFile) {
    write_file(dir_ / "disposal_tariffs.csv",
               "site_id,rate_per_ton,min_weight_tons,valid_from,valid_to\n"
               "900,0.25,0,2025-01-01,\n");
    const auto cycle = *EconomicCycle::for_period(2025, 11, 37000.0, 1200.0);
    const auto loaded = DataLoader::load_directory(dir_, cycle);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->input.disposal_tariffs.size(), 1u);
}

TEST_F(DataLoaderDirectory, MissingRequiredFile_ReturnsNullopt) {
    std::filesystem::remove(dir_ / "trips.csv");
    const auto cycle = *EconomicCycle::for_period(2025, 11, 37000.0, 1200.0);
    EXPECT_FALSE(DataLoader::load_directory(dir_, cycle).has_value());
}

TEST(DataLoader_ReadFile, MissingFile_ReturnsNullopt) {
    EXPECT_FALSE(DataLoader::read_file("/nonexistent/biosettle/routes.csv").has_value());
}
