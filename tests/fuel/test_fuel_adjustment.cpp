#include <gtest/gtest.h>
#include "../../src/fuel/fuel_adjustment.hpp"
#include "biosettle/errors.hpp"
#include <limits>
#include <string>

using namespace biosettle;
using namespace biosettle::fuel;

// ─── calculate_fuel_factor ────────────────────────────────────────────────────

TEST(FuelAdjustment, PriceRiseOfTwentyPercent_FactorIsOnePointTwo) {
    EXPECT_DOUBLE_EQ(FuelAdjustment::calculate_fuel_factor(1200.0, 1000.0), 1.2);
}

TEST(FuelAdjustment, EqualPrices_FactorIsExactlyOne) {
    EXPECT_EQ(FuelAdjustment::calculate_fuel_factor(987.5, 987.5), 1.0);
}

TEST(FuelAdjustment, PriceDrop_FactorBelowOne) {
    EXPECT_DOUBLE_EQ(FuelAdjustment::calculate_fuel_factor(800.0, 1000.0), 0.8);
}

TEST(FuelAdjustment, ZeroCurrentPrice_FactorIsZero) {
    // Only the base price is validated.
    EXPECT_DOUBLE_EQ(FuelAdjustment::calculate_fuel_factor(0.0, 1000.0), 0.0);
}

TEST(FuelAdjustment, NegativeCurrentPrice_NotRejected) {
    EXPECT_LT(FuelAdjustment::calculate_fuel_factor(-100.0, 1000.0), 0.0);
}

TEST(FuelAdjustment, ZeroBasePrice_ThrowsInvalidFuelPrice) {
    try {
        (void)FuelAdjustment::calculate_fuel_factor(1200.0, 0.0);
        FAIL() << "expected SettlementError";
    } catch (const SettlementError& ex) {
        EXPECT_EQ(ex.kind(), ErrorKind::InvalidFuelPrice);
    }
}

TEST(FuelAdjustment, NegativeBasePrice_Throws) {
    EXPECT_THROW((void)FuelAdjustment::calculate_fuel_factor(1200.0, -5.0), SettlementError);
}

TEST(FuelAdjustment, NaNBasePrice_Throws) {
    EXPECT_THROW((void)FuelAdjustment::calculate_fuel_factor(
                     1200.0, std::numeric_limits<double>::quiet_NaN()),
                 SettlementError);
}

TEST(FuelAdjustment, ErrorMessageNamesBasePrice) {
    try {
        (void)FuelAdjustment::calculate_fuel_factor(1200.0, -5.0);
        FAIL() << "expected SettlementError";
    } catch (const SettlementError& ex) {
        EXPECT_NE(std::string(ex.what()).find("-5"), std::string::npos);
    }
}
