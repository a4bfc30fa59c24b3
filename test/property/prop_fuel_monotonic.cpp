/**
 * @file  prop_fuel_monotonic.cpp
 * @brief Property: fuel factor is strictly increasing in the current price
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_fuel_monotonic
 *
 * factor(c, b) = 1 + (c − b) / b is affine in c with slope 1/b > 0, so for
 * any valid base price:
 *   c1 < c2  ⇒  factor(c1, b) < factor(c2, b)
 *   factor(c, b) == 1  ⇔  c == b
 * and any base ≤ 0 must be rejected with InvalidFuelPrice.
 */

#include <rapidcheck.h>

#include "fuel/fuel_adjustment.hpp"
#include "biosettle/errors.hpp"

using namespace biosettle;
using namespace biosettle::fuel;

int main() {
    bool ok = true;

    // ── Property 1: strictly increasing in the current price ─────────────────
    ok = rc::check(
        "fuel_monotonic: higher current price gives a higher factor",
        []() {
            const int base = *rc::gen::inRange(1, 100000);
            const int lo   = *rc::gen::inRange(0, 100000);
            const int step = *rc::gen::inRange(1, 1000);

            const double f_lo = FuelAdjustment::calculate_fuel_factor(lo, base);
            const double f_hi = FuelAdjustment::calculate_fuel_factor(lo + step, base);
            RC_ASSERT(f_lo < f_hi);
        }
    ) && ok;

    // ── Property 2: neutral at the base price ────────────────────────────────
    ok = rc::check(
        "fuel_monotonic: factor is 1 exactly when prices match",
        []() {
            const int base    = *rc::gen::inRange(1, 100000);
            const int current = *rc::gen::inRange(0, 100000);
            const double f = FuelAdjustment::calculate_fuel_factor(current, base);
            RC_ASSERT((f == 1.0) == (current == base));
        }
    ) && ok;

    // ── Property 3: non-positive base always rejected ────────────────────────
    ok = rc::check(
        "fuel_monotonic: base price <= 0 throws InvalidFuelPrice",
        []() {
            const int base    = *rc::gen::inRange(-100000, 1);
            const int current = *rc::gen::inRange(0, 100000);
            try {
                (void)FuelAdjustment::calculate_fuel_factor(current, base);
                RC_FAIL("expected SettlementError");
            } catch (const SettlementError& ex) {
                RC_ASSERT(ex.kind() == ErrorKind::InvalidFuelPrice);
            }
        }
    ) && ok;

    return ok ? 0 : 1;
}
