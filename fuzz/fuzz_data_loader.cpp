/**
 * @file  fuzz_data_loader.cpp
 * @brief libFuzzer target for the CSV loader and the settlement pipeline
 *
 * Build:
 *   cmake -DBIOSETTLE_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_data_loader
 *
 * Run for 60 seconds:
 *   ./fuzz_data_loader -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. Every parser accounts for each data row: rows kept + rows skipped
 *      never exceeds the number of lines.
 *   3. Every parsed value satisfies its factory invariants
 *      (distance > 0, rates > 0, finite weights).
 *   4. Settling the parsed trips never throws: calculator failures are
 *      reported as issues, and no trip or load is settled twice.
 *
 * Fuzzer strategy:
 *   The same bytes are fed to every parser, so the fuzzer learns the
 *   column layouts of all five files at once:
 *     • Binary garbage (null bytes, high bytes)
 *     • "nan", "inf", "1e308" numeric tokens
 *     • Missing, extra and empty columns
 *     • CR/LF mixes and comment lines
 *     • Repeated trip ids with disagreeing dates or vehicles
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "biosettle/data_loader.hpp"
#include "biosettle/settlement.hpp"

using namespace biosettle;
using namespace biosettle::core;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view input{
        reinterpret_cast<const char*>(data), size
    };

    std::size_t lines = 1;
    for (char c : input) {
        if (c == '\n') ++lines;
    }

    const auto routes     = DataLoader::parse_routes(input);
    const auto contractor = DataLoader::parse_contractor_tariffs(input);
    const auto client     = DataLoader::parse_client_tariffs(input);
    const auto disposal   = DataLoader::parse_disposal_tariffs(input);
    const auto trips      = DataLoader::parse_trips(input);

    // Invariant 2: row accounting
    assert(routes.rows.size() + routes.skipped <= lines);
    assert(contractor.rows.size() + contractor.skipped <= lines);
    assert(client.rows.size() + client.skipped <= lines);
    assert(disposal.rows.size() + disposal.skipped <= lines);
    assert(trips.rows.size() + trips.skipped <= lines);

    // Invariant 3: factory invariants hold on parsed values
    for (const auto& r : routes.rows) {
        assert(std::isfinite(r.distance_km()) && r.distance_km() > 0.0);
    }
    for (const auto& t : contractor.rows) {
        assert(t.base_rate_per_ton_km() > 0.0 && t.base_fuel_price() > 0.0);
    }
    for (const auto& trip : trips.rows) {
        assert(!trip.loads.empty());
        for (const auto& load : trip.loads) {
            assert(std::isfinite(load.net_weight_tons));
        }
    }

    // Invariant 4: settlement absorbs every calculator failure
    const auto cycle = EconomicCycle::for_period(2025, 11, 37000.0, 1200.0);
    if (!cycle) return 0;

    const SettlementInput settlement_input{
        .cycle              = *cycle,
        .routes             = RouteMap(routes.rows),
        .contractor_tariffs = contractor.rows,
        .client_tariffs     = client.rows,
        .disposal_tariffs   = disposal.rows,
        .trips              = trips.rows,
    };
    const auto report = SettlementEngine{}.settle(settlement_input);

    std::size_t load_count = 0;
    for (const auto& trip : trips.rows) {
        load_count += trip.loads.size();
    }
    assert(report.trip_costs.size() <= trips.rows.size());
    assert(report.revenues.size() <= load_count);
    assert(report.disposals.size() <= load_count);

    (void)report;
    return 0;
}
