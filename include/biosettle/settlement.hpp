#pragma once

/// @file include/biosettle/settlement.hpp
/// @brief Period settlement engine: public API.
///
/// # Module: Settlement Engine
///
/// ## Responsibility
/// Settle one billing cycle: price every trip for its contractor, bill every
/// load to its client, charge disposal for every load delivered to a site,
/// and total the period in UF and CLP.
///
/// ## Pipeline
///   trips → TransportCostCalculator   (tariff of the trip's vehicle type)
///   loads → ClientRevenueCalculator   (tariffs of the load's client, trip date)
///   loads → DisposalCostCalculator    (site tariff, loads not sent to treatment)
///   lines → SettlementReport totals, margin = revenue − transport − disposal
///
/// ## Usage
/// ```cpp
/// SettlementEngine engine;
/// auto report = engine.settle(input);
/// fmt::print("{}\n", report.to_string());
/// ```
///
/// ## Guarantees
/// - Each calculation is atomic: a failing trip or load yields a
///   `SettlementIssue` and no line, the rest of the batch still settles
/// - `settle` is const and does not modify its input

#include "biosettle/errors.hpp"
#include "biosettle/results.hpp"
#include "biosettle/routes.hpp"
#include "biosettle/tariffs.hpp"
#include "biosettle/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace biosettle::core {

// ─── Inputs ───────────────────────────────────────────────────────────────────

/// One vehicle movement and the loads it carried, in pickup order.
struct Trip {
    std::string       trip_id;
    Date              date;
    VehicleType       vehicle_type;
    std::vector<Load> loads;
};

struct SettlementInput {
    EconomicCycle                   cycle;
    RouteMap                        routes;
    std::vector<TariffRule>         contractor_tariffs;  ///< First rule per vehicle type wins
    std::vector<ClientTariff>       client_tariffs;      ///< All clients, filtered per load
    std::vector<DisposalSiteTariff> disposal_tariffs;    ///< Empty: disposal is not settled
    std::vector<Trip>               trips;
};

// ─── SettlementConfig ─────────────────────────────────────────────────────────

struct SettlementConfig {
    /// Report trips dated outside the cycle as issues instead of settling them.
    bool skip_out_of_cycle_trips = true;

    /// If true, emit per-trip diagnostics to stderr.
    bool verbose = false;
};

// ─── Report lines ─────────────────────────────────────────────────────────────

struct TripCostLine {
    std::string    trip_id;
    Date           date;
    VehicleType    vehicle_type;
    TripCostResult cost;
};

struct RevenueLine {
    std::string   trip_id;
    std::int64_t  load_id;
    std::int64_t  client_id;
    RevenueResult revenue;
};

struct DisposalLine {
    std::string        trip_id;
    std::int64_t       load_id;
    DisposalCostResult disposal;
};

/// A trip or load that could not be settled.
struct SettlementIssue {
    std::string              subject;  ///< "trip T-1" or "load 42"
    std::optional<ErrorKind> error;    ///< Empty for trips outside the cycle
    std::string              message;
};

// ─── SettlementReport ─────────────────────────────────────────────────────────

struct SettlementReport {
    std::string period;     ///< "YYYY-MM"
    Date        cycle_start;
    Date        cycle_end;
    double      uf_value = 0.0;

    std::vector<TripCostLine>    trip_costs;
    std::vector<RevenueLine>     revenues;
    std::vector<DisposalLine>    disposals;
    std::vector<SettlementIssue> issues;

    double transport_cost_uf = 0.0;
    double client_revenue_uf = 0.0;
    double disposal_cost_uf  = 0.0;

    /// client_revenue − transport_cost − disposal_cost.
    [[nodiscard]] double margin_uf() const noexcept;

    /// UF amount at the cycle's UF value.
    [[nodiscard]] double to_clp(double amount_uf) const noexcept;

    [[nodiscard]] bool has_issues() const noexcept { return !issues.empty(); }

    /// Formatted period summary.
    [[nodiscard]] std::string to_string() const;
};

// ─── SettlementEngine ─────────────────────────────────────────────────────────

class SettlementEngine {
public:
    explicit SettlementEngine(SettlementConfig config = SettlementConfig{});

    [[nodiscard]] SettlementReport settle(const SettlementInput& input) const;

    [[nodiscard]] const SettlementConfig& config() const noexcept { return config_; }

private:
    void settle_trip(const SettlementInput& input,
                     const Trip& trip,
                     SettlementReport& report) const;

    void bill_load(const SettlementInput& input,
                   const Trip& trip,
                   const Load& load,
                   SettlementReport& report) const;

    void charge_disposal(const SettlementInput& input,
                         const Trip& trip,
                         const Load& load,
                         SettlementReport& report) const;

    void record_issue(SettlementReport& report,
                      std::string subject,
                      std::optional<ErrorKind> error,
                      std::string message) const;

    [[nodiscard]] static std::optional<TariffRule>
    tariff_for(const std::vector<TariffRule>& tariffs, VehicleType type);

    [[nodiscard]] static std::vector<ClientTariff>
    tariffs_of_client(const std::vector<ClientTariff>& tariffs, std::int64_t client_id);

    SettlementConfig config_;
};

}  // namespace biosettle::core
