/// @file src/core/settlement.cpp
/// @brief Period settlement engine.

#include "biosettle/settlement.hpp"

#include "../cost/transport_cost_calculator.hpp"
#include "../disposal/disposal_cost_calculator.hpp"
#include "../revenue/client_revenue_calculator.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <iterator>
#include <utility>

namespace biosettle::core {

// ─── SettlementReport ─────────────────────────────────────────────────────────

double SettlementReport::margin_uf() const noexcept {
    return client_revenue_uf - transport_cost_uf - disposal_cost_uf;
}

double SettlementReport::to_clp(double amount_uf) const noexcept {
    return amount_uf * uf_value;
}

std::string SettlementReport::to_string() const {
    std::string out = fmt::format(
        "Settlement {}  ({} .. {})  UF = {:.2f} CLP\n"
        "  Trips settled:   {:6d}\n"
        "  Loads billed:    {:6d}\n"
        "  Disposal lines:  {:6d}\n"
        "  Issues:          {:6d}\n"
        "  ---------------------------------------------------------\n"
        "  {:<20} {:>14} {:>20}\n"
        "  {:<20} {:>14.4f} {:>20.0f}\n"
        "  {:<20} {:>14.4f} {:>20.0f}\n"
        "  {:<20} {:>14.4f} {:>20.0f}\n"
        "  {:<20} {:>14.4f} {:>20.0f}\n",
        period, biosettle::to_string(cycle_start), biosettle::to_string(cycle_end), uf_value,
        trip_costs.size(), revenues.size(), disposals.size(), issues.size(),
        "", "UF", "CLP",
        "Client revenue",  client_revenue_uf, to_clp(client_revenue_uf),
        "Transport cost",  transport_cost_uf, to_clp(transport_cost_uf),
        "Disposal cost",   disposal_cost_uf,  to_clp(disposal_cost_uf),
        "Margin",          margin_uf(),       to_clp(margin_uf()));

    for (const auto& issue : issues) {
        out += fmt::format("  ! {} [{}] {}\n",
                           issue.subject,
                           issue.error ? biosettle::to_string(*issue.error) : "OutOfCycle",
                           issue.message);
    }
    return out;
}

// ─── SettlementEngine ─────────────────────────────────────────────────────────

SettlementEngine::SettlementEngine(SettlementConfig config)
    : config_(std::move(config))
{}

SettlementReport SettlementEngine::settle(const SettlementInput& input) const {
    SettlementReport report;
    report.period      = input.cycle.period_label();
    report.cycle_start = input.cycle.start_date();
    report.cycle_end   = input.cycle.end_date();
    report.uf_value    = input.cycle.uf_value();

    if (config_.verbose) {
        fmt::print(stderr, "[settlement] {}: {} trips, {} routes, {} contractor tariffs\n",
                   report.period, input.trips.size(), input.routes.size(),
                   input.contractor_tariffs.size());
    }

    for (const auto& trip : input.trips) {
        if (config_.skip_out_of_cycle_trips && !input.cycle.contains(trip.date)) {
            record_issue(report, fmt::format("trip {}", trip.trip_id), std::nullopt,
                         fmt::format("dated {}, outside cycle {} .. {}",
                                     biosettle::to_string(trip.date),
                                     biosettle::to_string(report.cycle_start),
                                     biosettle::to_string(report.cycle_end)));
            continue;
        }
        settle_trip(input, trip, report);
    }

    return report;
}

void SettlementEngine::settle_trip(const SettlementInput& input,
                                   const Trip& trip,
                                   SettlementReport& report) const {
    try {
        auto trip_cost = cost::TransportCostCalculator::calculate_trip_cost(
            trip.loads, input.routes, tariff_for(input.contractor_tariffs, trip.vehicle_type),
            input.cycle);

        if (config_.verbose) {
            fmt::print(stderr, "[settlement] trip {} ({}): {}\n",
                       trip.trip_id, biosettle::to_string(trip.vehicle_type), trip_cost.to_string());
        }
        report.transport_cost_uf += trip_cost.total_cost_uf();
        report.trip_costs.push_back(TripCostLine{
            .trip_id      = trip.trip_id,
            .date         = trip.date,
            .vehicle_type = trip.vehicle_type,
            .cost         = std::move(trip_cost),
        });
    } catch (const SettlementError& ex) {
        record_issue(report, fmt::format("trip {}", trip.trip_id), ex.kind(), ex.what());
    }

    // Client billing and disposal do not depend on the contractor cost.
    for (const auto& load : trip.loads) {
        bill_load(input, trip, load, report);
        if (!load.goes_to_treatment && !input.disposal_tariffs.empty()) {
            charge_disposal(input, trip, load, report);
        }
    }
}

void SettlementEngine::bill_load(const SettlementInput& input,
                                 const Trip& trip,
                                 const Load& load,
                                 SettlementReport& report) const {
    try {
        const auto tariffs = tariffs_of_client(input.client_tariffs, load.client_id);
        auto load_revenue = revenue::ClientRevenueCalculator::calculate_load_revenue(
            load, tariffs, input.cycle.uf_value(), trip.date);

        report.client_revenue_uf += load_revenue.total_uf();
        report.revenues.push_back(RevenueLine{
            .trip_id   = trip.trip_id,
            .load_id   = load.id,
            .client_id = load.client_id,
            .revenue   = std::move(load_revenue),
        });
    } catch (const SettlementError& ex) {
        record_issue(report, fmt::format("load {}", load.id), ex.kind(), ex.what());
    }
}

void SettlementEngine::charge_disposal(const SettlementInput& input,
                                       const Trip& trip,
                                       const Load& load,
                                       SettlementReport& report) const {
    try {
        auto site_cost = disposal::DisposalCostCalculator::calculate_disposal_cost(
            load, input.disposal_tariffs, trip.date);

        report.disposal_cost_uf += site_cost.total_uf();
        report.disposals.push_back(DisposalLine{
            .trip_id  = trip.trip_id,
            .load_id  = load.id,
            .disposal = std::move(site_cost),
        });
    } catch (const SettlementError& ex) {
        record_issue(report, fmt::format("load {}", load.id), ex.kind(), ex.what());
    }
}

void SettlementEngine::record_issue(SettlementReport& report,
                                    std::string subject,
                                    std::optional<ErrorKind> error,
                                    std::string message) const {
    if (config_.verbose) {
        fmt::print(stderr, "[settlement] {} skipped: {}\n", subject, message);
    }
    report.issues.push_back(SettlementIssue{
        .subject = std::move(subject),
        .error   = error,
        .message = std::move(message),
    });
}

// ─── Tariff selection ─────────────────────────────────────────────────────────

std::optional<TariffRule>
SettlementEngine::tariff_for(const std::vector<TariffRule>& tariffs, VehicleType type) {
    const auto it = std::find_if(tariffs.begin(), tariffs.end(),
                                 [type](const TariffRule& t) { return t.vehicle_type() == type; });
    if (it == tariffs.end()) {
        return std::nullopt;
    }
    return *it;
}

std::vector<ClientTariff>
SettlementEngine::tariffs_of_client(const std::vector<ClientTariff>& tariffs,
                                    std::int64_t client_id) {
    std::vector<ClientTariff> out;
    std::copy_if(tariffs.begin(), tariffs.end(), std::back_inserter(out),
                 [client_id](const ClientTariff& t) { return t.client_id() == client_id; });
    return out;
}

}  // namespace biosettle::core
