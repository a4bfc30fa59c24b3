/// @file src/revenue/client_revenue_calculator.cpp
/// @brief ClientRevenueCalculator: UF/CLP billed to a client per load.

#include "client_revenue_calculator.hpp"

#include "biosettle/errors.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <iterator>

namespace biosettle::revenue {

// ─── calculate_load_revenue ───────────────────────────────────────────────────

RevenueResult
ClientRevenueCalculator::calculate_load_revenue(const Load& load,
                                                std::span<const ClientTariff> tariffs,
                                                double uf_value,
                                                Date calculation_date) {
    if (!std::isfinite(load.net_weight_tons) || load.net_weight_tons <= 0.0) {
        throw SettlementError(
            ErrorKind::InvalidWeight,
            fmt::format("load {} net_weight_tons must be positive to bill revenue, got {}",
                        load.id, load.net_weight_tons));
    }
    if (!std::isfinite(uf_value) || uf_value <= 0.0) {
        throw SettlementError(
            ErrorKind::InvalidConversionRate,
            fmt::format("uf_value must be positive to bill load {}, got {}",
                        load.id, uf_value));
    }

    const auto active = active_tariffs(tariffs, calculation_date);

    std::array<double, 3> breakdown{};
    breakdown[index_of(BillingConcept::Transporte)] =
        concept_amount(load, active, BillingConcept::Transporte, calculation_date);
    breakdown[index_of(BillingConcept::Disposicion)] =
        concept_amount(load, active, BillingConcept::Disposicion, calculation_date);

    // Treatment is billed only for loads routed through a treatment plant;
    // otherwise the zero entry stays in the breakdown.
    if (load.goes_to_treatment) {
        breakdown[index_of(BillingConcept::Tratamiento)] =
            concept_amount(load, active, BillingConcept::Tratamiento, calculation_date);
    }

    double total_uf = 0.0;
    for (double amount : breakdown) {
        total_uf += amount;
    }

    return RevenueResult(total_uf, total_uf * uf_value, breakdown);
}

// ─── active_tariffs ───────────────────────────────────────────────────────────

std::vector<ClientTariff>
ClientRevenueCalculator::active_tariffs(std::span<const ClientTariff> tariffs, Date date) {
    std::vector<ClientTariff> active;
    std::copy_if(tariffs.begin(), tariffs.end(), std::back_inserter(active),
                 [date](const ClientTariff& t) { return t.is_active_on(date); });
    return active;
}

// ─── find_tariff ──────────────────────────────────────────────────────────────

std::optional<ClientTariff>
ClientRevenueCalculator::find_tariff(std::span<const ClientTariff> tariffs,
                                     BillingConcept billing_concept) {
    const auto it = std::find_if(tariffs.begin(), tariffs.end(),
                                 [billing_concept](const ClientTariff& t) {
                                     return t.billing_concept() == billing_concept;
                                 });
    if (it == tariffs.end()) {
        return std::nullopt;
    }
    return *it;
}

// ─── concept_amount ───────────────────────────────────────────────────────────

double ClientRevenueCalculator::concept_amount(const Load& load,
                                               std::span<const ClientTariff> active,
                                               BillingConcept billing_concept,
                                               Date calculation_date) {
    const auto tariff = find_tariff(active, billing_concept);
    if (!tariff) {
        throw SettlementError(
            ErrorKind::MissingTariff,
            fmt::format("no {} tariff in force on {} for client {} (load {})",
                        to_string(billing_concept), to_string(calculation_date),
                        load.client_id, load.id));
    }

    const double billable_weight = std::max(load.net_weight_tons, tariff->min_weight_tons());
    return tariff->rate_per_ton() * billable_weight;
}

}  // namespace biosettle::revenue
