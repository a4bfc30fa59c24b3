#pragma once

/// @file src/revenue/client_revenue_calculator.hpp
/// @brief ClientRevenueCalculator: UF/CLP billed to a client per load.
///
/// # Module: Client Revenue Calculator
///
/// ## Responsibility
/// Bill the client that generated a load across three independent concepts:
///   - TRANSPORTE   always charged
///   - DISPOSICION  always charged
///   - TRATAMIENTO  charged only when the load goes to a treatment plant,
///                  otherwise recorded as 0 for auditability
///
/// ## Core Formula (per concept)
/// ```
/// amount_uf = rate_per_ton · max(net_weight_tons, min_weight_tons)
/// total_clp = Σ amount_uf · uf_value
/// ```
///
/// ## Tariff Selection
/// Only tariffs in force on the calculation date are considered
/// (`valid_from <= date <= valid_to`, open-ended when `valid_to` is empty).
/// The first in-force tariff for a concept wins.
///
/// ## Guarantees
/// - No cross-concept discount or cap
/// - Stateless; failures throw before any result exists

#include "biosettle/results.hpp"
#include "biosettle/tariffs.hpp"
#include "biosettle/types.hpp"

#include <optional>
#include <span>
#include <vector>

namespace biosettle::revenue {

class ClientRevenueCalculator {
public:
    ClientRevenueCalculator() = delete;

    /// Compute the revenue of one load.
    ///
    /// # Arguments
    /// * `load`            : Load to bill (net weight must be > 0)
    /// * `tariffs`         : Client tariffs; out-of-window ones are ignored
    /// * `uf_value`        : CLP per UF (must be > 0)
    /// * `calculation_date`: Date the validity windows are checked against
    ///
    /// # Throws
    /// `SettlementError` with kind
    /// - `InvalidWeight`         if `load.net_weight_tons <= 0`
    /// - `InvalidConversionRate` if `uf_value <= 0`
    /// - `MissingTariff`         if a charged concept has no in-force tariff
    [[nodiscard]] static RevenueResult
    calculate_load_revenue(const Load& load,
                           std::span<const ClientTariff> tariffs,
                           double uf_value,
                           Date calculation_date = today());

    /// Tariffs in force on `date`, in input order.
    [[nodiscard]] static std::vector<ClientTariff>
    active_tariffs(std::span<const ClientTariff> tariffs, Date date);

    /// First tariff for `billing_concept`, if any.
    [[nodiscard]] static std::optional<ClientTariff>
    find_tariff(std::span<const ClientTariff> tariffs, BillingConcept billing_concept);

private:
    [[nodiscard]] static double
    concept_amount(const Load& load,
                   std::span<const ClientTariff> active,
                   BillingConcept billing_concept,
                   Date calculation_date);
};

}  // namespace biosettle::revenue
