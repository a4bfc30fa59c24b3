#pragma once

/// @file include/biosettle/results.hpp
/// @brief Immutable calculation results returned to the billing orchestrator.
///
/// Results are created only by their calculator (private constructors with
/// a friend declaration) and expose const accessors. Amounts are in UF; the
/// `to_currency` helpers convert to CLP with a caller-supplied UF value.

#include "biosettle/types.hpp"

#include <array>
#include <optional>
#include <string>
#include <vector>

namespace biosettle {

namespace cost { class TransportCostCalculator; }
namespace revenue { class ClientRevenueCalculator; }
namespace disposal { class DisposalCostCalculator; }

// ─── TripCostResult ───────────────────────────────────────────────────────────

/// What a breakdown entry measures.
enum class BreakdownKind {
    LegCost,             ///< UF amount of one leg (after fuel adjustment)
    TotalDistanceKm,     ///< Sum of leg distances
    BillableWeightTons,  ///< Weight billed on the heaviest leg
};

struct BreakdownEntry {
    BreakdownKind kind;
    std::string   label;  ///< Stable, human-readable label
    double        value;
};

/// Amount owed to a transport contractor for one trip.
class TripCostResult {
public:
    [[nodiscard]] double total_cost_uf() const noexcept { return total_cost_uf_; }
    [[nodiscard]] double adjustment_factor() const noexcept { return adjustment_factor_; }

    /// Billable weight of the main (heaviest) leg.
    [[nodiscard]] double applied_weight_tons() const noexcept { return applied_weight_tons_; }

    /// Leg costs in travel order, followed by metadata entries.
    [[nodiscard]] const std::vector<BreakdownEntry>& segment_breakdown() const noexcept {
        return segment_breakdown_;
    }

    /// Leg cost entries only, in travel order.
    [[nodiscard]] std::vector<BreakdownEntry> legs() const;

    /// First entry of the given kind, if any.
    [[nodiscard]] std::optional<BreakdownEntry> find(BreakdownKind kind) const;

    /// total_cost_uf × uf_value.
    ///
    /// # Throws
    /// `SettlementError{InvalidConversionRate}` if `uf_value <= 0`.
    [[nodiscard]] double to_currency(double uf_value) const;

    /// One-line summary, e.g. "37.9080 UF (factor 1.2000, 18.00 t)".
    [[nodiscard]] std::string to_string() const;

private:
    friend class cost::TransportCostCalculator;

    TripCostResult(double total_cost_uf,
                   double adjustment_factor,
                   double applied_weight_tons,
                   std::vector<BreakdownEntry> breakdown);

    double                      total_cost_uf_;
    double                      adjustment_factor_;
    double                      applied_weight_tons_;
    std::vector<BreakdownEntry> segment_breakdown_;
};

// ─── RevenueResult ────────────────────────────────────────────────────────────

/// Amount billed to the client that generated a load, split by concept.
class RevenueResult {
public:
    [[nodiscard]] double total_uf() const noexcept { return total_uf_; }
    [[nodiscard]] double total_clp() const noexcept { return total_clp_; }

    /// UF amount of one concept; 0 for a concept that was not charged.
    [[nodiscard]] double amount(BillingConcept billing_concept) const noexcept {
        return concept_breakdown_[index_of(billing_concept)];
    }

    /// Amounts indexed in `ALL_CONCEPTS` order.
    [[nodiscard]] const std::array<double, 3>& concept_breakdown() const noexcept {
        return concept_breakdown_;
    }

    [[nodiscard]] std::string to_string() const;

private:
    friend class revenue::ClientRevenueCalculator;

    RevenueResult(double total_uf, double total_clp,
                  std::array<double, 3> breakdown) noexcept;

    double                total_uf_;
    double                total_clp_;
    std::array<double, 3> concept_breakdown_;
};

// ─── DisposalCostResult ───────────────────────────────────────────────────────

/// Amount a disposal site charges for receiving one load.
class DisposalCostResult {
public:
    [[nodiscard]] NodeId site_id() const noexcept { return site_id_; }
    [[nodiscard]] double billable_weight_tons() const noexcept { return billable_weight_tons_; }
    [[nodiscard]] double rate_per_ton() const noexcept { return rate_per_ton_; }
    [[nodiscard]] double total_uf() const noexcept { return total_uf_; }

    /// # Throws
    /// `SettlementError{InvalidConversionRate}` if `uf_value <= 0`.
    [[nodiscard]] double to_currency(double uf_value) const;

private:
    friend class disposal::DisposalCostCalculator;

    DisposalCostResult(NodeId site, double weight, double rate, double total) noexcept;

    NodeId site_id_;
    double billable_weight_tons_;
    double rate_per_ton_;
    double total_uf_;
};

}  // namespace biosettle
