/// @file src/core/results.cpp
/// @brief Accessors, currency conversion and summaries of calculation results.

#include "biosettle/results.hpp"
#include "biosettle/errors.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <iterator>
#include <utility>

namespace biosettle {

namespace {

/// Shared guard for every UF → CLP conversion.
[[nodiscard]] double convert_uf(double amount_uf, double uf_value) {
    if (!(uf_value > 0.0)) {
        throw SettlementError(
            ErrorKind::InvalidConversionRate,
            fmt::format("uf_value must be positive to convert {:.4f} UF, got {}",
                        amount_uf, uf_value));
    }
    return amount_uf * uf_value;
}

}  // anonymous namespace

// ─── TripCostResult ───────────────────────────────────────────────────────────

TripCostResult::TripCostResult(double total_cost_uf,
                               double adjustment_factor,
                               double applied_weight_tons,
                               std::vector<BreakdownEntry> breakdown)
    : total_cost_uf_(total_cost_uf)
    , adjustment_factor_(adjustment_factor)
    , applied_weight_tons_(applied_weight_tons)
    , segment_breakdown_(std::move(breakdown))
{}

std::vector<BreakdownEntry> TripCostResult::legs() const {
    std::vector<BreakdownEntry> out;
    std::copy_if(segment_breakdown_.begin(), segment_breakdown_.end(),
                 std::back_inserter(out),
                 [](const BreakdownEntry& e) { return e.kind == BreakdownKind::LegCost; });
    return out;
}

std::optional<BreakdownEntry> TripCostResult::find(BreakdownKind kind) const {
    const auto it = std::find_if(segment_breakdown_.begin(), segment_breakdown_.end(),
                                 [kind](const BreakdownEntry& e) { return e.kind == kind; });
    if (it == segment_breakdown_.end()) {
        return std::nullopt;
    }
    return *it;
}

double TripCostResult::to_currency(double uf_value) const {
    return convert_uf(total_cost_uf_, uf_value);
}

std::string TripCostResult::to_string() const {
    return fmt::format("{:.4f} UF (factor {:.4f}, {:.2f} t)",
                       total_cost_uf_, adjustment_factor_, applied_weight_tons_);
}

// ─── RevenueResult ────────────────────────────────────────────────────────────

RevenueResult::RevenueResult(double total_uf, double total_clp,
                             std::array<double, 3> breakdown) noexcept
    : total_uf_(total_uf)
    , total_clp_(total_clp)
    , concept_breakdown_(breakdown)
{}

std::string RevenueResult::to_string() const {
    return fmt::format("{:.4f} UF = {:.0f} CLP  [{} {:.4f} | {} {:.4f} | {} {:.4f}]",
                       total_uf_, total_clp_,
                       biosettle::to_string(BillingConcept::Transporte),
                       amount(BillingConcept::Transporte),
                       biosettle::to_string(BillingConcept::Disposicion),
                       amount(BillingConcept::Disposicion),
                       biosettle::to_string(BillingConcept::Tratamiento),
                       amount(BillingConcept::Tratamiento));
}

// ─── DisposalCostResult ───────────────────────────────────────────────────────

DisposalCostResult::DisposalCostResult(NodeId site, double weight,
                                       double rate, double total) noexcept
    : site_id_(site)
    , billable_weight_tons_(weight)
    , rate_per_ton_(rate)
    , total_uf_(total)
{}

double DisposalCostResult::to_currency(double uf_value) const {
    return convert_uf(total_uf_, uf_value);
}

}  // namespace biosettle
