#pragma once

/// @file include/biosettle/tariffs.hpp
/// @brief Immutable tariff and economic-cycle value types.
///
/// # Module: Domain Value Types
///
/// ## Responsibility
/// Hold the pricing configuration the calculators read: contractor tariff
/// rules, client tariffs per billing concept, disposal-site tariffs, and the
/// economic snapshot of a billing period.
///
/// ## Guarantees
/// - Every type is built through a static `make(...)` factory that returns
///   `std::nullopt` when an invariant is violated, so an existing instance is
///   always valid
/// - Instances are immutable: fields are private, accessors are const
/// - Non-finite numeric inputs are rejected
///
/// ## NOT Responsible For
/// - Choosing which tariff applies to a load (see the calculators)
/// - Loading configuration from disk (see data_loader.hpp)

#include "biosettle/types.hpp"

#include <cstdint>
#include <optional>

namespace biosettle {

// ─── TariffRule ───────────────────────────────────────────────────────────────

/// A contractor's pricing rule for one vehicle configuration.
class TariffRule {
public:
    /// # Returns
    /// `nullopt` unless `base_rate_per_ton_km > 0`, `min_weight_tons >= 0`
    /// and `base_fuel_price > 0`.
    [[nodiscard]] static std::optional<TariffRule>
    make(double base_rate_per_ton_km,
         double min_weight_tons,
         VehicleType vehicle_type,
         double base_fuel_price) noexcept;

    [[nodiscard]] double base_rate_per_ton_km() const noexcept { return base_rate_per_ton_km_; }
    [[nodiscard]] double min_weight_tons() const noexcept { return min_weight_tons_; }
    [[nodiscard]] VehicleType vehicle_type() const noexcept { return vehicle_type_; }
    [[nodiscard]] double base_fuel_price() const noexcept { return base_fuel_price_; }

private:
    TariffRule(double rate, double min_weight, VehicleType type, double fuel) noexcept;

    double      base_rate_per_ton_km_;  ///< UF per ton-km
    double      min_weight_tons_;       ///< Guaranteed minimum billable weight
    VehicleType vehicle_type_;
    double      base_fuel_price_;       ///< Contractual reference fuel price
};

// ─── EconomicCycle ────────────────────────────────────────────────────────────

/// Economic snapshot of one billing period.
class EconomicCycle {
public:
    /// # Returns
    /// `nullopt` unless `uf_value > 0`, `fuel_price > 0`, both dates are valid
    /// calendar days and `end_date >= start_date`.
    [[nodiscard]] static std::optional<EconomicCycle>
    make(double uf_value,
         double fuel_price,
         bool   is_closed,
         Date   start_date,
         Date   end_date) noexcept;

    /// Cycle for a settlement month: day 19 of the previous month through
    /// day 18 of `month`. January wraps to December of `year - 1`.
    ///
    /// # Returns
    /// `nullopt` if `month` is outside 1..12 or the prices are invalid.
    [[nodiscard]] static std::optional<EconomicCycle>
    for_period(int year,
               unsigned month,
               double uf_value,
               double fuel_price,
               bool is_closed = false) noexcept;

    [[nodiscard]] double uf_value() const noexcept { return uf_value_; }
    [[nodiscard]] double fuel_price() const noexcept { return fuel_price_; }
    [[nodiscard]] bool is_closed() const noexcept { return is_closed_; }
    [[nodiscard]] Date start_date() const noexcept { return start_date_; }
    [[nodiscard]] Date end_date() const noexcept { return end_date_; }

    /// True if `date` falls within [start_date, end_date].
    [[nodiscard]] bool contains(Date date) const noexcept;

    /// "YYYY-MM" of the settled month (the end date's month).
    [[nodiscard]] std::string period_label() const;

private:
    EconomicCycle(double uf, double fuel, bool closed, Date start, Date end) noexcept;

    double uf_value_;
    double fuel_price_;
    bool   is_closed_;   ///< Informational only to the calculators
    Date   start_date_;
    Date   end_date_;
};

// ─── ValidityWindow ───────────────────────────────────────────────────────────

/// Inclusive date range a tariff is in force. An empty `valid_to` is
/// open-ended.
struct ValidityWindow {
    Date                valid_from;
    std::optional<Date> valid_to;

    /// `valid_from <= date` and (`valid_to` empty or `date <= valid_to`).
    [[nodiscard]] bool contains(Date date) const noexcept;

    /// Both dates are real days and `valid_to >= valid_from` when present.
    [[nodiscard]] bool is_well_formed() const noexcept;
};

// ─── ClientTariff ─────────────────────────────────────────────────────────────

/// One client's price for one billing concept.
class ClientTariff {
public:
    [[nodiscard]] static std::optional<ClientTariff>
    make(std::int64_t client_id,
         BillingConcept billing_concept,
         double rate_per_ton,
         double min_weight_tons,
         Date valid_from,
         std::optional<Date> valid_to = std::nullopt) noexcept;

    [[nodiscard]] std::int64_t client_id() const noexcept { return client_id_; }
    [[nodiscard]] BillingConcept billing_concept() const noexcept { return concept_; }
    [[nodiscard]] double rate_per_ton() const noexcept { return rate_per_ton_; }
    [[nodiscard]] double min_weight_tons() const noexcept { return min_weight_tons_; }
    [[nodiscard]] Date valid_from() const noexcept { return window_.valid_from; }
    [[nodiscard]] std::optional<Date> valid_to() const noexcept { return window_.valid_to; }

    [[nodiscard]] bool is_active_on(Date date) const noexcept {
        return window_.contains(date);
    }

private:
    ClientTariff(std::int64_t client, BillingConcept c, double rate,
                 double min_weight, ValidityWindow window) noexcept;

    std::int64_t   client_id_;
    BillingConcept concept_;
    double         rate_per_ton_;     ///< UF per ton
    double         min_weight_tons_;
    ValidityWindow window_;
};

// ─── DisposalSiteTariff ───────────────────────────────────────────────────────

/// What a disposal site charges per ton received.
class DisposalSiteTariff {
public:
    [[nodiscard]] static std::optional<DisposalSiteTariff>
    make(NodeId site_id,
         double rate_per_ton,
         double min_weight_tons,
         Date valid_from,
         std::optional<Date> valid_to = std::nullopt) noexcept;

    [[nodiscard]] NodeId site_id() const noexcept { return site_id_; }
    [[nodiscard]] double rate_per_ton() const noexcept { return rate_per_ton_; }
    [[nodiscard]] double min_weight_tons() const noexcept { return min_weight_tons_; }
    [[nodiscard]] Date valid_from() const noexcept { return window_.valid_from; }
    [[nodiscard]] std::optional<Date> valid_to() const noexcept { return window_.valid_to; }

    [[nodiscard]] bool is_active_on(Date date) const noexcept {
        return window_.contains(date);
    }

private:
    DisposalSiteTariff(NodeId site, double rate, double min_weight,
                       ValidityWindow window) noexcept;

    NodeId         site_id_;
    double         rate_per_ton_;
    double         min_weight_tons_;
    ValidityWindow window_;
};

}  // namespace biosettle
