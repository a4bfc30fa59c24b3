/// @file src/core/tariffs.cpp
/// @brief Factories and validity checks for tariff and cycle value types.

#include "biosettle/tariffs.hpp"
#include "biosettle/constants.hpp"

#include <fmt/core.h>

#include <cmath>
#include <utility>

namespace biosettle {

namespace {

[[nodiscard]] bool is_positive(double v) noexcept {
    return std::isfinite(v) && v > 0.0;
}

[[nodiscard]] bool is_non_negative(double v) noexcept {
    return std::isfinite(v) && v >= 0.0;
}

}  // anonymous namespace

// ─── TariffRule ───────────────────────────────────────────────────────────────

TariffRule::TariffRule(double rate, double min_weight, VehicleType type, double fuel) noexcept
    : base_rate_per_ton_km_(rate)
    , min_weight_tons_(min_weight)
    , vehicle_type_(type)
    , base_fuel_price_(fuel)
{}

std::optional<TariffRule>
TariffRule::make(double base_rate_per_ton_km,
                 double min_weight_tons,
                 VehicleType vehicle_type,
                 double base_fuel_price) noexcept {
    if (!is_positive(base_rate_per_ton_km)) return std::nullopt;
    if (!is_non_negative(min_weight_tons))  return std::nullopt;
    if (!is_positive(base_fuel_price))      return std::nullopt;

    return TariffRule(base_rate_per_ton_km, min_weight_tons, vehicle_type, base_fuel_price);
}

// ─── EconomicCycle ────────────────────────────────────────────────────────────

EconomicCycle::EconomicCycle(double uf, double fuel, bool closed, Date start, Date end) noexcept
    : uf_value_(uf)
    , fuel_price_(fuel)
    , is_closed_(closed)
    , start_date_(start)
    , end_date_(end)
{}

std::optional<EconomicCycle>
EconomicCycle::make(double uf_value,
                    double fuel_price,
                    bool   is_closed,
                    Date   start_date,
                    Date   end_date) noexcept {
    if (!is_positive(uf_value) || !is_positive(fuel_price)) {
        return std::nullopt;
    }
    if (!start_date.ok() || !end_date.ok() || end_date < start_date) {
        return std::nullopt;
    }
    return EconomicCycle(uf_value, fuel_price, is_closed, start_date, end_date);
}

std::optional<EconomicCycle>
EconomicCycle::for_period(int year,
                          unsigned month,
                          double uf_value,
                          double fuel_price,
                          bool is_closed) noexcept {
    if (month < 1 || month > 12) {
        return std::nullopt;
    }

    using std::chrono::day;
    using std::chrono::months;

    const std::chrono::year_month settled{std::chrono::year{year}, std::chrono::month{month}};
    const Date end{settled / day{constants::CYCLE_END_DAY}};
    const Date start{(settled - months{1}) / day{constants::CYCLE_START_DAY}};

    return make(uf_value, fuel_price, is_closed, start, end);
}

bool EconomicCycle::contains(Date date) const noexcept {
    return start_date_ <= date && date <= end_date_;
}

std::string EconomicCycle::period_label() const {
    return fmt::format("{:04d}-{:02d}",
                       static_cast<int>(end_date_.year()),
                       static_cast<unsigned>(end_date_.month()));
}

// ─── ValidityWindow ───────────────────────────────────────────────────────────

bool ValidityWindow::contains(Date date) const noexcept {
    if (date < valid_from) {
        return false;
    }
    return !valid_to.has_value() || date <= *valid_to;
}

bool ValidityWindow::is_well_formed() const noexcept {
    if (!valid_from.ok()) {
        return false;
    }
    if (valid_to.has_value()) {
        return valid_to->ok() && *valid_to >= valid_from;
    }
    return true;
}

// ─── ClientTariff ─────────────────────────────────────────────────────────────

ClientTariff::ClientTariff(std::int64_t client, BillingConcept c, double rate,
                           double min_weight, ValidityWindow window) noexcept
    : client_id_(client)
    , concept_(c)
    , rate_per_ton_(rate)
    , min_weight_tons_(min_weight)
    , window_(std::move(window))
{}

std::optional<ClientTariff>
ClientTariff::make(std::int64_t client_id,
                   BillingConcept billing_concept,
                   double rate_per_ton,
                   double min_weight_tons,
                   Date valid_from,
                   std::optional<Date> valid_to) noexcept {
    if (!is_positive(rate_per_ton))        return std::nullopt;
    if (!is_non_negative(min_weight_tons)) return std::nullopt;

    ValidityWindow window{valid_from, valid_to};
    if (!window.is_well_formed()) {
        return std::nullopt;
    }
    return ClientTariff(client_id, billing_concept, rate_per_ton, min_weight_tons, window);
}

// ─── DisposalSiteTariff ───────────────────────────────────────────────────────

DisposalSiteTariff::DisposalSiteTariff(NodeId site, double rate, double min_weight,
                                       ValidityWindow window) noexcept
    : site_id_(site)
    , rate_per_ton_(rate)
    , min_weight_tons_(min_weight)
    , window_(std::move(window))
{}

std::optional<DisposalSiteTariff>
DisposalSiteTariff::make(NodeId site_id,
                         double rate_per_ton,
                         double min_weight_tons,
                         Date valid_from,
                         std::optional<Date> valid_to) noexcept {
    if (!is_positive(rate_per_ton))        return std::nullopt;
    if (!is_non_negative(min_weight_tons)) return std::nullopt;

    ValidityWindow window{valid_from, valid_to};
    if (!window.is_well_formed()) {
        return std::nullopt;
    }
    return DisposalSiteTariff(site_id, rate_per_ton, min_weight_tons, window);
}

}  // namespace biosettle
