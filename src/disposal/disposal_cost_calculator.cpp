/// @file src/disposal/disposal_cost_calculator.cpp
/// @brief DisposalCostCalculator: UF a disposal site charges per load.

#include "disposal_cost_calculator.hpp"

#include "biosettle/errors.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cmath>

namespace biosettle::disposal {

DisposalCostResult
DisposalCostCalculator::calculate_disposal_cost(const Load& load,
                                                std::span<const DisposalSiteTariff> site_tariffs,
                                                Date calculation_date) {
    if (!std::isfinite(load.net_weight_tons) || load.net_weight_tons <= 0.0) {
        throw SettlementError(
            ErrorKind::InvalidWeight,
            fmt::format("load {} net_weight_tons must be positive to price disposal, got {}",
                        load.id, load.net_weight_tons));
    }

    const auto tariff = find_site_tariff(site_tariffs, load.destination_id, calculation_date);
    if (!tariff) {
        throw SettlementError(
            ErrorKind::MissingTariff,
            fmt::format("no disposal tariff in force on {} for site {} (load {})",
                        to_string(calculation_date), load.destination_id, load.id));
    }

    const double weight = std::max(load.net_weight_tons, tariff->min_weight_tons());
    return DisposalCostResult(tariff->site_id(), weight, tariff->rate_per_ton(),
                              weight * tariff->rate_per_ton());
}

std::optional<DisposalSiteTariff>
DisposalCostCalculator::find_site_tariff(std::span<const DisposalSiteTariff> site_tariffs,
                                         NodeId site_id,
                                         Date date) {
    const auto it = std::find_if(site_tariffs.begin(), site_tariffs.end(),
                                 [site_id, date](const DisposalSiteTariff& t) {
                                     return t.site_id() == site_id && t.is_active_on(date);
                                 });
    if (it == site_tariffs.end()) {
        return std::nullopt;
    }
    return *it;
}

}  // namespace biosettle::disposal
