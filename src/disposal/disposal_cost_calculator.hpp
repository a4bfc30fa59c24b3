#pragma once

/// @file src/disposal/disposal_cost_calculator.hpp
/// @brief DisposalCostCalculator: UF a disposal site charges per load.
///
/// A disposal site bills `rate_per_ton · max(net_weight, min_weight)` for
/// every load it receives, using the site's tariff in force on the
/// calculation date. Loads bound for a treatment plant never reach a site and
/// are not priced here; the settlement engine skips them.

#include "biosettle/results.hpp"
#include "biosettle/tariffs.hpp"
#include "biosettle/types.hpp"

#include <optional>
#include <span>

namespace biosettle::disposal {

class DisposalCostCalculator {
public:
    DisposalCostCalculator() = delete;

    /// # Throws
    /// `SettlementError` with kind
    /// - `InvalidWeight` if `load.net_weight_tons <= 0`
    /// - `MissingTariff` if no tariff for `load.destination_id` is in force
    [[nodiscard]] static DisposalCostResult
    calculate_disposal_cost(const Load& load,
                            std::span<const DisposalSiteTariff> site_tariffs,
                            Date calculation_date);

    /// First tariff of `site_id` in force on `date`.
    [[nodiscard]] static std::optional<DisposalSiteTariff>
    find_site_tariff(std::span<const DisposalSiteTariff> site_tariffs,
                     NodeId site_id,
                     Date date);
};

}  // namespace biosettle::disposal
