#pragma once

/// @file include/biosettle/errors.hpp
/// @brief Error taxonomy shared by every calculator.
///
/// All failures are input-validation or missing-configuration errors. None
/// is transient: retrying with the same inputs always fails the same way.

#include <stdexcept>
#include <string>
#include <string_view>

namespace biosettle {

enum class ErrorKind {
    InvalidFuelPrice,       ///< base_fuel_price <= 0
    EmptyLoadList,          ///< trip cost requested for zero loads
    MissingTariff,          ///< no applicable tariff (including expired ones)
    InvalidRoute,           ///< no distance route for a required leg
    InvalidWeight,          ///< net_weight_tons <= 0
    InvalidConversionRate,  ///< uf_value <= 0
    UnsupportedTripShape,   ///< linked trip with more than two loads
};

[[nodiscard]] std::string_view to_string(ErrorKind kind) noexcept;

/// Exception thrown by calculators when a precondition is violated.
///
/// `what()` carries the context needed to fix the input (ids, concept,
/// date, offending value).
class SettlementError : public std::runtime_error {
public:
    SettlementError(ErrorKind kind, const std::string& message);

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

}  // namespace biosettle
