/// @file src/core/errors.cpp
/// @brief SettlementError and error-kind names.

#include "biosettle/errors.hpp"

namespace biosettle {

std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::InvalidFuelPrice:      return "InvalidFuelPrice";
        case ErrorKind::EmptyLoadList:         return "EmptyLoadList";
        case ErrorKind::MissingTariff:         return "MissingTariff";
        case ErrorKind::InvalidRoute:          return "InvalidRoute";
        case ErrorKind::InvalidWeight:         return "InvalidWeight";
        case ErrorKind::InvalidConversionRate: return "InvalidConversionRate";
        case ErrorKind::UnsupportedTripShape:  return "UnsupportedTripShape";
    }
    return "Unknown";
}

SettlementError::SettlementError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message)
    , kind_(kind)
{}

}  // namespace biosettle
