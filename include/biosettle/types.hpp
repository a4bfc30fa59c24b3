#pragma once

/// @file include/biosettle/types.hpp
/// @brief Shared primitive types for the biosolids settlement engine.
///
/// All calculator modules include this file. It defines the closed
/// enumerations used on tariffs and results, the calendar date alias, and the
/// read-only `Load` projection consumed from the logistics side.

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace biosettle {

/// Opaque identifier of a logistics node (facility, treatment plant or site).
using NodeId = std::int64_t;

/// Calendar date used for tariff validity windows and billing cycles.
using Date = std::chrono::year_month_day;

// ─── Enumerations ─────────────────────────────────────────────────────────────

/// Vehicle configuration a contractor tariff applies to.
enum class VehicleType {
    Batea,            ///< Tipper truck, direct loading
    AmplirollSimple,  ///< Hook-lift truck carrying a single container
    AmplirollCarro,   ///< Hook-lift truck with trailer
};

/// Concept a client is billed for on each load.
enum class BillingConcept {
    Transporte,
    Disposicion,
    Tratamiento,
};

inline constexpr std::array<VehicleType, 3> ALL_VEHICLE_TYPES{
    VehicleType::Batea,
    VehicleType::AmplirollSimple,
    VehicleType::AmplirollCarro,
};

inline constexpr std::array<BillingConcept, 3> ALL_CONCEPTS{
    BillingConcept::Transporte,
    BillingConcept::Disposicion,
    BillingConcept::Tratamiento,
};

/// Wire name of a vehicle type ("BATEA", "AMPLIROLL_SIMPLE", "AMPLIROLL_CARRO").
[[nodiscard]] std::string_view to_string(VehicleType type) noexcept;

/// Wire name of a billing concept ("TRANSPORTE", "DISPOSICION", "TRATAMIENTO").
[[nodiscard]] std::string_view to_string(BillingConcept concept_) noexcept;

/// Parse a vehicle type wire name (case-insensitive).
///
/// The legacy name "AMPLIROLL" maps to `AmplirollSimple`.
///
/// # Returns
/// `nullopt` for any name outside the closed set.
[[nodiscard]] std::optional<VehicleType>
parse_vehicle_type(std::string_view text) noexcept;

/// Parse a billing concept wire name (case-insensitive).
[[nodiscard]] std::optional<BillingConcept>
parse_concept(std::string_view text) noexcept;

/// Position of a concept in `ALL_CONCEPTS`.
[[nodiscard]] constexpr std::size_t index_of(BillingConcept concept_) noexcept {
    return static_cast<std::size_t>(concept_);
}

// ─── Dates ────────────────────────────────────────────────────────────────────

/// ISO-8601 calendar form, e.g. "2025-11-18".
[[nodiscard]] std::string to_string(Date date);

/// Parse a strict `YYYY-MM-DD` date.
///
/// # Returns
/// `nullopt` if the text is malformed or names a day that does not exist.
[[nodiscard]] std::optional<Date> parse_date(std::string_view text) noexcept;

/// Current UTC calendar date.
[[nodiscard]] Date today() noexcept;

// ─── Load ─────────────────────────────────────────────────────────────────────

/// Minimal read-only projection of a logistics load.
///
/// Owned and mutated by the logistics module; calculators only read it.
struct Load {
    std::int64_t id = 0;                ///< Load identifier (reporting only)
    std::int64_t client_id = 0;         ///< Client that generated the biosolids
    double net_weight_tons = 0.0;       ///< Net weight carried
    NodeId origin_id = 0;               ///< Pickup facility
    NodeId destination_id = 0;          ///< Disposal site or treatment plant
    bool goes_to_treatment = false;     ///< True if the load passes through a treatment plant
};

}  // namespace biosettle
