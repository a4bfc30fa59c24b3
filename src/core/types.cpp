/// @file src/core/types.cpp
/// @brief Enumeration names, date parsing and formatting.

#include "biosettle/types.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cctype>
#include <charconv>

namespace biosettle {

namespace {

/// ASCII case-insensitive equality.
[[nodiscard]] bool iequals(std::string_view a, std::string_view b) noexcept {
    return a.size() == b.size()
        && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::toupper(static_cast<unsigned char>(x))
                   == std::toupper(static_cast<unsigned char>(y));
           });
}

/// Parse an unsigned decimal field that must consume the whole view.
template <typename T>
[[nodiscard]] std::optional<T> parse_field(std::string_view text) noexcept {
    T value{};
    const auto* first = text.data();
    const auto* last  = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) {
        return std::nullopt;
    }
    return value;
}

}  // anonymous namespace

// ─── VehicleType ──────────────────────────────────────────────────────────────

std::string_view to_string(VehicleType type) noexcept {
    switch (type) {
        case VehicleType::Batea:           return "BATEA";
        case VehicleType::AmplirollSimple: return "AMPLIROLL_SIMPLE";
        case VehicleType::AmplirollCarro:  return "AMPLIROLL_CARRO";
    }
    return "UNKNOWN";
}

std::optional<VehicleType> parse_vehicle_type(std::string_view text) noexcept {
    for (VehicleType type : ALL_VEHICLE_TYPES) {
        if (iequals(text, to_string(type))) {
            return type;
        }
    }
    // Older configuration exports name the single hook-lift "AMPLIROLL".
    if (iequals(text, "AMPLIROLL")) {
        return VehicleType::AmplirollSimple;
    }
    return std::nullopt;
}

// ─── BillingConcept ───────────────────────────────────────────────────────────

std::string_view to_string(BillingConcept concept_) noexcept {
    switch (concept_) {
        case BillingConcept::Transporte:  return "TRANSPORTE";
        case BillingConcept::Disposicion: return "DISPOSICION";
        case BillingConcept::Tratamiento: return "TRATAMIENTO";
    }
    return "UNKNOWN";
}

std::optional<BillingConcept> parse_concept(std::string_view text) noexcept {
    for (BillingConcept c : ALL_CONCEPTS) {
        if (iequals(text, to_string(c))) {
            return c;
        }
    }
    return std::nullopt;
}

// ─── Dates ────────────────────────────────────────────────────────────────────

std::string to_string(Date date) {
    return fmt::format("{:04d}-{:02d}-{:02d}",
                       static_cast<int>(date.year()),
                       static_cast<unsigned>(date.month()),
                       static_cast<unsigned>(date.day()));
}

std::optional<Date> parse_date(std::string_view text) noexcept {
    // Strict YYYY-MM-DD: 10 characters, dashes at 4 and 7.
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }

    const auto y = parse_field<unsigned>(text.substr(0, 4));
    const auto m = parse_field<unsigned>(text.substr(5, 2));
    const auto d = parse_field<unsigned>(text.substr(8, 2));
    if (!y || !m || !d) {
        return std::nullopt;
    }

    const Date date{std::chrono::year{static_cast<int>(*y)},
                    std::chrono::month{*m},
                    std::chrono::day{*d}};
    if (!date.ok()) {
        return std::nullopt;
    }
    return date;
}

Date today() noexcept {
    return Date{std::chrono::floor<std::chrono::days>(std::chrono::system_clock::now())};
}

}  // namespace biosettle
