#pragma once

/// @file include/biosettle/data_loader.hpp
/// @brief CSV loader for settlement configuration and trip data.
///
/// # Module: DataLoader
///
/// ## Responsibility
/// Parse the CSV exports the billing orchestrator produces into the typed
/// inputs of the settlement engine. Malformed rows, and rows whose values
/// violate a value-type invariant, are skipped and counted; the loader never
/// fails a whole file because of one bad row.
///
/// ## Expected Files
/// ```
/// routes.csv              origin_id,destination_id,distance_km,is_segment_link
/// contractor_tariffs.csv  vehicle_type,base_rate_per_ton_km,min_weight_tons,base_fuel_price
/// client_tariffs.csv      client_id,concept,rate_per_ton,min_weight_tons,valid_from,valid_to
/// disposal_tariffs.csv    site_id,rate_per_ton,min_weight_tons,valid_from,valid_to   (optional)
/// trips.csv               trip_id,date,vehicle_type,load_id,client_id,net_weight_tons,
///                         origin_id,destination_id,goes_to_treatment
/// ```
/// The first non-comment line of every file is a header and is skipped.
/// Lines starting with `#` are comments. An empty `valid_to` is open-ended;
/// an empty contractor `min_weight_tons` falls back to the vehicle default.
/// Trip rows sharing a `trip_id` form one trip, loads in file order. If any
/// row of a trip is malformed or disagrees with the trip's date or vehicle,
/// the whole trip is dropped and all of its rows count as skipped.
///
/// ## Guarantees
/// - Does not modify any file or external state
/// - Returns `nullopt` only when a required file cannot be opened

#include "biosettle/routes.hpp"
#include "biosettle/settlement.hpp"
#include "biosettle/tariffs.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace biosettle::core {

/// Rows parsed from one CSV source.
template <typename T>
struct ParseResult {
    std::vector<T> rows;
    std::size_t    skipped = 0;  ///< Data rows rejected as malformed or invalid
};

/// Settlement input assembled from a data directory.
struct LoadedInput {
    SettlementInput input;
    std::size_t     skipped_rows = 0;    ///< Total across all files
    std::size_t     duplicate_routes = 0;
};

class DataLoader {
public:
    DataLoader() = delete;

    [[nodiscard]] static ParseResult<DistanceRoute>
    parse_routes(std::string_view csv_content);

    [[nodiscard]] static ParseResult<TariffRule>
    parse_contractor_tariffs(std::string_view csv_content);

    [[nodiscard]] static ParseResult<ClientTariff>
    parse_client_tariffs(std::string_view csv_content);

    [[nodiscard]] static ParseResult<DisposalSiteTariff>
    parse_disposal_tariffs(std::string_view csv_content);

    [[nodiscard]] static ParseResult<Trip>
    parse_trips(std::string_view csv_content);

    /// Read a whole file.
    ///
    /// # Returns
    /// `nullopt` if the file cannot be opened.
    [[nodiscard]] static std::optional<std::string>
    read_file(const std::filesystem::path& path);

    /// Load every file of a data directory (see file list above).
    ///
    /// # Returns
    /// `nullopt` if any required file is missing; `disposal_tariffs.csv` is
    /// optional and leaves disposal unsettled when absent.
    [[nodiscard]] static std::optional<LoadedInput>
    load_directory(const std::filesystem::path& dir, const EconomicCycle& cycle);

    /// Split a CSV line on commas, trimming whitespace. Empty fields are kept.
    [[nodiscard]] static std::vector<std::string> split_row(std::string_view line);

    [[nodiscard]] static std::optional<double> parse_double(std::string_view text) noexcept;
    [[nodiscard]] static std::optional<std::int64_t> parse_int(std::string_view text) noexcept;

    /// Accepts 1/0/true/false/yes/no (case-insensitive).
    [[nodiscard]] static std::optional<bool> parse_bool(std::string_view text) noexcept;
};

}  // namespace biosettle::core
