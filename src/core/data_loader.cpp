/// @file src/core/data_loader.cpp
/// @brief CSV loader for settlement configuration and trip data.

#include "biosettle/data_loader.hpp"
#include "biosettle/constants.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <fstream>
#include <map>
#include <sstream>
#include <utility>

namespace biosettle::core {

namespace {

/// Walk the data rows of a CSV document.
///
/// Skips blank lines, `#` comments and the header (first remaining line).
/// `row_fn(fields)` returns true if the row was accepted; rejected rows are
/// counted into `skipped`.
template <typename RowFn>
void for_each_data_row(std::string_view csv, std::size_t& skipped, RowFn row_fn) {
    std::istringstream stream{std::string(csv)};
    std::string line;
    bool header_skipped = false;

    while (std::getline(stream, line)) {
        // Trim carriage return for Windows-style line endings.
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        const auto first = line.find_first_not_of(" \t");
        if (first == std::string::npos || line[first] == '#') {
            continue;
        }
        if (!header_skipped) {
            header_skipped = true;
            continue;
        }
        if (!row_fn(DataLoader::split_row(line))) {
            ++skipped;
        }
    }
}

/// Optional date column: empty means "no date".
[[nodiscard]] std::optional<std::optional<Date>> parse_optional_date(std::string_view text) {
    if (text.empty()) {
        return std::optional<Date>{};
    }
    auto date = parse_date(text);
    if (!date) {
        return std::nullopt;
    }
    return std::optional<Date>{*date};
}

}  // anonymous namespace

// ─── Field parsing ────────────────────────────────────────────────────────────

std::vector<std::string> DataLoader::split_row(std::string_view line) {
    std::vector<std::string> fields;
    std::size_t start = 0;
    while (true) {
        const auto comma = line.find(',', start);
        auto field = line.substr(start, comma == std::string_view::npos
                                            ? std::string_view::npos
                                            : comma - start);
        const auto first = field.find_first_not_of(" \t\r\n");
        const auto last  = field.find_last_not_of(" \t\r\n");
        fields.emplace_back(first == std::string_view::npos
                                ? std::string_view{}
                                : field.substr(first, last - first + 1));
        if (comma == std::string_view::npos) {
            break;
        }
        start = comma + 1;
    }
    return fields;
}

std::optional<double> DataLoader::parse_double(std::string_view text) noexcept {
    if (text.empty()) {
        return std::nullopt;
    }
    // from_chars rejects a leading '+', which spreadsheet exports emit.
    if (text.front() == '+') {
        text.remove_prefix(1);
    }
    double value = 0.0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

std::optional<std::int64_t> DataLoader::parse_int(std::string_view text) noexcept {
    if (text.empty()) {
        return std::nullopt;
    }
    std::int64_t value = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

std::optional<bool> DataLoader::parse_bool(std::string_view text) noexcept {
    std::string lower;
    lower.reserve(text.size());
    for (char c : text) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (lower == "1" || lower == "true" || lower == "yes") return true;
    if (lower == "0" || lower == "false" || lower == "no") return false;
    return std::nullopt;
}

// ─── parse_routes ─────────────────────────────────────────────────────────────

ParseResult<DistanceRoute> DataLoader::parse_routes(std::string_view csv_content) {
    ParseResult<DistanceRoute> result;
    for_each_data_row(csv_content, result.skipped, [&](const std::vector<std::string>& f) {
        if (f.size() < constants::ROUTE_COLUMNS) return false;

        const auto origin  = parse_int(f[0]);
        const auto dest    = parse_int(f[1]);
        const auto km      = parse_double(f[2]);
        const auto segment = parse_bool(f[3]);
        if (!origin || !dest || !km || !segment) return false;

        auto route = DistanceRoute::make(*origin, *dest, *km, *segment);
        if (!route) return false;
        result.rows.push_back(*route);
        return true;
    });
    return result;
}

// ─── parse_contractor_tariffs ─────────────────────────────────────────────────

ParseResult<TariffRule> DataLoader::parse_contractor_tariffs(std::string_view csv_content) {
    ParseResult<TariffRule> result;
    for_each_data_row(csv_content, result.skipped, [&](const std::vector<std::string>& f) {
        if (f.size() < constants::CONTRACTOR_TARIFF_COLUMNS) return false;

        const auto type = parse_vehicle_type(f[0]);
        const auto rate = parse_double(f[1]);
        const auto fuel = parse_double(f[3]);
        if (!type || !rate || !fuel) return false;

        double min_weight = default_min_weight(*type);
        if (!f[2].empty()) {
            const auto parsed = parse_double(f[2]);
            if (!parsed) return false;
            min_weight = *parsed;
        }

        auto tariff = TariffRule::make(*rate, min_weight, *type, *fuel);
        if (!tariff) return false;
        result.rows.push_back(*tariff);
        return true;
    });
    return result;
}

// ─── parse_client_tariffs ─────────────────────────────────────────────────────

ParseResult<ClientTariff> DataLoader::parse_client_tariffs(std::string_view csv_content) {
    ParseResult<ClientTariff> result;
    for_each_data_row(csv_content, result.skipped, [&](const std::vector<std::string>& f) {
        if (f.size() < constants::CLIENT_TARIFF_COLUMNS) return false;

        const auto client     = parse_int(f[0]);
        const auto concept_   = parse_concept(f[1]);
        const auto rate       = parse_double(f[2]);
        const auto min_weight = f[3].empty() ? std::optional<double>{0.0} : parse_double(f[3]);
        const auto from       = parse_date(f[4]);
        const auto to         = parse_optional_date(f[5]);
        if (!client || !concept_ || !rate || !min_weight || !from || !to) return false;

        auto tariff = ClientTariff::make(*client, *concept_, *rate, *min_weight, *from, *to);
        if (!tariff) return false;
        result.rows.push_back(*tariff);
        return true;
    });
    return result;
}

// ─── parse_disposal_tariffs ───────────────────────────────────────────────────

ParseResult<DisposalSiteTariff> DataLoader::parse_disposal_tariffs(std::string_view csv_content) {
    ParseResult<DisposalSiteTariff> result;
    for_each_data_row(csv_content, result.skipped, [&](const std::vector<std::string>& f) {
        if (f.size() < constants::DISPOSAL_TARIFF_COLUMNS) return false;

        const auto site       = parse_int(f[0]);
        const auto rate       = parse_double(f[1]);
        const auto min_weight = f[2].empty() ? std::optional<double>{0.0} : parse_double(f[2]);
        const auto from       = parse_date(f[3]);
        const auto to         = parse_optional_date(f[4]);
        if (!site || !rate || !min_weight || !from || !to) return false;

        auto tariff = DisposalSiteTariff::make(*site, *rate, *min_weight, *from, *to);
        if (!tariff) return false;
        result.rows.push_back(*tariff);
        return true;
    });
    return result;
}

// ─── parse_trips ──────────────────────────────────────────────────────────────

ParseResult<Trip> DataLoader::parse_trips(std::string_view csv_content) {
    struct PendingTrip {
        Trip        trip;
        std::size_t row_count = 0;
        bool        rejected  = false;  ///< Some row of the trip was unusable
    };

    std::vector<PendingTrip> pending;
    std::map<std::string, std::size_t> index_of_trip;  // trip_id → position in pending
    std::size_t unattributed = 0;

    for_each_data_row(csv_content, unattributed, [&](const std::vector<std::string>& f) {
        // Rows without a trip id cannot be tied to a trip.
        if (f.empty() || f[0].empty()) return false;

        auto [it, inserted] = index_of_trip.try_emplace(f[0], pending.size());
        if (inserted) {
            pending.push_back(PendingTrip{});
            pending.back().trip.trip_id = f[0];
        }
        PendingTrip& entry = pending[it->second];
        ++entry.row_count;

        if (f.size() < constants::TRIP_COLUMNS) {
            entry.rejected = true;
            return true;
        }

        const auto date      = parse_date(f[1]);
        const auto vehicle   = parse_vehicle_type(f[2]);
        const auto load_id   = parse_int(f[3]);
        const auto client_id = parse_int(f[4]);
        const auto weight    = parse_double(f[5]);
        const auto origin    = parse_int(f[6]);
        const auto dest      = parse_int(f[7]);
        const auto treatment = parse_bool(f[8]);
        if (!date || !vehicle || !load_id || !client_id || !weight
            || !origin || !dest || !treatment) {
            entry.rejected = true;
            return true;
        }

        Trip& trip = entry.trip;
        if (trip.loads.empty()) {
            trip.date         = *date;
            trip.vehicle_type = *vehicle;
        } else if (trip.date != *date || trip.vehicle_type != *vehicle) {
            // Later rows of a trip must agree on the trip-level columns.
            entry.rejected = true;
            return true;
        }

        trip.loads.push_back(Load{
            .id                = *load_id,
            .client_id         = *client_id,
            .net_weight_tons   = *weight,
            .origin_id         = *origin,
            .destination_id    = *dest,
            .goes_to_treatment = *treatment,
        });
        return true;
    });

    // A trip missing any of its rows would be costed over the wrong legs,
    // so it is dropped whole.
    ParseResult<Trip> result;
    result.skipped = unattributed;
    for (auto& entry : pending) {
        if (entry.rejected || entry.trip.loads.empty()) {
            result.skipped += entry.row_count;
            continue;
        }
        result.rows.push_back(std::move(entry.trip));
    }
    return result;
}

// ─── read_file ────────────────────────────────────────────────────────────────

std::optional<std::string> DataLoader::read_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    return contents.str();
}

// ─── load_directory ───────────────────────────────────────────────────────────

std::optional<LoadedInput>
DataLoader::load_directory(const std::filesystem::path& dir, const EconomicCycle& cycle) {
    const auto routes_csv     = read_file(dir / "routes.csv");
    const auto contractor_csv = read_file(dir / "contractor_tariffs.csv");
    const auto client_csv     = read_file(dir / "client_tariffs.csv");
    const auto trips_csv      = read_file(dir / "trips.csv");
    if (!routes_csv || !contractor_csv || !client_csv || !trips_csv) {
        return std::nullopt;
    }
    const auto disposal_csv = read_file(dir / "disposal_tariffs.csv");

    auto routes     = parse_routes(*routes_csv);
    auto contractor = parse_contractor_tariffs(*contractor_csv);
    auto client     = parse_client_tariffs(*client_csv);
    auto trips      = parse_trips(*trips_csv);
    auto disposal   = disposal_csv ? parse_disposal_tariffs(*disposal_csv)
                                   : ParseResult<DisposalSiteTariff>{};

    RouteMap route_map(routes.rows);
    const std::size_t duplicates = route_map.duplicates_dropped();

    return LoadedInput{
        .input = SettlementInput{
            .cycle              = cycle,
            .routes             = std::move(route_map),
            .contractor_tariffs = std::move(contractor.rows),
            .client_tariffs     = std::move(client.rows),
            .disposal_tariffs   = std::move(disposal.rows),
            .trips              = std::move(trips.rows),
        },
        .skipped_rows = routes.skipped + contractor.skipped + client.skipped
                      + trips.skipped + disposal.skipped,
        .duplicate_routes = duplicates,
    };
}

}  // namespace biosettle::core
