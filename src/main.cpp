/// @file src/main.cpp
/// @brief biosettle CLI entry point.
///
/// Usage:
///   biosettle --settle <dir> --period YYYY-MM --uf <value> --fuel <price> [--verbose]
///   biosettle --fuel-factor <current_price> <base_price>
///   biosettle --cycle YYYY-MM
///   biosettle --help

#include "biosettle/data_loader.hpp"
#include "biosettle/errors.hpp"
#include "biosettle/settlement.hpp"
#include "biosettle/tariffs.hpp"

#include "fuel/fuel_adjustment.hpp"

#include <fmt/core.h>

#include <charconv>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace {

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  biosettle --settle <dir> --period YYYY-MM --uf <value> --fuel <price> [--verbose]\n"
        "                                      Settle one billing cycle from CSV data\n"
        "  biosettle --fuel-factor <current> <base>\n"
        "                                      Print the fuel adjustment factor\n"
        "  biosettle --cycle YYYY-MM           Print the billing cycle dates\n"
        "  biosettle --help                    Show this help\n"
        "\n"
        "Data directory:\n"
        "  routes.csv, contractor_tariffs.csv, client_tariffs.csv, trips.csv\n"
        "  disposal_tariffs.csv (optional)\n"
    );
}

/// Parse "YYYY-MM" into (year, month).
std::optional<std::pair<int, unsigned>> parse_period(std::string_view text) {
    if (text.size() != 7 || text[4] != '-') {
        return std::nullopt;
    }
    int year = 0;
    unsigned month = 0;
    const auto y = std::from_chars(text.data(), text.data() + 4, year);
    const auto m = std::from_chars(text.data() + 5, text.data() + 7, month);
    if (y.ec != std::errc{} || y.ptr != text.data() + 4
        || m.ec != std::errc{} || m.ptr != text.data() + 7
        || month < 1 || month > 12) {
        return std::nullopt;
    }
    return std::make_pair(year, month);
}

struct SettleArgs {
    std::string dir;
    std::string period;
    double      uf_value   = 0.0;
    double      fuel_price = 0.0;
    bool        verbose    = false;
};

/// Parse the options following `--settle <dir>`.
std::optional<SettleArgs> parse_settle_args(int argc, char* argv[]) {
    SettleArgs args;
    args.dir = argv[2];
    bool have_uf = false;
    bool have_fuel = false;

    for (int i = 3; i < argc; ++i) {
        const std::string_view opt(argv[i]);
        if (opt == "--verbose") {
            args.verbose = true;
            continue;
        }
        if (i + 1 >= argc) {
            fmt::print(stderr, "Error: {} requires a value\n", opt);
            return std::nullopt;
        }
        const std::string_view value(argv[++i]);
        if (opt == "--period") {
            args.period = std::string(value);
        } else if (opt == "--uf" || opt == "--fuel") {
            const auto number = biosettle::core::DataLoader::parse_double(value);
            if (!number) {
                fmt::print(stderr, "Error: {} expects a number, got '{}'\n", opt, value);
                return std::nullopt;
            }
            (opt == "--uf" ? args.uf_value : args.fuel_price) = *number;
            (opt == "--uf" ? have_uf : have_fuel) = true;
        } else {
            fmt::print(stderr, "Error: unknown option '{}'\n", opt);
            return std::nullopt;
        }
    }

    if (args.period.empty() || !have_uf || !have_fuel) {
        fmt::print(stderr, "Error: --settle requires --period, --uf and --fuel\n");
        return std::nullopt;
    }
    return args;
}

/// Load a data directory and settle one cycle.
/// Returns 0 on success, 1 on error.
int run_settle(const SettleArgs& args) {
    const auto period = parse_period(args.period);
    if (!period) {
        fmt::print(stderr, "Error: invalid period '{}', expected YYYY-MM\n", args.period);
        return 1;
    }

    const auto cycle = biosettle::EconomicCycle::for_period(
        period->first, period->second, args.uf_value, args.fuel_price);
    if (!cycle) {
        fmt::print(stderr, "Error: UF value and fuel price must be positive (uf={}, fuel={})\n",
                   args.uf_value, args.fuel_price);
        return 1;
    }

    auto loaded = biosettle::core::DataLoader::load_directory(args.dir, *cycle);
    if (!loaded) {
        fmt::print(stderr, "Error: cannot read data files from '{}'\n", args.dir);
        return 1;
    }

    fmt::print("Loaded {} trips, {} routes from '{}'", loaded->input.trips.size(),
               loaded->input.routes.size(), args.dir);
    if (loaded->skipped_rows > 0 || loaded->duplicate_routes > 0) {
        fmt::print(" ({} malformed rows skipped, {} duplicate routes dropped)",
                   loaded->skipped_rows, loaded->duplicate_routes);
    }
    fmt::print("\n");

    biosettle::core::SettlementEngine engine(
        biosettle::core::SettlementConfig{.verbose = args.verbose});
    const auto report = engine.settle(loaded->input);

    fmt::print("{}", report.to_string());
    return 0;
}

int run_fuel_factor(std::string_view current_text, std::string_view base_text) {
    const auto current = biosettle::core::DataLoader::parse_double(current_text);
    const auto base    = biosettle::core::DataLoader::parse_double(base_text);
    if (!current || !base) {
        fmt::print(stderr, "Error: fuel prices must be numbers\n");
        return 1;
    }
    try {
        const double factor = biosettle::fuel::FuelAdjustment::calculate_fuel_factor(*current, *base);
        fmt::print("Fuel factor: {:.6f}  (current {}, base {})\n", factor, *current, *base);
    } catch (const biosettle::SettlementError& ex) {
        fmt::print(stderr, "Error: {}\n", ex.what());
        return 1;
    }
    return 0;
}

int run_cycle(std::string_view period_text) {
    const auto period = parse_period(period_text);
    if (!period) {
        fmt::print(stderr, "Error: invalid period '{}', expected YYYY-MM\n", period_text);
        return 1;
    }
    // Prices do not affect the cycle boundaries.
    const auto cycle = biosettle::EconomicCycle::for_period(period->first, period->second, 1.0, 1.0);
    if (!cycle) {
        fmt::print(stderr, "Error: cannot build cycle for '{}'\n", period_text);
        return 1;
    }
    fmt::print("Cycle {}: {} .. {}\n", cycle->period_label(),
               biosettle::to_string(cycle->start_date()),
               biosettle::to_string(cycle->end_date()));
    return 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string mode(argv[1]);

    if (mode == "--help" || mode == "-h") {
        print_usage();
        return 0;
    }

    if (mode == "--settle") {
        if (argc < 3) {
            fmt::print(stderr, "Error: --settle requires a data directory\n");
            print_usage();
            return 1;
        }
        const auto args = parse_settle_args(argc, argv);
        if (!args) {
            print_usage();
            return 1;
        }
        return run_settle(*args);
    }

    if (mode == "--fuel-factor") {
        if (argc < 4) {
            fmt::print(stderr, "Error: --fuel-factor requires <current> <base>\n");
            print_usage();
            return 1;
        }
        return run_fuel_factor(argv[2], argv[3]);
    }

    if (mode == "--cycle") {
        if (argc < 3) {
            fmt::print(stderr, "Error: --cycle requires a period YYYY-MM\n");
            print_usage();
            return 1;
        }
        return run_cycle(argv[2]);
    }

    fmt::print(stderr, "Unknown option: {}\n", mode);
    print_usage();
    return 1;
}
