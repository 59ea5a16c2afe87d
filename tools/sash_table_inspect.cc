// SPDX-License-Identifier: MIT
/**
 * @file sash_table_inspect.cc
 * @brief Load a coefficient dataset, report its contents, resolve ad hoc
 *
 * Usage:
 *   sash_table_inspect <dataset> [system_key]
 *   sash_table_inspect <dataset> --resolve <system> <category> <width> <height> [--bilinear]
 *   sash_table_inspect <dataset> --to-parquet <out.parquet>
 *
 * Exits non-zero when the dataset fails its integrity check, so it doubles
 * as a pre-deployment validator.
 */

#include "src/resolve/resolver.hpp"
#include "src/table/parquet/parquet_io.hpp"
#include "src/table/table_loader.hpp"

#include <charconv>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using namespace sash;

namespace {

void print_usage(const char* argv0) {
    std::cerr << "Usage:\n"
              << "  " << argv0 << " <dataset> [system_key]\n"
              << "  " << argv0 << " <dataset> --resolve <system> <category> <width> <height> [--bilinear]\n"
              << "  " << argv0 << " <dataset> --to-parquet <out.parquet>\n";
}

std::optional<double> parse_meters(std::string_view text) {
    double value = 0.0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

void print_system(const CoefficientTable& table, const std::string& system_key) {
    std::cout << system_key << "\n";
    for (const auto& category : table.categories(system_key)) {
        const Grid* grid = table.find_grid(system_key, category);
        const GridRanges r = grid->ranges();
        std::cout << "  " << std::setw(12) << std::left << category << std::right
                  << " width [" << r.width.min << ", " << r.width.max << "] m"
                  << " x " << grid->width_count()
                  << "  height [" << r.height.min << ", " << r.height.max << "] m"
                  << " x " << grid->height_count() << "\n";
    }
}

int run_resolve(const std::shared_ptr<const CoefficientTable>& table,
                const std::vector<std::string_view>& args) {
    if (args.size() < 4) {
        std::cerr << "--resolve needs <system> <category> <width> <height>\n";
        return 2;
    }
    auto width = parse_meters(args[2]);
    auto height = parse_meters(args[3]);
    if (!width || !height) {
        std::cerr << "width and height must be numbers in meters\n";
        return 2;
    }

    ResolverConfig config;
    if (args.size() > 4 && args[4] == "--bilinear") {
        config.sampling = SamplingMode::Bilinear;
    }
    auto resolver = Resolver::create(table, config);
    if (!resolver) {
        std::cerr << "Invalid resolver configuration: " << describe(resolver.error()) << "\n";
        return 1;
    }

    auto result = resolver->resolve(ResolutionRequest{
        .system_key = std::string(args[0]),
        .category = std::string(args[1]),
        .width = *width,
        .height = *height,
    });
    if (!result) {
        std::cerr << describe(result.error()) << "\n";
        return 1;
    }

    std::cout << "coefficient: " << result->coefficient << "\n"
              << "grid:        " << result->resolved_system << "/" << result->resolved_category
              << (result->is_fallback_category ? " (fallback)" : "") << "\n"
              << "cell:        " << result->effective_width << " x "
              << result->effective_height << " m (" << resolver->sampler().name() << ")\n";
    if (result->warning) {
        std::cout << "warning:     " << *result->warning << "\n";
    }
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 2;
    }

    auto table = load_coefficient_table(argv[1]);
    if (!table) {
        std::cerr << "Failed to load " << argv[1] << ": " << describe(table.error()) << "\n";
        return 1;
    }

    std::vector<std::string_view> args(argv + 2, argv + argc);

    if (!args.empty() && args[0] == "--resolve") {
        return run_resolve(*table, std::vector<std::string_view>(args.begin() + 1, args.end()));
    }

    if (!args.empty() && args[0] == "--to-parquet") {
        if (args.size() < 2) {
            print_usage(argv[0]);
            return 2;
        }
        auto written = write_parquet((*table)->to_data(), std::string(args[1]));
        if (!written) {
            std::cerr << "Failed to write " << args[1] << ": " << describe(written.error()) << "\n";
            return 1;
        }
        std::cout << "Wrote " << (*table)->grid_count() << " grids to " << args[1] << "\n";
        return 0;
    }

    const CoefficientTable& t = **table;
    if (!args.empty()) {
        const std::string system_key(args[0]);
        if (!t.find_system(system_key)) {
            std::cerr << "Unknown system '" << system_key << "'\n";
            return 1;
        }
        print_system(t, system_key);
        return 0;
    }

    std::cout << t.system_count() << " systems, " << t.grid_count() << " grids\n";
    for (const auto& system_key : t.systems()) {
        const size_t n = t.categories(system_key).size();
        std::cout << "  " << std::setw(24) << std::left << system_key << std::right
                  << " " << n << (n == 1 ? " category" : " categories") << "\n";
    }
    return 0;
}
