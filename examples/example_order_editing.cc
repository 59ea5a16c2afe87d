// SPDX-License-Identifier: MIT
/**
 * @file example_order_editing.cc
 * @brief Order editing session against an in-process resolution service
 *
 * Demonstrates:
 * - Loading and validating a coefficient table
 * - Debounced per-sash resolution while the user types dimensions
 * - Supersede-on-edit: only the last value typed is resolved
 * - Cache hits for repeated sizes
 * - Releasing a removed line item
 *
 * Usage: example_order_editing [dataset.json|dataset.parquet]
 */

#include "src/client/local_transport.hpp"
#include "src/client/resolution_client.hpp"
#include "src/table/table_loader.hpp"

#include <chrono>
#include <iostream>
#include <memory>

using namespace sash;
using namespace std::chrono_literals;

namespace {

std::shared_ptr<const CoefficientTable> builtin_table() {
    CoefficientTableData data;
    data.entries.push_back({
        .system_key = "uni1_zebra",
        .category = "E",
        .widths = {0.4, 0.8, 1.2, 1.6, 2.0},
        .heights = {0.5, 1.0, 1.5, 2.0, 2.5},
        .values = {1.10, 1.12, 1.15, 1.18, 1.22,
                   1.08, 1.10, 1.13, 1.16, 1.20,
                   1.05, 1.08, 1.11, 1.14, 1.18,
                   1.03, 1.06, 1.09, 1.12, 1.16,
                   1.02, 1.05, 1.08, 1.11, 1.15},
    });
    data.entries.push_back({
        .system_key = "uni1_zebra",
        .category = "B",
        .widths = {0.4, 1.2, 2.0},
        .heights = {0.5, 1.5, 2.5},
        .values = {1.30, 1.34, 1.40,
                   1.26, 1.30, 1.36,
                   1.22, 1.27, 1.33},
    });
    auto table = CoefficientTable::create(std::move(data));
    if (!table) {
        std::cerr << "Built-in table is invalid: " << describe(table.error()) << "\n";
        return nullptr;
    }
    return *table;
}

}  // namespace

int main(int argc, char** argv) {
    std::cout << "=== Order Editing Session Example ===\n\n";

    std::shared_ptr<const CoefficientTable> table;
    if (argc > 1) {
        auto loaded = load_coefficient_table(argv[1]);
        if (!loaded) {
            std::cerr << "Failed to load " << argv[1] << ": " << describe(loaded.error()) << "\n";
            return 1;
        }
        table = *loaded;
    } else {
        table = builtin_table();
    }
    if (!table) {
        return 1;
    }

    auto resolver = Resolver::create(table);
    if (!resolver) {
        std::cerr << "Resolver: " << describe(resolver.error()) << "\n";
        return 1;
    }
    ResolutionService service(std::move(*resolver));

    // 1. One event loop drives debounce timers and transport completions
    EventLoop loop;
    LocalTransport transport(loop, service, {.latency = 40ms});
    ResolutionClient client(loop, transport, {.debounce = 150ms});

    auto report = [](SashId id) {
        return [id](const ResolutionResult& r) {
            std::cout << "  sash " << id << ": coefficient " << r.coefficient
                      << " from " << r.resolved_system << "/" << r.resolved_category;
            if (r.warning) {
                std::cout << "  [warning: " << *r.warning << "]";
            }
            std::cout << "\n";
        };
    };
    auto report_error = [](SashId id) {
        return [id](const ClientError& e) {
            std::cout << "  sash " << id << ": error " << describe(e) << "\n";
        };
    };

    // 2. The user types a width for sash 1: only the last value is resolved
    std::cout << "Typing width 1 -> 1.1 -> 1.15 on sash 1\n";
    for (double width : {1.0, 1.1, 1.15}) {
        client.request_resolution(1, {"uni1_zebra", "E", width, 1.4},
                                  report(1), report_error(1));
        loop.run_for(50ms);
    }
    loop.run_until_idle();

    // 3. Same size on another sash: served from the cache
    std::cout << "\nSash 2 with the same size\n";
    client.request_resolution(2, {"uni1_zebra", "E", 1.15, 1.4}, report(2), report_error(2));

    // 4. Unknown category falls back, oversize dimension is clamped
    std::cout << "\nSash 3: category 'Z', width 2.6 m\n";
    client.request_resolution(3, {"uni1_zebra", "Z", 2.6, 1.0}, report(3), report_error(3));
    loop.run_until_idle();

    // 5. Line removed from the order while its request is in flight
    std::cout << "\nSash 4 removed before its answer arrives\n";
    client.request_resolution(4, {"uni1_zebra", "B", 0.9, 0.9}, report(4), report_error(4));
    loop.run_for(170ms);
    client.release_sash(4);
    loop.run_until_idle();

    // 6. Configuration defect: unknown system
    std::cout << "\nSash 5 with an unknown system\n";
    client.request_resolution(5, {"uni2_roller", "E", 1.0, 1.0}, report(5), report_error(5));
    loop.run_until_idle();

    std::cout << "\nTransport: " << transport.calls_sent() << " sent, "
              << transport.calls_served() << " served, "
              << transport.calls_aborted() << " aborted; cache holds "
              << client.cache().size() << " results\n";

    client.reset_all();
    return 0;
}
