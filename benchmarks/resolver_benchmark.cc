// SPDX-License-Identifier: MIT
#include <benchmark/benchmark.h>

#include <memory>
#include <random>
#include <string>
#include <vector>

#include "src/resolve/resolver.hpp"

using namespace sash;

// Benchmark single and batch coefficient resolution

static std::shared_ptr<const CoefficientTable> create_bench_table(size_t n_systems,
                                                                  size_t n_categories,
                                                                  size_t n_points) {
    CoefficientTableData data;
    std::vector<double> axis(n_points);
    for (size_t i = 0; i < n_points; i++) axis[i] = 0.3 + i * 2.7 / (n_points - 1);

    for (size_t s = 0; s < n_systems; s++) {
        for (size_t c = 0; c < n_categories; c++) {
            CoefficientTableData::Entry entry{
                .system_key = "system_" + std::to_string(s),
                .category = "cat_" + std::to_string(c),
                .widths = axis,
                .heights = axis,
                .values = std::vector<double>(n_points * n_points),
            };
            for (size_t k = 0; k < entry.values.size(); k++) {
                entry.values[k] = 1.0 + 0.001 * static_cast<double>(k + s + c);
            }
            data.entries.push_back(std::move(entry));
        }
    }
    return CoefficientTable::create(std::move(data)).value();
}

static std::vector<ResolutionRequest> create_requests(size_t n, size_t n_systems,
                                                      size_t n_categories) {
    std::mt19937 rng(42);
    std::uniform_real_distribution<double> dim(0.2, 3.2);
    std::uniform_int_distribution<size_t> sys(0, n_systems - 1);
    // One past the last category forces the fallback path now and then
    std::uniform_int_distribution<size_t> cat(0, n_categories);

    std::vector<ResolutionRequest> requests;
    requests.reserve(n);
    for (size_t i = 0; i < n; i++) {
        requests.push_back({"system_" + std::to_string(sys(rng)),
                            "cat_" + std::to_string(cat(rng)),
                            dim(rng), dim(rng)});
    }
    return requests;
}

static void BM_Resolve(benchmark::State& state, SamplingMode mode) {
    auto table = create_bench_table(20, 8, static_cast<size_t>(state.range(0)));
    auto resolver = Resolver::create(table, ResolverConfig{.sampling = mode}).value();
    auto requests = create_requests(1024, 20, 8);

    size_t i = 0;
    for (auto _ : state) {
        auto result = resolver.resolve(requests[i++ & 1023]);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations());
}

static void BM_Resolve_Ceiling(benchmark::State& state) {
    BM_Resolve(state, SamplingMode::Ceiling);
}

static void BM_Resolve_Bilinear(benchmark::State& state) {
    BM_Resolve(state, SamplingMode::Bilinear);
}

static void BM_ResolveBatch(benchmark::State& state) {
    auto table = create_bench_table(20, 8, 16);
    auto resolver = Resolver::create(table).value();
    auto requests = create_requests(static_cast<size_t>(state.range(0)), 20, 8);

    for (auto _ : state) {
        auto results = resolver.resolve_batch(requests);
        benchmark::DoNotOptimize(results.data());
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}

BENCHMARK(BM_Resolve_Ceiling)->Arg(8)->Arg(32)->Arg(128);
BENCHMARK(BM_Resolve_Bilinear)->Arg(8)->Arg(32)->Arg(128);
BENCHMARK(BM_ResolveBatch)->Arg(64)->Arg(1024)->Arg(16384)->UseRealTime();

BENCHMARK_MAIN();
