#pragma once
#include <benchmark/benchmark.h>

#include "StablePop/optimiser.h"
#include "StablePop/simulation.h"

#include <vector>

using namespace spop;

const auto simulate_parameters = [] {
    auto parameters = default_parameters();
    parameters.n_years = 10'000;
    parameters.target_total_fertility_rate = 2.0802;
    return parameters;
}();

static void simulate(benchmark::State &state, const Parameters &parameters) {
    for (auto _ : state) {
        auto result = parameters.run();
        benchmark::DoNotOptimize(result);
    }
}

static void stabilisation_cost_evaluation(benchmark::State &state, const Parameters &parameters) {
    auto bounds = OptimiserOptions{}.fertility_bounds;
    for (auto _ : state) {
        auto cost = stabilisation_cost(parameters, parameters.target_total_fertility_rate, bounds);
        benchmark::DoNotOptimize(cost);
    }
}

static void simulate_batch(benchmark::State &state, const Parameters &parameters) {
    auto batch = std::vector<Parameters>{};
    for (auto i = 0; i < state.range(0); i++) {
        auto candidate = parameters;
        candidate.target_total_fertility_rate += 0.01 * (i - state.range(0) / 2);
        batch.push_back(candidate);
    }

    for (auto _ : state) {
        auto results = run_batch(batch);
        benchmark::DoNotOptimize(results);
    }

    state.SetItemsProcessed(state.iterations() * state.range(0));
}

BENCHMARK_CAPTURE(simulate, simulate_10000_years, simulate_parameters)
    ->Unit(benchmark::kMillisecond);
BENCHMARK_CAPTURE(stabilisation_cost_evaluation, reference_scenario, default_parameters())
    ->Unit(benchmark::kMillisecond);
BENCHMARK_CAPTURE(simulate_batch, reference_scenario, default_parameters())
    ->Arg(8)
    ->Unit(benchmark::kMillisecond);
