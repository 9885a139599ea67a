#include <benchmark/benchmark.h>
#include <fmt/format.h>
#include <thread>

#include "simulation_benchs.h"

int main(int argc, char **argv) {
    ::benchmark::Initialize(&argc, argv);
    if (::benchmark::ReportUnrecognizedArguments(argc, argv)) {
        return 1;
    }

    fmt::print("\nStablePop benchmarks, concurrent threads: {}\n",
               std::thread::hardware_concurrency());
    fmt::print("Reference scenario: {}\n\n", spop::default_parameters().to_string());

    ::benchmark::RunSpecifiedBenchmarks();
    ::benchmark::Shutdown();
}
