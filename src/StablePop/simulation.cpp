#include "simulation.h"
#include "population_simulator.h"

#include <oneapi/tbb/parallel_for.h>

namespace spop {

SimulationResult Parameters::run() const { return run_simulation(*this); }

SimulationResult run_simulation(const Parameters &parameters) {
    validate(parameters);
    return run_simulation(parameters, DemographicTables::create(parameters));
}

SimulationResult run_simulation(const Parameters &parameters, DemographicTables tables) {
    constexpr auto initial_year = 0;
    auto population = PopulationSimulator(parameters, std::move(tables));

    auto result = SimulationResult{};
    result.initial_population = population.state().snapshot();
    result.timeline.append(initial_year, population.totals());
    for (auto year = initial_year; year < initial_year + parameters.n_years; year++) {
        population.step_year(year);
        result.timeline.append(year + 1, population.totals());
    }

    auto state = population.release();
    result.final_population = state.snapshot();

    // Cohorts at either end have not completed their reproductive window
    result.cohort_fertility = std::move(state.cohorts());
    result.cohort_fertility.retain(initial_year + cohort_burn_in_years,
                                   initial_year + parameters.n_years - cohort_burn_in_years);
    return result;
}

std::vector<SimulationResult> run_batch(const std::vector<Parameters> &batch) {
    for (const auto &parameters : batch) {
        validate(parameters);
    }

    auto results = std::vector<SimulationResult>(batch.size());
    tbb::parallel_for(std::size_t{0}, batch.size(),
                      [&](std::size_t index) { results[index] = run_simulation(batch[index]); });

    return results;
}
} // namespace spop
