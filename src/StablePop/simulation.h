#pragma once
#include "demographic_tables.h"
#include "parameters.h"
#include "simulation_result.h"

#include <vector>

namespace spop {

/// @brief Cohorts born within this many years of either simulation end are trimmed
inline constexpr int cohort_burn_in_years = 100;

/// @brief Runs a simulation with the built-in demographic tables
/// @param parameters The simulation parameters
/// @return The simulation result
/// @throws core::ConfigurationError for invalid parameters
SimulationResult run_simulation(const Parameters &parameters);

/// @brief Runs a simulation with custom demographic tables
/// @param parameters The simulation parameters
/// @param tables The birth and death rates tables
/// @return The simulation result
/// @throws core::ConfigurationError for invalid parameters
/// @throws std::invalid_argument for tables and parameters maximum age mismatch
SimulationResult run_simulation(const Parameters &parameters, DemographicTables tables);

/// @brief Runs independent simulations in parallel
/// @param batch The simulations parameters
/// @return The simulations result, in the same order as the parameters
/// @throws core::ConfigurationError for invalid parameters
std::vector<SimulationResult> run_batch(const std::vector<Parameters> &batch);

} // namespace spop
