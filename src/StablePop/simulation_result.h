#pragma once
#include "population.h"
#include "timeline.h"

namespace spop {

/// @brief Defines the immutable outcome of one simulation run
struct SimulationResult {
    /// @brief Population by age and gender before the first simulated year
    AgeGenderMap initial_population{};

    /// @brief Population by age and gender after the last simulated year
    AgeGenderMap final_population{};

    /// @brief Cohort fertility ledger, trimmed to cohorts with complete reproductive window
    CohortFertility cohort_fertility{};

    /// @brief Yearly population totals, years [0, n_years]
    Timeline timeline{};

    bool operator==(const SimulationResult &rhs) const = default;
};
} // namespace spop
