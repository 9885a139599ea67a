#pragma once
#include "demographic_tables.h"
#include "gender_value.h"
#include "parameters.h"
#include "population.h"
#include "timeline.h"

namespace spop {

/// @brief Advances an age and gender structured population one year at a time
///
/// @details The model tracks expected counts, each year applies in order:
/// age propagation, births and deaths. Births and deaths are rounded to the
/// nearest integer count per bucket, the female newborns absorb the rounding
/// residual of the sex ratio split. Instances are not shared between runs.
class PopulationSimulator {
  public:
    PopulationSimulator() = delete;

    /// @brief Initialises a new instance of the PopulationSimulator class with built-in tables
    /// @param parameters The simulation parameters
    /// @throws core::ConfigurationError for invalid parameters
    explicit PopulationSimulator(const Parameters &parameters);

    /// @brief Initialises a new instance of the PopulationSimulator class with custom tables
    /// @param parameters The simulation parameters
    /// @param tables The birth and death rates tables
    /// @throws core::ConfigurationError for invalid parameters
    /// @throws std::invalid_argument for tables and parameters maximum age mismatch
    PopulationSimulator(const Parameters &parameters, DemographicTables tables);

    /// @brief Gets the run parameters
    const Parameters &parameters() const noexcept { return parameters_; }

    /// @brief Gets the current population state
    const PopulationState &state() const noexcept { return state_; }

    /// @brief Gets the fraction of newborns that are male
    double male_birth_bias() const noexcept { return male_birth_bias_; }

    /// @brief Gets the number of simulated years so far
    int years_simulated() const noexcept { return years_simulated_; }

    /// @brief Simulates one year: age propagation, births and deaths
    /// @param year The current simulation year
    /// @return The newborns by gender
    /// @throws std::logic_error if all parameters years have been simulated
    CountGenderValue step_year(int year);

    /// @brief Shifts every age bucket one year older, clearing the age zero buckets
    void propagate_age();

    /// @brief Adds the year newborns and updates the cohort fertility ledger
    /// @param year The current simulation year
    /// @return The newborns by gender
    CountGenderValue handle_births(int year);

    /// @brief Removes the expected deaths from every bucket
    /// @return The total number of deaths
    core::Count handle_deaths();

    /// @brief Gets the current totals by gender
    TimelineData totals() const;

    /// @brief Moves the population state out of this instance
    /// @return The population state
    PopulationState release() noexcept;

  private:
    Parameters parameters_;
    DemographicTables tables_;
    PopulationState state_;
    double male_birth_bias_{};
    int years_simulated_{};

    void initialise_population();
};
} // namespace spop
