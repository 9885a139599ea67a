#pragma once
#include "StablePop.Core/array2d.h"
#include "StablePop.Core/forward_type.h"
#include "parameters.h"

#include <vector>

namespace spop {

/// @brief Gets the initial population relative frequency of an age
/// @param age The age
/// @param max_age The maximum tracked age
/// @return Fraction of the population at that age, zero above max_age
double age_distribution(int age, int max_age) noexcept;

/// @brief Gets the nominal per-woman annual birth probability of an age
/// @param age The mother age
/// @return The nominal birth probability, zero outside ages [15, 49]
double nominal_birth_probability(int age) noexcept;

/// @brief Gets the total fertility of the nominal birth probability curve
/// @return The sum of the nominal curve over all ages
double nominal_total_fertility() noexcept;

/// @brief Gets the per-woman annual birth probability rescaled to a target fertility
/// @param age The mother age
/// @param target_tfr The target total fertility rate
/// @return The birth probability
double birth_probability(int age, double target_tfr) noexcept;

/// @brief Gets the annual death probability
/// @param age The age
/// @param gender The gender
/// @param max_age The maximum tracked age, death is certain from this age
/// @param infant_mortality_rate The death probability at age zero
/// @return The death probability
double death_probability(int age, core::Gender gender, int max_age,
                         double infant_mortality_rate) noexcept;

/// @brief Defines the per-run birth and death rates lookup tables
///
/// @details The rates cover the ages [0, max_age + 1], the death rates at ages
/// greater or equal to max_age must be 1.0 to bound the population age.
class DemographicTables {
  public:
    DemographicTables() = delete;

    /// @brief Initialises a new instance of the DemographicTables class with custom rates
    /// @param max_age The maximum tracked age
    /// @param birth_rates The birth probability by age
    /// @param death_rates The death probability by age (rows) and gender (columns)
    /// @throws std::invalid_argument for tables size mismatch, negative birth rates, death
    /// rates outside [0, 1],
    /// or death rates at the ceiling ages other than 1.0
    DemographicTables(int max_age, std::vector<double> birth_rates,
                      core::DoubleArray2D death_rates);

    /// @brief Creates the built-in tables for a simulation parameters
    /// @param parameters The simulation parameters
    /// @return The new DemographicTables instance
    static DemographicTables create(const Parameters &parameters);

    /// @brief Gets the maximum tracked age
    int max_age() const noexcept { return max_age_; }

    /// @brief Gets the birth probability of an age
    /// @throws std::out_of_range for age outside [0, max_age + 1]
    double birth_rate(int age) const;

    /// @brief Gets the death probability of an age and gender
    /// @throws std::out_of_range for age outside [0, max_age + 1]
    double death_rate(int age, core::Gender gender) const;

  private:
    int max_age_;
    std::vector<double> birth_rates_;
    core::DoubleArray2D death_rates_;
};
} // namespace spop
