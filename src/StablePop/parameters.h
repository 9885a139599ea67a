#pragma once
#include "StablePop.Core/forward_type.h"
#include "simulation_result.h"

#include <string>

namespace spop {

/// @brief Oldest age at which women give birth
inline constexpr int max_fertile_age = 49;

/// @brief Defines the simulation run parameters, immutable per run
struct Parameters {
    /// @brief Initial population size, both genders
    core::Count initial_population{};

    /// @brief Number of simulated years
    int n_years{};

    /// @brief Maximum age, people reaching it die within the year
    int max_age{};

    /// @brief Sex ratio at birth, males per 100 females
    int males_per_100_females{};

    /// @brief Target total fertility rate, children per woman
    double target_total_fertility_rate{};

    /// @brief Probability of death within the first year of life
    double infant_mortality_rate{};

    /// @brief Runs a simulation with this instance parameters
    /// @return The simulation result
    /// @throws core::ConfigurationError for invalid parameters
    SimulationResult run() const;

    /// @brief Gets a string representation of this instance
    /// @return The string representation
    std::string to_string() const;

    bool operator==(const Parameters &rhs) const = default;
};

/// @brief Validates the parameters ranges
/// @param parameters The parameters to validate
/// @throws core::ConfigurationError naming the first invalid field
void validate(const Parameters &parameters);

/// @brief Gets the reference scenario parameters
/// @return The default parameters
Parameters default_parameters() noexcept;

} // namespace spop
