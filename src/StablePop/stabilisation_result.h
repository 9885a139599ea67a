#pragma once
#include "parameters.h"

namespace spop {

/// @brief Defines the outcome of a fertility stabilisation search
struct StabilisationResult {
    /// @brief The input parameters with the best target fertility rate found
    Parameters parameters{};

    /// @brief Whether the search met its tolerance before the iterations budget
    bool converged{};

    /// @brief Number of search iterations completed
    unsigned int iterations{};

    /// @brief Number of simulations evaluated
    unsigned int evaluations{};

    /// @brief Cost of the best fertility rate found
    double cost{};
};
} // namespace spop
