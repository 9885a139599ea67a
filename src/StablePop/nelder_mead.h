#pragma once

#include <Eigen/Dense>

#include <functional>
#include <limits>
#include <vector>

namespace spop {

/// @brief Defines the Nelder-Mead coefficients and termination criteria
struct NelderMeadOptions {
    /// @brief Reflection coefficient
    double alpha{1.0};

    /// @brief Expansion coefficient
    double gamma{2.0};

    /// @brief Contraction coefficient
    double rho{0.5};

    /// @brief Shrink coefficient
    double sigma{0.5};

    /// @brief Maximum number of iterations
    unsigned int max_iterations{10'000};

    /// @brief Simplex costs standard deviation tolerance for convergence
    double sd_tolerance{std::numeric_limits<double>::epsilon()};
};

/// @brief Enumerates the Nelder-Mead termination reasons
enum class TerminationReason {
    /// @brief Simplex costs standard deviation reached the tolerance
    converged,

    /// @brief Iterations budget exhausted before convergence
    max_iterations
};

/// @brief Defines the Nelder-Mead search state
struct NelderMeadState {
    /// @brief Best vertex found so far
    Eigen::VectorXd best_param;

    /// @brief Cost of the best vertex
    double best_cost{std::numeric_limits<double>::infinity()};

    /// @brief Number of completed iterations
    unsigned int iterations{};

    /// @brief Number of cost function evaluations
    unsigned int evaluations{};

    /// @brief Current simplex costs standard deviation
    double cost_sd{std::numeric_limits<double>::infinity()};

    /// @brief Search termination reason
    TerminationReason termination{TerminationReason::max_iterations};

    /// @brief Whether the search has converged
    bool converged() const noexcept { return termination == TerminationReason::converged; }
};

/// @brief Derivative-free downhill simplex minimiser.
///
/// @details Each iteration replaces the worst vertex by reflection, expansion,
/// outside or inside contraction about the centroid of the remaining vertices, or shrinks the
/// simplex toward the best vertex. The search is sequential and deterministic.
///
/// References:
/// - J. A. Nelder and R. Mead, A simplex method for function minimization,
///   The Computer Journal, Volume 7, Issue 4, January 1965, pages 308-313.
class NelderMead {
  public:
    /// @brief Cost function type
    using CostFunction = std::function<double(const Eigen::VectorXd &)>;

    /// @brief Iteration observer type
    using Observer = std::function<void(const NelderMeadState &)>;

    NelderMead() = delete;

    /// @brief Initialises a new instance of the NelderMead class
    /// @param initial_simplex The n + 1 initial vertices of dimension n
    /// @param options The coefficients and termination criteria
    /// @throws std::invalid_argument for malformed simplex or coefficients
    explicit NelderMead(std::vector<Eigen::VectorXd> initial_simplex,
                        NelderMeadOptions options = {});

    /// @brief Gets the search options
    const NelderMeadOptions &options() const noexcept { return options_; }

    /// @brief Minimises a cost function
    /// @param cost The cost function, must return finite values
    /// @param observer Optional observer, notified after every iteration
    /// @return The final search state
    /// @throws std::domain_error for non-finite cost value
    NelderMeadState minimise(const CostFunction &cost, const Observer &observer = {}) const;

  private:
    std::vector<Eigen::VectorXd> initial_simplex_;
    NelderMeadOptions options_;
};
} // namespace spop
