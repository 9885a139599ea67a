#pragma once
#include "StablePop.Core/interval.h"
#include "event_aggregator.h"
#include "parameters.h"
#include "stabilisation_result.h"
#include "timeline.h"

#include <limits>
#include <memory>

namespace spop {

/// @brief Enumerates the fertility stabilisation search strategies
enum class StabilisationStrategy {
    /// @brief Downhill simplex minimisation of the squared population slope
    simplex,

    /// @brief Proportional-integral feedback on the relative population growth
    feedback
};

/// @brief Defines the stabilisation search options
struct OptimiserOptions {
    /// @brief The search strategy
    StabilisationStrategy strategy{StabilisationStrategy::simplex};

    /// @brief Maximum number of search iterations
    unsigned int max_iterations{10'000};

    /// @brief Initial simplex half width around the starting fertility rate
    double initial_step{0.05};

    /// @brief Admissible target fertility rates, candidates are clamped to it
    core::DoubleInterval fertility_bounds{0.0, 3.0};

    /// @brief Simplex costs standard deviation tolerance
    double sd_tolerance{std::numeric_limits<double>::epsilon()};

    /// @brief Feedback proportional gain, fertility change per unit of annual growth
    double proportional_gain{30.0};

    /// @brief Feedback integral gain
    double integral_gain{5.0};

    /// @brief Feedback convergence tolerance on the relative annual growth
    double feedback_tolerance{1e-7};

    /// @brief Publish a progress message every this many iterations, zero disables
    unsigned int notify_interval{100};
};

/// @brief Defines the long-run population growth estimate of a timeline
struct GrowthEstimate {
    /// @brief Start year of the slope window
    int halfway_year{};

    /// @brief End year of the slope window
    int end_year{};

    /// @brief Average annual population change over the window
    double slope{};

    /// @brief Slope relative to the population at the window start
    double relative_growth{};
};

/// @brief Estimates the long-run population growth of a simulation timeline
///
/// @details The window ends at the first year the population falls to a third of
/// the initial population, or at the last year, and starts halfway through.
/// @param timeline The simulation timeline
/// @param initial_population The simulation initial population parameter
/// @return The growth estimate, zero slope for an empty window
/// @throws core::NoDataError for empty timeline
GrowthEstimate estimate_growth(const Timeline &timeline, core::Count initial_population);

/// @brief Computes the stabilisation cost of a target fertility rate
/// @param parameters The simulation parameters
/// @param fertility_rate The candidate target fertility rate
/// @param bounds The admissible fertility rates, the candidate is clamped to it
/// @return The squared population slope
double stabilisation_cost(const Parameters &parameters, double fertility_rate,
                          const core::DoubleInterval &bounds);

/// @brief Searches for the target fertility rate producing zero long-run population growth
class Optimiser {
  public:
    /// @brief Initialises a new instance of the Optimiser class
    /// @param options The search options
    /// @param bus Optional message bus instance for progress notification
    explicit Optimiser(OptimiserOptions options = {},
                       std::shared_ptr<EventAggregator> bus = nullptr) noexcept;

    /// @brief Gets the search options
    const OptimiserOptions &options() const noexcept { return options_; }

    /// @brief Runs the search from the parameters target fertility rate
    /// @param parameters The initial parameters
    /// @return The search outcome, best point found even without convergence
    /// @throws core::ConfigurationError for invalid parameters or less than two years
    StabilisationResult stabilise(const Parameters &parameters) const;

  private:
    OptimiserOptions options_;
    std::shared_ptr<EventAggregator> event_bus_;
    std::string optimiser_id_{"stabilisation"};

    StabilisationResult simplex_search(const Parameters &parameters) const;
    StabilisationResult feedback_search(const Parameters &parameters) const;
    void notify(std::unique_ptr<EventMessage> message) const;
    bool should_notify(unsigned int iteration) const noexcept;
};

/// @brief Finds the stabilising fertility rate with the default simplex search
/// @param parameters The initial parameters
/// @return The parameters with the best target fertility rate found
/// @throws core::ConfigurationError for invalid parameters or less than two years
Parameters solve(const Parameters &parameters);

} // namespace spop
