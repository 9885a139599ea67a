#include "optimiser.h"
#include "StablePop.Core/exception.h"
#include "error_message.h"
#include "info_message.h"
#include "nelder_mead.h"
#include "result_message.h"
#include "simulation.h"

#include <cmath>
#include <fmt/format.h>
#include <utility>

namespace spop {

GrowthEstimate estimate_growth(const Timeline &timeline, core::Count initial_population) {
    auto range = timeline.year_range();
    auto threshold = initial_population / 3;
    auto end_year = range.upper();
    for (const auto &entry : timeline) {
        if (entry.data.total() <= threshold) {
            end_year = entry.year;
            break;
        }
    }

    auto estimate = GrowthEstimate{};
    estimate.end_year = end_year;
    estimate.halfway_year = range.lower() + (end_year - range.lower()) / 2;
    auto years = estimate.end_year - estimate.halfway_year;
    if (years == 0) {
        return estimate;
    }

    auto halfway_sum = static_cast<double>(timeline.sum(estimate.halfway_year));
    auto end_sum = static_cast<double>(timeline.sum(estimate.end_year));
    estimate.slope = (end_sum - halfway_sum) / years;
    estimate.relative_growth = halfway_sum > 0.0 ? estimate.slope / halfway_sum : 0.0;
    return estimate;
}

double stabilisation_cost(const Parameters &parameters, double fertility_rate,
                          const core::DoubleInterval &bounds) {
    auto candidate = parameters;
    candidate.target_total_fertility_rate = bounds.clamp(fertility_rate);
    auto result = run_simulation(candidate);
    auto slope = estimate_growth(result.timeline, candidate.initial_population).slope;
    return slope * slope;
}

Optimiser::Optimiser(OptimiserOptions options, std::shared_ptr<EventAggregator> bus) noexcept
    : options_{options}, event_bus_{std::move(bus)} {}

StabilisationResult Optimiser::stabilise(const Parameters &parameters) const {
    validate(parameters);
    if (parameters.n_years < 2) {
        throw core::ConfigurationError(fmt::format(
            "n_years must be at least 2 to estimate population growth, given: {}.",
            parameters.n_years));
    }

    notify(std::make_unique<InfoEventMessage>(
        optimiser_id_, OptimiserAction::start, 0u, 0u,
        fmt::format("initial TFR: {:.6f}", parameters.target_total_fertility_rate)));

    auto result = StabilisationResult{};
    try {
        if (options_.strategy == StabilisationStrategy::feedback) {
            result = feedback_search(parameters);
        } else {
            result = simplex_search(parameters);
        }
    } catch (const std::exception &ex) {
        notify(std::make_unique<ErrorEventMessage>(optimiser_id_, 0u, ex.what()));
        throw;
    }

    notify(std::make_unique<InfoEventMessage>(
        optimiser_id_, OptimiserAction::stop, result.evaluations, result.iterations,
        result.converged ? "converged" : "iterations budget exhausted"));
    notify(std::make_unique<ResultEventMessage>(optimiser_id_, result));
    return result;
}

StabilisationResult Optimiser::simplex_search(const Parameters &parameters) const {
    auto tfr = parameters.target_total_fertility_rate;
    auto initial_simplex = std::vector<Eigen::VectorXd>{
        Eigen::VectorXd::Constant(1, tfr - options_.initial_step),
        Eigen::VectorXd::Constant(1, tfr + options_.initial_step)};

    auto solver_options = NelderMeadOptions{};
    solver_options.max_iterations = options_.max_iterations;
    solver_options.sd_tolerance = options_.sd_tolerance;
    auto solver = NelderMead(std::move(initial_simplex), solver_options);

    const auto &bounds = options_.fertility_bounds;
    auto state = solver.minimise(
        [&parameters, &bounds](const Eigen::VectorXd &param) {
            return stabilisation_cost(parameters, param[0], bounds);
        },
        [this](const NelderMeadState &current) {
            if (should_notify(current.iterations)) {
                notify(std::make_unique<InfoEventMessage>(
                    optimiser_id_, OptimiserAction::update, current.evaluations,
                    current.iterations,
                    fmt::format("best TFR: {:.8f}, cost: {:.6g}",
                                options_.fertility_bounds.clamp(current.best_param[0]),
                                current.best_cost)));
            }
        });

    auto result = StabilisationResult{};
    result.parameters = parameters;
    result.parameters.target_total_fertility_rate = bounds.clamp(state.best_param[0]);
    result.converged = state.converged();
    result.iterations = state.iterations;
    result.evaluations = state.evaluations;
    result.cost = state.best_cost;
    return result;
}

StabilisationResult Optimiser::feedback_search(const Parameters &parameters) const {
    const auto &bounds = options_.fertility_bounds;
    auto candidate = parameters;
    candidate.target_total_fertility_rate = bounds.clamp(parameters.target_total_fertility_rate);

    auto result = StabilisationResult{};
    result.parameters = candidate;
    result.cost = std::numeric_limits<double>::infinity();
    auto integral = 0.0;
    for (auto iteration = 1u; iteration <= options_.max_iterations; iteration++) {
        auto simulation = run_simulation(candidate);
        auto growth = estimate_growth(simulation.timeline, candidate.initial_population);
        auto cost = growth.slope * growth.slope;
        result.evaluations++;
        result.iterations = iteration;
        if (cost < result.cost) {
            result.cost = cost;
            result.parameters.target_total_fertility_rate = candidate.target_total_fertility_rate;
        }

        if (should_notify(iteration)) {
            notify(std::make_unique<InfoEventMessage>(
                optimiser_id_, OptimiserAction::update, result.evaluations, iteration,
                fmt::format("TFR: {:.8f}, annual growth: {:.3e}",
                            candidate.target_total_fertility_rate, growth.relative_growth)));
        }

        if (std::abs(growth.relative_growth) <= options_.feedback_tolerance) {
            result.converged = true;
            break;
        }

        integral += growth.relative_growth;
        candidate.target_total_fertility_rate = bounds.clamp(
            candidate.target_total_fertility_rate -
            (options_.proportional_gain * growth.relative_growth +
             options_.integral_gain * integral));
    }

    return result;
}

void Optimiser::notify(std::unique_ptr<EventMessage> message) const {
    if (event_bus_) {
        event_bus_->publish(std::move(message));
    }
}

bool Optimiser::should_notify(unsigned int iteration) const noexcept {
    return event_bus_ && options_.notify_interval > 0 && iteration % options_.notify_interval == 0;
}

Parameters solve(const Parameters &parameters) { return Optimiser{}.stabilise(parameters).parameters; }
} // namespace spop
