#include "nelder_mead.h"

#include <algorithm>
#include <cmath>
#include <fmt/format.h>
#include <numeric>
#include <stdexcept>

namespace spop {

namespace { // anonymous namespace

struct Vertex {
    Eigen::VectorXd param;
    double cost{};
};

double costs_standard_deviation(const std::vector<Vertex> &simplex) {
    auto n = static_cast<double>(simplex.size());
    auto mean = std::accumulate(simplex.begin(), simplex.end(), 0.0,
                                [](double sum, const Vertex &v) { return sum + v.cost; }) /
                n;
    auto variance = std::accumulate(simplex.begin(), simplex.end(), 0.0,
                                    [mean](double sum, const Vertex &v) {
                                        return sum + (v.cost - mean) * (v.cost - mean);
                                    }) /
                    n;
    return std::sqrt(variance);
}

} // anonymous namespace

NelderMead::NelderMead(std::vector<Eigen::VectorXd> initial_simplex, NelderMeadOptions options)
    : initial_simplex_{std::move(initial_simplex)}, options_{options} {
    if (initial_simplex_.size() < 2) {
        throw std::invalid_argument("Simplex requires at least two vertices.");
    }

    auto dimension = initial_simplex_.front().size();
    if (static_cast<std::size_t>(dimension) + 1 != initial_simplex_.size()) {
        throw std::invalid_argument(fmt::format(
            "Simplex of dimension {} requires {} vertices, given: {}.", dimension,
            dimension + 1, initial_simplex_.size()));
    }

    for (const auto &vertex : initial_simplex_) {
        if (vertex.size() != dimension) {
            throw std::invalid_argument("Simplex vertices dimension mismatch.");
        }
    }

    if (options_.alpha <= 0.0 || options_.gamma <= 1.0 || options_.rho <= 0.0 ||
        options_.rho > 0.5 || options_.sigma <= 0.0 || options_.sigma >= 1.0) {
        throw std::invalid_argument("Invalid Nelder-Mead coefficients.");
    }
}

NelderMeadState NelderMead::minimise(const CostFunction &cost, const Observer &observer) const {
    auto state = NelderMeadState{};
    auto evaluate = [&cost, &state](const Eigen::VectorXd &param) {
        auto value = cost(param);
        state.evaluations++;
        if (!std::isfinite(value)) {
            throw std::domain_error(fmt::format("Non-finite cost value: {}.", value));
        }

        return value;
    };

    auto simplex = std::vector<Vertex>{};
    simplex.reserve(initial_simplex_.size());
    for (const auto &param : initial_simplex_) {
        simplex.push_back(Vertex{param, evaluate(param)});
    }

    auto by_cost = [](const Vertex &left, const Vertex &right) { return left.cost < right.cost; };
    std::stable_sort(simplex.begin(), simplex.end(), by_cost);

    auto update_state = [&state, &simplex]() {
        state.best_param = simplex.front().param;
        state.best_cost = simplex.front().cost;
        state.cost_sd = costs_standard_deviation(simplex);
    };

    update_state();
    auto worst = simplex.size() - 1;
    auto shrink = [&]() {
        // toward the best vertex
        for (auto i = std::size_t{1}; i < simplex.size(); i++) {
            Eigen::VectorXd shrunk = simplex.front().param +
                                     options_.sigma * (simplex[i].param - simplex.front().param);
            simplex[i] = Vertex{shrunk, evaluate(shrunk)};
        }
    };

    while (true) {
        if (state.cost_sd <= options_.sd_tolerance) {
            state.termination = TerminationReason::converged;
            break;
        }

        if (state.iterations >= options_.max_iterations) {
            state.termination = TerminationReason::max_iterations;
            break;
        }

        Eigen::VectorXd centroid = Eigen::VectorXd::Zero(simplex.front().param.size());
        for (auto i = std::size_t{0}; i < worst; i++) {
            centroid += simplex[i].param;
        }
        centroid /= static_cast<double>(worst);

        const auto &best = simplex.front();
        const auto &second_worst = simplex[worst - 1];
        Eigen::VectorXd reflected = centroid + options_.alpha * (centroid - simplex[worst].param);
        auto reflected_cost = evaluate(reflected);

        if (best.cost <= reflected_cost && reflected_cost < second_worst.cost) {
            simplex[worst] = Vertex{reflected, reflected_cost};
        } else if (reflected_cost < best.cost) {
            Eigen::VectorXd expanded = centroid + options_.gamma * (reflected - centroid);
            auto expanded_cost = evaluate(expanded);
            if (expanded_cost < reflected_cost) {
                simplex[worst] = Vertex{expanded, expanded_cost};
            } else {
                simplex[worst] = Vertex{reflected, reflected_cost};
            }
        } else if (reflected_cost < simplex[worst].cost) {
            // outside contraction, toward the reflected point
            Eigen::VectorXd contracted = centroid + options_.rho * (reflected - centroid);
            auto contracted_cost = evaluate(contracted);
            if (contracted_cost <= reflected_cost) {
                simplex[worst] = Vertex{contracted, contracted_cost};
            } else {
                shrink();
            }
        } else {
            Eigen::VectorXd contracted =
                centroid + options_.rho * (simplex[worst].param - centroid);
            auto contracted_cost = evaluate(contracted);
            if (contracted_cost < simplex[worst].cost) {
                simplex[worst] = Vertex{contracted, contracted_cost};
            } else {
                shrink();
            }
        }

        std::stable_sort(simplex.begin(), simplex.end(), by_cost);
        state.iterations++;
        update_state();
        if (observer) {
            observer(state);
        }
    }

    return state;
}
} // namespace spop
