#include "population_simulator.h"
#include "StablePop.Core/math_util.h"

#include <algorithm>
#include <fmt/format.h>

namespace spop {

namespace { // anonymous namespace

const Parameters &validated(const Parameters &parameters) {
    validate(parameters);
    return parameters;
}

} // anonymous namespace

PopulationSimulator::PopulationSimulator(const Parameters &parameters)
    : PopulationSimulator(parameters, DemographicTables::create(validated(parameters))) {}

PopulationSimulator::PopulationSimulator(const Parameters &parameters, DemographicTables tables)
    : parameters_{validated(parameters)}, tables_{std::move(tables)},
      state_{parameters.max_age} {
    if (tables_.max_age() != parameters_.max_age) {
        throw std::invalid_argument(
            fmt::format("Tables and parameters maximum age mismatch: {} vs. {}.",
                        tables_.max_age(), parameters_.max_age));
    }

    auto males = static_cast<double>(parameters_.males_per_100_females);
    male_birth_bias_ = males / (males + 100.0);
    initialise_population();
}

void PopulationSimulator::initialise_population() {
    auto half_population = static_cast<double>(parameters_.initial_population) * 0.5;
    for (auto age = 0; age < state_.bucket_count(); age++) {
        auto frequency = age_distribution(age, parameters_.max_age);

        // truncate to whole people, same count for each gender
        auto count_each = static_cast<core::Count>(frequency * half_population);
        state_.at(age, core::Gender::male) = count_each;
        state_.at(age, core::Gender::female) = count_each;
    }
}

CountGenderValue PopulationSimulator::step_year(int year) {
    if (years_simulated_ >= parameters_.n_years) {
        throw std::logic_error(fmt::format("Simulation has completed all {} years.",
                                           parameters_.n_years));
    }

    propagate_age();
    auto newborns = handle_births(year);
    handle_deaths();
    years_simulated_++;
    return newborns;
}

void PopulationSimulator::propagate_age() {
    // top down, each bucket must be read before it is overwritten
    for (auto age = parameters_.max_age; age >= 0; age--) {
        for (auto gender : {core::Gender::male, core::Gender::female}) {
            auto &young = state_.at(age, gender);
            state_.at(age + 1, gender) = young;
            young = 0;
        }
    }
}

CountGenderValue PopulationSimulator::handle_births(int year) {
    auto &cohorts = state_.cohorts();
    core::Count total_newborns{};
    for (auto age = 0; age < state_.bucket_count(); age++) {
        auto females = state_.at(age, core::Gender::female);
        auto births = core::MathHelper::round_to_count(tables_.birth_rate(age) *
                                                       static_cast<double>(females));
        if (births > 0) {
            cohorts.add_births(year - age, births);
            total_newborns = core::MathHelper::saturating_add(total_newborns, births);
        }
    }

    auto males = core::MathHelper::round_to_count(static_cast<double>(total_newborns) *
                                                  male_birth_bias_);
    males = std::min(males, total_newborns);
    auto newborns = CountGenderValue{males, total_newborns - males};

    cohorts.add_females(year, newborns.females);
    auto &female_infants = state_.at(0, core::Gender::female);
    female_infants = core::MathHelper::saturating_add(female_infants, newborns.females);
    auto &male_infants = state_.at(0, core::Gender::male);
    male_infants = core::MathHelper::saturating_add(male_infants, newborns.males);
    return newborns;
}

core::Count PopulationSimulator::handle_deaths() {
    core::Count total_deaths{};
    for (auto age = 0; age < state_.bucket_count(); age++) {
        for (auto gender : {core::Gender::male, core::Gender::female}) {
            auto &count = state_.at(age, gender);
            auto deaths = core::MathHelper::round_to_count(static_cast<double>(count) *
                                                           tables_.death_rate(age, gender));

            // rounding can exceed a small bucket count
            deaths = std::min(deaths, count);
            count = core::MathHelper::saturating_subtract(count, deaths);
            total_deaths = core::MathHelper::saturating_add(total_deaths, deaths);
        }
    }

    return total_deaths;
}

TimelineData PopulationSimulator::totals() const {
    return TimelineData{state_.total(core::Gender::male), state_.total(core::Gender::female)};
}

PopulationState PopulationSimulator::release() noexcept { return std::move(state_); }
} // namespace spop
