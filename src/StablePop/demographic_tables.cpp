#include "demographic_tables.h"
#include "StablePop.Core/math_util.h"

#include <cmath>
#include <fmt/format.h>

namespace spop {

double age_distribution(int age, int max_age) noexcept {
    if (age < 0 || age > max_age) {
        return 0.0;
    }

    if (age <= 14) {
        return 0.25 / 15.0;
    }
    if (age <= 24) {
        return 0.16 / 10.0;
    }
    if (age <= 54) {
        return 0.41 / 30.0;
    }
    if (age <= 64) {
        return 0.09 / 10.0;
    }

    return 0.09 / 56.0;
}

double nominal_birth_probability(int age) noexcept {
    if (age < 15 || age > max_fertile_age) {
        return 0.0;
    }

    if (age <= 19) {
        return 0.04;
    }
    if (age <= 24) {
        return 0.10;
    }
    if (age <= 29) {
        return 0.13;
    }
    if (age <= 34) {
        return 0.12;
    }
    if (age <= 39) {
        return 0.08;
    }
    if (age <= 44) {
        return 0.03;
    }

    return 0.005;
}

double nominal_total_fertility() noexcept {
    static const double total = [] {
        auto sum = 0.0;
        for (auto age = 0; age <= max_fertile_age; age++) {
            sum += nominal_birth_probability(age);
        }

        return sum;
    }();

    return total;
}

double birth_probability(int age, double target_tfr) noexcept {
    return nominal_birth_probability(age) * target_tfr / nominal_total_fertility();
}

double death_probability(int age, core::Gender gender, int max_age,
                         double infant_mortality_rate) noexcept {
    if (age >= max_age) {
        return 1.0;
    }

    if (age <= 0) {
        return infant_mortality_rate;
    }

    // Life table by five years age group, ages 1 and 2-4 on their own
    struct LifeTableRow {
        int upper_age;
        double male;
        double female;
    };

    static constexpr LifeTableRow life_table[] = {
        {1, 0.00039, 0.00030},  {4, 0.00020, 0.00015},  {9, 0.00013, 0.00010},
        {14, 0.00010, 0.00008}, {19, 0.00022, 0.00018}, {24, 0.00074, 0.00060},
        {29, 0.00097, 0.00080}, {34, 0.00107, 0.00090}, {39, 0.00127, 0.00110},
        {44, 0.00174, 0.00150}, {49, 0.00261, 0.00220}, {54, 0.00422, 0.00350},
        {59, 0.00689, 0.00570}, {64, 0.01135, 0.00940}, {69, 0.01871, 0.01550},
        {74, 0.03066, 0.02540}, {79, 0.05027, 0.04160}, {84, 0.08096, 0.06700},
        {89, 0.13257, 0.10970}, {94, 0.20755, 0.17100}, {99, 0.31234, 0.25500},
    };

    for (const auto &row : life_table) {
        if (age <= row.upper_age) {
            return gender == core::Gender::male ? row.male : row.female;
        }
    }

    // centenarians
    return gender == core::Gender::male ? 0.43622 : 0.36000;
}

DemographicTables::DemographicTables(int max_age, std::vector<double> birth_rates,
                                     core::DoubleArray2D death_rates)
    : max_age_{max_age}, birth_rates_{std::move(birth_rates)},
      death_rates_{std::move(death_rates)} {
    if (max_age_ < 0) {
        throw std::invalid_argument(
            fmt::format("Tables maximum age must not be negative, given: {}.", max_age_));
    }

    auto buckets = static_cast<std::size_t>(max_age_) + 2;
    if (birth_rates_.size() != buckets) {
        throw std::invalid_argument(fmt::format("Birth rates size mismatch: {} vs. given {}.",
                                                buckets, birth_rates_.size()));
    }

    if (death_rates_.rows() != buckets || death_rates_.columns() != 2) {
        throw std::invalid_argument(
            fmt::format("Death rates size mismatch: {}x2 vs. given {}x{}.", buckets,
                        death_rates_.rows(), death_rates_.columns()));
    }

    auto is_probability = [](double value) { return value >= 0.0 && value <= 1.0; };
    for (auto age = std::size_t{0}; age < buckets; age++) {
        if (!std::isfinite(birth_rates_[age]) || birth_rates_[age] < 0.0) {
            throw std::invalid_argument(fmt::format(
                "Birth rate at age {} must be a non-negative number: {}.", age, birth_rates_[age]));
        }

        for (auto gender : {core::Gender::male, core::Gender::female}) {
            auto rate = death_rates_(age, core::gender_index(gender));
            if (!is_probability(rate)) {
                throw std::invalid_argument(fmt::format(
                    "Death rate at age {} is not a probability: {}.", age, rate));
            }

            if (static_cast<int>(age) >= max_age_ && !core::MathHelper::equal(rate, 1.0)) {
                throw std::invalid_argument(fmt::format(
                    "Death rate at ceiling age {} must be 1.0, given: {}.", age, rate));
            }
        }
    }
}

DemographicTables DemographicTables::create(const Parameters &parameters) {
    auto buckets = static_cast<std::size_t>(parameters.max_age) + 2;
    auto births = std::vector<double>(buckets);
    auto deaths = core::DoubleArray2D(buckets, 2);
    for (auto age = 0; age < static_cast<int>(buckets); age++) {
        auto index = static_cast<std::size_t>(age);
        births[index] = birth_probability(age, parameters.target_total_fertility_rate);
        for (auto gender : {core::Gender::male, core::Gender::female}) {
            deaths(index, core::gender_index(gender)) = death_probability(
                age, gender, parameters.max_age, parameters.infant_mortality_rate);
        }
    }

    return DemographicTables{parameters.max_age, std::move(births), std::move(deaths)};
}

double DemographicTables::birth_rate(int age) const {
    if (age < 0 || age > max_age_ + 1) {
        throw std::out_of_range(fmt::format("Birth rate age {} out of range.", age));
    }

    return birth_rates_[static_cast<std::size_t>(age)];
}

double DemographicTables::death_rate(int age, core::Gender gender) const {
    if (age < 0) {
        throw std::out_of_range(fmt::format("Death rate age {} out of range.", age));
    }

    return death_rates_(static_cast<std::size_t>(age), core::gender_index(gender));
}
} // namespace spop
