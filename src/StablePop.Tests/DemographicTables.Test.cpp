#include "pch.h"

#include "StablePop/demographic_tables.h"

namespace {
spop::core::DoubleArray2D make_death_rates(int max_age, double rate) {
    using namespace spop::core;
    auto buckets = static_cast<std::size_t>(max_age) + 2;
    auto rates = DoubleArray2D(buckets, 2, rate);
    for (auto age = static_cast<std::size_t>(max_age); age < buckets; age++) {
        rates(age, 0) = 1.0;
        rates(age, 1) = 1.0;
    }

    return rates;
}
} // anonymous namespace

TEST(TestStablePop_DemographicTables, AgeDistributionSumsToOne) {
    using namespace spop;

    auto sum = 0.0;
    for (auto age = 0; age <= 121; age++) {
        sum += age_distribution(age, 120);
    }

    ASSERT_NEAR(1.0, sum, 1e-12);
    ASSERT_EQ(0.0, age_distribution(121, 120));
    ASSERT_EQ(0.0, age_distribution(-1, 120));
}

TEST(TestStablePop_DemographicTables, AgeDistributionBands) {
    using namespace spop;

    ASSERT_DOUBLE_EQ(0.25 / 15.0, age_distribution(0, 120));
    ASSERT_DOUBLE_EQ(0.25 / 15.0, age_distribution(14, 120));
    ASSERT_DOUBLE_EQ(0.16 / 10.0, age_distribution(15, 120));
    ASSERT_DOUBLE_EQ(0.41 / 30.0, age_distribution(54, 120));
    ASSERT_DOUBLE_EQ(0.09 / 10.0, age_distribution(64, 120));
    ASSERT_DOUBLE_EQ(0.09 / 56.0, age_distribution(65, 120));
    ASSERT_DOUBLE_EQ(0.09 / 56.0, age_distribution(120, 120));
}

TEST(TestStablePop_DemographicTables, NominalFertility) {
    using namespace spop;

    ASSERT_DOUBLE_EQ(2.525, nominal_total_fertility());
    ASSERT_EQ(0.0, nominal_birth_probability(14));
    ASSERT_EQ(0.04, nominal_birth_probability(15));
    ASSERT_EQ(0.13, nominal_birth_probability(27));
    ASSERT_EQ(0.005, nominal_birth_probability(49));
    ASSERT_EQ(0.0, nominal_birth_probability(50));
}

TEST(TestStablePop_DemographicTables, BirthProbabilityMatchesTargetFertility) {
    using namespace spop;

    for (auto target : {0.0, 1.5, 2.06406, 3.0}) {
        auto sum = 0.0;
        for (auto age = 0; age <= max_fertile_age; age++) {
            sum += birth_probability(age, target);
        }

        ASSERT_NEAR(target, sum, 1e-12);
    }
}

TEST(TestStablePop_DemographicTables, DeathProbabilityRules) {
    using namespace spop;
    using spop::core::Gender;

    ASSERT_EQ(0.005, death_probability(0, Gender::male, 120, 0.005));
    ASSERT_EQ(0.005, death_probability(0, Gender::female, 120, 0.005));
    ASSERT_EQ(1.0, death_probability(120, Gender::male, 120, 0.005));
    ASSERT_EQ(1.0, death_probability(121, Gender::female, 120, 0.005));
    ASSERT_EQ(1.0, death_probability(60, Gender::female, 60, 0.005));

    for (auto age = 1; age < 120; age++) {
        auto male = death_probability(age, Gender::male, 120, 0.005);
        auto female = death_probability(age, Gender::female, 120, 0.005);
        ASSERT_GT(male, 0.0);
        ASSERT_LT(male, 1.0);
        ASSERT_GE(male, female);
    }
}

TEST(TestStablePop_DemographicTables, CreateFromParameters) {
    using namespace spop;
    using spop::core::Gender;

    auto parameters = default_parameters();
    auto tables = DemographicTables::create(parameters);

    ASSERT_EQ(parameters.max_age, tables.max_age());
    ASSERT_DOUBLE_EQ(birth_probability(30, parameters.target_total_fertility_rate),
                     tables.birth_rate(30));
    ASSERT_EQ(0.0, tables.birth_rate(parameters.max_age + 1));
    ASSERT_EQ(parameters.infant_mortality_rate, tables.death_rate(0, Gender::female));
    ASSERT_EQ(1.0, tables.death_rate(parameters.max_age, Gender::male));
    ASSERT_EQ(1.0, tables.death_rate(parameters.max_age + 1, Gender::female));
    ASSERT_THROW(tables.birth_rate(parameters.max_age + 2), std::out_of_range);
    ASSERT_THROW(tables.death_rate(-1, Gender::male), std::out_of_range);
}

TEST(TestStablePop_DemographicTables, CreateCustom) {
    using namespace spop;
    using spop::core::Gender;

    auto births = std::vector<double>(52, 0.0);
    births[30] = 0.5;
    auto tables = DemographicTables(50, births, make_death_rates(50, 0.01));

    ASSERT_EQ(50, tables.max_age());
    ASSERT_EQ(0.5, tables.birth_rate(30));
    ASSERT_EQ(0.01, tables.death_rate(49, Gender::male));
    ASSERT_EQ(1.0, tables.death_rate(50, Gender::female));
}

TEST(TestStablePop_DemographicTables, CreateCustomMalformedThrows) {
    using namespace spop;

    auto births = std::vector<double>(52, 0.0);
    ASSERT_THROW(DemographicTables(50, std::vector<double>(51, 0.0), make_death_rates(50, 0.0)),
                 std::invalid_argument);
    ASSERT_THROW(DemographicTables(50, births, make_death_rates(60, 0.0)), std::invalid_argument);

    auto negative_births = births;
    negative_births[20] = -0.1;
    ASSERT_THROW(DemographicTables(50, negative_births, make_death_rates(50, 0.0)),
                 std::invalid_argument);

    ASSERT_THROW(DemographicTables(50, births, make_death_rates(50, 1.5)), std::invalid_argument);

    auto open_ceiling = make_death_rates(50, 0.0);
    open_ceiling(51, 1) = 0.5;
    ASSERT_THROW(DemographicTables(50, births, open_ceiling), std::invalid_argument);
}
