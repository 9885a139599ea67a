#include "pch.h"

#include "StablePop.Core/exception.h"
#include "StablePop/simulation.h"

#include <iterator>
#include <limits>

namespace {
spop::Parameters short_run(int n_years) {
    auto parameters = spop::default_parameters();
    parameters.n_years = n_years;
    return parameters;
}
} // anonymous namespace

TEST(TestStablePop_Simulation, ZeroYearsKeepsInitialState) {
    using namespace spop;

    auto result = run_simulation(short_run(0));
    ASSERT_EQ(1u, result.timeline.size());
    ASSERT_EQ(result.initial_population, result.final_population);
    ASSERT_EQ(result.initial_population.count(), result.timeline.sum(0));
    ASSERT_TRUE(result.cohort_fertility.empty());
}

TEST(TestStablePop_Simulation, TimelineCoversEveryYear) {
    using namespace spop;

    auto parameters = short_run(50);
    auto result = run_simulation(parameters);

    ASSERT_EQ(static_cast<std::size_t>(parameters.n_years) + 1, result.timeline.size());
    ASSERT_EQ(core::IntegerInterval(0, parameters.n_years), result.timeline.year_range());
    ASSERT_EQ(result.initial_population.count(), result.timeline.sum(0));
    ASSERT_EQ(result.final_population.count(), result.timeline.sum(parameters.n_years));
    ASSERT_EQ(result.final_population.count_gender(core::Gender::female),
              result.timeline.at(parameters.n_years).females);
}

TEST(TestStablePop_Simulation, ShortRunHasNoCompletedCohorts) {
    using namespace spop;

    auto result = run_simulation(short_run(50));
    ASSERT_TRUE(result.cohort_fertility.empty());
    ASSERT_THROW(result.cohort_fertility.avg(), core::NoDataError);
}

TEST(TestStablePop_Simulation, CohortLedgerTrimmedToBurnIn) {
    using namespace spop;

    auto parameters = short_run(300);
    auto result = run_simulation(parameters);
    const auto &cohorts = result.cohort_fertility;

    ASSERT_FALSE(cohorts.empty());
    ASSERT_EQ(cohort_burn_in_years, cohorts.begin()->first);
    ASSERT_EQ(parameters.n_years - cohort_burn_in_years, std::prev(cohorts.end())->first);
    ASSERT_EQ(static_cast<std::size_t>(parameters.n_years - 2 * cohort_burn_in_years + 1),
              cohorts.size());

    // completed cohorts realise close to the target fertility
    auto completed = cohorts.at(150);
    ASSERT_NEAR(parameters.target_total_fertility_rate, completed.ratio(), 0.05);
}

TEST(TestStablePop_Simulation, DeterministicRuns) {
    using namespace spop;

    auto parameters = short_run(120);
    auto first = run_simulation(parameters);
    auto second = parameters.run();

    ASSERT_EQ(first, second);
}

TEST(TestStablePop_Simulation, LowFertilityShrinks) {
    using namespace spop;

    auto parameters = short_run(200);
    parameters.target_total_fertility_rate = 1.0;
    auto result = run_simulation(parameters);

    ASSERT_LT(result.final_population.count(), result.initial_population.count() / 2);
}

TEST(TestStablePop_Simulation, InvalidParametersThrow) {
    using namespace spop;

    auto parameters = short_run(10);
    parameters.initial_population = 0;
    ASSERT_THROW(run_simulation(parameters), core::ConfigurationError);

    parameters = short_run(-1);
    ASSERT_THROW(parameters.run(), core::ConfigurationError);

    parameters = short_run(10);
    parameters.max_age = 48;
    ASSERT_THROW(run_simulation(parameters), core::ConfigurationError);

    parameters = short_run(10);
    parameters.males_per_100_females = 256;
    ASSERT_THROW(run_simulation(parameters), core::ConfigurationError);

    parameters = short_run(10);
    parameters.target_total_fertility_rate = std::numeric_limits<double>::quiet_NaN();
    ASSERT_THROW(run_simulation(parameters), core::ConfigurationError);

    parameters = short_run(10);
    parameters.infant_mortality_rate = 1.5;
    ASSERT_THROW(run_simulation(parameters), core::ConfigurationError);
}

TEST(TestStablePop_Simulation, ConservationWithStillTables) {
    using namespace spop;

    auto parameters = short_run(1);
    parameters.max_age = 60;
    auto buckets = static_cast<std::size_t>(parameters.max_age) + 2;
    auto deaths = core::DoubleArray2D(buckets, 2, 0.0);
    for (auto age = buckets - 2; age < buckets; age++) {
        deaths(age, 0) = 1.0;
        deaths(age, 1) = 1.0;
    }

    auto result = run_simulation(
        parameters, DemographicTables{parameters.max_age, std::vector<double>(buckets, 0.0), deaths});
    const auto &start = result.initial_population;
    auto expected = start.count() - start.count_age(parameters.max_age - 1) -
                    start.count_age(parameters.max_age);

    ASSERT_EQ(expected, result.final_population.count());
    for (auto age = 1; age < parameters.max_age; age++) {
        ASSERT_EQ(start.count_age(age - 1), result.final_population.count_age(age));
    }
}

TEST(TestStablePop_Simulation, HighFertilityCountsSaturate) {
    using namespace spop;

    // grows past the largest count well before the last year
    auto parameters = default_parameters();
    parameters.target_total_fertility_rate = 3.0;
    auto result = run_simulation(parameters);

    auto previous = result.timeline.sum(0);
    for (const auto &entry : result.timeline) {
        ASSERT_GE(entry.data.total(), previous) << "year " << entry.year;
        previous = entry.data.total();
    }

    ASSERT_EQ(std::numeric_limits<core::Count>::max(), result.timeline.sum(parameters.n_years));
    ASSERT_EQ(std::numeric_limits<core::Count>::max(), result.final_population.count());
}

TEST(TestStablePop_Simulation, BatchMatchesSequentialRuns) {
    using namespace spop;

    auto batch = std::vector<Parameters>{};
    for (auto tfr : {1.8, 2.06406, 2.3}) {
        auto parameters = short_run(150);
        parameters.target_total_fertility_rate = tfr;
        batch.push_back(parameters);
    }

    auto results = run_batch(batch);
    ASSERT_EQ(batch.size(), results.size());
    for (auto index = std::size_t{0}; index < batch.size(); index++) {
        ASSERT_EQ(run_simulation(batch[index]), results[index]);
    }

    ASSERT_LT(results[0].timeline.sum(150), results[2].timeline.sum(150));
    ASSERT_TRUE(run_batch({}).empty());
}

TEST(TestStablePop_Simulation, BatchValidatesBeforeRunning) {
    using namespace spop;

    auto batch = std::vector<Parameters>{short_run(10), short_run(10)};
    batch[1].infant_mortality_rate = -0.1;
    ASSERT_THROW(run_batch(batch), core::ConfigurationError);
}
