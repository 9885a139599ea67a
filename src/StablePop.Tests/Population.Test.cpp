#include "pch.h"

#include "StablePop.Core/exception.h"
#include "StablePop/population.h"

#include <iterator>

TEST(TestStablePop_Population, CreateZeroFilled) {
    using namespace spop;
    using spop::core::Gender;

    auto state = PopulationState(120);
    ASSERT_EQ(120, state.max_age());
    ASSERT_EQ(122, state.bucket_count());
    ASSERT_EQ(0u, state.total());
    ASSERT_EQ(0u, state.at(121, Gender::female));
    ASSERT_TRUE(state.cohorts().empty());
    ASSERT_THROW(PopulationState(-1), std::invalid_argument);
}

TEST(TestStablePop_Population, BucketAccess) {
    using namespace spop;
    using spop::core::Gender;

    auto state = PopulationState(60);
    state.at(0, Gender::male) = 10;
    state.at(0, Gender::female) = 12;
    state.at(61, Gender::female) = 3;

    ASSERT_EQ(10u, state.total(Gender::male));
    ASSERT_EQ(15u, state.total(Gender::female));
    ASSERT_EQ(25u, state.total());
    ASSERT_THROW(state.at(62, Gender::male), std::out_of_range);
    ASSERT_THROW(state.at(-1, Gender::male), std::out_of_range);
}

TEST(TestStablePop_Population, SnapshotQueries) {
    using namespace spop;
    using spop::core::Gender;

    auto state = PopulationState(50);
    state.at(20, Gender::male) = 100;
    state.at(20, Gender::female) = 90;
    state.at(30, Gender::female) = 5;

    auto snapshot = state.snapshot();
    ASSERT_EQ(52u, snapshot.males.size());
    ASSERT_EQ(52u, snapshot.females.size());
    ASSERT_EQ(195u, snapshot.count());
    ASSERT_EQ(100u, snapshot.count_gender(Gender::male));
    ASSERT_EQ(95u, snapshot.count_gender(Gender::female));
    ASSERT_EQ(190u, snapshot.count_age(20));
    ASSERT_EQ(0u, snapshot.count_age(200));
    ASSERT_EQ(5u, snapshot.count_age_gender(30, Gender::female));
    ASSERT_EQ(0u, snapshot.count_age_gender(30, Gender::male));
    ASSERT_THROW(snapshot.count_age_gender(52, Gender::male), std::out_of_range);

    // snapshots are detached copies
    state.at(20, Gender::male) = 0;
    ASSERT_EQ(100u, snapshot.count_age_gender(20, Gender::male));
}

TEST(TestStablePop_Population, CohortRatio) {
    using namespace spop;

    auto cohort = CohortData{200, 410};
    ASSERT_DOUBLE_EQ(2.05, cohort.ratio());
    ASSERT_THROW((CohortData{0, 5}).ratio(), spop::core::NoDataError);
}

TEST(TestStablePop_Population, CohortAccumulates) {
    using namespace spop;

    auto cohorts = CohortFertility{};
    cohorts.add_females(10, 100);
    cohorts.add_births(10, 30);
    cohorts.add_births(10, 70);
    cohorts.add_births(12, 5);

    ASSERT_EQ(2u, cohorts.size());
    ASSERT_EQ((CohortData{100, 100}), cohorts.at(10));
    ASSERT_EQ((CohortData{0, 5}), cohorts.at(12));
    ASSERT_TRUE(cohorts.contains(12));
    ASSERT_FALSE(cohorts.contains(11));
    ASSERT_THROW(cohorts.at(11), std::out_of_range);
}

TEST(TestStablePop_Population, CohortAverageSkipsEmptyExposure) {
    using namespace spop;

    auto cohorts = CohortFertility{};
    cohorts.add_females(1, 100);
    cohorts.add_births(1, 200);
    cohorts.add_females(2, 100);
    cohorts.add_births(2, 220);
    cohorts.add_births(3, 50);

    ASSERT_DOUBLE_EQ(2.1, cohorts.avg());
}

TEST(TestStablePop_Population, CohortAverageWithoutDataThrows) {
    using namespace spop;

    auto cohorts = CohortFertility{};
    ASSERT_THROW(cohorts.avg(), spop::core::NoDataError);

    cohorts.add_births(3, 50);
    ASSERT_THROW(cohorts.avg(), spop::core::NoDataError);
}

TEST(TestStablePop_Population, CohortRetainInclusiveRange) {
    using namespace spop;

    auto cohorts = CohortFertility{};
    for (auto year = -5; year <= 15; year++) {
        cohorts.add_females(year, 1);
    }

    cohorts.retain(0, 10);
    ASSERT_EQ(11u, cohorts.size());
    ASSERT_EQ(0, cohorts.begin()->first);
    ASSERT_EQ(10, std::prev(cohorts.end())->first);

    cohorts.retain(8, 2);
    ASSERT_TRUE(cohorts.empty());
}
