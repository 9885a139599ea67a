#include "pch.h"

#include "StablePop.Core/exception.h"
#include "StablePop/timeline.h"

TEST(TestStablePop_Timeline, CreateEmpty) {
    using namespace spop;

    auto timeline = Timeline{};
    ASSERT_TRUE(timeline.empty());
    ASSERT_EQ(0u, timeline.size());
    ASSERT_THROW(timeline.year_range(), spop::core::NoDataError);
    ASSERT_THROW(timeline.at(0), std::out_of_range);
}

TEST(TestStablePop_Timeline, AppendContiguousYears) {
    using namespace spop;

    auto timeline = Timeline{};
    timeline.append(0, TimelineData{10, 12});
    timeline.append(1, TimelineData{11, 13});
    timeline.append(2, TimelineData{9, 9});

    ASSERT_EQ(3u, timeline.size());
    ASSERT_EQ(spop::core::IntegerInterval(0, 2), timeline.year_range());
    ASSERT_EQ((TimelineData{11, 13}), timeline.at(1));
    ASSERT_EQ(22u, timeline.sum(0));
    ASSERT_EQ(18u, timeline.sum(2));
    ASSERT_THROW(timeline.at(3), std::out_of_range);
    ASSERT_THROW(timeline.at(-1), std::out_of_range);

    auto year = 0;
    for (const auto &entry : timeline) {
        ASSERT_EQ(year, entry.year);
        year++;
    }
}

TEST(TestStablePop_Timeline, AppendGapThrows) {
    using namespace spop;

    auto timeline = Timeline{};
    timeline.append(5, TimelineData{1, 1});
    ASSERT_THROW(timeline.append(7, TimelineData{1, 1}), std::invalid_argument);
    ASSERT_THROW(timeline.append(5, TimelineData{1, 1}), std::invalid_argument);
    ASSERT_EQ(1u, timeline.size());
    ASSERT_EQ(spop::core::IntegerInterval(5, 5), timeline.year_range());
}
