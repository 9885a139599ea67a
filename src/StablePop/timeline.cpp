#include "timeline.h"

#include <fmt/format.h>

namespace spop {

void Timeline::append(int year, TimelineData data) {
    if (!entries_.empty() && year != entries_.back().year + 1) {
        throw std::invalid_argument(fmt::format(
            "Timeline year {} does not follow the last year {}.", year, entries_.back().year));
    }

    entries_.push_back(Entry{year, data});
}

const TimelineData &Timeline::at(int year) const {
    if (entries_.empty()) {
        throw std::out_of_range(fmt::format("Timeline year {} lookup on empty series.", year));
    }

    auto first = entries_.front().year;
    auto offset = static_cast<long long>(year) - first;
    if (offset < 0 || offset >= static_cast<long long>(entries_.size())) {
        throw std::out_of_range(fmt::format("Timeline year {} is out of range [{}, {}].", year,
                                            first, entries_.back().year));
    }

    return entries_[static_cast<std::size_t>(offset)].data;
}

core::Count Timeline::sum(int year) const { return at(year).total(); }

core::IntegerInterval Timeline::year_range() const {
    if (entries_.empty()) {
        throw core::NoDataError("Timeline years range of empty series.");
    }

    return core::IntegerInterval{entries_.front().year, entries_.back().year};
}
} // namespace spop
