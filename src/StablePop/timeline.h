#pragma once
#include "StablePop.Core/interval.h"
#include "gender_value.h"

#include <vector>

namespace spop {

/// @brief Population totals of one simulated year
using TimelineData = CountGenderValue;

/// @brief Defines the yearly population time series, contiguous years without gaps
class Timeline {
  public:
    /// @brief Timeline entry, the year and its population totals
    struct Entry {
        /// @brief The simulation year
        int year{};

        /// @brief The population totals
        TimelineData data{};

        bool operator==(const Entry &rhs) const = default;
    };

    using const_iterator = std::vector<Entry>::const_iterator;

    /// @brief Initialises a new instance of the Timeline class
    Timeline() = default;

    /// @brief Appends the next year to the series
    /// @param year The year, must follow the last recorded year
    /// @param data The population totals
    /// @throws std::invalid_argument for non-contiguous year
    void append(int year, TimelineData data);

    /// @brief Gets the population totals of a year
    /// @param year The year to lookup
    /// @return The population totals
    /// @throws std::out_of_range for year outside the series
    const TimelineData &at(int year) const;

    /// @brief Gets the total population, males and females, of a year
    /// @param year The year to lookup
    /// @return Total population count
    /// @throws std::out_of_range for year outside the series
    core::Count sum(int year) const;

    /// @brief Gets the first and last recorded years
    /// @return The years range
    /// @throws core::NoDataError for empty timeline
    core::IntegerInterval year_range() const;

    std::size_t size() const noexcept { return entries_.size(); }
    bool empty() const noexcept { return entries_.empty(); }
    const_iterator begin() const noexcept { return entries_.begin(); }
    const_iterator end() const noexcept { return entries_.end(); }

    bool operator==(const Timeline &rhs) const = default;

  private:
    std::vector<Entry> entries_;
};
} // namespace spop
