#pragma once

#include "exception.h"
#include "forward_type.h"

#include <algorithm>
#include <fmt/format.h>

namespace spop::core {

/// @brief Closed range [lower, upper] of numeric values, e.g. timeline years or
/// admissible fertility rates
/// @tparam TYPE The numerical type
template <Numerical TYPE> class Interval {
  public:
    /// @brief Initialises a new instance of the Interval class, the [0, 0] range
    Interval() = default;

    /// @brief Initialises a new instance of the Interval class
    /// @param lower_value Lower bound, inclusive
    /// @param upper_value Upper bound, inclusive
    /// @throws SpopException for lower bound greater than upper bound
    explicit Interval(TYPE lower_value, TYPE upper_value)
        : lower_{lower_value}, upper_{upper_value} {
        if (lower_ > upper_) {
            throw SpopException(fmt::format("Invalid interval: {}-{}", lower_, upper_));
        }
    }

    TYPE lower() const noexcept { return lower_; }

    TYPE upper() const noexcept { return upper_; }

    TYPE length() const noexcept { return upper_ - lower_; }

    /// @brief Determines whether a value lies within the bounds
    bool contains(TYPE value) const noexcept { return lower_ <= value && value <= upper_; }

    /// @brief Determines whether another range lies entirely within the bounds
    bool contains(const Interval<TYPE> &other) const noexcept {
        return contains(other.lower_) && contains(other.upper_);
    }

    /// @brief Moves a value to the nearest bound when outside the range
    /// @param value The value to clamp
    /// @return The value, or the nearest bound
    TYPE clamp(TYPE value) const noexcept { return std::clamp(value, lower_, upper_); }

    std::string to_string() const { return fmt::format("{}-{}", lower_, upper_); }

    auto operator<=>(const Interval<TYPE> &rhs) const = default;

  private:
    TYPE lower_{};
    TYPE upper_{};
};

/// @brief Range of whole numbers, years and ages
using IntegerInterval = Interval<int>;

/// @brief Range of real numbers, rates
using DoubleInterval = Interval<double>;

} // namespace spop::core
