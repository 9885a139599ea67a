#pragma once
#include "forward_type.h"

namespace spop::core {

/// @brief Numerical comparison and expected-count rounding functions.
///
/// References:
/// - Didier H. Besset, Object-Oriented Implementation of Numerical Methods An
///   Introduction with Smalltalk, Morgan Kaufmann, November 2000.
class MathHelper {
  public:
    MathHelper() = delete;

    /// @brief Gets the largest positive value which, when added to 1.0, yields 1.0.
    /// @return The machine precision value
    static double machine_precision() noexcept;

    /// @brief Gets the typical meaningful precision for numerical calculations.
    /// @return The default precision for numerical calculations
    static double default_numerical_precision() noexcept;

    /// @brief Compares two floating-point numbers for relative equality using
    ///        the default numerical precision.
    /// @param left The left double to compare.
    /// @param right The right double to compare.
    /// @return <b>true</b> if the number are equal, otherwise. <b>false</b>
    static bool equal(double left, double right) noexcept;

    /// @brief Compares two floating-point numbers for relative equality.
    ///
    /// Let <c>a</c> and <c>b</c> be the two numbers to be compared, the numbers
    /// are equal if <c>|a - b| / max(|a|, |b|)</c> is smaller than the precision,
    /// or if both numbers are smaller than the precision in magnitude.
    ///
    /// @param left The left double to compare.
    /// @param right The right double to compare.
    /// @param precision The comparison precision.
    /// @return <b>true</b> if the number are equal, otherwise. <b>false</b>
    static bool equal(double left, double right, double precision) noexcept;

    /// @brief Rounds an expected value to the nearest population count
    /// @param expected The expected (non-negative) value
    /// @return The rounded count, zero for negative or non-finite values
    static Count round_to_count(double expected) noexcept;

    /// @brief Subtracts two counts, clamping the result to zero
    /// @param value The minuend count
    /// @param amount The subtrahend count
    /// @return The difference, or zero if amount is greater than value
    static Count saturating_subtract(Count value, Count amount) noexcept;

    /// @brief Adds two counts, clamping the result to the largest count
    /// @param value The first count
    /// @param amount The count to add
    /// @return The sum, or the largest representable count on overflow
    static Count saturating_add(Count value, Count amount) noexcept;
};
} // namespace spop::core
