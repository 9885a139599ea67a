#pragma once
#include "forward_type.h"

#include <algorithm>
#include <fmt/format.h>
#include <stdexcept>
#include <vector>

namespace spop::core {

/// @brief Fixed size rows by columns table over one contiguous row-major buffer
///
/// @details Used for the per-(age, gender) population buckets and rate tables,
/// rows are ages and columns are genders. Element access is bounds checked.
/// @tparam TYPE The numerical element type
template <Numerical TYPE> class Array2D {
  public:
    /// @brief Initialises an empty instance without storage
    Array2D() = default;

    /// @brief Initialises a zero filled instance
    /// @param nrows Number of rows
    /// @param ncols Number of columns
    /// @throws std::invalid_argument for zero rows or columns
    Array2D(const std::size_t nrows, const std::size_t ncols)
        : rows_{nrows}, columns_{ncols}, data_(nrows * ncols) {
        if (nrows == 0 || ncols == 0) {
            throw std::invalid_argument(
                fmt::format("Invalid {}x{} table, rows and columns must be positive.", nrows,
                            ncols));
        }
    }

    /// @brief Initialises an instance with every element set to a value
    /// @param nrows Number of rows
    /// @param ncols Number of columns
    /// @param value The elements initial value
    /// @throws std::invalid_argument for zero rows or columns
    Array2D(const std::size_t nrows, const std::size_t ncols, TYPE value)
        : Array2D(nrows, ncols) {
        fill(value);
    }

    std::size_t size() const noexcept { return data_.size(); }

    std::size_t rows() const noexcept { return rows_; }

    std::size_t columns() const noexcept { return columns_; }

    /// @throws std::out_of_range for row or column outside the table
    TYPE &operator()(std::size_t row, std::size_t column) { return data_[offset(row, column)]; }

    /// @throws std::out_of_range for row or column outside the table
    const TYPE &operator()(std::size_t row, std::size_t column) const {
        return data_[offset(row, column)];
    }

    /// @brief Sets every element to a value
    void fill(TYPE value) { std::fill(data_.begin(), data_.end(), value); }

    /// @brief Sets every element to zero
    void clear() { fill(TYPE{}); }

    bool operator==(const Array2D<TYPE> &rhs) const = default;

  private:
    std::size_t rows_{};
    std::size_t columns_{};
    std::vector<TYPE> data_;

    std::size_t offset(std::size_t row, std::size_t column) const {
        if (row >= rows_ || column >= columns_) {
            throw std::out_of_range(fmt::format("Element ({}, {}) is outside the {}x{} table.",
                                                row, column, rows_, columns_));
        }

        return row * columns_ + column;
    }
};

/// @brief Table of rates, e.g. death probability by age and gender
using DoubleArray2D = Array2D<double>;

/// @brief Table of people counts by age and gender
using CountArray2D = Array2D<Count>;
} // namespace spop::core
