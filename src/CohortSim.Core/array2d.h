#pragma once
#include "forward_type.h"

#include <algorithm>
#include <fmt/format.h>
#include <stdexcept>
#include <vector>

namespace csim::core {

/// @brief Defines a contiguous storage for two-dimensional numerical data in row-major format
/// @tparam TYPE The numerical type to store
template <Numerical TYPE> class Array2D {
  public:
    /// @brief Initialises new instance of the Array2D class with no storage.
    Array2D() = default;

    /// @brief Initialises new instance of the Array2D class.
    /// @param nrows The number of rows in the array
    /// @param ncols The number fo columns in the array
    /// @throws std::invalid_argument for array with zero size storage;
    Array2D(const size_t nrows, const size_t ncols)
        : rows_{nrows}, columns_{ncols}, data_(nrows * ncols) {
        if (nrows == 0 || ncols == 0) {
            throw std::invalid_argument("Invalid array constructor with 0 size");
        }

        data_.shrink_to_fit();
    }

    /// @brief Initialises new instance of the Array2D class with custom default value.
    /// @param nrows The number of rows in the array
    /// @param ncols The number of columns in the array
    /// @param value The default value to initialise the array values
    /// @throws std::invalid_argument for array with zero size storage;
    Array2D(const size_t nrows, const size_t ncols, TYPE value) : Array2D(nrows, ncols) {
        fill(value);
    }

    /// @brief Gets the total size of the array storage
    /// @return The total size
    size_t size() const noexcept { return rows_ * columns_; }

    /// @brief Gets the number of rows in the array
    /// @return The number of rows
    size_t rows() const noexcept { return rows_; }

    /// @brief Gets the number of coluns in the array
    /// @return The number of columns
    size_t columns() const noexcept { return columns_; }

    /// @brief Gets a value from the array
    /// @param row The zero-based row index
    /// @param column The zero-based columns index
    /// @return The respective value at location
    /// throws std::out_of_range for row or column index out of array bounds
    TYPE &operator()(size_t row, size_t column) {
        check_boundaries(row, column);
        return data_[row * columns_ + column];
    }

    /// @brief Gets a read-only value from the array
    /// @param row The zero-based row index
    /// @param column The zero-based columns index
    /// @return The respective value at location
    /// throws std::out_of_range for row or column index out of array bounds
    const TYPE &operator()(size_t row, size_t column) const {
        check_boundaries(row, column);
        return data_[row * columns_ + column];
    }

    /// @brief Fill the array data with a default value
    /// @param value The default value to store in the array
    void fill(TYPE value) { std::fill(data_.begin(), data_.end(), value); }

  private:
    size_t rows_{};
    size_t columns_{};
    std::vector<TYPE> data_;

    void check_boundaries(size_t row, size_t column) const {
        if (row >= rows_) {
            throw std::out_of_range(
                fmt::format("Row {} is out of array bounds [0, {}).", row, rows_));
        }

        if (column >= columns_) {
            throw std::out_of_range(
                fmt::format("Column {} is out of array bounds [0, {}).", column, columns_));
        }
    }
};

/// @brief Contiguous storage for two-dimensional double precision values
using DoubleArray2D = Array2D<double>;

/// @brief Contiguous storage for two-dimensional integer values
using IntegerArray2D = Array2D<int>;
} // namespace csim::core
