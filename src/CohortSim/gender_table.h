#pragma once
#include <map>
#include <numeric>

#include "CohortSim.Core/array2d.h"
#include "CohortSim.Core/forward_type.h"
#include "CohortSim.Core/interval.h"
#include "monotonic_vector.h"

namespace csim {

/// @brief Defines the age and gender lookup table data type
///
/// Rows are keyed by single year of age, columns by gender. Values are stored contiguously
/// in a core::Array2D and located through the breakpoint indices.
///
/// @tparam TYPE The cell value type
template <core::Numerical TYPE> class AgeGenderTable {
  public:
    /// @brief Initialises a new instance of the AgeGenderTable class
    AgeGenderTable() = default;

    /// @brief Initialises a new instance of the AgeGenderTable class
    /// @param rows The monotonic age lookup breakpoints
    /// @param cols The gender columns lookup breakpoints
    /// @param values The full lookup-table values
    /// @throws std::invalid_argument for lookup breakpoints and values table size mismatch
    AgeGenderTable(const MonotonicVector<int> &rows, const std::vector<core::Gender> &cols,
                   core::Array2D<TYPE> &&values)
        : table_{std::move(values)} {
        if (rows.size() != table_.rows() || cols.size() != table_.columns()) {
            throw std::invalid_argument("Lookup breakpoints and values size mismatch.");
        }

        auto rows_count = static_cast<int>(rows.size());
        for (auto index = 0; index < rows_count; index++) {
            rows_index_.emplace(rows[index], index);
        }

        auto cols_count = static_cast<int>(cols.size());
        for (auto index = 0; index < cols_count; index++) {
            cols_index_.emplace(cols[index], index);
        }
    }

    /// @brief Gets the lookup table size
    /// @return Lookup table size
    std::size_t size() const noexcept { return table_.size(); }

    /// @brief Get the number of age breakpoints
    /// @return Number of rows
    std::size_t rows() const noexcept { return table_.rows(); }

    /// @brief Determine whether the lookup table is empty
    /// @return true, if the lookup data is empty; otherwise, false
    bool empty() const noexcept { return rows_index_.empty() || cols_index_.empty(); }

    /// @brief Gets the age range covered by the table
    /// @return The age breakpoints range
    /// @throws std::out_of_range for empty lookup table
    core::IntegerInterval age_range() const {
        if (rows_index_.empty()) {
            throw std::out_of_range("The lookup table is empty.");
        }

        return core::IntegerInterval{rows_index_.begin()->first, rows_index_.rbegin()->first};
    }

    /// @brief Gets a value at a given age and gender intersection
    /// @param age The reference row
    /// @param gender The reference column
    /// @return The lookup value
    /// @throws std::out_of_range for accessing unknown lookup breakpoints
    TYPE &at(const int age, const core::Gender gender) {
        return table_(rows_index_.at(age), cols_index_.at(gender));
    }

    /// @brief Gets a read-only value at a given age and gender intersection
    /// @param age The reference row
    /// @param gender The reference column
    /// @return The lookup value
    /// @throws std::out_of_range for accessing unknown lookup breakpoints
    const TYPE &at(const int age, const core::Gender gender) const {
        return table_(rows_index_.at(age), cols_index_.at(gender));
    }

    /// @brief Determines whether the lookup contains a value
    /// @param age The row breakpoint value
    /// @param gender The column breakpoint value
    /// @return true, if the lookup contains the value; otherwise, false
    bool contains(const int age, const core::Gender gender) const noexcept {
        if (rows_index_.contains(age)) {
            return cols_index_.contains(gender);
        }

        return false;
    }

  private:
    core::Array2D<TYPE> table_{};
    std::map<int, int> rows_index_{};
    std::map<core::Gender, int> cols_index_{};
};

/// @brief Creates an instance of the age and gender lookup table
/// @tparam TYPE The values data type
/// @param age_range The age breakpoints range
/// @return A new instance of the AgeGenderTable class, all values set to zero
/// @throws std::invalid_argument for age range 'lower' of negative value or not less than
/// the 'upper' value
template <core::Numerical TYPE>
AgeGenderTable<TYPE> create_age_gender_table(const core::IntegerInterval &age_range) {
    if (age_range.lower() < 0 || age_range.lower() >= age_range.upper()) {
        throw std::invalid_argument("The 'age lower' value must be non-negative and less than "
                                    "the 'age upper' value.");
    }

    auto rows = std::vector<int>(static_cast<std::size_t>(age_range.length()) + 1);
    std::iota(rows.begin(), rows.end(), age_range.lower());

    auto cols = std::vector<core::Gender>{core::Gender::male, core::Gender::female};
    auto data = core::Array2D<TYPE>(rows.size(), cols.size(), TYPE{});
    return AgeGenderTable<TYPE>(MonotonicVector<int>(std::move(rows)), cols, std::move(data));
}

/// @brief Age and Gender lookup table for double precision floating-point values
using DoubleAgeGenderTable = AgeGenderTable<double>;

} // namespace csim
