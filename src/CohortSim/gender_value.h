#pragma once
#include <cstdint>
#include <type_traits>

#include "CohortSim.Core/forward_type.h"

namespace csim {

/// @brief Defines a gender associated value data type
/// @tparam T The value type
template <typename T>
    requires std::is_arithmetic_v<T>
struct GenderValue {
    /// @brief Initialises a new instance of the GenderValue structure
    GenderValue() = default;

    /// @brief Initialises a new instance of the GenderValue structure
    /// @param males_value The males value
    /// @param females_value The female value
    GenderValue(T males_value, T females_value) : males{males_value}, females{females_value} {}

    /// @brief Males value
    T males{};

    /// @brief Females value
    T females{};

    /// @brief Gets the value for a given gender
    /// @param gender The gender to select
    /// @return The gender value, zero for unknown gender
    T at(core::Gender gender) const noexcept {
        switch (gender) {
        case core::Gender::male:
            return males;
        case core::Gender::female:
            return females;
        default:
            return T{};
        }
    }

    /// @brief Gets the total value for males and females
    /// @return Total value
    T total() const noexcept { return males + females; }

    /// @brief Compare two GenderValue instances
    auto operator<=>(const GenderValue<T> &rhs) const = default;
};

/// @brief Gender value for integer value
using IntegerGenderValue = GenderValue<std::int64_t>;

/// @brief Gender value for double precision floating-point value
using DoubleGenderValue = GenderValue<double>;

} // namespace csim
