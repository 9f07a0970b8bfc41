#pragma once

#include "CohortSim.Core/exception.h"
#include "CohortSim.Core/forward_type.h"
#include "CohortSim.Core/interval.h"

#include <string>
#include <vector>

namespace csim {

/// @brief Annual rate of decrease in age-specific mortality by gender
struct MortalityImprovement {
    double male{};
    double female{};

    /// @brief Gets the improvement rate for a given gender
    /// @param gender The gender to select
    /// @return The improvement rate, zero for unknown gender
    double rate(core::Gender gender) const noexcept;
};

/// @brief Caller supplied projection parameters, immutable for one run
struct SimulationParameters {
    /// @brief The working to retired boundary age
    int retirement_age{66};

    /// @brief Total fertility rate, children per woman
    double fertility_rate{1.40};

    /// @brief Net annual migration count, may be negative
    int net_migration{110000};

    /// @brief Mortality improvement rates by gender
    MortalityImprovement mortality_improvement{0.010, 0.008};

    /// @brief Years added to the base workforce entry age
    int entry_age_shift{};

    /// @brief Proportional reduction applied to the base employment rates
    double unemployment_adjustment{};
};

/// @brief Valid parameter domains
namespace parameter_domain {
inline const auto retirement_age = core::IntegerInterval{55, 80};
inline const auto fertility_rate = core::DoubleInterval{0.0, 5.0};
inline const auto net_migration = core::IntegerInterval{-500000, 500000};
inline const auto mortality_improvement = core::DoubleInterval{0.0, 0.05};
inline const auto entry_age_shift = core::IntegerInterval{-5, 10};
inline const auto unemployment_adjustment = core::DoubleInterval{-0.5, 0.5};

/// @brief Maximum number of years between the projection first and last year
inline constexpr int max_projection_span = 200;
} // namespace parameter_domain

/// @brief Projection parameters validation error
class ParameterError final : public core::CsimException {
  public:
    /// @brief Initialises a new instance of the ParameterError class
    /// @param violations The list of parameter domain violations
    /// @param location Source location (defaults to current location)
    ParameterError(std::vector<std::string> violations,
                   const source_location location = source_location::current());

    /// @brief Gets the list of parameter domain violations
    const std::vector<std::string> &violations() const noexcept { return violations_; }

  private:
    std::vector<std::string> violations_;
};

/// @brief Checks the projection parameters against their valid domains
/// @param parameters The parameters to check
/// @param start_year The projection first year
/// @param end_year The projection last year
/// @return The list of violations, empty if all parameters are valid
std::vector<std::string> check_parameters(const SimulationParameters &parameters, int start_year,
                                          int end_year);

/// @brief Validates the projection parameters
/// @param parameters The parameters to validate
/// @param start_year The projection first year
/// @param end_year The projection last year
/// @throws ParameterError for any parameter outside its valid domain
void validate_parameters(const SimulationParameters &parameters, int start_year, int end_year);

} // namespace csim
