#pragma once

#include "demographic_rates.h"
#include "gender_value.h"
#include "population_snapshot.h"
#include "simulation_parameters.h"

#include <cstdint>
#include <vector>

namespace csim {

/// @brief The outcome of one cohort evolution step
struct EvolutionResult {
    /// @brief The next year population
    PopulationSnapshot population;

    /// @brief Number of live births, the new age zero cohort
    IntegerGenderValue births{};

    /// @brief Number of deaths, terminal group included
    IntegerGenderValue deaths{};

    /// @brief Net migration actually applied, after capping at the cohort size
    IntegerGenderValue migration{};
};

/// @brief Implements the cohort-component population projection step
///
/// @details Advances a population snapshot by one year:
/// 1. births from the female population and the scaled age-specific fertility rates;
/// 2. net migration distributed by age with a rounding carry accumulator per gender;
/// 3. migrants join their cohort before mortality, survivors age by one year;
/// 4. the terminal group is evolved separately and merged with the age 99 survivors.
class CohortEvolution {
  public:
    CohortEvolution() = delete;

    /// @brief Initialises a new instance of the CohortEvolution class
    /// @param rates The demographic rate functions, must outlive this instance
    explicit CohortEvolution(const DemographicRates &rates);

    /// @brief Evolves a population snapshot by one year
    /// @param current The current year population
    /// @param years_elapsed The number of years from the projection start
    /// @param parameters The simulation parameters
    /// @return The next year population and the components of change
    EvolutionResult evolve(const PopulationSnapshot &current, int years_elapsed,
                           const SimulationParameters &parameters) const;

    /// @brief Distributes a net migration total over the non-terminal ages
    /// @param total The net migration total for one gender
    /// @param gender The migrants gender
    /// @return The number of migrants for each age 0 to 99, summing to the total
    std::vector<std::int64_t> distribute_migration(std::int64_t total, core::Gender gender) const;

  private:
    const DemographicRates &rates_;

    IntegerGenderValue calculate_births(const PopulationSnapshot &current,
                                        const SimulationParameters &parameters) const;

    IntegerGenderValue split_migration(int net_migration) const noexcept;
};

} // namespace csim
