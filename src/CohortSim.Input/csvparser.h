#pragma once

#include "poco.h"

#include "CohortSim/gender_table.h"
#include "CohortSim/population_snapshot.h"
#include "CohortSim/reference_data.h"

#include <filesystem>
#include <map>
#include <vector>

namespace csim::input {

/// @brief Loads the base year population, columns: age, male, female
/// @param file_name The population file full path
/// @return The base year population snapshot
/// @throws std::runtime_error for missing columns or invalid values
PopulationSnapshot load_population_from_csv(const std::filesystem::path &file_name);

/// @brief Loads the life table death probabilities, columns: age, male, female
/// @param file_name The life table file full path
/// @return The death probability (qx) by age and gender table
DoubleAgeGenderTable load_life_table_from_csv(const std::filesystem::path &file_name);

/// @brief Loads the age-specific fertility rates, columns: age, rate
///
/// The file rates are live births per 1000 women, the returned rates are per woman.
///
/// @param file_name The fertility file full path
/// @return The fertility rate by age
std::map<int, double> load_fertility_from_csv(const std::filesystem::path &file_name);

/// @brief Loads the migration weights, columns: age_group, male, female
///
/// Open-ended age groups, e.g. `80+`, are closed at the age before the terminal age.
///
/// @param file_name The migration file full path
/// @return The migration weights by age band
std::vector<MigrationBand> load_migration_from_csv(const std::filesystem::path &file_name);

/// @brief Loads the base employment rates, columns: age, rate
/// @param file_name The employment file full path
/// @return The employment rate by age
std::map<int, double> load_employment_from_csv(const std::filesystem::path &file_name);

/// @brief Loads the healthcare cost multipliers, columns: age_group, multiplier
/// @param file_name The healthcare file full path
/// @return The healthcare multipliers by age band
std::vector<HealthcareBand> load_healthcare_from_csv(const std::filesystem::path &file_name);

/// @brief Loads and validates all reference data tables
/// @param info The reference data files information
/// @param economy The economic assumptions
/// @return The reference data instance
/// @throws std::invalid_argument for reference data validation failures
ReferenceData load_reference_data(const poco::DataInfo &info, const EconomicAssumptions &economy);

} // namespace csim::input
