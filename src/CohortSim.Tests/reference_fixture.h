#pragma once

#include "CohortSim/reference_data.h"

#include <cstdint>

/// @brief Creates a population with the same count at every age and gender
csim::PopulationSnapshot create_uniform_population(std::int64_t count);

/// @brief Creates a life table with constant qx and a separate terminal age value
csim::DoubleAgeGenderTable create_life_table(double qx, double terminal_qx);

csim::EconomicAssumptions create_test_economy();

/// @brief Creates small synthetic reference data tables
///
/// Fertility sums to a baseline TFR of 1.40 over ages 15-49, migration is spread over
/// three bands (0-14: 20%, 15-64: 70%, 65-99: 10%), employment is 0.7 for ages 15-64 and
/// 0.1 for ages 65-74, healthcare multipliers are 0.5, 1.0 and 3.0 for the same bands.
csim::ReferenceData create_test_reference(std::int64_t count = 1000, double qx = 0.01,
                                          double terminal_qx = 0.5);
