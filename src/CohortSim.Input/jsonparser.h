#pragma once
#include "poco.h"

#include "CohortSim/reference_data.h"
#include "CohortSim/scenario.h"

#include <nlohmann/json.hpp>

namespace csim::input::poco {
/// @brief JSON parser namespace alias.
///
/// Configuration file serialisation / de-serialisation mapping specific
/// to the `JSON for Modern C++` library adopted by the project.
///
/// @sa https://github.com/nlohmann/json#arbitrary-types-conversions
/// for details about the contents and code structure in this file.
using json = nlohmann::json;

// Reference data files
void to_json(json &j, const DataInfo &p);
void from_json(const json &j, DataInfo &p);

// Output information
void to_json(json &j, const OutputInfo &p);
void from_json(const json &j, OutputInfo &p);

} // namespace csim::input::poco

namespace csim {

//--------------------------------------------------------
// Engine types mapping, found by argument-dependent lookup
//--------------------------------------------------------

void to_json(nlohmann::json &j, const EconomicAssumptions &p);
void from_json(const nlohmann::json &j, EconomicAssumptions &p);

void to_json(nlohmann::json &j, const MortalityImprovement &p);
void from_json(const nlohmann::json &j, MortalityImprovement &p);

void to_json(nlohmann::json &j, const ScenarioPreset &p);
void from_json(const nlohmann::json &j, ScenarioPreset &p);

void to_json(nlohmann::json &j, const SimulationParameters &p);

} // namespace csim
