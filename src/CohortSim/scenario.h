#pragma once

#include "simulation_parameters.h"

#include <optional>
#include <string>
#include <vector>

namespace csim {

/// @brief Enumerates the projection scenario presets
enum class ScenarioType : uint8_t {
    /// @brief Lower fertility, reduced migration, slower mortality improvement
    low,

    /// @brief Current trends continue
    medium,

    /// @brief Higher fertility, strong migration, faster mortality improvement
    high,

    /// @brief User supplied parameters
    custom
};

/// @brief Demographic and labour parameters of a scenario, retirement age excluded
struct ScenarioPreset {
    double fertility_rate{};
    int net_migration{};
    MortalityImprovement mortality_improvement{};
    int entry_age_shift{};
    double unemployment_adjustment{};
};

/// @brief Defines a named scenario
struct ScenarioDefinition {
    ScenarioType type{};
    std::string name;
    std::string description;
    ScenarioPreset preset;
};

/// @brief Gets the definition of a scenario preset
/// @param type The scenario type
/// @return The scenario definition
/// @throws std::invalid_argument for the custom scenario, which has no preset values
const ScenarioDefinition &get_scenario_definition(ScenarioType type);

/// @brief Gets the scenario preset definitions
/// @return The low, medium and high scenario definitions
const std::vector<ScenarioDefinition> &get_scenario_definitions() noexcept;

/// @brief Creates the simulation parameters for a scenario
/// @param type The scenario type
/// @param retirement_age The retirement age, not part of the presets
/// @param custom The custom parameters, required for the custom scenario
/// @return The scenario simulation parameters
/// @throws std::invalid_argument for custom scenario without custom values
SimulationParameters create_scenario_parameters(ScenarioType type, int retirement_age,
                                                const std::optional<ScenarioPreset> &custom = {});

/// @brief Converts a scenario name to its ScenarioType equivalent, case-insensitive
/// @param name The scenario name
/// @return The scenario type
/// @throws std::invalid_argument for unknown scenario names
ScenarioType parse_scenario_type(const std::string_view &name);

/// @brief Converts a ScenarioType to its string representation
/// @param type The scenario type
/// @return The scenario name
std::string to_string(ScenarioType type);

} // namespace csim
