#include "scenario.h"
#include "CohortSim.Core/string_util.h"

#include <fmt/format.h>
#include <stdexcept>

namespace csim {

const std::vector<ScenarioDefinition> &get_scenario_definitions() noexcept {
    static const auto definitions = std::vector<ScenarioDefinition>{
        {ScenarioType::low, "Low",
         "Pessimistic: lower fertility, reduced migration, slower mortality improvement",
         {1.20, 50000, {0.005, 0.004}, 1, 0.02}},
        {ScenarioType::medium, "Medium",
         "Baseline: current trends continue",
         {1.40, 110000, {0.010, 0.008}, 0, 0.0}},
        {ScenarioType::high, "High",
         "Optimistic: higher fertility, strong migration, faster mortality improvement",
         {1.77, 150000, {0.015, 0.012}, -1, -0.02}}};

    return definitions;
}

const ScenarioDefinition &get_scenario_definition(ScenarioType type) {
    for (const auto &definition : get_scenario_definitions()) {
        if (definition.type == type) {
            return definition;
        }
    }

    throw std::invalid_argument(
        fmt::format("Scenario: {} does not have a preset definition.", to_string(type)));
}

SimulationParameters create_scenario_parameters(ScenarioType type, int retirement_age,
                                                const std::optional<ScenarioPreset> &custom) {
    auto preset = ScenarioPreset{};
    if (type == ScenarioType::custom) {
        if (!custom.has_value()) {
            throw std::invalid_argument("Custom scenario requires the parameter values.");
        }

        preset = custom.value();
    } else {
        preset = get_scenario_definition(type).preset;
    }

    return SimulationParameters{.retirement_age = retirement_age,
                                .fertility_rate = preset.fertility_rate,
                                .net_migration = preset.net_migration,
                                .mortality_improvement = preset.mortality_improvement,
                                .entry_age_shift = preset.entry_age_shift,
                                .unemployment_adjustment = preset.unemployment_adjustment};
}

ScenarioType parse_scenario_type(const std::string_view &name) {
    if (core::case_insensitive::equals(name, "low")) {
        return ScenarioType::low;
    }

    if (core::case_insensitive::equals(name, "medium")) {
        return ScenarioType::medium;
    }

    if (core::case_insensitive::equals(name, "high")) {
        return ScenarioType::high;
    }

    if (core::case_insensitive::equals(name, "custom")) {
        return ScenarioType::custom;
    }

    throw std::invalid_argument(fmt::format("Unknown scenario type: {}", name));
}

std::string to_string(ScenarioType type) {
    switch (type) {
    case ScenarioType::low:
        return "low";
    case ScenarioType::medium:
        return "medium";
    case ScenarioType::high:
        return "high";
    case ScenarioType::custom:
        return "custom";
    default:
        return "unknown";
    }
}

} // namespace csim
