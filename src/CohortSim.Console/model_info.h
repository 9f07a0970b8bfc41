#pragma once

#include "CohortSim/simulation_parameters.h"

#include <fmt/format.h>
#include <string>

namespace csim {
/// @brief Projection experiment run-time information for reproducibility.
struct ExperimentInfo {
    /// @brief The model name
    std::string model;

    /// @brief The model version
    std::string version;

    /// @brief Projected scenario name
    std::string scenario;

    /// @brief The first projected year
    int start_year{};

    /// @brief The last projected year
    int end_year{};

    /// @brief The scenario simulation parameters
    SimulationParameters parameters;

    /// @brief Creates a string representation of this instance
    /// @return The string representation
    std::string to_string() const noexcept {
        return fmt::format("{} v{} - {} years: {}-{}", model, version, scenario, start_year,
                           end_year);
    }
};
} // namespace csim
