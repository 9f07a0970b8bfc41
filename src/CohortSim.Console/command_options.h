/**
 * @file
 * @brief Functionality for parsing console application's command-line arguments
 */
#pragma once

#include <cxxopts.hpp>

#include "CohortSim/scenario.h"

#include <optional>
#include <string>
#include <vector>

namespace csim {
/// @brief Defines the Command Line Interface (CLI) arguments options
struct CommandOptions {
    /// @brief The configuration file full path
    std::string config_file;

    /// @brief The output folder where results will be saved
    std::optional<std::string> output_folder;

    /// @brief The scenarios to project, overrides the configuration list
    std::optional<std::vector<ScenarioType>> scenarios;

    /// @brief The year to print the advisory prompt for, optional.
    std::optional<int> advisory_year;

    /// @brief Indicates whether the application logging is verbose
    bool verbose{};
};

/// @brief Creates the command-line interface (CLI) options
/// @return CohortSim CLI options
cxxopts::Options create_options();

/// @brief Parses the command-line interface (CLI) arguments
/// @param options The valid CLI options
/// @param argc Number of input arguments
/// @param argv List of input arguments
/// @return User command-line options or std::nullopt if program should exit
std::optional<CommandOptions> parse_arguments(cxxopts::Options &options, int argc, char **argv);

} // namespace csim
