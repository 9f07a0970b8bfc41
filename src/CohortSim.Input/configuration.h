/**
 * @file
 * @brief Main header file for functionality related to loading config files
 *
 * This file contains definitions for the main functions required to load JSON-formatted
 * configuration files from disk.
 */
#pragma once

#include "poco.h"

#include "CohortSim.Core/forward_type.h"
#include "CohortSim/reference_data.h"
#include "CohortSim/runner.h"
#include "CohortSim/scenario.h"

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#ifndef CSIM_PROJECT_NAME
#define CSIM_PROJECT_NAME "CohortSim"
#endif

#ifndef CSIM_PROJECT_VERSION
#define CSIM_PROJECT_VERSION "0.0.0"
#endif

namespace csim::input {

/// @brief Defines the application configuration data structure
struct Configuration {
    /// @brief The root path for configuration files
    std::filesystem::path root_path;

    /// @brief Reference data files and demographic constants
    poco::DataInfo data;

    /// @brief Base year economic assumptions
    EconomicAssumptions economy;

    /// @brief The first projected year
    int start_year{};

    /// @brief The last projected year, inclusive
    int end_year{};

    /// @brief The scenarios to project
    std::vector<ScenarioType> scenarios;

    /// @brief The working to retired boundary age, shared by all scenarios
    int retirement_age{66};

    /// @brief The custom scenario values, required when the custom scenario is selected
    std::optional<ScenarioPreset> custom;

    /// @brief The population balance tolerance, in persons
    double balance_tolerance{1.0};

    /// @brief Experiment output folder and file information
    poco::OutputInfo output;

    /// @brief Application logging verbosity mode
    core::VerboseMode verbosity{};

    /// @brief Experiment model name
    const char *app_name = CSIM_PROJECT_NAME;

    /// @brief Experiment model version
    const char *app_version = CSIM_PROJECT_VERSION;
};

/// @brief Represents an error that occurred with the format of a config file
class ConfigurationError : public std::runtime_error {
  public:
    ConfigurationError(const std::string &msg);
};

/// @brief Loads the input configuration file, *.json, information
/// @param config_file Path to config file
/// @param output_folder Output folder, overrides the config file value
/// @param verbose Set log verbosity for the experiment
/// @return The configuration file information
/// @throw ConfigurationError: Could not load one or more configuration sections
Configuration get_configuration(const std::filesystem::path &config_file,
                                const std::optional<std::string> &output_folder, bool verbose);

/// @brief Creates the scenario runs from configuration
/// @param config User input configuration instance
/// @return The scenarios to project
/// @throw ConfigurationError: Custom scenario selected without custom values
std::vector<ScenarioRun> create_scenario_runs(const Configuration &config);

/// @brief Creates the full output file name from user input configuration
/// @param info User output information, may contain relative path and environment variables
/// @param scenario The scenario name appended to the file name
/// @return Output file full name
std::string create_output_file_name(const poco::OutputInfo &info, const std::string &scenario);

/// @brief Expand environment variables in path to respective values
/// @param path The source path to information
/// @return The resulting full path
std::string expand_environment_variables(const std::string &path);

} // namespace csim::input
