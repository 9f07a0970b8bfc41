/**
 * @file
 * @brief This file contains functions for loading subsections of the main JSON file
 */
#pragma once
#include "configuration.h"

#include <nlohmann/json.hpp>
#include <optional>

namespace csim::input {
/// @brief The configuration file schema name
inline constexpr const char *ConfigSchemaFileName = "config.json";

/// @brief The supported configuration schema version
inline constexpr int ConfigSchemaVersion = 1;

/// @brief Check the schema version and throw if invalid
/// @param j The root JSON object
/// @throw ConfigurationError: If version attribute is not present or invalid
void check_version(const nlohmann::json &j);

/// @brief Load reference data section of JSON object
/// @param j The root JSON object
/// @param config The config object to update
/// @throw ConfigurationError: Could not load data files info
void load_data_info(const nlohmann::json &j, Configuration &config);

/// @brief Load economy section of JSON object
/// @param j The root JSON object
/// @param config The config object to update
/// @throw ConfigurationError: Could not load economic assumptions
void load_economy_info(const nlohmann::json &j, Configuration &config);

/// @brief Load running section of JSON object
/// @param j The root JSON object
/// @param config The config object to update
/// @throw ConfigurationError: Could not load running section
void load_running_info(const nlohmann::json &j, Configuration &config);

/// @brief Load output section of JSON object
/// @param j The root JSON object
/// @param config The config object to update
/// @param output_folder Output folder, if provided via command-line argument
/// @throw ConfigurationError: Could not load output info
void load_output_info(const nlohmann::json &j, Configuration &config,
                      const std::optional<std::string> &output_folder);
} // namespace csim::input
