#pragma once

#include <string>

#ifndef CSIM_TEST_DATA_PATH
#define CSIM_TEST_DATA_PATH "data"
#endif

/// @brief The test data folder, set from the command line or compiled default
extern std::string test_datastore_path;

/// @brief Finds a relative folder in the current path or any of its parents
/// @param relative_path The relative folder to search for
/// @return The absolute folder path
/// @throws std::runtime_error if the folder is not found
std::string resolve_path(const std::string &relative_path);

/// @brief Gets the test data folder
std::string default_datastore_path();
