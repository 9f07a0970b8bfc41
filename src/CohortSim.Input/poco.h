#pragma once

#include <filesystem>
#include <string>

namespace csim::input::poco {

//! Reference data folder and table file names
struct DataInfo {
    std::filesystem::path folder{};
    std::string population{};
    std::string life_table{};
    std::string fertility{};
    std::string migration{};
    std::string employment{};
    std::string healthcare{};
    double sex_ratio_at_birth{};
    double migration_male_share{};

    auto operator<=>(const DataInfo &rhs) const = default;
};

//! Experiment output folder and file information
struct OutputInfo {
    std::string folder{};
    std::string file_name{};

    auto operator<=>(const OutputInfo &rhs) const = default;
};

} // namespace csim::input::poco
