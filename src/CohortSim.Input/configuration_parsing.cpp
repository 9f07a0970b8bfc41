#include "configuration_parsing.h"
#include "configuration_parsing_helpers.h"
#include "jsonparser.h"

#include "CohortSim/simulation_parameters.h"

#include <fmt/color.h>
#include <stdexcept>

namespace csim::input {
using json = nlohmann::json;

nlohmann::json get(const json &j, const std::string &key) {
    try {
        return j.at(key);
    } catch (const std::exception &) {
        fmt::print(fmt::fg(fmt::color::red), "Missing key \"{}\"\n", key);
        throw ConfigurationError{fmt::format("Missing key \"{}\"", key)};
    }
}

void rebase_valid_path(std::filesystem::path &path, const std::filesystem::path &base_dir) try {
    if (path.is_relative()) {
        path = std::filesystem::absolute(base_dir / path);
    }

    if (!std::filesystem::exists(path)) {
        throw ConfigurationError{fmt::format("Path does not exist: {}", path.string())};
    }
} catch (const std::filesystem::filesystem_error &) {
    throw ConfigurationError{fmt::format("OS error while reading path {}", path.string())};
}

void check_version(const json &j) {
    int version;
    if (!get_to(j, "version", version)) {
        throw ConfigurationError{"File must have a schema version"};
    }

    if (version != ConfigSchemaVersion) {
        throw ConfigurationError{fmt::format(
            "Configuration schema version: {} mismatch, supported: {}", version,
            ConfigSchemaVersion)};
    }
}

void load_data_info(const json &j, Configuration &config) {
    if (!get_to(j, "data", config.data)) {
        throw ConfigurationError{"Could not load data info"};
    }

    bool success = true;
    try {
        rebase_valid_path(config.data.folder, config.root_path);
    } catch (const ConfigurationError &) {
        fmt::print(fmt::fg(fmt::color::red), "Data folder not found: {}\n",
                   config.data.folder.string());
        throw;
    }

    for (const auto &file_name :
         {config.data.population, config.data.life_table, config.data.fertility,
          config.data.migration, config.data.employment, config.data.healthcare}) {
        auto path = config.data.folder / file_name;
        if (std::filesystem::exists(path)) {
            fmt::print("{:<14}, file: {}\n", path.stem().string(), path.string());
        } else {
            success = false;
            fmt::print(fmt::fg(fmt::color::red), "Could not find file: {}\n", path.string());
        }
    }

    if (!success) {
        throw ConfigurationError{"Could not find reference data files"};
    }
}

void load_economy_info(const json &j, Configuration &config) {
    if (!get_to(j, "economy", config.economy)) {
        throw ConfigurationError{"Could not load economic assumptions"};
    }
}

void load_running_info(const json &j, Configuration &config) {
    const auto running = get(j, "running");

    bool success = true;
    get_to(running, "start_year", config.start_year, success);
    get_to(running, "end_year", config.end_year, success);
    get_to(running, "retirement_age", config.retirement_age, success);
    get_to(running, "balance_tolerance", config.balance_tolerance, success);

    std::vector<std::string> scenarios;
    if (get_to(running, "scenarios", scenarios, success)) {
        config.scenarios.clear();
        for (const auto &name : scenarios) {
            try {
                config.scenarios.push_back(parse_scenario_type(name));
            } catch (const std::invalid_argument &e) {
                success = false;
                fmt::print(fmt::fg(fmt::color::red), "{}\n", e.what());
            }
        }
    }

    if (running.contains("custom")) {
        ScenarioPreset custom;
        if (get_to(running, "custom", custom, success)) {
            config.custom = custom;
        }
    }

    if (config.start_year > config.end_year) {
        success = false;
        fmt::print(fmt::fg(fmt::color::red), "Start year: {} is after end year: {}\n",
                   config.start_year, config.end_year);
    } else if (config.end_year - config.start_year > parameter_domain::max_projection_span) {
        success = false;
        fmt::print(fmt::fg(fmt::color::red), "Projection span: {} to {} exceeds {} years\n",
                   config.start_year, config.end_year, parameter_domain::max_projection_span);
    }

    if (!success) {
        throw ConfigurationError{"Could not load running info"};
    }
}

void load_output_info(const json &j, Configuration &config,
                      const std::optional<std::string> &output_folder) {
    if (!get_to(j, "output", config.output)) {
        throw ConfigurationError{"Could not load output info"};
    }

    if (output_folder.has_value()) {
        config.output.folder = output_folder.value();
    } else {
        config.output.folder = expand_environment_variables(config.output.folder);
    }

    if (config.output.folder.empty()) {
        throw ConfigurationError{"Must specify output folder via command line or config file"};
    }
}

} // namespace csim::input
