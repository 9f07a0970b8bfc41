#include "command_options.h"
#include "CohortSim.Input/configuration.h"

#include <fmt/color.h>

#include <iostream>
#include <stdexcept>

namespace csim {

cxxopts::Options create_options() {
    cxxopts::Options options("CohortSim.Console",
                             "CohortSim cohort-component population and economic projection.");

    // clang-format off
    options.add_options()
        ("c,config", "Path to configuration file.", cxxopts::value<std::string>())
        ("o,output", "Path to output folder", cxxopts::value<std::string>())
        ("s,scenario", "Scenario to project (low, medium, high, custom), can be repeated.",
            cxxopts::value<std::vector<std::string>>())
        ("advisory-year", "Print the advisory prompt for the given projection year.",
            cxxopts::value<int>())
        ("verbose", "Print more information about progress",
            cxxopts::value<bool>()->default_value("false"))
        ("help", "Help for this application.")
        ("version", "Print the application version number.");
    // clang-format on

    return options;
}

std::optional<CommandOptions> parse_arguments(cxxopts::Options &options, int argc, char **argv) {
    CommandOptions cmd;
    auto result = options.parse(argc, argv);

    if (result.count("help")) {
        std::cout << options.help() << '\n';
        return std::nullopt;
    }

    if (result.count("version")) {
        fmt::print("Version {}\n\n", CSIM_PROJECT_VERSION);
        return std::nullopt;
    }

    cmd.verbose = result["verbose"].as<bool>();
    if (cmd.verbose) {
        fmt::print(fg(fmt::color::dark_salmon), "Verbose output enabled\n");
    }

    if (!result.count("config")) {
        throw std::invalid_argument("The configuration file argument is required.");
    }

    cmd.config_file = result["config"].as<std::string>();
    fmt::print("Configuration file: {}\n", cmd.config_file);

    if (result.count("output")) {
        cmd.output_folder = result["output"].as<std::string>();
    }

    if (result.count("scenario")) {
        std::vector<ScenarioType> scenarios;
        for (const auto &name : result["scenario"].as<std::vector<std::string>>()) {
            scenarios.emplace_back(parse_scenario_type(name));
        }

        cmd.scenarios = std::move(scenarios);
    }

    if (result.count("advisory-year")) {
        cmd.advisory_year = result["advisory-year"].as<int>();
    }

    return cmd;
}
} // namespace csim
