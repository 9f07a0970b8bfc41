#include "configuration.h"
#include "configuration_parsing.h"
#include "schema.h"

#include "CohortSim.Core/scoped_timer.h"
#include "CohortSim.Core/string_util.h"

#include <fmt/chrono.h>
#include <fmt/color.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>

#if CSIM_USE_TIMER
#define MEASURE_FUNCTION()                                                                         \
    csim::core::ScopedTimer timer { __func__ }
#else
#define MEASURE_FUNCTION()
#endif

namespace csim::input {

ConfigurationError::ConfigurationError(const std::string &msg) : std::runtime_error{msg} {}

Configuration get_configuration(const std::filesystem::path &config_file,
                                const std::optional<std::string> &output_folder, bool verbose) {
    MEASURE_FUNCTION();
    bool success = true;

    Configuration config;

    // verbosity
    config.verbosity = core::VerboseMode::none;
    if (verbose) {
        config.verbosity = core::VerboseMode::verbose;
    }

    nlohmann::json opt;
    try {
        opt = load_and_validate_json(config_file, ConfigSchemaFileName, ConfigSchemaVersion,
                                     /*require_schema_property=*/false);
        check_version(opt);
    } catch (const std::exception &e) {
        fmt::print(fg(fmt::color::red), "Invalid configuration file: {}\n", e.what());
        throw ConfigurationError{fmt::format("Error loading config file: {}", e.what())};
    }

    // Base dir for relative paths
    config.root_path = config_file.parent_path();

    try {
        load_data_info(opt, config);
    } catch (const std::exception &e) {
        success = false;
        fmt::print(fg(fmt::color::red), "Could not load reference data info: {}\n", e.what());
    }

    try {
        load_economy_info(opt, config);
    } catch (const std::exception &e) {
        success = false;
        fmt::print(fg(fmt::color::red), "Could not load economy info: {}\n", e.what());
    }

    try {
        load_running_info(opt, config);
    } catch (const std::exception &e) {
        success = false;
        fmt::print(fg(fmt::color::red), "Could not load running info: {}\n", e.what());
    }

    try {
        load_output_info(opt, config, output_folder);
    } catch (const ConfigurationError &e) {
        success = false;
        fmt::print(fg(fmt::color::red), "Could not load output info: {}\n", e.what());
    }

    if (!success) {
        throw ConfigurationError{"Error loading config file"};
    }

    return config;
}

std::vector<ScenarioRun> create_scenario_runs(const Configuration &config) {
    auto result = std::vector<ScenarioRun>{};
    result.reserve(config.scenarios.size());
    for (const auto &type : config.scenarios) {
        if (type == ScenarioType::custom && !config.custom.has_value()) {
            throw ConfigurationError{"Custom scenario selected without the custom values"};
        }

        result.emplace_back(ScenarioRun{
            .name = to_string(type),
            .parameters = create_scenario_parameters(type, config.retirement_age, config.custom)});
    }

    return result;
}

std::string create_output_file_name(const poco::OutputInfo &info, const std::string &scenario) {
    namespace fs = std::filesystem;

    fs::path output_folder = expand_environment_variables(info.folder);
    auto tp = std::chrono::system_clock::now();
    auto timestamp_tk = fmt::format("{0:%F_%H-%M-}{1:%S}", tp, tp.time_since_epoch());

    // filename token replacement
    auto file_name = info.file_name;
    std::size_t tk_end = 0;
    auto tk_start = file_name.find_first_of('{', tk_end);
    if (tk_start != std::string::npos) {
        tk_end = file_name.find_first_of('}', tk_start + 1);
        if (tk_end != std::string::npos) {
            auto token_str = file_name.substr(tk_start, tk_end - tk_start + 1);
            if (!core::case_insensitive::equals(token_str, "{TIMESTAMP}")) {
                throw std::logic_error(fmt::format("Unknown output file token: {}", token_str));
            }

            file_name.replace(tk_start, tk_end - tk_start + 1, timestamp_tk);
        }
    }

    auto result_file_name = fmt::format("CohortSim_result_{}.json", timestamp_tk);
    if (!file_name.empty()) {
        result_file_name = file_name;
    }

    if (!scenario.empty()) {
        tk_start = result_file_name.find_last_of('.');
        if (tk_start != std::string::npos) {
            result_file_name.replace(tk_start, size_t{1}, fmt::format("_{}.", scenario));
        } else {
            result_file_name.append(fmt::format("_{}.json", scenario));
        }
    }

    return (output_folder / result_file_name).string();
}

#ifdef _WIN32
#pragma warning(disable : 4996)
#endif
std::string expand_environment_variables(const std::string &path) {
    if (path.find("${") == std::string::npos) {
        return path;
    }

    std::string pre = path.substr(0, path.find("${"));
    std::string post = path.substr(path.find("${") + 2);
    if (post.find('}') == std::string::npos) {
        return path;
    }

    std::string variable = post.substr(0, post.find('}'));
    std::string value;

    post = post.substr(post.find('}') + 1);
    if (const char *v = std::getenv(variable.c_str())) { // C4996, but safe here.
        value = v;
    }

    return expand_environment_variables(pre + value + post);
}

} // namespace csim::input
