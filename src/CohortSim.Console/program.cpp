#include "CohortSim.Core/thread_util.h"
#include "CohortSim.Input/api.h"
#include "CohortSim/api.h"
#include "command_options.h"
#include "event_monitor.h"
#include "model_info.h"
#include "result_file_writer.h"

#include <fmt/chrono.h>
#include <fmt/color.h>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <oneapi/tbb/global_control.h>
#include <oneapi/tbb/task_arena.h>
#include <optional>

namespace {
/// @brief Get a string representation of current system time
/// @return The system time as string
std::string get_time_now_str() {
    auto tp = std::chrono::system_clock::now();
    return fmt::format("{0:%F %H:%M:}{1:%S} {0:%Z}", tp, tp.time_since_epoch());
}

/// @brief Prints application start-up messages
void print_app_title() {
    fmt::print(fg(fmt::color::yellow) | fmt::emphasis::bold,
               "\n# CohortSim Population and Economic Projection #\n\n");

    fmt::print("Today: {}\nMaximum threads: {}\n\n", get_time_now_str(),
               tbb::global_control::active_value(tbb::global_control::max_allowed_parallelism));
}

/// @brief Writes one scenario results to the JSON and CSV output files
void write_scenario_results(const csim::input::Configuration &config,
                            const csim::ScenarioResult &result) {
    auto file_name = csim::input::create_output_file_name(config.output, result.name);
    auto writer = csim::ResultFileWriter{file_name,
                                         csim::ExperimentInfo{.model = config.app_name,
                                                              .version = config.app_version,
                                                              .scenario = result.name,
                                                              .start_year = config.start_year,
                                                              .end_year = config.end_year,
                                                              .parameters = result.parameters}};
    for (const auto &record : result.records) {
        writer.write(record);
    }

    fmt::print("Scenario {} results written to: {}\n", result.name, file_name);
}

/// @brief Prints the advisory prompt of a scenario projected year
void print_advisory_prompt(const csim::ScenarioResult &result, int year) {
    auto it = std::find_if(result.records.cbegin(), result.records.cend(),
                           [year](const auto &record) { return record.year == year; });
    if (it == result.records.cend()) {
        fmt::print(fg(fmt::color::dark_salmon), "Scenario {} has no projection for year {}.\n",
                   result.name, year);
        return;
    }

    fmt::print(fg(fmt::color::cyan), "\nAdvisory prompt, scenario {}:\n", result.name);
    fmt::print("{}\n", csim::create_advisory_prompt(*it, result.parameters));
}

/// @brief Prints application exit message
/// @param exit_code The application exit code
/// @return The respective exit code
int exit_application(int exit_code) {
    fmt::print("\n\n");
    fmt::print(fg(fmt::color::yellow) | fmt::emphasis::bold, "Goodbye.");
    fmt::print(" {}.\n\n", get_time_now_str());
    return exit_code;
}
} // anonymous namespace

/// @brief CohortSim host application entry point
/// @param argc The number of command arguments
/// @param argv The list of arguments provided
/// @return The application exit code
int main(int argc, char *argv[]) { // NOLINT(bugprone-exception-escape)
    using namespace csim;
    using namespace csim::input;

    // Set thread limit from OMP_THREAD_LIMIT, if set in environment.
    char *env_threads = std::getenv("OMP_THREAD_LIMIT");
    int threads =
        env_threads != nullptr ? std::atoi(env_threads) : tbb::this_task_arena::max_concurrency();
    auto thread_control =
        tbb::global_control(tbb::global_control::max_allowed_parallelism, threads);

    // Create CLI options and validate minimum arguments
    auto options = create_options();
    if (argc < 2) {
        std::cout << options.help() << '\n';
        return exit_application(EXIT_FAILURE);
    }

    // Print application title and parse command line arguments
    print_app_title();

    std::optional<CommandOptions> cmd_args_opt;
    try {
        cmd_args_opt = parse_arguments(options, argc, argv);

        // We won't get a config if e.g. the user chooses the --help option
        if (!cmd_args_opt) {
            return exit_application(EXIT_SUCCESS);
        }
    } catch (const std::exception &ex) {
        fmt::print(fg(fmt::color::red), "\nInvalid command line argument: {}\n", ex.what());
        fmt::print("\n{}\n", options.help());
        return exit_application(EXIT_FAILURE);
    }

    const auto &cmd_args = cmd_args_opt.value();

    // Parse inputs configuration file, *.json.
    Configuration config;
    std::vector<ScenarioRun> scenarios;
    try {
        config = get_configuration(cmd_args.config_file, cmd_args.output_folder, cmd_args.verbose);
        if (cmd_args.scenarios.has_value()) {
            config.scenarios = cmd_args.scenarios.value();
        }

        scenarios = create_scenario_runs(config);
    } catch (const std::exception &ex) {
        fmt::print(fg(fmt::color::red), "\n\nInvalid configuration - {}.\n", ex.what());
        return exit_application(EXIT_FAILURE);
    }

    // Create output folder
    if (!std::filesystem::exists(config.output.folder)) {
        fmt::print(fg(fmt::color::dark_salmon), "\nCreating output folder: {} ...\n",
                   config.output.folder);
        if (!std::filesystem::create_directories(config.output.folder)) {
            fmt::print(fg(fmt::color::red), "Failed to create output folder: {}\n",
                       config.output.folder);
            return exit_application(EXIT_FAILURE);
        }
    }

    // Load reference data tables asynchronous
    auto reference_future = core::run_async(load_reference_data, config.data, config.economy);

#ifdef CSIM_CATCH_EXCEPTIONS
    try {
#endif
        // Create event bus and event monitor
        auto event_bus = std::make_shared<DefaultEventBus>();
        auto event_monitor = EventMonitor{*event_bus, config.verbosity};

        // Request reference data instance, wait, if not completed.
        auto reference = reference_future.get();
        const auto &baseline = reference.baseline();
        fmt::print("Base population: {} ({} males, {} females).\n", baseline.total(),
                   baseline.total_males(), baseline.total_females());

        fmt::print(fg(fmt::color::cyan), "\nStarting projection of {} scenarios, {} to {} ...\n\n",
                   scenarios.size(), config.start_year, config.end_year);

        auto runner = Runner(event_bus, config.balance_tolerance);
        auto results = runner.run(reference, config.start_year, config.end_year, scenarios);
        event_monitor.stop();

        auto runtime = 0.0;
        for (const auto &result : results) {
            runtime += result.elapsed_ms;
            write_scenario_results(config, result);
            if (!result.balance_failures.empty()) {
                fmt::print(fg(fmt::color::yellow), "Scenario {} failed {} balance checks.\n",
                           result.name, result.balance_failures.size());
            }

            if (cmd_args.advisory_year.has_value()) {
                print_advisory_prompt(result, cmd_args.advisory_year.value());
            }
        }

        fmt::print(fg(fmt::color::light_green), "\nCompleted, projection time : {}ms\n\n",
                   runtime);

#ifdef CSIM_CATCH_EXCEPTIONS
    } catch (const std::exception &ex) {
        fmt::print(fg(fmt::color::red), "\n\nFailed with message: {}.\n\n", ex.what());

        // Rethrow exception so it can be handled by OS's default handler
        throw;
    }
#endif // CSIM_CATCH_EXCEPTIONS

    return exit_application(EXIT_SUCCESS);
}

// NOLINTBEGIN(modernize-concat-nested-namespaces)
/// @brief Top-level namespace for CohortSim Console host application
namespace csim {
/// @brief Internal details namespace for private data types and functions
namespace detail {}
} // namespace csim
// NOLINTEND(modernize-concat-nested-namespaces)
