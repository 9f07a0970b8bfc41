#pragma once
#include "balance_validator.h"
#include "event_aggregator.h"
#include "reference_data.h"
#include "simulation_parameters.h"
#include "year_record.h"

#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace csim {

/// @brief Defines a named scenario to project
struct ScenarioRun {
    /// @brief The scenario name
    std::string name;

    /// @brief The scenario simulation parameters
    SimulationParameters parameters;
};

/// @brief The projection output of one scenario
struct ScenarioResult {
    std::string name;
    SimulationParameters parameters;
    std::vector<YearRecord> records;
    std::vector<BalanceCheck> balance_failures;

    /// @brief The scenario elapsed time in milliseconds
    double elapsed_ms{};
};

/// @brief Defines the projection experiment executive
///
/// @details The executive projects a set of independent scenarios from the same reference
/// data in parallel, each scenario is evaluated by its own driver and shares no mutable
/// state with the others. Progress is reported through the message bus.
class Runner {
  public:
    Runner() = delete;

    /// @brief Initialises a new instance of the Runner class.
    /// @param bus The message bus instance to use for notification
    /// @param balance_tolerance The population balance tolerance for each scenario
    Runner(std::shared_ptr<EventAggregator> bus, double balance_tolerance = 1.0) noexcept;

    /// @brief Run an experiment
    /// @param reference The reference data tables
    /// @param start_year The first projected year
    /// @param end_year The last projected year, inclusive
    /// @param scenarios The scenarios to project
    /// @return The scenario results, in the same order as the scenarios
    /// @throws std::invalid_argument for empty scenarios or experiment already running.
    /// @throws ParameterError for any scenario with invalid parameters.
    std::vector<ScenarioResult> run(const ReferenceData &reference, int start_year, int end_year,
                                    const std::vector<ScenarioRun> &scenarios);

    /// @brief Gets a value indicating whether an experiment is current running.
    /// @return true, if a experiment is underway; otherwise, false.
    bool is_running() const noexcept;

  private:
    std::atomic<bool> running_;
    std::shared_ptr<EventAggregator> event_bus_;
    double balance_tolerance_;
    std::string runner_id_{"Runner"};

    void notify(std::unique_ptr<EventMessage> message);
};

} // namespace csim
