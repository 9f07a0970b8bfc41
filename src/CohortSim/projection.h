#pragma once

#include "balance_validator.h"
#include "cohort_evolution.h"
#include "demographic_rates.h"
#include "economic_metrics.h"
#include "event_aggregator.h"
#include "reference_data.h"
#include "simulation_parameters.h"
#include "year_record.h"

#include <memory>
#include <string>
#include <vector>

namespace csim {

/// @brief Enumerates the projection driver states
enum class ProjectionState : uint8_t {
    /// @brief Checking the parameters against their domains
    validating,

    /// @brief Iterating the projection years
    running,

    /// @brief All years have been projected
    complete
};

/// @brief Defines the year-by-year population projection driver
///
/// @details Each year the current population is summarised, the economic metrics are
/// calculated and the year record appended to the output, then the population evolves to
/// the next year and the step is checked for population conservation. Invalid parameters
/// abort the run before any computation; balance mismatches are published as warnings and
/// the run continues.
class ProjectionDriver {
  public:
    ProjectionDriver() = delete;

    /// @brief Initialises a new instance of the ProjectionDriver class
    /// @param reference The reference data tables, must outlive this instance
    /// @param bus The message bus instance to use for notification, optional
    /// @param validator The population balance validator
    /// @param name The driver identifier used in notifications
    explicit ProjectionDriver(const ReferenceData &reference,
                              std::shared_ptr<EventAggregator> bus = {},
                              BalanceValidator validator = BalanceValidator{},
                              std::string name = "Projection");

    ProjectionDriver(const ProjectionDriver &) = delete;
    ProjectionDriver(ProjectionDriver &&) = delete;
    ProjectionDriver &operator=(const ProjectionDriver &) = delete;
    ProjectionDriver &operator=(ProjectionDriver &&) = delete;
    ~ProjectionDriver() = default;

    /// @brief Projects the population from the base year population
    /// @param start_year The first projected year, seeded with the baseline population
    /// @param end_year The last projected year, inclusive
    /// @param parameters The simulation parameters
    /// @param run_number The run number used in notifications
    /// @return The ordered year records, one per year
    /// @throws ParameterError for parameters outside their valid domain
    std::vector<YearRecord> run(int start_year, int end_year,
                                const SimulationParameters &parameters,
                                unsigned int run_number = 1);

    /// @brief Gets the driver current state
    ProjectionState state() const noexcept { return state_; }

    /// @brief Gets the balance checks that failed in the last run
    const std::vector<BalanceCheck> &balance_failures() const noexcept {
        return balance_failures_;
    }

    /// @brief Gets the driver identifier
    const std::string &name() const noexcept { return name_; }

  private:
    const ReferenceData &reference_;
    DemographicRates rates_;
    CohortEvolution evolution_;
    EconomicCalculator calculator_;
    BalanceValidator validator_;
    std::shared_ptr<EventAggregator> event_bus_;
    std::string name_;
    ProjectionState state_{ProjectionState::validating};
    std::vector<BalanceCheck> balance_failures_;

    void notify(std::unique_ptr<EventMessage> message) const;
};

/// @brief Projects the population without notifications
/// @param reference The reference data tables
/// @param start_year The first projected year
/// @param end_year The last projected year, inclusive
/// @param parameters The simulation parameters
/// @return The ordered year records, one per year
/// @throws ParameterError for parameters outside their valid domain
std::vector<YearRecord> project(const ReferenceData &reference, int start_year, int end_year,
                                const SimulationParameters &parameters);

} // namespace csim
